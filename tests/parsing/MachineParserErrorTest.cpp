#include <gtest/gtest.h>
#include <string>

#include "parsing/MachineParser.h"

using namespace TSM;

// Fixture for malformed input: every error is collected as a Diagnostic
class MachineParserErrorTest : public ::testing::Test {
protected:
    // Parse and expect failure with exactly one diagnostic of the given kind
    const Diagnostic &expectSingleError(const std::string &content, ErrorKind kind) {
        auto source = parser.parseContent(content);
        EXPECT_EQ(source, nullptr);
        EXPECT_TRUE(parser.hasErrors());

        const auto &diagnostics = parser.getDiagnostics();
        EXPECT_EQ(diagnostics.size(), 1u);
        if (diagnostics.empty()) {
            static const Diagnostic none;
            ADD_FAILURE() << "no diagnostic reported";
            return none;
        }
        EXPECT_EQ(diagnostics[0].kind, kind) << diagnostics[0].message;
        return diagnostics[0];
    }

    MachineParser parser;
};

TEST_F(MachineParserErrorTest, MissingPlusIsSyntaxError) {
    const auto &error = expectSingleError("transitions: { *Idle Start = Running }", ErrorKind::SyntaxError);

    EXPECT_NE(error.message.find("expected '+'"), std::string::npos);
    EXPECT_EQ(error.clauseText, "*Idle Start = Running");
    EXPECT_EQ(error.position.line, 1u);
    EXPECT_EQ(error.position.column, 22u);
}

TEST_F(MachineParserErrorTest, WildcardEventIsSyntaxError) {
    const auto &error = expectSingleError("transitions: { *Idle + _ = Running }", ErrorKind::SyntaxError);
    EXPECT_NE(error.message.find("events cannot be wildcards"), std::string::npos);
}

TEST_F(MachineParserErrorTest, WildcardInsideAlternationIsSyntaxError) {
    expectSingleError("transitions: { *Idle | _ + Go = Running }", ErrorKind::SyntaxError);
}

TEST_F(MachineParserErrorTest, EmptyTransitionsBlockIsSyntaxError) {
    const auto &error = expectSingleError("name: Empty, transitions: { }", ErrorKind::SyntaxError);
    EXPECT_NE(error.message.find("empty"), std::string::npos);
}

TEST_F(MachineParserErrorTest, UnterminatedBlockIsSyntaxError) {
    expectSingleError("transitions: { *Idle + Go = Busy,", ErrorKind::SyntaxError);
}

TEST_F(MachineParserErrorTest, UnknownKeyIsSyntaxError) {
    const auto &error = expectSingleError("states: [A], transitions: { *A + Go = B }", ErrorKind::SyntaxError);
    EXPECT_NE(error.message.find("unknown key 'states'"), std::string::npos);
}

TEST_F(MachineParserErrorTest, RepeatedKeyIsSyntaxError) {
    expectSingleError("name: A, name: B, transitions: { *A + Go = B }", ErrorKind::SyntaxError);
}

TEST_F(MachineParserErrorTest, InvalidCharacterIsSyntaxError) {
    const auto &error = expectSingleError("transitions: { *Idle + Go -> Busy }", ErrorKind::SyntaxError);
    EXPECT_NE(error.message.find("unexpected character '-'"), std::string::npos);
}

TEST_F(MachineParserErrorTest, UnterminatedCommentIsSyntaxError) {
    const auto &error =
        expectSingleError("transitions: { *Idle + Go = Busy } /* trailing", ErrorKind::SyntaxError);
    EXPECT_NE(error.message.find("unterminated block comment"), std::string::npos);
}

TEST_F(MachineParserErrorTest, TextAfterBlockIsSyntaxError) {
    expectSingleError("transitions: { *Idle + Go = Busy } name: Late", ErrorKind::SyntaxError);
}

TEST_F(MachineParserErrorTest, ReportsEveryMalformedClause) {
    auto source = parser.parseContent(R"(transitions: {
        *Idle + = Busy,
        Busy Stop = Idle,
        Busy + Go = Idle,
    })");

    EXPECT_EQ(source, nullptr);
    const auto &diagnostics = parser.getDiagnostics();
    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_EQ(diagnostics[0].kind, ErrorKind::SyntaxError);
    EXPECT_EQ(diagnostics[0].position.line, 2u);
    EXPECT_EQ(diagnostics[1].kind, ErrorKind::SyntaxError);
    EXPECT_EQ(diagnostics[1].position.line, 3u);
    EXPECT_EQ(diagnostics[1].clauseText, "Busy Stop = Idle");
}

TEST_F(MachineParserErrorTest, MissingInitialMarkerIsInitialStateError) {
    const auto &error = expectSingleError("transitions: { Idle + Go = Busy }", ErrorKind::InitialStateError);
    EXPECT_FALSE(error.hint.empty());
}

TEST_F(MachineParserErrorTest, SecondInitialMarkerIsInitialStateError) {
    const auto &error = expectSingleError(R"(transitions: {
        *Idle + Go = Busy,
        *Busy + Stop = Idle,
    })",
                                          ErrorKind::InitialStateError);

    EXPECT_NE(error.message.find("'Busy'"), std::string::npos);
    EXPECT_NE(error.message.find("'Idle'"), std::string::npos);
    EXPECT_EQ(error.position.line, 3u);
    EXPECT_EQ(error.clauseText, "*Busy + Stop = Idle");
}

TEST_F(MachineParserErrorTest, InitialWildcardIsInitialStateError) {
    expectSingleError("transitions: { *_ + Reset = Idle, *Idle + Go = Busy }", ErrorKind::InitialStateError);
}

TEST_F(MachineParserErrorTest, InitialWildcardAlternativeIsInitialStateError) {
    const auto &error =
        expectSingleError("transitions: { *Idle + Go = Busy, Busy | *_ + Reset = Idle }", ErrorKind::InitialStateError);

    EXPECT_EQ(error.clauseText, "Busy | *_ + Reset = Idle");
    EXPECT_EQ(error.position.column, 42u);
}

TEST_F(MachineParserErrorTest, WildcardAlternativeIsSyntaxError) {
    const auto &error =
        expectSingleError("transitions: { *Idle + Go = Busy, Busy | _ + Reset = Idle }", ErrorKind::SyntaxError);

    EXPECT_NE(error.message.find("cannot be combined"), std::string::npos);
}

TEST_F(MachineParserErrorTest, MissingFileIsConfigurationError) {
    auto source = parser.parseFile("nonexistent_machine.tsm");

    EXPECT_EQ(source, nullptr);
    ASSERT_TRUE(parser.hasErrors());
    EXPECT_EQ(parser.getDiagnostics()[0].kind, ErrorKind::ConfigurationError);
    EXPECT_NE(parser.getDiagnostics()[0].message.find("File not found"), std::string::npos);
}

TEST_F(MachineParserErrorTest, ParserIsReusableAfterFailure) {
    EXPECT_EQ(parser.parseContent("transitions: { }"), nullptr);
    EXPECT_TRUE(parser.hasErrors());

    EXPECT_NE(parser.parseContent("transitions: { *A + Go = B }"), nullptr);
    EXPECT_FALSE(parser.hasErrors());
}

TEST_F(MachineParserErrorTest, DiagnosticFormatNamesSourceAndKind) {
    parser.parseContent("transitions: {\n  *Idle Start = Running\n}", "robot.tsm");
    ASSERT_TRUE(parser.hasErrors());

    std::string formatted = parser.getDiagnostics()[0].format("robot.tsm");
    EXPECT_EQ(formatted.rfind("robot.tsm:2:9: error[SyntaxError]: ", 0), 0u) << formatted;
    EXPECT_NE(formatted.find("\n    | *Idle Start"), std::string::npos) << formatted;
}
