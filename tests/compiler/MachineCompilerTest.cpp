#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>

#include "compiler/MachineCompiler.h"

using namespace TSM;
using ::testing::ElementsAre;

class MachineCompilerTest : public ::testing::Test {
protected:
    static std::string fixture(const std::string &name) {
        return std::string(TSM_FIXTURES_DIR) + "/" + name;
    }

    MachineCompiler compiler;
};

TEST_F(MachineCompilerTest, CompilesRobotFixture) {
    auto spec = compiler.compileFile(fixture("robot.tsm"));

    ASSERT_NE(spec, nullptr);
    EXPECT_FALSE(compiler.hasErrors());
    EXPECT_EQ(spec->name, "Robot");
    EXPECT_EQ(spec->initialState, "Off");
    EXPECT_THAT(spec->states, ElementsAre("Off", "Idle", "Moving", "Waiting", "EmergencyStopped"));
    EXPECT_EQ(spec->events.size(), 9u);

    // PowerOff reaches Off from every state
    for (const auto &state : spec->states) {
        EXPECT_EQ(spec->processEvent(state, "PowerOff"), std::optional<std::string>("Off")) << state;
    }
    EXPECT_EQ(spec->processEvent("Moving", "Tick"), std::optional<std::string>("Moving"));
    EXPECT_FALSE(spec->processEvent("Off", "EmergencyStop").has_value());
}

TEST_F(MachineCompilerTest, CompilesSourceText) {
    auto spec = compiler.compileSource("transitions: { *Idle + Start = Running, Running + Stop = Idle }", "inline");

    ASSERT_NE(spec, nullptr);
    EXPECT_EQ(spec->sourceName, "inline");
    EXPECT_EQ(spec->table.size(), 2u);
}

TEST_F(MachineCompilerTest, ParseErrorsStopCompilation) {
    auto spec = compiler.compileSource("transitions: { *Idle + Start Running }");

    EXPECT_EQ(spec, nullptr);
    ASSERT_TRUE(compiler.hasErrors());
    EXPECT_EQ(compiler.getDiagnostics()[0].kind, ErrorKind::SyntaxError);
}

TEST_F(MachineCompilerTest, ExpansionErrorsStopCompilation) {
    auto spec = compiler.compileSource("transitions: { *Idle + Start = Running, _ + Tick = _ }");

    EXPECT_EQ(spec, nullptr);
    ASSERT_EQ(compiler.getDiagnostics().size(), 1u);
    EXPECT_EQ(compiler.getDiagnostics()[0].kind, ErrorKind::InvalidInternalTransitionError);
}

TEST_F(MachineCompilerTest, ValidationErrorsStopCompilation) {
    auto spec = compiler.compileFile(fixture("invalid/duplicate.tsm"));

    EXPECT_EQ(spec, nullptr);
    ASSERT_EQ(compiler.getDiagnostics().size(), 1u);
    EXPECT_EQ(compiler.getDiagnostics()[0].kind, ErrorKind::DuplicateTransitionError);
    EXPECT_EQ(compiler.getDiagnostics()[0].position.line, 3u);
}

TEST_F(MachineCompilerTest, MissingFileIsReported) {
    auto spec = compiler.compileFile(fixture("does_not_exist.tsm"));

    EXPECT_EQ(spec, nullptr);
    ASSERT_TRUE(compiler.hasErrors());
    EXPECT_EQ(compiler.getDiagnostics()[0].kind, ErrorKind::ConfigurationError);
}

TEST_F(MachineCompilerTest, DiagnosticsResetBetweenCompilations) {
    EXPECT_EQ(compiler.compileFile(fixture("invalid/duplicate.tsm")), nullptr);
    EXPECT_TRUE(compiler.hasErrors());

    EXPECT_NE(compiler.compileFile(fixture("player.tsm")), nullptr);
    EXPECT_FALSE(compiler.hasErrors());
}

TEST_F(MachineCompilerTest, LookupIsIdempotent) {
    auto spec = compiler.compileFile(fixture("door.tsm"));
    ASSERT_NE(spec, nullptr);

    for (const auto &state : spec->states) {
        for (const auto &event : spec->events) {
            EXPECT_EQ(spec->processEvent(state, event), spec->processEvent(state, event));
        }
    }
    EXPECT_EQ(spec->artifactStem(), "door");
}
