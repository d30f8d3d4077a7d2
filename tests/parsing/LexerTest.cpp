#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "parsing/Lexer.h"

using namespace TSM;

namespace {

std::vector<TokenType> typesOf(const std::vector<Token> &tokens) {
    std::vector<TokenType> types;
    for (const auto &token : tokens) {
        types.push_back(token.type);
    }
    return types;
}

}  // namespace

TEST(LexerTest, TokenizesClause) {
    Lexer lexer("*Idle | Busy + Start = Running,");
    auto tokens = lexer.tokenize();

    std::vector<TokenType> expected = {TokenType::Star,       TokenType::Identifier, TokenType::Pipe,
                                       TokenType::Identifier, TokenType::Plus,       TokenType::Identifier,
                                       TokenType::Equals,     TokenType::Identifier, TokenType::Comma,
                                       TokenType::EndOfInput};
    EXPECT_EQ(typesOf(tokens), expected);
    EXPECT_EQ(tokens[1].lexeme, "Idle");
    EXPECT_EQ(tokens[3].lexeme, "Busy");
    EXPECT_EQ(tokens[7].lexeme, "Running");
}

TEST(LexerTest, LoneUnderscoreIsWildcard) {
    Lexer lexer("_ + Reset = _ _private");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].type, TokenType::Underscore);
    EXPECT_EQ(tokens[4].type, TokenType::Underscore);
    EXPECT_EQ(tokens[5].type, TokenType::Identifier);
    EXPECT_EQ(tokens[5].lexeme, "_private");
}

TEST(LexerTest, TracksLineAndColumn) {
    Lexer lexer("name: Robot,\n  transitions");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].position.line, 1u);
    EXPECT_EQ(tokens[0].position.column, 1u);
    EXPECT_EQ(tokens[2].lexeme, "Robot");
    EXPECT_EQ(tokens[2].position.column, 7u);
    EXPECT_EQ(tokens[4].lexeme, "transitions");
    EXPECT_EQ(tokens[4].position.line, 2u);
    EXPECT_EQ(tokens[4].position.column, 3u);
}

TEST(LexerTest, SkipsComments) {
    Lexer lexer("// leading comment\nIdle /* inline\n comment */ + Go");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].lexeme, "Idle");
    EXPECT_EQ(tokens[0].position.line, 2u);
    EXPECT_EQ(tokens[1].type, TokenType::Plus);
    EXPECT_EQ(tokens[1].position.line, 3u);
    EXPECT_EQ(tokens[2].lexeme, "Go");
}

TEST(LexerTest, UnknownCharacterIsInvalid) {
    Lexer lexer("Idle + Go -> Busy");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 4u);
    EXPECT_EQ(tokens[3].type, TokenType::Invalid);
    EXPECT_EQ(tokens[3].lexeme, "-");
    EXPECT_EQ(tokens[3].position.column, 11u);
}

TEST(LexerTest, UnterminatedBlockCommentIsInvalid) {
    Lexer lexer("Idle /* never closed");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].type, TokenType::Invalid);
    EXPECT_EQ(tokens[1].lexeme, "/*");
    EXPECT_EQ(tokens[1].position.column, 6u);
    EXPECT_EQ(tokens.back().type, TokenType::EndOfInput);
}

TEST(LexerTest, EmptyInputYieldsEndOfInput) {
    Lexer lexer("   \n\t ");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::EndOfInput);
}
