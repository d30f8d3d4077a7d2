#pragma once

#include "parsing/Token.h"
#include <string>
#include <vector>

namespace TSM {

/**
 * @brief Tokenizer for the transition DSL
 *
 * Whitespace is insignificant. "//" starts a comment running to the end of
 * the line; C-style block comments are skipped as well. Problems are
 * reported as Invalid tokens (the offending character, or the opening of an
 * unterminated block comment); the parser turns them into SyntaxError
 * diagnostics.
 */
class Lexer {
public:
    explicit Lexer(std::string source);

    /**
     * @brief Tokenize the entire source; the last token is always EndOfInput
     */
    std::vector<Token> tokenize();

    Token nextToken();

    bool isAtEnd() const {
        return current_ >= source_.size();
    }

private:
    std::string source_;
    size_t current_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    char peek() const;
    char peekNext() const;
    char advance();

    SourcePosition currentPosition() const;
    Token makeToken(TokenType type, std::string lexeme, const SourcePosition &start) const;

    // Returns false if a block comment is left open
    bool skipWhitespaceAndComments(SourcePosition &unterminatedAt);

    Token scanIdentifier(const SourcePosition &start);

    static bool isIdentifierStart(char c);
    static bool isIdentifierChar(char c);
};

}  // namespace TSM
