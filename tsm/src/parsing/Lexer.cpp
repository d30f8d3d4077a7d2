#include "parsing/Lexer.h"
#include "common/Logger.h"
#include <cctype>
#include <utility>

namespace TSM {

std::string_view tokenTypeToString(TokenType type) {
    switch (type) {
    case TokenType::Identifier:
        return "identifier";
    case TokenType::Underscore:
        return "'_'";
    case TokenType::Star:
        return "'*'";
    case TokenType::Plus:
        return "'+'";
    case TokenType::Pipe:
        return "'|'";
    case TokenType::Equals:
        return "'='";
    case TokenType::Comma:
        return "','";
    case TokenType::Colon:
        return "':'";
    case TokenType::LBracket:
        return "'['";
    case TokenType::RBracket:
        return "']'";
    case TokenType::LBrace:
        return "'{'";
    case TokenType::RBrace:
        return "'}'";
    case TokenType::EndOfInput:
        return "end of input";
    case TokenType::Invalid:
        return "invalid token";
    }
    return "unknown";
}

Lexer::Lexer(std::string source) : source_(std::move(source)) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        Token token = nextToken();
        bool done = token.is(TokenType::EndOfInput);
        tokens.push_back(std::move(token));
        if (done) {
            break;
        }
    }
    LOG_TRACE("Lexer: produced {} tokens", tokens.size());
    return tokens;
}

Token Lexer::nextToken() {
    SourcePosition unterminatedAt;
    if (!skipWhitespaceAndComments(unterminatedAt)) {
        return makeToken(TokenType::Invalid, "/*", unterminatedAt);
    }

    SourcePosition start = currentPosition();
    if (isAtEnd()) {
        return makeToken(TokenType::EndOfInput, "", start);
    }

    char c = peek();
    if (isIdentifierStart(c)) {
        return scanIdentifier(start);
    }

    advance();
    switch (c) {
    case '*':
        return makeToken(TokenType::Star, "*", start);
    case '+':
        return makeToken(TokenType::Plus, "+", start);
    case '|':
        return makeToken(TokenType::Pipe, "|", start);
    case '=':
        return makeToken(TokenType::Equals, "=", start);
    case ',':
        return makeToken(TokenType::Comma, ",", start);
    case ':':
        return makeToken(TokenType::Colon, ":", start);
    case '[':
        return makeToken(TokenType::LBracket, "[", start);
    case ']':
        return makeToken(TokenType::RBracket, "]", start);
    case '{':
        return makeToken(TokenType::LBrace, "{", start);
    case '}':
        return makeToken(TokenType::RBrace, "}", start);
    default:
        break;
    }

    return makeToken(TokenType::Invalid, std::string(1, c), start);
}

char Lexer::peek() const {
    return isAtEnd() ? '\0' : source_[current_];
}

char Lexer::peekNext() const {
    return current_ + 1 >= source_.size() ? '\0' : source_[current_ + 1];
}

char Lexer::advance() {
    char c = source_[current_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

SourcePosition Lexer::currentPosition() const {
    return SourcePosition{line_, column_, current_};
}

Token Lexer::makeToken(TokenType type, std::string lexeme, const SourcePosition &start) const {
    Token token;
    token.type = type;
    token.lexeme = std::move(lexeme);
    token.position = start;
    return token;
}

bool Lexer::skipWhitespaceAndComments(SourcePosition &unterminatedAt) {
    while (!isAtEnd()) {
        char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else if (c == '/' && peekNext() == '/') {
            while (!isAtEnd() && peek() != '\n') {
                advance();
            }
        } else if (c == '/' && peekNext() == '*') {
            unterminatedAt = currentPosition();
            advance();
            advance();
            bool closed = false;
            while (!isAtEnd()) {
                if (peek() == '*' && peekNext() == '/') {
                    advance();
                    advance();
                    closed = true;
                    break;
                }
                advance();
            }
            if (!closed) {
                return false;
            }
        } else {
            break;
        }
    }
    return true;
}

Token Lexer::scanIdentifier(const SourcePosition &start) {
    size_t begin = current_;
    while (!isAtEnd() && isIdentifierChar(peek())) {
        advance();
    }

    std::string text = source_.substr(begin, current_ - begin);
    if (text == "_") {
        return makeToken(TokenType::Underscore, text, start);
    }
    return makeToken(TokenType::Identifier, text, start);
}

bool Lexer::isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool Lexer::isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace TSM
