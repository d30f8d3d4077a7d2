#pragma once

#include "model/Diagnostic.h"
#include <string>
#include <string_view>

namespace TSM {

enum class TokenType {
    Identifier,  // [A-Za-z_][A-Za-z0-9_]* except a lone '_'
    Underscore,  // _
    Star,        // *
    Plus,        // +
    Pipe,        // |
    Equals,      // =
    Comma,       // ,
    Colon,       // :
    LBracket,    // [
    RBracket,    // ]
    LBrace,      // {
    RBrace,      // }
    EndOfInput,
    Invalid  // Unknown character or unterminated comment
};

std::string_view tokenTypeToString(TokenType type);

struct Token {
    TokenType type = TokenType::EndOfInput;
    std::string lexeme;
    SourcePosition position;

    bool is(TokenType t) const {
        return type == t;
    }
};

}  // namespace TSM
