#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TSM {

/**
 * @brief Position inside the DSL source (1-based line and column)
 */
struct SourcePosition {
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    bool isKnown() const {
        return line > 0;
    }
};

enum class ErrorKind {
    SyntaxError,                     // Text does not match the grammar
    InitialStateError,               // Zero or several '*' markers, or '*' on the wildcard
    DuplicateTransitionError,        // Same (state, event) defined twice by explicit clauses
    AmbiguousWildcardError,          // Two wildcard clauses give one event different targets
    InvalidInternalTransitionError,  // '_' target on a wildcard source
    ConfigurationError,              // Unknown derive capability, unreadable input
    ReservedIdentifierError          // Identifier cannot become a C++ enumerator
};

std::string_view errorKindName(ErrorKind kind);

/**
 * @brief Structured compile error
 *
 * Every failure of the compilation pipeline is reported as a Diagnostic.
 * clauseText holds the offending clause as written (empty when the error is
 * not tied to a single clause) and hint an optional remediation.
 */
struct Diagnostic {
    ErrorKind kind = ErrorKind::SyntaxError;
    std::string message;
    std::string clauseText;
    SourcePosition position;
    std::string hint;

    Diagnostic() = default;

    Diagnostic(ErrorKind k, std::string msg, SourcePosition pos = {}, std::string clause = "", std::string help = "")
        : kind(k), message(std::move(msg)), clauseText(std::move(clause)), position(pos), hint(std::move(help)) {}

    /**
     * @brief Render as "<source>:<line>:<column>: error[<Kind>]: <message>"
     *
     * The clause text and the hint follow on their own indented lines.
     */
    std::string format(const std::string &sourceName) const;
};

using DiagnosticList = std::vector<Diagnostic>;

}  // namespace TSM
