#pragma once

#include "model/Clause.h"
#include "model/Diagnostic.h"
#include "parsing/Token.h"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TSM {

/**
 * @brief Parser for the transition DSL
 *
 * Turns the source text into a MachineSource: the optional name and derive
 * lists, and the ordered clause list of the transitions block.
 *
 * @code
 * name: Player,
 * derive_states: [Debug, Clone, PartialEq, Eq],
 * transitions: {
 *     *Idle + Start = Running,
 *     Running + Pause | Stop = Idle,
 *     _ + Reset = Idle,
 * }
 * @endcode
 *
 * Errors are collected rather than thrown. A malformed clause is reported
 * and skipped up to the next ',' or '}' so that one pass reports every bad
 * clause; the result is nullptr whenever any error was recorded.
 */
class MachineParser {
public:
    MachineParser() = default;
    ~MachineParser() = default;

    /**
     * @brief Parse a DSL file
     * @param filename Path of the file to parse
     * @return Parsed source, nullptr on failure
     */
    std::shared_ptr<MachineSource> parseFile(const std::string &filename);

    /**
     * @brief Parse DSL text
     * @param content Source text
     * @param sourceName Label used in diagnostics
     * @return Parsed source, nullptr on failure
     */
    std::shared_ptr<MachineSource> parseContent(const std::string &content, const std::string &sourceName = "<input>");

    bool hasErrors() const;

    const DiagnosticList &getDiagnostics() const;

private:
    std::shared_ptr<MachineSource> parseTokens();

    bool parseMetadataEntry(MachineSource &source, std::set<std::string> &seenKeys, bool &sawTransitions);
    std::optional<std::vector<Identifier>> parseIdentifierList(const std::string &key);
    bool parseTransitionsBlock(MachineSource &source);

    std::optional<Clause> parseClause(size_t index);
    std::optional<StatePattern> parseStatePattern(size_t clauseStart);
    std::optional<EventPattern> parseEventPattern(size_t clauseStart);
    std::optional<TargetSpec> parseTarget(size_t clauseStart);

    void validateInitialMarkers(const MachineSource &source, const SourcePosition &blockPosition);

    // Skip to the ',' or '}' that ends the current clause without consuming it
    void synchronizeToClauseEnd();

    std::string clauseTextFrom(size_t firstToken) const;
    std::string describe(const Token &token) const;

    const Token &peek(size_t ahead = 0) const;
    const Token &advance();
    bool check(TokenType type) const;
    bool match(TokenType type);

    void addError(ErrorKind kind, const std::string &message, const SourcePosition &position,
                  const std::string &clauseText = "", const std::string &hint = "");
    void reportInvalidToken(const Token &token, const std::string &clauseText);
    void clearDiagnostics();

    std::string sourceName_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    DiagnosticList diagnostics_;
};

}  // namespace TSM
