#pragma once

#include "compiler/PatternExpander.h"
#include "model/Clause.h"
#include "model/Diagnostic.h"
#include "model/MachineSpec.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TSM {

/**
 * @brief Builds and validates the transition table of a machine
 *
 * Steps, in order:
 *  1. collect distinct states (sources, targets, wildcard targets) and
 *     events in first-seen order, initial state first;
 *  2. insert explicit transitions; any repeated (state, event) is a
 *     DuplicateTransitionError, even with the same target;
 *  3. register wildcard rules; one event with two different wildcard
 *     targets is an AmbiguousWildcardError;
 *  4. apply each wildcard rule to every state without an explicit entry
 *     for its event.
 * All violations are reported; no MachineSpec is produced if any occurred.
 */
class TableBuilder {
public:
    /**
     * @brief Build the validated machine
     * @param source Parsed source (clauses and metadata)
     * @param expansions Expansion of every clause, in source order
     * @param diagnostics Receives every violation found
     * @return Machine, nullptr on failure
     */
    std::shared_ptr<const MachineSpec> build(const MachineSource &source,
                                             const std::vector<ClauseExpansion> &expansions,
                                             DiagnosticList &diagnostics) const;

private:
    void collectSymbols(const MachineSource &source, MachineSpec &spec) const;
    bool resolveInitialState(const MachineSource &source, MachineSpec &spec, DiagnosticList &diagnostics) const;
    bool resolveCapabilities(const std::optional<std::vector<Identifier>> &derives, const std::string &key,
                             CapabilitySet &capabilities, DiagnosticList &diagnostics) const;

    bool insertExplicitTransitions(const MachineSource &source, const std::vector<ClauseExpansion> &expansions,
                                   MachineSpec &spec, DiagnosticList &diagnostics) const;
    bool registerWildcardRules(const MachineSource &source, const std::vector<ClauseExpansion> &expansions,
                               MachineSpec &spec, DiagnosticList &diagnostics) const;
    void applyWildcardRules(MachineSpec &spec) const;

    static const Clause *findClause(const MachineSource &source, size_t clauseIndex);
    static SourcePosition eventPosition(const Clause *clause, const std::string &event);
};

}  // namespace TSM
