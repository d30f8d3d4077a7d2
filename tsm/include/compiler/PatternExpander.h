#pragma once

#include "model/Clause.h"
#include "model/Diagnostic.h"
#include "model/TransitionTable.h"
#include <optional>
#include <vector>

namespace TSM {

/**
 * @brief Concrete output of one clause
 *
 * A concrete-source clause yields transitions only, a wildcard-source
 * clause yields wildcard rules only.
 */
struct ClauseExpansion {
    std::vector<Transition> transitions;
    std::vector<WildcardRule> wildcardRules;
    const Clause *clause = nullptr;

    bool isWildcard() const {
        return !wildcardRules.empty();
    }
};

/**
 * @brief Expands '|' alternatives, the '_' source and the '_' target of a clause
 *
 * For a concrete source the result is the Cartesian product of source
 * alternatives and event alternatives, each paired with the target (or
 * with the source itself for '_'). A '_' source yields one wildcard rule
 * per event; those are resolved against the full state set by TableBuilder.
 */
class PatternExpander {
public:
    /**
     * @brief Expand a single clause
     * @param clause Clause to expand
     * @param diagnostics Receives an InvalidInternalTransitionError for '_ + E = _'
     * @return Expansion, nullopt on error
     */
    std::optional<ClauseExpansion> expand(const Clause &clause, DiagnosticList &diagnostics) const;

    /**
     * @brief Expand every clause, in source order
     * @return One expansion per clause, nullopt if any clause failed
     */
    std::optional<std::vector<ClauseExpansion>> expandAll(const std::vector<Clause> &clauses,
                                                          DiagnosticList &diagnostics) const;
};

}  // namespace TSM
