#include "compiler/PatternExpander.h"
#include "common/Logger.h"
#include <utility>

namespace TSM {

std::optional<ClauseExpansion> PatternExpander::expand(const Clause &clause, DiagnosticList &diagnostics) const {
    ClauseExpansion expansion;
    expansion.clause = &clause;

    if (clause.source.isWildcard()) {
        if (clause.target.isSameAsSource()) {
            diagnostics.emplace_back(ErrorKind::InvalidInternalTransitionError,
                                     "a wildcard source cannot use '_' as target: there is no single source state "
                                     "to stay in",
                                     clause.target.position, clause.text,
                                     "name the target state, or write the internal transition per state");
            return std::nullopt;
        }

        for (const auto &event : clause.events.alternatives) {
            expansion.wildcardRules.push_back(WildcardRule{event.name, clause.target.identifier.name, clause.index});
        }
        LOG_TRACE("PatternExpander: '{}' -> {} wildcard rule(s)", clause.text, expansion.wildcardRules.size());
        return expansion;
    }

    for (const auto &alternative : clause.source.alternatives) {
        const std::string &state = alternative.identifier.name;
        const std::string &target = clause.target.isSameAsSource() ? state : clause.target.identifier.name;

        for (const auto &event : clause.events.alternatives) {
            expansion.transitions.push_back(Transition{state, event.name, target, clause.index});
        }
    }
    LOG_TRACE("PatternExpander: '{}' -> {} transition(s)", clause.text, expansion.transitions.size());
    return expansion;
}

std::optional<std::vector<ClauseExpansion>> PatternExpander::expandAll(const std::vector<Clause> &clauses,
                                                                       DiagnosticList &diagnostics) const {
    std::vector<ClauseExpansion> expansions;
    expansions.reserve(clauses.size());

    bool failed = false;
    for (const auto &clause : clauses) {
        auto expansion = expand(clause, diagnostics);
        if (!expansion) {
            failed = true;
            continue;
        }
        expansions.push_back(std::move(*expansion));
    }

    if (failed) {
        return std::nullopt;
    }
    return expansions;
}

}  // namespace TSM
