#include "compiler/TableBuilder.h"
#include "common/Logger.h"
#include <algorithm>
#include <utility>

namespace TSM {

namespace {

const char *const DUPLICATE_HINT = "each combination of source state and event can only appear once; use distinct "
                                   "events, or move conditional logic to the host application";

const char *const CAPABILITY_HINT = "supported capabilities: PartialEq, Eq, Clone, Copy, Debug, Display, Hash, "
                                    "PartialOrd, Ord, Default";

void appendUnique(std::vector<std::string> &values, const std::string &value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

std::string describeClause(const Clause *clause) {
    if (!clause) {
        return "an earlier clause";
    }
    return "'" + clause->text + "' (line " + std::to_string(clause->position.line) + ")";
}

}  // namespace

std::shared_ptr<const MachineSpec> TableBuilder::build(const MachineSource &source,
                                                       const std::vector<ClauseExpansion> &expansions,
                                                       DiagnosticList &diagnostics) const {
    auto spec = std::make_shared<MachineSpec>();
    spec->name = source.name ? source.name->name : "";
    spec->sourceName = source.sourceName;

    bool valid = true;
    valid &= resolveCapabilities(source.deriveStates, "derive_states", spec->deriveStates, diagnostics);
    valid &= resolveCapabilities(source.deriveEvents, "derive_events", spec->deriveEvents, diagnostics);

    collectSymbols(source, *spec);
    valid &= resolveInitialState(source, *spec, diagnostics);
    valid &= insertExplicitTransitions(source, expansions, *spec, diagnostics);
    valid &= registerWildcardRules(source, expansions, *spec, diagnostics);

    if (!valid) {
        LOG_DEBUG("TableBuilder: '{}' rejected", spec->sourceName);
        return nullptr;
    }

    applyWildcardRules(*spec);

    LOG_DEBUG("TableBuilder: '{}' has {} state(s), {} event(s), {} transition(s), initial '{}'", spec->sourceName,
              spec->states.size(), spec->events.size(), spec->table.size(), spec->initialState);
    return spec;
}

void TableBuilder::collectSymbols(const MachineSource &source, MachineSpec &spec) const {
    for (const auto &clause : source.clauses) {
        for (const auto &alternative : clause.source.alternatives) {
            appendUnique(spec.states, alternative.identifier.name);
        }
        if (!clause.target.isSameAsSource()) {
            appendUnique(spec.states, clause.target.identifier.name);
        }
        for (const auto &event : clause.events.alternatives) {
            appendUnique(spec.events, event.name);
        }
    }
}

bool TableBuilder::resolveInitialState(const MachineSource &source, MachineSpec &spec,
                                       DiagnosticList &diagnostics) const {
    for (const auto &clause : source.clauses) {
        if (const auto *initial = clause.source.initialAlternative()) {
            spec.initialState = initial->identifier.name;
            break;
        }
    }

    if (spec.initialState.empty()) {
        diagnostics.emplace_back(ErrorKind::InitialStateError,
                                 "no initial state: no clause marks its source state with '*'", SourcePosition{}, "",
                                 "prefix the starting state of one clause with '*'");
        return false;
    }

    // The initial state leads the enumeration so that it is the zero value
    auto it = std::find(spec.states.begin(), spec.states.end(), spec.initialState);
    std::rotate(spec.states.begin(), it, it + 1);
    return true;
}

bool TableBuilder::resolveCapabilities(const std::optional<std::vector<Identifier>> &derives, const std::string &key,
                                       CapabilitySet &capabilities, DiagnosticList &diagnostics) const {
    if (!derives) {
        capabilities = CapabilitySet::defaults();
        return true;
    }

    bool valid = true;
    for (const auto &derive : *derives) {
        if (!capabilities.insert(derive.name)) {
            diagnostics.emplace_back(ErrorKind::ConfigurationError,
                                     "unknown capability '" + derive.name + "' in '" + key + "'", derive.position, "",
                                     CAPABILITY_HINT);
            valid = false;
        }
    }
    return valid;
}

bool TableBuilder::insertExplicitTransitions(const MachineSource &source,
                                             const std::vector<ClauseExpansion> &expansions, MachineSpec &spec,
                                             DiagnosticList &diagnostics) const {
    bool valid = true;
    for (const auto &expansion : expansions) {
        for (const auto &transition : expansion.transitions) {
            const TableEntry *existing =
                spec.table.insert(transition.state, transition.event,
                                  TableEntry{transition.target, TransitionOrigin::Explicit, transition.clauseIndex});
            if (!existing) {
                continue;
            }

            const Clause *clause = findClause(source, transition.clauseIndex);
            const Clause *earlier = findClause(source, existing->clauseIndex);
            std::string message = "duplicate transition: state '" + transition.state + "' + event '" +
                                   transition.event + "' is already defined by " + describeClause(earlier) +
                                   " with target '" + existing->target + "'; this clause targets '" +
                                   transition.target + "'";

            diagnostics.emplace_back(ErrorKind::DuplicateTransitionError, message,
                                     eventPosition(clause, transition.event), clause ? clause->text : "",
                                     DUPLICATE_HINT);
            valid = false;
        }
    }
    return valid;
}

bool TableBuilder::registerWildcardRules(const MachineSource &source, const std::vector<ClauseExpansion> &expansions,
                                         MachineSpec &spec, DiagnosticList &diagnostics) const {
    std::map<std::string, WildcardRule> rulesByEvent;
    bool valid = true;

    for (const auto &expansion : expansions) {
        for (const auto &rule : expansion.wildcardRules) {
            auto [it, inserted] = rulesByEvent.try_emplace(rule.event, rule);
            if (inserted) {
                spec.table.addWildcardRule(rule);
                continue;
            }

            const WildcardRule &first = it->second;
            const Clause *clause = findClause(source, rule.clauseIndex);
            if (first.target == rule.target) {
                LOG_WARN("TableBuilder: wildcard rule '_ + {} = {}' repeated in '{}'", rule.event, rule.target,
                         clause ? clause->text : "");
                continue;
            }

            const Clause *earlier = findClause(source, first.clauseIndex);
            diagnostics.emplace_back(ErrorKind::AmbiguousWildcardError,
                                     "ambiguous wildcard: event '" + rule.event + "' leads to '" + first.target +
                                         "' in " + describeClause(earlier) + " and to '" + rule.target +
                                         "' in this clause",
                                     eventPosition(clause, rule.event), clause ? clause->text : "",
                                     "give each wildcard event a single target");
            valid = false;
        }
    }
    return valid;
}

void TableBuilder::applyWildcardRules(MachineSpec &spec) const {
    for (const auto &rule : spec.table.wildcardRules()) {
        size_t applied = 0;
        for (const auto &state : spec.states) {
            // Explicit entries take precedence over the wildcard
            if (!spec.table.insert(state, rule.event, TableEntry{rule.target, TransitionOrigin::Wildcard,
                                                                 rule.clauseIndex})) {
                applied++;
            }
        }
        LOG_TRACE("TableBuilder: '_ + {} = {}' applied to {} state(s)", rule.event, rule.target, applied);
    }
}

const Clause *TableBuilder::findClause(const MachineSource &source, size_t clauseIndex) {
    for (const auto &clause : source.clauses) {
        if (clause.index == clauseIndex) {
            return &clause;
        }
    }
    return nullptr;
}

SourcePosition TableBuilder::eventPosition(const Clause *clause, const std::string &event) {
    if (!clause) {
        return {};
    }
    for (const auto &alternative : clause->events.alternatives) {
        if (alternative.name == event) {
            return alternative.position;
        }
    }
    return clause->position;
}

}  // namespace TSM
