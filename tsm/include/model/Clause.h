#pragma once

#include "model/Diagnostic.h"
#include <optional>
#include <string>
#include <vector>

namespace TSM {

/**
 * @brief Name of a state or event as written in the source
 */
struct Identifier {
    std::string name;
    SourcePosition position;
};

struct StateAlternative {
    Identifier identifier;
    bool initial = false;  // Marked with '*'
};

/**
 * @brief Source side of a clause: '_' or one or more '|'-separated states
 */
struct StatePattern {
    enum class Kind { Concrete, Wildcard };

    Kind kind = Kind::Concrete;
    std::vector<StateAlternative> alternatives;  // Empty for Wildcard
    SourcePosition position;

    bool isWildcard() const {
        return kind == Kind::Wildcard;
    }

    /**
     * @brief Alternative carrying the '*' marker, nullptr if none
     */
    const StateAlternative *initialAlternative() const {
        for (const auto &alternative : alternatives) {
            if (alternative.initial) {
                return &alternative;
            }
        }
        return nullptr;
    }
};

struct EventPattern {
    std::vector<Identifier> alternatives;
};

/**
 * @brief Destination of a clause: a named state or '_' (stay in the source state)
 */
struct TargetSpec {
    enum class Kind { State, SameAsSource };

    Kind kind = Kind::SameAsSource;
    Identifier identifier;  // Valid for Kind::State
    SourcePosition position;

    bool isSameAsSource() const {
        return kind == Kind::SameAsSource;
    }
};

/**
 * @brief One "source + events = target" rule in source order
 */
struct Clause {
    StatePattern source;
    EventPattern events;
    TargetSpec target;
    std::string text;  // Clause as written, whitespace collapsed
    SourcePosition position;
    size_t index = 0;  // Position in the transitions block
};

/**
 * @brief Parser output: metadata shell plus the ordered clause list
 */
struct MachineSource {
    std::string sourceName;
    std::optional<Identifier> name;
    std::optional<std::vector<Identifier>> deriveStates;
    std::optional<std::vector<Identifier>> deriveEvents;
    std::vector<Clause> clauses;
};

}  // namespace TSM
