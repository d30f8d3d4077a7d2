#pragma once

#include "model/Capability.h"
#include "model/TransitionTable.h"
#include <optional>
#include <string>
#include <vector>

namespace TSM {

/**
 * @brief Validated state machine, the sole input of the emitters
 *
 * states lists every distinct state in first-seen order with the initial
 * state moved to the front; events lists every distinct event in first-seen
 * order. Built once by TableBuilder and handed out as a const object.
 */
class MachineSpec {
public:
    std::string name;        // Namespace name, empty for the default namespace
    std::string sourceName;  // Input file or label used in diagnostics
    CapabilitySet deriveStates;
    CapabilitySet deriveEvents;
    std::vector<std::string> states;
    std::vector<std::string> events;
    std::string initialState;
    TransitionTable table;

    bool hasNamespace() const {
        return !name.empty();
    }

    /**
     * @brief Base name of emitted artifacts: the machine name, else the source file stem
     */
    std::string artifactStem() const;

    std::optional<size_t> stateIndex(const std::string &state) const;
    std::optional<size_t> eventIndex(const std::string &event) const;

    /**
     * @brief Target of (state, event), nullopt for "no transition"
     */
    std::optional<std::string> processEvent(const std::string &state, const std::string &event) const {
        return table.lookup(state, event);
    }
};

}  // namespace TSM
