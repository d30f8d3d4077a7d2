#pragma once

#include "model/MachineSpec.h"
#include <cstddef>
#include <json/json.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TSM {

/**
 * @brief Interpreter over a serialized transition table
 *
 * Holds a dense states x events table of target indices, built from the
 * JSON written by TableSerializer or directly from a MachineSpec. Like the
 * generated processEvent() it is a pure lookup: the caller owns the current
 * state and decides whether to commit the returned target.
 *
 * @code
 * std::string error;
 * auto machine = TableMachine::loadFile("robot_table.json", &error);
 * auto state = machine->initialState();
 * if (auto next = machine->processEvent(state, *machine->findEvent("Move"))) {
 *     state = *next;
 * }
 * @endcode
 *
 * Instances are immutable and may be shared between threads.
 */
class TableMachine {
    // Only the factories below can name this, so only they can construct
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    using StateId = size_t;
    using EventId = size_t;

    explicit TableMachine(ConstructionKey) {}

    static std::shared_ptr<const TableMachine> fromSpec(const MachineSpec &spec);

    /**
     * @brief Build from a parsed table document
     * @param root Document in the TableSerializer format
     * @param errorOut Receives the reason on failure
     * @return Machine, nullptr if the document is malformed
     */
    static std::shared_ptr<const TableMachine> fromJson(const Json::Value &root, std::string *errorOut = nullptr);

    static std::shared_ptr<const TableMachine> fromJsonString(const std::string &json,
                                                              std::string *errorOut = nullptr);

    static std::shared_ptr<const TableMachine> loadFile(const std::string &filename, std::string *errorOut = nullptr);

    const std::string &name() const {
        return name_;
    }

    StateId initialState() const {
        return initialState_;
    }

    size_t stateCount() const {
        return states_.size();
    }

    size_t eventCount() const {
        return events_.size();
    }

    const std::string &stateName(StateId state) const;
    const std::string &eventName(EventId event) const;

    std::optional<StateId> findState(const std::string &name) const;
    std::optional<EventId> findEvent(const std::string &name) const;

    /**
     * @brief Target of (state, event)
     * @return nullopt when there is no transition or an id is out of range
     */
    std::optional<StateId> processEvent(StateId state, EventId event) const noexcept;

    /**
     * @brief Name-based lookup; unknown names yield nullopt
     */
    std::optional<std::string> processEvent(const std::string &state, const std::string &event) const;

private:
    static constexpr size_t NO_TRANSITION = static_cast<size_t>(-1);

    bool setTarget(StateId state, EventId event, StateId target);

    std::string name_;
    std::vector<std::string> states_;
    std::vector<std::string> events_;
    std::vector<size_t> targets_;  // row-major, stateCount() x eventCount()
    StateId initialState_ = 0;
};

}  // namespace TSM
