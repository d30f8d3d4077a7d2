#include "runtime/TableMachine.h"
#include "common/FileLoadingHelper.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "runtime/TableSerializer.h"
#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace TSM {

namespace {

std::optional<size_t> indexOf(const std::vector<std::string> &values, const std::string &value) {
    auto it = std::find(values.begin(), values.end(), value);
    if (it == values.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(values.begin(), it));
}

bool hasDuplicates(const std::vector<std::string> &values) {
    std::set<std::string> seen(values.begin(), values.end());
    return seen.size() != values.size();
}

std::shared_ptr<const TableMachine> reject(const std::string &reason, std::string *errorOut) {
    LOG_ERROR("TableMachine: Invalid table: {}", reason);
    if (errorOut) {
        *errorOut = reason;
    }
    return nullptr;
}

}  // namespace

std::shared_ptr<const TableMachine> TableMachine::fromSpec(const MachineSpec &spec) {
    auto machine = std::make_shared<TableMachine>(ConstructionKey{});
    machine->name_ = spec.name;
    machine->states_ = spec.states;
    machine->events_ = spec.events;
    machine->targets_.assign(spec.states.size() * spec.events.size(), NO_TRANSITION);
    machine->initialState_ = spec.stateIndex(spec.initialState).value_or(0);

    for (const auto &[key, entry] : spec.table.entries()) {
        auto state = spec.stateIndex(key.first);
        auto event = spec.eventIndex(key.second);
        auto target = spec.stateIndex(entry.target);
        if (state && event && target) {
            machine->targets_[*state * spec.events.size() + *event] = *target;
        }
    }

    LOG_DEBUG("TableMachine: Built '{}' from compiled machine ({} entries)", spec.artifactStem(), spec.table.size());
    return machine;
}

std::shared_ptr<const TableMachine> TableMachine::fromJson(const Json::Value &root, std::string *errorOut) {
    if (!root.isObject()) {
        return reject("document is not a JSON object", errorOut);
    }

    std::string format = JsonUtils::getString(root, "format");
    if (format != TableSerializer::FORMAT_TAG) {
        return reject("unexpected format '" + format + "', expected '" + TableSerializer::FORMAT_TAG + "'", errorOut);
    }

    int version = JsonUtils::getInt(root, "version", -1);
    if (version != TableSerializer::FORMAT_VERSION) {
        return reject("unsupported version " + std::to_string(version), errorOut);
    }

    auto states = JsonUtils::getStringArray(root, "states");
    auto events = JsonUtils::getStringArray(root, "events");
    if (!states || states->empty()) {
        return reject("'states' must be a non-empty array of strings", errorOut);
    }
    if (!events) {
        return reject("'events' must be an array of strings", errorOut);
    }
    if (hasDuplicates(*states) || hasDuplicates(*events)) {
        return reject("'states' and 'events' must not contain duplicates", errorOut);
    }

    auto machine = std::make_shared<TableMachine>(ConstructionKey{});
    machine->name_ = JsonUtils::getString(root, "name");
    machine->states_ = std::move(*states);
    machine->events_ = std::move(*events);
    machine->targets_.assign(machine->states_.size() * machine->events_.size(), NO_TRANSITION);

    std::string initial = JsonUtils::getString(root, "initial");
    auto initialId = machine->findState(initial);
    if (!initialId) {
        return reject("initial state '" + initial + "' is not a declared state", errorOut);
    }
    machine->initialState_ = *initialId;

    const Json::Value &transitions = root["transitions"];
    if (!transitions.isArray()) {
        return reject("'transitions' must be an array", errorOut);
    }

    for (const auto &transition : transitions) {
        std::string state = JsonUtils::getString(transition, "state");
        std::string event = JsonUtils::getString(transition, "event");
        std::string target = JsonUtils::getString(transition, "target");

        auto stateId = machine->findState(state);
        auto eventId = machine->findEvent(event);
        auto targetId = machine->findState(target);
        if (!stateId || !eventId || !targetId) {
            return reject("transition '" + state + " + " + event + " = " + target + "' names an undeclared symbol",
                          errorOut);
        }
        if (!machine->setTarget(*stateId, *eventId, *targetId)) {
            return reject("transition '" + state + " + " + event + "' is listed more than once", errorOut);
        }
    }

    LOG_DEBUG("TableMachine: Loaded '{}' ({} states, {} events, {} transitions)", machine->name_,
              machine->states_.size(), machine->events_.size(), transitions.size());
    return machine;
}

std::shared_ptr<const TableMachine> TableMachine::fromJsonString(const std::string &json, std::string *errorOut) {
    std::string parseError;
    auto root = JsonUtils::parseJson(json, &parseError);
    if (!root) {
        return reject("malformed JSON: " + parseError, errorOut);
    }
    return fromJson(*root, errorOut);
}

std::shared_ptr<const TableMachine> TableMachine::loadFile(const std::string &filename, std::string *errorOut) {
    std::string content;
    if (!FileLoadingHelper::loadFileContent(filename, content)) {
        return reject("cannot read " + filename, errorOut);
    }
    return fromJsonString(content, errorOut);
}

const std::string &TableMachine::stateName(StateId state) const {
    static const std::string unknown;
    return state < states_.size() ? states_[state] : unknown;
}

const std::string &TableMachine::eventName(EventId event) const {
    static const std::string unknown;
    return event < events_.size() ? events_[event] : unknown;
}

std::optional<TableMachine::StateId> TableMachine::findState(const std::string &name) const {
    return indexOf(states_, name);
}

std::optional<TableMachine::EventId> TableMachine::findEvent(const std::string &name) const {
    return indexOf(events_, name);
}

std::optional<TableMachine::StateId> TableMachine::processEvent(StateId state, EventId event) const noexcept {
    if (state >= states_.size() || event >= events_.size()) {
        return std::nullopt;
    }

    size_t target = targets_[state * events_.size() + event];
    if (target == NO_TRANSITION) {
        return std::nullopt;
    }
    return target;
}

std::optional<std::string> TableMachine::processEvent(const std::string &state, const std::string &event) const {
    auto stateId = findState(state);
    auto eventId = findEvent(event);
    if (!stateId || !eventId) {
        return std::nullopt;
    }

    auto target = processEvent(*stateId, *eventId);
    if (!target) {
        return std::nullopt;
    }
    return states_[*target];
}

bool TableMachine::setTarget(StateId state, EventId event, StateId target) {
    size_t &slot = targets_[state * events_.size() + event];
    if (slot != NO_TRANSITION) {
        return false;
    }
    slot = target;
    return true;
}

}  // namespace TSM
