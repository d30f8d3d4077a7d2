#include "model/TransitionTable.h"

namespace TSM {

const TableEntry *TransitionTable::insert(const std::string &state, const std::string &event, TableEntry entry) {
    auto [it, inserted] = entries_.try_emplace(Key{state, event}, std::move(entry));
    return inserted ? nullptr : &it->second;
}

const TableEntry *TransitionTable::find(const std::string &state, const std::string &event) const {
    auto it = entries_.find(Key{state, event});
    return it == entries_.end() ? nullptr : &it->second;
}

std::optional<std::string> TransitionTable::lookup(const std::string &state, const std::string &event) const {
    const TableEntry *entry = find(state, event);
    if (!entry) {
        return std::nullopt;
    }
    return entry->target;
}

}  // namespace TSM
