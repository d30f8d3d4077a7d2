#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TSM {

/**
 * @brief Concrete (state, event) -> target triple produced by expansion
 */
struct Transition {
    std::string state;
    std::string event;
    std::string target;
    size_t clauseIndex = 0;
};

/**
 * @brief "Any state + event = target" rule from a wildcard-source clause
 */
struct WildcardRule {
    std::string event;
    std::string target;
    size_t clauseIndex = 0;
};

enum class TransitionOrigin { Explicit, Wildcard };

struct TableEntry {
    std::string target;
    TransitionOrigin origin = TransitionOrigin::Explicit;
    size_t clauseIndex = 0;
};

/**
 * @brief Canonical (state, event) -> target mapping
 *
 * Holds the resolved entries, explicit and wildcard-derived alike, and keeps
 * the wildcard rules they were derived from. The table itself does not
 * validate: insert() refuses to overwrite and hands the caller the entry
 * already present so it can report the conflict.
 */
class TransitionTable {
public:
    using Key = std::pair<std::string, std::string>;  // (state, event)

    /**
     * @brief Insert an entry unless the key is taken
     * @return nullptr on success, otherwise the existing entry
     */
    const TableEntry *insert(const std::string &state, const std::string &event, TableEntry entry);

    void addWildcardRule(WildcardRule rule) {
        wildcardRules_.push_back(std::move(rule));
    }

    const TableEntry *find(const std::string &state, const std::string &event) const;

    /**
     * @brief Target for (state, event), nullopt when there is no transition
     */
    std::optional<std::string> lookup(const std::string &state, const std::string &event) const;

    bool contains(const std::string &state, const std::string &event) const {
        return find(state, event) != nullptr;
    }

    const std::map<Key, TableEntry> &entries() const {
        return entries_;
    }

    const std::vector<WildcardRule> &wildcardRules() const {
        return wildcardRules_;
    }

    size_t size() const {
        return entries_.size();
    }

private:
    std::map<Key, TableEntry> entries_;
    std::vector<WildcardRule> wildcardRules_;
};

}  // namespace TSM
