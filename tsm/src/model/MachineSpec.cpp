#include "model/MachineSpec.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>

namespace TSM {

namespace {

std::optional<size_t> indexOf(const std::vector<std::string> &values, const std::string &value) {
    auto it = std::find(values.begin(), values.end(), value);
    if (it == values.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(values.begin(), it));
}

}  // namespace

std::string MachineSpec::artifactStem() const {
    if (hasNamespace()) {
        return name;
    }

    std::string stem = std::filesystem::path(sourceName).stem().string();
    bool usable = !stem.empty() && std::all_of(stem.begin(), stem.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
    return usable ? stem : "machine";
}

std::optional<size_t> MachineSpec::stateIndex(const std::string &state) const {
    return indexOf(states, state);
}

std::optional<size_t> MachineSpec::eventIndex(const std::string &event) const {
    return indexOf(events, event);
}

}  // namespace TSM
