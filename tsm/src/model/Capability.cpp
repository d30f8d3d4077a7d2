#include "model/Capability.h"
#include <algorithm>
#include <array>
#include <utility>

namespace TSM {

namespace {

constexpr std::array<std::pair<std::string_view, Capability>, 10> DERIVE_NAMES = {{
    {"PartialEq", Capability::Equality},
    {"Eq", Capability::Equality},
    {"Clone", Capability::Duplication},
    {"Copy", Capability::Duplication},
    {"Debug", Capability::Formatting},
    {"Display", Capability::Formatting},
    {"Hash", Capability::Hashing},
    {"PartialOrd", Capability::Ordering},
    {"Ord", Capability::Ordering},
    {"Default", Capability::Default},
}};

}  // namespace

std::optional<Capability> capabilityFromDeriveName(std::string_view deriveName) {
    for (const auto &[name, capability] : DERIVE_NAMES) {
        if (name == deriveName) {
            return capability;
        }
    }
    return std::nullopt;
}

bool CapabilitySet::insert(const std::string &deriveName) {
    auto capability = capabilityFromDeriveName(deriveName);
    if (!capability) {
        return false;
    }

    if (std::find(names_.begin(), names_.end(), deriveName) == names_.end()) {
        names_.push_back(deriveName);
    }
    mask_ |= static_cast<uint8_t>(*capability);
    return true;
}

CapabilitySet CapabilitySet::defaults() {
    CapabilitySet set;
    set.names_ = {"Debug", "Clone", "PartialEq", "Eq"};
    set.mask_ = static_cast<uint8_t>(Capability::Formatting) | static_cast<uint8_t>(Capability::Duplication) |
                static_cast<uint8_t>(Capability::Equality);
    return set;
}

}  // namespace TSM
