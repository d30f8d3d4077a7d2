#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TSM {

/**
 * @brief Derived capability requested for the State or Event enumeration
 */
enum class Capability : uint8_t {
    Equality = 1 << 0,     // PartialEq, Eq
    Duplication = 1 << 1,  // Clone, Copy
    Formatting = 1 << 2,   // Debug, Display
    Hashing = 1 << 3,      // Hash
    Ordering = 1 << 4,     // PartialOrd, Ord
    Default = 1 << 5       // Default
};

/**
 * @brief Map a derive name to its capability
 * @return nullopt for names the emitter does not know
 */
std::optional<Capability> capabilityFromDeriveName(std::string_view deriveName);

/**
 * @brief Ordered set of derive names with their capability mask
 *
 * The names are kept as written so the serialized table round-trips them;
 * the emitter only looks at the mask.
 */
class CapabilitySet {
public:
    /**
     * @brief Add a derive name
     * @return false if the name is unknown; the set is left unchanged
     */
    bool insert(const std::string &deriveName);

    bool has(Capability capability) const {
        return (mask_ & static_cast<uint8_t>(capability)) != 0;
    }

    bool empty() const {
        return names_.empty();
    }

    const std::vector<std::string> &names() const {
        return names_;
    }

    uint8_t mask() const {
        return mask_;
    }

    /**
     * @brief Debug, Clone, PartialEq, Eq: the set used when no derive list is given
     */
    static CapabilitySet defaults();

private:
    std::vector<std::string> names_;
    uint8_t mask_ = 0;
};

}  // namespace TSM
