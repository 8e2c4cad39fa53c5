#pragma once

#include "BlePlatform.h"
#include "BleTypes.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace pulsebridge {

/**
 * @brief Resolved characteristic handles for the current connection.
 *
 * Entries belong to one generation. invalidateAll() drops them and starts a new
 * generation, so a lookup that raced with a disconnect cannot store a handle
 * from the dead link.
 */
class CharacteristicCache {
public:
    using Resolver = std::function<PlatformStatus(CharacteristicInfo&)>;

    // Returns the memoized entry, or runs resolver on a miss and keeps its result.
    PlatformStatus resolve(const GattTarget& target, const Resolver& resolver, CharacteristicInfo& out);
    bool lookup(const GattTarget& target, CharacteristicInfo& out) const;
    void invalidateAll();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint32_t generation() const;

private:
    mutable std::mutex mutex_;
    std::map<GattTarget, CharacteristicInfo> entries_;
    uint32_t generation_ = 0;
};

}  // namespace pulsebridge
