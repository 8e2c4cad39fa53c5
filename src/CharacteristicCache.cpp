#include "CharacteristicCache.h"

namespace pulsebridge {

PlatformStatus CharacteristicCache::resolve(const GattTarget& target, const Resolver& resolver, CharacteristicInfo& out) {
    uint32_t startGeneration = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(target);
        if (it != entries_.end()) {
            out = it->second;
            return PlatformStatus::Success;
        }
        startGeneration = generation_;
    }

    CharacteristicInfo resolved;
    const PlatformStatus status = resolver(resolved);
    if (status != PlatformStatus::Success) {
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation_ != startGeneration) {
        return PlatformStatus::Disconnected;
    }
    entries_[target] = resolved;
    out = resolved;
    return PlatformStatus::Success;
}

bool CharacteristicCache::lookup(const GattTarget& target, CharacteristicInfo& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(target);
    if (it == entries_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

void CharacteristicCache::invalidateAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    ++generation_;
}

size_t CharacteristicCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint32_t CharacteristicCache::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

}  // namespace pulsebridge
