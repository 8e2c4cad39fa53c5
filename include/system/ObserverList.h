#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace pulsebridge::system {

using ListenerId = uint32_t;
constexpr ListenerId kInvalidListener = 0;

/**
 * @brief Registry of callbacks for one notification kind.
 *
 * add() hands back an id that remove() takes; owners remove their listeners in
 * their destructors. notify() snapshots the list and calls outside the lock,
 * so a listener may remove itself while being called.
 */
template <typename... Args>
class ObserverList {
public:
    using Callback = std::function<void(Args...)>;

    ListenerId add(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        const ListenerId id = ++nextId_;
        entries_.emplace_back(id, std::move(callback));
        return id;
    }

    void remove(ListenerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->first == id) {
                entries_.erase(it);
                return;
            }
        }
    }

    void notify(const Args&... args) const {
        std::vector<std::pair<ListenerId, Callback>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = entries_;
        }
        for (const auto& entry : snapshot) {
            if (entry.second) {
                entry.second(args...);
            }
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<ListenerId, Callback>> entries_;
    ListenerId nextId_ = kInvalidListener;
};

}  // namespace pulsebridge::system
