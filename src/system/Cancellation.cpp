#include "system/Cancellation.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace pulsebridge::system {

namespace {
constexpr uint32_t kLockPollSliceMs = 10;
}

bool CancellationToken::cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::waitFor(uint32_t ms) const {
    if (!state_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, std::chrono::milliseconds(ms), [this] { return state_->cancelled; });
}

void CancellationSource::cancelState(const std::shared_ptr<CancellationToken::State>& state) {
    std::vector<std::weak_ptr<CancellationToken::State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled) {
            return;
        }
        state->cancelled = true;
        children.swap(state->children);
    }
    state->cv.notify_all();
    for (const auto& weak : children) {
        if (auto child = weak.lock()) {
            cancelState(child);
        }
    }
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<CancellationToken::State>()) {
    if (!parent.state_) {
        return;
    }
    bool parentCancelled = false;
    {
        std::lock_guard<std::mutex> lock(parent.state_->mutex);
        parentCancelled = parent.state_->cancelled;
        if (!parentCancelled) {
            auto& children = parent.state_->children;
            children.erase(std::remove_if(children.begin(), children.end(),
                                          [](const std::weak_ptr<CancellationToken::State>& w) { return w.expired(); }),
                           children.end());
            children.push_back(state_);
        }
    }
    if (parentCancelled) {
        cancelState(state_);
    }
}

void CancellationSource::cancel() {
    cancelState(state_);
}

bool CancellationSource::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

std::unique_lock<std::timed_mutex> acquireWithin(std::timed_mutex& mutex, uint32_t timeoutMs,
                                                 const CancellationToken& cancel) {
    std::unique_lock<std::timed_mutex> lock(mutex, std::defer_lock);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (!cancel.cancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            if (lock.try_lock()) {
                return lock;
            }
            break;
        }
        const auto slice = std::min<std::chrono::steady_clock::duration>(
            deadline - now, std::chrono::milliseconds(kLockPollSliceMs));
        if (lock.try_lock_for(slice)) {
            return lock;
        }
    }
    return lock;
}

}  // namespace pulsebridge::system
