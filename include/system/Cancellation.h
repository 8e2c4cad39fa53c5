#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace pulsebridge::system {

class CancellationSource;

/**
 * @brief Read side of a cancellation signal.
 *
 * A default-constructed token is never cancelled, so operations can take
 * `const CancellationToken& cancel = {}` and callers that do not care pass
 * nothing.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool cancelled() const;

    // Sleeps up to `ms`; returns true as soon as the token is cancelled.
    bool waitFor(uint32_t ms) const;

private:
    friend class CancellationSource;

    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        std::vector<std::weak_ptr<State>> children;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();
    // Cancelled together with `parent` as well as on its own.
    explicit CancellationSource(const CancellationToken& parent);

    void cancel();
    [[nodiscard]] bool cancelled() const;
    [[nodiscard]] CancellationToken token() const;

private:
    static void cancelState(const std::shared_ptr<CancellationToken::State>& state);

    std::shared_ptr<CancellationToken::State> state_;
};

/**
 * @brief Acquires a timed mutex within `timeoutMs`, giving up early on cancellation.
 *
 * The returned lock does not own the mutex when the wait timed out or was
 * cancelled; check `owns_lock()` and `cancel.cancelled()` to tell which.
 */
std::unique_lock<std::timed_mutex> acquireWithin(std::timed_mutex& mutex, uint32_t timeoutMs,
                                                 const CancellationToken& cancel);

}  // namespace pulsebridge::system
