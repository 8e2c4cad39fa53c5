#pragma once

#include <cstdint>

namespace pulsebridge {

/**
 * @brief Attempt bookkeeping for one connect call, subscribe, write or recovery episode.
 *
 * Lives on the stack of the operation that owns it and is dropped when that
 * operation succeeds or runs out of attempts.
 */
struct RetryBudget {
    uint32_t attemptsMade = 0;
    uint32_t maxAttempts = 1;
    uint32_t baseDelayMs = 0;
    uint32_t attemptTimeoutMs = 0;

    RetryBudget(uint32_t attempts, uint32_t delayMs, uint32_t timeoutMs = 0)
        : maxAttempts(attempts == 0 ? 1 : attempts), baseDelayMs(delayMs), attemptTimeoutMs(timeoutMs) {}

    bool exhausted() const { return attemptsMade >= maxAttempts; }
    uint32_t begin() { return ++attemptsMade; }

    // Delay that grows with the number of attempts already made.
    uint32_t linearDelayMs() const { return baseDelayMs * attemptsMade; }
    uint32_t fixedDelayMs() const { return baseDelayMs; }
};

}  // namespace pulsebridge
