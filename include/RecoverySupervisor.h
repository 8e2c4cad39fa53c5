#pragma once

#include "BleSession.h"
#include "Config.h"
#include "system/Cancellation.h"
#include "system/ObserverList.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>

namespace pulsebridge {

struct RecoveryConfig {
    uint32_t attempts = RECOVERY_RETRY_COUNT;
    uint32_t baseDelayMs = RECOVERY_BASE_DELAY_MS;
};

/**
 * @brief Reconnects in the background after the link drops on its own.
 *
 * Listens to the session's lifecycle events. An unexpected disconnect starts
 * one recovery episode on a worker thread; a second one while the episode runs
 * is ignored. Manual connect, manual disconnect and shutdown cancel the
 * episode. Attempt n waits baseDelay * n, then asks the session to reconnect,
 * which replays subscriptions and re-sends soft limits before Connected.
 */
class RecoverySupervisor {
public:
    RecoverySupervisor(BleSession& session, const RecoveryConfig& config);
    ~RecoverySupervisor();

    RecoverySupervisor(const RecoverySupervisor&) = delete;
    RecoverySupervisor& operator=(const RecoverySupervisor&) = delete;

    // Returns false when an episode is already running.
    bool start();
    void cancel() noexcept;

    [[nodiscard]] bool running() const { return recovering_.load(); }
    [[nodiscard]] uint32_t episodesStarted() const { return episodes_.load(); }

private:
    void runEpisode(system::CancellationToken token);

    BleSession& session_;
    RecoveryConfig config_;
    std::atomic<bool> recovering_{false};
    std::atomic<uint32_t> episodes_{0};
    std::mutex threadMutex_;
    std::thread worker_;
    system::CancellationSource cancel_;
    system::ListenerId lifecycleListener_ = system::kInvalidListener;
};

}  // namespace pulsebridge
