#pragma once

#include "BleError.h"
#include "BlePlatform.h"
#include "BleTypes.h"
#include "CharacteristicCache.h"
#include "Config.h"
#include "system/Cancellation.h"
#include "system/ObserverList.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pulsebridge {

struct SessionConfig {
    uint32_t connectAttempts = CONNECT_RETRY_COUNT;
    uint32_t connectRetryDelayMs = CONNECT_RETRY_DELAY_MS;
    uint32_t connectAttemptTimeoutMs = CONNECT_ATTEMPT_TIMEOUT_MS;
    uint32_t pairTimeoutMs = PAIR_TIMEOUT_MS;
    uint32_t pairSettleMs = PAIR_SETTLE_MS;
    uint32_t accessSettleMs = ACCESS_SETTLE_MS;
    uint32_t subscribeAttempts = SUBSCRIBE_RETRY_COUNT;
    uint32_t writeAttempts = WRITE_RETRY_COUNT;
    uint32_t retryDelayMs = GATT_RETRY_DELAY_MS;
    uint32_t gattTimeoutMs = GATT_OPERATION_TIMEOUT_MS;
    uint32_t lockWaitMs = LOCK_WAIT_MS;
};

enum class LifecycleEvent {
    ManualConnect,
    ManualDisconnect,
    UnexpectedDisconnect,
    Shutdown
};

/**
 * @brief Owns the single physical link to a Coyote box.
 *
 * State moves Disconnected -> Connecting -> Connected -> Disconnecting ->
 * Disconnected. Transitions (connect, disconnect, recovery, scan start) are
 * serialized by the connection lock; reads, writes and subscriptions by the
 * GATT lock, so at most one GATT transaction is ever in flight. The lock order
 * is always connection lock first.
 *
 * Connected is published only after the subscription intent has been replayed
 * and every restore hook (the soft-limit re-send) has run, so public writes can
 * never reach the device ahead of the limits.
 *
 * Usage example:
 * @code
 * BleSession session(platform, SessionConfig{});
 * auto id = session.stateChanged().add([](ConnectionState s) { ... });
 * if (session.connect("AA:BB:CC:DD:EE:01").ok()) {
 *     session.subscribe({COYOTE_SERVICE_UUID, COYOTE_NOTIFY_CHAR_UUID});
 * }
 * session.disconnect();
 * session.stateChanged().remove(id);
 * @endcode
 */
class BleSession {
public:
    // Write access handed to restore hooks while the link is up but not yet published.
    // Every write is bounded by the deadline of the connect attempt that runs the hooks.
    class RestoreWriter {
    public:
        BleStatus write(const GattTarget& target, const uint8_t* data, size_t len, WriteMode mode);

    private:
        friend class BleSession;
        RestoreWriter(BleSession& session, std::chrono::steady_clock::time_point deadline,
                      const system::CancellationToken& cancel)
            : session_(session), deadline_(deadline), cancel_(cancel) {}
        BleSession& session_;
        std::chrono::steady_clock::time_point deadline_;
        system::CancellationToken cancel_;
    };

    using RestoreHook = std::function<BleStatus(RestoreWriter&)>;

    BleSession(BlePlatform& platform, const SessionConfig& config);
    ~BleSession();

    BleSession(const BleSession&) = delete;
    BleSession& operator=(const BleSession&) = delete;

    BleStatus scan(const ScanOptions& options, std::vector<DiscoveredDevice>& out,
                   const system::CancellationToken& cancel = {});
    void stopScan();

    BleStatus connect(const std::string& deviceId, const system::CancellationToken& cancel = {});

    /**
     * @brief Tears the link down and always ends in Disconnected.
     *
     * Cancels recovery and any connect in progress. Failures on the way are
     * logged, never returned.
     */
    void disconnect() noexcept;

    // Cancelling `cancel` aborts the retry back-off.
    BleStatus subscribe(const GattTarget& target, const system::CancellationToken& cancel = {});
    BleStatus unsubscribe(const GattTarget& target);
    BleStatus write(const GattTarget& target, const uint8_t* data, size_t len, WriteMode mode,
                    const system::CancellationToken& cancel = {});
    BleStatus read(const GattTarget& target, Bytes& out);

    // One reconnect against the last device id; used by the recovery supervisor.
    BleStatus recover(const system::CancellationToken& cancel);

    void shutdown() noexcept;

    system::ListenerId addRestoreHook(RestoreHook hook);
    void removeRestoreHook(system::ListenerId id);

    system::ObserverList<ConnectionState>& stateChanged() { return stateObservers_; }
    system::ObserverList<DiscoveredDevice>& deviceDiscovered() { return discoveryObservers_; }
    system::ObserverList<GattTarget, Bytes>& dataReceived() { return dataObservers_; }
    system::ObserverList<LifecycleEvent>& lifecycle() { return lifecycleObservers_; }

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] std::string lastDeviceId() const;
    [[nodiscard]] std::string deviceName() const;
    [[nodiscard]] std::vector<GattTarget> subscriptionIntent() const;
    [[nodiscard]] size_t cachedCharacteristicCount() const { return cache_.size(); }
    [[nodiscard]] bool scanning() const;

private:
    using Clock = std::chrono::steady_clock;

    BleStatus connectLocked(const std::string& deviceId, const system::CancellationToken& cancel);
    BleStatus connectAttempt(uint64_t address, Clock::time_point deadline, const system::CancellationToken& cancel);
    PlatformStatus openDevice(uint64_t address, const std::optional<DeviceRecord>& record, Clock::time_point deadline);
    BleStatus restoreLocked(Clock::time_point deadline, const system::CancellationToken& cancel);
    void teardownLocked() noexcept;
    void releaseLink() noexcept;

    // Clock::time_point::max() means no deadline beyond the per-call GATT timeout.
    BleStatus subscribeCore(const GattTarget& target, bool requireConnected, Clock::time_point deadline,
                            const system::CancellationToken& cancel);
    BleStatus gattWrite(const GattTarget& target, const uint8_t* data, size_t len, WriteMode mode,
                        bool requireConnected, Clock::time_point deadline, const system::CancellationToken& cancel);
    BleStatus resolveLocked(const GattTarget& target, CharacteristicInfo& info, uint32_t timeoutMs);
    bool linkUsable(bool requireConnected) const;

    void setState(ConnectionState next);
    void handleAdvertisement(const Advertisement& advertisement);
    void handleLinkLoss(int reason);

    BlePlatform& platform_;
    SessionConfig config_;
    CharacteristicCache cache_;

    std::timed_mutex connectionLock_;
    std::timed_mutex gattLock_;

    mutable std::mutex stateMutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    bool linkUp_ = false;
    bool manualDisconnect_ = false;
    bool shutdown_ = false;
    std::string lastDeviceId_;
    std::string deviceName_;
    std::vector<std::string> services_;
    std::set<GattTarget> subscriptionIntent_;
    std::set<GattTarget> liveSubscriptions_;
    system::CancellationSource connectCancel_;

    mutable std::mutex scanMutex_;
    bool scanning_ = false;
    std::string scanPrefix_;
    std::map<std::string, DiscoveredDevice> discovered_;
    system::CancellationSource scanStop_;

    std::mutex hooksMutex_;
    std::vector<std::pair<system::ListenerId, RestoreHook>> restoreHooks_;
    system::ListenerId nextHookId_ = system::kInvalidListener;

    system::ObserverList<ConnectionState> stateObservers_;
    system::ObserverList<DiscoveredDevice> discoveryObservers_;
    system::ObserverList<GattTarget, Bytes> dataObservers_;
    system::ObserverList<LifecycleEvent> lifecycleObservers_;
};

}  // namespace pulsebridge
