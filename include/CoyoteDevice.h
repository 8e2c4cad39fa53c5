#pragma once

#include "BleError.h"
#include "BlePlatform.h"
#include "BleSession.h"
#include "BleTypes.h"
#include "CommandDispatcher.h"
#include "FrameCodec.h"
#include "RecoverySupervisor.h"

#include <cstdint>
#include <string>
#include <vector>

namespace pulsebridge {

struct DeviceConfig {
    SessionConfig session;
    RecoveryConfig recovery;
    DispatcherConfig dispatcher;
    ScanOptions scan{"", COYOTE_NAME_PREFIX, DEFAULT_SCAN_TIMEOUT_MS};
};

/**
 * @brief One Coyote box: session, recovery and dispatcher wired together.
 *
 * Constructed once by whoever owns the radio and handed by reference to the
 * code that drives the device. This is the whole upstream surface: scan,
 * connect, disconnect, subscriptions, the four commands and the notification
 * channels.
 */
class CoyoteDevice {
public:
    CoyoteDevice(BlePlatform& platform, const DeviceConfig& config);

    BleStatus scan(std::vector<DiscoveredDevice>& out, const system::CancellationToken& cancel = {});
    BleStatus scan(const ScanOptions& options, std::vector<DiscoveredDevice>& out,
                   const system::CancellationToken& cancel = {});

    // Connects, subscribes to device feedback and takes a first battery reading.
    BleStatus connect(const std::string& deviceId, const system::CancellationToken& cancel = {});
    void disconnect() noexcept;

    BleStatus subscribe(const GattTarget& target) { return session_.subscribe(target); }
    BleStatus unsubscribe(const GattTarget& target) { return session_.unsubscribe(target); }

    BleStatus setStrength(Channel channel, int value, StrengthMode mode) {
        return dispatcher_.setStrength(channel, value, mode);
    }
    BleStatus sendWaveform(Channel channel, const WaveformSamples& samples) {
        return dispatcher_.sendWaveform(channel, samples);
    }
    BleStatus setSoftLimits(int limitA, int limitB) { return dispatcher_.setSoftLimits(limitA, limitB); }
    BleStatus clearQueue(Channel channel) { return dispatcher_.clearQueue(channel); }

    void service(uint64_t nowMs) { dispatcher_.service(nowMs); }

    [[nodiscard]] ConnectionState state() const { return session_.state(); }
    const ScanOptions& scanDefaults() const { return config_.scan; }

    system::ObserverList<ConnectionState>& stateChanged() { return session_.stateChanged(); }
    system::ObserverList<DiscoveredDevice>& deviceDiscovered() { return session_.deviceDiscovered(); }
    system::ObserverList<TelemetryAck>& telemetryReceived() { return dispatcher_.telemetryReceived(); }
    system::ObserverList<uint8_t>& batteryReceived() { return dispatcher_.batteryReceived(); }

    BleSession& session() { return session_; }
    RecoverySupervisor& supervisor() { return supervisor_; }
    CommandDispatcher& dispatcher() { return dispatcher_; }

private:
    DeviceConfig config_;
    BleSession session_;
    RecoverySupervisor supervisor_;
    CommandDispatcher dispatcher_;
};

}  // namespace pulsebridge
