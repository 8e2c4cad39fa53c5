#pragma once

#include "BleError.h"
#include "BleSession.h"
#include "BleTypes.h"
#include "Config.h"
#include "FrameCodec.h"
#include "system/ObserverList.h"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace pulsebridge {

struct DispatcherConfig {
    uint32_t keepAliveIntervalMs = WAVEFORM_KEEPALIVE_MS;
    uint32_t ackWaitMs = STRENGTH_ACK_WAIT_MS;
    uint32_t batteryFirstPollMs = BATTERY_FIRST_POLL_MS;
    uint32_t batteryPollIntervalMs = BATTERY_POLL_INTERVAL_MS;
    GattTarget writeTarget{COYOTE_SERVICE_UUID, COYOTE_WRITE_CHAR_UUID};
    GattTarget notifyTarget{COYOTE_SERVICE_UUID, COYOTE_NOTIFY_CHAR_UUID};
    GattTarget batteryTarget{COYOTE_BATTERY_SERVICE_UUID, COYOTE_BATTERY_CHAR_UUID};
};

/**
 * @brief Turns strength, waveform and limit requests into frames on the one link.
 *
 * Every write goes through the session, whose GATT lock keeps a single
 * transaction in flight, so concurrent callers only ever put whole frames on
 * the wire. Soft limits are registered as a session restore hook and reach the
 * device after every (re)connection before the session reports Connected.
 *
 * Usage example:
 * @code
 * CommandDispatcher dispatcher(session, DispatcherConfig{});
 * dispatcher.setSoftLimits(40, 60);
 * dispatcher.setStrength(Channel::A, 20, StrengthMode::Absolute);
 * dispatcher.sendWaveform(Channel::B, samples);
 *
 * void loop() {
 *     dispatcher.service(millis());
 * }
 * @endcode
 */
class CommandDispatcher {
public:
    CommandDispatcher(BleSession& session, const DispatcherConfig& config);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    /**
     * @brief Sends a strength change; the value is clamped to the device ceiling.
     *
     * Written acknowledged with retry. When the previous change is still waiting
     * for its B1 acknowledgement the call waits up to ackWaitMs for it first.
     */
    BleStatus setStrength(Channel channel, int value, StrengthMode mode);

    /**
     * @brief Sends 100 ms of waveform and keeps repeating it from service().
     */
    BleStatus sendWaveform(Channel channel, const WaveformSamples& samples);

    // Stores the limits; sends them now when connected and after every reconnect.
    BleStatus setSoftLimits(int limitA, int limitB);
    void setBalance(const BalanceParams& balance);

    // Stops repeating the channel's waveform; the device runs dry within one frame.
    BleStatus clearQueue(Channel channel);

    BleStatus readBattery(uint8_t& percent);

    // Waveform keep-alive, battery polling and pending limit delivery.
    void service(uint64_t nowMs);

    [[nodiscard]] SoftLimits softLimits() const;
    [[nodiscard]] TelemetryAck lastTelemetry() const;
    [[nodiscard]] bool waveformActive(Channel channel) const;
    const DispatcherConfig& config() const { return config_; }

    system::ObserverList<TelemetryAck>& telemetryReceived() { return telemetryObservers_; }
    system::ObserverList<uint8_t>& batteryReceived() { return batteryObservers_; }

private:
    void handleData(const GattTarget& target, const Bytes& data);
    void handleState(ConnectionState state);
    BleStatus restoreLimits(BleSession::RestoreWriter& writer);
    uint8_t nextSequenceLocked();

    BleSession& session_;
    DispatcherConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable ackCv_;
    SoftLimits limits_;
    std::optional<SoftLimits> deviceLimits_;
    uint8_t sequence_ = 0;
    bool awaitingAck_ = false;
    uint8_t pendingSequence_ = 0;
    TelemetryAck telemetry_;
    std::optional<WaveformSamples> activeA_;
    std::optional<WaveformSamples> activeB_;
    bool serviceStarted_ = false;
    uint64_t lastKeepAliveMs_ = 0;
    uint64_t nextBatteryPollMs_ = 0;

    system::ListenerId dataListener_ = system::kInvalidListener;
    system::ListenerId stateListener_ = system::kInvalidListener;
    system::ListenerId restoreHook_ = system::kInvalidListener;
    system::ObserverList<TelemetryAck> telemetryObservers_;
    system::ObserverList<uint8_t> batteryObservers_;
};

}  // namespace pulsebridge
