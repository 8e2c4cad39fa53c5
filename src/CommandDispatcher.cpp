#include "CommandDispatcher.h"

#include "system/Log.h"

#include <algorithm>
#include <chrono>

namespace pulsebridge {

namespace {

constexpr const char* kTag = "CMD";

bool touchesA(Channel channel) {
    return channel == Channel::A || channel == Channel::AB;
}

bool touchesB(Channel channel) {
    return channel == Channel::B || channel == Channel::AB;
}

}  // namespace

CommandDispatcher::CommandDispatcher(BleSession& session, const DispatcherConfig& config)
    : session_(session), config_(config) {
    dataListener_ = session_.dataReceived().add(
        [this](const GattTarget& target, const Bytes& data) { handleData(target, data); });
    stateListener_ = session_.stateChanged().add([this](ConnectionState state) { handleState(state); });
    restoreHook_ = session_.addRestoreHook([this](BleSession::RestoreWriter& writer) { return restoreLimits(writer); });
}

CommandDispatcher::~CommandDispatcher() {
    session_.removeRestoreHook(restoreHook_);
    session_.stateChanged().remove(stateListener_);
    session_.dataReceived().remove(dataListener_);
}

uint8_t CommandDispatcher::nextSequenceLocked() {
    // 0 tells the device not to acknowledge, so strength changes cycle 1..15.
    sequence_ = static_cast<uint8_t>(sequence_ % 15 + 1);
    return sequence_;
}

BleStatus CommandDispatcher::setStrength(Channel channel, int value, StrengthMode mode) {
    if (session_.state() != ConnectionState::Connected) {
        return BleStatus::failure(ErrorKind::InvalidState, "strength change needs a connected device");
    }
    if (value > kStrengthCeiling || value < 0) {
        PB_LOGD(kTag, "strength %d clamped to [0, %u]", value, static_cast<unsigned>(kStrengthCeiling));
    }

    uint8_t sequence = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (awaitingAck_) {
            ackCv_.wait_for(lock, std::chrono::milliseconds(config_.ackWaitMs), [this] { return !awaitingAck_; });
        }
        sequence = nextSequenceLocked();
        awaitingAck_ = true;
        pendingSequence_ = sequence;
    }

    const StrengthFrame frame = encodeStrengthSet(channel, mode, value, sequence);
    const BleStatus status = session_.write(config_.writeTarget, frame.data(), frame.size(), WriteMode::WithResponse);
    if (!status.ok()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pendingSequence_ == sequence) {
            awaitingAck_ = false;
        }
        PB_LOGW(kTag, "strength change failed: %s", status.describe().c_str());
    }
    return status;
}

BleStatus CommandDispatcher::sendWaveform(Channel channel, const WaveformSamples& samples) {
    if (session_.state() != ConnectionState::Connected) {
        return BleStatus::failure(ErrorKind::InvalidState, "waveform needs a connected device");
    }
    const StrengthFrame frame = encodeWaveform(channel, samples);
    const BleStatus status = session_.write(config_.writeTarget, frame.data(), frame.size(), WriteMode::WithoutResponse);
    if (!status.ok()) {
        PB_LOGW(kTag, "waveform write failed: %s", status.describe().c_str());
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (touchesA(channel)) {
        activeA_ = samples;
    }
    if (touchesB(channel)) {
        activeB_ = samples;
    }
    return status;
}

BleStatus CommandDispatcher::clearQueue(Channel channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (touchesA(channel)) {
        activeA_.reset();
    }
    if (touchesB(channel)) {
        activeB_.reset();
    }
    PB_LOGD(kTag, "waveform queue cleared");
    return BleStatus::success();
}

BleStatus CommandDispatcher::setSoftLimits(int limitA, int limitB) {
    SoftLimits limits;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        limits_.limitA = static_cast<uint8_t>(std::clamp(limitA, 0, static_cast<int>(kStrengthCeiling)));
        limits_.limitB = static_cast<uint8_t>(std::clamp(limitB, 0, static_cast<int>(kStrengthCeiling)));
        limits = limits_;
    }
    if (session_.state() != ConnectionState::Connected) {
        PB_LOGD(kTag, "soft limits stored for the next connection");
        return BleStatus::success();
    }

    const SoftLimitFrame frame = encodeSoftLimit(limits);
    const BleStatus status = session_.write(config_.writeTarget, frame.data(), frame.size(), WriteMode::WithResponse);
    if (status.ok()) {
        std::lock_guard<std::mutex> lock(mutex_);
        deviceLimits_ = limits;
    }
    return status;
}

void CommandDispatcher::setBalance(const BalanceParams& balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    limits_.balance = balance;
}

BleStatus CommandDispatcher::readBattery(uint8_t& percent) {
    Bytes value;
    const BleStatus status = session_.read(config_.batteryTarget, value);
    if (!status.ok()) {
        return status;
    }
    if (value.empty()) {
        return BleStatus::failure(ErrorKind::Transient, "empty battery value");
    }
    percent = value[0];
    batteryObservers_.notify(percent);
    return status;
}

BleStatus CommandDispatcher::restoreLimits(BleSession::RestoreWriter& writer) {
    SoftLimits limits;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        limits = limits_;
        awaitingAck_ = false;
    }
    PB_LOGI(kTag, "sending soft limits A=%u B=%u", static_cast<unsigned>(limits.limitA),
            static_cast<unsigned>(limits.limitB));
    const SoftLimitFrame frame = encodeSoftLimit(limits);
    const BleStatus status = writer.write(config_.writeTarget, frame.data(), frame.size(), WriteMode::WithResponse);
    if (status.ok()) {
        std::lock_guard<std::mutex> lock(mutex_);
        deviceLimits_ = limits;
    }
    return status;
}

void CommandDispatcher::handleData(const GattTarget& target, const Bytes& data) {
    if (target == config_.notifyTarget) {
        const auto ack = decodeTelemetry(data.data(), data.size());
        if (!ack) {
            PB_LOGD(kTag, "ignoring %u byte notification", static_cast<unsigned>(data.size()));
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            telemetry_ = *ack;
            if (awaitingAck_ && ack->sequence == pendingSequence_) {
                awaitingAck_ = false;
            }
        }
        ackCv_.notify_all();
        telemetryObservers_.notify(*ack);
    } else if (target == config_.batteryTarget && !data.empty()) {
        batteryObservers_.notify(data[0]);
    }
}

void CommandDispatcher::handleState(ConnectionState state) {
    if (state == ConnectionState::Connected) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deviceLimits_.reset();
        awaitingAck_ = false;
        serviceStarted_ = false;
    }
    ackCv_.notify_all();
}

void CommandDispatcher::service(uint64_t nowMs) {
    if (session_.state() != ConnectionState::Connected) {
        return;
    }

    std::optional<SoftLimits> pendingLimits;
    std::optional<WaveformSamples> waveA;
    std::optional<WaveformSamples> waveB;
    bool keepAlive = false;
    bool pollBattery = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!serviceStarted_) {
            serviceStarted_ = true;
            nextBatteryPollMs_ = nowMs + config_.batteryFirstPollMs;
            lastKeepAliveMs_ = 0;
        }
        if (!deviceLimits_ || !(*deviceLimits_ == limits_)) {
            pendingLimits = limits_;
        }
        if ((activeA_ || activeB_) && (lastKeepAliveMs_ == 0 || nowMs - lastKeepAliveMs_ >= config_.keepAliveIntervalMs)) {
            keepAlive = true;
            lastKeepAliveMs_ = nowMs;
            waveA = activeA_;
            waveB = activeB_;
        }
        if (nowMs >= nextBatteryPollMs_) {
            pollBattery = true;
            nextBatteryPollMs_ = nowMs + config_.batteryPollIntervalMs;
        }
    }

    if (pendingLimits) {
        const SoftLimitFrame frame = encodeSoftLimit(*pendingLimits);
        const BleStatus status = session_.write(config_.writeTarget, frame.data(), frame.size(), WriteMode::WithResponse);
        if (status.ok()) {
            std::lock_guard<std::mutex> lock(mutex_);
            deviceLimits_ = *pendingLimits;
        } else {
            PB_LOGW(kTag, "soft limit delivery failed: %s", status.describe().c_str());
        }
    }
    if (keepAlive) {
        const StrengthFrame frame = encodeWaveformPair(waveA ? &*waveA : nullptr, waveB ? &*waveB : nullptr);
        const BleStatus status = session_.write(config_.writeTarget, frame.data(), frame.size(), WriteMode::WithoutResponse);
        if (!status.ok()) {
            PB_LOGD(kTag, "waveform keep-alive failed: %s", status.describe().c_str());
        }
    }
    if (pollBattery) {
        uint8_t percent = 0;
        const BleStatus status = readBattery(percent);
        if (!status.ok()) {
            PB_LOGW(kTag, "battery poll failed: %s", status.describe().c_str());
        }
    }
}

SoftLimits CommandDispatcher::softLimits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limits_;
}

TelemetryAck CommandDispatcher::lastTelemetry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return telemetry_;
}

bool CommandDispatcher::waveformActive(Channel channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (channel == Channel::AB) {
        return activeA_.has_value() && activeB_.has_value();
    }
    return channel == Channel::A ? activeA_.has_value() : activeB_.has_value();
}

}  // namespace pulsebridge
