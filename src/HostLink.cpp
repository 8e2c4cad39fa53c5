#include "HostLink.h"

#include "FrameCodec.h"
#include "PersistentConfig.h"
#include "system/Log.h"

#include <pb_decode.h>
#include <pb_encode.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <string>
#include <utility>

#ifdef ARDUINO
#include <Arduino.h>
#endif

namespace pulsebridge {

namespace {

constexpr const char* kTag = "HOST";
constexpr size_t kLengthPrefixBytes = 2;

uint64_t monotonicMs() {
#ifdef ARDUINO
    return millis();
#else
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
#endif
}

template <size_t N>
void copyString(char (&dest)[N], const std::string& src) {
    const size_t len = std::min(src.size(), N - 1);
    std::memcpy(dest, src.data(), len);
    dest[len] = '\0';
}

pulsebridge_ErrorKind toProto(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return pulsebridge_ErrorKind_ERROR_KIND_NONE;
        case ErrorKind::Unavailable:
            return pulsebridge_ErrorKind_ERROR_KIND_UNAVAILABLE;
        case ErrorKind::NotFound:
            return pulsebridge_ErrorKind_ERROR_KIND_NOT_FOUND;
        case ErrorKind::Transient:
            return pulsebridge_ErrorKind_ERROR_KIND_TRANSIENT;
        case ErrorKind::PermissionDenied:
            return pulsebridge_ErrorKind_ERROR_KIND_PERMISSION_DENIED;
        case ErrorKind::InvalidState:
            return pulsebridge_ErrorKind_ERROR_KIND_INVALID_STATE;
        case ErrorKind::Cancelled:
            return pulsebridge_ErrorKind_ERROR_KIND_CANCELLED;
    }
    return pulsebridge_ErrorKind_ERROR_KIND_TRANSIENT;
}

pulsebridge_LinkState toProto(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:
            return pulsebridge_LinkState_LINK_STATE_DISCONNECTED;
        case ConnectionState::Connecting:
            return pulsebridge_LinkState_LINK_STATE_CONNECTING;
        case ConnectionState::Connected:
            return pulsebridge_LinkState_LINK_STATE_CONNECTED;
        case ConnectionState::Disconnecting:
            return pulsebridge_LinkState_LINK_STATE_DISCONNECTING;
    }
    return pulsebridge_LinkState_LINK_STATE_DISCONNECTED;
}

Channel fromProto(pulsebridge_Channel channel) {
    switch (channel) {
        case pulsebridge_Channel_CHANNEL_B:
            return Channel::B;
        case pulsebridge_Channel_CHANNEL_AB:
            return Channel::AB;
        default:
            return Channel::A;
    }
}

StrengthMode fromProto(pulsebridge_StrengthMode mode) {
    switch (mode) {
        case pulsebridge_StrengthMode_STRENGTH_MODE_INCREASE:
            return StrengthMode::Increase;
        case pulsebridge_StrengthMode_STRENGTH_MODE_DECREASE:
            return StrengthMode::Decrease;
        default:
            return StrengthMode::Absolute;
    }
}

uint8_t clampByte(uint32_t value, uint32_t hi) {
    return static_cast<uint8_t>(std::min(value, hi));
}

}  // namespace

bool encodeWithLength(const pb_msgdesc_t* fields, const void* src, std::vector<uint8_t>& out) {
    std::array<uint8_t, kLengthPrefixBytes + HOST_FRAME_MAX_BYTES> buffer{};
    pb_ostream_t stream = pb_ostream_from_buffer(buffer.data() + kLengthPrefixBytes, HOST_FRAME_MAX_BYTES);
    if (!pb_encode(&stream, fields, src)) {
        PB_LOGE(kTag, "encode error: %s", PB_GET_ERROR(&stream));
        return false;
    }
    const size_t payloadLen = stream.bytes_written;
    buffer[0] = static_cast<uint8_t>(payloadLen & 0xFF);
    buffer[1] = static_cast<uint8_t>((payloadLen >> 8) & 0xFF);
    out.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(payloadLen + kLengthPrefixBytes));
    return true;
}

bool encodeFrame(const pulsebridge_BridgeEvent& event, std::vector<uint8_t>& out) {
    return encodeWithLength(pulsebridge_BridgeEvent_fields, &event, out);
}

size_t FrameAssembler::push(const uint8_t* data, size_t len, const FrameHandler& handler) {
    buffer_.insert(buffer_.end(), data, data + len);
    size_t frames = 0;
    size_t offset = 0;
    while (buffer_.size() - offset >= kLengthPrefixBytes) {
        const size_t payloadLen = static_cast<size_t>(buffer_[offset]) | (static_cast<size_t>(buffer_[offset + 1]) << 8);
        if (payloadLen > maxFrameBytes_) {
            PB_LOGW(kTag, "dropping %u buffered bytes, frame length %u too large",
                    static_cast<unsigned>(buffer_.size()), static_cast<unsigned>(payloadLen));
            ++rejected_;
            buffer_.clear();
            return frames;
        }
        if (buffer_.size() - offset < kLengthPrefixBytes + payloadLen) {
            break;
        }
        handler(buffer_.data() + offset + kLengthPrefixBytes, payloadLen);
        offset += kLengthPrefixBytes + payloadLen;
        ++frames;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    return frames;
}

HostLink::HostLink(CoyoteDevice& device, EventSink sink) : device_(device), sink_(std::move(sink)) {
    stateListener_ = device_.stateChanged().add([this](ConnectionState state) { sendStatus(state); });
    discoveryListener_ = device_.deviceDiscovered().add([this](const DiscoveredDevice& found) { sendDiscovered(found); });
    telemetryListener_ = device_.telemetryReceived().add([this](const TelemetryAck& ack) { sendTelemetry(ack); });
    batteryListener_ = device_.batteryReceived().add([this](uint8_t percent) { sendBattery(percent); });
}

HostLink::~HostLink() {
    device_.batteryReceived().remove(batteryListener_);
    device_.telemetryReceived().remove(telemetryListener_);
    device_.deviceDiscovered().remove(discoveryListener_);
    device_.stateChanged().remove(stateListener_);
}

void HostLink::handleFrame(const uint8_t* payload, size_t len) {
    pulsebridge_HostCommand command = pulsebridge_HostCommand_init_default;
    pb_istream_t stream = pb_istream_from_buffer(payload, len);
    if (!pb_decode(&stream, pulsebridge_HostCommand_fields, &command)) {
        ++decodeFailures_;
        PB_LOGW(kTag, "decode error: %s", PB_GET_ERROR(&stream));
        sendResult(0, BleStatus::failure(ErrorKind::InvalidState, "malformed command"));
        return;
    }
    handleCommand(command);
}

void HostLink::handleCommand(const pulsebridge_HostCommand& command) {
    const BleStatus status = runCommand(command);
    if (!status.ok()) {
        PB_LOGW(kTag, "command %u failed: %s", static_cast<unsigned>(command.request_id), status.describe().c_str());
    }
    sendResult(command.request_id, status);
}

BleStatus HostLink::runCommand(const pulsebridge_HostCommand& command) {
    switch (command.which_command) {
        case pulsebridge_HostCommand_scan_tag:
            return runScan(command.command.scan);
        case pulsebridge_HostCommand_connect_tag:
            return runConnect(command.command.connect);
        case pulsebridge_HostCommand_disconnect_tag:
            device_.disconnect();
            return BleStatus::success();
        case pulsebridge_HostCommand_subscription_tag:
            return runSubscription(command.command.subscription);
        case pulsebridge_HostCommand_set_strength_tag: {
            const auto& request = command.command.set_strength;
            return device_.setStrength(fromProto(request.channel), static_cast<int>(std::min<uint32_t>(request.value, 255)),
                                       fromProto(request.mode));
        }
        case pulsebridge_HostCommand_send_waveform_tag:
            return runWaveform(command.command.send_waveform);
        case pulsebridge_HostCommand_set_soft_limits_tag:
            return runSoftLimits(command.command.set_soft_limits);
        case pulsebridge_HostCommand_clear_queue_tag:
            return device_.clearQueue(fromProto(command.command.clear_queue.channel));
        case pulsebridge_HostCommand_query_status_tag:
            sendStatus(device_.state());
            return BleStatus::success();
        default:
            return BleStatus::failure(ErrorKind::InvalidState, "unknown command");
    }
}

BleStatus HostLink::runScan(const pulsebridge_ScanRequest& request) {
    ScanOptions options = device_.scanDefaults();
    if (request.timeout_ms > 0) {
        options.timeoutMs = request.timeout_ms;
    }
    if (request.name_prefix[0] != '\0') {
        options.namePrefix = request.name_prefix;
    }
    if (request.service_uuid[0] != '\0') {
        options.serviceFilter = request.service_uuid;
    }
    std::vector<DiscoveredDevice> found;
    const BleStatus status = device_.scan(options, found);
    if (status.ok()) {
        PB_LOGI(kTag, "scan finished with %u device(s)", static_cast<unsigned>(found.size()));
    }
    return status;
}

BleStatus HostLink::runConnect(const pulsebridge_ConnectRequest& request) {
    std::string deviceId = request.device_id;
    if (deviceId.empty()) {
        PersistentSettings settings;
        if (loadPersistentSettings(settings) && settings.hasDeviceId) {
            deviceId = settings.deviceId;
        }
    }
    if (deviceId.empty()) {
        return BleStatus::failure(ErrorKind::InvalidState, "no device id given and none remembered");
    }
    const BleStatus status = device_.connect(deviceId);
    if (status.ok()) {
        storeDeviceId(deviceId);
    }
    return status;
}

BleStatus HostLink::runSubscription(const pulsebridge_SubscriptionRequest& request) {
    const GattTarget target(request.service_uuid, request.characteristic_uuid);
    return request.enable ? device_.subscribe(target) : device_.unsubscribe(target);
}

BleStatus HostLink::runWaveform(const pulsebridge_SendWaveform& request) {
    WaveformSamples samples{};
    if (request.samples_count > 0) {
        if (static_cast<size_t>(request.samples_count) != samples.size()) {
            return BleStatus::failure(ErrorKind::InvalidState, "a waveform frame carries exactly 4 samples");
        }
        for (size_t i = 0; i < samples.size(); ++i) {
            const auto& sample = request.samples[i];
            samples[i].frequency = request.user_frequency ? mapFrequency(static_cast<int>(std::min<uint32_t>(sample.frequency, 1000)))
                                                          : clampByte(sample.frequency, kFrequencyMax);
            samples[i].strength = clampByte(sample.strength, kWaveformStrengthMax);
        }
    } else if (!parseWaveformHex(request.hex, samples)) {
        return BleStatus::failure(ErrorKind::InvalidState, "waveform hex must be 16 hex digits");
    }
    return device_.sendWaveform(fromProto(request.channel), samples);
}

BleStatus HostLink::runSoftLimits(const pulsebridge_SetSoftLimits& request) {
    const BleStatus status = device_.setSoftLimits(static_cast<int>(std::min<uint32_t>(request.limit_a, 255)),
                                                   static_cast<int>(std::min<uint32_t>(request.limit_b, 255)));
    if (status.ok()) {
        const SoftLimits limits = device_.dispatcher().softLimits();
        storeSoftLimits(limits.limitA, limits.limitB);
    }
    return status;
}

void HostLink::sendResult(uint32_t requestId, const BleStatus& status) {
    pulsebridge_BridgeEvent event = pulsebridge_BridgeEvent_init_default;
    event.which_event = pulsebridge_BridgeEvent_result_tag;
    event.event.result.request_id = requestId;
    event.event.result.error = toProto(status.kind);
    copyString(event.event.result.detail, status.detail);
    emit(event);
}

void HostLink::sendStatus(ConnectionState state) {
    const SoftLimits limits = device_.dispatcher().softLimits();
    pulsebridge_BridgeEvent event = pulsebridge_BridgeEvent_init_default;
    event.which_event = pulsebridge_BridgeEvent_state_changed_tag;
    event.event.state_changed.state = toProto(state);
    copyString(event.event.state_changed.device_id, device_.session().lastDeviceId());
    event.event.state_changed.limit_a = limits.limitA;
    event.event.state_changed.limit_b = limits.limitB;
    emit(event);
}

void HostLink::sendDiscovered(const DiscoveredDevice& found) {
    pulsebridge_BridgeEvent event = pulsebridge_BridgeEvent_init_default;
    event.which_event = pulsebridge_BridgeEvent_device_discovered_tag;
    auto& out = event.event.device_discovered;
    copyString(out.id, found.id);
    copyString(out.name, found.name);
    copyString(out.mac_address, found.macAddress);
    out.rssi = found.rssi;
    out.connectable = found.connectable;
    emit(event);
}

void HostLink::sendTelemetry(const TelemetryAck& ack) {
    pulsebridge_BridgeEvent event = pulsebridge_BridgeEvent_init_default;
    event.which_event = pulsebridge_BridgeEvent_telemetry_tag;
    event.event.telemetry.sequence = ack.sequence;
    event.event.telemetry.strength_a = ack.strengthA;
    event.event.telemetry.strength_b = ack.strengthB;
    emit(event);
}

void HostLink::sendBattery(uint8_t percent) {
    pulsebridge_BridgeEvent event = pulsebridge_BridgeEvent_init_default;
    event.which_event = pulsebridge_BridgeEvent_battery_tag;
    event.event.battery.percent = percent;
    emit(event);
}

void HostLink::emit(pulsebridge_BridgeEvent& event) {
    event.timestamp_ms = monotonicMs();
    std::lock_guard<std::mutex> lock(sendMutex_);
    if (sink_) {
        sink_(event);
    }
}

}  // namespace pulsebridge
