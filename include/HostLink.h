#pragma once

#include "BleError.h"
#include "BleTypes.h"
#include "Config.h"
#include "CoyoteDevice.h"
#include "system/ObserverList.h"

#include <pb.h>

#include "proto/bridge.pb.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace pulsebridge {

// Serializes src behind a two byte little-endian length prefix.
bool encodeWithLength(const pb_msgdesc_t* fields, const void* src, std::vector<uint8_t>& out);
bool encodeFrame(const pulsebridge_BridgeEvent& event, std::vector<uint8_t>& out);

/**
 * @brief Reassembles length-prefixed frames from a byte stream.
 *
 * A frame may arrive split across several reads or several frames in one read.
 * A prefix announcing more than maxFrameBytes drops everything buffered.
 */
class FrameAssembler {
public:
    using FrameHandler = std::function<void(const uint8_t* payload, size_t len)>;

    explicit FrameAssembler(size_t maxFrameBytes = HOST_FRAME_MAX_BYTES) : maxFrameBytes_(maxFrameBytes) {}

    // Returns the number of complete frames handed to handler.
    size_t push(const uint8_t* data, size_t len, const FrameHandler& handler);
    void reset() { buffer_.clear(); }

    [[nodiscard]] size_t buffered() const { return buffer_.size(); }
    [[nodiscard]] uint32_t rejectedFrames() const { return rejected_; }

private:
    size_t maxFrameBytes_;
    Bytes buffer_;
    uint32_t rejected_ = 0;
};

/**
 * @brief Bridges the protobuf command stream from the host to a CoyoteDevice.
 *
 * Every decoded HostCommand is answered with exactly one CommandResult carrying
 * its request id. State changes, discoveries, telemetry and battery readings
 * are forwarded as unsolicited BridgeEvents. Commands run on the caller's
 * thread; events may be emitted from the radio stack's thread, so the sink is
 * always called under the link's send mutex.
 *
 * Usage example:
 * @code
 * HostLink link(device, [](const pulsebridge_BridgeEvent& event) {
 *     std::vector<uint8_t> frame;
 *     if (encodeFrame(event, frame)) {
 *         Serial.write(frame.data(), frame.size());
 *     }
 * });
 * assembler.push(buf, n, [&](const uint8_t* payload, size_t len) { link.handleFrame(payload, len); });
 * @endcode
 */
class HostLink {
public:
    using EventSink = std::function<void(const pulsebridge_BridgeEvent&)>;

    HostLink(CoyoteDevice& device, EventSink sink);
    ~HostLink();

    HostLink(const HostLink&) = delete;
    HostLink& operator=(const HostLink&) = delete;

    void handleFrame(const uint8_t* payload, size_t len);
    void handleCommand(const pulsebridge_HostCommand& command);

    [[nodiscard]] uint32_t decodeFailures() const { return decodeFailures_; }

private:
    BleStatus runCommand(const pulsebridge_HostCommand& command);
    BleStatus runScan(const pulsebridge_ScanRequest& request);
    BleStatus runConnect(const pulsebridge_ConnectRequest& request);
    BleStatus runSubscription(const pulsebridge_SubscriptionRequest& request);
    BleStatus runWaveform(const pulsebridge_SendWaveform& request);
    BleStatus runSoftLimits(const pulsebridge_SetSoftLimits& request);

    void sendResult(uint32_t requestId, const BleStatus& status);
    void sendStatus(ConnectionState state);
    void sendDiscovered(const DiscoveredDevice& device);
    void sendTelemetry(const TelemetryAck& ack);
    void sendBattery(uint8_t percent);
    void emit(pulsebridge_BridgeEvent& event);

    CoyoteDevice& device_;
    EventSink sink_;
    std::mutex sendMutex_;
    uint32_t decodeFailures_ = 0;

    system::ListenerId stateListener_ = system::kInvalidListener;
    system::ListenerId discoveryListener_ = system::kInvalidListener;
    system::ListenerId telemetryListener_ = system::kInvalidListener;
    system::ListenerId batteryListener_ = system::kInvalidListener;
};

}  // namespace pulsebridge
