#include <unity.h>

#include "CoyoteDevice.h"
#include "FakeBlePlatform.h"
#include "HostLink.h"
#include "PersistentConfig.h"

#include <pb_decode.h>

#include <cstring>
#include <string>
#include <vector>

extern "C" void setUp(void) {
    pulsebridge::clearPersistentSettings();
}
extern "C" void tearDown(void) {}

using pulsebridge::CoyoteDevice;
using pulsebridge::DeviceConfig;
using pulsebridge::FrameAssembler;
using pulsebridge::GattTarget;
using pulsebridge::HostLink;
using pulsebridge::test::FakeBlePlatform;
namespace CharProperty = pulsebridge::CharProperty;

namespace {

constexpr const char* kDeviceId = "AABBCCDDEE01";

struct Sink {
    std::vector<pulsebridge_BridgeEvent> events;
    void operator()(const pulsebridge_BridgeEvent& evt) {
        events.push_back(evt);
    }
    void clear() { events.clear(); }

    std::vector<pulsebridge_CommandResult> results() const {
        std::vector<pulsebridge_CommandResult> out;
        for (const auto& evt : events) {
            if (evt.which_event == pulsebridge_BridgeEvent_result_tag) {
                out.push_back(evt.event.result);
            }
        }
        return out;
    }

    size_t count(pb_size_t tag) const {
        size_t n = 0;
        for (const auto& evt : events) {
            if (evt.which_event == tag) {
                ++n;
            }
        }
        return n;
    }
};

DeviceConfig fastConfig() {
    DeviceConfig config;
    config.session.connectRetryDelayMs = 2;
    config.session.pairSettleMs = 0;
    config.session.accessSettleMs = 0;
    config.session.retryDelayMs = 1;
    config.dispatcher.ackWaitMs = 5;
    return config;
}

struct Rig {
    FakeBlePlatform platform;
    CoyoteDevice device;
    Sink sink;
    HostLink link;
    FrameAssembler assembler;

    Rig() : device(platform, fastConfig()), link(device, [this](const pulsebridge_BridgeEvent& evt) { sink(evt); }) {
        platform.addCharacteristic(GattTarget(COYOTE_SERVICE_UUID, COYOTE_WRITE_CHAR_UUID), 0x0E,
                                   CharProperty::Write | CharProperty::WriteNoResponse);
        platform.addCharacteristic(GattTarget(COYOTE_SERVICE_UUID, COYOTE_NOTIFY_CHAR_UUID), 0x11,
                                   CharProperty::Notify);
        platform.addCharacteristic(GattTarget(COYOTE_BATTERY_SERVICE_UUID, COYOTE_BATTERY_CHAR_UUID), 0x21,
                                   CharProperty::Read | CharProperty::Notify);
        platform.setReadValue(0x21, {90});
    }

    // Pushes the command through the same path the firmware uses for UART input.
    void send(const pulsebridge_HostCommand& command) {
        std::vector<uint8_t> frame;
        TEST_ASSERT_TRUE(pulsebridge::encodeWithLength(pulsebridge_HostCommand_fields, &command, frame));
        const size_t frames = assembler.push(frame.data(), frame.size(), [this](const uint8_t* payload, size_t len) {
            link.handleFrame(payload, len);
        });
        TEST_ASSERT_EQUAL_UINT(1, frames);
    }

    void connect(uint32_t requestId, const char* deviceId) {
        pulsebridge_HostCommand command = pulsebridge_HostCommand_init_default;
        command.request_id = requestId;
        command.which_command = pulsebridge_HostCommand_connect_tag;
        std::strncpy(command.command.connect.device_id, deviceId, sizeof(command.command.connect.device_id) - 1);
        send(command);
    }
};

pulsebridge_HostCommand strengthCommand(uint32_t requestId, uint32_t value) {
    pulsebridge_HostCommand command = pulsebridge_HostCommand_init_default;
    command.request_id = requestId;
    command.which_command = pulsebridge_HostCommand_set_strength_tag;
    command.command.set_strength.channel = pulsebridge_Channel_CHANNEL_A;
    command.command.set_strength.mode = pulsebridge_StrengthMode_STRENGTH_MODE_ABSOLUTE;
    command.command.set_strength.value = value;
    return command;
}

}  // namespace

static void test_connect_answers_once_and_remembers_device() {
    Rig rig;
    rig.connect(7, kDeviceId);

    const auto results = rig.sink.results();
    TEST_ASSERT_EQUAL_UINT(1, results.size());
    TEST_ASSERT_EQUAL_UINT32(7, results[0].request_id);
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_NONE, results[0].error);
    TEST_ASSERT_EQUAL(pulsebridge_BridgeEvent_result_tag, rig.sink.events.back().which_event);
    TEST_ASSERT_TRUE(rig.sink.count(pulsebridge_BridgeEvent_state_changed_tag) >= 2);
    TEST_ASSERT_EQUAL_UINT(1, rig.sink.count(pulsebridge_BridgeEvent_battery_tag));

    pulsebridge::PersistentSettings settings;
    TEST_ASSERT_TRUE(pulsebridge::loadPersistentSettings(settings));
    TEST_ASSERT_TRUE(settings.hasDeviceId);
    TEST_ASSERT_EQUAL_STRING(kDeviceId, settings.deviceId.c_str());
}

static void test_connect_without_id_uses_remembered_device() {
    Rig rig;
    rig.connect(1, "");
    auto results = rig.sink.results();
    TEST_ASSERT_EQUAL_UINT(1, results.size());
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_INVALID_STATE, results[0].error);
    TEST_ASSERT_EQUAL_INT(0, rig.platform.openCalls());

    pulsebridge::storeDeviceId(kDeviceId);
    rig.sink.clear();
    rig.connect(2, "");
    results = rig.sink.results();
    TEST_ASSERT_EQUAL_UINT(1, results.size());
    TEST_ASSERT_EQUAL_UINT32(2, results[0].request_id);
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_NONE, results[0].error);
    TEST_ASSERT_TRUE(rig.device.state() == pulsebridge::ConnectionState::Connected);
}

static void test_commands_report_device_errors() {
    Rig rig;
    rig.send(strengthCommand(11, 20));
    auto results = rig.sink.results();
    TEST_ASSERT_EQUAL_UINT(1, results.size());
    TEST_ASSERT_EQUAL_UINT32(11, results[0].request_id);
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_INVALID_STATE, results[0].error);

    rig.connect(12, kDeviceId);
    rig.sink.clear();
    rig.platform.clearLog();
    rig.send(strengthCommand(13, 500));
    results = rig.sink.results();
    TEST_ASSERT_EQUAL_UINT(1, results.size());
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_NONE, results[0].error);
    const auto writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(1, writes.size());
    TEST_ASSERT_EQUAL_UINT8(200, writes[0].data[2]);
}

static void test_query_status_reports_state_and_limits() {
    Rig rig;
    pulsebridge_HostCommand limits = pulsebridge_HostCommand_init_default;
    limits.request_id = 3;
    limits.which_command = pulsebridge_HostCommand_set_soft_limits_tag;
    limits.command.set_soft_limits.limit_a = 40;
    limits.command.set_soft_limits.limit_b = 300;
    rig.send(limits);

    pulsebridge::PersistentSettings settings;
    TEST_ASSERT_TRUE(pulsebridge::loadPersistentSettings(settings));
    TEST_ASSERT_TRUE(settings.hasSoftLimits);
    TEST_ASSERT_EQUAL_UINT8(40, settings.limitA);
    TEST_ASSERT_EQUAL_UINT8(200, settings.limitB);

    rig.sink.clear();
    pulsebridge_HostCommand query = pulsebridge_HostCommand_init_default;
    query.request_id = 4;
    query.which_command = pulsebridge_HostCommand_query_status_tag;
    rig.send(query);

    TEST_ASSERT_EQUAL_UINT(2, rig.sink.events.size());
    const auto& status = rig.sink.events[0];
    TEST_ASSERT_EQUAL(pulsebridge_BridgeEvent_state_changed_tag, status.which_event);
    TEST_ASSERT_EQUAL(pulsebridge_LinkState_LINK_STATE_DISCONNECTED, status.event.state_changed.state);
    TEST_ASSERT_EQUAL_UINT32(40, status.event.state_changed.limit_a);
    TEST_ASSERT_EQUAL_UINT32(200, status.event.state_changed.limit_b);
    TEST_ASSERT_EQUAL(pulsebridge_BridgeEvent_result_tag, rig.sink.events[1].which_event);
    TEST_ASSERT_EQUAL_UINT32(4, rig.sink.events[1].event.result.request_id);
}

static void test_waveform_needs_four_samples() {
    Rig rig;
    rig.connect(1, kDeviceId);
    rig.sink.clear();
    rig.platform.clearLog();

    pulsebridge_HostCommand wave = pulsebridge_HostCommand_init_default;
    wave.request_id = 20;
    wave.which_command = pulsebridge_HostCommand_send_waveform_tag;
    wave.command.send_waveform.channel = pulsebridge_Channel_CHANNEL_B;
    wave.command.send_waveform.samples_count = 3;
    rig.send(wave);
    auto results = rig.sink.results();
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_INVALID_STATE, results.back().error);
    TEST_ASSERT_EQUAL_UINT(0, rig.platform.writes().size());

    wave.request_id = 21;
    wave.command.send_waveform.samples_count = 4;
    wave.command.send_waveform.user_frequency = true;
    for (auto& sample : wave.command.send_waveform.samples) {
        sample.frequency = 610;
        sample.strength = 150;
    }
    rig.send(wave);
    results = rig.sink.results();
    TEST_ASSERT_EQUAL_UINT32(21, results.back().request_id);
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_NONE, results.back().error);
    auto writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(1, writes.size());
    TEST_ASSERT_EQUAL_UINT8(201, writes[0].data[12]);
    TEST_ASSERT_EQUAL_UINT8(100, writes[0].data[16]);

    pulsebridge_HostCommand hex = pulsebridge_HostCommand_init_default;
    hex.request_id = 22;
    hex.which_command = pulsebridge_HostCommand_send_waveform_tag;
    std::strncpy(hex.command.send_waveform.hex, "0A0A0A0A0014", sizeof(hex.command.send_waveform.hex) - 1);
    rig.send(hex);
    results = rig.sink.results();
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_INVALID_STATE, results.back().error);

    std::strncpy(hex.command.send_waveform.hex, "0A0A0A0A00141E28", sizeof(hex.command.send_waveform.hex) - 1);
    hex.request_id = 23;
    rig.send(hex);
    results = rig.sink.results();
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_NONE, results.back().error);
    writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(2, writes.size());
    TEST_ASSERT_EQUAL_UINT8(40, writes[1].data[11]);
}

static void test_malformed_and_unknown_commands() {
    Rig rig;
    const uint8_t garbage[] = {0x04, 0x00, 0x0A, 0xFF, 0xFF, 0xFF};
    rig.assembler.push(garbage, sizeof(garbage), [&](const uint8_t* payload, size_t len) {
        rig.link.handleFrame(payload, len);
    });
    auto results = rig.sink.results();
    TEST_ASSERT_EQUAL_UINT(1, results.size());
    TEST_ASSERT_EQUAL_UINT32(0, results[0].request_id);
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_INVALID_STATE, results[0].error);
    TEST_ASSERT_EQUAL_UINT32(1, rig.link.decodeFailures());

    pulsebridge_HostCommand empty = pulsebridge_HostCommand_init_default;
    empty.request_id = 9;
    rig.send(empty);
    results = rig.sink.results();
    TEST_ASSERT_EQUAL_UINT(2, results.size());
    TEST_ASSERT_EQUAL_UINT32(9, results[1].request_id);
    TEST_ASSERT_EQUAL(pulsebridge_ErrorKind_ERROR_KIND_INVALID_STATE, results[1].error);
}

static void test_assembler_handles_split_and_joined_frames() {
    FrameAssembler assembler(16);
    std::vector<std::vector<uint8_t>> payloads;
    const auto collect = [&](const uint8_t* payload, size_t len) { payloads.emplace_back(payload, payload + len); };

    const uint8_t first[] = {0x03, 0x00, 0x01};
    const uint8_t rest[] = {0x02, 0x03, 0x01, 0x00, 0x09, 0x00};
    TEST_ASSERT_EQUAL_UINT(0, assembler.push(first, sizeof(first), collect));
    TEST_ASSERT_EQUAL_UINT(3, assembler.buffered());
    TEST_ASSERT_EQUAL_UINT(2, assembler.push(rest, sizeof(rest), collect));
    TEST_ASSERT_EQUAL_UINT(1, assembler.buffered());
    TEST_ASSERT_EQUAL_UINT(2, payloads.size());
    TEST_ASSERT_EQUAL_UINT(3, payloads[0].size());
    TEST_ASSERT_EQUAL_UINT8(0x03, payloads[0][2]);
    TEST_ASSERT_EQUAL_UINT8(0x09, payloads[1][0]);

    const uint8_t oversize[] = {0x00, 0x40, 0x01};
    assembler.reset();
    TEST_ASSERT_EQUAL_UINT(0, assembler.push(oversize, sizeof(oversize), collect));
    TEST_ASSERT_EQUAL_UINT(0, assembler.buffered());
    TEST_ASSERT_EQUAL_UINT32(1, assembler.rejectedFrames());
}

static void test_events_survive_the_wire() {
    Rig rig;
    std::vector<uint8_t> wire;
    HostLink wired(rig.device, [&](const pulsebridge_BridgeEvent& evt) {
        std::vector<uint8_t> frame;
        TEST_ASSERT_TRUE(pulsebridge::encodeFrame(evt, frame));
        wire.insert(wire.end(), frame.begin(), frame.end());
    });

    pulsebridge::TelemetryAck ack;
    ack.sequence = 4;
    ack.strengthA = 12;
    ack.strengthB = 30;
    rig.device.telemetryReceived().notify(ack);

    FrameAssembler host;
    std::vector<pulsebridge_BridgeEvent> decoded;
    host.push(wire.data(), wire.size(), [&](const uint8_t* payload, size_t len) {
        pulsebridge_BridgeEvent evt = pulsebridge_BridgeEvent_init_default;
        pb_istream_t stream = pb_istream_from_buffer(payload, len);
        TEST_ASSERT_TRUE(pb_decode(&stream, pulsebridge_BridgeEvent_fields, &evt));
        decoded.push_back(evt);
    });

    TEST_ASSERT_EQUAL_UINT(1, decoded.size());
    TEST_ASSERT_EQUAL(pulsebridge_BridgeEvent_telemetry_tag, decoded[0].which_event);
    TEST_ASSERT_EQUAL_UINT32(4, decoded[0].event.telemetry.sequence);
    TEST_ASSERT_EQUAL_UINT32(30, decoded[0].event.telemetry.strength_b);
    TEST_ASSERT_TRUE(decoded[0].timestamp_ms > 0);
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_connect_answers_once_and_remembers_device);
    RUN_TEST(test_connect_without_id_uses_remembered_device);
    RUN_TEST(test_commands_report_device_errors);
    RUN_TEST(test_query_status_reports_state_and_limits);
    RUN_TEST(test_waveform_needs_four_samples);
    RUN_TEST(test_malformed_and_unknown_commands);
    RUN_TEST(test_assembler_handles_split_and_joined_frames);
    RUN_TEST(test_events_survive_the_wire);
    return UNITY_END();
}
