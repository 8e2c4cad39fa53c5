#include <unity.h>

#include "CoyoteDevice.h"
#include "FakeBlePlatform.h"

#include <thread>
#include <vector>

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

using pulsebridge::Channel;
using pulsebridge::CoyoteDevice;
using pulsebridge::DeviceConfig;
using pulsebridge::ErrorKind;
using pulsebridge::GattTarget;
using pulsebridge::PlatformStatus;
using pulsebridge::StrengthMode;
using pulsebridge::WaveformSamples;
using pulsebridge::test::FakeBlePlatform;
namespace CharProperty = pulsebridge::CharProperty;

namespace {

constexpr const char* kDeviceId = "AABBCCDDEE01";
constexpr uint32_t kWriteHandle = 0x0E;
constexpr uint32_t kNotifyHandle = 0x11;
constexpr uint32_t kBatteryHandle = 0x21;

DeviceConfig fastConfig() {
    DeviceConfig config;
    config.session.connectRetryDelayMs = 2;
    config.session.pairSettleMs = 0;
    config.session.accessSettleMs = 0;
    config.session.retryDelayMs = 1;
    config.session.lockWaitMs = 1000;
    config.dispatcher.ackWaitMs = 5;
    return config;
}

struct Rig {
    FakeBlePlatform platform;
    CoyoteDevice device;

    Rig() : device(platform, fastConfig()) {
        platform.addCharacteristic(GattTarget(COYOTE_SERVICE_UUID, COYOTE_WRITE_CHAR_UUID), kWriteHandle,
                                   CharProperty::Write | CharProperty::WriteNoResponse);
        platform.addCharacteristic(GattTarget(COYOTE_SERVICE_UUID, COYOTE_NOTIFY_CHAR_UUID), kNotifyHandle,
                                   CharProperty::Notify);
        platform.addCharacteristic(GattTarget(COYOTE_BATTERY_SERVICE_UUID, COYOTE_BATTERY_CHAR_UUID), kBatteryHandle,
                                   CharProperty::Read | CharProperty::Notify);
        platform.setReadValue(kBatteryHandle, {87});
    }
};

WaveformSamples pulse() {
    WaveformSamples samples{};
    for (auto& sample : samples) {
        sample.frequency = 50;
        sample.strength = 40;
    }
    return samples;
}

}  // namespace

static void test_commands_need_connection() {
    Rig rig;
    TEST_ASSERT_TRUE(rig.device.setStrength(Channel::A, 10, StrengthMode::Absolute).kind == ErrorKind::InvalidState);
    TEST_ASSERT_TRUE(rig.device.sendWaveform(Channel::A, pulse()).kind == ErrorKind::InvalidState);
    TEST_ASSERT_EQUAL_UINT(0, rig.platform.writes().size());
}

static void test_limits_before_connect_are_sent_first() {
    Rig rig;
    TEST_ASSERT_TRUE(rig.device.setSoftLimits(250, 10).ok());
    TEST_ASSERT_EQUAL_UINT(0, rig.platform.writes().size());
    TEST_ASSERT_EQUAL_UINT8(200, rig.device.dispatcher().softLimits().limitA);

    TEST_ASSERT_TRUE(rig.device.connect(kDeviceId).ok());
    const auto writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(1, writes.size());
    const uint8_t expected[] = {0xBF, 0xC8, 0x0A, 0x80, 0x80, 0x80, 0x80};
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, writes[0].data.data(), sizeof(expected));
    TEST_ASSERT_TRUE(writes[0].withResponse);
}

static void test_limits_while_connected_are_sent_now() {
    Rig rig;
    TEST_ASSERT_TRUE(rig.device.connect(kDeviceId).ok());
    rig.platform.clearLog();

    TEST_ASSERT_TRUE(rig.device.setSoftLimits(40, 60).ok());
    const auto writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(1, writes.size());
    TEST_ASSERT_EQUAL_HEX8(0xBF, writes[0].data[0]);
    TEST_ASSERT_EQUAL_UINT8(40, writes[0].data[1]);
    TEST_ASSERT_EQUAL_UINT8(60, writes[0].data[2]);
}

static void test_failed_limits_are_delivered_by_service() {
    Rig rig;
    TEST_ASSERT_TRUE(rig.device.connect(kDeviceId).ok());
    rig.platform.clearLog();
    rig.platform.queueWrite(PlatformStatus::Failed);
    rig.platform.queueWrite(PlatformStatus::Failed);
    rig.platform.queueWrite(PlatformStatus::Failed);

    TEST_ASSERT_TRUE(rig.device.setSoftLimits(30, 30).kind == ErrorKind::Transient);
    TEST_ASSERT_EQUAL_UINT(0, rig.platform.writes().size());

    rig.device.service(1000);
    const auto writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(1, writes.size());
    TEST_ASSERT_EQUAL_HEX8(0xBF, writes[0].data[0]);
    TEST_ASSERT_EQUAL_UINT8(30, writes[0].data[1]);

    rig.device.service(1010);
    TEST_ASSERT_EQUAL_UINT(1, rig.platform.writes().size());
}

static void test_strength_sequence_and_ack() {
    Rig rig;
    TEST_ASSERT_TRUE(rig.device.connect(kDeviceId).ok());
    rig.platform.clearLog();

    std::vector<pulsebridge::TelemetryAck> acks;
    const auto id = rig.device.telemetryReceived().add([&](const pulsebridge::TelemetryAck& ack) { acks.push_back(ack); });

    TEST_ASSERT_TRUE(rig.device.setStrength(Channel::A, 20, StrengthMode::Absolute).ok());
    rig.platform.notify(kNotifyHandle, {0xB1, 0x01, 0x14, 0x00});
    TEST_ASSERT_EQUAL_UINT(1, acks.size());
    TEST_ASSERT_EQUAL_UINT8(20, rig.device.dispatcher().lastTelemetry().strengthA);

    for (int i = 0; i < 15; ++i) {
        TEST_ASSERT_TRUE(rig.device.setStrength(Channel::B, 5, StrengthMode::Increase).ok());
    }
    rig.device.telemetryReceived().remove(id);

    const auto writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(16, writes.size());
    TEST_ASSERT_EQUAL_UINT8(1, writes[0].data[1] >> 4);
    TEST_ASSERT_EQUAL_UINT8(2, writes[1].data[1] >> 4);
    TEST_ASSERT_EQUAL_UINT8(15, writes[14].data[1] >> 4);
    // 0 means "no acknowledgement", so the counter wraps to 1.
    TEST_ASSERT_EQUAL_UINT8(1, writes[15].data[1] >> 4);
    for (const auto& write : writes) {
        TEST_ASSERT_TRUE(write.withResponse);
        TEST_ASSERT_EQUAL_UINT(20, write.data.size());
    }
}

static void test_concurrent_writers_never_interleave() {
    Rig rig;
    TEST_ASSERT_TRUE(rig.device.connect(kDeviceId).ok());
    rig.platform.clearLog();
    rig.platform.setWriteDelayMs(1);

    std::thread strengths([&] {
        for (int i = 0; i < 20; ++i) {
            rig.device.setStrength(Channel::A, i, StrengthMode::Absolute);
        }
    });
    std::thread waves([&] {
        for (int i = 0; i < 20; ++i) {
            rig.device.sendWaveform(Channel::B, pulse());
        }
    });
    strengths.join();
    waves.join();

    TEST_ASSERT_FALSE(rig.platform.overlapDetected());
    const auto writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(40, writes.size());
    size_t strengthFrames = 0;
    size_t waveFrames = 0;
    for (const auto& write : writes) {
        TEST_ASSERT_EQUAL_UINT(20, write.data.size());
        if (pulsebridge::decodeStrengthSet(write.data.data(), write.data.size())) {
            ++strengthFrames;
        } else if (pulsebridge::decodeWaveform(write.data.data(), write.data.size())) {
            ++waveFrames;
        }
    }
    TEST_ASSERT_EQUAL_UINT(20, strengthFrames);
    TEST_ASSERT_EQUAL_UINT(20, waveFrames);
}

static void test_waveform_keepalive_and_clear() {
    Rig rig;
    TEST_ASSERT_TRUE(rig.device.connect(kDeviceId).ok());
    TEST_ASSERT_TRUE(rig.device.sendWaveform(Channel::A, pulse()).ok());
    TEST_ASSERT_TRUE(rig.device.dispatcher().waveformActive(Channel::A));
    TEST_ASSERT_FALSE(rig.device.dispatcher().waveformActive(Channel::B));
    rig.platform.clearLog();

    rig.device.service(1000);
    rig.device.service(1050);
    rig.device.service(1100);
    auto writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(2, writes.size());
    const auto decoded = pulsebridge::decodeWaveform(writes[1].data.data(), writes[1].data.size());
    TEST_ASSERT_TRUE(decoded.has_value());
    TEST_ASSERT_TRUE(decoded->channel == Channel::A);
    TEST_ASSERT_TRUE(decoded->samples == pulse());

    TEST_ASSERT_TRUE(rig.device.clearQueue(Channel::A).ok());
    TEST_ASSERT_FALSE(rig.device.dispatcher().waveformActive(Channel::A));
    rig.device.service(1300);
    writes = rig.platform.writes();
    TEST_ASSERT_EQUAL_UINT(2, writes.size());
}

static void test_battery_is_polled() {
    Rig rig;
    std::vector<uint8_t> levels;
    const auto id = rig.device.batteryReceived().add([&](uint8_t percent) { levels.push_back(percent); });

    TEST_ASSERT_TRUE(rig.device.connect(kDeviceId).ok());
    TEST_ASSERT_EQUAL_UINT(1, levels.size());

    rig.device.service(1000);
    rig.device.service(5999);
    TEST_ASSERT_EQUAL_UINT(1, levels.size());
    rig.device.service(6000);
    TEST_ASSERT_EQUAL_UINT(2, levels.size());
    TEST_ASSERT_EQUAL_UINT8(87, levels[1]);

    rig.platform.notify(kBatteryHandle, {64});
    TEST_ASSERT_EQUAL_UINT(3, levels.size());
    TEST_ASSERT_EQUAL_UINT8(64, levels[2]);
    rig.device.batteryReceived().remove(id);
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_commands_need_connection);
    RUN_TEST(test_limits_before_connect_are_sent_first);
    RUN_TEST(test_limits_while_connected_are_sent_now);
    RUN_TEST(test_failed_limits_are_delivered_by_service);
    RUN_TEST(test_strength_sequence_and_ack);
    RUN_TEST(test_concurrent_writers_never_interleave);
    RUN_TEST(test_waveform_keepalive_and_clear);
    RUN_TEST(test_battery_is_polled);
    return UNITY_END();
}
