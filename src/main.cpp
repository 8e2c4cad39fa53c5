#include <Arduino.h>
#include <NimBLEDevice.h>

#include "Config.h"
#include "CoyoteDevice.h"
#include "HostLink.h"
#include "PersistentConfig.h"
#include "platform/NimBlePlatform.h"
#include "system/Log.h"

#include <algorithm>
#include <array>
#include <memory>
#include <vector>

namespace {

constexpr const char* kFirmwareVersion = "1.0.0";
constexpr const char* kTag = "BOOT";
constexpr uint32_t kStatusIntervalMs = 10000;

std::unique_ptr<pulsebridge::platform::NimBlePlatform> g_platform;
std::unique_ptr<pulsebridge::CoyoteDevice> g_device;
std::unique_ptr<pulsebridge::HostLink> g_hostLink;
pulsebridge::FrameAssembler g_assembler;

void writeEvent(const pulsebridge_BridgeEvent& event) {
    std::vector<uint8_t> frame;
    if (!pulsebridge::encodeFrame(event, frame)) {
        return;
    }
    Serial1.write(frame.data(), frame.size());
}

void restoreSettings() {
    pulsebridge::PersistentSettings settings;
    if (!pulsebridge::loadPersistentSettings(settings)) {
        PB_LOGI(kTag, "no stored settings");
        return;
    }
    if (settings.hasSoftLimits) {
        g_device->setSoftLimits(settings.limitA, settings.limitB);
        PB_LOGI(kTag, "restored soft limits A=%u B=%u", static_cast<unsigned>(settings.limitA),
                static_cast<unsigned>(settings.limitB));
    }
    if (settings.hasDeviceId) {
        PB_LOGI(kTag, "reconnecting to %s", settings.deviceId.c_str());
        const pulsebridge::BleStatus status = g_device->connect(settings.deviceId);
        if (!status.ok()) {
            PB_LOGW(kTag, "auto-connect failed: %s", status.describe().c_str());
        }
    }
}

void pumpHostInput() {
    std::array<uint8_t, 64> chunk{};
    while (Serial1.available() > 0) {
        const size_t len = Serial1.readBytes(chunk.data(), std::min<size_t>(chunk.size(), Serial1.available()));
        if (len == 0) {
            break;
        }
        g_assembler.push(chunk.data(), len,
                         [](const uint8_t* payload, size_t payloadLen) { g_hostLink->handleFrame(payload, payloadLen); });
    }
}

}  // namespace

void setup() {
    Serial.begin(115200);
    delay(100);
    Serial.println();
    Serial.println("========================================");
    Serial.println("    PulseBridge - Booting");
    Serial.println("========================================");
    Serial.print("Firmware version: ");
    Serial.println(kFirmwareVersion);
    Serial.print("Free heap: ");
    Serial.print(ESP.getFreeHeap());
    Serial.println(" bytes");
    Serial.println();

    Serial1.begin(HOST_SERIAL_BAUD, SERIAL_8N1, HOST_UART_RX_PIN, HOST_UART_TX_PIN);

    NimBLEDevice::init("PulseBridge");
    NimBLEDevice::setPower(ESP_PWR_LVL_P9);
    NimBLEDevice::setSecurityAuth(true, false, true);

    g_platform = std::make_unique<pulsebridge::platform::NimBlePlatform>();
    g_device = std::make_unique<pulsebridge::CoyoteDevice>(*g_platform, pulsebridge::DeviceConfig{});
    g_hostLink = std::make_unique<pulsebridge::HostLink>(*g_device, writeEvent);
    PB_LOGI(kTag, "host link on UART rx=%d tx=%d @ %d baud", HOST_UART_RX_PIN, HOST_UART_TX_PIN, HOST_SERIAL_BAUD);

    restoreSettings();
}

void loop() {
    const uint64_t now = millis();
    pumpHostInput();
    g_device->service(now);

    static uint64_t lastStatus = 0;
    if (now - lastStatus > kStatusIntervalMs) {
        lastStatus = now;
        const pulsebridge::SoftLimits limits = g_device->dispatcher().softLimits();
        PB_LOGI("STATUS", "uptime_s=%llu state=%s limits=%u/%u heap=%u", static_cast<unsigned long long>(now / 1000),
                pulsebridge::connectionStateLabel(g_device->state()), static_cast<unsigned>(limits.limitA),
                static_cast<unsigned>(limits.limitB), static_cast<unsigned>(ESP.getFreeHeap()));
    }
    delay(2);
}
