#include "CoyoteDevice.h"

#include "system/Log.h"

namespace pulsebridge {

namespace {
constexpr const char* kTag = "COYOTE";
}

CoyoteDevice::CoyoteDevice(BlePlatform& platform, const DeviceConfig& config)
    : config_(config),
      session_(platform, config_.session),
      supervisor_(session_, config_.recovery),
      dispatcher_(session_, config_.dispatcher) {}

BleStatus CoyoteDevice::scan(std::vector<DiscoveredDevice>& out, const system::CancellationToken& cancel) {
    return session_.scan(config_.scan, out, cancel);
}

BleStatus CoyoteDevice::scan(const ScanOptions& options, std::vector<DiscoveredDevice>& out,
                             const system::CancellationToken& cancel) {
    return session_.scan(options, out, cancel);
}

BleStatus CoyoteDevice::connect(const std::string& deviceId, const system::CancellationToken& cancel) {
    BleStatus status = session_.connect(deviceId, cancel);
    if (!status.ok()) {
        return status;
    }

    status = session_.subscribe(config_.dispatcher.notifyTarget);
    if (!status.ok()) {
        PB_LOGE(kTag, "device feedback unavailable: %s", status.describe().c_str());
        session_.disconnect();
        return status;
    }

    // Battery reporting is optional on some firmware revisions.
    const BleStatus battery = session_.subscribe(config_.dispatcher.batteryTarget);
    if (!battery.ok()) {
        PB_LOGW(kTag, "battery notifications unavailable: %s", battery.describe().c_str());
    }
    uint8_t percent = 0;
    if (dispatcher_.readBattery(percent).ok()) {
        PB_LOGI(kTag, "battery %u%%", static_cast<unsigned>(percent));
    }
    return BleStatus::success();
}

void CoyoteDevice::disconnect() noexcept {
    session_.disconnect();
}

}  // namespace pulsebridge
