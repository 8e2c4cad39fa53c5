#pragma once

#include <cstdint>
#include <string>

namespace pulsebridge {

struct PersistentSettings {
    bool hasDeviceId = false;
    std::string deviceId;
    bool hasSoftLimits = false;
    uint8_t limitA = 0;
    uint8_t limitB = 0;
};

// Survives a reboot on the firmware; process-local on a desktop build.
bool loadPersistentSettings(PersistentSettings& out);
void storeDeviceId(const std::string& deviceId);
void storeSoftLimits(uint8_t limitA, uint8_t limitB);
void clearPersistentSettings();

}  // namespace pulsebridge
