#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pulsebridge {

using Bytes = std::vector<uint8_t>;

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting
};

const char* connectionStateLabel(ConnectionState state);

struct DiscoveredDevice {
    std::string id;          // 12 hex digits, e.g. AABBCCDDEE01
    std::string name;
    std::string macAddress;  // AA:BB:CC:DD:EE:01
    int rssi = 0;
    std::vector<std::string> serviceIds;
    bool connectable = true;
};

struct ScanOptions {
    std::string serviceFilter;
    std::string namePrefix;
    uint32_t timeoutMs = 10000;
};

struct GattTarget {
    std::string serviceId;
    std::string characteristicId;

    GattTarget() = default;
    GattTarget(std::string service, std::string characteristic);

    bool operator==(const GattTarget& other) const;
    bool operator!=(const GattTarget& other) const { return !(*this == other); }
    bool operator<(const GattTarget& other) const;
};

enum class WriteMode {
    WithResponse,
    WithoutResponse
};

// Lower-cases a UUID string so that textual comparisons are stable.
std::string normalizeUuid(const std::string& uuid);

// Accepts AA:BB:CC:DD:EE:FF, AA-BB-CC-DD-EE-FF, AABBCCDDEEFF and 0xAABBCCDDEEFF.
std::optional<uint64_t> parseDeviceId(const std::string& text);
std::string formatDeviceId(uint64_t address);
std::string formatMacAddress(uint64_t address);

}  // namespace pulsebridge
