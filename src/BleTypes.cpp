#include "BleTypes.h"

#include <cctype>
#include <cstdio>
#include <tuple>

namespace pulsebridge {

namespace {

constexpr uint64_t kAddressMask = 0xFFFFFFFFFFFFULL;

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

const char* connectionStateLabel(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnecting: return "disconnecting";
    }
    return "unknown";
}

GattTarget::GattTarget(std::string service, std::string characteristic)
    : serviceId(normalizeUuid(service)), characteristicId(normalizeUuid(characteristic)) {}

bool GattTarget::operator==(const GattTarget& other) const {
    return serviceId == other.serviceId && characteristicId == other.characteristicId;
}

bool GattTarget::operator<(const GattTarget& other) const {
    return std::tie(serviceId, characteristicId) < std::tie(other.serviceId, other.characteristicId);
}

std::string normalizeUuid(const std::string& uuid) {
    std::string out;
    out.reserve(uuid.size());
    for (char c : uuid) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::optional<uint64_t> parseDeviceId(const std::string& text) {
    std::string digits;
    size_t start = 0;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        start = 2;
    }
    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (c == ':' || c == '-') {
            continue;
        }
        if (hexValue(c) < 0) {
            return std::nullopt;
        }
        digits.push_back(c);
    }
    if (digits.size() != 12) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : digits) {
        value = (value << 4) | static_cast<uint64_t>(hexValue(c));
    }
    return value & kAddressMask;
}

std::string formatDeviceId(uint64_t address) {
    char buffer[13] = {0};
    std::snprintf(buffer, sizeof(buffer), "%012llX", static_cast<unsigned long long>(address & kAddressMask));
    return buffer;
}

std::string formatMacAddress(uint64_t address) {
    char buffer[18] = {0};
    std::snprintf(buffer, sizeof(buffer), "%02X:%02X:%02X:%02X:%02X:%02X",
                  static_cast<unsigned>((address >> 40) & 0xFF),
                  static_cast<unsigned>((address >> 32) & 0xFF),
                  static_cast<unsigned>((address >> 24) & 0xFF),
                  static_cast<unsigned>((address >> 16) & 0xFF),
                  static_cast<unsigned>((address >> 8) & 0xFF),
                  static_cast<unsigned>(address & 0xFF));
    return buffer;
}

}  // namespace pulsebridge
