#include "PersistentConfig.h"

#ifdef ARDUINO
#include <Preferences.h>

namespace pulsebridge {
namespace {
constexpr const char* kNamespace = "pbcfg";
constexpr const char* kKeyDevice = "device";
constexpr const char* kKeyLimitA = "limA";
constexpr const char* kKeyLimitB = "limB";
}  // namespace

bool loadPersistentSettings(PersistentSettings& out) {
    Preferences prefs;
    if (!prefs.begin(kNamespace, true)) {
        return false;
    }
    bool any = false;
    if (prefs.isKey(kKeyDevice)) {
        out.deviceId = prefs.getString(kKeyDevice, "").c_str();
        out.hasDeviceId = !out.deviceId.empty();
        any = any || out.hasDeviceId;
    }
    if (prefs.isKey(kKeyLimitA) && prefs.isKey(kKeyLimitB)) {
        out.limitA = prefs.getUChar(kKeyLimitA, 0);
        out.limitB = prefs.getUChar(kKeyLimitB, 0);
        out.hasSoftLimits = true;
        any = true;
    }
    prefs.end();
    return any;
}

void storeDeviceId(const std::string& deviceId) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putString(kKeyDevice, deviceId.c_str());
    prefs.end();
}

void storeSoftLimits(uint8_t limitA, uint8_t limitB) {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.putUChar(kKeyLimitA, limitA);
    prefs.putUChar(kKeyLimitB, limitB);
    prefs.end();
}

void clearPersistentSettings() {
    Preferences prefs;
    prefs.begin(kNamespace, false);
    prefs.clear();
    prefs.end();
}

}  // namespace pulsebridge
#else

namespace pulsebridge {
namespace {
PersistentSettings g_settings;
}

bool loadPersistentSettings(PersistentSettings& out) {
    out = g_settings;
    return g_settings.hasDeviceId || g_settings.hasSoftLimits;
}

void storeDeviceId(const std::string& deviceId) {
    g_settings.deviceId = deviceId;
    g_settings.hasDeviceId = !deviceId.empty();
}

void storeSoftLimits(uint8_t limitA, uint8_t limitB) {
    g_settings.limitA = limitA;
    g_settings.limitB = limitB;
    g_settings.hasSoftLimits = true;
}

void clearPersistentSettings() {
    g_settings = PersistentSettings{};
}

}  // namespace pulsebridge

#endif  // ARDUINO
