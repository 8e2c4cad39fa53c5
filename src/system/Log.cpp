#include "system/Log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

#ifdef ARDUINO
#include <Arduino.h>
#endif

namespace pulsebridge::system {

namespace {

#ifdef ARDUINO
std::atomic<LogLevel> g_level{LogLevel::Info};
#else
std::atomic<LogLevel> g_level{LogLevel::Warn};
#endif

const char* levelPrefix(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "E ";
        case LogLevel::Warn: return "W ";
        case LogLevel::Debug: return "D ";
        default: return "";
    }
}

}  // namespace

void setLogLevel(LogLevel level) {
    g_level.store(level);
}

LogLevel logLevel() {
    return g_level.load();
}

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
    if (level == LogLevel::None || static_cast<int>(level) > static_cast<int>(g_level.load())) {
        return;
    }
    char message[192];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    const char* safeTag = (tag && tag[0] != '\0') ? tag : "LOG";
#ifdef ARDUINO
    Serial.printf("%s[%s] %s\n", levelPrefix(level), safeTag, message);
#else
    std::fprintf(stderr, "%s[%s] %s\n", levelPrefix(level), safeTag, message);
#endif
}

}  // namespace pulsebridge::system
