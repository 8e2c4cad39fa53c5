#pragma once

namespace pulsebridge::system {

enum class LogLevel {
    None,
    Error,
    Warn,
    Info,
    Debug
};

/**
 * @brief Tagged, level-filtered log output.
 *
 * On the firmware lines go to the USB serial console as `[TAG] message`; on a
 * desktop build they go to stderr. Use the PB_LOG* macros rather than calling
 * logf directly.
 *
 * @code
 * PB_LOGI("BLE", "connected to %s", deviceId.c_str());
 * @endcode
 */
void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();

void logf(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

}  // namespace pulsebridge::system

#define PB_LOGE(tag, fmt, ...) ::pulsebridge::system::logf(::pulsebridge::system::LogLevel::Error, tag, fmt, ##__VA_ARGS__)
#define PB_LOGW(tag, fmt, ...) ::pulsebridge::system::logf(::pulsebridge::system::LogLevel::Warn, tag, fmt, ##__VA_ARGS__)
#define PB_LOGI(tag, fmt, ...) ::pulsebridge::system::logf(::pulsebridge::system::LogLevel::Info, tag, fmt, ##__VA_ARGS__)
#define PB_LOGD(tag, fmt, ...) ::pulsebridge::system::logf(::pulsebridge::system::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)
