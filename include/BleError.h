#pragma once

#include <string>

namespace pulsebridge {

enum class ErrorKind {
    None,
    Unavailable,       // no adapter, or adapter switched off
    NotFound,          // device, service or characteristic absent
    Transient,         // timeout, busy stack, failed write; retried before it surfaces
    PermissionDenied,  // access refused, never retried
    InvalidState,      // operation outside Connected
    Cancelled
};

const char* errorKindLabel(ErrorKind kind);

/**
 * @brief Outcome of a fallible session or dispatcher operation.
 *
 * Values travel through out-parameters; the status only says whether the
 * operation worked and, if not, which kind of failure ended it.
 *
 * @code
 * Bytes level;
 * BleStatus status = session.read(batteryTarget, level);
 * if (!status.ok()) {
 *     PB_LOGW("APP", "battery read failed: %s", status.describe().c_str());
 * }
 * @endcode
 */
struct BleStatus {
    ErrorKind kind = ErrorKind::None;
    std::string detail;

    static BleStatus success() { return BleStatus{}; }
    static BleStatus failure(ErrorKind kind, std::string detail);

    bool ok() const { return kind == ErrorKind::None; }
    std::string describe() const;
};

}  // namespace pulsebridge
