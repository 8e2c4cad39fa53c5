#include "BleError.h"

#include <utility>

namespace pulsebridge {

const char* errorKindLabel(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "ok";
        case ErrorKind::Unavailable: return "unavailable";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::PermissionDenied: return "permission-denied";
        case ErrorKind::InvalidState: return "invalid-state";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

BleStatus BleStatus::failure(ErrorKind kind, std::string detail) {
    BleStatus status;
    status.kind = kind;
    status.detail = std::move(detail);
    return status;
}

std::string BleStatus::describe() const {
    std::string text = errorKindLabel(kind);
    if (!detail.empty()) {
        text += ": ";
        text += detail;
    }
    return text;
}

}  // namespace pulsebridge
