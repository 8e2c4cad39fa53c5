#include "BlePlatform.h"

namespace pulsebridge {

const char* platformStatusLabel(PlatformStatus status) {
    switch (status) {
        case PlatformStatus::Success: return "success";
        case PlatformStatus::Timeout: return "timeout";
        case PlatformStatus::Busy: return "busy";
        case PlatformStatus::NotFound: return "not found";
        case PlatformStatus::AccessDenied: return "access denied";
        case PlatformStatus::Disconnected: return "disconnected";
        case PlatformStatus::Failed: return "failed";
        case PlatformStatus::Unsupported: return "unsupported";
    }
    return "unknown";
}

}  // namespace pulsebridge
