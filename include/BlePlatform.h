#pragma once

#include "BleTypes.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pulsebridge {

enum class PlatformStatus {
    Success,
    Timeout,
    Busy,
    NotFound,
    AccessDenied,
    Disconnected,
    Failed,
    Unsupported
};

const char* platformStatusLabel(PlatformStatus status);

enum class AccessStatus {
    Allowed,
    DeniedByUser,
    DeniedBySystem,
    Unspecified
};

enum class CccdValue {
    None,
    Notify,
    Indicate
};

// GATT characteristic property bits as they appear in the declaration.
namespace CharProperty {
constexpr uint8_t Read = 0x02;
constexpr uint8_t WriteNoResponse = 0x04;
constexpr uint8_t Write = 0x08;
constexpr uint8_t Notify = 0x10;
constexpr uint8_t Indicate = 0x20;
}  // namespace CharProperty

struct CharacteristicInfo {
    uint32_t handle = 0;
    uint8_t properties = 0;

    bool canNotify() const { return (properties & CharProperty::Notify) != 0; }
    bool canIndicate() const { return (properties & CharProperty::Indicate) != 0; }
};

struct AdapterStatus {
    bool available = false;
    bool enabled = false;
    std::string detail;
};

struct Advertisement {
    uint64_t address = 0;
    std::string localName;
    int rssi = 0;
    std::vector<std::string> serviceIds;
    bool connectable = true;
};

// What the radio stack remembers about a peer it has already seen or bonded with.
struct DeviceRecord {
    uint64_t address = 0;
    uint8_t addressType = 0;
    std::string name;
    bool paired = false;
    bool canPair = true;
};

/**
 * @brief Radio stack seam for a single central link.
 *
 * Every blocking call is bounded by the timeout it receives. Implementations
 * report failures through PlatformStatus and never throw. Notification and
 * link-loss callbacks may arrive on the stack's own thread.
 */
class BlePlatform {
public:
    using AdvertisementHandler = std::function<void(const Advertisement&)>;
    using NotificationHandler = std::function<void(const uint8_t* data, size_t len)>;
    using LinkLossHandler = std::function<void(int reason)>;

    virtual ~BlePlatform() = default;

    virtual AdapterStatus adapterStatus() = 0;

    virtual PlatformStatus startScan(const std::string& serviceFilter, AdvertisementHandler handler) = 0;
    virtual void stopScan() = 0;

    virtual std::optional<DeviceRecord> findDeviceRecord(uint64_t address) = 0;
    // Both return NotFound when the stack hands back no device handle.
    virtual PlatformStatus openByRecord(const DeviceRecord& record, uint32_t timeoutMs) = 0;
    virtual PlatformStatus openByAddress(uint64_t address, uint32_t timeoutMs) = 0;

    virtual PlatformStatus pair(uint32_t timeoutMs) = 0;
    virtual AccessStatus requestAccess() = 0;

    virtual PlatformStatus discoverServices(bool uncached, uint32_t timeoutMs, std::vector<std::string>& serviceIds) = 0;
    virtual bool maintainConnection(const std::string& serviceId) = 0;

    virtual PlatformStatus findCharacteristic(const GattTarget& target, uint32_t timeoutMs, CharacteristicInfo& out) = 0;
    virtual PlatformStatus writeCccd(uint32_t handle, CccdValue value, uint32_t timeoutMs) = 0;
    virtual void attachNotifications(uint32_t handle, NotificationHandler handler) = 0;
    virtual void detachNotifications(uint32_t handle) = 0;

    virtual PlatformStatus write(uint32_t handle, const uint8_t* data, size_t len, bool withResponse, uint32_t timeoutMs) = 0;
    virtual PlatformStatus read(uint32_t handle, Bytes& out, uint32_t timeoutMs) = 0;

    virtual std::string deviceName() const = 0;
    virtual void closeDevice() noexcept = 0;

    virtual void setLinkLossHandler(LinkLossHandler handler) = 0;
};

}  // namespace pulsebridge
