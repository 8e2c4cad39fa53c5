#pragma once

#include "BlePlatform.h"

#include <NimBLEDevice.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace pulsebridge::platform {

/**
 * @brief BlePlatform on top of the NimBLE-Arduino 2.x central role.
 *
 * Owns at most one NimBLEClient. Characteristic handles handed out by
 * findCharacteristic stay valid until closeDevice(), which also drops every
 * notification handler. GATT calls run on a short-lived FreeRTOS task so the
 * caller waits at most its timeout; a call that outlives it keeps running
 * until NimBLE's own ATT timeout, and closeDevice() waits for it before the
 * client is deleted.
 */
class NimBlePlatform : public BlePlatform {
public:
    NimBlePlatform();
    ~NimBlePlatform() override;

    AdapterStatus adapterStatus() override;

    PlatformStatus startScan(const std::string& serviceFilter, AdvertisementHandler handler) override;
    void stopScan() override;

    std::optional<DeviceRecord> findDeviceRecord(uint64_t address) override;
    PlatformStatus openByRecord(const DeviceRecord& record, uint32_t timeoutMs) override;
    PlatformStatus openByAddress(uint64_t address, uint32_t timeoutMs) override;

    PlatformStatus pair(uint32_t timeoutMs) override;
    AccessStatus requestAccess() override;

    PlatformStatus discoverServices(bool uncached, uint32_t timeoutMs, std::vector<std::string>& serviceIds) override;
    bool maintainConnection(const std::string& serviceId) override;

    PlatformStatus findCharacteristic(const GattTarget& target, uint32_t timeoutMs, CharacteristicInfo& out) override;
    PlatformStatus writeCccd(uint32_t handle, CccdValue value, uint32_t timeoutMs) override;
    void attachNotifications(uint32_t handle, NotificationHandler handler) override;
    void detachNotifications(uint32_t handle) override;

    PlatformStatus write(uint32_t handle, const uint8_t* data, size_t len, bool withResponse, uint32_t timeoutMs) override;
    PlatformStatus read(uint32_t handle, Bytes& out, uint32_t timeoutMs) override;

    std::string deviceName() const override;
    void closeDevice() noexcept override;

    void setLinkLossHandler(LinkLossHandler handler) override;

private:
    class ScanCallbacks : public NimBLEScanCallbacks {
    public:
        explicit ScanCallbacks(NimBlePlatform& owner) : owner_(owner) {}
        void onResult(const NimBLEAdvertisedDevice* advertisedDevice) override;

    private:
        NimBlePlatform& owner_;
    };

    class ClientCallbacks : public NimBLEClientCallbacks {
    public:
        explicit ClientCallbacks(NimBlePlatform& owner) : owner_(owner) {}
        void onDisconnect(NimBLEClient* client, int reason) override;

    private:
        NimBlePlatform& owner_;
    };

    struct GattCall {
        std::function<PlatformStatus()> body;
        PlatformStatus result = PlatformStatus::Failed;
        std::atomic<bool> finished{false};
        SemaphoreHandle_t done = nullptr;

        ~GattCall() {
            if (done != nullptr) {
                vSemaphoreDelete(done);
            }
        }
    };

    static void gattTask(void* param);
    PlatformStatus runBounded(const char* what, uint32_t timeoutMs, std::function<PlatformStatus()> body);
    bool drainInFlight(uint32_t waitMs);

    PlatformStatus openWith(const NimBLEAdvertisedDevice* advertised, const NimBLEAddress& address, uint32_t timeoutMs);
    NimBLERemoteCharacteristic* characteristicFor(uint32_t handle);
    void routeNotification(uint32_t handle, const uint8_t* data, size_t len);

    ScanCallbacks scanCallbacks_;
    ClientCallbacks clientCallbacks_;

    mutable std::mutex mutex_;
    NimBLEClient* client_ = nullptr;
    std::string deviceName_;
    bool paramsUpdated_ = false;
    std::string scanFilter_;
    AdvertisementHandler advertisementHandler_;
    LinkLossHandler linkLossHandler_;
    std::map<uint64_t, uint8_t> seenAddressTypes_;
    std::map<uint64_t, std::string> seenNames_;
    std::map<uint32_t, NimBLERemoteCharacteristic*> characteristics_;
    std::map<uint32_t, NotificationHandler> notificationHandlers_;
    std::shared_ptr<GattCall> inFlight_;
};

}  // namespace pulsebridge::platform
