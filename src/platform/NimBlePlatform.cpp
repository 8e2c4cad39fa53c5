#include "platform/NimBlePlatform.h"

#include "system/Log.h"

#include <Arduino.h>

#include <memory>
#include <utility>

namespace pulsebridge::platform {

namespace {

constexpr const char* kTag = "NIMBLE";
constexpr uint32_t kEncryptPollMs = 20;
constexpr uint32_t kGattTaskStack = 4096;
constexpr UBaseType_t kGattTaskPriority = 5;
// NimBLE gives up on an ATT request after 30 s.
constexpr uint32_t kDrainWaitMs = 31000;

// 15 ms .. 30 ms interval, no latency, 4 s supervision timeout (units of 1.25 ms and 10 ms).
constexpr uint16_t kMinInterval = 12;
constexpr uint16_t kMaxInterval = 24;
constexpr uint16_t kLatency = 0;
constexpr uint16_t kSupervisionTimeout = 400;

std::string uuidString(const NimBLEUUID& uuid) {
    NimBLEUUID full = uuid;
    return normalizeUuid(full.to128().toString());
}

uint8_t propertiesOf(const NimBLERemoteCharacteristic* characteristic) {
    uint8_t properties = 0;
    if (characteristic->canRead()) {
        properties |= CharProperty::Read;
    }
    if (characteristic->canWriteNoResponse()) {
        properties |= CharProperty::WriteNoResponse;
    }
    if (characteristic->canWrite()) {
        properties |= CharProperty::Write;
    }
    if (characteristic->canNotify()) {
        properties |= CharProperty::Notify;
    }
    if (characteristic->canIndicate()) {
        properties |= CharProperty::Indicate;
    }
    return properties;
}

}  // namespace

void NimBlePlatform::gattTask(void* param) {
    auto* holder = static_cast<std::shared_ptr<GattCall>*>(param);
    std::shared_ptr<GattCall> call = std::move(*holder);
    delete holder;

    call->result = call->body();
    call->finished.store(true);
    xSemaphoreGive(call->done);
    call.reset();
    vTaskDelete(nullptr);
}

PlatformStatus NimBlePlatform::runBounded(const char* what, uint32_t timeoutMs, std::function<PlatformStatus()> body) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_ && !inFlight_->finished.load()) {
            PB_LOGW(kTag, "%s refused, an earlier call is still running", what);
            return PlatformStatus::Busy;
        }
        inFlight_.reset();
    }
    if (timeoutMs == 0) {
        return PlatformStatus::Timeout;
    }

    auto call = std::make_shared<GattCall>();
    call->body = std::move(body);
    call->done = xSemaphoreCreateBinary();
    if (call->done == nullptr) {
        PB_LOGE(kTag, "%s: no memory for semaphore", what);
        return PlatformStatus::Failed;
    }
    auto* holder = new std::shared_ptr<GattCall>(call);
    if (xTaskCreate(gattTask, "gatt", kGattTaskStack, holder, kGattTaskPriority, nullptr) != pdPASS) {
        delete holder;
        PB_LOGE(kTag, "%s: task create failed", what);
        return PlatformStatus::Failed;
    }

    if (xSemaphoreTake(call->done, pdMS_TO_TICKS(timeoutMs)) == pdTRUE) {
        return call->result;
    }
    PB_LOGW(kTag, "%s timed out after %u ms", what, static_cast<unsigned>(timeoutMs));
    std::lock_guard<std::mutex> lock(mutex_);
    inFlight_ = call;
    return PlatformStatus::Timeout;
}

bool NimBlePlatform::drainInFlight(uint32_t waitMs) {
    std::shared_ptr<GattCall> call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        call = std::move(inFlight_);
    }
    if (!call || call->finished.load()) {
        return true;
    }
    if (xSemaphoreTake(call->done, pdMS_TO_TICKS(waitMs)) == pdTRUE) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    inFlight_ = call;
    return false;
}

void NimBlePlatform::ScanCallbacks::onResult(const NimBLEAdvertisedDevice* advertisedDevice) {
    Advertisement advertisement;
    advertisement.address = static_cast<uint64_t>(advertisedDevice->getAddress());
    advertisement.localName = advertisedDevice->getName();
    advertisement.rssi = advertisedDevice->getRSSI();
    advertisement.connectable = advertisedDevice->isConnectable();
    for (uint8_t i = 0; i < advertisedDevice->getServiceUUIDCount(); ++i) {
        advertisement.serviceIds.push_back(uuidString(advertisedDevice->getServiceUUID(i)));
    }

    AdvertisementHandler handler;
    {
        std::lock_guard<std::mutex> lock(owner_.mutex_);
        owner_.seenAddressTypes_[advertisement.address] = advertisedDevice->getAddressType();
        if (!advertisement.localName.empty()) {
            owner_.seenNames_[advertisement.address] = advertisement.localName;
        }
        if (!owner_.scanFilter_.empty()) {
            bool match = false;
            for (const auto& id : advertisement.serviceIds) {
                match = match || id == owner_.scanFilter_;
            }
            if (!match) {
                return;
            }
        }
        handler = owner_.advertisementHandler_;
    }
    if (handler) {
        handler(advertisement);
    }
}

void NimBlePlatform::ClientCallbacks::onDisconnect(NimBLEClient* client, int reason) {
    (void)client;
    PB_LOGW(kTag, "link lost (reason %d)", reason);
    LinkLossHandler handler;
    {
        std::lock_guard<std::mutex> lock(owner_.mutex_);
        handler = owner_.linkLossHandler_;
    }
    if (handler) {
        handler(reason);
    }
}

NimBlePlatform::NimBlePlatform() : scanCallbacks_(*this), clientCallbacks_(*this) {}

NimBlePlatform::~NimBlePlatform() {
    closeDevice();
}

AdapterStatus NimBlePlatform::adapterStatus() {
    AdapterStatus status;
    status.available = NimBLEDevice::isInitialized();
    status.enabled = status.available;
    if (!status.available) {
        status.detail = "NimBLE stack not initialised";
    }
    return status;
}

PlatformStatus NimBlePlatform::startScan(const std::string& serviceFilter, AdvertisementHandler handler) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scanFilter_ = normalizeUuid(serviceFilter);
        advertisementHandler_ = std::move(handler);
    }
    NimBLEScan* scan = NimBLEDevice::getScan();
    scan->setScanCallbacks(&scanCallbacks_, false);
    scan->setActiveScan(true);  // scan responses carry the local name
    scan->setDuplicateFilter(false);
    scan->clearResults();
    // Zero duration scans until stopScan().
    if (!scan->start(0, false, true)) {
        PB_LOGE(kTag, "scan start failed");
        return PlatformStatus::Failed;
    }
    return PlatformStatus::Success;
}

void NimBlePlatform::stopScan() {
    NimBLEDevice::getScan()->stop();
    std::lock_guard<std::mutex> lock(mutex_);
    advertisementHandler_ = nullptr;
}

std::optional<DeviceRecord> NimBlePlatform::findDeviceRecord(uint64_t address) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto type = seenAddressTypes_.find(address);
    if (type == seenAddressTypes_.end()) {
        return std::nullopt;
    }
    DeviceRecord record;
    record.address = address;
    record.addressType = type->second;
    const auto name = seenNames_.find(address);
    if (name != seenNames_.end()) {
        record.name = name->second;
    }
    record.paired = NimBLEDevice::isBonded(NimBLEAddress(address, record.addressType));
    return record;
}

PlatformStatus NimBlePlatform::openByRecord(const DeviceRecord& record, uint32_t timeoutMs) {
    const NimBLEAddress address(record.address, record.addressType);
    const NimBLEAdvertisedDevice* advertised = NimBLEDevice::getScan()->getResults().getDevice(address);
    const PlatformStatus status = openWith(advertised, address, timeoutMs);
    if (status == PlatformStatus::Success && !record.name.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (deviceName_.empty()) {
            deviceName_ = record.name;
        }
    }
    return status;
}

PlatformStatus NimBlePlatform::openByAddress(uint64_t address, uint32_t timeoutMs) {
    return openWith(nullptr, NimBLEAddress(address, BLE_ADDR_PUBLIC), timeoutMs);
}

PlatformStatus NimBlePlatform::openWith(const NimBLEAdvertisedDevice* advertised, const NimBLEAddress& address,
                                        uint32_t timeoutMs) {
    closeDevice();

    NimBLEClient* client = NimBLEDevice::createClient();
    if (client == nullptr) {
        PB_LOGE(kTag, "no free client slot");
        return PlatformStatus::Busy;
    }
    client->setClientCallbacks(&clientCallbacks_, false);
    client->setConnectTimeout(timeoutMs);

    const bool connected = advertised != nullptr ? client->connect(advertised, true) : client->connect(address, true);
    if (!connected) {
        const int error = client->getLastError();
        PB_LOGW(kTag, "connect to %s failed (error %d)", address.toString().c_str(), error);
        NimBLEDevice::deleteClient(client);
        return error == BLE_HS_ETIMEOUT ? PlatformStatus::Timeout : PlatformStatus::Failed;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    client_ = client;
    paramsUpdated_ = false;
    if (advertised != nullptr && advertised->haveName()) {
        deviceName_ = advertised->getName();
    }
    return PlatformStatus::Success;
}

PlatformStatus NimBlePlatform::pair(uint32_t timeoutMs) {
    NimBLEClient* client = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = client_;
    }
    if (client == nullptr || !client->isConnected()) {
        return PlatformStatus::Disconnected;
    }
    if (!client->secureConnection(true)) {
        return PlatformStatus::Failed;
    }
    const uint32_t start = millis();
    while (!client->getConnInfo().isEncrypted()) {
        if (!client->isConnected()) {
            return PlatformStatus::Disconnected;
        }
        if (millis() - start >= timeoutMs) {
            return PlatformStatus::Timeout;
        }
        delay(kEncryptPollMs);
    }
    return PlatformStatus::Success;
}

AccessStatus NimBlePlatform::requestAccess() {
    // The radio belongs to this firmware; there is no user consent layer.
    return AccessStatus::Allowed;
}

PlatformStatus NimBlePlatform::discoverServices(bool uncached, uint32_t timeoutMs, std::vector<std::string>& serviceIds) {
    NimBLEClient* client = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = client_;
    }
    if (client == nullptr || !client->isConnected()) {
        return PlatformStatus::Disconnected;
    }
    auto found = std::make_shared<std::vector<std::string>>();
    const PlatformStatus status = runBounded("discovery", timeoutMs, [client, uncached, found] {
        const auto& services = client->getServices(uncached);
        for (const NimBLERemoteService* service : services) {
            found->push_back(uuidString(service->getUUID()));
        }
        if (found->empty()) {
            return client->isConnected() ? PlatformStatus::Failed : PlatformStatus::Disconnected;
        }
        return PlatformStatus::Success;
    });
    if (status == PlatformStatus::Success) {
        serviceIds = *found;
    }
    return status;
}

bool NimBlePlatform::maintainConnection(const std::string& serviceId) {
    (void)serviceId;
    std::lock_guard<std::mutex> lock(mutex_);
    if (client_ == nullptr || paramsUpdated_) {
        return client_ != nullptr;
    }
    client_->updateConnParams(kMinInterval, kMaxInterval, kLatency, kSupervisionTimeout);
    paramsUpdated_ = true;
    return true;
}

PlatformStatus NimBlePlatform::findCharacteristic(const GattTarget& target, uint32_t timeoutMs, CharacteristicInfo& out) {
    NimBLEClient* client = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = client_;
    }
    if (client == nullptr || !client->isConnected()) {
        return PlatformStatus::Disconnected;
    }
    auto found = std::make_shared<NimBLERemoteCharacteristic*>(nullptr);
    const PlatformStatus status = runBounded("characteristic lookup", timeoutMs, [client, target, found] {
        // getService may run a discovery round trip when the cache is cold.
        NimBLERemoteService* service = client->getService(NimBLEUUID(target.serviceId));
        if (service == nullptr) {
            return PlatformStatus::NotFound;
        }
        *found = service->getCharacteristic(NimBLEUUID(target.characteristicId));
        return *found == nullptr ? PlatformStatus::NotFound : PlatformStatus::Success;
    });
    if (status != PlatformStatus::Success) {
        return status;
    }
    NimBLERemoteCharacteristic* characteristic = *found;
    out.handle = characteristic->getHandle();
    out.properties = propertiesOf(characteristic);
    std::lock_guard<std::mutex> lock(mutex_);
    if (client_ != client) {
        return PlatformStatus::Disconnected;
    }
    characteristics_[out.handle] = characteristic;
    return PlatformStatus::Success;
}

NimBLERemoteCharacteristic* NimBlePlatform::characteristicFor(uint32_t handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = characteristics_.find(handle);
    return it == characteristics_.end() ? nullptr : it->second;
}

PlatformStatus NimBlePlatform::writeCccd(uint32_t handle, CccdValue value, uint32_t timeoutMs) {
    NimBLERemoteCharacteristic* characteristic = characteristicFor(handle);
    if (characteristic == nullptr) {
        return PlatformStatus::NotFound;
    }
    return runBounded("cccd write", timeoutMs, [this, characteristic, handle, value] {
        bool ok = false;
        if (value == CccdValue::None) {
            ok = characteristic->unsubscribe(true);
        } else {
            ok = characteristic->subscribe(
                value == CccdValue::Notify,
                [this, handle](NimBLERemoteCharacteristic*, uint8_t* data, size_t len, bool) {
                    routeNotification(handle, data, len);
                },
                true);
        }
        if (ok) {
            return PlatformStatus::Success;
        }
        return characteristic->getClient()->isConnected() ? PlatformStatus::Failed : PlatformStatus::Disconnected;
    });
}

void NimBlePlatform::attachNotifications(uint32_t handle, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notificationHandlers_[handle] = std::move(handler);
}

void NimBlePlatform::detachNotifications(uint32_t handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    notificationHandlers_.erase(handle);
}

void NimBlePlatform::routeNotification(uint32_t handle, const uint8_t* data, size_t len) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = notificationHandlers_.find(handle);
        if (it == notificationHandlers_.end()) {
            return;
        }
        handler = it->second;
    }
    handler(data, len);
}

PlatformStatus NimBlePlatform::write(uint32_t handle, const uint8_t* data, size_t len, bool withResponse,
                                     uint32_t timeoutMs) {
    NimBLERemoteCharacteristic* characteristic = characteristicFor(handle);
    if (characteristic == nullptr) {
        return PlatformStatus::NotFound;
    }
    // The task may outlive this call, so it writes from its own copy.
    Bytes payload(data, data + len);
    return runBounded("write", timeoutMs, [characteristic, handle, withResponse, payload] {
        if (characteristic->writeValue(payload.data(), payload.size(), withResponse)) {
            return PlatformStatus::Success;
        }
        NimBLEClient* client = characteristic->getClient();
        if (!client->isConnected()) {
            return PlatformStatus::Disconnected;
        }
        const int error = client->getLastError();
        PB_LOGD(kTag, "write to handle %u failed (error %d)", static_cast<unsigned>(handle), error);
        return error == BLE_HS_ETIMEOUT ? PlatformStatus::Timeout : PlatformStatus::Failed;
    });
}

PlatformStatus NimBlePlatform::read(uint32_t handle, Bytes& out, uint32_t timeoutMs) {
    NimBLERemoteCharacteristic* characteristic = characteristicFor(handle);
    if (characteristic == nullptr) {
        return PlatformStatus::NotFound;
    }
    auto value = std::make_shared<Bytes>();
    const PlatformStatus status = runBounded("read", timeoutMs, [characteristic, value] {
        const NimBLEAttValue attr = characteristic->readValue();
        NimBLEClient* client = characteristic->getClient();
        if (!client->isConnected()) {
            return PlatformStatus::Disconnected;
        }
        if (client->getLastError() != 0) {
            return PlatformStatus::Failed;
        }
        value->assign(attr.data(), attr.data() + attr.size());
        return PlatformStatus::Success;
    });
    if (status == PlatformStatus::Success) {
        out = *value;
    }
    return status;
}

std::string NimBlePlatform::deviceName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deviceName_;
}

void NimBlePlatform::closeDevice() noexcept {
    NimBLEClient* client = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = client_;
        client_ = nullptr;
        characteristics_.clear();
        notificationHandlers_.clear();
        deviceName_.clear();
        paramsUpdated_ = false;
    }
    if (client == nullptr) {
        return;
    }
    if (client->isConnected()) {
        client->disconnect();
    }
    // A timed-out GATT call may still be using the client.
    if (!drainInFlight(kDrainWaitMs)) {
        PB_LOGE(kTag, "GATT call still running after disconnect, client not freed");
        return;
    }
    NimBLEDevice::deleteClient(client);
}

void NimBlePlatform::setLinkLossHandler(LinkLossHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    linkLossHandler_ = std::move(handler);
}

}  // namespace pulsebridge::platform
