#pragma once

#include "BlePlatform.h"
#include "BleTypes.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pulsebridge::test {

// Scripted radio stack. Queued results are consumed one per call; an empty
// queue falls back to the default result.
class FakeBlePlatform : public BlePlatform {
public:
    struct WriteRecord {
        uint32_t handle = 0;
        Bytes data;
        bool withResponse = false;
    };

    struct CccdRecord {
        uint32_t handle = 0;
        CccdValue value = CccdValue::None;
    };

    FakeBlePlatform() = default;

    // --- scripting -----------------------------------------------------------

    void setAdapter(bool available, bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        adapter_.available = available;
        adapter_.enabled = enabled;
    }

    void setRecord(std::optional<DeviceRecord> record) {
        std::lock_guard<std::mutex> lock(mutex_);
        record_ = std::move(record);
    }

    void queueRecordOpen(PlatformStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        recordOpenResults_.push_back(status);
    }

    void queueAddressOpen(PlatformStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        addressOpenResults_.push_back(status);
    }

    void setDefaultOpen(PlatformStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultOpen_ = status;
    }

    void setPairResult(PlatformStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        pairResult_ = status;
    }

    void setAccess(AccessStatus access) {
        std::lock_guard<std::mutex> lock(mutex_);
        access_ = access;
    }

    void queueDiscovery(bool uncached, PlatformStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        (uncached ? uncachedDiscovery_ : cachedDiscovery_).push_back(status);
    }

    void addCharacteristic(const GattTarget& target, uint32_t handle, uint8_t properties) {
        std::lock_guard<std::mutex> lock(mutex_);
        characteristics_[target] = CharacteristicInfo{handle, properties};
        bool known = false;
        for (const auto& id : services_) {
            known = known || id == target.serviceId;
        }
        if (!known) {
            services_.push_back(target.serviceId);
        }
    }

    void queueCccd(PlatformStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        cccdResults_.push_back(status);
    }

    void queueWrite(PlatformStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        writeResults_.push_back(status);
    }

    void setDefaultWrite(PlatformStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultWrite_ = status;
    }

    void setWriteDelayMs(uint32_t ms) { writeDelayMs_ = ms; }

    // A Timeout result blocks for the whole timeout the caller passed in.
    void setStallOnTimeout(bool stall) { stallOnTimeout_ = stall; }

    void setReadValue(uint32_t handle, Bytes value) {
        std::lock_guard<std::mutex> lock(mutex_);
        readValues_[handle] = std::move(value);
    }

    void setAdvertisements(std::vector<Advertisement> advertisements) {
        std::lock_guard<std::mutex> lock(mutex_);
        advertisements_ = std::move(advertisements);
    }

    // --- injection -----------------------------------------------------------

    void advertise(const Advertisement& advertisement) {
        AdvertisementHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = scanHandler_;
        }
        if (handler) {
            handler(advertisement);
        }
    }

    void simulateLinkLoss(int reason = 0x08) {
        LinkLossHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connected_ = false;
            handler = linkLossHandler_;
        }
        if (handler) {
            handler(reason);
        }
    }

    void notify(uint32_t handle, const Bytes& data) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = handlers_.find(handle);
            if (it == handlers_.end()) {
                return;
            }
            handler = it->second;
        }
        handler(data.data(), data.size());
    }

    // --- inspection ----------------------------------------------------------

    int openCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return recordOpenCalls_ + addressOpenCalls_;
    }

    int recordOpenCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return recordOpenCalls_;
    }

    int addressOpenCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return addressOpenCalls_;
    }

    int pairCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pairCalls_;
    }

    int discoveryCalls(bool uncached) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uncached ? uncachedCalls_ : cachedCalls_;
    }

    int findCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return findCalls_;
    }

    std::vector<CccdRecord> cccdWrites() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cccdWrites_;
    }

    std::vector<WriteRecord> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    size_t handlerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

    bool hasHandler(uint32_t handle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.count(handle) != 0;
    }

    bool connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    bool scanning() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(scanHandler_);
    }

    bool overlapDetected() const { return overlap_.load(); }
    bool closedDuringWrite() const { return closedDuringWrite_.load(); }

    void clearLog() {
        std::lock_guard<std::mutex> lock(mutex_);
        writes_.clear();
        cccdWrites_.clear();
    }

    // --- BlePlatform -----------------------------------------------------------

    AdapterStatus adapterStatus() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return adapter_;
    }

    PlatformStatus startScan(const std::string& serviceFilter, AdvertisementHandler handler) override {
        (void)serviceFilter;
        std::vector<Advertisement> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            scanHandler_ = handler;
            pending = advertisements_;
        }
        for (const auto& advertisement : pending) {
            handler(advertisement);
        }
        return PlatformStatus::Success;
    }

    void stopScan() override {
        std::lock_guard<std::mutex> lock(mutex_);
        scanHandler_ = nullptr;
    }

    std::optional<DeviceRecord> findDeviceRecord(uint64_t address) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record_ && record_->address == address) {
            return record_;
        }
        return std::nullopt;
    }

    PlatformStatus openByRecord(const DeviceRecord& record, uint32_t timeoutMs) override {
        (void)record;
        PlatformStatus status = PlatformStatus::Failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++recordOpenCalls_;
            status = finishOpen(next(recordOpenResults_, defaultOpen_));
        }
        stall(status, timeoutMs);
        return status;
    }

    PlatformStatus openByAddress(uint64_t address, uint32_t timeoutMs) override {
        (void)address;
        PlatformStatus status = PlatformStatus::Failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++addressOpenCalls_;
            status = finishOpen(next(addressOpenResults_, defaultOpen_));
        }
        stall(status, timeoutMs);
        return status;
    }

    PlatformStatus pair(uint32_t timeoutMs) override {
        (void)timeoutMs;
        std::lock_guard<std::mutex> lock(mutex_);
        ++pairCalls_;
        return pairResult_;
    }

    AccessStatus requestAccess() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return access_;
    }

    PlatformStatus discoverServices(bool uncached, uint32_t timeoutMs, std::vector<std::string>& serviceIds) override {
        (void)timeoutMs;
        std::lock_guard<std::mutex> lock(mutex_);
        if (uncached) {
            ++uncachedCalls_;
        } else {
            ++cachedCalls_;
        }
        const PlatformStatus status = next(uncached ? uncachedDiscovery_ : cachedDiscovery_, PlatformStatus::Success);
        if (status == PlatformStatus::Success) {
            serviceIds = services_;
        }
        return status;
    }

    bool maintainConnection(const std::string& serviceId) override {
        (void)serviceId;
        return true;
    }

    PlatformStatus findCharacteristic(const GattTarget& target, uint32_t timeoutMs, CharacteristicInfo& out) override {
        (void)timeoutMs;
        std::lock_guard<std::mutex> lock(mutex_);
        ++findCalls_;
        if (!connected_) {
            return PlatformStatus::Disconnected;
        }
        const auto it = characteristics_.find(target);
        if (it == characteristics_.end()) {
            return PlatformStatus::NotFound;
        }
        out = it->second;
        return PlatformStatus::Success;
    }

    PlatformStatus writeCccd(uint32_t handle, CccdValue value, uint32_t timeoutMs) override {
        PlatformStatus status = PlatformStatus::Failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connected_) {
                return PlatformStatus::Disconnected;
            }
            status = next(cccdResults_, PlatformStatus::Success);
            if (status == PlatformStatus::Success) {
                cccdWrites_.push_back(CccdRecord{handle, value});
            }
        }
        stall(status, timeoutMs);
        return status;
    }

    void attachNotifications(uint32_t handle, NotificationHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[handle] = std::move(handler);
    }

    void detachNotifications(uint32_t handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(handle);
    }

    PlatformStatus write(uint32_t handle, const uint8_t* data, size_t len, bool withResponse,
                         uint32_t timeoutMs) override {
        if (inFlight_.exchange(true)) {
            overlap_.store(true);
        }
        if (writeDelayMs_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(writeDelayMs_.load()));
        }
        PlatformStatus status = PlatformStatus::Success;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connected_) {
                status = PlatformStatus::Disconnected;
            } else {
                status = next(writeResults_, defaultWrite_);
            }
            if (status == PlatformStatus::Success) {
                writes_.push_back(WriteRecord{handle, Bytes(data, data + len), withResponse});
            }
        }
        stall(status, timeoutMs);
        inFlight_.store(false);
        return status;
    }

    PlatformStatus read(uint32_t handle, Bytes& out, uint32_t timeoutMs) override {
        (void)timeoutMs;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return PlatformStatus::Disconnected;
        }
        const auto it = readValues_.find(handle);
        if (it == readValues_.end()) {
            return PlatformStatus::NotFound;
        }
        out = it->second;
        return PlatformStatus::Success;
    }

    std::string deviceName() const override { return "47L121000"; }

    void closeDevice() noexcept override {
        if (inFlight_.load()) {
            closedDuringWrite_.store(true);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
        handlers_.clear();
    }

    void setLinkLossHandler(LinkLossHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        linkLossHandler_ = std::move(handler);
    }

private:
    static PlatformStatus next(std::deque<PlatformStatus>& queue, PlatformStatus fallback) {
        if (queue.empty()) {
            return fallback;
        }
        const PlatformStatus status = queue.front();
        queue.pop_front();
        return status;
    }

    void stall(PlatformStatus status, uint32_t timeoutMs) const {
        if (status == PlatformStatus::Timeout && stallOnTimeout_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
        }
    }

    PlatformStatus finishOpen(PlatformStatus status) {
        if (status == PlatformStatus::Success) {
            connected_ = true;
        }
        return status;
    }

    mutable std::mutex mutex_;
    AdapterStatus adapter_{true, true, ""};
    std::optional<DeviceRecord> record_;
    std::deque<PlatformStatus> recordOpenResults_;
    std::deque<PlatformStatus> addressOpenResults_;
    PlatformStatus defaultOpen_ = PlatformStatus::Success;
    PlatformStatus pairResult_ = PlatformStatus::Success;
    AccessStatus access_ = AccessStatus::Allowed;
    std::deque<PlatformStatus> uncachedDiscovery_;
    std::deque<PlatformStatus> cachedDiscovery_;
    std::vector<std::string> services_;
    std::map<GattTarget, CharacteristicInfo> characteristics_;
    std::deque<PlatformStatus> cccdResults_;
    std::deque<PlatformStatus> writeResults_;
    PlatformStatus defaultWrite_ = PlatformStatus::Success;
    std::map<uint32_t, Bytes> readValues_;
    std::vector<Advertisement> advertisements_;

    AdvertisementHandler scanHandler_;
    LinkLossHandler linkLossHandler_;
    std::map<uint32_t, NotificationHandler> handlers_;
    bool connected_ = false;

    int recordOpenCalls_ = 0;
    int addressOpenCalls_ = 0;
    int pairCalls_ = 0;
    int uncachedCalls_ = 0;
    int cachedCalls_ = 0;
    int findCalls_ = 0;
    std::vector<CccdRecord> cccdWrites_;
    std::vector<WriteRecord> writes_;

    std::atomic<uint32_t> writeDelayMs_{0};
    std::atomic<bool> inFlight_{false};
    std::atomic<bool> overlap_{false};
    std::atomic<bool> closedDuringWrite_{false};
    std::atomic<bool> stallOnTimeout_{false};
};

}  // namespace pulsebridge::test
