#include "BleSession.h"

#include "RetryPolicy.h"
#include "system/Log.h"

#include <algorithm>
#include <cctype>

namespace pulsebridge {

using system::CancellationSource;
using system::CancellationToken;

namespace {

constexpr const char* kTag = "BLE";
constexpr uint32_t kScanPollSliceMs = 20;

ErrorKind kindFor(PlatformStatus status) {
    switch (status) {
        case PlatformStatus::Success:
            return ErrorKind::None;
        case PlatformStatus::NotFound:
        case PlatformStatus::Unsupported:
            return ErrorKind::NotFound;
        case PlatformStatus::AccessDenied:
            return ErrorKind::PermissionDenied;
        case PlatformStatus::Timeout:
        case PlatformStatus::Busy:
        case PlatformStatus::Disconnected:
        case PlatformStatus::Failed:
            break;
    }
    return ErrorKind::Transient;
}

BleStatus lockFailure(const CancellationToken& cancel, const char* what) {
    if (cancel.cancelled()) {
        return BleStatus::failure(ErrorKind::Cancelled, std::string(what) + " cancelled");
    }
    return BleStatus::failure(ErrorKind::Transient, std::string(what) + " lock busy");
}

bool startsWithIgnoreCase(const std::string& text, const std::string& prefix) {
    if (prefix.size() > text.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

uint32_t remainingMs(std::chrono::steady_clock::time_point deadline) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
        return 0;
    }
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
}

// Platform timeout for one call: the per-call cap, shortened to what is left of the deadline.
uint32_t boundedMs(std::chrono::steady_clock::time_point deadline, uint32_t capMs) {
    if (deadline == std::chrono::steady_clock::time_point::max()) {
        return capMs;
    }
    return std::min(capMs, remainingMs(deadline));
}

BleStatus attemptTimedOut(const char* step) {
    return BleStatus::failure(ErrorKind::Transient, std::string("attempt timed out before ") + step);
}

BleStatus cancelledDuring(const char* step) {
    return BleStatus::failure(ErrorKind::Cancelled, std::string(step) + " cancelled");
}

}  // namespace

BleStatus BleSession::RestoreWriter::write(const GattTarget& target, const uint8_t* data, size_t len, WriteMode mode) {
    return session_.gattWrite(target, data, len, mode, false, deadline_, cancel_);
}

BleSession::BleSession(BlePlatform& platform, const SessionConfig& config)
    : platform_(platform), config_(config) {
    platform_.setLinkLossHandler([this](int reason) { handleLinkLoss(reason); });
}

BleSession::~BleSession() {
    shutdown();
    platform_.setLinkLossHandler(nullptr);
}

// ---------------------------------------------------------------------------
// Scanning
// ---------------------------------------------------------------------------

BleStatus BleSession::scan(const ScanOptions& options, std::vector<DiscoveredDevice>& out,
                           const CancellationToken& cancel) {
    auto snapshot = [this](std::vector<DiscoveredDevice>& dest) {
        dest.clear();
        for (const auto& entry : discovered_) {
            dest.push_back(entry.second);
        }
    };

    CancellationSource stop;
    {
        auto connection = system::acquireWithin(connectionLock_, config_.lockWaitMs, cancel);
        if (!connection.owns_lock()) {
            std::lock_guard<std::mutex> lock(scanMutex_);
            if (scanning_) {
                snapshot(out);
                return BleStatus::success();
            }
            return lockFailure(cancel, "scan");
        }

        {
            std::lock_guard<std::mutex> lock(scanMutex_);
            if (scanning_) {
                PB_LOGD(kTag, "scan already running, returning %u results", static_cast<unsigned>(discovered_.size()));
                snapshot(out);
                return BleStatus::success();
            }
        }

        const AdapterStatus adapter = platform_.adapterStatus();
        if (!adapter.available) {
            return BleStatus::failure(ErrorKind::Unavailable, "no Bluetooth adapter");
        }
        if (!adapter.enabled) {
            return BleStatus::failure(ErrorKind::Unavailable, "Bluetooth adapter is off");
        }

        {
            std::lock_guard<std::mutex> lock(scanMutex_);
            scanning_ = true;
            scanPrefix_ = options.namePrefix;
            discovered_.clear();
            scanStop_ = stop;
        }

        const std::string filter = normalizeUuid(options.serviceFilter);
        const PlatformStatus started =
            platform_.startScan(filter, [this](const Advertisement& advertisement) { handleAdvertisement(advertisement); });
        if (started != PlatformStatus::Success) {
            std::lock_guard<std::mutex> lock(scanMutex_);
            scanning_ = false;
            return BleStatus::failure(kindFor(started), std::string("scan start failed: ") + platformStatusLabel(started));
        }
        PB_LOGI(kTag, "scanning for %u ms (prefix '%s')", static_cast<unsigned>(options.timeoutMs),
                options.namePrefix.c_str());
    }

    // The connection lock is released while the radio listens so connect() can interrupt.
    const auto deadline = Clock::now() + std::chrono::milliseconds(options.timeoutMs);
    const CancellationToken stopToken = stop.token();
    while (!cancel.cancelled() && !stopToken.cancelled()) {
        const uint32_t left = remainingMs(deadline);
        if (left == 0) {
            break;
        }
        stopToken.waitFor(std::min(left, kScanPollSliceMs));
    }
    platform_.stopScan();

    std::lock_guard<std::mutex> lock(scanMutex_);
    scanning_ = false;
    snapshot(out);
    PB_LOGI(kTag, "scan finished, %u device(s)", static_cast<unsigned>(out.size()));
    return BleStatus::success();
}

void BleSession::stopScan() {
    bool active = false;
    {
        std::lock_guard<std::mutex> lock(scanMutex_);
        active = scanning_;
        if (active) {
            scanStop_.cancel();
        }
    }
    if (active) {
        platform_.stopScan();
    }
}

void BleSession::handleAdvertisement(const Advertisement& advertisement) {
    DiscoveredDevice device;
    device.id = formatDeviceId(advertisement.address);
    device.macAddress = formatMacAddress(advertisement.address);
    device.name = advertisement.localName.empty() ? "Unknown (" + device.macAddress + ")" : advertisement.localName;
    device.rssi = advertisement.rssi;
    device.connectable = advertisement.connectable;
    for (const auto& service : advertisement.serviceIds) {
        device.serviceIds.push_back(normalizeUuid(service));
    }

    bool isNew = false;
    {
        std::lock_guard<std::mutex> lock(scanMutex_);
        if (!scanning_) {
            return;
        }
        if (!scanPrefix_.empty() && !startsWithIgnoreCase(advertisement.localName, scanPrefix_)) {
            return;
        }
        isNew = discovered_.find(device.id) == discovered_.end();
        discovered_[device.id] = device;
    }
    if (isNew) {
        PB_LOGD(kTag, "found %s (%s) rssi=%d", device.name.c_str(), device.macAddress.c_str(), device.rssi);
        discoveryObservers_.notify(device);
    }
}

// ---------------------------------------------------------------------------
// Connect / recover / disconnect
// ---------------------------------------------------------------------------

BleStatus BleSession::connect(const std::string& deviceId, const CancellationToken& cancel) {
    stopScan();
    lifecycleObservers_.notify(LifecycleEvent::ManualConnect);

    CancellationSource attempt(cancel);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (shutdown_) {
            return BleStatus::failure(ErrorKind::InvalidState, "session is shut down");
        }
        connectCancel_ = attempt;
    }

    const CancellationToken token = attempt.token();
    auto connection = system::acquireWithin(connectionLock_, config_.lockWaitMs, token);
    if (!connection.owns_lock()) {
        return lockFailure(token, "connect");
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        manualDisconnect_ = false;
        lastDeviceId_ = deviceId;
    }
    if (state() != ConnectionState::Disconnected) {
        PB_LOGI(kTag, "replacing existing session");
        teardownLocked();
    }
    return connectLocked(deviceId, token);
}

BleStatus BleSession::recover(const CancellationToken& cancel) {
    auto connection = system::acquireWithin(connectionLock_, config_.lockWaitMs, cancel);
    if (!connection.owns_lock()) {
        return lockFailure(cancel, "recovery");
    }
    std::string deviceId;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (manualDisconnect_ || shutdown_) {
            return BleStatus::failure(ErrorKind::Cancelled, "manual disconnect requested");
        }
        if (state_ == ConnectionState::Connected) {
            return BleStatus::success();
        }
        deviceId = lastDeviceId_;
    }
    if (deviceId.empty()) {
        return BleStatus::failure(ErrorKind::InvalidState, "no device to reconnect to");
    }
    return connectLocked(deviceId, cancel);
}

BleStatus BleSession::connectLocked(const std::string& deviceId, const CancellationToken& cancel) {
    const AdapterStatus adapter = platform_.adapterStatus();
    if (!adapter.available) {
        return BleStatus::failure(ErrorKind::Unavailable, "no Bluetooth adapter");
    }
    if (!adapter.enabled) {
        return BleStatus::failure(ErrorKind::Unavailable, "Bluetooth adapter is off");
    }
    const auto address = parseDeviceId(deviceId);
    if (!address) {
        return BleStatus::failure(ErrorKind::NotFound, "invalid device id '" + deviceId + "'");
    }

    // A lost link may still hold the platform device.
    releaseLink();
    setState(ConnectionState::Connecting);

    RetryBudget budget(config_.connectAttempts, config_.connectRetryDelayMs, config_.connectAttemptTimeoutMs);
    BleStatus last = BleStatus::failure(ErrorKind::Transient, "no attempt made");
    while (!budget.exhausted()) {
        if (budget.attemptsMade > 0) {
            const uint32_t delay = budget.linearDelayMs();
            PB_LOGI(kTag, "retrying connect in %u ms", static_cast<unsigned>(delay));
            if (cancel.waitFor(delay)) {
                last = BleStatus::failure(ErrorKind::Cancelled, "connect cancelled");
                break;
            }
        }
        const uint32_t attempt = budget.begin();
        if (cancel.cancelled()) {
            last = BleStatus::failure(ErrorKind::Cancelled, "connect cancelled");
            break;
        }

        PB_LOGI(kTag, "connecting to %s (attempt %u/%u)", deviceId.c_str(), static_cast<unsigned>(attempt),
                static_cast<unsigned>(budget.maxAttempts));
        const auto deadline = Clock::now() + std::chrono::milliseconds(budget.attemptTimeoutMs);
        BleStatus status = connectAttempt(*address, deadline, cancel);
        if (status.ok()) {
            status = restoreLocked(deadline, cancel);
        }
        if (status.ok()) {
            setState(ConnectionState::Connected);
            PB_LOGI(kTag, "connected to %s", deviceId.c_str());
            return status;
        }

        last = status;
        PB_LOGW(kTag, "connect attempt %u failed: %s", static_cast<unsigned>(attempt), status.describe().c_str());
        releaseLink();
        if (status.kind == ErrorKind::PermissionDenied || status.kind == ErrorKind::Unavailable ||
            status.kind == ErrorKind::Cancelled) {
            break;
        }
    }

    releaseLink();
    setState(ConnectionState::Disconnected);
    if (last.kind == ErrorKind::PermissionDenied || last.kind == ErrorKind::Unavailable ||
        last.kind == ErrorKind::Cancelled) {
        return last;
    }
    return BleStatus::failure(last.kind, "connect failed after " + std::to_string(budget.attemptsMade) +
                                             " attempt(s): " + last.detail);
}

PlatformStatus BleSession::openDevice(uint64_t address, const std::optional<DeviceRecord>& record,
                                      Clock::time_point deadline) {
    if (record) {
        const PlatformStatus opened = platform_.openByRecord(*record, remainingMs(deadline));
        if (opened != PlatformStatus::NotFound) {
            return opened;
        }
        PB_LOGW(kTag, "no handle from device record, trying address");
    }
    const uint32_t left = remainingMs(deadline);
    if (left == 0) {
        return PlatformStatus::Timeout;
    }
    return platform_.openByAddress(address, left);
}

BleStatus BleSession::connectAttempt(uint64_t address, Clock::time_point deadline, const CancellationToken& cancel) {
    const std::optional<DeviceRecord> record = platform_.findDeviceRecord(address);
    const PlatformStatus opened = openDevice(address, record, deadline);
    if (opened != PlatformStatus::Success) {
        return BleStatus::failure(kindFor(opened), std::string("device handle: ") + platformStatusLabel(opened));
    }

    if (record && !record->paired && record->canPair) {
        const uint32_t left = remainingMs(deadline);
        if (left == 0) {
            return attemptTimedOut("pairing");
        }
        const PlatformStatus paired = platform_.pair(std::min(config_.pairTimeoutMs, left));
        if (paired == PlatformStatus::Success) {
            PB_LOGI(kTag, "paired");
        } else {
            PB_LOGW(kTag, "pairing %s, continuing unpaired", platformStatusLabel(paired));
        }
        if (cancel.waitFor(boundedMs(deadline, config_.pairSettleMs))) {
            return BleStatus::failure(ErrorKind::Cancelled, "connect cancelled");
        }
    }

    const AccessStatus access = platform_.requestAccess();
    if (access == AccessStatus::DeniedByUser || access == AccessStatus::DeniedBySystem) {
        return BleStatus::failure(ErrorKind::PermissionDenied,
                                  access == AccessStatus::DeniedByUser ? "device access denied by user"
                                                                       : "device access denied by system");
    }
    if (cancel.waitFor(boundedMs(deadline, config_.accessSettleMs))) {
        return BleStatus::failure(ErrorKind::Cancelled, "connect cancelled");
    }

    std::vector<std::string> services;
    uint32_t left = remainingMs(deadline);
    if (left == 0) {
        return attemptTimedOut("service discovery");
    }
    PlatformStatus discovered = platform_.discoverServices(true, left, services);
    if (discovered != PlatformStatus::Success) {
        PB_LOGW(kTag, "uncached discovery %s, falling back to cache", platformStatusLabel(discovered));
        services.clear();
        left = remainingMs(deadline);
        if (left == 0) {
            return attemptTimedOut("cached service discovery");
        }
        discovered = platform_.discoverServices(false, left, services);
    }
    if (discovered != PlatformStatus::Success) {
        return BleStatus::failure(ErrorKind::Transient,
                                  std::string("service discovery failed: ") + platformStatusLabel(discovered));
    }

    for (auto& service : services) {
        service = normalizeUuid(service);
        if (!platform_.maintainConnection(service)) {
            PB_LOGD(kTag, "maintain-connection hint unsupported for %s", service.c_str());
        }
    }
    const std::string name = platform_.deviceName();

    std::lock_guard<std::mutex> lock(stateMutex_);
    services_ = std::move(services);
    deviceName_ = name;
    linkUp_ = true;
    return BleStatus::success();
}

BleStatus BleSession::restoreLocked(Clock::time_point deadline, const CancellationToken& cancel) {
    std::vector<GattTarget> intent;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        intent.assign(subscriptionIntent_.begin(), subscriptionIntent_.end());
    }
    for (const auto& target : intent) {
        if (cancel.cancelled()) {
            return BleStatus::failure(ErrorKind::Cancelled, "restore cancelled");
        }
        const BleStatus status = subscribeCore(target, false, deadline, cancel);
        if (status.kind == ErrorKind::Cancelled) {
            return status;
        }
        if (!status.ok()) {
            PB_LOGW(kTag, "could not restore subscription %s: %s", target.characteristicId.c_str(),
                    status.describe().c_str());
        }
    }

    std::vector<RestoreHook> hooks;
    {
        std::lock_guard<std::mutex> lock(hooksMutex_);
        for (const auto& entry : restoreHooks_) {
            hooks.push_back(entry.second);
        }
    }
    RestoreWriter writer(*this, deadline, cancel);
    for (const auto& hook : hooks) {
        const BleStatus status = hook(writer);
        if (!status.ok()) {
            return BleStatus::failure(status.kind, "restore hook: " + status.detail);
        }
    }
    return BleStatus::success();
}

void BleSession::disconnect() noexcept {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        manualDisconnect_ = true;
        connectCancel_.cancel();
    }
    lifecycleObservers_.notify(LifecycleEvent::ManualDisconnect);
    stopScan();

    auto connection = system::acquireWithin(connectionLock_, config_.connectAttemptTimeoutMs + config_.lockWaitMs, {});
    if (!connection.owns_lock()) {
        PB_LOGE(kTag, "connection lock still held, forcing teardown");
    }
    teardownLocked();
}

void BleSession::shutdown() noexcept {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        manualDisconnect_ = true;
        connectCancel_.cancel();
    }
    lifecycleObservers_.notify(LifecycleEvent::Shutdown);
    stopScan();

    auto connection = system::acquireWithin(connectionLock_, config_.connectAttemptTimeoutMs + config_.lockWaitMs, {});
    if (!connection.owns_lock()) {
        PB_LOGE(kTag, "connection lock still held at shutdown, forcing teardown");
    }
    teardownLocked();

    std::lock_guard<std::mutex> lock(stateMutex_);
    subscriptionIntent_.clear();
}

void BleSession::teardownLocked() noexcept {
    bool active = false;
    bool linkUp = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        linkUp = linkUp_;
        active = linkUp_ || state_ != ConnectionState::Disconnected;
    }
    if (!active) {
        releaseLink();
        return;
    }

    setState(ConnectionState::Disconnecting);
    {
        // Retry loops stop on a dead link. A call already inside the platform
        // returns within its GATT timeout, before the device is closed.
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            linkUp_ = false;
        }
        auto gatt = system::acquireWithin(gattLock_, config_.lockWaitMs + config_.gattTimeoutMs, {});
        if (!gatt.owns_lock()) {
            PB_LOGE(kTag, "GATT lock busy during teardown, continuing");
        }

        std::vector<GattTarget> live;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            live.assign(liveSubscriptions_.begin(), liveSubscriptions_.end());
        }
        for (const auto& target : live) {
            CharacteristicInfo info;
            if (!cache_.lookup(target, info)) {
                continue;
            }
            platform_.detachNotifications(info.handle);
            if (!linkUp) {
                continue;
            }
            const PlatformStatus cleared = platform_.writeCccd(info.handle, CccdValue::None, config_.gattTimeoutMs);
            if (cleared != PlatformStatus::Success) {
                PB_LOGW(kTag, "clearing notifications on %s: %s", target.characteristicId.c_str(),
                        platformStatusLabel(cleared));
            }
        }
        releaseLink();
    }
    setState(ConnectionState::Disconnected);
    PB_LOGI(kTag, "disconnected");
}

void BleSession::releaseLink() noexcept {
    cache_.invalidateAll();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        linkUp_ = false;
        liveSubscriptions_.clear();
        services_.clear();
        deviceName_.clear();
    }
    platform_.closeDevice();
}

void BleSession::handleLinkLoss(int reason) {
    bool wasConnected = false;
    bool unexpected = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!linkUp_) {
            return;
        }
        linkUp_ = false;
        wasConnected = state_ == ConnectionState::Connected;
        unexpected = wasConnected && !manualDisconnect_ && !shutdown_;
        liveSubscriptions_.clear();
        services_.clear();
    }
    cache_.invalidateAll();

    PB_LOGW(kTag, "link lost (reason %d)", reason);
    if (wasConnected) {
        setState(ConnectionState::Disconnected);
    }
    if (unexpected) {
        lifecycleObservers_.notify(LifecycleEvent::UnexpectedDisconnect);
    }
}

// ---------------------------------------------------------------------------
// GATT operations
// ---------------------------------------------------------------------------

bool BleSession::linkUsable(bool requireConnected) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!linkUp_) {
        return false;
    }
    return !requireConnected || state_ == ConnectionState::Connected;
}

BleStatus BleSession::resolveLocked(const GattTarget& target, CharacteristicInfo& info, uint32_t timeoutMs) {
    std::vector<std::string> services;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        services = services_;
    }
    const PlatformStatus status = cache_.resolve(
        target,
        [&](CharacteristicInfo& out) {
            if (std::find(services.begin(), services.end(), target.serviceId) == services.end()) {
                return PlatformStatus::NotFound;
            }
            return platform_.findCharacteristic(target, timeoutMs, out);
        },
        info);
    if (status == PlatformStatus::Success) {
        return BleStatus::success();
    }
    if (kindFor(status) == ErrorKind::NotFound) {
        return BleStatus::failure(ErrorKind::NotFound, "characteristic " + target.characteristicId + " not found");
    }
    return BleStatus::failure(kindFor(status),
                              "resolving " + target.characteristicId + ": " + platformStatusLabel(status));
}

BleStatus BleSession::subscribe(const GattTarget& target, const CancellationToken& cancel) {
    if (state() != ConnectionState::Connected) {
        return BleStatus::failure(ErrorKind::InvalidState, "subscribe requires a connected session");
    }
    return subscribeCore(target, true, Clock::time_point::max(), cancel);
}

BleStatus BleSession::subscribeCore(const GattTarget& target, bool requireConnected, Clock::time_point deadline,
                                    const CancellationToken& cancel) {
    auto gatt = system::acquireWithin(gattLock_, boundedMs(deadline, config_.lockWaitMs), cancel);
    if (!gatt.owns_lock()) {
        return lockFailure(cancel, "subscribe");
    }
    if (!linkUsable(requireConnected)) {
        return BleStatus::failure(ErrorKind::InvalidState, "link is not connected");
    }

    uint32_t callMs = boundedMs(deadline, config_.gattTimeoutMs);
    if (callMs == 0) {
        return attemptTimedOut("subscribing");
    }
    CharacteristicInfo info;
    const BleStatus resolved = resolveLocked(target, info, callMs);
    if (!resolved.ok()) {
        return resolved;
    }
    if (!info.canNotify() && !info.canIndicate()) {
        return BleStatus::failure(ErrorKind::NotFound,
                                  "characteristic " + target.characteristicId + " cannot notify or indicate");
    }

    const CccdValue value = info.canNotify() ? CccdValue::Notify : CccdValue::Indicate;
    RetryBudget budget(config_.subscribeAttempts, config_.retryDelayMs);
    PlatformStatus last = PlatformStatus::Failed;
    while (!budget.exhausted()) {
        const uint32_t attempt = budget.begin();
        callMs = boundedMs(deadline, config_.gattTimeoutMs);
        if (callMs == 0) {
            last = PlatformStatus::Timeout;
            break;
        }
        platform_.detachNotifications(info.handle);
        platform_.attachNotifications(info.handle, [this, target](const uint8_t* data, size_t len) {
            dataObservers_.notify(target, Bytes(data, data + len));
        });
        last = platform_.writeCccd(info.handle, value, callMs);
        if (last == PlatformStatus::Success) {
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                subscriptionIntent_.insert(target);
                liveSubscriptions_.insert(target);
            }
            PB_LOGI(kTag, "subscribed to %s", target.characteristicId.c_str());
            return BleStatus::success();
        }

        platform_.detachNotifications(info.handle);
        PB_LOGW(kTag, "subscribe %s attempt %u failed: %s", target.characteristicId.c_str(),
                static_cast<unsigned>(attempt), platformStatusLabel(last));
        if (last == PlatformStatus::Disconnected || !linkUsable(requireConnected)) {
            break;
        }
        if (!budget.exhausted() && cancel.waitFor(boundedMs(deadline, budget.fixedDelayMs()))) {
            return cancelledDuring("subscribe");
        }
    }
    return BleStatus::failure(ErrorKind::Transient, std::string("subscribe failed: ") + platformStatusLabel(last));
}

BleStatus BleSession::unsubscribe(const GattTarget& target) {
    if (state() != ConnectionState::Connected) {
        return BleStatus::failure(ErrorKind::InvalidState, "unsubscribe requires a connected session");
    }
    auto gatt = system::acquireWithin(gattLock_, config_.lockWaitMs, {});
    if (!gatt.owns_lock()) {
        return BleStatus::failure(ErrorKind::Transient, "GATT lock busy");
    }

    PlatformStatus cleared = PlatformStatus::Success;
    CharacteristicInfo info;
    if (cache_.lookup(target, info)) {
        platform_.detachNotifications(info.handle);
        cleared = platform_.writeCccd(info.handle, CccdValue::None, config_.gattTimeoutMs);
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        subscriptionIntent_.erase(target);
        liveSubscriptions_.erase(target);
    }
    if (cleared != PlatformStatus::Success) {
        return BleStatus::failure(ErrorKind::Transient,
                                  std::string("clearing notifications failed: ") + platformStatusLabel(cleared));
    }
    PB_LOGI(kTag, "unsubscribed from %s", target.characteristicId.c_str());
    return BleStatus::success();
}

BleStatus BleSession::write(const GattTarget& target, const uint8_t* data, size_t len, WriteMode mode,
                            const CancellationToken& cancel) {
    if (state() != ConnectionState::Connected) {
        return BleStatus::failure(ErrorKind::InvalidState, "write requires a connected session");
    }
    return gattWrite(target, data, len, mode, true, Clock::time_point::max(), cancel);
}

BleStatus BleSession::gattWrite(const GattTarget& target, const uint8_t* data, size_t len, WriteMode mode,
                                bool requireConnected, Clock::time_point deadline, const CancellationToken& cancel) {
    auto gatt = system::acquireWithin(gattLock_, boundedMs(deadline, config_.lockWaitMs), cancel);
    if (!gatt.owns_lock()) {
        return lockFailure(cancel, "write");
    }
    if (!linkUsable(requireConnected)) {
        return BleStatus::failure(ErrorKind::InvalidState, "link is not connected");
    }

    uint32_t callMs = boundedMs(deadline, config_.gattTimeoutMs);
    if (callMs == 0) {
        return attemptTimedOut("writing");
    }
    CharacteristicInfo info;
    const BleStatus resolved = resolveLocked(target, info, callMs);
    if (!resolved.ok()) {
        return resolved;
    }

    if (mode == WriteMode::WithoutResponse) {
        const PlatformStatus quick = platform_.write(info.handle, data, len, false, callMs);
        if (quick == PlatformStatus::Success) {
            return BleStatus::success();
        }
        PB_LOGD(kTag, "write without response %s, using acknowledged write", platformStatusLabel(quick));
    }

    RetryBudget budget(config_.writeAttempts, config_.retryDelayMs);
    PlatformStatus last = PlatformStatus::Failed;
    while (!budget.exhausted()) {
        const uint32_t attempt = budget.begin();
        callMs = boundedMs(deadline, config_.gattTimeoutMs);
        if (callMs == 0) {
            last = PlatformStatus::Timeout;
            break;
        }
        last = platform_.write(info.handle, data, len, true, callMs);
        if (last == PlatformStatus::Success) {
            return BleStatus::success();
        }
        PB_LOGW(kTag, "write attempt %u/%u failed: %s", static_cast<unsigned>(attempt),
                static_cast<unsigned>(budget.maxAttempts), platformStatusLabel(last));
        if (last == PlatformStatus::Disconnected || !linkUsable(requireConnected)) {
            break;
        }
        if (!budget.exhausted() && cancel.waitFor(boundedMs(deadline, budget.fixedDelayMs()))) {
            return cancelledDuring("write");
        }
    }
    return BleStatus::failure(ErrorKind::Transient, std::string("write failed: ") + platformStatusLabel(last));
}

BleStatus BleSession::read(const GattTarget& target, Bytes& out) {
    if (state() != ConnectionState::Connected) {
        return BleStatus::failure(ErrorKind::InvalidState, "read requires a connected session");
    }
    auto gatt = system::acquireWithin(gattLock_, config_.lockWaitMs, {});
    if (!gatt.owns_lock()) {
        return BleStatus::failure(ErrorKind::Transient, "GATT lock busy");
    }
    if (!linkUsable(true)) {
        return BleStatus::failure(ErrorKind::InvalidState, "link is not connected");
    }

    CharacteristicInfo info;
    const BleStatus resolved = resolveLocked(target, info, config_.gattTimeoutMs);
    if (!resolved.ok()) {
        return resolved;
    }
    const PlatformStatus status = platform_.read(info.handle, out, config_.gattTimeoutMs);
    if (status != PlatformStatus::Success) {
        return BleStatus::failure(kindFor(status), std::string("read failed: ") + platformStatusLabel(status));
    }
    return BleStatus::success();
}

// ---------------------------------------------------------------------------
// Hooks, state, accessors
// ---------------------------------------------------------------------------

system::ListenerId BleSession::addRestoreHook(RestoreHook hook) {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    const system::ListenerId id = ++nextHookId_;
    restoreHooks_.emplace_back(id, std::move(hook));
    return id;
}

void BleSession::removeRestoreHook(system::ListenerId id) {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    restoreHooks_.erase(std::remove_if(restoreHooks_.begin(), restoreHooks_.end(),
                                       [id](const std::pair<system::ListenerId, RestoreHook>& entry) {
                                           return entry.first == id;
                                       }),
                        restoreHooks_.end());
}

void BleSession::setState(ConnectionState next) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == next) {
            return;
        }
        state_ = next;
    }
    PB_LOGD(kTag, "state -> %s", connectionStateLabel(next));
    stateObservers_.notify(next);
}

ConnectionState BleSession::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

std::string BleSession::lastDeviceId() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastDeviceId_;
}

std::string BleSession::deviceName() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return deviceName_;
}

std::vector<GattTarget> BleSession::subscriptionIntent() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return std::vector<GattTarget>(subscriptionIntent_.begin(), subscriptionIntent_.end());
}

bool BleSession::scanning() const {
    std::lock_guard<std::mutex> lock(scanMutex_);
    return scanning_;
}

}  // namespace pulsebridge
