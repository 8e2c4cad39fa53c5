#include "RecoverySupervisor.h"

#include "RetryPolicy.h"
#include "system/Log.h"

#include <utility>

namespace pulsebridge {

namespace {
constexpr const char* kTag = "RECOVER";
}

RecoverySupervisor::RecoverySupervisor(BleSession& session, const RecoveryConfig& config)
    : session_(session), config_(config) {
    lifecycleListener_ = session_.lifecycle().add([this](LifecycleEvent event) {
        if (event == LifecycleEvent::UnexpectedDisconnect) {
            start();
        } else {
            cancel();
        }
    });
}

RecoverySupervisor::~RecoverySupervisor() {
    session_.lifecycle().remove(lifecycleListener_);
    cancel();
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(threadMutex_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

bool RecoverySupervisor::start() {
    bool expected = false;
    if (!recovering_.compare_exchange_strong(expected, true)) {
        PB_LOGD(kTag, "episode already running");
        return false;
    }

    std::lock_guard<std::mutex> lock(threadMutex_);
    if (worker_.joinable()) {
        // The previous episode cleared the flag on its way out.
        worker_.join();
    }
    cancel_ = system::CancellationSource();
    ++episodes_;
    worker_ = std::thread(&RecoverySupervisor::runEpisode, this, cancel_.token());
    return true;
}

void RecoverySupervisor::cancel() noexcept {
    std::lock_guard<std::mutex> lock(threadMutex_);
    cancel_.cancel();
}

void RecoverySupervisor::runEpisode(system::CancellationToken token) {
    PB_LOGW(kTag, "link dropped, starting recovery");
    RetryBudget budget(config_.attempts, config_.baseDelayMs);
    bool recovered = false;
    while (!budget.exhausted()) {
        const uint32_t attempt = budget.begin();
        if (token.waitFor(budget.linearDelayMs())) {
            break;
        }
        const BleStatus status = session_.recover(token);
        if (status.ok()) {
            PB_LOGI(kTag, "recovered on attempt %u", static_cast<unsigned>(attempt));
            recovered = true;
            break;
        }
        if (status.kind == ErrorKind::Cancelled || status.kind == ErrorKind::PermissionDenied) {
            PB_LOGI(kTag, "recovery stopped: %s", status.describe().c_str());
            break;
        }
        PB_LOGW(kTag, "recovery attempt %u/%u failed: %s", static_cast<unsigned>(attempt),
                static_cast<unsigned>(budget.maxAttempts), status.describe().c_str());
    }
    if (!recovered && !token.cancelled() && budget.exhausted()) {
        PB_LOGE(kTag, "recovery gave up after %u attempts", static_cast<unsigned>(budget.attemptsMade));
    }
    recovering_.store(false);
}

}  // namespace pulsebridge
