#include "rfsync/polling/polling_orchestrator.h"
#include "rfsync/core/logging.h"

#include <algorithm>
#include <future>
#include <thread>

namespace rfsync {
namespace polling {

using std::chrono::milliseconds;

namespace {

json optionalTimestamp(const std::optional<core::Timestamp>& timestamp) {
    return timestamp ? json(core::formatIsoTimestamp(*timestamp)) : json(nullptr);
}

} // namespace

json VendorPollStatus::toJson() const {
    json j;
    j["vendorCode"] = vendorCode;
    j["cyclesRun"] = cyclesRun;
    j["successes"] = successes;
    j["failures"] = failures;
    j["deferred"] = deferred;
    j["consecutiveFailures"] = consecutiveFailures;
    j["unavailable"] = unavailable;
    j["lastAttempt"] = optionalTimestamp(lastAttempt);
    j["lastSuccess"] = optionalTimestamp(lastSuccess);
    j["nextPollAt"] = optionalTimestamp(nextPollAt);
    j["lastError"] = lastError;
    j["lastFailureKind"] =
        lastFailureKind ? json(core::vendorFailureKindToString(*lastFailureKind)) : json(nullptr);
    j["lastDeviceCount"] = lastDeviceCount;
    j["lastHealth"] = lastHealth ? lastHealth->toJson() : json(nullptr);
    return j;
}

std::string cycleOutcomeToString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::SUCCESS:
            return "success";
        case CycleOutcome::FAILED:
            return "failed";
        case CycleOutcome::DEFERRED:
            return "deferred";
        default:
            return "unknown";
    }
}

PollingOrchestrator::PollingOrchestrator(
    std::shared_ptr<const core::SyncConfig> config,
    std::shared_ptr<vendor::VendorRegistry> registry,
    std::shared_ptr<sync::SyncCoordinator> coordinator,
    std::shared_ptr<sync::DeviceLifecycleManager> lifecycle,
    std::shared_ptr<RateLimiterRegistry> limiters, std::shared_ptr<sync::EventEmitter> emitter,
    std::shared_ptr<core::IScheduler> scheduler,
    std::shared_ptr<connection::SubscriptionManager> subscriptions)
    : config_(std::move(config)), registry_(std::move(registry)),
      coordinator_(std::move(coordinator)), lifecycle_(std::move(lifecycle)),
      limiters_(std::move(limiters)), emitter_(std::move(emitter)),
      scheduler_(std::move(scheduler)), subscriptions_(std::move(subscriptions)) {
    for (const auto& code : registry_->vendorCodes()) {
        statuses_[code].vendorCode = code;
    }
}

PollingOrchestrator::~PollingOrchestrator() {
    stop();
}

void PollingOrchestrator::start() {
    if (running_.exchange(true)) {
        return;
    }

    auto logger = core::getLogger(core::loggers::POLLING);
    for (const auto& code : registry_->vendorCodes()) {
        scheduleCycle(code, milliseconds(0));
    }
    scheduleSweep(std::chrono::duration_cast<milliseconds>(config_->health.sweepInterval));
    logger->info("Polling started for {} vendors", registry_->size());
}

void PollingOrchestrator::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& pair : cycleTasks_) {
        scheduler_->cancel(pair.second);
    }
    cycleTasks_.clear();
    if (sweepTask_) {
        scheduler_->cancel(*sweepTask_);
        sweepTask_.reset();
    }
    core::getLogger(core::loggers::POLLING)->info("Polling stopped");
}

core::VendorConfig PollingOrchestrator::vendorConfig(const std::string& vendorCode) const {
    if (const auto* config = config_->findVendor(vendorCode)) {
        return *config;
    }
    core::VendorConfig defaults;
    defaults.code = vendorCode;
    return defaults;
}

milliseconds PollingOrchestrator::backoffDelay(const core::VendorConfig& config,
                                               uint32_t consecutiveFailures) {
    const milliseconds interval = std::chrono::duration_cast<milliseconds>(config.pollInterval);
    const milliseconds cap =
        std::max(interval, std::chrono::duration_cast<milliseconds>(config.failureBackoffMax));
    milliseconds delay = interval;
    for (uint32_t i = 0; i < consecutiveFailures && delay < cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap);
}

CycleReport PollingOrchestrator::runCycle(const std::string& vendorCode) {
    auto logger = core::getLogger(core::loggers::POLLING);
    const core::VendorConfig config = vendorConfig(vendorCode);
    const auto interval = std::chrono::duration_cast<milliseconds>(config.pollInterval);

    CycleReport report;
    report.vendorCode = vendorCode;
    report.nextDelay = interval;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& status = statuses_[vendorCode];
        status.vendorCode = vendorCode;
        status.cyclesRun++;
        status.lastAttempt = scheduler_->clock()->now();
    }

    auto adapter = registry_->get(vendorCode);
    if (!adapter) {
        report.outcome = CycleOutcome::FAILED;
        report.error = "No adapter registered";
        recordFailure(config, report.error, core::VendorFailureKind::SERVER);
    } else if (!limiters_->acquire(vendorCode, config.rateLimitWaitTimeout)) {
        report.outcome = CycleOutcome::DEFERRED;
        logger->debug("{} poll deferred by rate limiter", vendorCode);
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_[vendorCode].deferred++;
    } else {
        try {
            auto records =
                fetchWithDeadline(adapter, std::chrono::duration_cast<milliseconds>(config.pollDeadline));
            report.batch = coordinator_->applyInbound(vendorCode, records);
            if (subscriptions_) {
                subscriptions_->refresh(report.batch.deviceIds);
            }
            recordSuccess(vendorCode, records.size());
        } catch (const core::VendorUnavailableError& e) {
            report.outcome = CycleOutcome::FAILED;
            report.error = e.what();
            recordFailure(config, report.error, e.getKind());
        } catch (const std::exception& e) {
            report.outcome = CycleOutcome::FAILED;
            report.error = e.what();
            recordFailure(config, report.error, core::VendorFailureKind::SERVER);
        }
    }

    if (report.outcome == CycleOutcome::FAILED) {
        std::lock_guard<std::mutex> lock(mutex_);
        report.nextDelay = backoffDelay(config, statuses_[vendorCode].consecutiveFailures);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_[vendorCode].nextPollAt = scheduler_->clock()->now() + report.nextDelay;
    }
    return report;
}

std::vector<core::NormalizedRecord>
PollingOrchestrator::fetchWithDeadline(std::shared_ptr<vendor::IVendorAdapter> adapter,
                                       milliseconds deadline) {
    using Records = std::vector<core::NormalizedRecord>;
    auto promise = std::make_shared<std::promise<Records>>();
    auto future = promise->get_future();

    // Detached so an abandoned call cannot block this cycle; it owns the adapter
    std::thread([adapter, promise]() {
        try {
            promise->set_value(adapter->listDevices());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(deadline) != std::future_status::ready) {
        throw core::VendorUnavailableError(adapter->vendorCode(),
                                           "Poll deadline of " + std::to_string(deadline.count()) +
                                               " ms exceeded",
                                           core::VendorFailureKind::TIMEOUT);
    }
    return future.get();
}

void PollingOrchestrator::recordSuccess(const std::string& vendorCode, size_t deviceCount) {
    bool recovered = false;
    uint32_t streak = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& status = statuses_[vendorCode];
        recovered = status.unavailable;
        streak = status.consecutiveFailures;
        status.unavailable = false;
        status.consecutiveFailures = 0;
        status.successes++;
        status.lastSuccess = scheduler_->clock()->now();
        status.lastDeviceCount = deviceCount;
    }

    if (recovered) {
        core::getLogger(core::loggers::POLLING)
            ->info("Vendor {} recovered after {} failed cycles", vendorCode, streak);
        emitVendorEvent(core::SyncEventType::VENDOR_RECOVERED, vendorCode, "vendor recovered",
                        json{{"failedCycles", streak}});
    }
}

void PollingOrchestrator::recordFailure(const core::VendorConfig& config, const std::string& error,
                                        core::VendorFailureKind kind) {
    bool becameUnavailable = false;
    uint32_t streak = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& status = statuses_[config.code];
        status.failures++;
        status.consecutiveFailures++;
        status.lastError = error;
        status.lastFailureKind = kind;
        streak = status.consecutiveFailures;
        if (!status.unavailable && streak >= config.unavailableThreshold) {
            status.unavailable = true;
            becameUnavailable = true;
        }
    }

    core::getLogger(core::loggers::POLLING)
        ->warn("Vendor {} poll failed ({} consecutive): {}", config.code, streak, error);

    if (becameUnavailable) {
        emitVendorEvent(core::SyncEventType::VENDOR_UNAVAILABLE, config.code, error,
                        json{{"consecutiveFailures", streak},
                             {"kind", core::vendorFailureKindToString(kind)}});
    }
}

void PollingOrchestrator::emitVendorEvent(core::SyncEventType type, const std::string& vendorCode,
                                          const std::string& reason, const json& metadata) {
    core::SyncEvent event;
    event.type = type;
    event.vendorCode = vendorCode;
    event.reason = reason;
    event.source = core::EventSource::API;
    event.timestamp = scheduler_->clock()->now();
    event.metadata = metadata;
    emitter_->emit(event);
}

sync::HealthSweepSummary PollingOrchestrator::runHealthSweep() {
    return lifecycle_->bulkHealthCheck(config_->health.stalenessThreshold);
}

std::optional<vendor::VendorHealth> PollingOrchestrator::checkVendorHealth(const std::string& vendorCode) {
    auto adapter = registry_->get(vendorCode);
    if (!adapter) {
        return std::nullopt;
    }

    vendor::VendorHealth health = adapter->checkHealth();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& status = statuses_[vendorCode];
        status.vendorCode = vendorCode;
        status.lastHealth = health;
    }
    core::getLogger(core::loggers::POLLING)
        ->info("Vendor {} health: {} {}", vendorCode,
               vendor::vendorHealthStatusToString(health.status), health.detail);
    return health;
}

std::optional<VendorPollStatus> PollingOrchestrator::status(const std::string& vendorCode) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statuses_.find(vendorCode);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<VendorPollStatus> PollingOrchestrator::statuses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<VendorPollStatus> result;
    for (const auto& pair : statuses_) {
        result.push_back(pair.second);
    }
    return result;
}

void PollingOrchestrator::scheduleCycle(const std::string& vendorCode, milliseconds delay) {
    std::weak_ptr<PollingOrchestrator> weak = weak_from_this();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return;
    }
    cycleTasks_[vendorCode] = scheduler_->scheduleAfter(delay, [weak, vendorCode]() {
        auto self = weak.lock();
        if (!self || !self->running_) {
            return;
        }
        CycleReport report = self->runCycle(vendorCode);
        self->scheduleCycle(vendorCode, report.nextDelay);
    });
}

void PollingOrchestrator::scheduleSweep(milliseconds delay) {
    std::weak_ptr<PollingOrchestrator> weak = weak_from_this();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return;
    }
    sweepTask_ = scheduler_->scheduleAfter(delay, [weak]() {
        auto self = weak.lock();
        if (!self || !self->running_) {
            return;
        }
        try {
            self->runHealthSweep();
        } catch (const std::exception& e) {
            core::getLogger(core::loggers::POLLING)->error("Health sweep failed: {}", e.what());
        }
        self->scheduleSweep(
            std::chrono::duration_cast<milliseconds>(self->config_->health.sweepInterval));
    });
}

} // namespace polling
} // namespace rfsync
