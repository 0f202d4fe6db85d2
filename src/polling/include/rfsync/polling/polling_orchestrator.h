#pragma once

#include "rfsync/connection/subscription_manager.h"
#include "rfsync/core/configuration.h"
#include "rfsync/core/errors.h"
#include "rfsync/core/scheduler.h"
#include "rfsync/polling/rate_limiter.h"
#include "rfsync/sync/event_emitter.h"
#include "rfsync/sync/lifecycle_manager.h"
#include "rfsync/sync/sync_coordinator.h"
#include "rfsync/vendor/vendor_registry.h"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rfsync {
namespace polling {

using json = nlohmann::json;

/**
 * @brief Per vendor polling statistics
 */
struct VendorPollStatus {
    std::string vendorCode;
    uint64_t cyclesRun = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t deferred = 0;
    uint32_t consecutiveFailures = 0;
    bool unavailable = false;
    std::optional<core::Timestamp> lastAttempt;
    std::optional<core::Timestamp> lastSuccess;
    std::optional<core::Timestamp> nextPollAt;
    std::string lastError;
    std::optional<core::VendorFailureKind> lastFailureKind;
    size_t lastDeviceCount = 0;
    std::optional<vendor::VendorHealth> lastHealth;

    json toJson() const;
};

enum class CycleOutcome {
    SUCCESS,
    FAILED,
    DEFERRED // no rate limit token; retried next cycle
};

std::string cycleOutcomeToString(CycleOutcome outcome);

struct CycleReport {
    std::string vendorCode;
    CycleOutcome outcome = CycleOutcome::SUCCESS;
    sync::SyncBatchResult batch;
    std::string error;
    std::chrono::milliseconds nextDelay{0};
};

/**
 * @brief Runs one independent poll loop per vendor plus the health sweep
 *
 * Vendors never wait on each other: each loop is its own scheduler task
 * that reschedules itself once its cycle completes. A failing vendor backs
 * off exponentially up to failureBackoffMax; other vendors are unaffected.
 * Must be owned by a std::shared_ptr.
 */
class PollingOrchestrator : public std::enable_shared_from_this<PollingOrchestrator> {
public:
    PollingOrchestrator(std::shared_ptr<const core::SyncConfig> config,
                        std::shared_ptr<vendor::VendorRegistry> registry,
                        std::shared_ptr<sync::SyncCoordinator> coordinator,
                        std::shared_ptr<sync::DeviceLifecycleManager> lifecycle,
                        std::shared_ptr<RateLimiterRegistry> limiters,
                        std::shared_ptr<sync::EventEmitter> emitter,
                        std::shared_ptr<core::IScheduler> scheduler,
                        std::shared_ptr<connection::SubscriptionManager> subscriptions = nullptr);
    ~PollingOrchestrator();

    /**
     * @brief Schedule the first cycle of every registered vendor and the sweep
     */
    void start();
    void stop();
    bool isRunning() const { return running_; }

    /**
     * @brief Run one poll cycle for a vendor on the calling thread
     */
    CycleReport runCycle(const std::string& vendorCode);

    sync::HealthSweepSummary runHealthSweep();

    /**
     * @brief Query a vendor's health endpoint and record the result
     */
    std::optional<vendor::VendorHealth> checkVendorHealth(const std::string& vendorCode);

    std::optional<VendorPollStatus> status(const std::string& vendorCode) const;
    std::vector<VendorPollStatus> statuses() const;

    /**
     * @brief Delay before the next cycle after the given failure streak
     */
    static std::chrono::milliseconds backoffDelay(const core::VendorConfig& config,
                                                  uint32_t consecutiveFailures);

private:
    core::VendorConfig vendorConfig(const std::string& vendorCode) const;
    std::vector<core::NormalizedRecord> fetchWithDeadline(std::shared_ptr<vendor::IVendorAdapter> adapter,
                                                          std::chrono::milliseconds deadline);
    void recordSuccess(const std::string& vendorCode, size_t deviceCount);
    void recordFailure(const core::VendorConfig& config, const std::string& error,
                       core::VendorFailureKind kind);
    void scheduleCycle(const std::string& vendorCode, std::chrono::milliseconds delay);
    void scheduleSweep(std::chrono::milliseconds delay);
    void emitVendorEvent(core::SyncEventType type, const std::string& vendorCode,
                         const std::string& reason, const json& metadata);

    std::shared_ptr<const core::SyncConfig> config_;
    std::shared_ptr<vendor::VendorRegistry> registry_;
    std::shared_ptr<sync::SyncCoordinator> coordinator_;
    std::shared_ptr<sync::DeviceLifecycleManager> lifecycle_;
    std::shared_ptr<RateLimiterRegistry> limiters_;
    std::shared_ptr<sync::EventEmitter> emitter_;
    std::shared_ptr<core::IScheduler> scheduler_;
    std::shared_ptr<connection::SubscriptionManager> subscriptions_;

    std::atomic<bool> running_{false};
    mutable std::mutex mutex_;
    std::map<std::string, VendorPollStatus> statuses_;
    std::map<std::string, core::TaskId> cycleTasks_;
    std::optional<core::TaskId> sweepTask_;
};

} // namespace polling
} // namespace rfsync
