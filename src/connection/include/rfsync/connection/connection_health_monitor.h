#pragma once

#include "rfsync/core/configuration.h"
#include "rfsync/core/scheduler.h"
#include "rfsync/core/types.h"
#include "rfsync/store/connection_repository.h"
#include "rfsync/vendor/vendor_adapter.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rfsync {
namespace connection {

/**
 * @brief Exponential reconnect backoff with a delay cap and attempt ceiling
 */
struct RetryPolicy {
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{60000};
    uint32_t maxAttempts = 5;

    static RetryPolicy fromConfig(const core::ConnectionRetryConfig& config);

    /**
     * @brief Delay before the given retry (1-based): base * 2^(retry-1), capped
     */
    std::chrono::milliseconds delayForRetry(uint32_t retry) const;
};

using StreamRecordHandler = std::function<void(const core::NormalizedRecord&)>;

/**
 * @brief Owns one streaming subscription for one device
 *
 * connecting -> connected on a successful handshake. A failed handshake or
 * an unexpected close moves to error and schedules a retry; once the retry
 * ceiling is reached the monitor parks in disconnected until restart().
 * stop() is valid in every state and cancels any pending retry.
 *
 * Handshakes run on the scheduler, never on the caller's thread. Must be
 * owned by a std::shared_ptr.
 */
class ConnectionHealthMonitor : public std::enable_shared_from_this<ConnectionHealthMonitor> {
public:
    ConnectionHealthMonitor(std::string deviceId, std::string vendorId,
                            std::shared_ptr<vendor::IVendorAdapter> adapter,
                            std::shared_ptr<store::IConnectionRepository> connections,
                            std::shared_ptr<core::IScheduler> scheduler, RetryPolicy policy,
                            StreamRecordHandler onRecord = nullptr,
                            std::string subscription = "stream");
    ~ConnectionHealthMonitor();

    ConnectionHealthMonitor(const ConnectionHealthMonitor&) = delete;
    ConnectionHealthMonitor& operator=(const ConnectionHealthMonitor&) = delete;

    /**
     * @brief Begin connecting; only valid from stopped
     * @return False if the monitor was not stopped
     */
    bool start();

    /**
     * @brief Close the subscription, cancel retries and reset counters
     */
    void stop();

    /**
     * @brief Reset counters and reconnect from any state
     */
    void restart();

    core::ConnectionState state() const;
    core::ConnectionRecord record() const;
    uint32_t retryCount() const;
    std::vector<std::chrono::milliseconds> retryDelays() const;

    const std::string& deviceId() const { return deviceId_; }
    const std::string& vendorCode() const { return vendorCode_; }

private:
    void scheduleAttemptLocked(std::chrono::milliseconds delay);
    void attempt(uint64_t generation);
    void handleFailure(uint64_t generation, const std::string& error);
    void handleMessage(uint64_t generation, const core::NormalizedRecord& record);
    void persistLocked();

    std::string deviceId_;
    std::string vendorId_;
    std::string vendorCode_;
    std::shared_ptr<vendor::IVendorAdapter> adapter_;
    std::shared_ptr<store::IConnectionRepository> connections_;
    std::shared_ptr<core::IScheduler> scheduler_;
    RetryPolicy policy_;
    StreamRecordHandler onRecord_;

    mutable std::mutex mutex_;
    core::ConnectionRecord record_;
    uint64_t generation_ = 0;
    std::optional<core::TaskId> pendingTask_;
    std::unique_ptr<vendor::IStreamSubscription> subscription_;
    std::vector<std::chrono::milliseconds> retryDelays_;
};

} // namespace connection
} // namespace rfsync
