#pragma once

#include "rfsync/core/clock.h"
#include "rfsync/core/configuration.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace rfsync {
namespace polling {

/**
 * @brief Token bucket with continuous refill
 *
 * Safe for concurrent callers. Time comes from the injected clock's
 * monotonic source; waiting uses IClock::sleepFor.
 */
class TokenBucket {
public:
    TokenBucket(double capacity, double refillPerSecond, std::shared_ptr<core::IClock> clock);

    bool tryAcquire(double tokens = 1.0);

    /**
     * @brief Wait for tokens for at most timeout
     *
     * Gives up immediately if the tokens cannot accrue within the remaining
     * timeout.
     *
     * @return True if the tokens were taken
     */
    bool acquire(std::chrono::milliseconds timeout, double tokens = 1.0);

    double available() const;
    double capacity() const { return capacity_; }
    double refillPerSecond() const { return refillPerSecond_; }

private:
    void refillLocked() const;
    std::chrono::nanoseconds timeUntilLocked(double tokens) const;

    const double capacity_;
    const double refillPerSecond_;
    std::shared_ptr<core::IClock> clock_;

    mutable std::mutex mutex_;
    mutable double tokens_;
    mutable std::chrono::nanoseconds lastRefill_;
};

/**
 * @brief One token bucket per vendor
 *
 * Vendors without a configured bucket are not limited.
 */
class RateLimiterRegistry {
public:
    explicit RateLimiterRegistry(std::shared_ptr<core::IClock> clock);

    static std::shared_ptr<RateLimiterRegistry> fromConfig(const core::SyncConfig& config,
                                                           std::shared_ptr<core::IClock> clock);

    void configure(const std::string& vendorCode, double capacity, double refillPerSecond);
    std::shared_ptr<TokenBucket> bucket(const std::string& vendorCode) const;

    bool acquire(const std::string& vendorCode, std::chrono::milliseconds timeout);

    /**
     * @throws core::RateLimitExceeded if no token arrives within timeout
     */
    void acquireOrThrow(const std::string& vendorCode, std::chrono::milliseconds timeout);

private:
    std::shared_ptr<core::IClock> clock_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TokenBucket>> buckets_;
};

} // namespace polling
} // namespace rfsync
