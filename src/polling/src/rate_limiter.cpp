#include "rfsync/polling/rate_limiter.h"
#include "rfsync/core/errors.h"
#include "rfsync/core/logging.h"

#include <algorithm>
#include <cmath>

namespace rfsync {
namespace polling {

TokenBucket::TokenBucket(double capacity, double refillPerSecond,
                         std::shared_ptr<core::IClock> clock)
    : capacity_(capacity), refillPerSecond_(refillPerSecond), clock_(std::move(clock)),
      tokens_(capacity), lastRefill_(clock_->monotonic()) {
    if (capacity_ <= 0.0 || refillPerSecond_ <= 0.0) {
        throw core::ConfigurationError("Token bucket capacity and refill rate must be positive");
    }
}

void TokenBucket::refillLocked() const {
    auto now = clock_->monotonic();
    if (now > lastRefill_) {
        double elapsedSeconds = std::chrono::duration<double>(now - lastRefill_).count();
        tokens_ = std::min(capacity_, tokens_ + elapsedSeconds * refillPerSecond_);
        lastRefill_ = now;
    }
}

std::chrono::nanoseconds TokenBucket::timeUntilLocked(double tokens) const {
    double deficit = tokens - tokens_;
    if (deficit <= 0.0) {
        return std::chrono::nanoseconds(0);
    }
    double seconds = deficit / refillPerSecond_;
    return std::chrono::nanoseconds(static_cast<int64_t>(std::ceil(seconds * 1e9)));
}

bool TokenBucket::tryAcquire(double tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    refillLocked();
    if (tokens_ >= tokens) {
        tokens_ -= tokens;
        return true;
    }
    return false;
}

bool TokenBucket::acquire(std::chrono::milliseconds timeout, double tokens) {
    if (tokens > capacity_) {
        return false;
    }

    const auto deadline = clock_->monotonic() + timeout;
    while (true) {
        std::chrono::nanoseconds wait;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refillLocked();
            if (tokens_ >= tokens) {
                tokens_ -= tokens;
                return true;
            }
            wait = timeUntilLocked(tokens);
        }

        auto now = clock_->monotonic();
        if (now + wait > deadline) {
            return false;
        }
        clock_->sleepFor(wait);
    }
}

double TokenBucket::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    refillLocked();
    return tokens_;
}

RateLimiterRegistry::RateLimiterRegistry(std::shared_ptr<core::IClock> clock)
    : clock_(std::move(clock)) {}

std::shared_ptr<RateLimiterRegistry>
RateLimiterRegistry::fromConfig(const core::SyncConfig& config,
                                std::shared_ptr<core::IClock> clock) {
    auto registry = std::make_shared<RateLimiterRegistry>(std::move(clock));
    for (const auto& vendor : config.vendors) {
        registry->configure(vendor.code, vendor.rateLimitCapacity, vendor.rateLimitRefillPerSecond);
    }
    return registry;
}

void RateLimiterRegistry::configure(const std::string& vendorCode, double capacity,
                                    double refillPerSecond) {
    auto bucket = std::make_shared<TokenBucket>(capacity, refillPerSecond, clock_);
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_[vendorCode] = bucket;
}

std::shared_ptr<TokenBucket> RateLimiterRegistry::bucket(const std::string& vendorCode) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(vendorCode);
    return it != buckets_.end() ? it->second : nullptr;
}

bool RateLimiterRegistry::acquire(const std::string& vendorCode,
                                  std::chrono::milliseconds timeout) {
    auto limiter = bucket(vendorCode);
    if (!limiter) {
        return true;
    }
    bool granted = limiter->acquire(timeout);
    if (!granted) {
        core::getLogger(core::loggers::POLLING)
            ->debug("No rate limit token for {} within {} ms", vendorCode, timeout.count());
    }
    return granted;
}

void RateLimiterRegistry::acquireOrThrow(const std::string& vendorCode,
                                         std::chrono::milliseconds timeout) {
    if (!acquire(vendorCode, timeout)) {
        throw core::RateLimitExceeded(vendorCode);
    }
}

} // namespace polling
} // namespace rfsync
