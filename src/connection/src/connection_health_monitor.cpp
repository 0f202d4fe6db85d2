#include "rfsync/connection/connection_health_monitor.h"
#include "rfsync/core/logging.h"

#include <algorithm>

namespace rfsync {
namespace connection {

using core::ConnectionState;

RetryPolicy RetryPolicy::fromConfig(const core::ConnectionRetryConfig& config) {
    RetryPolicy policy;
    policy.baseDelay = config.baseRetryDelay;
    policy.maxDelay = config.maxRetryDelay;
    policy.maxAttempts = config.maxRetryAttempts;
    return policy;
}

std::chrono::milliseconds RetryPolicy::delayForRetry(uint32_t retry) const {
    std::chrono::milliseconds delay = baseDelay;
    for (uint32_t i = 1; i < retry && delay < maxDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, maxDelay);
}

ConnectionHealthMonitor::ConnectionHealthMonitor(
    std::string deviceId, std::string vendorId, std::shared_ptr<vendor::IVendorAdapter> adapter,
    std::shared_ptr<store::IConnectionRepository> connections,
    std::shared_ptr<core::IScheduler> scheduler, RetryPolicy policy, StreamRecordHandler onRecord,
    std::string subscription)
    : deviceId_(std::move(deviceId)), vendorId_(std::move(vendorId)),
      vendorCode_(adapter ? adapter->vendorCode() : std::string()), adapter_(std::move(adapter)),
      connections_(std::move(connections)), scheduler_(std::move(scheduler)), policy_(policy),
      onRecord_(std::move(onRecord)) {
    record_.deviceId = deviceId_;
    record_.vendorCode = vendorCode_;
    record_.subscription = std::move(subscription);
    record_.state = ConnectionState::STOPPED;
    std::lock_guard<std::mutex> lock(mutex_);
    persistLocked();
}

ConnectionHealthMonitor::~ConnectionHealthMonitor() {
    std::unique_ptr<vendor::IStreamSubscription> subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pendingTask_) {
            scheduler_->cancel(*pendingTask_);
        }
        subscription = std::move(subscription_);
    }
    if (subscription) {
        subscription->close();
    }
}

bool ConnectionHealthMonitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (record_.state != ConnectionState::STOPPED) {
        return false;
    }

    generation_++;
    record_.state = ConnectionState::CONNECTING;
    record_.retryCount = 0;
    record_.errorCount = 0;
    record_.nextRetryAt.reset();
    retryDelays_.clear();
    persistLocked();
    scheduleAttemptLocked(std::chrono::milliseconds(0));

    core::getLogger(core::loggers::CONNECTION)
        ->debug("Connecting {} stream for {}", vendorCode_, deviceId_);
    return true;
}

void ConnectionHealthMonitor::stop() {
    std::unique_ptr<vendor::IStreamSubscription> subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation_++;
        if (pendingTask_) {
            scheduler_->cancel(*pendingTask_);
            pendingTask_.reset();
        }
        subscription = std::move(subscription_);

        if (record_.state == ConnectionState::CONNECTED) {
            record_.disconnectedAt = scheduler_->clock()->now();
        }
        record_.state = ConnectionState::STOPPED;
        record_.retryCount = 0;
        record_.errorCount = 0;
        record_.nextRetryAt.reset();
        retryDelays_.clear();
        persistLocked();
    }

    if (subscription) {
        subscription->close();
    }
    core::getLogger(core::loggers::CONNECTION)->debug("Stopped stream for {}", deviceId_);
}

void ConnectionHealthMonitor::restart() {
    core::getLogger(core::loggers::CONNECTION)->info("Restarting stream for {}", deviceId_);
    stop();
    start();
}

ConnectionState ConnectionHealthMonitor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.state;
}

core::ConnectionRecord ConnectionHealthMonitor::record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

uint32_t ConnectionHealthMonitor::retryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.retryCount;
}

std::vector<std::chrono::milliseconds> ConnectionHealthMonitor::retryDelays() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retryDelays_;
}

void ConnectionHealthMonitor::scheduleAttemptLocked(std::chrono::milliseconds delay) {
    std::weak_ptr<ConnectionHealthMonitor> weak = weak_from_this();
    uint64_t generation = generation_;
    pendingTask_ = scheduler_->scheduleAfter(delay, [weak, generation]() {
        if (auto self = weak.lock()) {
            self->attempt(generation);
        }
    });
}

void ConnectionHealthMonitor::attempt(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || record_.state == ConnectionState::STOPPED) {
            return;
        }
        pendingTask_.reset();
        record_.state = ConnectionState::CONNECTING;
        persistLocked();
    }

    std::weak_ptr<ConnectionHealthMonitor> weak = weak_from_this();
    vendor::StreamHandlers handlers;
    handlers.onRecord = [weak, generation](const core::NormalizedRecord& record) {
        if (auto self = weak.lock()) {
            self->handleMessage(generation, record);
        }
    };
    handlers.onClosed = [weak, generation](const std::string& reason) {
        if (auto self = weak.lock()) {
            self->handleFailure(generation, "stream closed: " + reason);
        }
    };

    std::unique_ptr<vendor::IStreamSubscription> subscription;
    try {
        subscription = adapter_->subscribe(vendorId_, handlers);
    } catch (const std::exception& e) {
        handleFailure(generation, e.what());
        return;
    }
    if (!subscription) {
        handleFailure(generation, "adapter returned no subscription");
        return;
    }

    std::unique_ptr<vendor::IStreamSubscription> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || record_.state == ConnectionState::STOPPED) {
            stale = std::move(subscription);
        } else {
            subscription_ = std::move(subscription);
            record_.state = ConnectionState::CONNECTED;
            record_.connectedAt = scheduler_->clock()->now();
            record_.retryCount = 0;
            record_.nextRetryAt.reset();
            record_.lastError.clear();
            persistLocked();
        }
    }

    if (stale) {
        stale->close();
        return;
    }
    core::getLogger(core::loggers::CONNECTION)
        ->info("{} stream connected for {}", vendorCode_, deviceId_);
}

void ConnectionHealthMonitor::handleFailure(uint64_t generation, const std::string& error) {
    auto logger = core::getLogger(core::loggers::CONNECTION);
    std::unique_ptr<vendor::IStreamSubscription> dead;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || record_.state == ConnectionState::STOPPED ||
            record_.state == ConnectionState::DISCONNECTED) {
            return;
        }

        // Invalidate the failed attempt; late callbacks from it are ignored
        generation_++;
        dead = std::move(subscription_);

        auto now = scheduler_->clock()->now();
        record_.state = ConnectionState::ERROR;
        record_.errorCount++;
        record_.lastError = error;
        record_.disconnectedAt = now;

        if (record_.retryCount >= policy_.maxAttempts) {
            record_.state = ConnectionState::DISCONNECTED;
            record_.nextRetryAt.reset();
            persistLocked();
            logger->warn("{} stream for {} disconnected after {} retries: {}", vendorCode_, deviceId_,
                         record_.retryCount, error);
        } else {
            record_.retryCount++;
            auto delay = policy_.delayForRetry(record_.retryCount);
            retryDelays_.push_back(delay);
            record_.nextRetryAt = now + delay;
            persistLocked();
            scheduleAttemptLocked(delay);
            logger->warn("{} stream for {} failed ({}), retry {}/{} in {} ms", vendorCode_, deviceId_,
                         error, record_.retryCount, policy_.maxAttempts, delay.count());
        }
    }

    if (dead) {
        dead->close();
    }
}

void ConnectionHealthMonitor::handleMessage(uint64_t generation,
                                            const core::NormalizedRecord& record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || (record_.state != ConnectionState::CONNECTED&&
                                          record_.state != ConnectionState::CONNECTING)) {
            return;
        }
        record_.lastMessageAt = scheduler_->clock()->now();
        persistLocked();
    }

    if (onRecord_) {
        try {
            onRecord_(record);
        } catch (const std::exception& e) {
            core::getLogger(core::loggers::CONNECTION)
                ->error("Stream record handler failed for {}: {}", deviceId_, e.what());
        }
    }
}

void ConnectionHealthMonitor::persistLocked() {
    if (connections_) {
        connections_->upsert(record_);
    }
}

} // namespace connection
} // namespace rfsync
