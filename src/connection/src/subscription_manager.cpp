#include "rfsync/connection/subscription_manager.h"
#include "rfsync/core/logging.h"

namespace rfsync {
namespace connection {

using core::LifecycleState;

SubscriptionManager::SubscriptionManager(std::shared_ptr<store::IDeviceRepository> devices,
                                         std::shared_ptr<vendor::VendorRegistry> registry,
                                         std::shared_ptr<store::IConnectionRepository> connections,
                                         std::shared_ptr<core::IScheduler> scheduler,
                                         RetryPolicy policy, std::set<std::string> streamingVendors,
                                         VendorRecordHandler onRecord)
    : devices_(std::move(devices)), registry_(std::move(registry)),
      connections_(std::move(connections)), scheduler_(std::move(scheduler)), policy_(policy),
      streamingVendors_(std::move(streamingVendors)), onRecord_(std::move(onRecord)) {}

SubscriptionManager::~SubscriptionManager() {
    stopAll();
}

bool SubscriptionManager::isStreamingVendor(const std::string& vendorCode) const {
    if (streamingVendors_.count(vendorCode) == 0) {
        return false;
    }
    auto adapter = registry_->get(vendorCode);
    return adapter && adapter->supportsStreaming();
}

bool SubscriptionManager::eligible(const core::DeviceRecord& device) const {
    return (device.status == LifecycleState::ONLINE || device.status == LifecycleState::DEGRADED) &&
           isStreamingVendor(device.vendorCode);
}

std::shared_ptr<ConnectionHealthMonitor>
SubscriptionManager::monitorFor(const core::DeviceRecord& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = monitors_.find(device.id);
    if (it != monitors_.end()) {
        return it->second;
    }

    StreamRecordHandler handler;
    if (onRecord_) {
        auto onRecord = onRecord_;
        std::string vendorCode = device.vendorCode;
        handler = [onRecord, vendorCode](const core::NormalizedRecord& record) {
            onRecord(vendorCode, record);
        };
    }

    auto monitor = std::make_shared<ConnectionHealthMonitor>(
        device.id, device.vendorId, registry_->get(device.vendorCode), connections_, scheduler_,
        policy_, handler);
    monitors_[device.id] = monitor;
    return monitor;
}

size_t SubscriptionManager::refresh(const std::vector<std::string>& deviceIds) {
    size_t started = 0;
    for (const auto& deviceId : deviceIds) {
        auto device = devices_->read(deviceId);
        if (!device) {
            continue;
        }
        if (eligible(*device)) {
            if (monitorFor(*device)->start()) {
                started++;
            }
        } else {
            stop(deviceId);
        }
    }
    return started;
}

bool SubscriptionManager::ensure(const std::string& deviceId) {
    auto device = devices_->read(deviceId);
    if (!device || !eligible(*device)) {
        return false;
    }
    monitorFor(*device)->start();
    return true;
}

bool SubscriptionManager::stop(const std::string& deviceId) {
    std::shared_ptr<ConnectionHealthMonitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = monitors_.find(deviceId);
        if (it == monitors_.end()) {
            return false;
        }
        monitor = it->second;
        monitors_.erase(it);
    }
    monitor->stop();
    return true;
}

bool SubscriptionManager::forceReconnect(const std::string& deviceId) {
    auto device = devices_->read(deviceId);
    if (!device || !isStreamingVendor(device->vendorCode)) {
        return false;
    }
    core::getLogger(core::loggers::CONNECTION)->info("Forced reconnect of {}", deviceId);
    monitorFor(*device)->restart();
    return true;
}

void SubscriptionManager::stopAll() {
    std::map<std::string, std::shared_ptr<ConnectionHealthMonitor>> monitors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitors.swap(monitors_);
    }
    for (auto& pair : monitors) {
        pair.second->stop();
    }
}

std::shared_ptr<ConnectionHealthMonitor>
SubscriptionManager::monitor(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = monitors_.find(deviceId);
    return it != monitors_.end() ? it->second : nullptr;
}

size_t SubscriptionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitors_.size();
}

} // namespace connection
} // namespace rfsync
