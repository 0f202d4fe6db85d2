#pragma once

#include "rfsync/connection/connection_health_monitor.h"
#include "rfsync/store/device_repository.h"
#include "rfsync/vendor/vendor_registry.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace rfsync {
namespace connection {

/**
 * @brief Receives records delivered over any device stream
 */
using VendorRecordHandler =
    std::function<void(const std::string& vendorCode, const core::NormalizedRecord& record)>;

/**
 * @brief Owns one ConnectionHealthMonitor per streaming device
 *
 * Devices that are online or degraded on a streaming-enabled vendor get a
 * monitor; devices that leave those states have theirs stopped. Monitors
 * parked in disconnected are left alone until forceReconnect().
 */
class SubscriptionManager {
public:
    SubscriptionManager(std::shared_ptr<store::IDeviceRepository> devices,
                        std::shared_ptr<vendor::VendorRegistry> registry,
                        std::shared_ptr<store::IConnectionRepository> connections,
                        std::shared_ptr<core::IScheduler> scheduler, RetryPolicy policy,
                        std::set<std::string> streamingVendors,
                        VendorRecordHandler onRecord = nullptr);
    ~SubscriptionManager();

    /**
     * @brief Start or stop monitors to match the devices' current states
     * @return Number of monitors started
     */
    size_t refresh(const std::vector<std::string>& deviceIds);

    /**
     * @brief Make sure a monitor exists and is running for the device
     * @return False if the device is not eligible for streaming
     */
    bool ensure(const std::string& deviceId);

    bool stop(const std::string& deviceId);

    /**
     * @brief Administrative reconnect: reset counters and reconnect now
     * @return False if the device cannot stream
     */
    bool forceReconnect(const std::string& deviceId);

    void stopAll();

    std::shared_ptr<ConnectionHealthMonitor> monitor(const std::string& deviceId) const;
    size_t size() const;
    bool isStreamingVendor(const std::string& vendorCode) const;

private:
    std::shared_ptr<ConnectionHealthMonitor> monitorFor(const core::DeviceRecord& device);
    bool eligible(const core::DeviceRecord& device) const;

    std::shared_ptr<store::IDeviceRepository> devices_;
    std::shared_ptr<vendor::VendorRegistry> registry_;
    std::shared_ptr<store::IConnectionRepository> connections_;
    std::shared_ptr<core::IScheduler> scheduler_;
    RetryPolicy policy_;
    std::set<std::string> streamingVendors_;
    VendorRecordHandler onRecord_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ConnectionHealthMonitor>> monitors_;
};

} // namespace connection
} // namespace rfsync
