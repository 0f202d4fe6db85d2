#pragma once

#include "rfsync/core/types.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rfsync {
namespace store {

/**
 * @brief Exclusive per-device lock
 *
 * Writers hold a DeviceLock across read-validate-write so that updates to a
 * single device are totally ordered. Movable, not copyable.
 */
class DeviceLock {
public:
    DeviceLock() = default;
    DeviceLock(std::string deviceId, std::shared_ptr<std::mutex> rowMutex);
    DeviceLock(DeviceLock&& other) noexcept = default;
    DeviceLock& operator=(DeviceLock&& other) noexcept;
    ~DeviceLock() = default;

    DeviceLock(const DeviceLock&) = delete;
    DeviceLock& operator=(const DeviceLock&) = delete;

    bool ownsLock() const noexcept { return lock_.owns_lock(); }
    const std::string& deviceId() const noexcept { return deviceId_; }
    void unlock();

private:
    std::string deviceId_;
    std::shared_ptr<std::mutex> rowMutex_;
    std::unique_lock<std::mutex> lock_;
};

using StateCounts = std::map<core::LifecycleState, size_t>;

/**
 * @brief Device record repository interface
 *
 * Records are addressed by canonical id and never deleted. Only the sync
 * coordinator and the lifecycle manager write to it.
 */
class IDeviceRepository {
public:
    virtual ~IDeviceRepository() = default;

    /**
     * @brief Store a new record and assign its canonical id
     * @return The stored record, id and update counter filled in
     * @throws core::IdentityConflictError if (vendor, vendor id) or
     *         (vendor, serial) is already taken
     */
    virtual core::DeviceRecord create(core::DeviceRecord record) = 0;

    virtual std::optional<core::DeviceRecord> read(const std::string& deviceId) const = 0;

    /**
     * @brief Read a record that must exist
     * @throws core::DeviceNotFoundError
     */
    virtual core::DeviceRecord get(const std::string& deviceId) const = 0;

    /**
     * @brief Replace a record, bumping its update counter
     * @throws core::DeviceNotFoundError, core::IdentityConflictError
     */
    virtual core::DeviceRecord update(const core::DeviceRecord& record) = 0;

    /**
     * @brief Refresh last-seen without counting as a content change
     */
    virtual bool touchLastSeen(const std::string& deviceId, core::Timestamp timestamp) = 0;

    virtual bool exists(const std::string& deviceId) const = 0;

    /**
     * @brief Acquire the row lock for a device
     * @throws core::DeviceNotFoundError
     */
    virtual DeviceLock lockDevice(const std::string& deviceId) = 0;

    // Identity lookups
    virtual std::optional<core::DeviceRecord> findByVendorId(const std::string& vendorCode,
                                                             const std::string& vendorId) const = 0;
    virtual std::optional<core::DeviceRecord> findBySerial(const std::string& vendorCode,
                                                           const std::string& serial) const = 0;
    virtual std::optional<core::DeviceRecord> findByMac(const std::string& mac) const = 0;
    virtual std::vector<core::DeviceRecord> findByAddress(const std::string& address,
                                                          const std::string& vendorCode,
                                                          core::DeviceKind kind) const = 0;

    // Query operations
    virtual std::vector<core::DeviceRecord> findAll() const = 0;
    virtual std::vector<core::DeviceRecord> findByVendor(const std::string& vendorCode) const = 0;
    virtual std::vector<core::DeviceRecord> findByState(core::LifecycleState state) const = 0;

    // Statistics
    virtual size_t count() const = 0;
    virtual std::map<std::string, StateCounts> countByVendorAndState() const = 0;
};

} // namespace store
} // namespace rfsync
