#pragma once

#include "rfsync/store/device_repository.h"

#include <nlohmann/json.hpp>
#include <unordered_map>
#include <utility>

namespace rfsync {
namespace store {

/**
 * @brief In-process device repository with per-row locks
 *
 * The repository mutex guards the maps only; row mutexes are never taken
 * while it is held. Snapshots are plain JSON.
 */
class InMemoryDeviceRepository : public IDeviceRepository {
public:
    InMemoryDeviceRepository();
    ~InMemoryDeviceRepository() override = default;

    core::DeviceRecord create(core::DeviceRecord record) override;
    std::optional<core::DeviceRecord> read(const std::string& deviceId) const override;
    core::DeviceRecord get(const std::string& deviceId) const override;
    core::DeviceRecord update(const core::DeviceRecord& record) override;
    bool touchLastSeen(const std::string& deviceId, core::Timestamp timestamp) override;
    bool exists(const std::string& deviceId) const override;
    DeviceLock lockDevice(const std::string& deviceId) override;

    std::optional<core::DeviceRecord> findByVendorId(const std::string& vendorCode,
                                                     const std::string& vendorId) const override;
    std::optional<core::DeviceRecord> findBySerial(const std::string& vendorCode,
                                                   const std::string& serial) const override;
    std::optional<core::DeviceRecord> findByMac(const std::string& mac) const override;
    std::vector<core::DeviceRecord> findByAddress(const std::string& address,
                                                  const std::string& vendorCode,
                                                  core::DeviceKind kind) const override;

    std::vector<core::DeviceRecord> findAll() const override;
    std::vector<core::DeviceRecord> findByVendor(const std::string& vendorCode) const override;
    std::vector<core::DeviceRecord> findByState(core::LifecycleState state) const override;

    size_t count() const override;
    std::map<std::string, StateCounts> countByVendorAndState() const override;

    // Persistence management
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);
    bool saveSnapshot(const std::string& filePath) const;
    bool loadSnapshot(const std::string& filePath);

private:
    using IdentityIndex = std::map<std::pair<std::string, std::string>, std::string>;

    struct Row {
        core::DeviceRecord record;
        std::shared_ptr<std::mutex> rowMutex;
    };

    void checkUniqueLocked(const core::DeviceRecord& record) const;
    void indexLocked(const core::DeviceRecord& record);
    void unindexLocked(const core::DeviceRecord& record);
    std::string nextIdLocked();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Row> rows_;
    std::vector<std::string> order_;
    IdentityIndex vendorIdIndex_;
    IdentityIndex serialIndex_;
    uint64_t nextId_ = 1;
};

} // namespace store
} // namespace rfsync
