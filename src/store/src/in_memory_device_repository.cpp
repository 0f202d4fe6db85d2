#include "rfsync/store/in_memory_device_repository.h"
#include "rfsync/core/errors.h"
#include "rfsync/core/logging.h"

#include <fstream>

namespace rfsync {
namespace store {

using core::DeviceRecord;

// DeviceLock implementation
DeviceLock::DeviceLock(std::string deviceId, std::shared_ptr<std::mutex> rowMutex)
    : deviceId_(std::move(deviceId)), rowMutex_(std::move(rowMutex)), lock_(*rowMutex_) {}

DeviceLock& DeviceLock::operator=(DeviceLock&& other) noexcept {
    if (this != &other) {
        if (lock_.owns_lock()) {
            lock_.unlock();
        }
        lock_ = std::move(other.lock_);
        rowMutex_ = std::move(other.rowMutex_);
        deviceId_ = std::move(other.deviceId_);
    }
    return *this;
}

void DeviceLock::unlock() {
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
}

// InMemoryDeviceRepository implementation
InMemoryDeviceRepository::InMemoryDeviceRepository() {
    core::getLogger(core::loggers::STORE)->debug("In-memory device repository initialized");
}

DeviceRecord InMemoryDeviceRepository::create(DeviceRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);

    record.id = nextIdLocked();
    checkUniqueLocked(record);
    record.updateCounter = 1;

    rows_[record.id] = Row{record, std::make_shared<std::mutex>()};
    order_.push_back(record.id);
    indexLocked(record);

    core::getLogger(core::loggers::STORE)
        ->debug("Created device {} ({}:{})", record.id, record.vendorCode, record.vendorId);
    return record;
}

std::optional<DeviceRecord> InMemoryDeviceRepository::read(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(deviceId);
    if (it != rows_.end()) {
        return it->second.record;
    }
    return std::nullopt;
}

DeviceRecord InMemoryDeviceRepository::get(const std::string& deviceId) const {
    auto record = read(deviceId);
    if (!record) {
        throw core::DeviceNotFoundError(deviceId);
    }
    return *record;
}

DeviceRecord InMemoryDeviceRepository::update(const DeviceRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rows_.find(record.id);
    if (it == rows_.end()) {
        throw core::DeviceNotFoundError(record.id);
    }

    checkUniqueLocked(record);

    unindexLocked(it->second.record);
    uint64_t counter = it->second.record.updateCounter;
    it->second.record = record;
    it->second.record.updateCounter = counter + 1;
    indexLocked(it->second.record);

    return it->second.record;
}

bool InMemoryDeviceRepository::touchLastSeen(const std::string& deviceId,
                                             core::Timestamp timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(deviceId);
    if (it == rows_.end()) {
        return false;
    }
    it->second.record.lastSeen = timestamp;
    return true;
}

bool InMemoryDeviceRepository::exists(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.find(deviceId) != rows_.end();
}

DeviceLock InMemoryDeviceRepository::lockDevice(const std::string& deviceId) {
    std::shared_ptr<std::mutex> rowMutex;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rows_.find(deviceId);
        if (it == rows_.end()) {
            throw core::DeviceNotFoundError(deviceId);
        }
        rowMutex = it->second.rowMutex;
    }
    return DeviceLock(deviceId, std::move(rowMutex));
}

std::optional<DeviceRecord> InMemoryDeviceRepository::findByVendorId(
    const std::string& vendorCode, const std::string& vendorId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vendorIdIndex_.find({vendorCode, vendorId});
    if (it == vendorIdIndex_.end()) {
        return std::nullopt;
    }
    return rows_.at(it->second).record;
}

std::optional<DeviceRecord> InMemoryDeviceRepository::findBySerial(const std::string& vendorCode,
                                                                   const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = serialIndex_.find({vendorCode, serial});
    if (it == serialIndex_.end()) {
        return std::nullopt;
    }
    return rows_.at(it->second).record;
}

std::optional<DeviceRecord> InMemoryDeviceRepository::findByMac(const std::string& mac) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : order_) {
        const auto& record = rows_.at(id).record;
        if (record.mac && *record.mac == mac) {
            return record;
        }
    }
    return std::nullopt;
}

std::vector<DeviceRecord> InMemoryDeviceRepository::findByAddress(const std::string& address,
                                                                  const std::string& vendorCode,
                                                                  core::DeviceKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> result;
    if (address.empty()) {
        return result;
    }
    for (const auto& id : order_) {
        const auto& record = rows_.at(id).record;
        if (record.address == address && record.vendorCode == vendorCode && record.kind == kind) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<DeviceRecord> InMemoryDeviceRepository::findAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(rows_.at(id).record);
    }
    return result;
}

std::vector<DeviceRecord> InMemoryDeviceRepository::findByVendor(const std::string& vendorCode) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> result;
    for (const auto& id : order_) {
        const auto& record = rows_.at(id).record;
        if (record.vendorCode == vendorCode) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<DeviceRecord> InMemoryDeviceRepository::findByState(core::LifecycleState state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> result;
    for (const auto& id : order_) {
        const auto& record = rows_.at(id).record;
        if (record.status == state) {
            result.push_back(record);
        }
    }
    return result;
}

size_t InMemoryDeviceRepository::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

std::map<std::string, StateCounts> InMemoryDeviceRepository::countByVendorAndState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, StateCounts> result;
    for (const auto& pair : rows_) {
        result[pair.second.record.vendorCode][pair.second.record.status]++;
    }
    return result;
}

nlohmann::json InMemoryDeviceRepository::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json j;
    j["nextId"] = nextId_;
    j["devices"] = nlohmann::json::array();
    for (const auto& id : order_) {
        j["devices"].push_back(rows_.at(id).record.toJson());
    }
    return j;
}

void InMemoryDeviceRepository::fromJson(const nlohmann::json& j) {
    // Parse and index into locals; the repository changes only once all of it is valid
    std::unordered_map<std::string, Row> rows;
    std::vector<std::string> order;
    IdentityIndex vendorIds;
    IdentityIndex serials;

    for (const auto& deviceJson : j.at("devices")) {
        auto record = DeviceRecord::fromJson(deviceJson);
        if (rows.count(record.id) != 0) {
            throw core::SyncException("SNAPSHOT_INVALID", "Duplicate device id " + record.id,
                                      core::ErrorCategory::STORAGE);
        }
        if (!record.vendorId.empty() &&
            !vendorIds.emplace(std::make_pair(record.vendorCode, record.vendorId), record.id)
                 .second) {
            throw core::SyncException("SNAPSHOT_INVALID",
                                      "Vendor id " + record.vendorCode + ":" + record.vendorId +
                                          " appears twice",
                                      core::ErrorCategory::STORAGE);
        }
        if (record.serial&&
            !serials.emplace(std::make_pair(record.vendorCode, *record.serial), record.id).second) {
            throw core::SyncException("SNAPSHOT_INVALID",
                                      "Serial " + record.vendorCode + ":" + *record.serial +
                                          " appears twice",
                                      core::ErrorCategory::STORAGE);
        }
        order.push_back(record.id);
        rows[record.id] = Row{record, std::make_shared<std::mutex>()};
    }
    uint64_t nextId = j.value("nextId", static_cast<uint64_t>(order.size() + 1));

    std::lock_guard<std::mutex> lock(mutex_);
    rows_.swap(rows);
    order_.swap(order);
    vendorIdIndex_.swap(vendorIds);
    serialIndex_.swap(serials);
    nextId_ = nextId;
}

bool InMemoryDeviceRepository::saveSnapshot(const std::string& filePath) const {
    auto logger = core::getLogger(core::loggers::STORE);
    try {
        nlohmann::json j = toJson();
        std::ofstream file(filePath);
        if (!file.is_open()) {
            logger->error("Failed to open snapshot file for writing: {}", filePath);
            return false;
        }
        file << j.dump(2);
        logger->info("Saved {} devices to snapshot {}", j["devices"].size(), filePath);
        return true;
    } catch (const std::exception& e) {
        logger->error("Error saving snapshot {}: {}", filePath, e.what());
        return false;
    }
}

bool InMemoryDeviceRepository::loadSnapshot(const std::string& filePath) {
    auto logger = core::getLogger(core::loggers::STORE);
    try {
        std::ifstream file(filePath);
        if (!file.is_open()) {
            logger->warn("Snapshot file not found: {}", filePath);
            return false;
        }
        nlohmann::json j;
        file >> j;
        fromJson(j);
        logger->info("Loaded {} devices from snapshot {}", count(), filePath);
        return true;
    } catch (const std::exception& e) {
        logger->error("Error loading snapshot {}: {}", filePath, e.what());
        return false;
    }
}

void InMemoryDeviceRepository::checkUniqueLocked(const DeviceRecord& record) const {
    if (!record.vendorId.empty()) {
        auto it = vendorIdIndex_.find({record.vendorCode, record.vendorId});
        if (it != vendorIdIndex_.end() && it->second != record.id) {
            throw core::IdentityConflictError("Vendor id " + record.vendorId + " already tracked for " +
                                                  record.vendorCode,
                                              {it->second, record.id});
        }
    }
    if (record.serial) {
        auto it = serialIndex_.find({record.vendorCode, *record.serial});
        if (it != serialIndex_.end() && it->second != record.id) {
            throw core::IdentityConflictError("Serial " + *record.serial + " already tracked for " +
                                                  record.vendorCode,
                                              {it->second, record.id});
        }
    }
}

void InMemoryDeviceRepository::indexLocked(const DeviceRecord& record) {
    if (!record.vendorId.empty()) {
        vendorIdIndex_[{record.vendorCode, record.vendorId}] = record.id;
    }
    if (record.serial) {
        serialIndex_[{record.vendorCode, *record.serial}] = record.id;
    }
}

void InMemoryDeviceRepository::unindexLocked(const DeviceRecord& record) {
    if (!record.vendorId.empty()) {
        vendorIdIndex_.erase({record.vendorCode, record.vendorId});
    }
    if (record.serial) {
        serialIndex_.erase({record.vendorCode, *record.serial});
    }
}

std::string InMemoryDeviceRepository::nextIdLocked() {
    std::string id;
    do {
        id = "dev-" + std::to_string(nextId_++);
    } while (rows_.count(id) != 0);
    return id;
}

} // namespace store
} // namespace rfsync
