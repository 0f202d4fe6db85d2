#include "rfsync/store/connection_repository.h"

namespace rfsync {
namespace store {

void InMemoryConnectionRepository::upsert(const core::ConnectionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_[{record.deviceId, record.subscription}] = record;
}

std::optional<core::ConnectionRecord> InMemoryConnectionRepository::read(
    const std::string& deviceId, const std::string& subscription) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find({deviceId, subscription});
    if (it != rows_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<core::ConnectionRecord> InMemoryConnectionRepository::findByDevice(
    const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::ConnectionRecord> result;
    for (auto it = rows_.lower_bound({deviceId, std::string()});
         it != rows_.end() && it->first.first == deviceId; ++it) {
        result.push_back(it->second);
    }
    return result;
}

std::vector<core::ConnectionRecord> InMemoryConnectionRepository::findAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::ConnectionRecord> result;
    result.reserve(rows_.size());
    for (const auto& pair : rows_) {
        result.push_back(pair.second);
    }
    return result;
}

std::map<core::ConnectionState, size_t> InMemoryConnectionRepository::countByState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<core::ConnectionState, size_t> result;
    for (const auto& pair : rows_) {
        result[pair.second.state]++;
    }
    return result;
}

} // namespace store
} // namespace rfsync
