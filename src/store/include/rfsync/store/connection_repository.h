#pragma once

#include "rfsync/core/types.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rfsync {
namespace store {

/**
 * @brief Streaming connection rows keyed by (device id, subscription)
 *
 * Each row is written only by the monitor that owns it.
 */
class IConnectionRepository {
public:
    virtual ~IConnectionRepository() = default;

    virtual void upsert(const core::ConnectionRecord& record) = 0;
    virtual std::optional<core::ConnectionRecord> read(const std::string& deviceId,
                                                       const std::string& subscription) const = 0;
    virtual std::vector<core::ConnectionRecord> findByDevice(const std::string& deviceId) const = 0;
    virtual std::vector<core::ConnectionRecord> findAll() const = 0;
    virtual std::map<core::ConnectionState, size_t> countByState() const = 0;
};

class InMemoryConnectionRepository : public IConnectionRepository {
public:
    void upsert(const core::ConnectionRecord& record) override;
    std::optional<core::ConnectionRecord> read(const std::string& deviceId,
                                               const std::string& subscription) const override;
    std::vector<core::ConnectionRecord> findByDevice(const std::string& deviceId) const override;
    std::vector<core::ConnectionRecord> findAll() const override;
    std::map<core::ConnectionState, size_t> countByState() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, core::ConnectionRecord> rows_;
};

} // namespace store
} // namespace rfsync
