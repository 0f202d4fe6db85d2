#pragma once

#include "rfsync/core/types.h"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace rfsync {
namespace store {

/**
 * @brief Append-only audit trail of SyncEvents
 */
class ISyncEventLog {
public:
    virtual ~ISyncEventLog() = default;

    /**
     * @brief Append an event, assigning the next sequence number
     * @return The stored event
     */
    virtual core::SyncEvent append(core::SyncEvent event) = 0;

    virtual std::vector<core::SyncEvent> forDevice(const std::string& deviceId) const = 0;
    virtual std::vector<core::SyncEvent> since(uint64_t sequence) const = 0;
    virtual std::vector<core::SyncEvent> recent(size_t limit) const = 0;
    virtual size_t size() const = 0;
    virtual uint64_t lastSequence() const = 0;
};

/**
 * @brief Bounded in-memory event log; the oldest events are evicted first
 */
class InMemorySyncEventLog : public ISyncEventLog {
public:
    explicit InMemorySyncEventLog(size_t capacity = 10000);

    core::SyncEvent append(core::SyncEvent event) override;
    std::vector<core::SyncEvent> forDevice(const std::string& deviceId) const override;
    std::vector<core::SyncEvent> since(uint64_t sequence) const override;
    std::vector<core::SyncEvent> recent(size_t limit) const override;
    size_t size() const override;
    uint64_t lastSequence() const override;

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<core::SyncEvent> events_;
    uint64_t nextSequence_ = 1;
};

} // namespace store
} // namespace rfsync
