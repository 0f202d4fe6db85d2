#include "rfsync/store/sync_event_log.h"

#include <algorithm>

namespace rfsync {
namespace store {

InMemorySyncEventLog::InMemorySyncEventLog(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

core::SyncEvent InMemorySyncEventLog::append(core::SyncEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    event.sequence = nextSequence_++;
    events_.push_back(event);
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
    return event;
}

std::vector<core::SyncEvent> InMemorySyncEventLog::forDevice(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::SyncEvent> result;
    for (const auto& event : events_) {
        if (event.deviceId == deviceId) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<core::SyncEvent> InMemorySyncEventLog::since(uint64_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::SyncEvent> result;
    for (const auto& event : events_) {
        if (event.sequence > sequence) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<core::SyncEvent> InMemorySyncEventLog::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = std::min(limit, events_.size());
    return std::vector<core::SyncEvent>(events_.end() - static_cast<std::ptrdiff_t>(count),
                                        events_.end());
}

size_t InMemorySyncEventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t InMemorySyncEventLog::lastSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextSequence_ - 1;
}

} // namespace store
} // namespace rfsync
