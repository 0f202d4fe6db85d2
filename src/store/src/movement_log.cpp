#include "rfsync/store/movement_log.h"
#include "rfsync/core/logging.h"

namespace rfsync {
namespace store {

void InMemoryMovementLog::record(const core::MovementRecord& movement) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        movements_.push_back(movement);
    }
    core::getLogger(core::loggers::STORE)
        ->info("Device {} moved from {} to {} (matched by {})", movement.deviceId,
               movement.oldAddress, movement.newAddress, movement.matchedKey);
}

std::vector<core::MovementRecord> InMemoryMovementLog::forDevice(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::MovementRecord> result;
    for (const auto& movement : movements_) {
        if (movement.deviceId == deviceId) {
            result.push_back(movement);
        }
    }
    return result;
}

std::vector<core::MovementRecord> InMemoryMovementLog::findAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return movements_;
}

} // namespace store
} // namespace rfsync
