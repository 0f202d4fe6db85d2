#pragma once

#include "rfsync/core/types.h"

#include <mutex>
#include <string>
#include <vector>

namespace rfsync {
namespace store {

/**
 * @brief History of device address relocations
 */
class IMovementLog {
public:
    virtual ~IMovementLog() = default;

    virtual void record(const core::MovementRecord& movement) = 0;
    virtual std::vector<core::MovementRecord> forDevice(const std::string& deviceId) const = 0;
    virtual std::vector<core::MovementRecord> findAll() const = 0;
};

class InMemoryMovementLog : public IMovementLog {
public:
    void record(const core::MovementRecord& movement) override;
    std::vector<core::MovementRecord> forDevice(const std::string& deviceId) const override;
    std::vector<core::MovementRecord> findAll() const override;

private:
    mutable std::mutex mutex_;
    std::vector<core::MovementRecord> movements_;
};

} // namespace store
} // namespace rfsync
