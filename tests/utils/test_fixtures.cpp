#include "test_fixtures.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace rfsync {
namespace testing {

core::NormalizedRecord makeRecord(const std::string& vendorCode, const std::string& vendorId,
                                  const std::string& address, const std::string& status,
                                  std::optional<std::string> serial,
                                  std::optional<std::string> mac) {
    core::NormalizedRecord record;
    record.vendorCode = vendorCode;
    record.vendorId = vendorId;
    record.address = address;
    record.reportedStatus = status;
    record.serial = std::move(serial);
    record.mac = std::move(mac);
    record.kind = core::DeviceKind::RECEIVER;
    record.name = "RX " + vendorId;
    return record;
}

core::DeviceRecord makeDevice(const std::string& vendorCode, const std::string& vendorId,
                              const std::string& address, core::LifecycleState status) {
    core::DeviceRecord device;
    device.vendorCode = vendorCode;
    device.vendorId = vendorId;
    device.address = address;
    device.kind = core::DeviceKind::RECEIVER;
    device.status = status;
    return device;
}

const std::vector<core::LifecycleState>& allStates() {
    static const std::vector<core::LifecycleState> states = {
        core::LifecycleState::DISCOVERED, core::LifecycleState::PROVISIONING,
        core::LifecycleState::ONLINE,     core::LifecycleState::DEGRADED,
        core::LifecycleState::OFFLINE,    core::LifecycleState::MAINTENANCE,
        core::LifecycleState::RETIRED};
    return states;
}

std::string writeTempFile(const std::string& stem, const std::string& contents) {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() /
                (stem + "_" + std::to_string(stamp) + "_" + std::to_string(counter++) + ".json");
    std::ofstream out(path);
    out << contents;
    return path.string();
}

void EngineTestBase::SetUp() {
    clock_ = std::make_shared<core::ManualClock>();
    scheduler_ = std::make_shared<core::ManualScheduler>(clock_);
    devices_ = std::make_shared<store::InMemoryDeviceRepository>();
    connections_ = std::make_shared<store::InMemoryConnectionRepository>();
    eventLog_ = std::make_shared<store::InMemorySyncEventLog>();
    movements_ = std::make_shared<store::InMemoryMovementLog>();
    emitter_ = std::make_shared<sync::EventEmitter>(eventLog_);
    registry_ = std::make_shared<vendor::VendorRegistry>();
    lifecycle_ = std::make_shared<sync::DeviceLifecycleManager>(devices_, emitter_, clock_);
    coordinator_ = std::make_shared<sync::SyncCoordinator>(devices_, lifecycle_, emitter_,
                                                           movements_, registry_, clock_);
}

std::vector<core::SyncEvent> EngineTestBase::eventsOfType(core::SyncEventType type) const {
    std::vector<core::SyncEvent> result;
    for (const auto& event : eventLog_->since(0)) {
        if (event.type == type) {
            result.push_back(event);
        }
    }
    return result;
}

} // namespace testing
} // namespace rfsync
