#pragma once

#include "rfsync/core/clock.h"
#include "rfsync/core/types.h"
#include "rfsync/store/device_repository.h"
#include "rfsync/store/movement_log.h"
#include "rfsync/sync/dedup_resolver.h"
#include "rfsync/sync/event_emitter.h"
#include "rfsync/sync/lifecycle_manager.h"
#include "rfsync/vendor/vendor_registry.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rfsync {
namespace sync {

/**
 * @brief Lifecycle state implied by a vendor reported status
 * @return std::nullopt when the status implies nothing
 */
std::optional<core::LifecycleState> impliedStateForVendorStatus(const std::string& status);

/**
 * @brief A record held back because its identity was ambiguous
 */
struct QuarantinedRecord {
    core::NormalizedRecord record;
    std::vector<std::string> conflictingIds;
    std::string detail;
    core::Timestamp quarantinedAt;

    json toJson() const;
};

struct RecordError {
    std::string vendorId;
    std::string message;
};

/**
 * @brief Per batch outcome of applyInbound
 */
struct SyncBatchResult {
    size_t created = 0;
    size_t updated = 0;
    size_t transitioned = 0;
    size_t relocated = 0;
    size_t unchanged = 0;
    size_t conflicts = 0;
    std::vector<RecordError> errors;
    std::vector<std::string> deviceIds; // devices matched or created by the batch

    json toJson() const;
};

/**
 * @brief Device counts by state, per vendor and overall
 */
struct HealthSummary {
    std::map<std::string, store::StateCounts> byVendor;
    store::StateCounts totals;
    size_t total = 0;

    json toJson() const;
};

/**
 * @brief Pull and push synchronization between vendors and the device store
 */
class SyncCoordinator {
public:
    SyncCoordinator(std::shared_ptr<store::IDeviceRepository> repository,
                    std::shared_ptr<DeviceLifecycleManager> lifecycle,
                    std::shared_ptr<EventEmitter> emitter,
                    std::shared_ptr<store::IMovementLog> movementLog,
                    std::shared_ptr<vendor::VendorRegistry> registry,
                    std::shared_ptr<core::IClock> clock);

    /**
     * @brief Reconcile a batch of normalized records from one vendor
     *
     * Each record is isolated: a failure or conflict on one record never
     * affects the others and is reported in the result.
     */
    SyncBatchResult applyInbound(const std::string& vendorCode,
                                 const std::vector<core::NormalizedRecord>& records);

    /**
     * @brief Push explicitly named fields to the device's vendor
     *
     * Local lifecycle status is never changed by a push; status follows the
     * next inbound poll or an administrative transition.
     *
     * @throws core::DeviceNotFoundError, core::VendorUnavailableError
     */
    vendor::PushAck applyOutbound(const std::string& deviceId, const json& fields);

    std::vector<QuarantinedRecord> quarantined() const;
    size_t clearQuarantine();
    bool releaseQuarantined(const std::string& vendorCode, const std::string& vendorId);

    HealthSummary healthSummary() const;

private:
    void applyRecord(const std::string& vendorCode, core::NormalizedRecord record,
                     SyncBatchResult& result);
    void createDevice(const std::string& vendorCode, const core::NormalizedRecord& record,
                      SyncBatchResult& result);
    void updateDevice(const ResolveResult& resolution, const core::NormalizedRecord& record,
                      SyncBatchResult& result);
    bool applyReportedStatus(store::DeviceLock& lock, const core::NormalizedRecord& record);
    void quarantine(const core::NormalizedRecord& record, std::vector<std::string> conflictingIds,
                    const std::string& detail, SyncBatchResult& result);

    std::shared_ptr<store::IDeviceRepository> repository_;
    std::shared_ptr<DeviceLifecycleManager> lifecycle_;
    std::shared_ptr<EventEmitter> emitter_;
    std::shared_ptr<store::IMovementLog> movementLog_;
    std::shared_ptr<vendor::VendorRegistry> registry_;
    std::shared_ptr<core::IClock> clock_;
    DeduplicationResolver resolver_;

    mutable std::mutex quarantineMutex_;
    std::vector<QuarantinedRecord> quarantine_;
};

} // namespace sync
} // namespace rfsync
