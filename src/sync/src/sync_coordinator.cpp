#include "rfsync/sync/sync_coordinator.h"
#include "rfsync/core/errors.h"
#include "rfsync/core/logging.h"
#include "rfsync/core/utils.h"

#include <algorithm>

namespace rfsync {
namespace sync {

using core::DeviceRecord;
using core::LifecycleState;
using core::NormalizedRecord;

std::optional<LifecycleState> impliedStateForVendorStatus(const std::string& status) {
    std::string lower = core::string_utils::toLower(core::string_utils::trim(status));
    if (lower == "online" || lower == "ok" || lower == "active") {
        return LifecycleState::ONLINE;
    }
    if (lower == "warning" || lower == "degraded") {
        return LifecycleState::DEGRADED;
    }
    if (lower == "offline" || lower == "unreachable" || lower == "error") {
        return LifecycleState::OFFLINE;
    }
    if (lower == "discovering" || lower == "provisioning") {
        return LifecycleState::PROVISIONING;
    }
    return std::nullopt;
}

json QuarantinedRecord::toJson() const {
    return json{{"record", record.toJson()},
                {"conflictingIds", conflictingIds},
                {"detail", detail},
                {"quarantinedAt", core::formatIsoTimestamp(quarantinedAt)}};
}

json SyncBatchResult::toJson() const {
    json j{{"created", created},     {"updated", updated},
           {"transitioned", transitioned}, {"relocated", relocated},
           {"unchanged", unchanged}, {"conflicts", conflicts},
           {"errors", json::array()}};
    for (const auto& error : errors) {
        j["errors"].push_back(json{{"vendorId", error.vendorId}, {"message", error.message}});
    }
    return j;
}

namespace {

json stateCountsToJson(const store::StateCounts& counts) {
    json j = json::object();
    for (const auto& pair : counts) {
        j[core::lifecycleStateToString(pair.first)] = pair.second;
    }
    return j;
}

} // namespace

json HealthSummary::toJson() const {
    json vendors = json::object();
    for (const auto& pair : byVendor) {
        vendors[pair.first] = stateCountsToJson(pair.second);
    }
    return json{{"total", total}, {"totals", stateCountsToJson(totals)}, {"vendors", vendors}};
}

SyncCoordinator::SyncCoordinator(std::shared_ptr<store::IDeviceRepository> repository,
                                 std::shared_ptr<DeviceLifecycleManager> lifecycle,
                                 std::shared_ptr<EventEmitter> emitter,
                                 std::shared_ptr<store::IMovementLog> movementLog,
                                 std::shared_ptr<vendor::VendorRegistry> registry,
                                 std::shared_ptr<core::IClock> clock)
    : repository_(repository), lifecycle_(std::move(lifecycle)), emitter_(std::move(emitter)),
      movementLog_(std::move(movementLog)), registry_(std::move(registry)),
      clock_(std::move(clock)), resolver_(repository) {}

SyncBatchResult SyncCoordinator::applyInbound(const std::string& vendorCode,
                                              const std::vector<NormalizedRecord>& records) {
    auto logger = core::getLogger(core::loggers::SYNC);
    SyncBatchResult result;

    for (const auto& record : records) {
        try {
            applyRecord(vendorCode, record, result);
        } catch (const core::IdentityConflictError& e) {
            quarantine(record, e.getDeviceIds(), e.what(), result);
        } catch (const std::exception& e) {
            logger->warn("Failed to apply {}:{}: {}", vendorCode, record.vendorId, e.what());
            result.errors.push_back(RecordError{record.vendorId, e.what()});
        }
    }

    if (result.created + result.updated + result.transitioned + result.conflicts +
            result.errors.size() >
        0) {
        logger->info("Inbound {}: {} records, {} created, {} updated, {} transitioned, "
                     "{} relocated, {} conflicts, {} errors",
                     vendorCode, records.size(), result.created, result.updated,
                     result.transitioned, result.relocated, result.conflicts, result.errors.size());
    } else {
        logger->debug("Inbound {}: {} records unchanged", vendorCode, records.size());
    }
    return result;
}

void SyncCoordinator::applyRecord(const std::string& vendorCode, NormalizedRecord record,
                                  SyncBatchResult& result) {
    if (record.vendorId.empty()) {
        result.errors.push_back(RecordError{"", "Record from " + vendorCode + " has no vendor id"});
        return;
    }

    record.vendorCode = vendorCode;
    if (record.mac) {
        record.mac = core::string_utils::normalizeMac(*record.mac);
    }

    ResolveResult resolution = resolver_.resolve(record, vendorCode);
    switch (resolution.outcome) {
        case MatchOutcome::CONFLICT:
            quarantine(record, resolution.conflictingIds, resolution.detail, result);
            break;
        case MatchOutcome::CREATE_NEW:
            createDevice(vendorCode, record, result);
            break;
        case MatchOutcome::MATCHED:
        case MatchOutcome::RELOCATED:
            updateDevice(resolution, record, result);
            break;
    }
}

void SyncCoordinator::createDevice(const std::string& vendorCode, const NormalizedRecord& record,
                                   SyncBatchResult& result) {
    auto now = clock_->now();

    DeviceRecord device;
    device.vendorCode = vendorCode;
    device.vendorId = record.vendorId;
    device.serial = record.serial;
    device.mac = record.mac;
    device.address = record.address;
    device.kind = record.kind;
    device.name = record.name;
    device.firmwareVersion = record.firmwareVersion;
    device.telemetry = record.telemetry.is_object() ? record.telemetry : json::object();
    device.status = LifecycleState::DISCOVERED;
    device.createdAt = now;
    device.statusChangedAt = now;

    device = repository_->create(device);
    result.created++;
    result.deviceIds.push_back(device.id);

    core::getLogger(core::loggers::SYNC)
        ->info("Discovered device {} ({}:{} at {})", device.id, vendorCode, record.vendorId,
               record.address);

    EventEmitter::DeferredDispatch deferred(*emitter_);
    auto lock = repository_->lockDevice(device.id);
    if (applyReportedStatus(lock, record)) {
        result.transitioned++;
    }
}

void SyncCoordinator::updateDevice(const ResolveResult& resolution, const NormalizedRecord& record,
                                   SyncBatchResult& result) {
    auto logger = core::getLogger(core::loggers::SYNC);
    const std::string& deviceId = resolution.device->id;

    EventEmitter::DeferredDispatch deferred(*emitter_);
    auto lock = repository_->lockDevice(deviceId);
    DeviceRecord current = repository_->get(deviceId);
    std::vector<std::string> changed;

    // Vendor keys only move within the vendor that owns the record
    bool sameVendor = current.vendorCode == record.vendorCode;
    if (sameVendor && current.vendorId != record.vendorId) {
        current.vendorId = record.vendorId;
        changed.push_back("vendorId");
    }
    if (sameVendor && record.serial && current.serial != record.serial) {
        current.serial = record.serial;
        changed.push_back("serial");
    }
    if (record.mac && current.mac != record.mac) {
        current.mac = record.mac;
        changed.push_back("mac");
    }

    std::string previousAddress = current.address;
    bool relocated = !record.address.empty() && current.address != record.address;
    if (relocated) {
        current.address = record.address;
        changed.push_back("address");
    }

    if (!record.name.empty() && current.name != record.name) {
        current.name = record.name;
        changed.push_back("name");
    }
    if (!record.firmwareVersion.empty() && current.firmwareVersion != record.firmwareVersion) {
        current.firmwareVersion = record.firmwareVersion;
        changed.push_back("firmwareVersion");
    }
    if (record.kind != core::DeviceKind::UNKNOWN && current.kind != record.kind) {
        current.kind = record.kind;
        changed.push_back("kind");
    }
    if (record.telemetry.is_object()) {
        for (const auto& item : record.telemetry.items()) {
            if (!current.telemetry.contains(item.key()) || current.telemetry[item.key()] != item.value()) {
                current.telemetry[item.key()] = item.value();
                changed.push_back("telemetry." + item.key());
            }
        }
    }

    if (!changed.empty()) {
        repository_->update(current);
        result.updated++;
        logger->debug("Device {} fields changed: {}", deviceId, core::string_utils::join(changed, ", "));
    } else {
        result.unchanged++;
    }

    if (relocated) {
        std::string matchedKey =
            resolution.matchedKey ? identityKeyToString(*resolution.matchedKey) : "unknown";
        auto now = clock_->now();

        movementLog_->record(core::MovementRecord{deviceId, previousAddress, record.address,
                                                  matchedKey, now});

        core::SyncEvent event;
        event.type = core::SyncEventType::ADDRESS_RELOCATED;
        event.deviceId = deviceId;
        event.vendorCode = current.vendorCode;
        event.reason = "address changed from " + previousAddress + " to " + record.address;
        event.source = core::EventSource::API;
        event.timestamp = now;
        event.metadata = json{{"oldAddress", previousAddress},
                              {"newAddress", record.address},
                              {"matchedKey", matchedKey}};
        emitter_->emit(event);
        result.relocated++;
    }

    if (applyReportedStatus(lock, record)) {
        result.transitioned++;
    }
    result.deviceIds.push_back(deviceId);
}

bool SyncCoordinator::applyReportedStatus(store::DeviceLock& lock, const NormalizedRecord& record) {
    auto logger = core::getLogger(core::loggers::SYNC);
    DeviceRecord current = repository_->get(lock.deviceId());

    if (current.status == LifecycleState::MAINTENANCE || current.status == LifecycleState::RETIRED) {
        logger->debug("Device {} is {}, reported status '{}' ignored", current.id,
                      core::lifecycleStateToString(current.status), record.reportedStatus);
        return false;
    }

    auto implied = impliedStateForVendorStatus(record.reportedStatus);
    if (!implied) {
        return false;
    }

    bool transitioned = false;
    if (current.status != *implied) {
        if (DeviceLifecycleManager::planRoute(current.status, *implied)) {
            json metadata{{"vendorId", record.vendorId}, {"reportedStatus", record.reportedStatus}};
            auto applied = lifecycle_->transitionVia(lock, *implied,
                                                     "vendor reported '" + record.reportedStatus + "'",
                                                     core::EventSource::API, metadata);
            transitioned = !applied.empty();
        } else {
            logger->debug("Device {} cannot move from {} to reported {}", current.id,
                          core::lifecycleStateToString(current.status),
                          core::lifecycleStateToString(*implied));
        }
    }

    if (*implied == LifecycleState::ONLINE || *implied == LifecycleState::DEGRADED ||
        *implied == LifecycleState::PROVISIONING) {
        repository_->touchLastSeen(current.id, clock_->now());
    }
    return transitioned;
}

void SyncCoordinator::quarantine(const NormalizedRecord& record,
                                 std::vector<std::string> conflictingIds,
                                 const std::string& detail, SyncBatchResult& result) {
    auto logger = core::getLogger(core::loggers::SYNC);
    result.conflicts++;

    bool alreadyReported = false;
    {
        std::lock_guard<std::mutex> lock(quarantineMutex_);
        auto it = std::find_if(quarantine_.begin(), quarantine_.end(),
                               [&record](const QuarantinedRecord& entry) {
                                   return entry.record.vendorCode == record.vendorCode&&
                                          entry.record.vendorId == record.vendorId;
                               });
        if (it != quarantine_.end()) {
            alreadyReported = it->conflictingIds == conflictingIds;
            it->record = record;
            it->conflictingIds = conflictingIds;
            it->detail = detail;
        } else {
            quarantine_.push_back(QuarantinedRecord{record, conflictingIds, detail, clock_->now()});
        }
    }

    if (alreadyReported) {
        logger->debug("Record {}:{} still quarantined", record.vendorCode, record.vendorId);
        return;
    }

    logger->error("Identity conflict for {}:{}: {}", record.vendorCode, record.vendorId, detail);

    core::SyncEvent event;
    event.type = core::SyncEventType::IDENTITY_CONFLICT;
    event.deviceId = conflictingIds.empty() ? std::string() : conflictingIds.front();
    event.vendorCode = record.vendorCode;
    event.reason = detail;
    event.source = core::EventSource::API;
    event.timestamp = clock_->now();
    event.metadata = json{{"vendorId", record.vendorId},
                          {"conflictingIds", conflictingIds},
                          {"record", record.toJson()}};
    emitter_->emit(event);
}

vendor::PushAck SyncCoordinator::applyOutbound(const std::string& deviceId, const json& fields) {
    static const std::string telemetryPrefix = "telemetry.";
    auto logger = core::getLogger(core::loggers::SYNC);

    DeviceRecord device = repository_->get(deviceId);
    auto adapter = registry_ ? registry_->get(device.vendorCode) : nullptr;
    if (!adapter) {
        throw core::VendorUnavailableError(device.vendorCode, "No adapter registered",
                                           core::VendorFailureKind::SERVER);
    }

    json allowed = json::object();
    std::vector<std::string> rejected;
    if (fields.is_object()) {
        for (const auto& item : fields.items()) {
            const std::string& key = item.key();
            bool pushable =
                (key == "name" && item.value().is_string()) ||
                (key.compare(0, telemetryPrefix.size(), telemetryPrefix) == 0&&
                 key.size() > telemetryPrefix.size()) ||
                (key == "telemetry" && item.value().is_object());
            if (pushable) {
                allowed[key] = item.value();
            } else {
                rejected.push_back(key);
            }
        }
    }

    vendor::PushAck ack;
    if (allowed.empty()) {
        ack.accepted = false;
        ack.message = "No pushable fields";
    } else {
        ack = adapter->pushFields(device.vendorId, allowed);
    }

    for (const auto& key : rejected) {
        if (std::find(ack.rejectedFields.begin(), ack.rejectedFields.end(), key) ==
            ack.rejectedFields.end()) {
            ack.rejectedFields.push_back(key);
        }
    }

    logger->info("Push to {} ({}:{}): accepted={}, applied [{}], rejected [{}]", deviceId,
                 device.vendorCode, device.vendorId, ack.accepted,
                 core::string_utils::join(ack.appliedFields, ", "),
                 core::string_utils::join(ack.rejectedFields, ", "));
    return ack;
}

std::vector<QuarantinedRecord> SyncCoordinator::quarantined() const {
    std::lock_guard<std::mutex> lock(quarantineMutex_);
    return quarantine_;
}

size_t SyncCoordinator::clearQuarantine() {
    std::lock_guard<std::mutex> lock(quarantineMutex_);
    size_t count = quarantine_.size();
    quarantine_.clear();
    return count;
}

bool SyncCoordinator::releaseQuarantined(const std::string& vendorCode,
                                         const std::string& vendorId) {
    std::lock_guard<std::mutex> lock(quarantineMutex_);
    auto it = std::remove_if(quarantine_.begin(), quarantine_.end(),
                             [&](const QuarantinedRecord& entry) {
                                 return entry.record.vendorCode == vendorCode&&
                                        entry.record.vendorId == vendorId;
                             });
    bool removed = it != quarantine_.end();
    quarantine_.erase(it, quarantine_.end());
    return removed;
}

HealthSummary SyncCoordinator::healthSummary() const {
    HealthSummary summary;
    summary.byVendor = repository_->countByVendorAndState();
    for (const auto& vendor : summary.byVendor) {
        for (const auto& pair : vendor.second) {
            summary.totals[pair.first] += pair.second;
            summary.total += pair.second;
        }
    }
    return summary;
}

} // namespace sync
} // namespace rfsync
