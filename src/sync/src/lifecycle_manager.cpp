#include "rfsync/sync/lifecycle_manager.h"
#include "rfsync/core/errors.h"
#include "rfsync/core/logging.h"

#include <deque>

namespace rfsync {
namespace sync {

using core::DeviceRecord;
using core::LifecycleState;

json HealthSweepSummary::toJson() const {
    return json{{"checked", checked},         {"transitioned", transitioned},
                {"online", online},           {"degraded", degraded},
                {"offline", offline},         {"maintenance", maintenance},
                {"other", other}};
}

DeviceLifecycleManager::DeviceLifecycleManager(
    std::shared_ptr<store::IDeviceRepository> repository,
    std::shared_ptr<EventEmitter> emitter, std::shared_ptr<core::IClock> clock)
    : repository_(std::move(repository)), emitter_(std::move(emitter)),
      clock_(std::move(clock)) {}

const std::map<LifecycleState, std::set<LifecycleState>>&
DeviceLifecycleManager::transitionTable() {
    static const std::map<LifecycleState, std::set<LifecycleState>> table = {
        {LifecycleState::DISCOVERED,
         {LifecycleState::PROVISIONING, LifecycleState::OFFLINE, LifecycleState::RETIRED}},
        {LifecycleState::PROVISIONING,
         {LifecycleState::ONLINE, LifecycleState::OFFLINE, LifecycleState::DISCOVERED}},
        {LifecycleState::ONLINE,
         {LifecycleState::DEGRADED, LifecycleState::OFFLINE, LifecycleState::MAINTENANCE}},
        {LifecycleState::DEGRADED,
         {LifecycleState::ONLINE, LifecycleState::OFFLINE, LifecycleState::MAINTENANCE}},
        {LifecycleState::OFFLINE,
         {LifecycleState::ONLINE, LifecycleState::DEGRADED, LifecycleState::MAINTENANCE,
          LifecycleState::RETIRED}},
        {LifecycleState::MAINTENANCE,
         {LifecycleState::ONLINE, LifecycleState::OFFLINE, LifecycleState::RETIRED}},
        {LifecycleState::RETIRED, {}}};
    return table;
}

bool DeviceLifecycleManager::isValidTransition(LifecycleState from, LifecycleState to) {
    const auto& table = transitionTable();
    auto it = table.find(from);
    return it != table.end() && it->second.count(to) > 0;
}

std::vector<LifecycleState> DeviceLifecycleManager::validNextStates(LifecycleState state) {
    const auto& table = transitionTable();
    auto it = table.find(state);
    if (it == table.end()) {
        return {};
    }
    return std::vector<LifecycleState>(it->second.begin(), it->second.end());
}

std::optional<std::vector<LifecycleState>>
DeviceLifecycleManager::planRoute(LifecycleState from, LifecycleState to) {
    if (from == to) {
        return std::vector<LifecycleState>{};
    }

    // Breadth-first search; set iteration order keeps routes deterministic
    std::map<LifecycleState, LifecycleState> parent;
    std::deque<LifecycleState> queue{from};
    parent[from] = from;

    while (!queue.empty()) {
        LifecycleState current = queue.front();
        queue.pop_front();
        if (current == to) {
            break;
        }
        for (LifecycleState next : transitionTable().at(current)) {
            if (parent.emplace(next, current).second) {
                queue.push_back(next);
            }
        }
    }

    if (parent.find(to) == parent.end()) {
        return std::nullopt;
    }

    std::vector<LifecycleState> route;
    for (LifecycleState step = to; step != from; step = parent.at(step)) {
        route.insert(route.begin(), step);
    }
    return route;
}

TransitionResult DeviceLifecycleManager::transition(const std::string& deviceId,
                                                    LifecycleState target,
                                                    const std::string& reason,
                                                    core::EventSource source,
                                                    const json& metadata) {
    EventEmitter::DeferredDispatch deferred(*emitter_);
    auto lock = repository_->lockDevice(deviceId);
    return transition(lock, target, reason, source, metadata);
}

TransitionResult DeviceLifecycleManager::transition(store::DeviceLock& lock,
                                                    LifecycleState target,
                                                    const std::string& reason,
                                                    core::EventSource source,
                                                    const json& metadata) {
    if (!lock.ownsLock()) {
        throw core::SyncException("LOCK_REQUIRED",
                                  "Transition requires the row lock of " + lock.deviceId(),
                                  core::ErrorCategory::LIFECYCLE);
    }

    auto logger = core::getLogger(core::loggers::LIFECYCLE);

    // Re-read under the lock: a concurrent winner may have moved the device
    DeviceRecord record = repository_->get(lock.deviceId());

    TransitionResult result;
    result.from = record.status;
    result.to = target;

    if (record.status == target) {
        return result;
    }

    if (!isValidTransition(record.status, target)) {
        logger->warn("Rejected transition of {} from {} to {} ({})", record.id,
                     core::lifecycleStateToString(record.status),
                     core::lifecycleStateToString(target), reason);
        throw core::InvalidTransitionError(record.id, record.status, target);
    }

    auto now = clock_->now();
    LifecycleState from = record.status;

    if (from == LifecycleState::OFFLINE && record.offlineSince) {
        if (now > *record.offlineSince) {
            record.accumulatedDowntime +=
                std::chrono::duration_cast<std::chrono::seconds>(now - *record.offlineSince);
        }
        record.offlineSince.reset();
        record.offlineReason.clear();
    }

    record.status = target;
    record.statusChangedAt = now;

    switch (target) {
        case LifecycleState::ONLINE:
            record.lastSeen = now;
            record.consecutiveErrors = 0;
            break;
        case LifecycleState::OFFLINE:
            record.offlineReason = reason;
            record.offlineSince = now;
            record.consecutiveErrors++;
            break;
        case LifecycleState::DEGRADED:
            record.consecutiveErrors++;
            break;
        default:
            break;
    }

    repository_->update(record);

    core::SyncEvent event;
    event.type = core::SyncEventType::TRANSITION;
    event.deviceId = record.id;
    event.vendorCode = record.vendorCode;
    event.fromState = from;
    event.toState = target;
    event.reason = reason;
    event.source = source;
    event.timestamp = now;
    event.metadata = metadata.is_object() ? metadata : json::object();

    result.applied = true;
    result.event = emitter_->emit(event);

    logger->info("Device {} {} -> {} ({}, source={})", record.id,
                 core::lifecycleStateToString(from), core::lifecycleStateToString(target),
                 reason, core::eventSourceToString(source));
    return result;
}

std::vector<TransitionResult> DeviceLifecycleManager::transitionVia(store::DeviceLock& lock,
                                                                    LifecycleState target,
                                                                    const std::string& reason,
                                                                    core::EventSource source,
                                                                    const json& metadata) {
    DeviceRecord record = repository_->get(lock.deviceId());
    auto route = planRoute(record.status, target);
    if (!route) {
        throw core::InvalidTransitionError(record.id, record.status, target);
    }

    std::vector<TransitionResult> applied;
    for (LifecycleState step : *route) {
        auto result = transition(lock, step, reason, source, metadata);
        if (result.applied) {
            applied.push_back(result);
        }
    }
    return applied;
}

std::vector<TransitionResult> DeviceLifecycleManager::forceTransition(const std::string& deviceId,
                                                                      LifecycleState target,
                                                                      const std::string& reason) {
    EventEmitter::DeferredDispatch deferred(*emitter_);
    auto lock = repository_->lockDevice(deviceId);
    json metadata{{"forced", true}};
    return transitionVia(lock, target, reason, core::EventSource::ADMIN, metadata);
}

bool DeviceLifecycleManager::markWrapper(const std::string& deviceId, LifecycleState target,
                                         const std::string& reason, core::EventSource source) {
    try {
        return transition(deviceId, target, reason, source).applied;
    } catch (const core::InvalidTransitionError& e) {
        core::getLogger(core::loggers::LIFECYCLE)->warn("{}", e.what());
        return false;
    }
}

bool DeviceLifecycleManager::markOnline(const std::string& deviceId, const std::string& reason,
                                        core::EventSource source) {
    return markWrapper(deviceId, LifecycleState::ONLINE, reason, source);
}

bool DeviceLifecycleManager::markDegraded(const std::string& deviceId, const std::string& reason,
                                          core::EventSource source) {
    return markWrapper(deviceId, LifecycleState::DEGRADED, reason, source);
}

bool DeviceLifecycleManager::markOffline(const std::string& deviceId, const std::string& reason,
                                         core::EventSource source) {
    return markWrapper(deviceId, LifecycleState::OFFLINE, reason, source);
}

bool DeviceLifecycleManager::markMaintenance(const std::string& deviceId,
                                             const std::string& reason,
                                             core::EventSource source) {
    return markWrapper(deviceId, LifecycleState::MAINTENANCE, reason, source);
}

bool DeviceLifecycleManager::markRetired(const std::string& deviceId, const std::string& reason,
                                         core::EventSource source) {
    return markWrapper(deviceId, LifecycleState::RETIRED, reason, source);
}

bool DeviceLifecycleManager::checkHealth(const std::string& deviceId,
                                         std::chrono::seconds stalenessThreshold) {
    EventEmitter::DeferredDispatch deferred(*emitter_);
    auto lock = repository_->lockDevice(deviceId);
    DeviceRecord record = repository_->get(deviceId);

    if (record.status != LifecycleState::ONLINE && record.status != LifecycleState::DEGRADED) {
        return false;
    }

    core::Timestamp reference = record.lastSeen ? *record.lastSeen : record.statusChangedAt;
    auto age = clock_->now() - reference;
    if (age <= stalenessThreshold) {
        return false;
    }

    json metadata{{"lastSeen", record.lastSeen ? core::formatIsoTimestamp(*record.lastSeen) : ""},
                  {"thresholdSeconds", stalenessThreshold.count()}};
    return transition(lock, LifecycleState::OFFLINE, "health check timeout",
                      core::EventSource::HEALTHCHECK, metadata)
        .applied;
}

HealthSweepSummary DeviceLifecycleManager::bulkHealthCheck(std::chrono::seconds stalenessThreshold) {
    auto logger = core::getLogger(core::loggers::LIFECYCLE);
    HealthSweepSummary summary;

    for (const auto& device : repository_->findAll()) {
        summary.checked++;
        try {
            if (checkHealth(device.id, stalenessThreshold)) {
                summary.transitioned++;
            }
        } catch (const core::SyncException& e) {
            logger->warn("Health check of {} failed: {}", device.id, e.what());
        }
    }

    for (const auto& device : repository_->findAll()) {
        switch (device.status) {
            case LifecycleState::ONLINE:
                summary.online++;
                break;
            case LifecycleState::DEGRADED:
                summary.degraded++;
                break;
            case LifecycleState::OFFLINE:
                summary.offline++;
                break;
            case LifecycleState::MAINTENANCE:
                summary.maintenance++;
                break;
            default:
                summary.other++;
                break;
        }
    }

    if (summary.transitioned > 0) {
        logger->info("Health sweep: {} checked, {} marked offline", summary.checked,
                     summary.transitioned);
    } else {
        logger->debug("Health sweep: {} checked, no stale devices", summary.checked);
    }
    return summary;
}

std::vector<core::SyncEvent> DeviceLifecycleManager::history(const std::string& deviceId) const {
    std::vector<core::SyncEvent> result;
    for (auto& event : emitter_->eventLog()->forDevice(deviceId)) {
        if (event.type == core::SyncEventType::TRANSITION) {
            result.push_back(std::move(event));
        }
    }
    return result;
}

} // namespace sync
} // namespace rfsync
