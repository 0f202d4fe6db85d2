#pragma once

#include "rfsync/core/clock.h"
#include "rfsync/core/types.h"
#include "rfsync/store/device_repository.h"
#include "rfsync/sync/event_emitter.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rfsync {
namespace sync {

using json = nlohmann::json;

/**
 * @brief Result of a transition request
 *
 * applied is false when the device was already in the target state.
 */
struct TransitionResult {
    bool applied = false;
    core::LifecycleState from = core::LifecycleState::DISCOVERED;
    core::LifecycleState to = core::LifecycleState::DISCOVERED;
    std::optional<core::SyncEvent> event;
};

/**
 * @brief Counts produced by a health sweep over all devices
 */
struct HealthSweepSummary {
    size_t checked = 0;
    size_t transitioned = 0;
    size_t online = 0;
    size_t degraded = 0;
    size_t offline = 0;
    size_t maintenance = 0;
    size_t other = 0;

    json toJson() const;
};

/**
 * @brief Owns the device lifecycle state machine
 *
 * All status writes go through here. Each transition holds the device's
 * row lock across read-validate-write, so concurrent callers on the same
 * device are totally ordered and losers re-validate against the winner's
 * result.
 */
class DeviceLifecycleManager {
public:
    DeviceLifecycleManager(std::shared_ptr<store::IDeviceRepository> repository,
                           std::shared_ptr<EventEmitter> emitter,
                           std::shared_ptr<core::IClock> clock);

    /**
     * @brief Directed transition table; retired has no outgoing edges
     */
    static const std::map<core::LifecycleState, std::set<core::LifecycleState>>&
    transitionTable();

    static bool isValidTransition(core::LifecycleState from, core::LifecycleState to);
    static std::vector<core::LifecycleState> validNextStates(core::LifecycleState state);

    /**
     * @brief Shortest sequence of valid transitions from one state to another
     * @return States to pass through, ending with to; empty when from == to;
     *         std::nullopt when to is unreachable
     */
    static std::optional<std::vector<core::LifecycleState>> planRoute(core::LifecycleState from,
                                                                      core::LifecycleState to);

    /**
     * @brief Validate and apply a transition
     * @throws core::InvalidTransitionError if target is not reachable in one step
     * @throws core::DeviceNotFoundError
     */
    TransitionResult transition(const std::string& deviceId, core::LifecycleState target,
                                const std::string& reason,
                                core::EventSource source = core::EventSource::API,
                                const json& metadata = json::object());

    /**
     * @brief Same as transition() for a caller already holding the device lock
     *
     * Callers open an EventEmitter::DeferredDispatch before taking the lock so
     * listeners are notified after it is released.
     */
    TransitionResult transition(store::DeviceLock& lock, core::LifecycleState target,
                                const std::string& reason,
                                core::EventSource source = core::EventSource::API,
                                const json& metadata = json::object());

    /**
     * @brief Walk the shortest valid route to target under one lock
     * @return The transitions applied, in order
     * @throws core::InvalidTransitionError if target is unreachable
     */
    std::vector<TransitionResult> transitionVia(store::DeviceLock& lock,
                                                core::LifecycleState target,
                                                const std::string& reason,
                                                core::EventSource source,
                                                const json& metadata = json::object());

    /**
     * @brief Administrative transition along the shortest valid route
     * @throws core::InvalidTransitionError if target is unreachable (e.g. from retired)
     */
    std::vector<TransitionResult> forceTransition(const std::string& deviceId,
                                                  core::LifecycleState target,
                                                  const std::string& reason);

    // Convenience wrappers; rejected transitions are logged and return false
    bool markOnline(const std::string& deviceId, const std::string& reason = "device online",
                    core::EventSource source = core::EventSource::API);
    bool markDegraded(const std::string& deviceId, const std::string& reason = "device degraded",
                      core::EventSource source = core::EventSource::API);
    bool markOffline(const std::string& deviceId, const std::string& reason = "device offline",
                     core::EventSource source = core::EventSource::API);
    bool markMaintenance(const std::string& deviceId,
                         const std::string& reason = "maintenance mode",
                         core::EventSource source = core::EventSource::ADMIN);
    bool markRetired(const std::string& deviceId, const std::string& reason = "device retired",
                     core::EventSource source = core::EventSource::ADMIN);

    /**
     * @brief Take an online or degraded device offline if last-seen is stale
     * @return True if this call transitioned the device
     */
    bool checkHealth(const std::string& deviceId, std::chrono::seconds stalenessThreshold);

    /**
     * @brief Run checkHealth over every device and count states afterwards
     */
    HealthSweepSummary bulkHealthCheck(std::chrono::seconds stalenessThreshold);

    /**
     * @brief Transition events recorded for a device, oldest first
     */
    std::vector<core::SyncEvent> history(const std::string& deviceId) const;

    std::shared_ptr<core::IClock> clock() const { return clock_; }

private:
    bool markWrapper(const std::string& deviceId, core::LifecycleState target,
                     const std::string& reason, core::EventSource source);

    std::shared_ptr<store::IDeviceRepository> repository_;
    std::shared_ptr<EventEmitter> emitter_;
    std::shared_ptr<core::IClock> clock_;
};

} // namespace sync
} // namespace rfsync
