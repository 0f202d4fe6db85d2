#pragma once

#include "rfsync/core/utils.h"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace rfsync {
namespace core {

using json = nlohmann::json;

/**
 * @brief Kind of RF hardware tracked by the fleet
 */
enum class DeviceKind {
    RECEIVER,
    TRANSMITTER,
    CHARGER,
    UNKNOWN
};

/**
 * @brief Canonical device lifecycle states
 */
enum class LifecycleState {
    DISCOVERED,   // Found via a vendor API, not yet configured
    PROVISIONING, // Being configured/registered
    ONLINE,       // Fully operational
    DEGRADED,     // Functional but with warnings
    OFFLINE,      // Not responding
    MAINTENANCE,  // Administratively disabled
    RETIRED       // Permanently decommissioned, terminal
};

/**
 * @brief Origin of a lifecycle change
 */
enum class EventSource {
    API,
    ADMIN,
    HEALTHCHECK
};

/**
 * @brief Kinds of records carried on the SyncEvent stream
 */
enum class SyncEventType {
    TRANSITION,
    IDENTITY_CONFLICT,
    ADDRESS_RELOCATED,
    VENDOR_UNAVAILABLE,
    VENDOR_RECOVERED
};

/**
 * @brief Streaming subscription states
 */
enum class ConnectionState {
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    ERROR,
    STOPPED
};

/**
 * @brief Vendor-neutral representation of one device's reported fields
 */
struct NormalizedRecord {
    std::string vendorCode;
    std::string vendorId;
    std::optional<std::string> serial;
    std::optional<std::string> mac;
    std::string address;
    DeviceKind kind = DeviceKind::UNKNOWN;
    std::string reportedStatus;
    std::string name;
    std::string firmwareVersion;
    json telemetry = json::object();

    json toJson() const;
    static NormalizedRecord fromJson(const json& j);
};

/**
 * @brief Canonical tracked device
 *
 * The id is assigned once by the repository and never reused. Records are
 * never deleted; RETIRED is the end of the road.
 */
struct DeviceRecord {
    std::string id;
    std::string vendorCode;
    std::string vendorId;
    std::optional<std::string> serial;
    std::optional<std::string> mac;
    std::string address;
    DeviceKind kind = DeviceKind::UNKNOWN;
    std::string name;
    std::string firmwareVersion;
    LifecycleState status = LifecycleState::DISCOVERED;
    std::optional<Timestamp> lastSeen;
    json telemetry = json::object();
    uint64_t updateCounter = 0;

    // Derived lifecycle bookkeeping
    uint32_t consecutiveErrors = 0;
    std::string offlineReason;
    std::optional<Timestamp> offlineSince;
    std::chrono::seconds accumulatedDowntime{0};
    Timestamp createdAt;
    Timestamp statusChangedAt;

    json toJson() const;
    static DeviceRecord fromJson(const json& j);
};

/**
 * @brief Append-only audit record
 *
 * fromState/toState are only set for TRANSITION events.
 */
struct SyncEvent {
    uint64_t sequence = 0;
    SyncEventType type = SyncEventType::TRANSITION;
    std::string deviceId;
    std::string vendorCode;
    std::optional<LifecycleState> fromState;
    std::optional<LifecycleState> toState;
    std::string reason;
    EventSource source = EventSource::API;
    Timestamp timestamp;
    json metadata = json::object();

    json toJson() const;
};

/**
 * @brief Per device, per subscription streaming connection row
 */
struct ConnectionRecord {
    std::string deviceId;
    std::string vendorCode;
    std::string subscription = "stream";
    ConnectionState state = ConnectionState::STOPPED;
    uint32_t retryCount = 0;
    uint32_t errorCount = 0;
    std::optional<Timestamp> nextRetryAt;
    std::string lastError;
    std::optional<Timestamp> connectedAt;
    std::optional<Timestamp> lastMessageAt;
    std::optional<Timestamp> disconnectedAt;

    json toJson() const;
};

/**
 * @brief Address relocation history entry
 */
struct MovementRecord {
    std::string deviceId;
    std::string oldAddress;
    std::string newAddress;
    std::string matchedKey;
    Timestamp detectedAt;

    json toJson() const;
};

/**
 * @brief Helper functions for enum conversions
 */
std::string deviceKindToString(DeviceKind kind);
DeviceKind stringToDeviceKind(const std::string& kind);

std::string lifecycleStateToString(LifecycleState state);
std::optional<LifecycleState> stringToLifecycleState(const std::string& state);

std::string eventSourceToString(EventSource source);
std::string syncEventTypeToString(SyncEventType type);
std::string connectionStateToString(ConnectionState state);

/**
 * @brief States in which a device is considered active
 */
bool isActiveState(LifecycleState state);

/**
 * @brief States in which a device is considered inactive
 */
bool isInactiveState(LifecycleState state);

} // namespace core
} // namespace rfsync
