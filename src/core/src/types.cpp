#include "rfsync/core/types.h"

namespace rfsync {
namespace core {

namespace {

json optionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> readOptionalString(const json& j,
                                              const char* key) {
    if (j.contains(key) && j[key].is_string() &&
        !j[key].get<std::string>().empty()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

json optionalTimestamp(const std::optional<Timestamp>& value) {
    return value ? json(formatIsoTimestamp(*value)) : json(nullptr);
}

std::optional<Timestamp> readOptionalTimestamp(const json& j,
                                               const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return string_utils::parseIsoTimestamp(j[key].get<std::string>());
    }
    return std::nullopt;
}

} // namespace

// NormalizedRecord implementation
json NormalizedRecord::toJson() const {
    return json{{"vendorCode", vendorCode},
                {"vendorId", vendorId},
                {"serial", optionalString(serial)},
                {"mac", optionalString(mac)},
                {"address", address},
                {"kind", deviceKindToString(kind)},
                {"reportedStatus", reportedStatus},
                {"name", name},
                {"firmwareVersion", firmwareVersion},
                {"telemetry", telemetry}};
}

NormalizedRecord NormalizedRecord::fromJson(const json& j) {
    NormalizedRecord record;
    record.vendorCode = j.value("vendorCode", "");
    record.vendorId = j.value("vendorId", "");
    record.serial = readOptionalString(j, "serial");
    record.mac = readOptionalString(j, "mac");
    record.address = j.value("address", "");
    record.kind = stringToDeviceKind(j.value("kind", "unknown"));
    record.reportedStatus = j.value("reportedStatus", "");
    record.name = j.value("name", "");
    record.firmwareVersion = j.value("firmwareVersion", "");
    record.telemetry = j.value("telemetry", json::object());
    return record;
}

// DeviceRecord implementation
json DeviceRecord::toJson() const {
    return json{{"id", id},
                {"vendorCode", vendorCode},
                {"vendorId", vendorId},
                {"serial", optionalString(serial)},
                {"mac", optionalString(mac)},
                {"address", address},
                {"kind", deviceKindToString(kind)},
                {"name", name},
                {"firmwareVersion", firmwareVersion},
                {"status", lifecycleStateToString(status)},
                {"lastSeen", optionalTimestamp(lastSeen)},
                {"telemetry", telemetry},
                {"updateCounter", updateCounter},
                {"consecutiveErrors", consecutiveErrors},
                {"offlineReason", offlineReason},
                {"offlineSince", optionalTimestamp(offlineSince)},
                {"accumulatedDowntimeSeconds", accumulatedDowntime.count()},
                {"createdAt", formatIsoTimestamp(createdAt)},
                {"statusChangedAt", formatIsoTimestamp(statusChangedAt)}};
}

DeviceRecord DeviceRecord::fromJson(const json& j) {
    DeviceRecord record;
    record.id = j.value("id", "");
    record.vendorCode = j.value("vendorCode", "");
    record.vendorId = j.value("vendorId", "");
    record.serial = readOptionalString(j, "serial");
    record.mac = readOptionalString(j, "mac");
    record.address = j.value("address", "");
    record.kind = stringToDeviceKind(j.value("kind", "unknown"));
    record.name = j.value("name", "");
    record.firmwareVersion = j.value("firmwareVersion", "");
    record.status = stringToLifecycleState(j.value("status", "discovered"))
                        .value_or(LifecycleState::DISCOVERED);
    record.lastSeen = readOptionalTimestamp(j, "lastSeen");
    record.telemetry = j.value("telemetry", json::object());
    record.updateCounter = j.value("updateCounter", uint64_t{0});
    record.consecutiveErrors = j.value("consecutiveErrors", uint32_t{0});
    record.offlineReason = j.value("offlineReason", "");
    record.offlineSince = readOptionalTimestamp(j, "offlineSince");
    record.accumulatedDowntime =
        std::chrono::seconds(j.value("accumulatedDowntimeSeconds", int64_t{0}));
    record.createdAt =
        readOptionalTimestamp(j, "createdAt").value_or(Timestamp{});
    record.statusChangedAt =
        readOptionalTimestamp(j, "statusChangedAt").value_or(record.createdAt);
    return record;
}

// SyncEvent implementation
json SyncEvent::toJson() const {
    json j{{"sequence", sequence},
           {"type", syncEventTypeToString(type)},
           {"deviceId", deviceId},
           {"vendorCode", vendorCode},
           {"reason", reason},
           {"source", eventSourceToString(source)},
           {"timestamp", formatIsoTimestamp(timestamp)},
           {"metadata", metadata}};
    j["fromState"] =
        fromState ? json(lifecycleStateToString(*fromState)) : json(nullptr);
    j["toState"] =
        toState ? json(lifecycleStateToString(*toState)) : json(nullptr);
    return j;
}

// ConnectionRecord implementation
json ConnectionRecord::toJson() const {
    return json{{"deviceId", deviceId},
                {"vendorCode", vendorCode},
                {"subscription", subscription},
                {"state", connectionStateToString(state)},
                {"retryCount", retryCount},
                {"errorCount", errorCount},
                {"nextRetryAt", optionalTimestamp(nextRetryAt)},
                {"lastError", lastError},
                {"connectedAt", optionalTimestamp(connectedAt)},
                {"lastMessageAt", optionalTimestamp(lastMessageAt)},
                {"disconnectedAt", optionalTimestamp(disconnectedAt)}};
}

json MovementRecord::toJson() const {
    return json{{"deviceId", deviceId},
                {"oldAddress", oldAddress},
                {"newAddress", newAddress},
                {"matchedKey", matchedKey},
                {"detectedAt", formatIsoTimestamp(detectedAt)}};
}

// Helper function implementations
std::string deviceKindToString(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::RECEIVER: return "receiver";
        case DeviceKind::TRANSMITTER: return "transmitter";
        case DeviceKind::CHARGER: return "charger";
        default: return "unknown";
    }
}

DeviceKind stringToDeviceKind(const std::string& kind) {
    const std::string lower = string_utils::toLower(kind);
    if (lower == "receiver") return DeviceKind::RECEIVER;
    if (lower == "transmitter") return DeviceKind::TRANSMITTER;
    if (lower == "charger") return DeviceKind::CHARGER;
    return DeviceKind::UNKNOWN;
}

std::string lifecycleStateToString(LifecycleState state) {
    switch (state) {
        case LifecycleState::DISCOVERED: return "discovered";
        case LifecycleState::PROVISIONING: return "provisioning";
        case LifecycleState::ONLINE: return "online";
        case LifecycleState::DEGRADED: return "degraded";
        case LifecycleState::OFFLINE: return "offline";
        case LifecycleState::MAINTENANCE: return "maintenance";
        case LifecycleState::RETIRED: return "retired";
        default: return "unknown";
    }
}

std::optional<LifecycleState> stringToLifecycleState(const std::string& state) {
    const std::string lower = string_utils::toLower(state);
    if (lower == "discovered") return LifecycleState::DISCOVERED;
    if (lower == "provisioning") return LifecycleState::PROVISIONING;
    if (lower == "online") return LifecycleState::ONLINE;
    if (lower == "degraded") return LifecycleState::DEGRADED;
    if (lower == "offline") return LifecycleState::OFFLINE;
    if (lower == "maintenance") return LifecycleState::MAINTENANCE;
    if (lower == "retired") return LifecycleState::RETIRED;
    return std::nullopt;
}

std::string eventSourceToString(EventSource source) {
    switch (source) {
        case EventSource::API: return "api";
        case EventSource::ADMIN: return "admin";
        case EventSource::HEALTHCHECK: return "healthcheck";
        default: return "unknown";
    }
}

std::string syncEventTypeToString(SyncEventType type) {
    switch (type) {
        case SyncEventType::TRANSITION: return "transition";
        case SyncEventType::IDENTITY_CONFLICT: return "identity_conflict";
        case SyncEventType::ADDRESS_RELOCATED: return "address_relocated";
        case SyncEventType::VENDOR_UNAVAILABLE: return "vendor_unavailable";
        case SyncEventType::VENDOR_RECOVERED: return "vendor_recovered";
        default: return "unknown";
    }
}

std::string connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::ERROR: return "error";
        case ConnectionState::STOPPED: return "stopped";
        default: return "unknown";
    }
}

bool isActiveState(LifecycleState state) {
    return state == LifecycleState::ONLINE ||
           state == LifecycleState::DEGRADED ||
           state == LifecycleState::PROVISIONING;
}

bool isInactiveState(LifecycleState state) {
    return state == LifecycleState::OFFLINE ||
           state == LifecycleState::MAINTENANCE ||
           state == LifecycleState::RETIRED;
}

} // namespace core
} // namespace rfsync
