#include "rfsync/core/errors.h"

#include <sstream>

namespace rfsync {
namespace core {

SyncException::SyncException(const std::string& errorCode, const std::string& message,
                             ErrorCategory category)
    : errorCode_(errorCode), message_(message), category_(category) {}

const char* SyncException::what() const noexcept {
    return message_.c_str();
}

const std::string& SyncException::getErrorCode() const noexcept {
    return errorCode_;
}

ErrorCategory SyncException::getCategory() const noexcept {
    return category_;
}

InvalidTransitionError::InvalidTransitionError(const std::string& deviceId, LifecycleState from,
                                               LifecycleState to)
    : SyncException("INVALID_TRANSITION",
                    "Invalid transition for device " + deviceId + ": " +
                        lifecycleStateToString(from) + " -> " + lifecycleStateToString(to),
                    ErrorCategory::LIFECYCLE),
      deviceId_(deviceId), from_(from), to_(to) {}

IdentityConflictError::IdentityConflictError(const std::string& message,
                                             std::vector<std::string> deviceIds)
    : SyncException("IDENTITY_CONFLICT", message, ErrorCategory::IDENTITY),
      deviceIds_(std::move(deviceIds)) {}

std::string vendorFailureKindToString(VendorFailureKind kind) {
    switch (kind) {
        case VendorFailureKind::NETWORK: return "network";
        case VendorFailureKind::AUTH: return "auth";
        case VendorFailureKind::SERVER: return "server";
        case VendorFailureKind::TIMEOUT: return "timeout";
        default: return "unknown";
    }
}

namespace {

std::string describeVendorFailure(const std::string& vendorCode, const std::string& message,
                                  VendorFailureKind kind, std::optional<int> statusCode) {
    std::ostringstream ss;
    ss << "Vendor " << vendorCode << " unavailable (" << vendorFailureKindToString(kind);
    if (statusCode) {
        ss << ", status " << *statusCode;
    }
    ss << "): " << message;
    return ss.str();
}

} // namespace

VendorUnavailableError::VendorUnavailableError(const std::string& vendorCode,
                                               const std::string& message,
                                               VendorFailureKind kind,
                                               std::optional<int> statusCode)
    : SyncException("VENDOR_UNAVAILABLE",
                    describeVendorFailure(vendorCode, message, kind, statusCode),
                    ErrorCategory::VENDOR),
      vendorCode_(vendorCode), kind_(kind), statusCode_(statusCode) {}

RateLimitExceeded::RateLimitExceeded(const std::string& vendorCode)
    : SyncException("RATE_LIMITED", "Rate limit exceeded for vendor " + vendorCode,
                    ErrorCategory::RATE_LIMIT),
      vendorCode_(vendorCode) {}

DeviceNotFoundError::DeviceNotFoundError(const std::string& deviceId)
    : SyncException("DEVICE_NOT_FOUND", "Device not found: " + deviceId,
                    ErrorCategory::STORAGE) {}

ConfigurationError::ConfigurationError(const std::string& message)
    : SyncException("CONFIGURATION_ERROR", message, ErrorCategory::CONFIGURATION) {}

} // namespace core
} // namespace rfsync
