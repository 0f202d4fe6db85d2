#pragma once

#include "rfsync/core/types.h"

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace rfsync {
namespace core {

/**
 * @brief Error category enumeration
 */
enum class ErrorCategory {
    LIFECYCLE,
    IDENTITY,
    VENDOR,
    RATE_LIMIT,
    STORAGE,
    CONFIGURATION,
    UNKNOWN
};

/**
 * @brief Base exception for structured error handling
 */
class SyncException : public std::exception {
public:
    SyncException(const std::string& errorCode, const std::string& message,
                  ErrorCategory category = ErrorCategory::UNKNOWN);

    const char* what() const noexcept override;
    const std::string& getErrorCode() const noexcept;
    ErrorCategory getCategory() const noexcept;

private:
    std::string errorCode_;
    std::string message_;
    ErrorCategory category_;
};

/**
 * @brief Rejected lifecycle transition; the device is left untouched
 */
class InvalidTransitionError : public SyncException {
public:
    InvalidTransitionError(const std::string& deviceId, LifecycleState from, LifecycleState to);

    const std::string& getDeviceId() const noexcept { return deviceId_; }
    LifecycleState getFromState() const noexcept { return from_; }
    LifecycleState getToState() const noexcept { return to_; }

private:
    std::string deviceId_;
    LifecycleState from_;
    LifecycleState to_;
};

/**
 * @brief Ambiguous identity match; requires operator resolution
 */
class IdentityConflictError : public SyncException {
public:
    IdentityConflictError(const std::string& message, std::vector<std::string> deviceIds);

    const std::vector<std::string>& getDeviceIds() const noexcept { return deviceIds_; }

private:
    std::vector<std::string> deviceIds_;
};

/**
 * @brief Classification of vendor side failures
 */
enum class VendorFailureKind {
    NETWORK,
    AUTH,
    SERVER,
    TIMEOUT
};

std::string vendorFailureKindToString(VendorFailureKind kind);

/**
 * @brief Vendor API is unreachable, rejected our credentials or failed with 5xx
 */
class VendorUnavailableError : public SyncException {
public:
    VendorUnavailableError(const std::string& vendorCode, const std::string& message,
                           VendorFailureKind kind = VendorFailureKind::NETWORK,
                           std::optional<int> statusCode = std::nullopt);

    const std::string& getVendorCode() const noexcept { return vendorCode_; }
    VendorFailureKind getKind() const noexcept { return kind_; }
    std::optional<int> getStatusCode() const noexcept { return statusCode_; }

private:
    std::string vendorCode_;
    VendorFailureKind kind_;
    std::optional<int> statusCode_;
};

/**
 * @brief No rate limiter token within the wait budget; the call is deferred
 */
class RateLimitExceeded : public SyncException {
public:
    explicit RateLimitExceeded(const std::string& vendorCode);

    const std::string& getVendorCode() const noexcept { return vendorCode_; }

private:
    std::string vendorCode_;
};

class DeviceNotFoundError : public SyncException {
public:
    explicit DeviceNotFoundError(const std::string& deviceId);
};

class ConfigurationError : public SyncException {
public:
    explicit ConfigurationError(const std::string& message);
};

} // namespace core
} // namespace rfsync
