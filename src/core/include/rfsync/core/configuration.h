#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rfsync {
namespace core {

using json = nlohmann::json;

/**
 * @brief Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    void merge(const ConfigValidationResult& other, const std::string& prefix);

    std::string toString() const;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    bool enableConsole = true;
    bool enableFile = false;
    std::string logFile = "rfsync.log";
    size_t maxFileSize = 10 * 1024 * 1024;
    size_t maxFiles = 5;

    json toJson() const;
    void fromJson(const json& j);
    ConfigValidationResult validate() const;
};

/**
 * @brief Adapter construction settings for one vendor
 */
struct AdapterConfig {
    std::string type;
    json options = json::object();

    json toJson() const;
    void fromJson(const json& j);
};

/**
 * @brief Per vendor polling, rate limiting and failure handling settings
 */
struct VendorConfig {
    std::string code;
    bool enabled = true;
    std::chrono::seconds pollInterval{30};
    std::chrono::seconds pollDeadline{10};

    // Token bucket
    double rateLimitCapacity = 5.0;
    double rateLimitRefillPerSecond = 1.0;
    std::chrono::milliseconds rateLimitWaitTimeout{2000};

    // Failure handling
    std::chrono::seconds failureBackoffMax{300};
    uint32_t unavailableThreshold = 3;

    bool streamingEnabled = false;
    AdapterConfig adapter;

    json toJson() const;
    void fromJson(const json& j);
    ConfigValidationResult validate() const;
};

/**
 * @brief Staleness detection settings
 */
struct HealthConfig {
    std::chrono::seconds stalenessThreshold{300};
    std::chrono::seconds sweepInterval{60};

    json toJson() const;
    void fromJson(const json& j);
    ConfigValidationResult validate() const;
};

/**
 * @brief Streaming reconnect policy
 */
struct ConnectionRetryConfig {
    std::chrono::milliseconds baseRetryDelay{1000};
    std::chrono::milliseconds maxRetryDelay{60000};
    uint32_t maxRetryAttempts = 5;

    json toJson() const;
    void fromJson(const json& j);
    ConfigValidationResult validate() const;
};

struct StoreConfig {
    std::string snapshotPath;
    size_t eventLogCapacity = 10000;

    json toJson() const;
    void fromJson(const json& j);
    ConfigValidationResult validate() const;
};

/**
 * @brief Complete startup configuration
 *
 * Built once and shared read-only as std::shared_ptr<const SyncConfig>.
 */
struct SyncConfig {
    std::vector<VendorConfig> vendors;
    HealthConfig health;
    ConnectionRetryConfig connection;
    LoggingConfig logging;
    StoreConfig store;

    json toJson() const;
    void fromJson(const json& j);
    ConfigValidationResult validate() const;

    const VendorConfig* findVendor(const std::string& code) const;

    /**
     * @brief Overlay values from environment variables
     * @param prefix Variable prefix, e.g. RFSYNC_LOG_LEVEL
     */
    void loadFromEnvironment(const std::string& prefix = "RFSYNC_");

    /**
     * @brief Parse a configuration file
     * @throws ConfigurationError if the file is unreadable or malformed
     */
    static SyncConfig loadFromFile(const std::string& filePath);
    static SyncConfig loadFromString(const std::string& jsonString);

    /**
     * @brief Validate and freeze a configuration
     * @throws ConfigurationError listing every validation error
     */
    static std::shared_ptr<const SyncConfig> freeze(SyncConfig config);
};

} // namespace core
} // namespace rfsync
