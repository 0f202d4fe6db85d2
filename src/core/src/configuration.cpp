#include "rfsync/core/configuration.h"
#include "rfsync/core/errors.h"
#include "rfsync/core/utils.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace rfsync {
namespace core {

// ConfigValidationResult implementation
void ConfigValidationResult::merge(const ConfigValidationResult& other, const std::string& prefix) {
    for (const auto& error : other.errors) {
        addError(prefix + error);
    }
    for (const auto& warning : other.warnings) {
        addWarning(prefix + warning);
    }
}

std::string ConfigValidationResult::toString() const {
    std::stringstream ss;
    ss << "Validation " << (isValid ? "PASSED" : "FAILED") << "\n";

    if (!errors.empty()) {
        ss << "Errors:\n";
        for (const auto& error : errors) {
            ss << "  - " << error << "\n";
        }
    }

    if (!warnings.empty()) {
        ss << "Warnings:\n";
        for (const auto& warning : warnings) {
            ss << "  - " << warning << "\n";
        }
    }

    return ss.str();
}

// LoggingConfig implementation
json LoggingConfig::toJson() const {
    json j;
    j["level"] = level;
    j["pattern"] = pattern;
    j["enableConsole"] = enableConsole;
    j["enableFile"] = enableFile;
    j["logFile"] = logFile;
    j["maxFileSize"] = maxFileSize;
    j["maxFiles"] = maxFiles;
    return j;
}

void LoggingConfig::fromJson(const json& j) {
    level = j.value("level", level);
    pattern = j.value("pattern", pattern);
    enableConsole = j.value("enableConsole", enableConsole);
    enableFile = j.value("enableFile", enableFile);
    logFile = j.value("logFile", logFile);
    maxFileSize = j.value("maxFileSize", maxFileSize);
    maxFiles = j.value("maxFiles", maxFiles);
}

ConfigValidationResult LoggingConfig::validate() const {
    ConfigValidationResult result;

    static const std::set<std::string> levels{"trace", "debug", "info", "warn",
                                              "warning", "error", "critical", "off"};
    if (levels.count(string_utils::toLower(level)) == 0) {
        result.addWarning("Unknown log level '" + level + "', falling back to info");
    }

    if (!enableConsole && !enableFile) {
        result.addWarning("Both console and file logging are disabled");
    }

    if (enableFile && logFile.empty()) {
        result.addError("File logging enabled but no log file specified");
    }

    if (maxFileSize == 0) {
        result.addError("Max file size must be positive");
    }

    if (maxFiles == 0) {
        result.addError("Max files must be positive");
    }

    return result;
}

// AdapterConfig implementation
json AdapterConfig::toJson() const {
    return json{{"type", type}, {"options", options}};
}

void AdapterConfig::fromJson(const json& j) {
    type = j.value("type", type);
    options = j.value("options", json::object());
}

// VendorConfig implementation
json VendorConfig::toJson() const {
    json j;
    j["code"] = code;
    j["enabled"] = enabled;
    j["pollIntervalSeconds"] = pollInterval.count();
    j["pollDeadlineSeconds"] = pollDeadline.count();
    j["rateLimitCapacity"] = rateLimitCapacity;
    j["rateLimitRefillPerSecond"] = rateLimitRefillPerSecond;
    j["rateLimitWaitTimeoutMs"] = rateLimitWaitTimeout.count();
    j["failureBackoffMaxSeconds"] = failureBackoffMax.count();
    j["unavailableThreshold"] = unavailableThreshold;
    j["streamingEnabled"] = streamingEnabled;
    j["adapter"] = adapter.toJson();
    return j;
}

void VendorConfig::fromJson(const json& j) {
    code = j.value("code", code);
    enabled = j.value("enabled", enabled);
    pollInterval = std::chrono::seconds(j.value("pollIntervalSeconds", pollInterval.count()));
    pollDeadline = std::chrono::seconds(j.value("pollDeadlineSeconds", pollDeadline.count()));
    rateLimitCapacity = j.value("rateLimitCapacity", rateLimitCapacity);
    rateLimitRefillPerSecond = j.value("rateLimitRefillPerSecond", rateLimitRefillPerSecond);
    rateLimitWaitTimeout =
        std::chrono::milliseconds(j.value("rateLimitWaitTimeoutMs", rateLimitWaitTimeout.count()));
    failureBackoffMax =
        std::chrono::seconds(j.value("failureBackoffMaxSeconds", failureBackoffMax.count()));
    unavailableThreshold = j.value("unavailableThreshold", unavailableThreshold);
    streamingEnabled = j.value("streamingEnabled", streamingEnabled);
    if (j.contains("adapter")) {
        adapter.fromJson(j["adapter"]);
    }
}

ConfigValidationResult VendorConfig::validate() const {
    ConfigValidationResult result;

    if (code.empty()) {
        result.addError("Vendor code cannot be empty");
    }

    if (pollInterval.count() <= 0) {
        result.addError("Poll interval must be positive");
    }

    if (pollDeadline.count() <= 0) {
        result.addError("Poll deadline must be positive");
    } else if (pollDeadline > pollInterval) {
        result.addWarning("Poll deadline exceeds poll interval");
    }

    if (rateLimitCapacity < 1.0) {
        result.addError("Rate limit capacity must be at least 1");
    }

    if (rateLimitRefillPerSecond <= 0.0) {
        result.addError("Rate limit refill rate must be positive");
    }

    if (rateLimitWaitTimeout.count() < 0) {
        result.addError("Rate limit wait timeout cannot be negative");
    }

    if (failureBackoffMax < pollInterval) {
        result.addWarning("Failure backoff cap is shorter than the poll interval");
    }

    if (unavailableThreshold == 0) {
        result.addError("Unavailable threshold must be at least 1");
    }

    if (adapter.type.empty()) {
        result.addError("Adapter type must be specified");
    }

    return result;
}

// HealthConfig implementation
json HealthConfig::toJson() const {
    return json{{"stalenessThresholdSeconds", stalenessThreshold.count()},
                {"sweepIntervalSeconds", sweepInterval.count()}};
}

void HealthConfig::fromJson(const json& j) {
    stalenessThreshold =
        std::chrono::seconds(j.value("stalenessThresholdSeconds", stalenessThreshold.count()));
    sweepInterval = std::chrono::seconds(j.value("sweepIntervalSeconds", sweepInterval.count()));
}

ConfigValidationResult HealthConfig::validate() const {
    ConfigValidationResult result;

    if (stalenessThreshold.count() <= 0) {
        result.addError("Staleness threshold must be positive");
    }

    if (sweepInterval.count() <= 0) {
        result.addError("Health sweep interval must be positive");
    }

    return result;
}

// ConnectionRetryConfig implementation
json ConnectionRetryConfig::toJson() const {
    return json{{"baseRetryDelayMs", baseRetryDelay.count()},
                {"maxRetryDelayMs", maxRetryDelay.count()},
                {"maxRetryAttempts", maxRetryAttempts}};
}

void ConnectionRetryConfig::fromJson(const json& j) {
    baseRetryDelay = std::chrono::milliseconds(j.value("baseRetryDelayMs", baseRetryDelay.count()));
    maxRetryDelay = std::chrono::milliseconds(j.value("maxRetryDelayMs", maxRetryDelay.count()));
    maxRetryAttempts = j.value("maxRetryAttempts", maxRetryAttempts);
}

ConfigValidationResult ConnectionRetryConfig::validate() const {
    ConfigValidationResult result;

    if (baseRetryDelay.count() <= 0) {
        result.addError("Base retry delay must be positive");
    }

    if (maxRetryDelay < baseRetryDelay) {
        result.addError("Max retry delay must not be shorter than the base delay");
    }

    if (maxRetryAttempts == 0) {
        result.addWarning("Max retry attempts is 0, streaming connections will not reconnect");
    }

    return result;
}

// StoreConfig implementation
json StoreConfig::toJson() const {
    return json{{"snapshotPath", snapshotPath}, {"eventLogCapacity", eventLogCapacity}};
}

void StoreConfig::fromJson(const json& j) {
    snapshotPath = j.value("snapshotPath", snapshotPath);
    eventLogCapacity = j.value("eventLogCapacity", eventLogCapacity);
}

ConfigValidationResult StoreConfig::validate() const {
    ConfigValidationResult result;

    if (eventLogCapacity == 0) {
        result.addError("Event log capacity must be positive");
    }

    if (snapshotPath.empty()) {
        result.addWarning("No snapshot path configured, device state is not persisted");
    }

    return result;
}

// SyncConfig implementation
json SyncConfig::toJson() const {
    json j;
    j["vendors"] = json::array();
    for (const auto& vendor : vendors) {
        j["vendors"].push_back(vendor.toJson());
    }
    j["health"] = health.toJson();
    j["connection"] = connection.toJson();
    j["logging"] = logging.toJson();
    j["store"] = store.toJson();
    return j;
}

void SyncConfig::fromJson(const json& j) {
    if (j.contains("vendors") && j["vendors"].is_array()) {
        vendors.clear();
        for (const auto& vendorJson : j["vendors"]) {
            VendorConfig vendor;
            vendor.fromJson(vendorJson);
            vendors.push_back(vendor);
        }
    }
    if (j.contains("health")) {
        health.fromJson(j["health"]);
    }
    if (j.contains("connection")) {
        connection.fromJson(j["connection"]);
    }
    if (j.contains("logging")) {
        logging.fromJson(j["logging"]);
    }
    if (j.contains("store")) {
        store.fromJson(j["store"]);
    }
}

ConfigValidationResult SyncConfig::validate() const {
    ConfigValidationResult result;

    if (vendors.empty()) {
        result.addWarning("No vendors configured");
    }

    std::set<std::string> codes;
    for (const auto& vendor : vendors) {
        if (!codes.insert(vendor.code).second) {
            result.addError("Duplicate vendor code: " + vendor.code);
        }
        result.merge(vendor.validate(), "vendors[" + vendor.code + "]: ");
    }

    result.merge(health.validate(), "health: ");
    result.merge(connection.validate(), "connection: ");
    result.merge(logging.validate(), "logging: ");
    result.merge(store.validate(), "store: ");

    return result;
}

const VendorConfig* SyncConfig::findVendor(const std::string& code) const {
    for (const auto& vendor : vendors) {
        if (vendor.code == code) {
            return &vendor;
        }
    }
    return nullptr;
}

void SyncConfig::loadFromEnvironment(const std::string& prefix) {
    auto readEnv = [&prefix](const char* name) -> const char* {
        return std::getenv((prefix + name).c_str());
    };

    auto readSeconds = [&](const char* name, std::chrono::seconds& target) {
        if (const char* value = readEnv(name)) {
            try {
                target = std::chrono::seconds(std::stoll(value));
            } catch (const std::exception&) {
                throw ConfigurationError(prefix + name + " is not a number: " + value);
            }
        }
    };

    if (const char* value = readEnv("LOG_LEVEL")) {
        logging.level = value;
    }
    if (const char* value = readEnv("LOG_FILE")) {
        logging.logFile = value;
        logging.enableFile = true;
    }
    if (const char* value = readEnv("LOG_CONSOLE")) {
        logging.enableConsole = parseBoolean(value);
    }
    if (const char* value = readEnv("SNAPSHOT_PATH")) {
        store.snapshotPath = value;
    }
    readSeconds("STALENESS_THRESHOLD_SECONDS", health.stalenessThreshold);
    readSeconds("HEALTH_SWEEP_SECONDS", health.sweepInterval);
    if (const char* value = readEnv("RETRY_MAX_ATTEMPTS")) {
        try {
            connection.maxRetryAttempts = static_cast<uint32_t>(std::stoul(value));
        } catch (const std::exception&) {
            throw ConfigurationError(prefix + "RETRY_MAX_ATTEMPTS is not a number: " + value);
        }
    }
}

SyncConfig SyncConfig::loadFromFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open configuration file: " + filePath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    spdlog::debug("Loading configuration from {}", filePath);
    return loadFromString(buffer.str());
}

SyncConfig SyncConfig::loadFromString(const std::string& jsonString) {
    SyncConfig config;
    try {
        config.fromJson(json::parse(jsonString));
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Malformed configuration: ") + e.what());
    }
    return config;
}

std::shared_ptr<const SyncConfig> SyncConfig::freeze(SyncConfig config) {
    auto result = config.validate();
    for (const auto& warning : result.warnings) {
        spdlog::warn("Configuration: {}", warning);
    }
    if (!result.isValid) {
        throw ConfigurationError(result.toString());
    }
    return std::make_shared<const SyncConfig>(std::move(config));
}

} // namespace core
} // namespace rfsync
