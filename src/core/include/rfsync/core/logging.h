#pragma once

#include "rfsync/core/configuration.h"

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace rfsync {
namespace core {

/**
 * @brief Named loggers used across the engine
 */
namespace loggers {
constexpr const char* LIFECYCLE = "rfsync.lifecycle";
constexpr const char* SYNC = "rfsync.sync";
constexpr const char* DEDUP = "rfsync.dedup";
constexpr const char* POLLING = "rfsync.polling";
constexpr const char* CONNECTION = "rfsync.connection";
constexpr const char* VENDOR = "rfsync.vendor";
constexpr const char* STORE = "rfsync.store";
constexpr const char* DAEMON = "rfsync.daemon";
} // namespace loggers

/**
 * @brief Configure the shared sinks, default logger and level
 *
 * Engine loggers created before this call are replaced by loggers on the
 * new sinks; getLogger returns the replacements.
 */
void initializeLogging(const LoggingConfig& config);

/**
 * @brief Get a named logger, creating it on the shared sinks if needed
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

/**
 * @brief Flush and drop all loggers
 */
void shutdownLogging();

spdlog::level::level_enum parseLogLevel(const std::string& level);

} // namespace core
} // namespace rfsync
