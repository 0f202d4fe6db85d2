#include "rfsync/core/logging.h"
#include "rfsync/core/utils.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace rfsync {
namespace core {

namespace {

constexpr const char* kLoggerPrefix = "rfsync.";

std::mutex loggingMutex;
std::vector<spdlog::sink_ptr> sharedSinks;
spdlog::level::level_enum sharedLevel = spdlog::level::info;
bool configured = false;

std::vector<spdlog::sink_ptr>& sinksLocked() {
    if (!configured && sharedSinks.empty()) {
        sharedSinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    return sharedSinks;
}

std::shared_ptr<spdlog::logger> makeLoggerLocked(const std::string& name) {
    auto& sinks = sinksLocked();
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(sharedLevel);
    return logger;
}

} // namespace

spdlog::level::level_enum parseLogLevel(const std::string& level) {
    std::string lower = string_utils::toLower(level);
    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error")
        return spdlog::level::err;
    if (lower == "critical")
        return spdlog::level::critical;
    if (lower == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

void initializeLogging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(loggingMutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enableConsole) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (config.enableFile) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logFile, config.maxFileSize, config.maxFiles));
    }
    for (auto& sink : sinks) {
        sink->set_pattern(config.pattern);
    }

    sharedSinks = sinks;
    configured = true;
    sharedLevel = parseLogLevel(config.level);

    auto defaultLogger = std::make_shared<spdlog::logger>("rfsync", sharedSinks.begin(),
                                                          sharedSinks.end());
    defaultLogger->set_level(sharedLevel);
    spdlog::set_default_logger(defaultLogger);

    // Replace engine loggers rather than editing their sink lists; threads
    // still holding an old logger keep writing to the old sinks safely
    std::vector<std::string> names;
    spdlog::apply_all([&names](const std::shared_ptr<spdlog::logger>& logger) {
        if (logger->name().rfind(kLoggerPrefix, 0) == 0) {
            names.push_back(logger->name());
        }
    });
    for (const auto& name : names) {
        spdlog::drop(name);
        spdlog::register_logger(makeLoggerLocked(name));
    }
    spdlog::set_level(sharedLevel);
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(loggingMutex);

    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    logger = makeLoggerLocked(name);
    spdlog::register_logger(logger);
    return logger;
}

void shutdownLogging() {
    std::lock_guard<std::mutex> lock(loggingMutex);
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
    spdlog::drop_all();
    sharedSinks.clear();
    configured = false;
}

} // namespace core
} // namespace rfsync
