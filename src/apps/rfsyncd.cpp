#include "rfsync/connection/subscription_manager.h"
#include "rfsync/core/configuration.h"
#include "rfsync/core/errors.h"
#include "rfsync/core/logging.h"
#include "rfsync/core/scheduler.h"
#include "rfsync/polling/polling_orchestrator.h"
#include "rfsync/polling/rate_limiter.h"
#include "rfsync/store/connection_repository.h"
#include "rfsync/store/in_memory_device_repository.h"
#include "rfsync/store/movement_log.h"
#include "rfsync/store/sync_event_log.h"
#include "rfsync/sync/event_emitter.h"
#include "rfsync/sync/lifecycle_manager.h"
#include "rfsync/sync/sync_coordinator.h"
#include "rfsync/vendor/vendor_registry.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <set>
#include <string>
#include <thread>

using namespace rfsync;

namespace {

volatile std::sig_atomic_t shutdownRequested = 0;

void signalHandler(int) {
    shutdownRequested = 1;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json>\n"
              << "Environment overrides use the RFSYNC_ prefix (e.g. RFSYNC_LOG_LEVEL).\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::shared_ptr<const core::SyncConfig> config;
    try {
        auto loaded = core::SyncConfig::loadFromFile(argv[1]);
        loaded.loadFromEnvironment("RFSYNC_");
        config = core::SyncConfig::freeze(std::move(loaded));
    } catch (const core::ConfigurationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    core::initializeLogging(config->logging);
    auto logger = core::getLogger(core::loggers::DAEMON);

    try {
        auto clock = core::SystemClock::instance();

        // Store
        auto devices = std::make_shared<store::InMemoryDeviceRepository>();
        if (!config->store.snapshotPath.empty()) {
            devices->loadSnapshot(config->store.snapshotPath);
        }
        auto connections = std::make_shared<store::InMemoryConnectionRepository>();
        auto eventLog = std::make_shared<store::InMemorySyncEventLog>(config->store.eventLogCapacity);
        auto movements = std::make_shared<store::InMemoryMovementLog>();

        auto emitter = std::make_shared<sync::EventEmitter>(eventLog);
        emitter->subscribe([logger](const core::SyncEvent& event) {
            logger->info("event #{} {}", event.sequence, event.toJson().dump());
        });

        // Vendors
        auto registry = vendor::createRegistry(*config);

        // Engine
        auto lifecycle = std::make_shared<sync::DeviceLifecycleManager>(devices, emitter, clock);
        auto coordinator = std::make_shared<sync::SyncCoordinator>(devices, lifecycle, emitter,
                                                                   movements, registry, clock);

        auto scheduler = std::make_shared<core::ThreadPoolScheduler>(
            std::max<size_t>(4, registry->size() + 2), clock);

        std::set<std::string> streamingVendors;
        for (const auto& vendor : config->vendors) {
            if (vendor.enabled && vendor.streamingEnabled) {
                streamingVendors.insert(vendor.code);
            }
        }
        std::weak_ptr<sync::SyncCoordinator> weakCoordinator = coordinator;
        auto subscriptions = std::make_shared<connection::SubscriptionManager>(
            devices, registry, connections, scheduler,
            connection::RetryPolicy::fromConfig(config->connection), streamingVendors,
            [weakCoordinator](const std::string& vendorCode, const core::NormalizedRecord& record) {
                if (auto coordinator = weakCoordinator.lock()) {
                    coordinator->applyInbound(vendorCode, {record});
                }
            });

        auto limiters = polling::RateLimiterRegistry::fromConfig(*config, clock);
        auto orchestrator = std::make_shared<polling::PollingOrchestrator>(
            config, registry, coordinator, lifecycle, limiters, emitter, scheduler, subscriptions);

        for (const auto& code : registry->vendorCodes()) {
            orchestrator->checkVendorHealth(code);
        }

        scheduler->start();
        orchestrator->start();
        logger->info("rfsyncd running with {} vendors, {} known devices", registry->size(),
                     devices->count());

        while (!shutdownRequested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        logger->info("Shutting down");
        orchestrator->stop();
        subscriptions->stopAll();
        scheduler->stop();

        logger->info("Device summary: {}", coordinator->healthSummary().toJson().dump());
        if (!config->store.snapshotPath.empty() &&
            !devices->saveSnapshot(config->store.snapshotPath)) {
            logger->error("Snapshot could not be written to {}", config->store.snapshotPath);
        }
    } catch (const core::SyncException& e) {
        logger->critical("Fatal error [{}]: {}", e.getErrorCode(), e.what());
        core::shutdownLogging();
        return 1;
    } catch (const std::exception& e) {
        logger->critical("Fatal error: {}", e.what());
        core::shutdownLogging();
        return 1;
    }

    core::shutdownLogging();
    return 0;
}
