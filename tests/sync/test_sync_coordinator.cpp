#include "rfsync/core/errors.h"
#include "rfsync/sync/sync_coordinator.h"
#include "mock_vendor_adapter.h"
#include "test_fixtures.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace rfsync;
using rfsync::core::LifecycleState;
using rfsync::core::SyncEventType;
using rfsync::testing::makeRecord;
using ::testing::Return;

class SyncCoordinatorTest : public rfsync::testing::EngineTestBase {
protected:
    core::DeviceRecord onlyDevice() {
        auto all = devices_->findAll();
        EXPECT_EQ(all.size(), 1u);
        return all.front();
    }
};

TEST_F(SyncCoordinatorTest, NewOnlineDeviceIsDiscoveredThenOnline) {
    auto result = coordinator_->applyInbound("alpha", {makeRecord("alpha", "D1", "10.0.0.5", "online", "S1")});

    EXPECT_EQ(result.created, 1u);
    EXPECT_EQ(result.transitioned, 1u);
    ASSERT_EQ(result.deviceIds.size(), 1u);

    auto device = onlyDevice();
    EXPECT_EQ(device.status, LifecycleState::ONLINE);
    EXPECT_TRUE(device.lastSeen);

    auto transitions = eventsOfType(SyncEventType::TRANSITION);
    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[0].fromState, LifecycleState::DISCOVERED);
    EXPECT_EQ(transitions[1].toState, LifecycleState::ONLINE);
}

TEST_F(SyncCoordinatorTest, RepollingIdenticalDataChangesNothing) {
    auto record = makeRecord("alpha", "D1", "10.0.0.5", "online", "S1");
    record.telemetry = {{"battery", 90}};
    coordinator_->applyInbound("alpha", {record});

    auto before = onlyDevice();
    size_t eventsBefore = eventLog_->size();

    clock_->advance(std::chrono::seconds(30));
    auto result = coordinator_->applyInbound("alpha", {record});

    EXPECT_EQ(result.unchanged, 1u);
    EXPECT_EQ(result.updated, 0u);
    EXPECT_EQ(result.transitioned, 0u);
    EXPECT_EQ(eventLog_->size(), eventsBefore);

    auto after = onlyDevice();
    EXPECT_EQ(after.updateCounter, before.updateCounter);
    // Last-seen still advances
    EXPECT_EQ(after.lastSeen, clock_->now());
}

TEST_F(SyncCoordinatorTest, TelemetryChangesAreMergedPerKey) {
    auto record = makeRecord("alpha", "D1", "10.0.0.5", "online");
    record.telemetry = {{"battery", 90}, {"rssi", -60}};
    coordinator_->applyInbound("alpha", {record});

    record.telemetry = {{"battery", 85}};
    auto result = coordinator_->applyInbound("alpha", {record});
    EXPECT_EQ(result.updated, 1u);

    auto device = onlyDevice();
    EXPECT_EQ(device.telemetry["battery"], 85);
    EXPECT_EQ(device.telemetry["rssi"], -60);
}

TEST_F(SyncCoordinatorTest, SerialMatchRelocatesTheSameDevice) {
    coordinator_->applyInbound("alpha", {makeRecord("alpha", "D1", "10.0.0.5", "online", "S1")});
    auto original = onlyDevice();

    auto result = coordinator_->applyInbound(
        "alpha", {makeRecord("alpha", "D1-reflashed", "10.0.0.9", "online", "S1")});

    EXPECT_EQ(result.created, 0u);
    EXPECT_EQ(result.relocated, 1u);
    auto moved = onlyDevice();
    EXPECT_EQ(moved.id, original.id);
    EXPECT_EQ(moved.address, "10.0.0.9");
    EXPECT_EQ(moved.vendorId, "D1-reflashed");

    auto history = movements_->forDevice(original.id);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].oldAddress, "10.0.0.5");
    EXPECT_EQ(history[0].newAddress, "10.0.0.9");
    EXPECT_EQ(history[0].matchedKey, "serial");

    auto relocations = eventsOfType(SyncEventType::ADDRESS_RELOCATED);
    ASSERT_EQ(relocations.size(), 1u);
    EXPECT_EQ(relocations[0].metadata["newAddress"], "10.0.0.9");
}

TEST_F(SyncCoordinatorTest, ConflictingIdentityIsQuarantinedWithoutMutation) {
    coordinator_->applyInbound("alpha", {makeRecord("alpha", "D1", "10.0.0.5", "online", "S1"),
                                         makeRecord("alpha", "D2", "10.0.0.6", "online", "S2")});
    auto before = devices_->findAll();

    // vendorId points at D1 while the serial belongs to D2
    auto bad = makeRecord("alpha", "D1", "10.0.0.7", "offline", "S2");
    auto result = coordinator_->applyInbound("alpha", {bad});

    EXPECT_EQ(result.conflicts, 1u);
    EXPECT_EQ(devices_->findAll().size(), 2u);
    auto after = devices_->findAll();
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(after[i].updateCounter, before[i].updateCounter);
        EXPECT_EQ(after[i].status, LifecycleState::ONLINE);
    }

    auto quarantined = coordinator_->quarantined();
    ASSERT_EQ(quarantined.size(), 1u);
    EXPECT_EQ(quarantined[0].conflictingIds.size(), 2u);
    EXPECT_EQ(eventsOfType(SyncEventType::IDENTITY_CONFLICT).size(), 1u);

    // Same conflict again is not re-announced
    coordinator_->applyInbound("alpha", {bad});
    EXPECT_EQ(coordinator_->quarantined().size(), 1u);
    EXPECT_EQ(eventsOfType(SyncEventType::IDENTITY_CONFLICT).size(), 1u);

    EXPECT_TRUE(coordinator_->releaseQuarantined("alpha", "D1"));
    EXPECT_FALSE(coordinator_->releaseQuarantined("alpha", "D1"));
    EXPECT_TRUE(coordinator_->quarantined().empty());
}

TEST_F(SyncCoordinatorTest, DistinctVendorIdsAtOneAddressStayDistinct) {
    std::vector<core::NormalizedRecord> batch{makeRecord("alpha", "A", "10.0.0.5"),
                                              makeRecord("alpha", "B", "10.0.0.5")};
    auto first = coordinator_->applyInbound("alpha", batch);
    EXPECT_EQ(first.created, 2u);
    ASSERT_EQ(devices_->count(), 2u);
    auto a = devices_->findByVendorId("alpha", "A");
    auto b = devices_->findByVendorId("alpha", "B");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a->id, b->id);

    auto repoll = coordinator_->applyInbound("alpha", batch);
    EXPECT_EQ(repoll.created, 0u);
    EXPECT_EQ(repoll.updated, 0u);
    EXPECT_EQ(repoll.unchanged, 2u);
    EXPECT_EQ(devices_->get(a->id).updateCounter, a->updateCounter);
    EXPECT_EQ(devices_->get(b->id).updateCounter, b->updateCounter);
}

TEST_F(SyncCoordinatorTest, MacSeenThroughAnotherVendorIsQuarantined) {
    const std::string mac = "00:1b:66:aa:01:02";
    coordinator_->applyInbound(
        "shure", {makeRecord("shure", "S-1", "10.0.0.5", "online", std::nullopt, mac)});
    auto before = onlyDevice();

    auto result = coordinator_->applyInbound(
        "senn", {makeRecord("senn", "X-9", "10.0.0.5", "online", std::nullopt, mac)});
    EXPECT_EQ(result.conflicts, 1u);
    EXPECT_EQ(result.updated, 0u);

    auto after = onlyDevice();
    EXPECT_EQ(after.vendorCode, "shure");
    EXPECT_EQ(after.vendorId, "S-1");
    EXPECT_EQ(after.updateCounter, before.updateCounter);
    EXPECT_FALSE(devices_->findByVendorId("senn", "X-9"));

    auto repoll = coordinator_->applyInbound(
        "shure", {makeRecord("shure", "S-1", "10.0.0.5", "online", std::nullopt, mac)});
    EXPECT_EQ(repoll.unchanged, 1u);
    ASSERT_EQ(coordinator_->quarantined().size(), 1u);
    EXPECT_EQ(coordinator_->quarantined()[0].record.vendorCode, "senn");
}

TEST_F(SyncCoordinatorTest, OneBadRecordDoesNotAbortTheBatch) {
    auto nameless = makeRecord("alpha", "", "10.0.0.8");
    auto result = coordinator_->applyInbound(
        "alpha", {makeRecord("alpha", "D1", "10.0.0.5"), nameless, makeRecord("alpha", "D2", "10.0.0.6")});

    EXPECT_EQ(result.created, 2u);
    EXPECT_EQ(result.errors.size(), 1u);
}

TEST_F(SyncCoordinatorTest, MaintenanceDevicesKeepTheirStatus) {
    coordinator_->applyInbound("alpha", {makeRecord("alpha", "D1", "10.0.0.5", "online")});
    auto device = onlyDevice();
    lifecycle_->markMaintenance(device.id);

    auto record = makeRecord("alpha", "D1", "10.0.0.5", "offline");
    record.name = "Renamed on vendor";
    coordinator_->applyInbound("alpha", {record});

    auto after = onlyDevice();
    EXPECT_EQ(after.status, LifecycleState::MAINTENANCE);
    EXPECT_EQ(after.name, "Renamed on vendor");
}

TEST_F(SyncCoordinatorTest, UnknownVendorStatusOnlyUpdatesFields) {
    coordinator_->applyInbound("alpha", {makeRecord("alpha", "D1", "10.0.0.5", "online")});
    size_t eventsBefore = eventLog_->size();

    coordinator_->applyInbound("alpha", {makeRecord("alpha", "D1", "10.0.0.5", "rebooting")});
    EXPECT_EQ(onlyDevice().status, LifecycleState::ONLINE);
    EXPECT_EQ(eventLog_->size(), eventsBefore);
}

TEST_F(SyncCoordinatorTest, StaleDeviceRecoversOnNextPoll) {
    auto record = makeRecord("alpha", "D1", "10.0.0.5", "online", "S1");
    coordinator_->applyInbound("alpha", {record});
    auto device = onlyDevice();

    clock_->advance(std::chrono::seconds(301));
    lifecycle_->bulkHealthCheck(std::chrono::seconds(300));
    auto stale = onlyDevice();
    EXPECT_EQ(stale.status, LifecycleState::OFFLINE);
    EXPECT_EQ(stale.offlineReason, "health check timeout");

    clock_->advance(std::chrono::seconds(10));
    auto result = coordinator_->applyInbound("alpha", {record});
    EXPECT_EQ(result.transitioned, 1u);

    auto recovered = onlyDevice();
    EXPECT_EQ(recovered.status, LifecycleState::ONLINE);
    EXPECT_EQ(recovered.accumulatedDowntime, std::chrono::seconds(10));

    auto history = lifecycle_->history(device.id);
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[2].toState, LifecycleState::OFFLINE);
    EXPECT_EQ(history[3].toState, LifecycleState::ONLINE);
}

TEST_F(SyncCoordinatorTest, OutboundPushNeverTouchesStatus) {
    auto adapter = std::make_shared<rfsync::testing::MockVendorAdapter>("alpha");
    registry_->registerAdapter(adapter);
    coordinator_->applyInbound("alpha", {makeRecord("alpha", "D1", "10.0.0.5", "online")});
    auto device = onlyDevice();

    vendor::PushAck ack;
    ack.accepted = true;
    ack.appliedFields = {"name"};
    EXPECT_CALL(*adapter, pushFields("D1", vendor::json{{"name", "Lectern"}}))
        .WillOnce(Return(ack));

    auto result = coordinator_->applyOutbound(
        device.id, {{"name", "Lectern"}, {"status", "retired"}, {"serial", "X"}});

    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.appliedFields, std::vector<std::string>{"name"});
    EXPECT_THAT(result.rejectedFields, ::testing::UnorderedElementsAre("status", "serial"));

    auto after = onlyDevice();
    EXPECT_EQ(after.status, LifecycleState::ONLINE);
    EXPECT_EQ(after.updateCounter, device.updateCounter);
    // The pushed name arrives locally with the next inbound poll
    EXPECT_NE(after.name, "Lectern");
}

TEST_F(SyncCoordinatorTest, OutboundWithoutAdapterFails) {
    coordinator_->applyInbound("alpha", {makeRecord("alpha", "D1", "10.0.0.5", "online")});
    EXPECT_THROW(coordinator_->applyOutbound(onlyDevice().id, {{"name", "x"}}),
                 core::VendorUnavailableError);
    EXPECT_THROW(coordinator_->applyOutbound("dev-404", {{"name", "x"}}), core::DeviceNotFoundError);
}

TEST_F(SyncCoordinatorTest, HealthSummaryCountsByVendorAndState) {
    coordinator_->applyInbound("alpha", {makeRecord("alpha", "D1", "10.0.0.5", "online"),
                                         makeRecord("alpha", "D2", "10.0.0.6", "offline")});
    coordinator_->applyInbound("beta", {makeRecord("beta", "E1", "10.0.1.5", "warning")});

    auto summary = coordinator_->healthSummary();
    EXPECT_EQ(summary.total, 3u);
    EXPECT_EQ(summary.byVendor["alpha"][LifecycleState::OFFLINE], 1u);
    EXPECT_EQ(summary.totals[LifecycleState::ONLINE], 1u);
    EXPECT_EQ(summary.toJson()["vendors"]["beta"]["degraded"], 1);
}

TEST(VendorStatusMappingTest, MapsKnownStatuses) {
    EXPECT_EQ(sync::impliedStateForVendorStatus("OK"), LifecycleState::ONLINE);
    EXPECT_EQ(sync::impliedStateForVendorStatus(" warning "), LifecycleState::DEGRADED);
    EXPECT_EQ(sync::impliedStateForVendorStatus("unreachable"), LifecycleState::OFFLINE);
    EXPECT_EQ(sync::impliedStateForVendorStatus("provisioning"), LifecycleState::PROVISIONING);
    EXPECT_FALSE(sync::impliedStateForVendorStatus("retired"));
    EXPECT_FALSE(sync::impliedStateForVendorStatus(""));
}
