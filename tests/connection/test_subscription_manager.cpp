#include "rfsync/connection/subscription_manager.h"
#include "mock_vendor_adapter.h"
#include "test_fixtures.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace rfsync;
using rfsync::core::ConnectionState;
using rfsync::core::LifecycleState;
using rfsync::testing::makeDevice;
using rfsync::testing::MockVendorAdapter;
using rfsync::testing::StreamRecorder;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class SubscriptionManagerTest : public rfsync::testing::EngineTestBase {
protected:
    void SetUp() override {
        EngineTestBase::SetUp();

        streaming_ = std::make_shared<NiceMock<MockVendorAdapter>>("alpha");
        ON_CALL(*streaming_, supportsStreaming()).WillByDefault(Return(true));
        ON_CALL(*streaming_, subscribe(_, _))
            .WillByDefault(Invoke([this](const std::string&, vendor::StreamHandlers handlers) {
                return streams_.open(std::move(handlers));
            }));
        registry_->registerAdapter(streaming_);

        polledOnly_ = std::make_shared<NiceMock<MockVendorAdapter>>("beta");
        ON_CALL(*polledOnly_, supportsStreaming()).WillByDefault(Return(false));
        registry_->registerAdapter(polledOnly_);

        manager_ = std::make_unique<connection::SubscriptionManager>(
            devices_, registry_, connections_, scheduler_, connection::RetryPolicy{},
            std::set<std::string>{"alpha", "beta"},
            [this](const std::string& vendorCode, const core::NormalizedRecord& record) {
                coordinator_->applyInbound(vendorCode, {record});
            });
    }

    void TearDown() override { manager_.reset(); }

    std::shared_ptr<NiceMock<MockVendorAdapter>> streaming_;
    std::shared_ptr<NiceMock<MockVendorAdapter>> polledOnly_;
    StreamRecorder streams_;
    std::unique_ptr<connection::SubscriptionManager> manager_;
};

TEST_F(SubscriptionManagerTest, StartsMonitorsOnlyForEligibleDevices) {
    auto online = devices_->create(makeDevice("alpha", "D1", "10.0.0.5", LifecycleState::ONLINE));
    auto offline = devices_->create(makeDevice("alpha", "D2", "10.0.0.6", LifecycleState::OFFLINE));
    auto polled = devices_->create(makeDevice("beta", "E1", "10.0.1.5", LifecycleState::ONLINE));

    EXPECT_EQ(manager_->refresh({online.id, offline.id, polled.id, "dev-404"}), 1u);
    EXPECT_EQ(manager_->size(), 1u);
    EXPECT_TRUE(manager_->isStreamingVendor("alpha"));
    EXPECT_FALSE(manager_->isStreamingVendor("beta"));

    scheduler_->runDue();
    ASSERT_NE(manager_->monitor(online.id), nullptr);
    EXPECT_EQ(manager_->monitor(online.id)->state(), ConnectionState::CONNECTED);

    // Already running monitors are not restarted
    EXPECT_EQ(manager_->refresh({online.id}), 0u);
}

TEST_F(SubscriptionManagerTest, StreamedRecordsFlowIntoTheStore) {
    auto device = devices_->create(makeDevice("alpha", "D1", "10.0.0.5", LifecycleState::ONLINE));
    manager_->refresh({device.id});
    scheduler_->runDue();

    auto record = rfsync::testing::makeRecord("alpha", "D1", "10.0.0.5", "warning");
    record.telemetry = {{"battery", 40}};
    streams_.latest()->deliver(record);

    auto updated = devices_->get(device.id);
    EXPECT_EQ(updated.status, LifecycleState::DEGRADED);
    EXPECT_EQ(updated.telemetry["battery"], 40);
}

TEST_F(SubscriptionManagerTest, DeviceLeavingActiveStatesLosesItsMonitor) {
    auto device = devices_->create(makeDevice("alpha", "D1", "10.0.0.5", LifecycleState::ONLINE));
    manager_->refresh({device.id});
    scheduler_->runDue();
    auto stream = streams_.latest();

    lifecycle_->markOffline(device.id, "unplugged");
    manager_->refresh({device.id});

    EXPECT_EQ(manager_->size(), 0u);
    EXPECT_FALSE(stream->isOpen());
    EXPECT_EQ(connections_->read(device.id, "stream")->state, ConnectionState::STOPPED);
}

TEST_F(SubscriptionManagerTest, ForceReconnectRestartsTheMonitor) {
    auto device = devices_->create(makeDevice("alpha", "D1", "10.0.0.5", LifecycleState::ONLINE));
    manager_->refresh({device.id});
    scheduler_->runDue();

    EXPECT_TRUE(manager_->forceReconnect(device.id));
    scheduler_->runDue();
    EXPECT_EQ(streams_.count(), 2u);
    EXPECT_EQ(manager_->monitor(device.id)->state(), ConnectionState::CONNECTED);

    auto polled = devices_->create(makeDevice("beta", "E1", "10.0.1.5", LifecycleState::ONLINE));
    EXPECT_FALSE(manager_->forceReconnect(polled.id));
}

TEST_F(SubscriptionManagerTest, StopAllClosesEverything) {
    auto first = devices_->create(makeDevice("alpha", "D1", "10.0.0.5", LifecycleState::ONLINE));
    auto second = devices_->create(makeDevice("alpha", "D2", "10.0.0.6", LifecycleState::DEGRADED));
    EXPECT_EQ(manager_->refresh({first.id, second.id}), 2u);
    scheduler_->runDue();

    manager_->stopAll();
    EXPECT_EQ(manager_->size(), 0u);
    EXPECT_EQ(connections_->countByState()[ConnectionState::STOPPED], 2u);
}
