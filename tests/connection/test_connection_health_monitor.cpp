#include "rfsync/connection/connection_health_monitor.h"
#include "rfsync/core/clock.h"
#include "rfsync/core/errors.h"
#include "rfsync/core/scheduler.h"
#include "rfsync/store/connection_repository.h"
#include "mock_vendor_adapter.h"
#include "test_fixtures.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace rfsync;
using namespace std::chrono_literals;
using rfsync::core::ConnectionState;
using rfsync::testing::MockVendorAdapter;
using rfsync::testing::StreamRecorder;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

class ConnectionHealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<core::ManualClock>();
        scheduler_ = std::make_shared<core::ManualScheduler>(clock_);
        connections_ = std::make_shared<store::InMemoryConnectionRepository>();
        adapter_ = std::make_shared<NiceMock<MockVendorAdapter>>("alpha");

        policy_.baseDelay = 1s;
        policy_.maxDelay = 60s;
        policy_.maxAttempts = 5;
    }

    std::shared_ptr<connection::ConnectionHealthMonitor> makeMonitor() {
        return std::make_shared<connection::ConnectionHealthMonitor>(
            "dev-1", "D1", adapter_, connections_, scheduler_, policy_,
            [this](const core::NormalizedRecord& record) { received_.push_back(record); });
    }

    void failHandshakes() {
        ON_CALL(*adapter_, subscribe(_, _))
            .WillByDefault(Invoke([this](const std::string&, vendor::StreamHandlers) 
                                      -> std::unique_ptr<vendor::IStreamSubscription> {
                ++handshakes_;
                throw core::VendorUnavailableError("alpha", "handshake refused",
                                                   core::VendorFailureKind::NETWORK);
            }));
    }

    void acceptHandshakes() {
        ON_CALL(*adapter_, subscribe(_, _))
            .WillByDefault(Invoke([this](const std::string&, vendor::StreamHandlers handlers) {
                ++handshakes_;
                return streams_.open(std::move(handlers));
            }));
    }

    std::shared_ptr<core::ManualClock> clock_;
    std::shared_ptr<core::ManualScheduler> scheduler_;
    std::shared_ptr<store::InMemoryConnectionRepository> connections_;
    std::shared_ptr<NiceMock<MockVendorAdapter>> adapter_;
    connection::RetryPolicy policy_;
    StreamRecorder streams_;
    std::vector<core::NormalizedRecord> received_;
    int handshakes_ = 0;
};

TEST(RetryPolicyTest, DoublesUpToTheCap) {
    connection::RetryPolicy policy;
    policy.baseDelay = 1s;
    policy.maxDelay = 10s;
    EXPECT_EQ(policy.delayForRetry(1), 1s);
    EXPECT_EQ(policy.delayForRetry(3), 4s);
    EXPECT_EQ(policy.delayForRetry(4), 8s);
    EXPECT_EQ(policy.delayForRetry(5), 10s);
    EXPECT_EQ(policy.delayForRetry(40), 10s);
}

TEST_F(ConnectionHealthMonitorTest, BacksOffThenParksDisconnected) {
    failHandshakes();
    auto monitor = makeMonitor();
    ASSERT_TRUE(monitor->start());

    scheduler_->advance(10min);

    EXPECT_EQ(monitor->state(), ConnectionState::DISCONNECTED);
    EXPECT_EQ(handshakes_, 6);
    EXPECT_EQ(monitor->retryDelays(),
              (std::vector<std::chrono::milliseconds>{1s, 2s, 4s, 8s, 16s}));
    EXPECT_EQ(scheduler_->pendingTasks(), 0u);

    auto row = connections_->read("dev-1", "stream");
    ASSERT_TRUE(row);
    EXPECT_EQ(row->state, ConnectionState::DISCONNECTED);
    EXPECT_EQ(row->errorCount, 6u);
    EXPECT_EQ(row->lastError, "handshake refused");

    // Nothing happens on its own
    scheduler_->advance(1h);
    EXPECT_EQ(handshakes_, 6);
    EXPECT_FALSE(monitor->start());

    // Until an explicit restart
    acceptHandshakes();
    monitor->restart();
    scheduler_->runDue();
    EXPECT_EQ(monitor->state(), ConnectionState::CONNECTED);
    EXPECT_EQ(monitor->retryCount(), 0u);
}

TEST_F(ConnectionHealthMonitorTest, RetryTimingFollowsTheBackoff) {
    failHandshakes();
    auto monitor = makeMonitor();
    monitor->start();

    scheduler_->runDue();
    EXPECT_EQ(handshakes_, 1);
    EXPECT_EQ(monitor->state(), ConnectionState::ERROR);

    scheduler_->advance(999ms);
    EXPECT_EQ(handshakes_, 1);
    scheduler_->advance(1ms);
    EXPECT_EQ(handshakes_, 2);
    scheduler_->advance(2s);
    EXPECT_EQ(handshakes_, 3);
}

TEST_F(ConnectionHealthMonitorTest, ConnectsAndForwardsRecords) {
    acceptHandshakes();
    auto monitor = makeMonitor();
    monitor->start();
    scheduler_->runDue();

    ASSERT_EQ(monitor->state(), ConnectionState::CONNECTED);
    streams_.latest()->deliver(rfsync::testing::makeRecord("alpha", "D1", "10.0.0.5"));

    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0].vendorId, "D1");
    EXPECT_TRUE(monitor->record().lastMessageAt);
    EXPECT_TRUE(monitor->record().connectedAt);
}

TEST_F(ConnectionHealthMonitorTest, DroppedStreamReconnects) {
    acceptHandshakes();
    auto monitor = makeMonitor();
    monitor->start();
    scheduler_->runDue();

    streams_.latest()->drop("peer reset");
    EXPECT_EQ(monitor->state(), ConnectionState::ERROR);
    EXPECT_EQ(monitor->retryCount(), 1u);
    EXPECT_NE(monitor->record().lastError.find("peer reset"), std::string::npos);

    scheduler_->advance(1s);
    EXPECT_EQ(monitor->state(), ConnectionState::CONNECTED);
    EXPECT_EQ(monitor->retryCount(), 0u);
    EXPECT_EQ(streams_.count(), 2u);
}

TEST_F(ConnectionHealthMonitorTest, StopCancelsPendingRetry) {
    failHandshakes();
    auto monitor = makeMonitor();
    monitor->start();
    scheduler_->runDue();
    ASSERT_EQ(scheduler_->pendingTasks(), 1u);

    monitor->stop();
    EXPECT_EQ(monitor->state(), ConnectionState::STOPPED);
    EXPECT_EQ(scheduler_->pendingTasks(), 0u);
    EXPECT_EQ(monitor->retryCount(), 0u);

    scheduler_->advance(1min);
    EXPECT_EQ(handshakes_, 1);
}

TEST_F(ConnectionHealthMonitorTest, StopClosesOpenStream) {
    acceptHandshakes();
    auto monitor = makeMonitor();
    monitor->start();
    scheduler_->runDue();
    auto stream = streams_.latest();
    ASSERT_TRUE(stream->isOpen());

    monitor->stop();
    EXPECT_FALSE(stream->isOpen());
    EXPECT_TRUE(monitor->record().disconnectedAt);

    // Late messages from the closed stream are ignored
    stream->deliver(rfsync::testing::makeRecord("alpha", "D1", "10.0.0.5"));
    EXPECT_TRUE(received_.empty());
}
