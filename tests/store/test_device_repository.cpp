#include "rfsync/core/errors.h"
#include "rfsync/store/in_memory_device_repository.h"
#include "test_fixtures.h"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <thread>
#include <vector>

using namespace rfsync;
using rfsync::core::LifecycleState;
using rfsync::testing::makeDevice;

class DeviceRepositoryTest : public ::testing::Test {
protected:
    store::InMemoryDeviceRepository repo_;
};

TEST_F(DeviceRepositoryTest, AssignsSequentialIdsAndStartsCounterAtOne) {
    auto first = repo_.create(makeDevice("shure", "D1", "10.0.0.5"));
    auto second = repo_.create(makeDevice("shure", "D2", "10.0.0.6"));

    EXPECT_EQ(first.id, "dev-1");
    EXPECT_EQ(second.id, "dev-2");
    EXPECT_EQ(first.updateCounter, 1u);
    EXPECT_EQ(repo_.count(), 2u);
    EXPECT_TRUE(repo_.exists("dev-2"));
    EXPECT_FALSE(repo_.exists("dev-3"));
}

TEST_F(DeviceRepositoryTest, UpdateBumpsCounterAndTouchDoesNot) {
    auto device = repo_.create(makeDevice("shure", "D1", "10.0.0.5"));
    device.name = "Lectern";
    auto updated = repo_.update(device);
    EXPECT_EQ(updated.updateCounter, 2u);

    EXPECT_TRUE(repo_.touchLastSeen(device.id, std::chrono::system_clock::now()));
    auto touched = repo_.get(device.id);
    EXPECT_EQ(touched.updateCounter, 2u);
    EXPECT_TRUE(touched.lastSeen.has_value());
    EXPECT_EQ(touched.name, "Lectern");
}

TEST_F(DeviceRepositoryTest, UnknownDevicesAreReportedNotInvented) {
    EXPECT_FALSE(repo_.read("dev-9"));
    EXPECT_THROW(repo_.get("dev-9"), core::DeviceNotFoundError);
    EXPECT_THROW(repo_.lockDevice("dev-9"), core::DeviceNotFoundError);
    EXPECT_FALSE(repo_.touchLastSeen("dev-9", std::chrono::system_clock::now()));

    auto ghost = makeDevice("shure", "D1", "10.0.0.5");
    ghost.id = "dev-9";
    EXPECT_THROW(repo_.update(ghost), core::DeviceNotFoundError);
}

TEST_F(DeviceRepositoryTest, VendorIdAndSerialAreUniquePerVendor) {
    auto device = makeDevice("shure", "D1", "10.0.0.5");
    device.serial = "S1";
    repo_.create(device);

    EXPECT_THROW(repo_.create(makeDevice("shure", "D1", "10.0.0.7")), core::IdentityConflictError);

    auto sameSerial = makeDevice("shure", "D2", "10.0.0.8");
    sameSerial.serial = "S1";
    EXPECT_THROW(repo_.create(sameSerial), core::IdentityConflictError);

    // Another vendor may reuse both
    auto other = makeDevice("sennheiser", "D1", "10.0.0.5");
    other.serial = "S1";
    EXPECT_NO_THROW(repo_.create(other));
    EXPECT_EQ(repo_.count(), 2u);
}

TEST_F(DeviceRepositoryTest, IndexesFollowUpdates) {
    auto device = repo_.create(makeDevice("shure", "D1", "10.0.0.5"));
    device.vendorId = "D1-new";
    device.mac = "00:1b:66:aa:01:02";
    repo_.update(device);

    EXPECT_FALSE(repo_.findByVendorId("shure", "D1"));
    ASSERT_TRUE(repo_.findByVendorId("shure", "D1-new"));
    ASSERT_TRUE(repo_.findByMac("00:1b:66:aa:01:02"));
    EXPECT_EQ(repo_.findByMac("00:1b:66:aa:01:02")->id, device.id);

    auto atAddress = repo_.findByAddress("10.0.0.5", "shure", core::DeviceKind::RECEIVER);
    ASSERT_EQ(atAddress.size(), 1u);
    EXPECT_TRUE(repo_.findByAddress("10.0.0.5", "shure", core::DeviceKind::CHARGER).empty());
    EXPECT_TRUE(repo_.findByAddress("", "shure", core::DeviceKind::RECEIVER).empty());
}

TEST_F(DeviceRepositoryTest, QueriesByVendorAndState) {
    repo_.create(makeDevice("shure", "D1", "10.0.0.5", LifecycleState::ONLINE));
    repo_.create(makeDevice("shure", "D2", "10.0.0.6", LifecycleState::OFFLINE));
    repo_.create(makeDevice("sennheiser", "E1", "10.0.1.5", LifecycleState::ONLINE));

    EXPECT_EQ(repo_.findByVendor("shure").size(), 2u);
    EXPECT_EQ(repo_.findByState(LifecycleState::ONLINE).size(), 2u);

    auto counts = repo_.countByVendorAndState();
    EXPECT_EQ(counts["shure"][LifecycleState::OFFLINE], 1u);
    EXPECT_EQ(counts["sennheiser"][LifecycleState::ONLINE], 1u);
}

TEST_F(DeviceRepositoryTest, DeviceLockSerializesWriters) {
    auto device = repo_.create(makeDevice("shure", "D1", "10.0.0.5"));

    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto lock = repo_.lockDevice(device.id);
            int now = ++inside;
            int seen = maxInside.load();
            while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {
            }
            auto current = repo_.get(device.id);
            repo_.update(current);
            --inside;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(maxInside.load(), 1);
    EXPECT_EQ(repo_.get(device.id).updateCounter, 9u);
}

TEST_F(DeviceRepositoryTest, MovedLockKeepsOwnership) {
    auto device = repo_.create(makeDevice("shure", "D1", "10.0.0.5"));
    auto lock = repo_.lockDevice(device.id);
    store::DeviceLock moved(std::move(lock));
    EXPECT_TRUE(moved.ownsLock());
    EXPECT_FALSE(lock.ownsLock());
    EXPECT_EQ(moved.deviceId(), device.id);
    moved.unlock();
    EXPECT_FALSE(moved.ownsLock());
}

TEST_F(DeviceRepositoryTest, SnapshotRestoresDevicesAndIdSequence) {
    auto device = makeDevice("shure", "D1", "10.0.0.5", LifecycleState::ONLINE);
    device.serial = "S1";
    repo_.create(device);
    repo_.create(makeDevice("shure", "D2", "10.0.0.6"));

    auto path = rfsync::testing::writeTempFile("rfsync_snapshot", "");
    ASSERT_TRUE(repo_.saveSnapshot(path));

    store::InMemoryDeviceRepository restored;
    ASSERT_TRUE(restored.loadSnapshot(path));
    EXPECT_EQ(restored.count(), 2u);
    ASSERT_TRUE(restored.findBySerial("shure", "S1"));
    EXPECT_EQ(restored.findBySerial("shure", "S1")->status, LifecycleState::ONLINE);

    // Ids are never reused after a restore
    auto next = restored.create(makeDevice("shure", "D3", "10.0.0.7"));
    EXPECT_EQ(next.id, "dev-3");

    std::remove(path.c_str());
}

TEST_F(DeviceRepositoryTest, MissingOrCorruptSnapshotLeavesRepositoryUntouched) {
    repo_.create(makeDevice("shure", "D1", "10.0.0.5"));
    EXPECT_FALSE(repo_.loadSnapshot("/nonexistent/snapshot.json"));

    auto path = rfsync::testing::writeTempFile("rfsync_corrupt", "{\"devices\": [");
    EXPECT_FALSE(repo_.loadSnapshot(path));
    EXPECT_EQ(repo_.count(), 1u);
    std::remove(path.c_str());
}

TEST_F(DeviceRepositoryTest, RejectedSnapshotKeepsIdentityIndexes) {
    auto device = makeDevice("shure", "D1", "10.0.0.5");
    device.serial = "S1";
    auto created = repo_.create(device);

    auto badType = rfsync::testing::writeTempFile(
        "rfsync_bad_type", R"({"devices": [{"id": "dev-9", "vendorCode": "shure", "vendorId": 5}]})");
    auto duplicateId = rfsync::testing::writeTempFile(
        "rfsync_dup_id", R"({"devices": [{"id": "dev-7", "vendorCode": "shure", "vendorId": "A"},
                                         {"id": "dev-7", "vendorCode": "shure", "vendorId": "B"}]})");
    auto duplicateVendorId = rfsync::testing::writeTempFile(
        "rfsync_dup_vendor", R"({"devices": [{"id": "dev-7", "vendorCode": "shure", "vendorId": "A"},
                                             {"id": "dev-8", "vendorCode": "shure", "vendorId": "A"}]})");

    for (const auto& path : {badType, duplicateId, duplicateVendorId}) {
        EXPECT_FALSE(repo_.loadSnapshot(path)) << path;
        EXPECT_EQ(repo_.count(), 1u);
        ASSERT_TRUE(repo_.findByVendorId("shure", "D1")) << path;
        ASSERT_TRUE(repo_.findBySerial("shure", "S1")) << path;
        EXPECT_EQ(repo_.findByVendorId("shure", "D1")->id, created.id);
        std::remove(path.c_str());
    }

    // Uniqueness is still enforced against the surviving indexes
    EXPECT_THROW(repo_.create(makeDevice("shure", "D1", "10.0.0.8")), core::IdentityConflictError);
}
