#include "rfsync/core/clock.h"
#include "rfsync/core/scheduler.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace rfsync::core;
using namespace std::chrono_literals;

class ManualSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        scheduler_ = std::make_shared<ManualScheduler>(clock_);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<ManualScheduler> scheduler_;
};

TEST_F(ManualSchedulerTest, RunsTasksInDueOrder) {
    std::vector<int> order;
    scheduler_->scheduleAfter(300ms, [&] { order.push_back(3); });
    scheduler_->scheduleAfter(100ms, [&] { order.push_back(1); });
    scheduler_->scheduleAfter(200ms, [&] { order.push_back(2); });

    EXPECT_EQ(scheduler_->advance(150ms), 1u);
    EXPECT_EQ(scheduler_->advance(1s), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(ManualSchedulerTest, ClockReadsTaskDueTimeWhileRunning) {
    auto start = clock_->monotonic();
    std::chrono::nanoseconds seen{0};
    scheduler_->scheduleAfter(250ms, [&] { seen = clock_->monotonic() - start; });

    scheduler_->advance(1s);
    EXPECT_EQ(seen, std::chrono::nanoseconds(250ms));
    EXPECT_EQ(clock_->monotonic() - start, std::chrono::nanoseconds(1s));
}

TEST_F(ManualSchedulerTest, TasksScheduledDuringAdvanceRunInTheSameWindow) {
    int runs = 0;
    std::function<void()> tick = [&] {
        ++runs;
        scheduler_->scheduleAfter(100ms, tick);
    };
    scheduler_->scheduleAfter(100ms, tick);

    scheduler_->advance(450ms);
    EXPECT_EQ(runs, 4);
    EXPECT_EQ(scheduler_->pendingTasks(), 1u);
}

TEST_F(ManualSchedulerTest, CancelledTasksNeverRun) {
    bool ran = false;
    auto id = scheduler_->scheduleAfter(10ms, [&] { ran = true; });
    EXPECT_TRUE(scheduler_->cancel(id));
    EXPECT_FALSE(scheduler_->cancel(id));
    scheduler_->advance(1s);
    EXPECT_FALSE(ran);
    EXPECT_FALSE(scheduler_->nextDue());
}

TEST(ManualClockTest, SleepAdvancesInsteadOfBlocking) {
    ManualClock clock;
    auto wallBefore = clock.now();
    auto before = clock.monotonic();
    clock.sleepFor(5s);
    EXPECT_EQ(clock.monotonic() - before, std::chrono::nanoseconds(5s));
    EXPECT_EQ(clock.now() - wallBefore, std::chrono::system_clock::duration(5s));

    clock.advanceTo(before);
    EXPECT_EQ(clock.monotonic() - before, std::chrono::nanoseconds(5s));
}

TEST(ThreadPoolSchedulerTest, RunsDelayedTasks) {
    ThreadPoolScheduler scheduler(2);
    scheduler.start();

    std::atomic<int> runs{0};
    scheduler.scheduleAfter(10ms, [&] { ++runs; });
    scheduler.scheduleAfter(20ms, [&] { ++runs; });
    auto cancelled = scheduler.scheduleAfter(500ms, [&] { runs += 100; });
    EXPECT_TRUE(scheduler.cancel(cancelled));

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (runs.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    scheduler.stop();

    EXPECT_EQ(runs.load(), 2);
    EXPECT_FALSE(scheduler.isRunning());
}
