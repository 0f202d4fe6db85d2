#pragma once

#include "rfsync/core/clock.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rfsync {
namespace core {

using TaskId = uint64_t;
using ScheduledTask = std::function<void()>;

/**
 * @brief Delayed task execution
 *
 * Tasks run at most once; periodic work reschedules itself.
 */
class IScheduler {
public:
    virtual ~IScheduler() = default;

    /**
     * @brief Schedule a task to run after a delay
     * @return Identifier usable with cancel()
     */
    virtual TaskId scheduleAfter(std::chrono::milliseconds delay, ScheduledTask task) = 0;

    /**
     * @brief Cancel a pending task
     * @return True if the task had not started yet
     */
    virtual bool cancel(TaskId id) = 0;

    virtual std::shared_ptr<IClock> clock() const = 0;
};

/**
 * @brief Timer thread feeding a pool of worker threads
 *
 * A task blocked on I/O occupies one worker only; other due tasks keep
 * running on the remaining workers.
 */
class ThreadPoolScheduler : public IScheduler {
public:
    explicit ThreadPoolScheduler(size_t workerCount = 4,
                                 std::shared_ptr<IClock> clock = SystemClock::instance());
    ~ThreadPoolScheduler() override;

    void start();
    void stop();
    bool isRunning() const;

    TaskId scheduleAfter(std::chrono::milliseconds delay, ScheduledTask task) override;
    bool cancel(TaskId id) override;
    std::shared_ptr<IClock> clock() const override { return clock_; }

    size_t pendingTasks() const;

private:
    struct TimerEntry {
        std::chrono::steady_clock::time_point due;
        TaskId id;
        bool operator>(const TimerEntry& other) const {
            return due == other.due ? id > other.id : due > other.due;
        }
    };

    void timerLoop();
    void workerLoop();

    std::shared_ptr<IClock> clock_;
    size_t workerCount_;
    std::atomic<bool> running_{false};
    std::atomic<TaskId> nextId_{1};

    mutable std::mutex timerMutex_;
    std::condition_variable timerCondition_;
    std::priority_queue<TimerEntry, std::vector<TimerEntry>, std::greater<TimerEntry>> timers_;
    std::unordered_map<TaskId, ScheduledTask> pending_;

    std::mutex workMutex_;
    std::condition_variable workCondition_;
    std::queue<std::pair<TaskId, ScheduledTask>> ready_;

    std::thread timerThread_;
    std::vector<std::thread> workers_;
};

/**
 * @brief Single threaded scheduler driven by a ManualClock
 *
 * Nothing runs until advance() or runDue() is called; tasks then run on
 * the calling thread in due-time order.
 */
class ManualScheduler : public IScheduler {
public:
    explicit ManualScheduler(std::shared_ptr<ManualClock> clock);

    TaskId scheduleAfter(std::chrono::milliseconds delay, ScheduledTask task) override;
    bool cancel(TaskId id) override;
    std::shared_ptr<IClock> clock() const override { return clock_; }

    /**
     * @brief Advance the clock, running every task that becomes due
     * @return Number of tasks executed
     */
    size_t advance(std::chrono::nanoseconds duration);
    size_t runDue();

    size_t pendingTasks() const;
    std::optional<std::chrono::nanoseconds> nextDue() const;

private:
    std::optional<std::pair<TaskId, ScheduledTask>> popDue(std::chrono::nanoseconds limit);

    std::shared_ptr<ManualClock> clock_;
    mutable std::mutex mutex_;
    TaskId nextId_ = 1;
    std::map<std::pair<std::chrono::nanoseconds, TaskId>, ScheduledTask> tasks_;
};

} // namespace core
} // namespace rfsync
