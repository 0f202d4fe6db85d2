#include "rfsync/core/scheduler.h"

#include <spdlog/spdlog.h>

namespace rfsync {
namespace core {

// ThreadPoolScheduler implementation
ThreadPoolScheduler::ThreadPoolScheduler(size_t workerCount, std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)), workerCount_(workerCount == 0 ? 1 : workerCount) {}

ThreadPoolScheduler::~ThreadPoolScheduler() {
    stop();
}

void ThreadPoolScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    timerThread_ = std::thread(&ThreadPoolScheduler::timerLoop, this);
    for (size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back(&ThreadPoolScheduler::workerLoop, this);
    }
    spdlog::debug("ThreadPoolScheduler: started with {} workers", workerCount_);
}

void ThreadPoolScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    timerCondition_.notify_all();
    workCondition_.notify_all();

    if (timerThread_.joinable()) {
        timerThread_.join();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    std::lock_guard<std::mutex> lock(timerMutex_);
    pending_.clear();
    timers_ = {};
    spdlog::debug("ThreadPoolScheduler: stopped");
}

bool ThreadPoolScheduler::isRunning() const {
    return running_.load();
}

TaskId ThreadPoolScheduler::scheduleAfter(std::chrono::milliseconds delay, ScheduledTask task) {
    TaskId id = nextId_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        pending_[id] = std::move(task);
        timers_.push(TimerEntry{std::chrono::steady_clock::now() + delay, id});
    }
    timerCondition_.notify_one();
    return id;
}

bool ThreadPoolScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(timerMutex_);
    return pending_.erase(id) > 0;
}

size_t ThreadPoolScheduler::pendingTasks() const {
    std::lock_guard<std::mutex> lock(timerMutex_);
    return pending_.size();
}

void ThreadPoolScheduler::timerLoop() {
    std::unique_lock<std::mutex> lock(timerMutex_);
    while (running_.load()) {
        if (timers_.empty()) {
            timerCondition_.wait(lock, [this] { return !running_.load() || !timers_.empty(); });
            continue;
        }

        auto next = timers_.top();
        if (next.due > std::chrono::steady_clock::now()) {
            timerCondition_.wait_until(lock, next.due);
            continue;
        }

        timers_.pop();
        auto it = pending_.find(next.id);
        if (it == pending_.end()) {
            continue; // cancelled
        }

        auto task = std::move(it->second);
        pending_.erase(it);
        {
            std::lock_guard<std::mutex> workLock(workMutex_);
            ready_.emplace(next.id, std::move(task));
        }
        workCondition_.notify_one();
    }
}

void ThreadPoolScheduler::workerLoop() {
    while (true) {
        std::pair<TaskId, ScheduledTask> item;
        {
            std::unique_lock<std::mutex> lock(workMutex_);
            workCondition_.wait(lock, [this] { return !running_.load() || !ready_.empty(); });
            if (!running_.load()) {
                return;
            }
            item = std::move(ready_.front());
            ready_.pop();
        }

        try {
            item.second();
        } catch (const std::exception& e) {
            spdlog::error("ThreadPoolScheduler: task {} failed: {}", item.first, e.what());
        }
    }
}

// ManualScheduler implementation
ManualScheduler::ManualScheduler(std::shared_ptr<ManualClock> clock) : clock_(std::move(clock)) {}

TaskId ManualScheduler::scheduleAfter(std::chrono::milliseconds delay, ScheduledTask task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskId id = nextId_++;
    auto due = clock_->monotonic() + std::chrono::duration_cast<std::chrono::nanoseconds>(delay);
    tasks_.emplace(std::make_pair(due, id), std::move(task));
    return id;
}

bool ManualScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
        if (it->first.second == id) {
            tasks_.erase(it);
            return true;
        }
    }
    return false;
}

size_t ManualScheduler::advance(std::chrono::nanoseconds duration) {
    const auto target = clock_->monotonic() + duration;
    size_t executed = 0;

    while (auto next = popDue(target)) {
        next->second();
        ++executed;
    }

    clock_->advanceTo(target);
    return executed;
}

size_t ManualScheduler::runDue() {
    return advance(std::chrono::nanoseconds{0});
}

size_t ManualScheduler::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::optional<std::chrono::nanoseconds> ManualScheduler::nextDue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.empty()) {
        return std::nullopt;
    }
    return tasks_.begin()->first.first;
}

std::optional<std::pair<TaskId, ScheduledTask>>
ManualScheduler::popDue(std::chrono::nanoseconds limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.empty() || tasks_.begin()->first.first > limit) {
        return std::nullopt;
    }

    auto it = tasks_.begin();
    clock_->advanceTo(it->first.first);
    std::pair<TaskId, ScheduledTask> result{it->first.second, std::move(it->second)};
    tasks_.erase(it);
    return result;
}

} // namespace core
} // namespace rfsync
