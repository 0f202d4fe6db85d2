#include "rfsync/core/clock.h"

#include <thread>

namespace rfsync {
namespace core {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

std::chrono::nanoseconds SystemClock::monotonic() const {
    return std::chrono::steady_clock::now().time_since_epoch();
}

void SystemClock::sleepFor(std::chrono::nanoseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

std::shared_ptr<SystemClock> SystemClock::instance() {
    static auto clock = std::make_shared<SystemClock>();
    return clock;
}

ManualClock::ManualClock(Timestamp start) : start_(start) {}

Timestamp ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_ + std::chrono::duration_cast<Timestamp::duration>(offset_);
}

std::chrono::nanoseconds ManualClock::monotonic() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return offset_;
}

void ManualClock::sleepFor(std::chrono::nanoseconds duration) {
    advance(duration);
}

void ManualClock::advance(std::chrono::nanoseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (duration.count() > 0) {
        offset_ += duration;
    }
}

void ManualClock::advanceTo(std::chrono::nanoseconds monotonicPoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (monotonicPoint > offset_) {
        offset_ = monotonicPoint;
    }
}

} // namespace core
} // namespace rfsync
