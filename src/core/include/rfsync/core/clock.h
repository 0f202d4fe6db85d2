#pragma once

#include "rfsync/core/utils.h"

#include <chrono>
#include <memory>
#include <mutex>

namespace rfsync {
namespace core {

/**
 * @brief Time source used by all time dependent components
 *
 * now() is wall-clock time for timestamps; monotonic() is used for
 * durations (token refill, timers) and never goes backwards.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual Timestamp now() const = 0;
    virtual std::chrono::nanoseconds monotonic() const = 0;
    virtual void sleepFor(std::chrono::nanoseconds duration) = 0;
};

/**
 * @brief Real time clock
 */
class SystemClock : public IClock {
public:
    Timestamp now() const override;
    std::chrono::nanoseconds monotonic() const override;
    void sleepFor(std::chrono::nanoseconds duration) override;

    static std::shared_ptr<SystemClock> instance();
};

/**
 * @brief Deterministic clock driven explicitly by the caller
 *
 * sleepFor() advances the clock instead of blocking.
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = Timestamp{} + std::chrono::hours(24 * 365 * 50));

    Timestamp now() const override;
    std::chrono::nanoseconds monotonic() const override;
    void sleepFor(std::chrono::nanoseconds duration) override;

    void advance(std::chrono::nanoseconds duration);
    void advanceTo(std::chrono::nanoseconds monotonicPoint);

private:
    mutable std::mutex mutex_;
    Timestamp start_;
    std::chrono::nanoseconds offset_{0};
};

} // namespace core
} // namespace rfsync
