//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Injectable time source used for every deadline decision in the pipeline.
///
/// Production code uses `SteadyClock`. Tests use `ManualClock`, whose time only
/// moves when a caller advances it, so timeout boundaries are deterministic.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SUPPORT_CLOCK_H
#define TRYRUN_SUPPORT_CLOCK_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace tryrun
{

/// @brief Abstract time source.
class Clock
{
public:
    /// @brief Clock duration type.
    using Duration = std::chrono::steady_clock::duration;

    /// @brief Clock time point type.
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    /// @brief Returns the current time of this clock.
    /// @return Current time point.
    [[nodiscard]] virtual TimePoint now() const = 0;

    /// @brief Lets `interval` of clock time pass for the caller.
    /// @param[in] interval Time to let pass.
    virtual void sleepFor(Duration interval) = 0;

    /// @brief Blocks until `ready` holds or the clock reaches `deadline`.
    ///
    /// The deadline wins when both conditions are observed together.
    ///
    /// @param[in] deadline Absolute clock deadline.
    /// @param[in] ready Readiness predicate, polled by the clock.
    /// @return `true` when `ready` was observed strictly before the deadline.
    [[nodiscard]] virtual bool waitUntil(TimePoint deadline, const std::function<bool()>& ready) = 0;
};

/// @brief Wall-clock implementation backed by `std::chrono::steady_clock`.
class SteadyClock final : public Clock
{
public:
    [[nodiscard]] TimePoint now() const override;
    void                    sleepFor(Duration interval) override;
    [[nodiscard]] bool      waitUntil(TimePoint deadline, const std::function<bool()>& ready) override;
};

/// @brief Virtual clock whose time moves only through `advance` or `sleepFor`.
class ManualClock final : public Clock
{
public:
    /// @brief Creates a clock positioned at `start`.
    /// @param[in] start Initial virtual time.
    explicit ManualClock(TimePoint start = TimePoint{});

    [[nodiscard]] TimePoint now() const override;

    /// @brief Advances virtual time by `interval` without blocking.
    void sleepFor(Duration interval) override;

    [[nodiscard]] bool waitUntil(TimePoint deadline, const std::function<bool()>& ready) override;

    /// @brief Moves virtual time forward and wakes waiters.
    /// @param[in] interval Non-negative amount of virtual time.
    void advance(Duration interval);

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    TimePoint               now_;
};

/// @brief Scoped deadline measured against a clock.
class Deadline final
{
public:
    /// @brief Starts a deadline `budget` after the clock's current time.
    /// @param[in] clock Time source.
    /// @param[in] budget Allowed duration.
    Deadline(const Clock& clock, Clock::Duration budget);

    /// @brief Returns the absolute expiry time.
    [[nodiscard]] Clock::TimePoint at() const
    {
        return at_;
    }

    /// @brief Returns the budget this deadline was started with.
    [[nodiscard]] Clock::Duration budget() const
    {
        return budget_;
    }

    /// @brief Returns whether the clock reached the deadline.
    [[nodiscard]] bool expired() const;

    /// @brief Returns the remaining time, clamped at zero.
    [[nodiscard]] Clock::Duration remaining() const;

    /// @brief Returns the time spent since the deadline started.
    [[nodiscard]] Clock::Duration elapsed() const;

private:
    const Clock&     clock_;
    Clock::TimePoint start_;
    Clock::Duration  budget_;
    Clock::TimePoint at_;
};

}  // namespace tryrun

#endif  // TRYRUN_SUPPORT_CLOCK_H
