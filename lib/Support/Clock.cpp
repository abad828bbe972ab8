//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the steady and manual clocks and scoped deadlines.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Support/Clock.h"

#include <algorithm>
#include <thread>

namespace tryrun
{
namespace
{

// Readiness predicates are polled; completion does not signal the clock.
constexpr std::chrono::milliseconds ReadyPollInterval{1};

}  // namespace

Clock::TimePoint SteadyClock::now() const
{
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleepFor(const Duration interval)
{
    std::this_thread::sleep_for(interval);
}

bool SteadyClock::waitUntil(const TimePoint deadline, const std::function<bool()>& ready)
{
    while (true)
    {
        const bool isReady = ready();
        const auto current = now();
        if (current >= deadline)
        {
            return false;
        }
        if (isReady)
        {
            return true;
        }
        std::this_thread::sleep_for(std::min<Duration>(ReadyPollInterval, deadline - current));
    }
}

ManualClock::ManualClock(const TimePoint start)
    : now_(start)
{
}

Clock::TimePoint ManualClock::now() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::sleepFor(const Duration interval)
{
    advance(interval);
}

bool ManualClock::waitUntil(const TimePoint deadline, const std::function<bool()>& ready)
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        // Readiness is sampled before time so that work which advanced the
        // clock past the deadline and then completed still counts as late.
        const bool isReady = ready();
        if (now_ >= deadline)
        {
            return false;
        }
        if (isReady)
        {
            return true;
        }
        cv_.wait_for(lock, ReadyPollInterval);
    }
}

void ManualClock::advance(const Duration interval)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::max<Duration>(Duration::zero(), interval);
    }
    cv_.notify_all();
}

Deadline::Deadline(const Clock& clock, const Clock::Duration budget)
    : clock_(clock)
    , start_(clock.now())
    , budget_(budget)
    , at_(start_ + budget)
{
}

bool Deadline::expired() const
{
    return clock_.now() >= at_;
}

Clock::Duration Deadline::remaining() const
{
    const auto current = clock_.now();
    return current >= at_ ? Clock::Duration::zero() : at_ - current;
}

Clock::Duration Deadline::elapsed() const
{
    return clock_.now() - start_;
}

}  // namespace tryrun
