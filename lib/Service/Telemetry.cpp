//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request telemetry recording and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Service/Telemetry.h"

#include <utility>

namespace tryrun::service
{
namespace
{

std::uint64_t lookup(const std::unordered_map<std::string, std::uint64_t>& counts, const std::string_view key)
{
    const auto it = counts.find(std::string(key));
    return it == counts.end() ? 0U : it->second;
}

}  // namespace

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(RequestMetric metric)
{
    RequestMetricSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++requestCounts_[metric.route];
        ++outcomeCounts_[metric.outcome];
        latencyTotals_[metric.route] += metric.latencyMicros;
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

std::uint64_t Telemetry::requestCount(const std::string_view route) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(requestCounts_, route);
}

std::uint64_t Telemetry::outcomeCount(const std::string_view outcome) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(outcomeCounts_, outcome);
}

std::uint64_t Telemetry::totalLatencyMicros(const std::string_view route) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(latencyTotals_, route);
}

}  // namespace tryrun::service
