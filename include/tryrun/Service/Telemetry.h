//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request telemetry aggregation and sink integration.
///
/// This module records lightweight per-route latency and per-outcome counts
/// and forwards samples to an optional sink for tracing and tests.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SERVICE_TELEMETRY_H
#define TRYRUN_SERVICE_TELEMETRY_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tryrun::service
{

/// @brief Immutable telemetry sample for a completed request.
struct RequestMetric final
{
    /// @brief Request route, such as `POST /workspace/run`.
    std::string route;

    /// @brief Response status code.
    int status{0};

    /// @brief Request latency in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief Terminal run phase or error kind.
    std::string outcome;
};

/// @brief Sink callback invoked for each telemetry sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Thread-safe request telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded metrics.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one request sample.
    void record(RequestMetric metric);

    /// @brief Returns total recorded request count for the route.
    [[nodiscard]] std::uint64_t requestCount(std::string_view route) const;

    /// @brief Returns total recorded count for an outcome.
    [[nodiscard]] std::uint64_t outcomeCount(std::string_view outcome) const;

    /// @brief Returns accumulated latency for the route in microseconds.
    [[nodiscard]] std::uint64_t totalLatencyMicros(std::string_view route) const;

private:
    mutable std::mutex                             mutex_;
    RequestMetricSink                              sink_;
    std::unordered_map<std::string, std::uint64_t> requestCounts_;
    std::unordered_map<std::string, std::uint64_t> outcomeCounts_;
    std::unordered_map<std::string, std::uint64_t> latencyTotals_;
};

}  // namespace tryrun::service

#endif  // TRYRUN_SERVICE_TELEMETRY_H
