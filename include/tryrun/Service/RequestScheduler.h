//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Cooperative request scheduler with cancellation support.
///
/// The scheduler runs requests on a fixed pool of worker threads and exposes
/// per-request cancellation tokens for responsive abort handling.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SERVICE_REQUEST_SCHEDULER_H
#define TRYRUN_SERVICE_REQUEST_SCHEDULER_H

#include "tryrun/Support/Cancellation.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tryrun::service
{

/// @brief Status outcome of a scheduled request task.
enum class RequestTaskStatus
{
    /// @brief Task completed successfully.
    Completed,

    /// @brief Task was cancelled cooperatively.
    Cancelled,

    /// @brief Task failed with an internal error.
    Failed,
};

/// @brief Result envelope for scheduled request work.
struct RequestTaskResult final
{
    /// @brief Task outcome status.
    RequestTaskStatus status{RequestTaskStatus::Failed};

    /// @brief JSON result payload when completed.
    llvm::json::Value value{llvm::json::Object{}};

    /// @brief Error message when failed.
    std::string errorMessage;
};

/// @brief Cooperative unit of scheduled request work.
using RequestTask = std::function<RequestTaskResult(const CancellationToken& token)>;

/// @brief Completion callback invoked on task finish.
using RequestCompletion = std::function<void(RequestTaskResult result, std::uint64_t latencyMicros)>;

/// @brief Fixed-size worker pool for cancellable requests.
class RequestScheduler final
{
public:
    /// @param[in] workerCount Number of worker threads; at least one is started.
    explicit RequestScheduler(unsigned workerCount = 1);
    ~RequestScheduler();

    RequestScheduler(const RequestScheduler&)            = delete;
    RequestScheduler& operator=(const RequestScheduler&) = delete;

    /// @brief Enqueues request work for execution.
    /// @param[in] requestKey Stable request key (the envelope id).
    /// @param[in] route Request route for tracing.
    /// @param[in] task Request task body.
    /// @param[in] completion Completion callback invoked once.
    /// @return `true` when queued successfully.
    [[nodiscard]] bool enqueue(std::string       requestKey,
                               std::string       route,
                               RequestTask       task,
                               RequestCompletion completion);

    /// @brief Requests cancellation for the given request key.
    /// @return `true` when a matching in-flight or queued request exists.
    [[nodiscard]] bool cancel(const std::string& requestKey);

    /// @brief Counts queued and running requests.
    /// @param[in] route Route to count; empty counts every route.
    [[nodiscard]] std::size_t pendingCount(llvm::StringRef route = {}) const;

    /// @brief Blocks until no request is queued or running.
    void waitIdle();

    /// @brief Stops the workers and cancels outstanding requests.
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tryrun::service

#endif  // TRYRUN_SERVICE_REQUEST_SCHEDULER_H
