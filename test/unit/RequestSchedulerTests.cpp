//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "tryrun/Service/RequestScheduler.h"

namespace
{

using tryrun::service::RequestTaskResult;
using tryrun::service::RequestTaskStatus;

RequestTaskResult waitForCancellation(const tryrun::CancellationToken& token)
{
    const auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < std::chrono::seconds(1))
    {
        if (token.isCancellationRequested())
        {
            return {RequestTaskStatus::Cancelled, llvm::json::Value(nullptr), {}};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return {RequestTaskStatus::Completed, llvm::json::Object{{"done", true}}, {}};
}

bool runCancelChecks()
{
    tryrun::service::RequestScheduler scheduler;

    std::mutex              mutex;
    std::condition_variable cv;
    bool                    sawCallback = false;
    RequestTaskResult       completionResult;
    std::uint64_t           completionLatency = 0;

    const bool queued = scheduler.enqueue(
        "i:7",
        "POST /workspace/run",
        waitForCancellation,
        [&mutex, &cv, &sawCallback, &completionResult, &completionLatency](RequestTaskResult   result,
                                                                           const std::uint64_t latencyMicros) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                sawCallback       = true;
                completionResult  = std::move(result);
                completionLatency = latencyMicros;
            }
            cv.notify_all();
        });

    if (!queued)
    {
        std::cerr << "expected enqueue to succeed\n";
        return false;
    }
    if (scheduler.enqueue("i:7", "POST /workspace/run", waitForCancellation, {}))
    {
        std::cerr << "duplicate in-flight key should be rejected\n";
        return false;
    }
    if (scheduler.pendingCount() != 1 || scheduler.pendingCount("POST /workspace/run") != 1 ||
        scheduler.pendingCount("POST /workspace/completion") != 0)
    {
        std::cerr << "pending count should track the in-flight request by route\n";
        return false;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    if (!scheduler.cancel("i:7"))
    {
        std::cerr << "expected cancel to find enqueued request\n";
        return false;
    }
    if (scheduler.cancel("i:8"))
    {
        std::cerr << "cancel should not find unknown requests\n";
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_for(lock, std::chrono::seconds(3), [&sawCallback]() { return sawCallback; }))
        {
            std::cerr << "timeout waiting for completion callback\n";
            return false;
        }
    }

    if (completionResult.status != RequestTaskStatus::Cancelled)
    {
        std::cerr << "expected cancelled task status\n";
        return false;
    }

    if (completionLatency == 0)
    {
        std::cerr << "expected non-zero latency metric\n";
        return false;
    }

    scheduler.waitIdle();
    if (scheduler.cancel("i:7") || scheduler.pendingCount() != 0)
    {
        std::cerr << "finished requests should be forgotten\n";
        return false;
    }

    scheduler.shutdown();
    return true;
}

bool runConcurrencyChecks()
{
    // Two requests that each wait for the other can only finish on two workers.
    tryrun::service::RequestScheduler scheduler(2);
    std::atomic<int>                  started{0};
    std::atomic<int>                  completed{0};

    const auto rendezvous = [&started](const tryrun::CancellationToken& token) -> RequestTaskResult {
        ++started;
        const auto start = std::chrono::steady_clock::now();
        while (started.load() < 2 && std::chrono::steady_clock::now() - start < std::chrono::seconds(3))
        {
            if (token.isCancellationRequested())
            {
                return {RequestTaskStatus::Cancelled, llvm::json::Value(nullptr), {}};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (started.load() < 2)
        {
            return {RequestTaskStatus::Failed, llvm::json::Value(nullptr), "peer never started"};
        }
        return {RequestTaskStatus::Completed, llvm::json::Object{}, {}};
    };
    const auto count = [&completed](RequestTaskResult result, std::uint64_t) {
        if (result.status == RequestTaskStatus::Completed)
        {
            ++completed;
        }
    };

    if (!scheduler.enqueue("s:a", "POST /workspace/run", rendezvous, count) ||
        !scheduler.enqueue("s:b", "POST /workspace/run", rendezvous, count))
    {
        std::cerr << "expected both requests to queue\n";
        return false;
    }
    scheduler.waitIdle();
    if (completed.load() != 2)
    {
        std::cerr << "requests should run concurrently on separate workers\n";
        return false;
    }
    return true;
}

bool runFailureChecks()
{
    tryrun::service::RequestScheduler scheduler;
    RequestTaskResult                 observed;
    const bool                        queued = scheduler.enqueue(
        "i:1",
        "POST /workspace/run",
        [](const tryrun::CancellationToken&) -> RequestTaskResult { throw std::runtime_error("worker exploded"); },
        [&observed](RequestTaskResult result, std::uint64_t) { observed = std::move(result); });
    if (!queued)
    {
        std::cerr << "expected enqueue to succeed\n";
        return false;
    }
    scheduler.waitIdle();
    if (observed.status != RequestTaskStatus::Failed || observed.errorMessage != "worker exploded")
    {
        std::cerr << "throwing tasks should complete as failed\n";
        return false;
    }
    return true;
}

bool runShutdownChecks()
{
    tryrun::service::RequestScheduler scheduler(1);
    std::mutex                        mutex;
    std::vector<RequestTaskStatus>    statuses;
    const auto                        record = [&mutex, &statuses](RequestTaskResult result, std::uint64_t) {
        std::lock_guard<std::mutex> lock(mutex);
        statuses.push_back(result.status);
    };

    if (!scheduler.enqueue("i:1", "POST /workspace/run", waitForCancellation, record) ||
        !scheduler.enqueue("i:2", "POST /workspace/run", waitForCancellation, record))
    {
        std::cerr << "expected both requests to queue\n";
        return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    scheduler.shutdown();

    if (statuses.size() != 2 || statuses[0] != RequestTaskStatus::Cancelled ||
        statuses[1] != RequestTaskStatus::Cancelled)
    {
        std::cerr << "shutdown should cancel running and queued requests\n";
        return false;
    }
    if (scheduler.enqueue("i:3", "POST /workspace/run", waitForCancellation, record))
    {
        std::cerr << "enqueue after shutdown should be rejected\n";
        return false;
    }
    return true;
}

}  // namespace

bool runRequestSchedulerTests()
{
    bool ok = true;
    ok      = runCancelChecks() && ok;
    ok      = runConcurrencyChecks() && ok;
    ok      = runFailureChecks() && ok;
    ok      = runShutdownChecks() && ok;
    return ok;
}
