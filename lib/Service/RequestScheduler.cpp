//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements cooperative request scheduling and cancellation.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Service/RequestScheduler.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tryrun::service
{

namespace
{

/// Runs `task` unless it was cancelled while queued. Exceptions become
/// `Failed` results so a worker never dies with a request.
RequestTaskResult execute(const RequestTask& task, const CancellationSource& cancellation)
{
    RequestTaskResult result;
    if (cancellation.isCancellationRequested())
    {
        result.status = RequestTaskStatus::Cancelled;
        return result;
    }
    try
    {
        return task(cancellation.token());
    } catch (const std::exception& ex)
    {
        result.errorMessage = ex.what();
    } catch (...)
    {
        result.errorMessage = "unknown exception";
    }
    result.status = RequestTaskStatus::Failed;
    return result;
}

}  // namespace

class RequestScheduler::Impl final
{
public:
    explicit Impl(const unsigned workerCount)
    {
        const unsigned count = std::max(1U, workerCount);
        workers_.reserve(count);
        for (unsigned i = 0; i < count; ++i)
        {
            workers_.emplace_back([this]() { workerLoop(); });
        }
    }

    ~Impl()
    {
        shutdown();
    }

    bool enqueue(std::string requestKey, std::string route, RequestTask task, RequestCompletion completion)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || inFlight_.contains(requestKey))
        {
            return false;
        }

        InFlight& record = inFlight_[requestKey];
        record.route     = std::move(route);
        queue_.push_back(Job{std::move(requestKey), std::move(task), std::move(completion), record.cancellation});
        ready_.notify_one();
        return true;
    }

    bool cancel(const std::string& requestKey)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  found = inFlight_.find(requestKey);
        if (found == inFlight_.end())
        {
            return false;
        }
        found->second.cancellation.cancel();
        return true;
    }

    std::size_t pendingCount(const llvm::StringRef route) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(inFlight_.begin(), inFlight_.end(), [route](const auto& entry) {
            return route.empty() || entry.second.route == route;
        }));
    }

    void waitIdle()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this]() { return inFlight_.empty(); });
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
            for (auto& entry : inFlight_)
            {
                entry.second.cancellation.cancel();
            }
        }
        ready_.notify_all();
        for (std::thread& worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

private:
    /// Bookkeeping for a request that is queued or running.
    struct InFlight final
    {
        std::string        route;
        CancellationSource cancellation;
    };

    struct Job final
    {
        std::string        requestKey;
        RequestTask        task;
        RequestCompletion  completion;
        CancellationSource cancellation;
    };

    /// Blocks for the next job; empty once stopping with nothing queued.
    std::optional<Job> takeNext()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty())
        {
            return std::nullopt;
        }
        Job job = std::move(queue_.front());
        queue_.pop_front();
        return job;
    }

    void retire(const std::string& requestKey)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.erase(requestKey);
        if (inFlight_.empty())
        {
            idle_.notify_all();
        }
    }

    void workerLoop()
    {
        while (std::optional<Job> job = takeNext())
        {
            const auto        startedAt = std::chrono::steady_clock::now();
            RequestTaskResult result    = execute(job->task, job->cancellation);
            const auto        elapsed   = std::chrono::steady_clock::now() - startedAt;

            // The completion runs before retiring so `waitIdle` also covers
            // delivery of the response.
            if (job->completion)
            {
                const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
                job->completion(std::move(result), static_cast<std::uint64_t>(micros));
            }
            retire(job->requestKey);
        }
    }

    mutable std::mutex                        mutex_;
    std::condition_variable                   ready_;
    std::condition_variable                   idle_;
    std::deque<Job>                           queue_;
    std::unordered_map<std::string, InFlight> inFlight_;
    bool                                      stopping_{false};
    std::vector<std::thread>                  workers_;
};

RequestScheduler::RequestScheduler(const unsigned workerCount)
    : impl_(std::make_unique<Impl>(workerCount))
{
}

RequestScheduler::~RequestScheduler() = default;

bool RequestScheduler::enqueue(std::string       requestKey,
                               std::string       route,
                               RequestTask       task,
                               RequestCompletion completion)
{
    return impl_->enqueue(std::move(requestKey), std::move(route), std::move(task), std::move(completion));
}

bool RequestScheduler::cancel(const std::string& requestKey)
{
    return impl_->cancel(requestKey);
}

std::size_t RequestScheduler::pendingCount(const llvm::StringRef route) const
{
    return impl_->pendingCount(route);
}

void RequestScheduler::waitIdle()
{
    impl_->waitIdle();
}

void RequestScheduler::shutdown()
{
    impl_->shutdown();
}

}  // namespace tryrun::service
