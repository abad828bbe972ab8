//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Abandonable background operation with cooperative cancellation.
///
/// The operation body runs on a detached thread that shares ownership of the
/// result slot. A waiter may stop waiting at any time; destroying the handle
/// requests cancellation and leaves the thread to finish on its own, so a
/// runaway body never blocks its caller.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_EXEC_ASYNC_OPERATION_H
#define TRYRUN_EXEC_ASYNC_OPERATION_H

#include "tryrun/Support/Cancellation.h"
#include "tryrun/Support/Clock.h"
#include "tryrun/Support/Error.h"

#include "llvm/Support/Error.h"

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace tryrun
{

/// @brief Result of waiting on an operation against a deadline.
enum class WaitStatus
{
    /// @brief The operation finished before the deadline.
    Ready,

    /// @brief The deadline passed first.
    Expired,

    /// @brief The waiter's own token was cancelled first.
    Cancelled,
};

/// @brief Handle onto a background operation producing `llvm::Expected<T>`.
template <typename T>
class AsyncOperation final
{
public:
    /// @brief Operation body; must poll the token at its blocking points.
    using Body = std::function<llvm::Expected<T>(const CancellationToken& token)>;

    /// @brief Starts `body` on a detached thread.
    ///
    /// @param[in] clock Clock that stamps the completion time of the body.
    /// @param[in] body Operation body.
    [[nodiscard]] static AsyncOperation start(std::shared_ptr<const Clock> clock, Body body)
    {
        AsyncOperation operation;
        std::thread([state = operation.state_, clock = std::move(clock), body = std::move(body)]() {
            llvm::Expected<T> result = invoke(body, state->source.token());
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->result.emplace(std::move(result));
                state->finishedAt = clock->now();
            }
            state->ready.store(true, std::memory_order_release);
        }).detach();
        return operation;
    }

    ~AsyncOperation()
    {
        if (state_)
        {
            state_->source.cancel();
        }
    }

    AsyncOperation(AsyncOperation&&) noexcept            = default;
    AsyncOperation& operator=(AsyncOperation&&) noexcept = default;
    AsyncOperation(const AsyncOperation&)                = delete;
    AsyncOperation& operator=(const AsyncOperation&)     = delete;

    [[nodiscard]] bool ready() const
    {
        return state_->ready.load(std::memory_order_acquire);
    }

    /// @brief Requests cancellation without waiting.
    void cancel()
    {
        state_->source.cancel();
    }

    /// @brief Waits on `clock` until the operation finishes, `deadline`
    ///        passes, or `outer` is cancelled. Expiry takes precedence over
    ///        cancellation, and cancellation over completion.
    ///
    /// Expiry is judged on the completion time stamped by the body's thread,
    /// so a body that finished in time is `Ready` even when the waiter only
    /// observes it after the deadline.
    [[nodiscard]] WaitStatus wait(Clock& clock, const Clock::TimePoint deadline, const CancellationToken& outer)
    {
        const bool woke = clock.waitUntil(deadline, [this, &outer]() {
            return ready() || outer.isCancellationRequested();
        });
        if (!woke && !finishedBefore(deadline))
        {
            return WaitStatus::Expired;
        }
        // A cancelled waiter discards the result even if it arrived.
        return outer.isCancellationRequested() ? WaitStatus::Cancelled : WaitStatus::Ready;
    }

    /// @brief Moves the result out; only valid once `ready()` is true.
    [[nodiscard]] llvm::Expected<T> take()
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->result)
        {
            return makePipelineError(ErrorKind::ToolchainFailure, "operation result taken before completion");
        }
        llvm::Expected<T> result = std::move(*state_->result);
        state_->result.reset();
        return result;
    }

private:
    struct State final
    {
        ~State()
        {
            // Results of abandoned operations are never inspected.
            if (result && !*result)
            {
                llvm::consumeError(result->takeError());
            }
        }

        std::mutex                       mutex;
        std::optional<llvm::Expected<T>> result;
        Clock::TimePoint                 finishedAt{};
        std::atomic_bool                 ready{false};
        CancellationSource               source;
    };

    AsyncOperation()
        : state_(std::make_shared<State>())
    {
    }

    [[nodiscard]] bool finishedBefore(const Clock::TimePoint deadline) const
    {
        if (!ready())
        {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->finishedAt < deadline;
    }

    static llvm::Expected<T> invoke(const Body& body, const CancellationToken& token)
    {
        try
        {
            return body(token);
        } catch (const std::exception& ex)
        {
            return makePipelineError(ErrorKind::ToolchainFailure, ex.what());
        } catch (...)
        {
            return makePipelineError(ErrorKind::ToolchainFailure, "unknown exception");
        }
    }

    std::shared_ptr<State> state_;
};

}  // namespace tryrun

#endif  // TRYRUN_EXEC_ASYNC_OPERATION_H
