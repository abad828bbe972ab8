//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Validates the injectable clock, deadlines, cancellation and background
/// operations that every timeout in the pipeline is built on.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Exec/AsyncOperation.h"
#include "tryrun/Support/Cancellation.h"
#include "tryrun/Support/Clock.h"
#include "tryrun/Support/Error.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace
{

using namespace std::chrono_literals;

/// Spins until `token` is cancelled, bounded in real time.
void blockUntilCancelled(const tryrun::CancellationToken& token)
{
    const auto limit = std::chrono::steady_clock::now() + 5s;
    while (!token.isCancellationRequested() && std::chrono::steady_clock::now() < limit)
    {
        std::this_thread::sleep_for(1ms);
    }
}

bool runDeadlineChecks()
{
    auto                   clock = std::make_shared<tryrun::ManualClock>();
    const tryrun::Deadline deadline(*clock, 100ms);
    if (deadline.expired() || deadline.remaining() != 100ms)
    {
        std::cerr << "fresh deadline should have its whole budget\n";
        return false;
    }
    clock->advance(40ms);
    if (deadline.elapsed() != 40ms || deadline.remaining() != 60ms)
    {
        std::cerr << "deadline should track manual clock advances\n";
        return false;
    }
    clock->sleepFor(60ms);
    if (!deadline.expired() || deadline.remaining() != tryrun::Clock::Duration::zero())
    {
        std::cerr << "deadline should expire exactly at its budget\n";
        return false;
    }
    clock->advance(-5ms);
    if (!deadline.expired())
    {
        std::cerr << "manual clock must never move backwards\n";
        return false;
    }
    return true;
}

bool runWaitUntilChecks()
{
    auto       clock = std::make_shared<tryrun::ManualClock>();
    const auto start = clock->now();
    if (!clock->waitUntil(start + 10ms, []() { return true; }))
    {
        std::cerr << "ready predicate before the deadline should win\n";
        return false;
    }

    clock->advance(10ms);
    if (clock->waitUntil(start + 10ms, []() { return true; }))
    {
        std::cerr << "deadline should win when both conditions hold\n";
        return false;
    }

    std::thread advancer([clock]() {
        std::this_thread::sleep_for(20ms);
        clock->advance(1s);
    });
    const bool woke = clock->waitUntil(clock->now() + 500ms, []() { return false; });
    advancer.join();
    if (woke)
    {
        std::cerr << "waitUntil should report expiry once another thread advances time\n";
        return false;
    }
    return true;
}

bool runCancellationChecks()
{
    const tryrun::CancellationToken idle;
    if (idle.isCancellationRequested())
    {
        std::cerr << "default token must never be cancelled\n";
        return false;
    }

    tryrun::CancellationSource source;
    const auto                 token = source.token();
    const auto                 copy  = token;
    if (token.isCancellationRequested() || source.isCancellationRequested())
    {
        std::cerr << "new source should not be cancelled\n";
        return false;
    }
    source.cancel();
    if (!token.isCancellationRequested() || !copy.isCancellationRequested() || !source.isCancellationRequested())
    {
        std::cerr << "cancel should reach every token of the source\n";
        return false;
    }
    return true;
}

bool runAsyncOperationChecks()
{
    auto                            clock = std::make_shared<tryrun::ManualClock>();
    const tryrun::CancellationToken never;

    {
        auto operation = tryrun::AsyncOperation<int>::start(clock, [](const tryrun::CancellationToken&) -> llvm::Expected<int> {
            return 42;
        });
        if (operation.wait(*clock, clock->now() + 1s, never) != tryrun::WaitStatus::Ready)
        {
            std::cerr << "quick operation should be ready before its deadline\n";
            return false;
        }
        auto value = operation.take();
        if (!value || *value != 42)
        {
            if (!value)
            {
                llvm::consumeError(value.takeError());
            }
            std::cerr << "operation result should be 42\n";
            return false;
        }
    }

    {
        const auto deadline  = clock->now() + 10ms;
        auto       operation = tryrun::AsyncOperation<int>::start(
            clock,
            [clock](const tryrun::CancellationToken&) -> llvm::Expected<int> {
                clock->advance(50ms);
                return 1;
            });
        if (operation.wait(*clock, deadline, never) != tryrun::WaitStatus::Expired)
        {
            std::cerr << "operation that overran its budget should be reported as expired\n";
            return false;
        }
    }

    {
        tryrun::CancellationSource outer;
        outer.cancel();
        auto operation = tryrun::AsyncOperation<int>::start(
            clock,
            [](const tryrun::CancellationToken& token) -> llvm::Expected<int> {
                blockUntilCancelled(token);
                return tryrun::makePipelineError(tryrun::ErrorKind::Cancelled, "stopped");
            });
        if (operation.wait(*clock, clock->now() + 1s, outer.token()) != tryrun::WaitStatus::Cancelled)
        {
            std::cerr << "outer cancellation should interrupt the wait\n";
            return false;
        }
    }

    {
        auto operation = tryrun::AsyncOperation<int>::start(clock, [](const tryrun::CancellationToken&) -> llvm::Expected<int> {
            throw std::runtime_error("exploded");
        });
        if (operation.wait(*clock, clock->now() + 1s, never) != tryrun::WaitStatus::Ready)
        {
            std::cerr << "throwing operation should still complete\n";
            return false;
        }
        auto value = operation.take();
        if (value)
        {
            std::cerr << "throwing operation should produce an error\n";
            return false;
        }
        std::string message;
        if (tryrun::classifyError(value.takeError(), message) != tryrun::ErrorKind::ToolchainFailure ||
            message != "exploded")
        {
            std::cerr << "exception should become a toolchain failure, got: " << message << "\n";
            return false;
        }
    }

    {
        // Finished in time, but the waiter only looks after the deadline.
        const auto start     = clock->now();
        auto       operation = tryrun::AsyncOperation<int>::start(clock, [](const tryrun::CancellationToken&) -> llvm::Expected<int> {
            return 7;
        });
        const auto limit = std::chrono::steady_clock::now() + 5s;
        while (!operation.ready() && std::chrono::steady_clock::now() < limit)
        {
            std::this_thread::sleep_for(1ms);
        }
        clock->advance(1s);
        if (operation.wait(*clock, start + 10ms, never) != tryrun::WaitStatus::Ready)
        {
            std::cerr << "operation that completed before its deadline should not be reported as expired\n";
            return false;
        }
        auto value = operation.take();
        if (!value || *value != 7)
        {
            if (!value)
            {
                llvm::consumeError(value.takeError());
            }
            std::cerr << "late-observed operation should keep its result\n";
            return false;
        }
    }
    return true;
}

bool runErrorChecks()
{
    llvm::Error error = tryrun::makePipelineError(tryrun::ErrorKind::InvalidPosition, "position 9 is outside [0, 8]");
    if (llvm::toString(std::move(error)) != "invalid_position: position 9 is outside [0, 8]")
    {
        std::cerr << "logged pipeline error should carry its kind prefix\n";
        return false;
    }

    bool sawText = false;
    llvm::handleAllErrors(tryrun::makePipelineError(tryrun::ErrorKind::UserCodeTimeout, "slow"),
                          [&sawText](const tryrun::PipelineError& pipelineError) {
                              sawText = pipelineError.text() == "slow" &&
                                        pipelineError.kind() == tryrun::ErrorKind::UserCodeTimeout &&
                                        pipelineError.message() == "user_code_timeout: slow";
                          });
    if (!sawText)
    {
        std::cerr << "pipeline error should expose its bare text and the base message\n";
        return false;
    }

    std::string message;
    if (tryrun::classifyError(tryrun::makePipelineError(tryrun::ErrorKind::MalformedRequest, "no buffers"), message) !=
            tryrun::ErrorKind::MalformedRequest ||
        message != "no buffers")
    {
        std::cerr << "classification should return the kind and bare text, got: " << message << "\n";
        return false;
    }
    if (tryrun::classifyError(llvm::createStringError(std::errc::io_error, "disk"), message) !=
            tryrun::ErrorKind::ToolchainFailure ||
        message != "disk")
    {
        std::cerr << "foreign errors should classify as toolchain failures\n";
        return false;
    }
    return true;
}

}  // namespace

bool runClockTests()
{
    bool ok = true;
    ok      = runDeadlineChecks() && ok;
    ok      = runWaitUntilChecks() && ok;
    ok      = runCancellationChecks() && ok;
    ok      = runAsyncOperationChecks() && ok;
    ok      = runErrorChecks() && ok;
    return ok;
}
