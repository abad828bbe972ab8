//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Support/Cancellation.h"
#include "tryrun/Support/Error.h"
#include "tryrun/Support/Process.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FileSystem.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>

namespace
{

tryrun::ProcessSpec shell(const std::string& script)
{
    tryrun::ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    return spec;
}

bool runCaptureChecks()
{
    std::string stdoutText;
    std::string stderrText;
    auto        exit = tryrun::runProcess(
        shell("printf 'hello\\n'; printf 'oops' 1>&2; exit 3"),
        [&stdoutText](const llvm::StringRef chunk) { stdoutText += chunk.str(); },
        [&stderrText](const llvm::StringRef chunk) { stderrText += chunk.str(); },
        {});
    if (!exit)
    {
        std::cerr << "shell should launch: " << llvm::toString(exit.takeError()) << "\n";
        return false;
    }
    if (exit->exitCode != 3 || exit->signal || exit->killed || exit->succeeded())
    {
        std::cerr << "expected exit code 3, got " << exit->exitCode << "\n";
        return false;
    }
    if (stdoutText != "hello\n" || stderrText != "oops")
    {
        std::cerr << "streams should be captured separately\n";
        return false;
    }

    std::string combined;
    auto        clean = tryrun::runProcessCapture(shell("echo one; echo two 1>&2"), combined, {});
    if (!clean || !clean->succeeded())
    {
        if (!clean)
        {
            llvm::consumeError(clean.takeError());
        }
        std::cerr << "expected a clean exit\n";
        return false;
    }
    if (combined.find("one\n") == std::string::npos || combined.find("two\n") == std::string::npos)
    {
        std::cerr << "combined capture should hold both streams\n";
        return false;
    }
    return true;
}

bool runSignalChecks()
{
    std::string output;
    auto        exit = tryrun::runProcessCapture(shell("kill -SEGV $$"), output, {});
    if (!exit)
    {
        std::cerr << "shell should launch: " << llvm::toString(exit.takeError()) << "\n";
        return false;
    }
    if (!exit->signal || *exit->signal != SIGSEGV || exit->exitCode != 128 + SIGSEGV || exit->killed)
    {
        std::cerr << "expected SIGSEGV termination\n";
        return false;
    }
    return true;
}

bool runLaunchFailureChecks()
{
    tryrun::ProcessSpec spec;
    spec.argv = {"/nonexistent/tryrun-missing-tool"};
    std::string output;
    auto        exit = tryrun::runProcessCapture(spec, output, {});
    if (exit)
    {
        std::cerr << "missing executable should not launch\n";
        return false;
    }
    std::string message;
    if (tryrun::classifyError(exit.takeError(), message) != tryrun::ErrorKind::ToolchainFailure ||
        message.find("tryrun-missing-tool") == std::string::npos)
    {
        std::cerr << "unexpected launch failure: " << message << "\n";
        return false;
    }

    auto empty = tryrun::runProcessCapture(tryrun::ProcessSpec{}, output, {});
    if (empty)
    {
        std::cerr << "empty command line should be rejected\n";
        return false;
    }
    llvm::consumeError(empty.takeError());
    return true;
}

bool runCancellationChecks()
{
    tryrun::CancellationSource source;
    std::thread                canceller([&source]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        source.cancel();
    });

    const auto  start = std::chrono::steady_clock::now();
    std::string output;
    auto        exit = tryrun::runProcessCapture(shell("echo started; sleep 30"), output, source.token());
    const auto  spent = std::chrono::steady_clock::now() - start;
    canceller.join();

    if (!exit)
    {
        std::cerr << "shell should launch: " << llvm::toString(exit.takeError()) << "\n";
        return false;
    }
    if (!exit->killed || exit->succeeded())
    {
        std::cerr << "cancelled child should be reported as killed\n";
        return false;
    }
    if (spent > std::chrono::seconds(10))
    {
        std::cerr << "cancellation should stop the child promptly\n";
        return false;
    }
    if (output.find("started") == std::string::npos)
    {
        std::cerr << "output written before cancellation should be kept\n";
        return false;
    }
    return true;
}

/// Counts the descriptors a freshly spawned `ls` holds; -1 on failure.
int countChildDescriptors()
{
    tryrun::ProcessSpec spec;
    spec.argv = {"ls", "/proc/self/fd"};
    std::string stdoutText;
    auto        exit = tryrun::runProcess(
        spec,
        [&stdoutText](const llvm::StringRef chunk) { stdoutText += chunk.str(); },
        nullptr,
        {});
    if (!exit)
    {
        llvm::consumeError(exit.takeError());
        return -1;
    }
    if (!exit->succeeded())
    {
        return -1;
    }
    llvm::SmallVector<llvm::StringRef, 8> lines;
    llvm::StringRef(stdoutText).split(lines, '\n', -1, false);
    return static_cast<int>(lines.size());
}

bool runDescriptorIsolationChecks()
{
    if (!llvm::sys::fs::is_directory("/proc/self/fd"))
    {
        return true;
    }
    const int baseline = countChildDescriptors();
    if (baseline < 3)
    {
        std::cerr << "could not list descriptors of a child process\n";
        return false;
    }

    // Children spawned while other workers hold live pipes must see no more
    // descriptors than a child spawned alone.
    std::atomic_int          worst{baseline};
    std::atomic_bool         failed{false};
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w)
    {
        workers.emplace_back([&worst, &failed]() {
            for (int i = 0; i < 16; ++i)
            {
                const int count = countChildDescriptors();
                if (count < 0)
                {
                    failed = true;
                    return;
                }
                int seen = worst.load();
                while (count > seen && !worst.compare_exchange_weak(seen, count))
                {
                }
            }
        });
    }
    for (auto& worker : workers)
    {
        worker.join();
    }
    if (failed)
    {
        std::cerr << "concurrent child listing failed\n";
        return false;
    }
    if (worst.load() != baseline)
    {
        std::cerr << "concurrent children inherited foreign pipes: " << worst.load() << " descriptors vs "
                  << baseline << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runProcessTests()
{
    bool ok = true;
    ok      = runCaptureChecks() && ok;
    ok      = runSignalChecks() && ok;
    ok      = runLaunchFailureChecks() && ok;
    ok      = runCancellationChecks() && ok;
    ok      = runDescriptorIsolationChecks() && ok;
    return ok;
}
