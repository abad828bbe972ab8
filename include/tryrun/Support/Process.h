//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// POSIX subprocess execution with streamed output and forceful cancellation.
///
/// Children run in their own process group so cancellation also reaches any
/// processes they spawned.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SUPPORT_PROCESS_H
#define TRYRUN_SUPPORT_PROCESS_H

#include "tryrun/Support/Cancellation.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tryrun
{

/// @brief Command line and stdio wiring for one child process.
struct ProcessSpec
{
    /// @brief Program followed by its arguments. `argv[0]` is looked up in `PATH`.
    std::vector<std::string> argv;

    /// @brief File connected to the child's standard input.
    std::string stdinPath{"/dev/null"};
};

/// @brief Termination status of a child process.
struct ProcessExit
{
    /// @brief Exit code when the child exited normally.
    int exitCode{-1};

    /// @brief Terminating signal number when the child was signalled.
    std::optional<int> signal;

    /// @brief True when the child was killed because of cancellation.
    bool killed{false};

    [[nodiscard]] bool succeeded() const
    {
        return !signal && !killed && exitCode == 0;
    }
};

/// @brief Receives chunks of child output as they are read.
using ProcessOutputFn = std::function<void(llvm::StringRef chunk)>;

/// @brief Runs a child process to completion or cancellation.
///
/// Output is delivered incrementally. When `token` is cancelled the whole
/// process group is killed and the call returns with `ProcessExit::killed`.
///
/// @param[in] spec Command and stdio wiring.
/// @param[in] onStdout Standard output sink.
/// @param[in] onStderr Standard error sink.
/// @param[in] token Cancellation token polled while the child runs.
/// @return Exit status, or an error when the child could not be started.
[[nodiscard]] llvm::Expected<ProcessExit> runProcess(const ProcessSpec&        spec,
                                                     const ProcessOutputFn&    onStdout,
                                                     const ProcessOutputFn&    onStderr,
                                                     const CancellationToken& token);

/// @brief Runs a child and collects standard output and error into one string.
[[nodiscard]] llvm::Expected<ProcessExit> runProcessCapture(const ProcessSpec&        spec,
                                                            std::string&              combinedOutput,
                                                            const CancellationToken& token);

}  // namespace tryrun

#endif  // TRYRUN_SUPPORT_PROCESS_H
