//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Compile-and-run pipeline with two independent deadlines.
///
/// The infrastructure deadline starts when compilation starts and covers
/// compilation plus artifact preparation. The user-code deadline starts when
/// the artifact starts running and covers only the run. Both are measured on
/// the injected clock, and either one expiring abandons the background work.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_EXEC_SANDBOX_H
#define TRYRUN_EXEC_SANDBOX_H

#include "tryrun/Compile/Toolchain.h"
#include "tryrun/Support/Cancellation.h"
#include "tryrun/Support/Clock.h"
#include "tryrun/Support/Diagnostics.h"
#include "tryrun/Workspace/Workspace.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tryrun
{

/// @brief Default budget for compilation and run setup.
inline constexpr std::chrono::milliseconds DefaultInfrastructureTimeout{10000};

/// @brief Default budget for the program's own run time.
inline constexpr std::chrono::milliseconds DefaultUserCodeTimeout{20000};

/// @brief Lifecycle of one run.
enum class RunPhase
{
    Pending,
    Compiling,
    Running,
    Succeeded,
    Failed,
    InfrastructureTimedOut,
    UserCodeTimedOut,
    Cancelled,
};

/// @brief Returns the display name of a phase.
[[nodiscard]] llvm::StringRef phaseName(RunPhase phase);

/// @brief Returns true for phases a run ends in.
[[nodiscard]] bool isTerminal(RunPhase phase);

/// @brief Per-request time budgets.
struct RunBudget
{
    std::chrono::milliseconds infrastructure{DefaultInfrastructureTimeout};
    std::chrono::milliseconds userCode{DefaultUserCodeTimeout};
};

/// @brief Terminal payload of a run.
struct RunResult
{
    /// @brief True when the program compiled and ran to a clean exit.
    bool succeeded{false};

    /// @brief Captured standard output, or rendered compile errors.
    std::string output;

    /// @brief Runtime fault description.
    std::optional<std::string> exception;

    /// @brief Diagnostics in caller coordinates.
    std::vector<Diagnostic> diagnostics;

    /// @brief Echoed caller correlation id.
    std::optional<std::string> requestId;
};

/// @brief Terminal phase plus payload.
struct SandboxOutcome
{
    RunPhase  phase{RunPhase::Pending};
    RunResult result;
};

/// @brief Receives every phase a run enters, in order.
using PhaseObserver = std::function<void(RunPhase phase)>;

/// @brief Runs workspaces through compilation and execution.
class Sandbox final
{
public:
    /// @param[in] toolchain Compiler capability.
    /// @param[in] clock Clock every deadline is measured on.
    /// @param[in] maxOutputBytes Output capture limit per run.
    Sandbox(std::shared_ptr<Toolchain> toolchain, std::shared_ptr<Clock> clock, std::size_t maxOutputBytes = 1024 * 1024);

    void setPhaseObserver(PhaseObserver observer);

    /// @brief Compiles and runs one request.
    ///
    /// Compilation failures, runtime faults and both timeouts are outcomes,
    /// not errors. Partial output captured before a user-code timeout is kept.
    ///
    /// @param[in] request Normalized request.
    /// @param[in] budget Deadlines for this run.
    /// @param[in] outer Token of the hosting scheduler.
    /// @return Outcome, or `MalformedRequest`/`ToolchainFailure` errors.
    [[nodiscard]] llvm::Expected<SandboxOutcome> run(const WorkspaceRequest& request,
                                                     const RunBudget&        budget,
                                                     const CancellationToken& outer = {});

private:
    SandboxOutcome finish(RunPhase phase, RunResult result) const;
    void           notify(RunPhase phase) const;

    std::shared_ptr<Toolchain> toolchain_;
    std::shared_ptr<Clock>     clock_;
    std::size_t                maxOutputBytes_;
    PhaseObserver              observer_;
};

}  // namespace tryrun

#endif  // TRYRUN_EXEC_SANDBOX_H
