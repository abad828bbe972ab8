//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the dual-deadline compile-and-run pipeline.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Exec/Sandbox.h"

#include "tryrun/Compile/CompilerAdapter.h"
#include "tryrun/Compile/DiagnosticMapper.h"
#include "tryrun/Exec/AsyncOperation.h"
#include "tryrun/Support/Error.h"

#include <utility>

namespace tryrun
{
namespace
{

std::vector<Diagnostic> errorsOnly(const std::vector<Diagnostic>& diagnostics)
{
    std::vector<Diagnostic> errors;
    for (const Diagnostic& diagnostic : diagnostics)
    {
        if (diagnostic.severity == DiagnosticSeverity::Error)
        {
            errors.push_back(diagnostic);
        }
    }
    return errors;
}

}  // namespace

llvm::StringRef phaseName(const RunPhase phase)
{
    switch (phase)
    {
    case RunPhase::Pending:
        return "Pending";
    case RunPhase::Compiling:
        return "Compiling";
    case RunPhase::Running:
        return "Running";
    case RunPhase::Succeeded:
        return "Succeeded";
    case RunPhase::Failed:
        return "Failed";
    case RunPhase::InfrastructureTimedOut:
        return "InfrastructureTimedOut";
    case RunPhase::UserCodeTimedOut:
        return "UserCodeTimedOut";
    case RunPhase::Cancelled:
        return "Cancelled";
    }
    return "Pending";
}

bool isTerminal(const RunPhase phase)
{
    return phase != RunPhase::Pending && phase != RunPhase::Compiling && phase != RunPhase::Running;
}

Sandbox::Sandbox(std::shared_ptr<Toolchain> toolchain, std::shared_ptr<Clock> clock, const std::size_t maxOutputBytes)
    : toolchain_(std::move(toolchain))
    , clock_(std::move(clock))
    , maxOutputBytes_(maxOutputBytes)
{
}

void Sandbox::setPhaseObserver(PhaseObserver observer)
{
    observer_ = std::move(observer);
}

void Sandbox::notify(const RunPhase phase) const
{
    if (observer_)
    {
        observer_(phase);
    }
}

SandboxOutcome Sandbox::finish(const RunPhase phase, RunResult result) const
{
    notify(phase);
    SandboxOutcome outcome;
    outcome.phase  = phase;
    outcome.result = std::move(result);
    return outcome;
}

llvm::Expected<SandboxOutcome> Sandbox::run(const WorkspaceRequest&  request,
                                            const RunBudget&         budget,
                                            const CancellationToken& outer)
{
    notify(RunPhase::Pending);
    RunResult result;
    result.requestId = request.requestId;

    auto assembled = CompilerAdapter::assemble(request.workspace);
    if (!assembled)
    {
        return assembled.takeError();
    }
    const auto unit = std::make_shared<const CompilationUnit>(std::move(*assembled));

    // Compilation and preparation share the infrastructure deadline.
    notify(RunPhase::Compiling);
    const Deadline infrastructure(*clock_, budget.infrastructure);
    auto           build = AsyncOperation<CompileOutcome>::start(
        clock_,
        [toolchain = toolchain_, unit](const CancellationToken& token) -> llvm::Expected<CompileOutcome> {
            CompilerAdapter adapter(toolchain);
            auto            compiled = adapter.compile(*unit, token);
            if (!compiled || !compiled->artifact)
            {
                return compiled;
            }
            if (auto error = compiled->artifact->prepare(token))
            {
                return std::move(error);
            }
            return compiled;
        });

    switch (build.wait(*clock_, infrastructure.at(), outer))
    {
    case WaitStatus::Expired:
        return finish(RunPhase::InfrastructureTimedOut, std::move(result));
    case WaitStatus::Cancelled:
        return finish(RunPhase::Cancelled, std::move(result));
    case WaitStatus::Ready:
        break;
    }

    auto compiled = build.take();
    if (!compiled)
    {
        std::string message;
        const auto  kind = classifyError(compiled.takeError(), message);
        if (kind == ErrorKind::Cancelled)
        {
            return finish(RunPhase::Cancelled, std::move(result));
        }
        return makePipelineError(kind, message);
    }

    const DiagnosticMapper mapper(*unit, request.workspace);
    result.diagnostics = mapper.mapAll(compiled->diagnostics);
    if (!compiled->artifact)
    {
        result.output = mapper.renderAll(errorsOnly(result.diagnostics));
        return finish(RunPhase::Failed, std::move(result));
    }

    notify(RunPhase::Running);
    const std::shared_ptr<CompiledArtifact> artifact = std::move(compiled->artifact);
    const auto                              output   = std::make_shared<OutputBuffer>(maxOutputBytes_);
    const Deadline                          userCode(*clock_, budget.userCode);
    auto execution = AsyncOperation<ExecutionOutcome>::start(clock_, [artifact, output](const CancellationToken& token) {
        return artifact->run(*output, token);
    });

    switch (execution.wait(*clock_, userCode.at(), outer))
    {
    case WaitStatus::Expired:
        // Best effort: whatever the program flushed before the deadline.
        result.output = output->snapshot();
        return finish(RunPhase::UserCodeTimedOut, std::move(result));
    case WaitStatus::Cancelled:
        result.output = output->snapshot();
        return finish(RunPhase::Cancelled, std::move(result));
    case WaitStatus::Ready:
        break;
    }

    auto executed = execution.take();
    result.output = output->snapshot();
    if (!executed)
    {
        std::string message;
        const auto  kind = classifyError(executed.takeError(), message);
        if (kind == ErrorKind::Cancelled)
        {
            return finish(RunPhase::Cancelled, std::move(result));
        }
        return makePipelineError(kind, message);
    }

    result.exception = executed->exception;
    if (!result.exception && executed->exitCode != 0)
    {
        result.exception = "Program exited with code " + std::to_string(executed->exitCode);
    }
    result.succeeded = !result.exception;
    return finish(result.succeeded ? RunPhase::Succeeded : RunPhase::Failed, std::move(result));
}

}  // namespace tryrun
