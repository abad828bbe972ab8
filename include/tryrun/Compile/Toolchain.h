//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Narrow capability interface onto a language toolchain.
///
/// The pipeline never inspects toolchain internals. Conforming toolchains are
/// substitutable, and tests drive the pipeline through fakes.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_COMPILE_TOOLCHAIN_H
#define TRYRUN_COMPILE_TOOLCHAIN_H

#include "tryrun/Support/Cancellation.h"
#include "tryrun/Support/Diagnostics.h"
#include "tryrun/Workspace/SourceMap.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tryrun
{

/// @brief What a compile invocation must produce.
enum class CompileAction
{
    /// @brief Produce a runnable artifact.
    Build,

    /// @brief Produce diagnostics only.
    CheckOnly,
};

/// @brief Input to `Toolchain::compile`.
struct CompileRequest
{
    /// @brief Merged translation unit.
    const CompilationUnit* unit{nullptr};

    /// @brief Requested action.
    CompileAction action{CompileAction::Build};
};

/// @brief Thread-safe sink for program output shared with the waiting side.
///
/// Writers append from the execution thread while a timed-out caller may take
/// a snapshot at any time. Output beyond the byte limit is dropped.
class OutputBuffer final
{
public:
    explicit OutputBuffer(std::size_t maxBytes = 1024 * 1024);

    /// @brief Appends a chunk of output.
    void append(llvm::StringRef chunk);

    /// @brief Returns the output captured so far.
    [[nodiscard]] std::string snapshot() const;

    /// @brief Returns true when output was dropped at the byte limit.
    [[nodiscard]] bool truncated() const;

private:
    mutable std::mutex mutex_;
    std::string        text_;
    std::size_t        maxBytes_;
    bool               truncated_{false};
};

/// @brief Result of running an artifact to completion.
struct ExecutionOutcome
{
    /// @brief Program exit code.
    int exitCode{0};

    /// @brief Description of an unhandled exception or runtime fault.
    std::optional<std::string> exception;
};

/// @brief Runnable product of a successful build.
///
/// Owned by exactly one run. Destruction releases every resource the
/// artifact holds, including on-disk state.
class CompiledArtifact
{
public:
    virtual ~CompiledArtifact() = default;

    /// @brief Performs run setup such as staging the executable.
    [[nodiscard]] virtual llvm::Error prepare(const CancellationToken& token) = 0;

    /// @brief Runs the program, streaming its standard output into `output`.
    /// @return Outcome, or an error when the program could not be started.
    [[nodiscard]] virtual llvm::Expected<ExecutionOutcome> run(OutputBuffer& output, const CancellationToken& token) = 0;
};

/// @brief Result of a compile invocation.
struct CompileOutcome
{
    /// @brief Artifact when the build succeeded and one was requested.
    std::unique_ptr<CompiledArtifact> artifact;

    /// @brief Diagnostics in merged coordinates, in toolchain order.
    std::vector<Diagnostic> diagnostics;
};

/// @brief One completion candidate.
struct CompletionItem
{
    std::string displayText;
    std::string kind;
    std::string filterText;
    std::string sortText;
    std::string insertText;
    std::string documentation;
};

/// @brief Compiler capability used by the pipeline.
class Toolchain
{
public:
    virtual ~Toolchain() = default;

    /// @brief Compiles a merged unit.
    ///
    /// Compilation failures are reported as diagnostics. Errors are reserved
    /// for failures of the toolchain itself.
    [[nodiscard]] virtual llvm::Expected<CompileOutcome> compile(const CompileRequest&     request,
                                                                 const CancellationToken& token) = 0;

    /// @brief Lists completion candidates at a merged offset, in toolchain order.
    [[nodiscard]] virtual llvm::Expected<std::vector<CompletionItem>> complete(const CompilationUnit&    unit,
                                                                               std::size_t               mergedOffset,
                                                                               const CancellationToken& token) = 0;
};

}  // namespace tryrun

#endif  // TRYRUN_COMPILE_TOOLCHAIN_H
