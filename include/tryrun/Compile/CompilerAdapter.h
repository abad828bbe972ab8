//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Workspace assembly and mode-aware compilation.
///
/// Assembly lays a workspace out as one translation unit:
///  1. usings become `#include` or `using namespace` lines;
///  2. auxiliary files follow, with whole-file and `file@region` buffer
///     injection applied;
///  3. remaining buffers close the unit, wrapped in a synthetic entry point
///     when compiled as a script.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_COMPILE_COMPILER_ADAPTER_H
#define TRYRUN_COMPILE_COMPILER_ADAPTER_H

#include "tryrun/Compile/Toolchain.h"
#include "tryrun/Support/Cancellation.h"
#include "tryrun/Workspace/SourceMap.h"
#include "tryrun/Workspace/Workspace.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>

namespace tryrun
{

/// @brief Diagnostic id reported when program mode finds no entry point.
inline constexpr const char* MissingEntryPointId = "TRY5001";

/// @brief Diagnostic id reported when a build fails without diagnostics.
inline constexpr const char* SilentBuildFailureId = "TRY5002";

/// @brief Compiles workspaces through a substitutable toolchain.
class CompilerAdapter final
{
public:
    explicit CompilerAdapter(std::shared_ptr<Toolchain> toolchain);

    /// @brief Assembles a workspace into a merged translation unit.
    /// @return Unit, or `MalformedRequest` when a region buffer names a
    ///         region its file does not declare.
    [[nodiscard]] static llvm::Expected<CompilationUnit> assemble(const Workspace& workspace);

    /// @brief Compiles an assembled unit.
    ///
    /// Program-mode units without an entry point are only checked, and an
    /// extra `TRY5001` diagnostic anchored at the start of the first buffer
    /// guarantees they never produce an artifact. Nothing is executed.
    ///
    /// @return Artifact and merged-coordinate diagnostics, or a toolchain error.
    [[nodiscard]] llvm::Expected<CompileOutcome> compile(const CompilationUnit& unit, const CancellationToken& token);

    [[nodiscard]] const std::shared_ptr<Toolchain>& toolchain() const
    {
        return toolchain_;
    }

private:
    std::shared_ptr<Toolchain> toolchain_;
};

/// @brief Lexically scans for a namespace-scope `main(...) {` definition.
///
/// Comments, string and character literals, and preprocessor lines are
/// skipped. Declarations without a body do not count.
[[nodiscard]] bool definesEntryPoint(llvm::StringRef text);

}  // namespace tryrun

#endif  // TRYRUN_COMPILE_COMPILER_ADAPTER_H
