//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Toolchain backed by a clang-compatible compiler driver subprocess.
///
/// Every compile and completion call works in a fresh scratch directory.
/// Artifacts own their directory and remove it on destruction, so nothing
/// survives the run that produced it.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_COMPILE_CLANG_TOOLCHAIN_H
#define TRYRUN_COMPILE_CLANG_TOOLCHAIN_H

#include "tryrun/Compile/Toolchain.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <optional>
#include <string>
#include <vector>

namespace tryrun
{

/// @brief Marker the prelude writes to standard error for unhandled exceptions.
inline constexpr const char* ExceptionMarker = "__tryrun_exception__: ";

/// @brief Compiler driver settings.
struct ToolchainOptions
{
    /// @brief Driver executable, looked up in `PATH` when not absolute.
    std::string compilerPath{"clang++"};

    /// @brief Value passed as `-std=`.
    std::string languageStandard{"c++20"};

    /// @brief Extra driver flags appended before the source file.
    std::vector<std::string> extraFlags;

    /// @brief Header force-included into every unit; empty disables it.
    std::string preludePath;

    /// @brief Directory scratch directories are created under; empty uses the
    ///        system temporary directory.
    std::string scratchRoot;
};

/// @brief Toolchain invoking a clang-compatible driver.
class ClangToolchain final : public Toolchain
{
public:
    explicit ClangToolchain(ToolchainOptions options);

    [[nodiscard]] llvm::Expected<CompileOutcome> compile(const CompileRequest&     request,
                                                         const CancellationToken& token) override;

    [[nodiscard]] llvm::Expected<std::vector<CompletionItem>> complete(const CompilationUnit&    unit,
                                                                       std::size_t               mergedOffset,
                                                                       const CancellationToken& token) override;

    [[nodiscard]] const ToolchainOptions& options() const
    {
        return options_;
    }

private:
    [[nodiscard]] std::vector<std::string> baseArguments() const;

    ToolchainOptions options_;
};

/// @brief Parses driver output into merged-coordinate diagnostics.
///
/// Lines have the shape `file:line:col:{l:c-l:c}: level: message [flag]`.
/// Lines about `sourcePath` get byte spans in `sourceText`; other located
/// lines and linker output are kept without a span. Notes are dropped.
[[nodiscard]] std::vector<Diagnostic> parseClangDiagnostics(llvm::StringRef output,
                                                            llvm::StringRef sourcePath,
                                                            llvm::StringRef sourceText);

/// @brief Parses `COMPLETION:` lines in emitted order.
[[nodiscard]] std::vector<CompletionItem> parseClangCompletions(llvm::StringRef output);

/// @brief Extracts the exception description the prelude reported, if any.
[[nodiscard]] std::optional<std::string> findReportedException(llvm::StringRef standardError);

}  // namespace tryrun

#endif  // TRYRUN_COMPILE_CLANG_TOOLCHAIN_H
