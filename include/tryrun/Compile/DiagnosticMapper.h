//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Translation of merged-coordinate diagnostics into caller coordinates.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_COMPILE_DIAGNOSTIC_MAPPER_H
#define TRYRUN_COMPILE_DIAGNOSTIC_MAPPER_H

#include "tryrun/Support/Diagnostics.h"
#include "tryrun/Workspace/SourceMap.h"
#include "tryrun/Workspace/Workspace.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace tryrun
{

/// @brief Maps diagnostics of one compilation unit back onto its workspace.
///
/// Mapped spans count characters of the owner text and always satisfy
/// `0 <= start <= end <= length(owner text)`.
/// Diagnostics that no buffer or file owns are kept with an empty span at
/// offset zero, an empty location, and `attributable` cleared.
class DiagnosticMapper final
{
public:
    DiagnosticMapper(const CompilationUnit& unit, const Workspace& workspace);

    /// @brief Maps one diagnostic.
    [[nodiscard]] Diagnostic map(const Diagnostic& merged) const;

    /// @brief Maps diagnostics preserving order.
    [[nodiscard]] std::vector<Diagnostic> mapAll(const std::vector<Diagnostic>& merged) const;

    /// @brief Renders `name(line,col): severity ID: message` for a mapped diagnostic.
    [[nodiscard]] std::string render(const Diagnostic& mapped) const;

    /// @brief Renders mapped diagnostics one per line.
    [[nodiscard]] std::string renderAll(const std::vector<Diagnostic>& mapped) const;

private:
    [[nodiscard]] llvm::StringRef ownerText(llvm::StringRef ownerId) const;

    const CompilationUnit& unit_;
    const Workspace&       workspace_;
};

}  // namespace tryrun

#endif  // TRYRUN_COMPILE_DIAGNOSTIC_MAPPER_H
