//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Execution-free completion at a buffer position.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_COMPLETION_COMPLETION_PROVIDER_H
#define TRYRUN_COMPLETION_COMPLETION_PROVIDER_H

#include "tryrun/Compile/Toolchain.h"
#include "tryrun/Support/Cancellation.h"
#include "tryrun/Support/Clock.h"
#include "tryrun/Workspace/Workspace.h"

#include "llvm/Support/Error.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tryrun
{

/// @brief Completion candidates in toolchain order.
struct CompletionResult
{
    std::vector<CompletionItem> items;
    std::optional<std::string>  requestId;
};

/// @brief Resolves completion requests through the toolchain.
class CompletionProvider final
{
public:
    CompletionProvider(std::shared_ptr<Toolchain> toolchain, std::shared_ptr<Clock> clock);

    /// @brief Lists candidates at the active buffer's position.
    ///
    /// The position must lie in `[0, length(content)]`. Items are returned
    /// exactly as the toolchain ordered them.
    ///
    /// @param[in] request Normalized request with an active, positioned buffer.
    /// @param[in] budget Infrastructure budget for the toolchain call.
    /// @param[in] outer Token of the hosting scheduler.
    /// @return Items, or `InvalidPosition`, `MalformedRequest`,
    ///         `InfrastructureTimeout`, `ToolchainFailure` or `Cancelled`.
    [[nodiscard]] llvm::Expected<CompletionResult> complete(const WorkspaceRequest&   request,
                                                            std::chrono::milliseconds budget,
                                                            const CancellationToken&  outer = {});

private:
    std::shared_ptr<Toolchain> toolchain_;
    std::shared_ptr<Clock>     clock_;
};

}  // namespace tryrun

#endif  // TRYRUN_COMPLETION_COMPLETION_PROVIDER_H
