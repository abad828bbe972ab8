//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Completion/CompletionProvider.h"

#include "tryrun/Compile/CompilerAdapter.h"
#include "tryrun/Exec/AsyncOperation.h"
#include "tryrun/Support/Error.h"
#include "tryrun/Support/SourceLocation.h"

#include "llvm/ADT/Twine.h"

#include <cstdint>
#include <utility>

namespace tryrun
{

CompletionProvider::CompletionProvider(std::shared_ptr<Toolchain> toolchain, std::shared_ptr<Clock> clock)
    : toolchain_(std::move(toolchain))
    , clock_(std::move(clock))
{
}

llvm::Expected<CompletionResult> CompletionProvider::complete(const WorkspaceRequest&         request,
                                                              const std::chrono::milliseconds budget,
                                                              const CancellationToken&        outer)
{
    const Buffer* active = request.activeBuffer();
    if (!active)
    {
        return makePipelineError(ErrorKind::InvalidPosition, "completion needs exactly one active buffer");
    }
    if (!active->position)
    {
        return makePipelineError(ErrorKind::InvalidPosition,
                                 llvm::Twine("buffer '") + active->id + "' has no position");
    }
    const std::int64_t  position = *active->position;
    const std::uint64_t length   = characterCount(active->content);
    if (position < 0 || static_cast<std::uint64_t>(position) > length)
    {
        return makePipelineError(ErrorKind::InvalidPosition,
                                 llvm::Twine("position ") + llvm::Twine(position) + " is outside [0, " +
                                     llvm::Twine(length) + "]");
    }
    const auto byteOffset = toByteOffset(active->content, static_cast<std::size_t>(position));
    if (!byteOffset)
    {
        return makePipelineError(ErrorKind::InvalidPosition,
                                 llvm::Twine("position ") + llvm::Twine(position) + " does not address a character");
    }

    auto assembled = CompilerAdapter::assemble(request.workspace);
    if (!assembled)
    {
        return assembled.takeError();
    }
    const auto unit   = std::make_shared<const CompilationUnit>(std::move(*assembled));
    const auto merged = unit->sourceMap.toMerged(active->id, *byteOffset);
    if (!merged)
    {
        return makePipelineError(ErrorKind::InvalidPosition,
                                 llvm::Twine("buffer '") + active->id + "' is not part of the compiled unit");
    }

    const Deadline infrastructure(*clock_, budget);
    auto           lookup = AsyncOperation<std::vector<CompletionItem>>::start(
        clock_,
        [toolchain = toolchain_, unit, offset = *merged](const CancellationToken& token) {
            return toolchain->complete(*unit, offset, token);
        });

    switch (lookup.wait(*clock_, infrastructure.at(), outer))
    {
    case WaitStatus::Expired:
        return makePipelineError(ErrorKind::InfrastructureTimeout,
                                 llvm::Twine("completion exceeded ") + llvm::Twine(budget.count()) + " ms");
    case WaitStatus::Cancelled:
        return makePipelineError(ErrorKind::Cancelled, "completion cancelled");
    case WaitStatus::Ready:
        break;
    }

    auto items = lookup.take();
    if (!items)
    {
        return items.takeError();
    }
    CompletionResult result;
    result.items     = std::move(*items);
    result.requestId = request.requestId;
    return result;
}

}  // namespace tryrun
