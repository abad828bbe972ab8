//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "support/FakeToolchain.h"

#include "tryrun/Completion/CompletionProvider.h"
#include "tryrun/Support/Error.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace
{

using namespace std::chrono_literals;

tryrun::WorkspaceRequest positioned(const std::string& content, const std::int64_t position)
{
    tryrun::WorkspaceRequest request;
    request.workspace.buffers.push_back(tryrun::Buffer{"", content, position});
    return request;
}

bool expectErrorKind(llvm::Expected<tryrun::CompletionResult> result,
                     const tryrun::ErrorKind                  expected,
                     const char*                              label)
{
    if (result)
    {
        std::cerr << label << ": expected an error\n";
        return false;
    }
    std::string message;
    const auto  kind = tryrun::classifyError(result.takeError(), message);
    if (kind != expected)
    {
        std::cerr << label << ": expected " << tryrun::errorKindName(expected).str() << ", got "
                  << tryrun::errorKindName(kind).str() << " (" << message << ")\n";
        return false;
    }
    return true;
}

bool runMemberCompletionChecks()
{
    auto                       clock     = std::make_shared<tryrun::ManualClock>();
    auto                       toolchain = std::make_shared<tryrun::test::FakeToolchain>(clock);
    tryrun::CompletionProvider provider(toolchain, clock);

    tryrun::WorkspaceRequest request = positioned("Console.", 8);
    request.requestId                = "c-1";
    auto result                      = provider.complete(request, 1000ms);
    if (!result)
    {
        std::cerr << "completion failed: " << llvm::toString(result.takeError()) << "\n";
        return false;
    }
    if (result->items.size() != 2 || result->items[0].displayText != "WriteLine" ||
        result->items[1].displayText != "Write")
    {
        std::cerr << "member completion should list WriteLine first\n";
        return false;
    }
    if (result->requestId != std::optional<std::string>("c-1"))
    {
        std::cerr << "completion should echo the request id\n";
        return false;
    }

    // Position zero is valid and sees none of the buffer.
    auto start = provider.complete(positioned("Console.", 0), 1000ms);
    if (!start || start->items.empty() || start->items[0].displayText != "int")
    {
        if (!start)
        {
            llvm::consumeError(start.takeError());
        }
        std::cerr << "completion at offset zero should fall back to keywords\n";
        return false;
    }
    return true;
}

bool runCharacterPositionChecks()
{
    auto                       clock     = std::make_shared<tryrun::ManualClock>();
    auto                       toolchain = std::make_shared<tryrun::test::FakeToolchain>(clock);
    tryrun::CompletionProvider provider(toolchain, clock);

    // 22 characters, 23 bytes: positions count characters.
    const std::string content = "auto s = \"\xC3\xA9\"; Console.";
    auto              result  = provider.complete(positioned(content, 22), 1000ms);
    if (!result)
    {
        std::cerr << "completion after a multibyte character failed: " << llvm::toString(result.takeError()) << "\n";
        return false;
    }
    if (result->items.empty() || result->items[0].displayText != "WriteLine")
    {
        std::cerr << "character position should land after 'Console.'\n";
        return false;
    }
    return expectErrorKind(provider.complete(positioned(content, 23), 1000ms),
                           tryrun::ErrorKind::InvalidPosition,
                           "byte length is not a valid position");
}

bool runInvalidPositionChecks()
{
    auto                       clock     = std::make_shared<tryrun::ManualClock>();
    auto                       toolchain = std::make_shared<tryrun::test::FakeToolchain>(clock);
    tryrun::CompletionProvider provider(toolchain, clock);

    bool ok = true;
    ok = expectErrorKind(provider.complete(positioned("Console.", 9), 1000ms), tryrun::ErrorKind::InvalidPosition,
                         "past end") &&
         ok;
    ok = expectErrorKind(provider.complete(positioned("Console.", -1), 1000ms), tryrun::ErrorKind::InvalidPosition,
                         "negative") &&
         ok;

    tryrun::WorkspaceRequest unpositioned;
    unpositioned.workspace.buffers.push_back(tryrun::Buffer{"a", "int x;", std::nullopt});
    unpositioned.workspace.buffers.push_back(tryrun::Buffer{"b", "int y;", std::nullopt});
    ok = expectErrorKind(provider.complete(unpositioned, 1000ms), tryrun::ErrorKind::InvalidPosition, "no active") &&
         ok;
    return ok;
}

bool runTimeoutAndCancellationChecks()
{
    auto                       clock     = std::make_shared<tryrun::ManualClock>();
    auto                       toolchain = std::make_shared<tryrun::test::FakeToolchain>(clock);
    tryrun::CompletionProvider provider(toolchain, clock);

    toolchain->setCompletionCost(200ms);
    if (!expectErrorKind(provider.complete(positioned("Console.", 8), 100ms),
                         tryrun::ErrorKind::InfrastructureTimeout,
                         "slow completion"))
    {
        return false;
    }

    toolchain->setCompletionCost(0ms);
    tryrun::CancellationSource source;
    source.cancel();
    return expectErrorKind(provider.complete(positioned("Console.", 8), 1000ms, source.token()),
                           tryrun::ErrorKind::Cancelled,
                           "cancelled completion");
}

}  // namespace

bool runCompletionProviderTests()
{
    bool ok = true;
    ok      = runMemberCompletionChecks() && ok;
    ok      = runCharacterPositionChecks() && ok;
    ok      = runInvalidPositionChecks() && ok;
    ok      = runTimeoutAndCancellationChecks() && ok;
    return ok;
}
