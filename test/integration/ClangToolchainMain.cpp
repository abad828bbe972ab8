//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Drives the clang toolchain, the prelude and the sandbox against a real
/// compiler driver. Exits with 77 (skipped) when no driver is available.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Compile/ClangToolchain.h"
#include "tryrun/Completion/CompletionProvider.h"
#include "tryrun/Exec/Sandbox.h"
#include "tryrun/Support/Clock.h"

#include "llvm/Support/FileSystem.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace
{

using namespace std::chrono_literals;

constexpr int SkipExitCode = 77;

struct Fixture final
{
    std::shared_ptr<tryrun::SteadyClock>    clock{std::make_shared<tryrun::SteadyClock>()};
    std::shared_ptr<tryrun::ClangToolchain> toolchain;
    tryrun::RunBudget                       budget;

    explicit Fixture(tryrun::ToolchainOptions options)
        : toolchain(std::make_shared<tryrun::ClangToolchain>(std::move(options)))
    {
        budget.infrastructure = 60s;
        budget.userCode       = 30s;
    }
};

tryrun::WorkspaceRequest scriptRequest(const std::string& code, std::optional<std::int64_t> position = std::nullopt)
{
    tryrun::WorkspaceRequest request;
    request.workspace.buffers.push_back(tryrun::Buffer{"main", code, position});
    return request;
}

bool runOrReport(Fixture& fixture, const std::string& code, const char* label, tryrun::SandboxOutcome& out)
{
    tryrun::Sandbox sandbox(fixture.toolchain, fixture.clock);
    auto            outcome = sandbox.run(scriptRequest(code), fixture.budget);
    if (!outcome)
    {
        std::cerr << label << ": unexpected error: " << llvm::toString(outcome.takeError()) << "\n";
        return false;
    }
    out = std::move(*outcome);
    return true;
}

bool runScriptExecutionChecks(Fixture& fixture)
{
    tryrun::SandboxOutcome outcome;
    if (!runOrReport(fixture, "Console.WriteLine(\"hello \", 6 * 7);", "hello", outcome))
    {
        return false;
    }
    if (outcome.phase != tryrun::RunPhase::Succeeded || outcome.result.output != "hello 42\n")
    {
        std::cerr << "script should run through the prelude, got " << tryrun::phaseName(outcome.phase).str() << ": "
                  << outcome.result.output << "\n";
        return false;
    }

    if (!runOrReport(fixture,
                     "#include <regex>\nConsole.WriteLine(std::regex_match(\"aaa\", std::regex(\"a+\")));",
                     "directive",
                     outcome))
    {
        return false;
    }
    if (outcome.phase != tryrun::RunPhase::Succeeded || outcome.result.output != "1\n")
    {
        std::cerr << "leading #include should compile at file scope, got: " << outcome.result.output << "\n";
        return false;
    }

    if (!runOrReport(fixture, "throw std::runtime_error(\"boom\");", "throw", outcome))
    {
        return false;
    }
    if (outcome.phase != tryrun::RunPhase::Failed || !outcome.result.exception ||
        outcome.result.exception->find("boom") == std::string::npos)
    {
        std::cerr << "uncaught exception should be reported by the prelude\n";
        return false;
    }
    return true;
}

bool runCompileErrorChecks(Fixture& fixture)
{
    // The second buffer is 34 characters in 36 bytes.
    const char* const cases[][2] = {
        {"Console.WriteLine(\"hello\"", "25"},
        {"auto s = \"\xC3\xA9\xC3\xA9\"; Console.WriteLine(s", "34"},
    };
    for (const auto& c : cases)
    {
        tryrun::SandboxOutcome outcome;
        if (!runOrReport(fixture, c[0], "missing paren", outcome))
        {
            return false;
        }
        if (outcome.phase != tryrun::RunPhase::Failed || outcome.result.diagnostics.empty())
        {
            std::cerr << "missing paren should fail compilation: " << c[0] << "\n";
            return false;
        }
        const tryrun::Diagnostic* error = nullptr;
        for (const auto& diagnostic : outcome.result.diagnostics)
        {
            if (diagnostic.severity == tryrun::DiagnosticSeverity::Error)
            {
                error = &diagnostic;
                break;
            }
        }
        if (!error || !error->span || std::to_string(error->span->start) != c[1] || !error->attributable ||
            error->location != "main")
        {
            std::cerr << "missing paren should be reported at the buffer end (" << c[1] << "): " << c[0] << "\n"
                      << outcome.result.output;
            return false;
        }
    }
    return true;
}

bool runCompletionChecks(Fixture& fixture)
{
    tryrun::CompletionProvider provider(fixture.toolchain, fixture.clock);
    auto                       result = provider.complete(scriptRequest("Console.", 8), fixture.budget.infrastructure);
    if (!result)
    {
        std::cerr << "completion failed: " << llvm::toString(result.takeError()) << "\n";
        return false;
    }
    for (const auto& item : result->items)
    {
        if (item.displayText == "WriteLine")
        {
            return true;
        }
    }
    std::cerr << "completion after 'Console.' should offer WriteLine (" << result->items.size() << " items)\n";
    return false;
}

}  // namespace

int main()
{
    const std::string compiler = TRYRUN_TEST_COMPILER;
    if (compiler.empty() || !llvm::sys::fs::can_execute(compiler))
    {
        std::cout << "no clang++ driver available; skipping\n";
        return SkipExitCode;
    }

    tryrun::ToolchainOptions options;
    options.compilerPath = compiler;
    options.preludePath  = TRYRUN_TEST_PRELUDE;
    Fixture fixture(std::move(options));

    bool ok = true;
    ok      = runScriptExecutionChecks(fixture) && ok;
    ok      = runCompileErrorChecks(fixture) && ok;
    ok      = runCompletionChecks(fixture) && ok;
    if (!ok)
    {
        std::cerr << "clang toolchain integration tests failed\n";
        return 1;
    }
    std::cout << "clang toolchain integration tests passed\n";
    return 0;
}
