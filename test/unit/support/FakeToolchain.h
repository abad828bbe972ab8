//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Deterministic toolchain double driven by a manual clock.
///
/// Compilation checks parenthesis balance and `#warning` lines. The produced
/// artifact interprets a tiny statement language found in the merged text:
/// `Console.WriteLine("..")`, `Console.Write("..")`, `Sleep(N)` (advances the
/// clock by N ms), `throw "..."` and `std::exit(N)`. Every simulated cost is
/// charged to the clock before the operation reports its result.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_TEST_FAKE_TOOLCHAIN_H
#define TRYRUN_TEST_FAKE_TOOLCHAIN_H

#include "tryrun/Compile/Toolchain.h"
#include "tryrun/Support/Clock.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace tryrun::test
{

class FakeToolchain final : public Toolchain
{
public:
    explicit FakeToolchain(std::shared_ptr<ManualClock> clock);

    [[nodiscard]] llvm::Expected<CompileOutcome> compile(const CompileRequest&     request,
                                                         const CancellationToken& token) override;

    [[nodiscard]] llvm::Expected<std::vector<CompletionItem>> complete(const CompilationUnit&    unit,
                                                                       std::size_t               mergedOffset,
                                                                       const CancellationToken& token) override;

    void setCompileCost(std::chrono::milliseconds cost)
    {
        compileCost_ = cost;
    }

    void setPrepareCost(std::chrono::milliseconds cost)
    {
        prepareCost_ = cost;
    }

    void setCompletionCost(std::chrono::milliseconds cost)
    {
        completionCost_ = cost;
    }

    /// @brief Makes `compile` fail as if the driver could not be started.
    void setLaunchFailure(bool enabled)
    {
        launchFailure_ = enabled;
    }

    /// @brief Makes `compile` block until its token is cancelled.
    void setBlockUntilCancelled(bool enabled)
    {
        blockUntilCancelled_ = enabled;
    }

    [[nodiscard]] unsigned compileCount() const
    {
        return compileCount_.load();
    }

    [[nodiscard]] std::string lastUnitText() const;

    [[nodiscard]] CompileAction lastAction() const;

private:
    std::shared_ptr<ManualClock> clock_;
    std::chrono::milliseconds    compileCost_{0};
    std::chrono::milliseconds    prepareCost_{0};
    std::chrono::milliseconds    completionCost_{0};
    std::atomic_bool             launchFailure_{false};
    std::atomic_bool             blockUntilCancelled_{false};
    std::atomic<unsigned>        compileCount_{0};
    mutable std::mutex           mutex_;
    std::string                  lastUnitText_;
    CompileAction                lastAction_{CompileAction::Build};
};

}  // namespace tryrun::test

#endif  // TRYRUN_TEST_FAKE_TOOLCHAIN_H
