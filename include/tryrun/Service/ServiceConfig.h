//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime configuration model for the execution daemon.
///
/// Values come from defaults, then an optional JSON configuration file, then
/// command-line flags. Request headers override the time budgets per request.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SERVICE_SERVICE_CONFIG_H
#define TRYRUN_SERVICE_SERVICE_CONFIG_H

#include "tryrun/Compile/ClangToolchain.h"
#include "tryrun/Exec/Sandbox.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tryrun::service
{

/// @brief Trace verbosity level for daemon logs and telemetry.
enum class TraceLevel
{
    /// @brief Disable trace output.
    Off,

    /// @brief Emit concise request-level traces.
    Basic,

    /// @brief Emit verbose traces for debugging.
    Verbose,
};

/// @brief Parses `off`, `basic` or `verbose`, case-insensitively.
[[nodiscard]] std::optional<TraceLevel> parseTraceLevel(llvm::StringRef text);

/// @brief Mutable runtime configuration for `tryrund`.
struct ServiceConfig final
{
    /// @brief Compiler driver executable.
    std::string compilerPath{"clang++"};

    /// @brief Language standard passed to the driver.
    std::string languageStandard{"c++20"};

    /// @brief Extra driver flags.
    std::vector<std::string> compilerFlags;

    /// @brief Header force-included into every unit.
    std::string preludePath;

    /// @brief Parent directory for per-request scratch directories.
    std::string scratchDirectory;

    /// @brief Default infrastructure budget.
    std::chrono::milliseconds infrastructureTimeout{DefaultInfrastructureTimeout};

    /// @brief Default user-code budget.
    std::chrono::milliseconds userCodeTimeout{DefaultUserCodeTimeout};

    /// @brief Output capture limit per run.
    std::size_t maxOutputBytes{1024 * 1024};

    /// @brief Number of concurrent request workers.
    unsigned workerCount{2};

    /// @brief Configured trace verbosity.
    TraceLevel traceLevel{TraceLevel::Basic};

    /// @brief Toolchain settings derived from this configuration.
    [[nodiscard]] ToolchainOptions toolchainOptions() const;

    /// @brief Budgets used when a request carries no overrides.
    [[nodiscard]] RunBudget defaultBudget() const;
};

/// @brief Returns the bundled prelude header path.
[[nodiscard]] std::string defaultPreludePath();

/// @brief Applies settings from a configuration object.
///
/// Unknown keys are ignored and invalid values leave the field untouched.
///
/// @param[in] settings Configuration object.
/// @param[in,out] config Configuration instance to update.
/// @return `true` when `settings` was an object.
[[nodiscard]] bool applyConfiguration(const llvm::json::Value& settings, ServiceConfig& config);

/// @brief Reads a JSON configuration file and applies it.
[[nodiscard]] llvm::Error loadConfigurationFile(llvm::StringRef path, ServiceConfig& config);

}  // namespace tryrun::service

#endif  // TRYRUN_SERVICE_SERVICE_CONFIG_H
