//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements configuration loading for the execution daemon.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Service/ServiceConfig.h"

#include "llvm/Support/MemoryBuffer.h"

#include <filesystem>
#include <system_error>
#include <utility>

namespace tryrun::service
{
namespace
{

std::optional<std::vector<std::string>> parseStringArrayValue(const llvm::json::Value& value)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        return std::nullopt;
    }

    std::vector<std::string> out;
    out.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return std::nullopt;
        }
        out.emplace_back(text->str());
    }
    return out;
}

void applyMilliseconds(const llvm::json::Object& object, llvm::StringRef key, std::chrono::milliseconds& out)
{
    if (const auto value = object.getInteger(key))
    {
        if (*value > 0)
        {
            out = std::chrono::milliseconds(*value);
        }
    }
}

void applyCompilerConfig(const llvm::json::Object& settings, ServiceConfig& config)
{
    const auto* compiler = settings.getObject("compiler");
    if (!compiler)
    {
        return;
    }

    if (const auto path = compiler->getString("path"))
    {
        config.compilerPath = path->str();
    }
    if (const auto standard = compiler->getString("standard"))
    {
        config.languageStandard = standard->str();
    }
    if (const auto prelude = compiler->getString("prelude"))
    {
        config.preludePath = prelude->str();
    }
    if (const auto* flagsValue = compiler->get("flags"))
    {
        if (const auto flags = parseStringArrayValue(*flagsValue))
        {
            config.compilerFlags = *flags;
        }
    }
}

void applyTimeoutConfig(const llvm::json::Object& settings, ServiceConfig& config)
{
    const auto* timeouts = settings.getObject("timeouts");
    if (!timeouts)
    {
        return;
    }
    applyMilliseconds(*timeouts, "infrastructureMs", config.infrastructureTimeout);
    applyMilliseconds(*timeouts, "userCodeMs", config.userCodeTimeout);
}

}  // namespace

std::optional<TraceLevel> parseTraceLevel(const llvm::StringRef text)
{
    if (text.equals_insensitive("off"))
    {
        return TraceLevel::Off;
    }
    if (text.equals_insensitive("basic"))
    {
        return TraceLevel::Basic;
    }
    if (text.equals_insensitive("verbose"))
    {
        return TraceLevel::Verbose;
    }
    return std::nullopt;
}

ToolchainOptions ServiceConfig::toolchainOptions() const
{
    ToolchainOptions options;
    options.compilerPath     = compilerPath;
    options.languageStandard = languageStandard;
    options.extraFlags       = compilerFlags;
    options.preludePath      = preludePath;
    options.scratchRoot      = scratchDirectory;
    return options;
}

RunBudget ServiceConfig::defaultBudget() const
{
    RunBudget budget;
    budget.infrastructure = infrastructureTimeout;
    budget.userCode       = userCodeTimeout;
    return budget;
}

std::string defaultPreludePath()
{
    const std::filesystem::path bundled =
        std::filesystem::path(TRYRUN_SOURCE_DIR) / "runtime" / "cpp" / "tryrun_prelude.hpp";
    std::error_code ec;
    if (std::filesystem::exists(bundled, ec))
    {
        return bundled.string();
    }
    return std::filesystem::absolute("runtime/cpp/tryrun_prelude.hpp", ec).string();
}

bool applyConfiguration(const llvm::json::Value& settings, ServiceConfig& config)
{
    const auto* object = settings.getAsObject();
    if (!object)
    {
        return false;
    }

    applyCompilerConfig(*object, config);
    applyTimeoutConfig(*object, config);

    if (const auto scratch = object->getString("scratchDirectory"))
    {
        config.scratchDirectory = scratch->str();
    }
    if (const auto maxOutput = object->getInteger("maxOutputBytes"))
    {
        if (*maxOutput > 0)
        {
            config.maxOutputBytes = static_cast<std::size_t>(*maxOutput);
        }
    }
    if (const auto workers = object->getInteger("workers"))
    {
        if (*workers > 0)
        {
            config.workerCount = static_cast<unsigned>(*workers);
        }
    }
    if (const auto rawTrace = object->getString("trace"))
    {
        if (const auto level = parseTraceLevel(*rawTrace))
        {
            config.traceLevel = *level;
        }
    }
    return true;
}

llvm::Error loadConfigurationFile(const llvm::StringRef path, ServiceConfig& config)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(),
                                       "failed to read configuration file %s",
                                       path.str().c_str());
    }

    auto parsed = llvm::json::parse((*buffer)->getBuffer());
    if (!parsed)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "configuration file %s is not valid JSON: %s",
                                       path.str().c_str(),
                                       llvm::toString(parsed.takeError()).c_str());
    }
    if (!applyConfiguration(*parsed, config))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "configuration file %s must contain a JSON object",
                                       path.str().c_str());
    }
    return llvm::Error::success();
}

}  // namespace tryrun::service
