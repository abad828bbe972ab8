//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `tryrund` execution daemon.
///
/// The process runs a framed stdio loop and dispatches request envelopes to
/// the service worker pool.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Compile/ClangToolchain.h"
#include "tryrun/Service/Service.h"
#include "tryrun/Service/ServiceConfig.h"
#include "tryrun/Service/Transport.h"
#include "tryrun/Support/Clock.h"
#include "tryrun/Version.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace
{

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: tryrund [--config <file>] [--compiler <path>] [--workers <n>] "
                    "[--trace <off|basic|verbose>]\n"
                 << "Try: tryrund --help\n";
}

void printHelp()
{
    llvm::errs()
        << "tryrund " << tryrun::kVersionString << "\n\n"
        << "Compiles and runs C++ workspaces for an editor host. Requests arrive on stdin as\n"
        << "Content-Length framed JSON envelopes and responses are written to stdout.\n\n"
        << "OPTIONS\n"
        << "  --config <file>\n"
        << "      JSON configuration file. Command-line options override its values.\n"
        << "  --compiler <path>\n"
        << "      Compiler driver (default: clang++).\n"
        << "  --prelude <path>\n"
        << "      Header force-included into every unit (default: bundled prelude).\n"
        << "  --workers <n>\n"
        << "      Number of concurrent requests (default: 2).\n"
        << "  --trace <off|basic|verbose>\n"
        << "      Diagnostic logging on stderr (default: basic).\n"
        << "  --version, -V\n"
        << "  --help, -h\n\n"
        << "ROUTES\n"
        << "  POST /workspace/run          compile and run; headers Timeout, User-Code-Timeout (ms)\n"
        << "  POST /workspace/completion   completion candidates at the active buffer position\n"
        << "  GET  /health                 liveness and version\n";
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    std::string                                 configPath;
    std::optional<std::string>                  compilerPath;
    std::optional<std::string>                  preludePath;
    std::optional<unsigned>                     workers;
    std::optional<tryrun::service::TraceLevel> traceLevel;

    for (int i = 1; i < argc; ++i)
    {
        const llvm::StringRef arg(argv[i]);
        auto                  requireValue = [&](const llvm::StringRef name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--version" || arg == "-V")
        {
            llvm::outs() << "tryrund " << tryrun::kVersionString << "\n";
            return 0;
        }
        if (arg == "--help" || arg == "-h")
        {
            printHelp();
            return 0;
        }
        if (arg == "--config")
        {
            configPath = requireValue(arg);
        }
        else if (arg == "--compiler")
        {
            compilerPath = requireValue(arg);
        }
        else if (arg == "--prelude")
        {
            preludePath = requireValue(arg);
        }
        else if (arg == "--workers")
        {
            const std::string value = requireValue(arg);
            unsigned          count = 0;
            if (llvm::StringRef(value).getAsInteger(10, count) || count == 0)
            {
                llvm::errs() << "Invalid --workers value: " << value << "\n";
                printUsage();
                return 1;
            }
            workers = count;
        }
        else if (arg == "--trace")
        {
            const std::string value = requireValue(arg);
            traceLevel              = tryrun::service::parseTraceLevel(value);
            if (!traceLevel)
            {
                llvm::errs() << "Invalid --trace value: " << value << "\n";
                printUsage();
                return 1;
            }
        }
        else
        {
            llvm::errs() << "Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    tryrun::service::ServiceConfig config;
    if (!configPath.empty())
    {
        if (llvm::Error error = tryrun::service::loadConfigurationFile(configPath, config))
        {
            llvm::errs() << "[tryrund] " << llvm::toString(std::move(error)) << "\n";
            return 1;
        }
    }
    if (compilerPath)
    {
        config.compilerPath = *compilerPath;
    }
    if (preludePath)
    {
        config.preludePath = *preludePath;
    }
    if (workers)
    {
        config.workerCount = *workers;
    }
    if (traceLevel)
    {
        config.traceLevel = *traceLevel;
    }
    if (config.preludePath.empty())
    {
        config.preludePath = tryrun::service::defaultPreludePath();
    }

    const bool                       telemetryEnabled = config.traceLevel != tryrun::service::TraceLevel::Off;
    tryrun::service::StdioTransport transport(std::cin, std::cout);
    auto toolchain = std::make_shared<tryrun::ClangToolchain>(config.toolchainOptions());
    tryrun::service::Service service(
        config,
        toolchain,
        std::make_shared<tryrun::SteadyClock>(),
        [&transport](llvm::json::Value message) {
            if (!transport.writeMessage(message))
            {
                llvm::errs() << "[tryrund] failed to write response envelope\n";
            }
        },
        [telemetryEnabled](const tryrun::service::RequestMetric& metric) {
            if (!telemetryEnabled)
            {
                return;
            }
            llvm::errs() << "[tryrund][telemetry] route=" << metric.route << " status=" << metric.status
                         << " latency_us=" << metric.latencyMicros << " outcome=" << metric.outcome << "\n";
        });

    while (true)
    {
        llvm::json::Value message(llvm::json::Object{});
        std::string       error;
        const auto        status = transport.readMessage(message, error);
        if (status == tryrun::service::ReadStatus::EndOfStream)
        {
            if (!error.empty())
            {
                llvm::errs() << "[tryrund] " << error << "\n";
            }
            break;
        }
        if (status == tryrun::service::ReadStatus::Malformed)
        {
            llvm::errs() << "[tryrund] " << error << "\n";
            tryrun::service::HttpResponse response;
            response.status = tryrun::service::HttpStatus::BadRequest;
            response.body   = tryrun::service::errorBody("malformed_request", error);
            if (!transport.writeMessage(tryrun::service::makeEnvelope(nullptr, response)))
            {
                llvm::errs() << "[tryrund] failed to write response envelope\n";
            }
            continue;
        }
        service.submit(message);
    }

    service.waitIdle();
    service.shutdown();
    return 0;
}
