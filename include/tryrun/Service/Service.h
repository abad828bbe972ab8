//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request routing and status mapping for the execution daemon.
///
/// The service decodes request bodies, drives the sandbox or the completion
/// provider, and converts outcomes and errors into status codes. Envelopes
/// submitted through `submit` run on the service's worker pool.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SERVICE_SERVICE_H
#define TRYRUN_SERVICE_SERVICE_H

#include "tryrun/Completion/CompletionProvider.h"
#include "tryrun/Exec/Sandbox.h"
#include "tryrun/Service/Protocol.h"
#include "tryrun/Service/RequestScheduler.h"
#include "tryrun/Service/ServiceConfig.h"
#include "tryrun/Service/Telemetry.h"
#include "tryrun/Support/Cancellation.h"
#include "tryrun/Support/Clock.h"
#include "tryrun/Support/Error.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace tryrun::service
{

/// @brief Status codes produced by the service.
namespace HttpStatus
{
inline constexpr int Ok                  = 200;
inline constexpr int BadRequest          = 400;
inline constexpr int NotFound            = 404;
inline constexpr int MethodNotAllowed    = 405;
inline constexpr int ExpectationFailed   = 417;
inline constexpr int InternalServerError = 500;
inline constexpr int ServiceUnavailable  = 503;
inline constexpr int GatewayTimeout      = 504;
}  // namespace HttpStatus

/// @brief Route paths.
inline constexpr llvm::StringRef RunPath        = "/workspace/run";
inline constexpr llvm::StringRef CompletionPath = "/workspace/completion";
inline constexpr llvm::StringRef HealthPath     = "/health";

/// @brief Header overriding the infrastructure budget, in milliseconds.
inline constexpr llvm::StringRef TimeoutHeader = "Timeout";

/// @brief Header overriding the user-code budget, in milliseconds.
inline constexpr llvm::StringRef UserCodeTimeoutHeader = "User-Code-Timeout";

/// @brief Maps a terminal run phase to a status code.
[[nodiscard]] int statusForPhase(RunPhase phase);

/// @brief Maps an error kind to a status code.
[[nodiscard]] int statusForError(ErrorKind kind);

/// @brief Callback used to emit encoded response envelopes.
using SendMessageFn = std::function<void(llvm::json::Value message)>;

/// @brief Execution service facade.
class Service final
{
public:
    /// @brief Creates a service.
    /// @param[in] config Runtime configuration.
    /// @param[in] toolchain Compiler capability shared by every request.
    /// @param[in] clock Clock every deadline is measured on.
    /// @param[in] sendMessage Envelope sink used by `submit`.
    /// @param[in] metricSink Optional telemetry sink.
    Service(ServiceConfig              config,
            std::shared_ptr<Toolchain> toolchain,
            std::shared_ptr<Clock>     clock,
            SendMessageFn              sendMessage = {},
            RequestMetricSink          metricSink  = {});
    ~Service();

    Service(const Service&)            = delete;
    Service& operator=(const Service&) = delete;

    /// @brief Handles one request synchronously on the calling thread.
    /// @param[in] request Decoded request.
    /// @param[in] token Cancellation token of the caller.
    /// @return Response with status and JSON body.
    [[nodiscard]] HttpResponse handle(const HttpRequest& request, const CancellationToken& token = {});

    /// @brief Decodes an envelope and schedules it on the worker pool.
    ///
    /// The response envelope is emitted through the send callback once the
    /// request finishes. An envelope of the form `{"cancel": id}` cancels the
    /// in-flight request with that id instead.
    void submit(const llvm::json::Value& message);

    /// @brief Blocks until every submitted request has responded.
    void waitIdle();

    /// @brief Stops the worker pool; outstanding requests respond with 503.
    void shutdown();

    [[nodiscard]] const ServiceConfig& config() const
    {
        return config_;
    }

    [[nodiscard]] const Telemetry& telemetry() const
    {
        return telemetry_;
    }

private:
    HttpResponse handleRun(const HttpRequest& request, const CancellationToken& token, std::string& outcome);
    HttpResponse handleCompletion(const HttpRequest& request, const CancellationToken& token, std::string& outcome);
    HttpResponse handleHealth(std::string& outcome) const;
    HttpResponse errorResponse(llvm::Error error, std::string& outcome) const;
    void         send(const llvm::json::Value& id, const HttpResponse& response);
    void         trace(TraceLevel level, const llvm::Twine& message) const;

    static std::string requestKeyFromId(const llvm::json::Value& id);

    ServiceConfig                       config_;
    std::unique_ptr<Sandbox>            sandbox_;
    std::unique_ptr<CompletionProvider> completion_;
    SendMessageFn                       sendMessage_;
    Telemetry                           telemetry_;
    mutable std::mutex                  logMutex_;
    RequestScheduler                    scheduler_;
};

}  // namespace tryrun::service

#endif  // TRYRUN_SERVICE_SERVICE_H
