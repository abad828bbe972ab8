//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request routing, budget headers, and status mapping.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Service/Service.h"

#include "tryrun/Version.h"
#include "tryrun/Workspace/Normalizer.h"

#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <optional>
#include <utility>

namespace tryrun::service
{
namespace
{

std::optional<std::chrono::milliseconds> parseMilliseconds(const llvm::StringRef text)
{
    unsigned long long value = 0;
    if (text.trim().getAsInteger(10, value) || value == 0)
    {
        return std::nullopt;
    }
    return std::chrono::milliseconds(value);
}

llvm::Expected<RunBudget> budgetFor(const HttpRequest& request, RunBudget budget)
{
    if (const auto raw = request.header(TimeoutHeader))
    {
        const auto value = parseMilliseconds(*raw);
        if (!value)
        {
            return makePipelineError(ErrorKind::MalformedRequest,
                                     "header '" + TimeoutHeader + "' must be a positive number of milliseconds");
        }
        budget.infrastructure = *value;
    }
    if (const auto raw = request.header(UserCodeTimeoutHeader))
    {
        const auto value = parseMilliseconds(*raw);
        if (!value)
        {
            return makePipelineError(ErrorKind::MalformedRequest,
                                     "header '" + UserCodeTimeoutHeader +
                                         "' must be a positive number of milliseconds");
        }
        budget.userCode = *value;
    }
    return budget;
}

HttpResponse plainError(const int status, const llvm::StringRef kind, const llvm::StringRef message)
{
    HttpResponse response;
    response.status = status;
    response.body   = errorBody(kind, message);
    return response;
}

}  // namespace

int statusForPhase(const RunPhase phase)
{
    switch (phase)
    {
    case RunPhase::InfrastructureTimedOut:
        return HttpStatus::GatewayTimeout;
    case RunPhase::UserCodeTimedOut:
        return HttpStatus::ExpectationFailed;
    case RunPhase::Cancelled:
        return HttpStatus::ServiceUnavailable;
    case RunPhase::Pending:
    case RunPhase::Compiling:
    case RunPhase::Running:
    case RunPhase::Succeeded:
    case RunPhase::Failed:
        break;
    }
    return HttpStatus::Ok;
}

int statusForError(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::MalformedRequest:
    case ErrorKind::InvalidPosition:
        return HttpStatus::BadRequest;
    case ErrorKind::InfrastructureTimeout:
        return HttpStatus::GatewayTimeout;
    case ErrorKind::UserCodeTimeout:
        return HttpStatus::ExpectationFailed;
    case ErrorKind::ToolchainFailure:
        return HttpStatus::InternalServerError;
    case ErrorKind::Cancelled:
        return HttpStatus::ServiceUnavailable;
    }
    return HttpStatus::InternalServerError;
}

Service::Service(ServiceConfig              config,
                 std::shared_ptr<Toolchain> toolchain,
                 std::shared_ptr<Clock>     clock,
                 SendMessageFn              sendMessage,
                 RequestMetricSink          metricSink)
    : config_(std::move(config))
    , sandbox_(std::make_unique<Sandbox>(toolchain, clock, config_.maxOutputBytes))
    , completion_(std::make_unique<CompletionProvider>(toolchain, clock))
    , sendMessage_(std::move(sendMessage))
    , scheduler_(config_.workerCount)
{
    telemetry_.setSink(std::move(metricSink));
    if (config_.traceLevel == TraceLevel::Verbose)
    {
        sandbox_->setPhaseObserver([this](const RunPhase phase) {
            trace(TraceLevel::Verbose, "run phase " + phaseName(phase));
        });
    }
}

Service::~Service()
{
    shutdown();
}

HttpResponse Service::handle(const HttpRequest& request, const CancellationToken& token)
{
    const auto        start = std::chrono::steady_clock::now();
    const std::string route = request.method + " " + request.path;
    std::string       outcome;
    HttpResponse      response;

    if (request.path == RunPath || request.path == CompletionPath)
    {
        if (request.method != "POST")
        {
            outcome  = "method_not_allowed";
            response = plainError(HttpStatus::MethodNotAllowed, outcome, "use POST for " + request.path);
        }
        else if (request.path == RunPath)
        {
            response = handleRun(request, token, outcome);
        }
        else
        {
            response = handleCompletion(request, token, outcome);
        }
    }
    else if (request.path == HealthPath)
    {
        if (request.method != "GET")
        {
            outcome  = "method_not_allowed";
            response = plainError(HttpStatus::MethodNotAllowed, outcome, "use GET for " + request.path);
        }
        else
        {
            response = handleHealth(outcome);
        }
    }
    else
    {
        outcome  = "not_found";
        response = plainError(HttpStatus::NotFound, outcome, "no route for " + request.path);
    }

    const auto latencyMicros =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count();
    trace(TraceLevel::Basic, route + " -> " + llvm::Twine(response.status) + " (" + outcome + ")");
    telemetry_.record(RequestMetric{route, response.status, static_cast<std::uint64_t>(latencyMicros), outcome});
    return response;
}

HttpResponse Service::handleRun(const HttpRequest& request, const CancellationToken& token, std::string& outcome)
{
    auto budget = budgetFor(request, config_.defaultBudget());
    if (!budget)
    {
        return errorResponse(budget.takeError(), outcome);
    }

    auto normalized = normalizeRequest(request.body);
    if (!normalized)
    {
        return errorResponse(normalized.takeError(), outcome);
    }
    trace(TraceLevel::Verbose,
          "run mode=" + modeName(normalized->workspace.mode) +
              " buffers=" + llvm::Twine(normalized->workspace.buffers.size()) +
              " files=" + llvm::Twine(normalized->workspace.files.size()));

    auto ran = sandbox_->run(*normalized, *budget, token);
    if (!ran)
    {
        return errorResponse(ran.takeError(), outcome);
    }

    outcome = phaseName(ran->phase).str();
    HttpResponse response;
    response.status = statusForPhase(ran->phase);
    response.body   = toJson(ran->result);
    return response;
}

HttpResponse Service::handleCompletion(const HttpRequest& request, const CancellationToken& token, std::string& outcome)
{
    auto budget = budgetFor(request, config_.defaultBudget());
    if (!budget)
    {
        return errorResponse(budget.takeError(), outcome);
    }

    auto normalized = normalizeRequest(request.body);
    if (!normalized)
    {
        return errorResponse(normalized.takeError(), outcome);
    }

    auto completed = completion_->complete(*normalized, budget->infrastructure, token);
    if (!completed)
    {
        return errorResponse(completed.takeError(), outcome);
    }

    outcome = "completed";
    HttpResponse response;
    response.status = HttpStatus::Ok;
    response.body   = toJson(*completed);
    return response;
}

HttpResponse Service::handleHealth(std::string& outcome) const
{
    outcome = "ok";
    HttpResponse response;
    response.body = llvm::json::Object{
        {"status", "ok"},
        {"version", kVersionString},
        {"workers", static_cast<std::int64_t>(config_.workerCount)},
        {"pending", static_cast<std::int64_t>(scheduler_.pendingCount())},
    };
    return response;
}

HttpResponse Service::errorResponse(llvm::Error error, std::string& outcome) const
{
    std::string     message;
    const ErrorKind kind = classifyError(std::move(error), message);
    outcome              = errorKindName(kind).str();
    return plainError(statusForError(kind), errorKindName(kind), message);
}

void Service::submit(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (object)
    {
        if (const auto* cancelId = object->get("cancel"))
        {
            if (!scheduler_.cancel(requestKeyFromId(*cancelId)))
            {
                trace(TraceLevel::Verbose, "cancel for unknown request " + requestKeyFromId(*cancelId));
            }
            return;
        }
    }

    auto envelope = parseEnvelope(message);
    if (!envelope)
    {
        llvm::json::Value id(nullptr);
        if (object)
        {
            if (const auto* rawId = object->get("id"))
            {
                id = *rawId;
            }
        }
        std::string outcome;
        send(id, errorResponse(envelope.takeError(), outcome));
        return;
    }

    auto              shared = std::make_shared<RequestEnvelope>(std::move(*envelope));
    const std::string route  = shared->request.method + " " + shared->request.path;
    const bool        queued = scheduler_.enqueue(
        requestKeyFromId(shared->id),
        route,
        [this, shared](const CancellationToken& token) {
            RequestTaskResult result;
            result.status = RequestTaskStatus::Completed;
            result.value  = makeEnvelope(shared->id, handle(shared->request, token));
            return result;
        },
        [this, shared](RequestTaskResult result, std::uint64_t) {
            switch (result.status)
            {
            case RequestTaskStatus::Completed:
                if (sendMessage_)
                {
                    sendMessage_(std::move(result.value));
                }
                return;
            case RequestTaskStatus::Cancelled:
                send(shared->id,
                     plainError(HttpStatus::ServiceUnavailable,
                                errorKindName(ErrorKind::Cancelled),
                                "request cancelled before it started"));
                return;
            case RequestTaskStatus::Failed:
                send(shared->id,
                     plainError(HttpStatus::InternalServerError,
                                errorKindName(ErrorKind::ToolchainFailure),
                                result.errorMessage));
                return;
            }
        });
    if (!queued)
    {
        send(shared->id,
             plainError(HttpStatus::ServiceUnavailable,
                        errorKindName(ErrorKind::Cancelled),
                        "request could not be scheduled (shutting down or duplicate id)"));
    }
}

void Service::waitIdle()
{
    scheduler_.waitIdle();
}

void Service::shutdown()
{
    scheduler_.shutdown();
}

void Service::send(const llvm::json::Value& id, const HttpResponse& response)
{
    if (sendMessage_)
    {
        sendMessage_(makeEnvelope(id, response));
    }
}

void Service::trace(const TraceLevel level, const llvm::Twine& message) const
{
    if (config_.traceLevel == TraceLevel::Off || config_.traceLevel < level)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(logMutex_);
    llvm::errs() << "[tryrund] " << message << "\n";
}

std::string Service::requestKeyFromId(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return ("s:" + text->str());
    }
    if (const auto integer = id.getAsInteger())
    {
        return ("i:" + std::to_string(*integer));
    }

    std::string              serialized;
    llvm::raw_string_ostream stream(serialized);
    stream << id;
    stream.flush();
    return ("j:" + serialized);
}

}  // namespace tryrun::service
