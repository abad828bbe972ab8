//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements daemon envelope decoding and response body encoding.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Service/Protocol.h"

#include "tryrun/Support/Error.h"

#include "llvm/Support/FormatVariadic.h"

#include <cstdint>

namespace tryrun::service
{
namespace
{

llvm::json::Value optionalString(const std::optional<std::string>& text)
{
    if (!text)
    {
        return nullptr;
    }
    return *text;
}

}  // namespace

std::optional<llvm::StringRef> HttpRequest::header(const llvm::StringRef name) const
{
    for (const auto& [key, value] : headers)
    {
        if (llvm::StringRef(key).trim().equals_insensitive(name))
        {
            return llvm::StringRef(value);
        }
    }
    return std::nullopt;
}

llvm::Expected<RequestEnvelope> parseEnvelope(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return makePipelineError(ErrorKind::MalformedRequest, "envelope must be a JSON object");
    }

    RequestEnvelope envelope;
    if (const auto* id = object->get("id"))
    {
        envelope.id = *id;
    }

    envelope.request.method = "POST";
    if (const auto method = object->getString("method"))
    {
        envelope.request.method = method->upper();
    }

    const auto path = object->getString("path");
    if (!path)
    {
        return makePipelineError(ErrorKind::MalformedRequest, "envelope has no path");
    }
    envelope.request.path = path->str();

    if (const auto* headers = object->getObject("headers"))
    {
        for (const auto& entry : *headers)
        {
            std::string value;
            if (const auto text = entry.second.getAsString())
            {
                value = text->str();
            }
            else if (const auto number = entry.second.getAsInteger())
            {
                value = std::to_string(*number);
            }
            else
            {
                return makePipelineError(ErrorKind::MalformedRequest,
                                         "header '" + llvm::StringRef(entry.first) + "' must be a string or number");
            }
            envelope.request.headers.emplace_back(llvm::StringRef(entry.first).str(), std::move(value));
        }
    }

    if (const auto* body = object->get("body"))
    {
        if (const auto text = body->getAsString())
        {
            envelope.request.body = text->str();
        }
        else if (body->kind() != llvm::json::Value::Null)
        {
            // Structured bodies are accepted and re-serialized for the normalizer.
            envelope.request.body = llvm::formatv("{0}", *body).str();
        }
    }
    return envelope;
}

llvm::json::Value makeEnvelope(const llvm::json::Value& id, const HttpResponse& response)
{
    return llvm::json::Object{
        {"id", id},
        {"status", response.status},
        {"body", response.body},
    };
}

llvm::json::Value toJson(const Diagnostic& diagnostic)
{
    const SourceSpan span = diagnostic.span.value_or(SourceSpan{});
    return llvm::json::Object{
        {"Start", static_cast<std::int64_t>(span.start)},
        {"End", static_cast<std::int64_t>(span.end)},
        {"Message", diagnostic.message},
        {"Id", diagnostic.id},
        {"Severity", severityName(diagnostic.severity)},
        {"Location", diagnostic.location},
        {"Attributable", diagnostic.attributable},
    };
}

llvm::json::Value toJson(const RunResult& result)
{
    llvm::json::Array diagnostics;
    for (const Diagnostic& diagnostic : result.diagnostics)
    {
        diagnostics.push_back(toJson(diagnostic));
    }

    llvm::json::Object body{
        {"Succeeded", result.succeeded},
        {"Output", result.output},
        {"Exception", optionalString(result.exception)},
        {"Diagnostics", std::move(diagnostics)},
    };
    if (result.requestId)
    {
        body["RequestId"] = *result.requestId;
    }
    return body;
}

llvm::json::Value toJson(const CompletionResult& result)
{
    llvm::json::Array items;
    for (const CompletionItem& item : result.items)
    {
        items.push_back(llvm::json::Object{
            {"DisplayText", item.displayText},
            {"Kind", item.kind},
            {"FilterText", item.filterText},
            {"SortText", item.sortText},
            {"InsertText", item.insertText},
            {"Documentation", item.documentation},
        });
    }

    llvm::json::Object body{{"Items", std::move(items)}};
    if (result.requestId)
    {
        body["RequestId"] = *result.requestId;
    }
    return body;
}

llvm::json::Value errorBody(const llvm::StringRef kind, const llvm::StringRef message)
{
    return llvm::json::Object{
        {"Error", kind},
        {"Message", message},
    };
}

}  // namespace tryrun::service
