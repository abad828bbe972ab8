//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Wire encodings for daemon envelopes and response bodies.
///
/// Request envelopes carry an HTTP-shaped request with a raw text body.
/// Response bodies use PascalCase field names.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SERVICE_PROTOCOL_H
#define TRYRUN_SERVICE_PROTOCOL_H

#include "tryrun/Completion/CompletionProvider.h"
#include "tryrun/Exec/Sandbox.h"
#include "tryrun/Support/Diagnostics.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tryrun::service
{

/// @brief HTTP-shaped request handed to the service.
struct HttpRequest
{
    std::string                                      method;
    std::string                                      path;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string                                      body;

    /// @brief Case-insensitive header lookup.
    [[nodiscard]] std::optional<llvm::StringRef> header(llvm::StringRef name) const;
};

/// @brief HTTP-shaped response produced by the service.
struct HttpResponse
{
    int               status{200};
    llvm::json::Value body{llvm::json::Object{}};
};

/// @brief Decoded request envelope.
struct RequestEnvelope
{
    /// @brief Correlation id echoed in the response envelope.
    llvm::json::Value id{nullptr};

    HttpRequest request;
};

/// @brief Decodes `{"id", "method", "path", "headers", "body"}`.
///
/// Header values may be strings or numbers. A missing method defaults to
/// `POST`; a missing body is empty.
[[nodiscard]] llvm::Expected<RequestEnvelope> parseEnvelope(const llvm::json::Value& message);

/// @brief Encodes `{"id", "status", "body"}`.
[[nodiscard]] llvm::json::Value makeEnvelope(const llvm::json::Value& id, const HttpResponse& response);

/// @brief Encodes one diagnostic as `{Start, End, Message, Id, Severity, Location}`.
[[nodiscard]] llvm::json::Value toJson(const Diagnostic& diagnostic);

/// @brief Encodes a run result.
[[nodiscard]] llvm::json::Value toJson(const RunResult& result);

/// @brief Encodes a completion result as `{Items: [...]}`.
[[nodiscard]] llvm::json::Value toJson(const CompletionResult& result);

/// @brief Encodes an error body as `{Error, Message}`.
[[nodiscard]] llvm::json::Value errorBody(llvm::StringRef kind, llvm::StringRef message);

}  // namespace tryrun::service

#endif  // TRYRUN_SERVICE_PROTOCOL_H
