//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Conversion of inbound request payloads into canonical workspaces.
///
/// Accepted shapes:
///  - `{"Buffer": "..."}`
///  - `{"Source": "...", "Position": n}`
///  - `{"Buffers": [...], "Usings": [...], "WorkspaceType": "...", "Files": [...]}`
///  - `{"Workspace": {...}, "ActiveBufferId": "...", "RequestId": "..."}`
///
/// Field names match case-insensitively and `null` counts as absent.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_WORKSPACE_NORMALIZER_H
#define TRYRUN_WORKSPACE_NORMALIZER_H

#include "tryrun/Workspace/Workspace.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace tryrun
{

/// @brief Parses and normalizes a raw request body.
/// @param[in] body Raw JSON text.
/// @return Canonical request, or a `MalformedRequest` error.
[[nodiscard]] llvm::Expected<WorkspaceRequest> normalizeRequest(llvm::StringRef body);

/// @brief Normalizes an already-parsed request payload.
/// @param[in] payload Parsed JSON payload.
/// @return Canonical request, or a `MalformedRequest` error.
[[nodiscard]] llvm::Expected<WorkspaceRequest> normalizeRequestValue(const llvm::json::Value& payload);

/// @brief Finds an object member by case-insensitive name.
/// @return Member value, or `nullptr` when missing or `null`.
[[nodiscard]] const llvm::json::Value* findField(const llvm::json::Object& object, llvm::StringRef name);

}  // namespace tryrun

#endif  // TRYRUN_WORKSPACE_NORMALIZER_H
