//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Canonical in-memory workspace model built once per request.
///
/// A workspace is immutable after normalization. Buffers carry caller text and
/// optional cursor positions; files are auxiliary compilation inputs that
/// buffers may replace whole or inject into by region.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_WORKSPACE_WORKSPACE_H
#define TRYRUN_WORKSPACE_WORKSPACE_H

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tryrun
{

/// @brief Compilation mode requested for a workspace.
enum class WorkspaceMode
{
    /// @brief Bare statements without an entry point.
    Script,

    /// @brief Complete program with an entry point.
    Console,
};

/// @brief Returns the wire name of a mode (`script`, `console`).
[[nodiscard]] llvm::StringRef modeName(WorkspaceMode mode);

/// @brief Parses a wire mode name, case-insensitively.
[[nodiscard]] std::optional<WorkspaceMode> parseMode(llvm::StringRef name);

/// @brief Parsed form of a buffer identifier `file` or `file@region`.
struct BufferId
{
    /// @brief File the buffer belongs to; may be empty.
    std::string fileName;

    /// @brief Region inside `fileName`; empty for whole-file buffers.
    std::string regionName;

    /// @brief Parses `text`; the region starts after the last `@`.
    [[nodiscard]] static BufferId parse(llvm::StringRef text);

    [[nodiscard]] bool hasRegion() const
    {
        return !regionName.empty();
    }

    /// @brief Formats the id back to its wire form.
    [[nodiscard]] std::string str() const;
};

/// @brief One caller-supplied source buffer.
struct Buffer
{
    /// @brief Buffer identifier, unique within the workspace.
    std::string id;

    /// @brief Source text.
    std::string content;

    /// @brief Optional cursor position as a character offset into `content`.
    std::optional<std::int64_t> position;
};

/// @brief Auxiliary source file.
struct WorkspaceFile
{
    /// @brief File name, unique within the workspace.
    std::string name;

    /// @brief File text.
    std::string text;
};

/// @brief Canonical workspace.
struct Workspace
{
    /// @brief Requested compilation mode.
    WorkspaceMode mode{WorkspaceMode::Script};

    /// @brief Buffers in caller order.
    std::vector<Buffer> buffers;

    /// @brief Auxiliary files in caller order.
    std::vector<WorkspaceFile> files;

    /// @brief Import directives in caller order.
    std::vector<std::string> usings;

    /// @brief Looks up a buffer by exact id.
    [[nodiscard]] const Buffer* findBuffer(llvm::StringRef id) const;

    /// @brief Looks up a file by exact name.
    [[nodiscard]] const WorkspaceFile* findFile(llvm::StringRef name) const;
};

/// @brief Normalized request: a workspace plus request-level metadata.
struct WorkspaceRequest
{
    /// @brief Workspace to compile.
    Workspace workspace;

    /// @brief Buffer designated as the entry buffer for positions.
    std::optional<std::string> activeBufferId;

    /// @brief Caller correlation id, echoed in responses.
    std::optional<std::string> requestId;

    /// @brief Resolves the entry buffer.
    ///
    /// Uses `activeBufferId` when set; otherwise the only buffer carrying a
    /// position, or the only buffer of the workspace.
    ///
    /// @return Entry buffer, or `nullptr` when it is ambiguous or missing.
    [[nodiscard]] const Buffer* activeBuffer() const;
};

}  // namespace tryrun

#endif  // TRYRUN_WORKSPACE_WORKSPACE_H
