//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Workspace/Workspace.h"

namespace tryrun
{

llvm::StringRef modeName(const WorkspaceMode mode)
{
    switch (mode)
    {
    case WorkspaceMode::Script:
        return "script";
    case WorkspaceMode::Console:
        return "console";
    }
    return "script";
}

std::optional<WorkspaceMode> parseMode(const llvm::StringRef name)
{
    const llvm::StringRef trimmed = name.trim();
    if (trimmed.equals_insensitive("script"))
    {
        return WorkspaceMode::Script;
    }
    if (trimmed.equals_insensitive("console"))
    {
        return WorkspaceMode::Console;
    }
    return std::nullopt;
}

BufferId BufferId::parse(const llvm::StringRef text)
{
    BufferId          id;
    const std::size_t at = text.rfind('@');
    if (at == llvm::StringRef::npos)
    {
        id.fileName = text.str();
        return id;
    }
    id.fileName   = text.substr(0, at).str();
    id.regionName = text.substr(at + 1).str();
    return id;
}

std::string BufferId::str() const
{
    return hasRegion() ? fileName + "@" + regionName : fileName;
}

const Buffer* Workspace::findBuffer(const llvm::StringRef id) const
{
    for (const Buffer& buffer : buffers)
    {
        if (buffer.id == id)
        {
            return &buffer;
        }
    }
    return nullptr;
}

const WorkspaceFile* Workspace::findFile(const llvm::StringRef name) const
{
    for (const WorkspaceFile& file : files)
    {
        if (file.name == name)
        {
            return &file;
        }
    }
    return nullptr;
}

const Buffer* WorkspaceRequest::activeBuffer() const
{
    if (activeBufferId)
    {
        return workspace.findBuffer(*activeBufferId);
    }

    const Buffer* positioned = nullptr;
    for (const Buffer& buffer : workspace.buffers)
    {
        if (!buffer.position)
        {
            continue;
        }
        if (positioned)
        {
            return nullptr;
        }
        positioned = &buffer;
    }
    if (positioned)
    {
        return positioned;
    }
    return workspace.buffers.size() == 1 ? &workspace.buffers.front() : nullptr;
}

}  // namespace tryrun
