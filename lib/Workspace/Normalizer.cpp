//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Workspace/Normalizer.h"

#include "tryrun/Support/Error.h"

#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/Twine.h"

#include <string>
#include <utility>

namespace tryrun
{
namespace
{

llvm::Error malformed(const llvm::Twine& message)
{
    return makePipelineError(ErrorKind::MalformedRequest, message);
}

llvm::Error readString(const llvm::json::Object& object,
                       const llvm::StringRef     name,
                       std::optional<std::string>& out)
{
    const llvm::json::Value* value = findField(object, name);
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return malformed(llvm::Twine("field '") + name + "' must be a string");
    }
    out = text->str();
    return llvm::Error::success();
}

llvm::Error readPosition(const llvm::json::Object& object, std::optional<std::int64_t>& out)
{
    const llvm::json::Value* value = findField(object, "Position");
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto position = value->getAsInteger();
    if (!position)
    {
        return malformed("field 'Position' must be an integer");
    }
    out = *position;
    return llvm::Error::success();
}

llvm::Error readMode(const llvm::json::Object& object, Workspace& workspace)
{
    std::optional<std::string> type;
    if (auto error = readString(object, "WorkspaceType", type))
    {
        return error;
    }
    if (!type)
    {
        workspace.mode = WorkspaceMode::Script;
        return llvm::Error::success();
    }
    const auto mode = parseMode(*type);
    if (!mode)
    {
        return malformed(llvm::Twine("unknown workspace type '") + *type + "'");
    }
    workspace.mode = *mode;
    return llvm::Error::success();
}

llvm::Error readBuffers(const llvm::json::Array& items, Workspace& workspace)
{
    for (const llvm::json::Value& item : items)
    {
        const auto* object = item.getAsObject();
        if (!object)
        {
            return malformed("each entry of 'Buffers' must be an object");
        }

        Buffer                     buffer;
        std::optional<std::string> id;
        std::optional<std::string> content;
        if (auto error = readString(*object, "Id", id))
        {
            return error;
        }
        if (auto error = readString(*object, "Content", content))
        {
            return error;
        }
        if (auto error = readPosition(*object, buffer.position))
        {
            return error;
        }
        buffer.id      = id.value_or(std::string());
        buffer.content = content.value_or(std::string());
        workspace.buffers.push_back(std::move(buffer));
    }
    return llvm::Error::success();
}

llvm::Error readFiles(const llvm::json::Array& items, Workspace& workspace)
{
    for (const llvm::json::Value& item : items)
    {
        const auto* object = item.getAsObject();
        if (!object)
        {
            return malformed("each entry of 'Files' must be an object");
        }

        std::optional<std::string> name;
        std::optional<std::string> text;
        if (auto error = readString(*object, "Name", name))
        {
            return error;
        }
        if (auto error = readString(*object, "Text", text))
        {
            return error;
        }
        if (!name || name->empty())
        {
            return malformed("each entry of 'Files' needs a non-empty 'Name'");
        }
        workspace.files.push_back(WorkspaceFile{std::move(*name), text.value_or(std::string())});
    }
    return llvm::Error::success();
}

llvm::Error readUsings(const llvm::json::Array& items, Workspace& workspace)
{
    for (const llvm::json::Value& item : items)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return malformed("each entry of 'Usings' must be a string");
        }
        if (!text->trim().empty())
        {
            workspace.usings.push_back(text->trim().str());
        }
    }
    return llvm::Error::success();
}

llvm::Expected<const llvm::json::Array*> arrayField(const llvm::json::Object& object, const llvm::StringRef name)
{
    const llvm::json::Value* value = findField(object, name);
    if (!value)
    {
        return nullptr;
    }
    const auto* array = value->getAsArray();
    if (!array)
    {
        return malformed(llvm::Twine("field '") + name + "' must be an array");
    }
    return array;
}

llvm::Error readWorkspace(const llvm::json::Object& object, Workspace& workspace)
{
    if (auto error = readMode(object, workspace))
    {
        return error;
    }

    auto buffers = arrayField(object, "Buffers");
    if (!buffers)
    {
        return buffers.takeError();
    }
    if (*buffers)
    {
        if (auto error = readBuffers(**buffers, workspace))
        {
            return error;
        }
    }

    auto files = arrayField(object, "Files");
    if (!files)
    {
        return files.takeError();
    }
    if (*files)
    {
        if (auto error = readFiles(**files, workspace))
        {
            return error;
        }
    }

    auto usings = arrayField(object, "Usings");
    if (!usings)
    {
        return usings.takeError();
    }
    if (*usings)
    {
        return readUsings(**usings, workspace);
    }
    return llvm::Error::success();
}

/// Rejects shapes that parse but cannot describe a compilable workspace.
llvm::Error validate(const WorkspaceRequest& request)
{
    const Workspace& workspace = request.workspace;
    if (workspace.buffers.empty())
    {
        return malformed("workspace contains no buffers");
    }

    llvm::StringSet<> bufferIds;
    for (const Buffer& buffer : workspace.buffers)
    {
        if (!bufferIds.insert(buffer.id).second)
        {
            return malformed(llvm::Twine("duplicate buffer id '") + buffer.id + "'");
        }
    }

    llvm::StringSet<> fileNames;
    for (const WorkspaceFile& file : workspace.files)
    {
        if (!fileNames.insert(file.name).second)
        {
            return malformed(llvm::Twine("duplicate file name '") + file.name + "'");
        }
    }

    if (request.activeBufferId && !workspace.findBuffer(*request.activeBufferId))
    {
        return malformed(llvm::Twine("active buffer '") + *request.activeBufferId + "' is not in the workspace");
    }
    return llvm::Error::success();
}

}  // namespace

const llvm::json::Value* findField(const llvm::json::Object& object, const llvm::StringRef name)
{
    for (const auto& entry : object)
    {
        const llvm::StringRef key = entry.first;
        if (key.equals_insensitive(name))
        {
            return entry.second.kind() == llvm::json::Value::Null ? nullptr : &entry.second;
        }
    }
    return nullptr;
}

llvm::Expected<WorkspaceRequest> normalizeRequest(const llvm::StringRef body)
{
    if (body.trim().empty())
    {
        return malformed("request body is empty");
    }

    auto parsed = llvm::json::parse(body);
    if (!parsed)
    {
        return malformed(llvm::Twine("request body is not valid JSON: ") + llvm::toString(parsed.takeError()));
    }
    return normalizeRequestValue(*parsed);
}

llvm::Expected<WorkspaceRequest> normalizeRequestValue(const llvm::json::Value& payload)
{
    const auto* root = payload.getAsObject();
    if (!root)
    {
        return malformed("request body must be a JSON object");
    }

    WorkspaceRequest request;
    if (auto error = readString(*root, "RequestId", request.requestId))
    {
        return std::move(error);
    }
    if (auto error = readString(*root, "ActiveBufferId", request.activeBufferId))
    {
        return std::move(error);
    }

    if (const llvm::json::Value* nested = findField(*root, "Workspace"))
    {
        const auto* object = nested->getAsObject();
        if (!object)
        {
            return malformed("field 'Workspace' must be an object");
        }
        if (auto error = readWorkspace(*object, request.workspace))
        {
            return std::move(error);
        }
    }
    else if (findField(*root, "Buffers"))
    {
        if (auto error = readWorkspace(*root, request.workspace))
        {
            return std::move(error);
        }
    }
    else
    {
        std::optional<std::string> content;
        if (auto error = readString(*root, "Buffer", content))
        {
            return std::move(error);
        }
        if (!content)
        {
            if (auto error = readString(*root, "Source", content))
            {
                return std::move(error);
            }
        }
        if (!content)
        {
            return malformed("request has no 'Buffer', 'Source' or 'Workspace' field");
        }

        Buffer buffer;
        buffer.content = std::move(*content);
        if (auto error = readPosition(*root, buffer.position))
        {
            return std::move(error);
        }
        if (auto error = readMode(*root, request.workspace))
        {
            return std::move(error);
        }
        request.workspace.buffers.push_back(std::move(buffer));
    }

    if (auto error = validate(request))
    {
        return std::move(error);
    }
    return request;
}

}  // namespace tryrun
