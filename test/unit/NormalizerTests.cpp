//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Support/Error.h"
#include "tryrun/Workspace/Normalizer.h"
#include "tryrun/Workspace/Workspace.h"

#include <iostream>
#include <string>

namespace
{

bool expectMalformed(const std::string& body)
{
    auto request = tryrun::normalizeRequest(body);
    if (request)
    {
        std::cerr << "expected malformed request for body: " << body << "\n";
        return false;
    }
    std::string message;
    if (tryrun::classifyError(request.takeError(), message) != tryrun::ErrorKind::MalformedRequest)
    {
        std::cerr << "expected MalformedRequest for body: " << body << " (" << message << ")\n";
        return false;
    }
    return true;
}

llvm::Expected<tryrun::WorkspaceRequest> normalizeOrReport(const std::string& body)
{
    auto request = tryrun::normalizeRequest(body);
    if (!request)
    {
        std::cerr << "unexpected normalize failure for " << body << ": " << llvm::toString(request.takeError())
                  << "\n";
        return tryrun::makePipelineError(tryrun::ErrorKind::MalformedRequest, "normalize failed");
    }
    return request;
}

}  // namespace

bool runNormalizerTests()
{
    for (const char* body : {"", "   ", "{", "garbage", "{}", "[]", "42", "{\"Buffer\": 7}", "{\"Source\": null}",
                             "{\"Buffers\": []}", "{\"Buffers\": {}}", "{\"Buffers\": [3]}",
                             "{\"Buffer\": \"x\", \"WorkspaceType\": \"repl\"}",
                             "{\"Buffer\": \"x\", \"Position\": \"8\"}"})
    {
        if (!expectMalformed(body))
        {
            return false;
        }
    }

    {
        auto request = normalizeOrReport(R"({"Buffer": "Console.WriteLine(1);"})");
        if (!request)
        {
            llvm::consumeError(request.takeError());
            return false;
        }
        const tryrun::Workspace& workspace = request->workspace;
        if (workspace.mode != tryrun::WorkspaceMode::Script || workspace.buffers.size() != 1 ||
            workspace.buffers.front().content != "Console.WriteLine(1);" || !workspace.buffers.front().id.empty())
        {
            std::cerr << "Buffer form should become one unnamed script buffer\n";
            return false;
        }
        if (request->activeBuffer() != &workspace.buffers.front())
        {
            std::cerr << "single buffer should be the active buffer\n";
            return false;
        }
    }

    {
        auto request = normalizeOrReport(R"({"source": "Console.", "position": 8, "requestid": "r-1"})");
        if (!request)
        {
            llvm::consumeError(request.takeError());
            return false;
        }
        const tryrun::Buffer& buffer = request->workspace.buffers.front();
        if (!buffer.position || *buffer.position != 8 || !request->requestId || *request->requestId != "r-1")
        {
            std::cerr << "field names should match case-insensitively\n";
            return false;
        }
    }

    {
        auto request = normalizeOrReport(R"({
            "RequestId": "abc",
            "ActiveBufferId": "Program.cpp@body",
            "Workspace": {
                "WorkspaceType": " Console ",
                "Usings": ["<vector>", "  ", "std"],
                "Files": [{"Name": "Program.cpp", "Text": "int main()\n{\n// #region body\n// #endregion\n}\n"}],
                "Buffers": [
                    {"Id": "Program.cpp@body", "Content": "Console.", "Position": 8},
                    {"Id": "helpers", "Content": "int twice(int x) { return 2 * x; }"}
                ]
            }
        })");
        if (!request)
        {
            llvm::consumeError(request.takeError());
            return false;
        }
        const tryrun::Workspace& workspace = request->workspace;
        if (workspace.mode != tryrun::WorkspaceMode::Console)
        {
            std::cerr << "workspace type should parse trimmed and case-insensitive\n";
            return false;
        }
        if (workspace.usings.size() != 2 || workspace.usings[0] != "<vector>" || workspace.usings[1] != "std")
        {
            std::cerr << "blank usings should be dropped\n";
            return false;
        }
        if (workspace.files.size() != 1 || workspace.buffers.size() != 2)
        {
            std::cerr << "nested workspace should keep files and buffers\n";
            return false;
        }
        const tryrun::Buffer* active = request->activeBuffer();
        if (!active || active->id != "Program.cpp@body")
        {
            std::cerr << "explicit active buffer id should win\n";
            return false;
        }
        const tryrun::BufferId id = tryrun::BufferId::parse(active->id);
        if (id.fileName != "Program.cpp" || id.regionName != "body" || id.str() != active->id)
        {
            std::cerr << "buffer id should split at the last '@'\n";
            return false;
        }
    }

    {
        auto request = normalizeOrReport(
            R"({"Buffers": [{"Id": "a", "Content": "x"}, {"Id": "b", "Content": "Console.", "Position": 8}]})");
        if (!request)
        {
            llvm::consumeError(request.takeError());
            return false;
        }
        const tryrun::Buffer* active = request->activeBuffer();
        if (!active || active->id != "b")
        {
            std::cerr << "the only positioned buffer should be active\n";
            return false;
        }
    }

    {
        auto request = normalizeOrReport(R"({"Buffers": [{"Id": "a", "Content": "x"}, {"Id": "b", "Content": "y"}]})");
        if (!request)
        {
            llvm::consumeError(request.takeError());
            return false;
        }
        if (request->activeBuffer() != nullptr)
        {
            std::cerr << "ambiguous workspaces should have no active buffer\n";
            return false;
        }
    }

    if (!expectMalformed(R"({"Buffers": [{"Id": "a", "Content": "x"}, {"Id": "a", "Content": "y"}]})") ||
        !expectMalformed(R"({"ActiveBufferId": "zzz", "Buffers": [{"Id": "a", "Content": "x"}]})") ||
        !expectMalformed(R"({"Buffers": [{"Id": "a"}], "Files": [{"Name": "f"}, {"Name": "f"}]})") ||
        !expectMalformed(R"({"Buffers": [{"Id": "a"}], "Files": [{"Text": "no name"}]})"))
    {
        return false;
    }

    {
        const tryrun::BufferId plain = tryrun::BufferId::parse("a@b@c");
        if (plain.fileName != "a@b" || plain.regionName != "c")
        {
            std::cerr << "region should start after the last '@'\n";
            return false;
        }
        if (tryrun::parseMode("SCRIPT") != tryrun::WorkspaceMode::Script || tryrun::parseMode("other"))
        {
            std::cerr << "mode parsing mismatch\n";
            return false;
        }
    }
    return true;
}
