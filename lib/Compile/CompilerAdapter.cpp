//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Compile/CompilerAdapter.h"

#include "tryrun/Support/Error.h"

#include "llvm/ADT/Twine.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tryrun
{
namespace
{

constexpr llvm::StringRef ScriptPrologue     = "int main()\n{\n";
constexpr llvm::StringRef ScriptStatementEnd = "\n;\n";
constexpr llvm::StringRef ScriptEpilogue     = "return 0;\n}\n";

bool isIdentifierChar(const char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

/// Blanks comments, literals and directives, keeping offsets and newlines.
std::string codeOnly(const llvm::StringRef text)
{
    std::string       code(text.size(), ' ');
    const std::size_t n         = text.size();
    std::size_t       i         = 0;
    bool              lineStart = true;
    while (i < n)
    {
        const char c = text[i];
        if (c == '\n')
        {
            code[i]   = '\n';
            lineStart = true;
            ++i;
            continue;
        }
        if (lineStart && (c == ' ' || c == '\t' || c == '\r'))
        {
            ++i;
            continue;
        }
        if (lineStart && c == '#')
        {
            while (i < n && text[i] != '\n')
            {
                i += (text[i] == '\\' && i + 1 < n && text[i + 1] == '\n') ? 2 : 1;
            }
            continue;
        }
        lineStart = false;

        if (c == '/' && i + 1 < n && text[i + 1] == '/')
        {
            while (i < n && text[i] != '\n')
            {
                ++i;
            }
            continue;
        }
        if (c == '/' && i + 1 < n && text[i + 1] == '*')
        {
            const std::size_t close = text.find("*/", i + 2);
            i                       = close == llvm::StringRef::npos ? n : close + 2;
            continue;
        }
        if (c == '"' && i > 0 && text[i - 1] == 'R')
        {
            const std::size_t open = text.find('(', i + 1);
            if (open != llvm::StringRef::npos)
            {
                const std::string terminator = ")" + text.slice(i + 1, open).str() + "\"";
                const std::size_t close      = text.find(terminator, open + 1);
                i = close == llvm::StringRef::npos ? n : close + terminator.size();
                continue;
            }
        }
        // A quote after an alphanumeric is a digit separator, not a literal.
        if (c == '"' || (c == '\'' && !(i > 0 && std::isalnum(static_cast<unsigned char>(text[i - 1])) != 0)))
        {
            ++i;
            while (i < n && text[i] != c && text[i] != '\n')
            {
                i += text[i] == '\\' ? 2 : 1;
            }
            ++i;
            continue;
        }

        code[i] = c;
        ++i;
    }
    return code;
}

/// Returns the length of the leading whole lines of `text` that hold only
/// preprocessor directives, comments or blanks; zero when they hold no
/// directive.
std::size_t leadingDirectiveLength(const llvm::StringRef text)
{
    const std::string code   = codeOnly(text);
    const std::size_t first  = code.find_first_not_of(" \t\r\n");
    std::size_t       length = text.size();
    if (first != std::string::npos)
    {
        const std::size_t newline = text.rfind('\n', first);
        length                    = newline == llvm::StringRef::npos ? 0 : newline + 1;
    }
    return text.take_front(length).contains('#') ? length : 0;
}

/// Returns the bounds of the text between `// #region <name>` and the
/// following `// #endregion` line.
std::optional<std::pair<std::size_t, std::size_t>> findRegion(const llvm::StringRef text, const llvm::StringRef name)
{
    constexpr llvm::StringRef OpenMarker  = "#region";
    constexpr llvm::StringRef CloseMarker = "#endregion";

    std::size_t searchFrom = 0;
    while (true)
    {
        const std::size_t marker = text.find(OpenMarker, searchFrom);
        if (marker == llvm::StringRef::npos)
        {
            return std::nullopt;
        }
        searchFrom = marker + OpenMarker.size();

        const std::size_t previousNewline = text.rfind('\n', marker);
        const std::size_t lineStart       = previousNewline == llvm::StringRef::npos ? 0 : previousNewline + 1;
        std::size_t       lineEnd         = text.find('\n', marker);
        if (lineEnd == llvm::StringRef::npos)
        {
            lineEnd = text.size();
        }
        if (text.slice(lineStart, marker).trim() != "//" || text.slice(searchFrom, lineEnd).trim() != name)
        {
            continue;
        }

        const std::size_t begin = std::min(lineEnd + 1, text.size());
        const std::size_t close = text.find(CloseMarker, begin);
        if (close == llvm::StringRef::npos)
        {
            return std::nullopt;
        }
        const std::size_t closeNewline = text.rfind('\n', close);
        const std::size_t end          = closeNewline == llvm::StringRef::npos ? 0 : closeNewline + 1;
        return std::make_pair(begin, std::max(begin, end));
    }
}

std::string usingLine(const llvm::StringRef directive)
{
    llvm::StringRef text = directive.trim();
    if (text.empty())
    {
        return {};
    }
    if (text.front() == '<' || text.front() == '"')
    {
        return "#include " + text.str() + "\n";
    }
    if (text.front() == '#')
    {
        return text.str() + "\n";
    }
    text.consume_front("using namespace");
    text = text.trim();
    text.consume_back(";");
    return "using namespace " + text.trim().str() + ";\n";
}

struct Injection
{
    std::size_t begin{0};
    std::size_t end{0};
    std::size_t bufferIndex{0};
};

llvm::Error appendFile(SourceAssembler&     assembler,
                       const Workspace&     workspace,
                       const WorkspaceFile& file,
                       std::vector<bool>&   consumed)
{
    std::vector<Injection> injections;
    for (std::size_t index = 0; index < workspace.buffers.size(); ++index)
    {
        if (consumed[index])
        {
            continue;
        }
        const BufferId id = BufferId::parse(workspace.buffers[index].id);
        if (id.fileName != file.name)
        {
            continue;
        }
        if (!id.hasRegion())
        {
            injections.push_back(Injection{0, file.text.size(), index});
            consumed[index] = true;
            continue;
        }
        const auto bounds = findRegion(file.text, id.regionName);
        if (!bounds)
        {
            return makePipelineError(ErrorKind::MalformedRequest,
                                     llvm::Twine("file '") + file.name + "' has no region '" + id.regionName + "'");
        }
        injections.push_back(Injection{bounds->first, bounds->second, index});
        consumed[index] = true;
    }

    std::sort(injections.begin(), injections.end(), [](const Injection& lhs, const Injection& rhs) {
        return lhs.begin < rhs.begin;
    });

    // Whole-file buffers share the file's name and override its length below.
    assembler.sourceMap().setOwnerLength(file.name, file.text.size());

    const llvm::StringRef text   = file.text;
    std::size_t           cursor = 0;
    for (const Injection& injection : injections)
    {
        if (injection.begin < cursor)
        {
            return makePipelineError(ErrorKind::MalformedRequest,
                                     llvm::Twine("buffers overlap inside file '") + file.name + "'");
        }
        if (injection.begin > cursor)
        {
            assembler.appendOwned(SegmentOrigin::File, file.name, text.slice(cursor, injection.begin), cursor);
        }
        const Buffer& buffer = workspace.buffers[injection.bufferIndex];
        assembler.appendOwned(SegmentOrigin::Buffer, buffer.id, buffer.content);
        assembler.sourceMap().setOwnerLength(buffer.id, buffer.content.size());
        if (injection.end < text.size())
        {
            assembler.ensureNewline();
        }
        cursor = injection.end;
    }
    if (cursor < text.size() || injections.empty())
    {
        assembler.appendOwned(SegmentOrigin::File, file.name, text.substr(cursor), cursor);
    }
    return llvm::Error::success();
}

Diagnostic unitDiagnostic(const char* id, std::string message, std::optional<SourceSpan> span)
{
    Diagnostic diagnostic;
    diagnostic.severity = DiagnosticSeverity::Error;
    diagnostic.id       = id;
    diagnostic.message  = std::move(message);
    diagnostic.span     = span;
    return diagnostic;
}

}  // namespace

bool definesEntryPoint(const llvm::StringRef text)
{
    const std::string code  = codeOnly(text);
    const std::size_t n     = code.size();
    int               depth = 0;
    for (std::size_t i = 0; i < n; ++i)
    {
        const char c = code[i];
        if (c == '{')
        {
            ++depth;
            continue;
        }
        if (c == '}')
        {
            depth = std::max(0, depth - 1);
            continue;
        }
        if (depth != 0 || code.compare(i, 4, "main") != 0)
        {
            continue;
        }
        if ((i > 0 && isIdentifierChar(code[i - 1])) || (i + 4 < n && isIdentifierChar(code[i + 4])))
        {
            continue;
        }
        std::size_t previous = i;
        while (previous > 0 && std::isspace(static_cast<unsigned char>(code[previous - 1])) != 0)
        {
            --previous;
        }
        if (previous > 0 && (code[previous - 1] == '.' || code[previous - 1] == ':' || code[previous - 1] == '>'))
        {
            continue;
        }

        std::size_t j = i + 4;
        while (j < n && std::isspace(static_cast<unsigned char>(code[j])) != 0)
        {
            ++j;
        }
        if (j >= n || code[j] != '(')
        {
            continue;
        }
        int parens = 0;
        for (; j < n; ++j)
        {
            if (code[j] == '(')
            {
                ++parens;
            }
            else if (code[j] == ')' && --parens == 0)
            {
                break;
            }
        }
        while (j < n && code[j] != '{' && code[j] != ';')
        {
            ++j;
        }
        if (j < n && code[j] == '{')
        {
            return true;
        }
    }
    return false;
}

CompilerAdapter::CompilerAdapter(std::shared_ptr<Toolchain> toolchain)
    : toolchain_(std::move(toolchain))
{
}

llvm::Expected<CompilationUnit> CompilerAdapter::assemble(const Workspace& workspace)
{
    SourceAssembler assembler;
    for (const std::string& directive : workspace.usings)
    {
        assembler.appendScaffolding(usingLine(directive));
    }

    std::vector<bool> consumed(workspace.buffers.size(), false);
    for (const WorkspaceFile& file : workspace.files)
    {
        if (auto error = appendFile(assembler, workspace, file, consumed))
        {
            return std::move(error);
        }
        assembler.ensureNewline();
    }

    std::vector<const Buffer*> remaining;
    bool                       hasEntryPoint = definesEntryPoint(assembler.text());
    for (std::size_t index = 0; index < workspace.buffers.size(); ++index)
    {
        if (consumed[index])
        {
            continue;
        }
        remaining.push_back(&workspace.buffers[index]);
        hasEntryPoint = hasEntryPoint || definesEntryPoint(workspace.buffers[index].content);
    }

    CompilationUnit unit;
    unit.mode     = workspace.mode;
    unit.strategy = (workspace.mode == WorkspaceMode::Console || hasEntryPoint) ? CompileStrategy::Program
                                                                                : CompileStrategy::Script;
    const bool               script = unit.strategy == CompileStrategy::Script;
    std::vector<std::size_t> hoisted(remaining.size(), 0);
    if (script)
    {
        // Directives cannot sit at block scope; they go above `main`.
        for (std::size_t index = 0; index < remaining.size(); ++index)
        {
            const Buffer* buffer = remaining[index];
            hoisted[index]       = leadingDirectiveLength(buffer->content);
            if (hoisted[index] == 0)
            {
                continue;
            }
            assembler.appendOwned(SegmentOrigin::Buffer,
                                  buffer->id,
                                  llvm::StringRef(buffer->content).take_front(hoisted[index]));
            assembler.ensureNewline();
        }
        assembler.appendScaffolding(ScriptPrologue);
    }
    for (std::size_t index = 0; index < remaining.size(); ++index)
    {
        const Buffer* buffer = remaining[index];
        assembler.appendOwned(SegmentOrigin::Buffer,
                              buffer->id,
                              llvm::StringRef(buffer->content).drop_front(hoisted[index]),
                              hoisted[index]);
        assembler.sourceMap().setOwnerLength(buffer->id, buffer->content.size());
        if (script)
        {
            assembler.appendScaffolding(ScriptStatementEnd);
        }
        else
        {
            assembler.ensureNewline();
        }
    }
    if (script)
    {
        assembler.appendScaffolding(ScriptEpilogue);
    }

    unit.hasEntryPoint  = hasEntryPoint || script;
    unit.primaryOwnerId = workspace.buffers.empty() ? std::string() : workspace.buffers.front().id;
    unit.text           = assembler.takeText();
    unit.sourceMap      = assembler.takeSourceMap();
    return unit;
}

llvm::Expected<CompileOutcome> CompilerAdapter::compile(const CompilationUnit& unit, const CancellationToken& token)
{
    const bool missingEntryPoint = unit.strategy == CompileStrategy::Program && !unit.hasEntryPoint;

    CompileRequest request;
    request.unit   = &unit;
    request.action = missingEntryPoint ? CompileAction::CheckOnly : CompileAction::Build;

    auto outcome = toolchain_->compile(request, token);
    if (!outcome)
    {
        return outcome.takeError();
    }

    if (missingEntryPoint)
    {
        outcome->artifact.reset();
        const auto anchor = static_cast<std::uint32_t>(unit.sourceMap.toMerged(unit.primaryOwnerId, 0).value_or(0));
        outcome->diagnostics.push_back(
            unitDiagnostic(MissingEntryPointId,
                           "Program does not contain a 'main' function suitable for an entry point",
                           SourceSpan{anchor, anchor}));
    }
    else if (!outcome->artifact && !containsErrors(outcome->diagnostics))
    {
        outcome->diagnostics.push_back(
            unitDiagnostic(SilentBuildFailureId, "Compilation did not produce a program", std::nullopt));
    }
    return outcome;
}

}  // namespace tryrun
