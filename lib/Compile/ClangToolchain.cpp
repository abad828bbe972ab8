//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the compiler-driver toolchain and its output parsers.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Compile/ClangToolchain.h"

#include "tryrun/Support/Error.h"
#include "tryrun/Support/Process.h"
#include "tryrun/Support/SourceLocation.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

namespace tryrun
{
namespace
{

constexpr std::size_t MaxStandardErrorBytes = 64 * 1024;

/// @brief Owns a scratch directory and removes it on destruction.
class ScratchDirectory final
{
public:
    explicit ScratchDirectory(std::string path)
        : path_(std::move(path))
    {
    }

    ~ScratchDirectory()
    {
        if (const std::error_code ec = llvm::sys::fs::remove_directories(path_))
        {
            llvm::errs() << "[tryrund] failed to remove scratch directory " << path_ << ": " << ec.message() << "\n";
        }
    }

    ScratchDirectory(const ScratchDirectory&)            = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    [[nodiscard]] std::string file(const llvm::StringRef name) const
    {
        return (std::filesystem::path(path_) / name.str()).string();
    }

private:
    std::string path_;
};

llvm::Expected<std::unique_ptr<ScratchDirectory>> createScratchDirectory(const llvm::StringRef root)
{
    if (!root.empty())
    {
        if (const std::error_code ec = llvm::sys::fs::create_directories(root))
        {
            return makePipelineError(ErrorKind::ToolchainFailure,
                                     llvm::Twine("failed to create scratch root ") + root + ": " + ec.message());
        }
    }

    llvm::SmallString<128> prefix(root);
    if (prefix.empty())
    {
        llvm::sys::path::system_temp_directory(true, prefix);
    }
    llvm::sys::path::append(prefix, "tryrun");

    llvm::SmallString<128> path;
    if (const std::error_code ec = llvm::sys::fs::createUniqueDirectory(prefix, path))
    {
        return makePipelineError(ErrorKind::ToolchainFailure,
                                 llvm::Twine("failed to create scratch directory: ") + ec.message());
    }
    return std::make_unique<ScratchDirectory>(path.str().str());
}

llvm::Error writeSource(const std::string& path, const llvm::StringRef text)
{
    std::error_code      ec;
    llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_Text);
    if (ec)
    {
        return makePipelineError(ErrorKind::ToolchainFailure, llvm::Twine("failed to open ") + path + ": " + ec.message());
    }
    os << text;
    os.close();
    if (os.has_error())
    {
        const std::error_code writeError = os.error();
        os.clear_error();
        return makePipelineError(ErrorKind::ToolchainFailure,
                                 llvm::Twine("failed to write ") + path + ": " + writeError.message());
    }
    return llvm::Error::success();
}

class ClangArtifact final : public CompiledArtifact
{
public:
    ClangArtifact(std::unique_ptr<ScratchDirectory> scratch, std::string programPath)
        : scratch_(std::move(scratch))
        , programPath_(std::move(programPath))
    {
    }

    llvm::Error prepare(const CancellationToken& token) override
    {
        if (token.isCancellationRequested())
        {
            return makePipelineError(ErrorKind::Cancelled, "run cancelled before start");
        }
        if (!llvm::sys::fs::can_execute(programPath_))
        {
            return makePipelineError(ErrorKind::ToolchainFailure,
                                     llvm::Twine("compiled program is not executable: ") + programPath_);
        }
        return llvm::Error::success();
    }

    llvm::Expected<ExecutionOutcome> run(OutputBuffer& output, const CancellationToken& token) override
    {
        std::string standardError;
        ProcessSpec spec;
        spec.argv.push_back(programPath_);

        auto exit = runProcess(
            spec,
            [&output](const llvm::StringRef chunk) { output.append(chunk); },
            [&standardError](const llvm::StringRef chunk) {
                if (standardError.size() < MaxStandardErrorBytes)
                {
                    standardError.append(chunk.data(), chunk.size());
                }
            },
            token);
        if (!exit)
        {
            return exit.takeError();
        }
        if (exit->killed)
        {
            return makePipelineError(ErrorKind::Cancelled, "program run cancelled");
        }

        ExecutionOutcome outcome;
        outcome.exitCode  = exit->exitCode;
        outcome.exception = findReportedException(standardError);
        if (!outcome.exception && exit->signal)
        {
            outcome.exception =
                "Program terminated by signal " + std::to_string(*exit->signal) + " (" + ::strsignal(*exit->signal) + ")";
        }
        return outcome;
    }

private:
    std::unique_ptr<ScratchDirectory> scratch_;
    std::string                       programPath_;
};

struct LevelMarker
{
    llvm::StringRef    text;
    DiagnosticSeverity severity;
    bool               note;
};

const LevelMarker LevelMarkers[] = {
    {": fatal error: ", DiagnosticSeverity::Error, false},
    {": error: ", DiagnosticSeverity::Error, false},
    {": warning: ", DiagnosticSeverity::Warning, false},
    {": remark: ", DiagnosticSeverity::Info, false},
    {": note: ", DiagnosticSeverity::Hidden, true},
};

struct ParsedLocation
{
    std::string                                            file;
    std::uint32_t                                          line{0};
    std::uint32_t                                          column{0};
    std::optional<std::pair<std::uint32_t, std::uint32_t>> rangeEnd;
};

std::optional<ParsedLocation> parseLocation(llvm::StringRef head)
{
    ParsedLocation location;
    // Ranges print right after the column; walking from the right leaves the
    // first one in `rangeEnd`.
    while (!head.empty() && head.back() == '}')
    {
        const std::size_t open = head.rfind('{');
        if (open == llvm::StringRef::npos)
        {
            return std::nullopt;
        }
        const llvm::StringRef range = head.slice(open + 1, head.size() - 1);
        const auto            to    = range.split('-').second;
        const auto            parts = to.split(':');
        std::uint32_t         line  = 0;
        std::uint32_t         column = 0;
        if (!parts.first.getAsInteger(10, line) && !parts.second.getAsInteger(10, column))
        {
            location.rangeEnd = std::make_pair(line, column);
        }
        head = head.take_front(open);
    }
    head.consume_back(":");

    const auto columnSplit = head.rsplit(':');
    const auto lineSplit   = columnSplit.first.rsplit(':');
    if (lineSplit.first.empty() || lineSplit.second.getAsInteger(10, location.line) ||
        columnSplit.second.getAsInteger(10, location.column))
    {
        return std::nullopt;
    }
    location.file = lineSplit.first.str();
    return location;
}

bool isLinkerTool(const llvm::StringRef head)
{
    const llvm::StringRef name = llvm::sys::path::filename(head.trim());
    return name == "ld" || name == "lld" || name == "collect2" || name.contains("ld.");
}

std::string defaultId(const DiagnosticSeverity severity)
{
    switch (severity)
    {
    case DiagnosticSeverity::Warning:
        return "clang-warning";
    case DiagnosticSeverity::Info:
    case DiagnosticSeverity::Hidden:
        return "clang-remark";
    case DiagnosticSeverity::Error:
        break;
    }
    return "clang-error";
}

Diagnostic unlocated(const DiagnosticSeverity severity, std::string id, std::string message)
{
    Diagnostic diagnostic;
    diagnostic.severity     = severity;
    diagnostic.id           = std::move(id);
    diagnostic.message      = std::move(message);
    diagnostic.attributable = false;
    return diagnostic;
}

std::string stripPlaceholders(llvm::StringRef text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const llvm::StringRef rest = text.substr(i);
        if (rest.size() >= 2 && ((rest[0] == '[' || rest[0] == '<' || rest[0] == '{') && rest[1] == '#'))
        {
            ++i;
            continue;
        }
        if (rest.size() >= 2 && rest[0] == '#' && (rest[1] == ']' || rest[1] == '>' || rest[1] == '}'))
        {
            ++i;
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

}  // namespace

ClangToolchain::ClangToolchain(ToolchainOptions options)
    : options_(std::move(options))
{
}

std::vector<std::string> ClangToolchain::baseArguments() const
{
    std::vector<std::string> argv{options_.compilerPath,
                                  "-std=" + options_.languageStandard,
                                  "-fno-color-diagnostics",
                                  "-fno-caret-diagnostics",
                                  "-fdiagnostics-print-source-range-info",
                                  "-fdiagnostics-show-option"};
    if (!options_.preludePath.empty())
    {
        argv.push_back("-include");
        argv.push_back(options_.preludePath);
    }
    argv.insert(argv.end(), options_.extraFlags.begin(), options_.extraFlags.end());
    return argv;
}

llvm::Expected<CompileOutcome> ClangToolchain::compile(const CompileRequest& request, const CancellationToken& token)
{
    if (!request.unit)
    {
        return makePipelineError(ErrorKind::ToolchainFailure, "compile request has no unit");
    }
    const CompilationUnit& unit = *request.unit;

    auto scratch = createScratchDirectory(options_.scratchRoot);
    if (!scratch)
    {
        return scratch.takeError();
    }
    const std::string sourcePath  = (*scratch)->file(unit.fileName);
    const std::string programPath = (*scratch)->file("program");
    if (auto error = writeSource(sourcePath, unit.text))
    {
        return std::move(error);
    }

    ProcessSpec spec;
    spec.argv = baseArguments();
    if (request.action == CompileAction::CheckOnly)
    {
        spec.argv.push_back("-fsyntax-only");
    }
    else
    {
        spec.argv.push_back("-o");
        spec.argv.push_back(programPath);
    }
    spec.argv.push_back(sourcePath);

    std::string output;
    auto        exit = runProcessCapture(spec, output, token);
    if (!exit)
    {
        return exit.takeError();
    }
    if (exit->killed)
    {
        return makePipelineError(ErrorKind::Cancelled, "compilation cancelled");
    }

    CompileOutcome outcome;
    outcome.diagnostics = parseClangDiagnostics(output, sourcePath, unit.text);
    if (exit->succeeded())
    {
        if (request.action == CompileAction::Build)
        {
            outcome.artifact = std::make_unique<ClangArtifact>(std::move(*scratch), programPath);
        }
    }
    else if (!containsErrors(outcome.diagnostics))
    {
        llvm::StringRef lastLine = llvm::StringRef(output).trim();
        lastLine                 = lastLine.substr(lastLine.rfind('\n') + 1);
        outcome.diagnostics.push_back(unlocated(DiagnosticSeverity::Error,
                                                "clang-driver",
                                                "compiler exited with status " + std::to_string(exit->exitCode) +
                                                    (lastLine.empty() ? std::string() : ": " + lastLine.str())));
    }
    return outcome;
}

llvm::Expected<std::vector<CompletionItem>> ClangToolchain::complete(const CompilationUnit&    unit,
                                                                     const std::size_t         mergedOffset,
                                                                     const CancellationToken& token)
{
    auto scratch = createScratchDirectory(options_.scratchRoot);
    if (!scratch)
    {
        return scratch.takeError();
    }
    const std::string sourcePath = (*scratch)->file(unit.fileName);
    if (auto error = writeSource(sourcePath, unit.text))
    {
        return std::move(error);
    }

    const SourceLocation at = locate(unit.text, mergedOffset);
    ProcessSpec          spec;
    spec.argv = baseArguments();
    spec.argv.push_back("-fsyntax-only");
    spec.argv.push_back("-Xclang");
    spec.argv.push_back("-code-completion-at=" + sourcePath + ":" + std::to_string(at.line) + ":" +
                        std::to_string(at.column));
    spec.argv.push_back(sourcePath);

    // Completion exits non-zero whenever the surrounding code has errors.
    std::string completions;
    auto        exit = runProcess(
        spec,
        [&completions](const llvm::StringRef chunk) { completions.append(chunk.data(), chunk.size()); },
        ProcessOutputFn{},
        token);
    if (!exit)
    {
        return exit.takeError();
    }
    if (exit->killed)
    {
        return makePipelineError(ErrorKind::Cancelled, "completion cancelled");
    }
    return parseClangCompletions(completions);
}

std::vector<Diagnostic> parseClangDiagnostics(const llvm::StringRef output,
                                              const llvm::StringRef sourcePath,
                                              const llvm::StringRef sourceText)
{
    std::vector<Diagnostic> diagnostics;
    llvm::StringRef         rest = output;
    while (!rest.empty())
    {
        const auto            split = rest.split('\n');
        const llvm::StringRef line  = split.first.rtrim();
        rest                        = split.second;
        if (line.empty())
        {
            continue;
        }

        const LevelMarker* marker   = nullptr;
        std::size_t        position = llvm::StringRef::npos;
        for (const LevelMarker& candidate : LevelMarkers)
        {
            const std::size_t found = line.find(candidate.text);
            if (found < position)
            {
                position = found;
                marker   = &candidate;
            }
        }

        if (!marker)
        {
            if (line.contains("undefined reference to") || line.contains("multiple definition of"))
            {
                diagnostics.push_back(unlocated(DiagnosticSeverity::Error, "link-error", line.trim().str()));
            }
            continue;
        }
        if (marker->note)
        {
            continue;
        }

        const llvm::StringRef head    = line.take_front(position);
        llvm::StringRef       message = line.substr(position + marker->text.size());
        std::string           id      = defaultId(marker->severity);
        if (!message.empty() && message.back() == ']')
        {
            const std::size_t open = message.rfind(" [");
            if (open != llvm::StringRef::npos)
            {
                const llvm::StringRef flag = message.slice(open + 2, message.size() - 1);
                if (flag.size() >= 2 && flag[0] == '-' && (flag[1] == 'W' || flag[1] == 'R'))
                {
                    id      = flag.str();
                    message = message.take_front(open);
                }
            }
        }

        const auto location = parseLocation(head);
        if (!location)
        {
            const bool linker = isLinkerTool(head) || message.contains("linker command failed");
            diagnostics.push_back(unlocated(marker->severity, linker ? "link-error" : id, message.str()));
            continue;
        }

        Diagnostic diagnostic;
        diagnostic.severity = marker->severity;
        diagnostic.id       = std::move(id);
        diagnostic.message  = message.str();
        if (location->file == sourcePath)
        {
            const auto start = offsetOf(sourceText, location->line, location->column);
            if (start)
            {
                std::size_t end = *start;
                if (location->rangeEnd)
                {
                    const auto rangeEnd = offsetOf(sourceText, location->rangeEnd->first, location->rangeEnd->second);
                    if (rangeEnd && *rangeEnd > end)
                    {
                        end = *rangeEnd;
                    }
                }
                diagnostic.span = SourceSpan{static_cast<std::uint32_t>(*start), static_cast<std::uint32_t>(end)};
            }
        }
        else
        {
            diagnostic.attributable = false;
        }
        diagnostics.push_back(std::move(diagnostic));
    }
    return diagnostics;
}

std::vector<CompletionItem> parseClangCompletions(const llvm::StringRef output)
{
    constexpr llvm::StringRef Prefix = "COMPLETION: ";

    std::vector<CompletionItem> items;
    llvm::StringRef             rest = output;
    while (!rest.empty())
    {
        const auto      split = rest.split('\n');
        llvm::StringRef line  = split.first.rtrim();
        rest                  = split.second;
        if (!line.consume_front(Prefix))
        {
            continue;
        }

        const auto      parts     = line.split(" : ");
        llvm::StringRef name      = parts.first.trim();
        llvm::StringRef signature = parts.second.trim();
        name.consume_back(" (Hidden)");

        llvm::StringRef resultType;
        if (signature.consume_front("[#"))
        {
            const auto typeSplit = signature.split("#]");
            resultType           = typeSplit.first;
            signature            = typeSplit.second;
        }
        const std::string body = stripPlaceholders(signature);

        CompletionItem item;
        if (name == "Pattern")
        {
            item.kind        = "Snippet";
            item.displayText = llvm::StringRef(body).take_until([](const char c) { return c == '(' || c == ' '; }).str();
        }
        else
        {
            item.displayText = name.str();
            if (body.find('(') != std::string::npos)
            {
                item.kind = "Method";
            }
            else if (!resultType.empty())
            {
                item.kind = "Field";
            }
            else if (signature.empty())
            {
                item.kind = "Keyword";
            }
            else
            {
                item.kind = "Class";
            }
        }
        if (item.displayText.empty())
        {
            continue;
        }

        std::string sortText = std::to_string(items.size());
        sortText.insert(0, sortText.size() < 6 ? 6 - sortText.size() : 0, '0');
        item.sortText      = std::move(sortText);
        item.filterText    = item.displayText;
        item.insertText    = item.displayText;
        item.documentation = resultType.empty() ? body : resultType.str() + " " + body;
        items.push_back(std::move(item));
    }
    return items;
}

std::optional<std::string> findReportedException(const llvm::StringRef standardError)
{
    llvm::StringRef rest = standardError;
    while (!rest.empty())
    {
        const auto      split = rest.split('\n');
        llvm::StringRef line  = split.first;
        rest                  = split.second;
        if (line.consume_front(ExceptionMarker))
        {
            return line.trim().str();
        }
    }
    return std::nullopt;
}

}  // namespace tryrun
