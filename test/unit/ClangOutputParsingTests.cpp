//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Validates parsing of clang driver diagnostics, code-completion listings
/// and the prelude's exception marker.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Compile/ClangToolchain.h"
#include "tryrun/Compile/CompilerAdapter.h"
#include "tryrun/Support/Error.h"

#include <iostream>
#include <string>

namespace
{

bool runDiagnosticParsingChecks()
{
    const std::string sourcePath = "/tmp/tryrun-x/main.cpp";
    const std::string sourceText = "int main()\n{\nConsole.WriteLine(\"hello\"\n;\nreturn 0;\n}\n";
    const std::string output     = "/tmp/tryrun-x/main.cpp:4:1:{4:1-4:2}: error: expected ')'\n"
                                   "/tmp/tryrun-x/main.cpp:3:18: note: to match this '('\n"
                                   "/tmp/tryrun-x/main.cpp:1:5: warning: unused variable 'x' [-Wunused-variable]\n"
                                   "/usr/include/c++/v1/vector:12:3: error: something in a header\n"
                                   "/usr/bin/ld: /tmp/main.o: in function `main': undefined reference to `foo()'\n"
                                   "clang++: error: linker command failed with exit code 1 (use -v to see invocation)\n"
                                   "In file included from /tmp/tryrun-x/main.cpp:1:\n"
                                   "2 errors generated.\n";

    const auto diagnostics = tryrun::parseClangDiagnostics(output, sourcePath, sourceText);
    if (diagnostics.size() != 5)
    {
        std::cerr << "expected 5 diagnostics, got " << diagnostics.size() << "\n";
        return false;
    }

    const tryrun::Diagnostic& paren = diagnostics[0];
    if (paren.severity != tryrun::DiagnosticSeverity::Error || paren.id != "clang-error" ||
        paren.message != "expected ')'" || !paren.span || paren.span->start != 39 || paren.span->end != 40)
    {
        std::cerr << "missing paren diagnostic should carry the ranged span\n";
        return false;
    }

    const tryrun::Diagnostic& unused = diagnostics[1];
    if (unused.severity != tryrun::DiagnosticSeverity::Warning || unused.id != "-Wunused-variable" ||
        unused.message != "unused variable 'x'" || !unused.span || unused.span->start != 4 || unused.span->end != 4)
    {
        std::cerr << "warning flag should become the diagnostic id\n";
        return false;
    }

    const tryrun::Diagnostic& header = diagnostics[2];
    if (header.span || header.attributable || header.id != "clang-error")
    {
        std::cerr << "diagnostics in other files should not carry spans\n";
        return false;
    }

    if (diagnostics[3].id != "link-error" || diagnostics[3].attributable || diagnostics[4].id != "link-error")
    {
        std::cerr << "linker output should be reported as link errors\n";
        return false;
    }

    const auto fatal = tryrun::parseClangDiagnostics(
        "main.cpp:1:10: fatal error: 'nope.h' file not found\nmain.cpp:2:1: remark: inlined [-Rpass=inline]\n",
        "main.cpp",
        "#include \"nope.h\"\nint x;\n");
    if (fatal.size() != 2 || fatal[0].severity != tryrun::DiagnosticSeverity::Error ||
        fatal[0].message != "'nope.h' file not found" || !fatal[0].span || fatal[0].span->start != 9 ||
        fatal[1].severity != tryrun::DiagnosticSeverity::Info || fatal[1].id != "-Rpass=inline")
    {
        std::cerr << "fatal errors and remarks should parse with their severities\n";
        return false;
    }
    return true;
}

bool runCompletionParsingChecks()
{
    const std::string output = "COMPLETION: WriteLine : [#void#]WriteLine(<#const Args &args...#>) const\n"
                               "COMPLETION: Write : [#void#]Write(<#const Args &args...#>) const\n"
                               "COMPLETION: value : [#int#]value\n"
                               "COMPLETION: Pattern : static_cast<<#type#>>(<#expression#>)\n"
                               "COMPLETION: int\n"
                               "COMPLETION: ConsoleWriter : ConsoleWriter::\n"
                               "COMPLETION: Secret (Hidden) : [#int#]Secret\n"
                               "unrelated line\n";
    const auto items = tryrun::parseClangCompletions(output);
    if (items.size() != 7)
    {
        std::cerr << "expected 7 completion items, got " << items.size() << "\n";
        return false;
    }

    if (items[0].displayText != "WriteLine" || items[0].kind != "Method" || items[0].sortText != "000000" ||
        items[0].insertText != "WriteLine" || items[0].filterText != "WriteLine" ||
        items[0].documentation != "void WriteLine(const Args &args...) const")
    {
        std::cerr << "method completion mismatch: " << items[0].documentation << "\n";
        return false;
    }
    if (items[1].displayText != "Write" || items[1].sortText != "000001")
    {
        std::cerr << "completion order should follow the toolchain\n";
        return false;
    }
    if (items[2].kind != "Field" || items[2].documentation != "int value")
    {
        std::cerr << "typed non-call completion should be a field\n";
        return false;
    }
    if (items[3].kind != "Snippet" || items[3].displayText != "static_cast<type>" ||
        items[3].documentation != "static_cast<type>(expression)")
    {
        std::cerr << "pattern completion mismatch: " << items[3].displayText << "\n";
        return false;
    }
    if (items[4].kind != "Keyword" || items[4].displayText != "int")
    {
        std::cerr << "bare completion should be a keyword\n";
        return false;
    }
    if (items[5].kind != "Class")
    {
        std::cerr << "untyped named completion should be a class\n";
        return false;
    }
    if (items[6].displayText != "Secret")
    {
        std::cerr << "hidden marker should be stripped\n";
        return false;
    }
    return true;
}

bool runExceptionMarkerChecks()
{
    const auto reported = tryrun::findReportedException(
        "noise\n" + std::string(tryrun::ExceptionMarker) + "std::runtime_error: boom\nmore noise\n");
    if (!reported || *reported != "std::runtime_error: boom")
    {
        std::cerr << "exception marker should be found in standard error\n";
        return false;
    }
    if (tryrun::findReportedException("Segmentation fault\n"))
    {
        std::cerr << "no marker should mean no reported exception\n";
        return false;
    }
    return true;
}

bool runMissingCompilerChecks()
{
    tryrun::ToolchainOptions options;
    options.compilerPath = "/nonexistent/tryrun-test-clang++";
    tryrun::ClangToolchain toolchain(options);

    tryrun::Workspace workspace;
    workspace.buffers.push_back(tryrun::Buffer{"", "int x = 1;", std::nullopt});
    auto unit = tryrun::CompilerAdapter::assemble(workspace);
    if (!unit)
    {
        std::cerr << "unexpected assembly failure: " << llvm::toString(unit.takeError()) << "\n";
        return false;
    }

    tryrun::CompileRequest request;
    request.unit = &*unit;
    auto outcome = toolchain.compile(request, {});
    if (outcome)
    {
        std::cerr << "missing compiler should fail to launch\n";
        return false;
    }
    std::string message;
    if (tryrun::classifyError(outcome.takeError(), message) != tryrun::ErrorKind::ToolchainFailure)
    {
        std::cerr << "missing compiler should be a toolchain failure: " << message << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runClangOutputParsingTests()
{
    bool ok = true;
    ok      = runDiagnosticParsingChecks() && ok;
    ok      = runCompletionParsingChecks() && ok;
    ok      = runExceptionMarkerChecks() && ok;
    ok      = runMissingCompilerChecks() && ok;
    return ok;
}
