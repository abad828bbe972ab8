//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection helpers.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Support/Diagnostics.h"

#include <iterator>
#include <utility>

namespace tryrun
{

llvm::StringRef severityName(const DiagnosticSeverity severity)
{
    switch (severity)
    {
    case DiagnosticSeverity::Hidden:
        return "Hidden";
    case DiagnosticSeverity::Info:
        return "Info";
    case DiagnosticSeverity::Warning:
        return "Warning";
    case DiagnosticSeverity::Error:
        return "Error";
    }
    return "Error";
}

llvm::StringRef severityLabel(const DiagnosticSeverity severity)
{
    switch (severity)
    {
    case DiagnosticSeverity::Hidden:
        return "hidden";
    case DiagnosticSeverity::Info:
        return "info";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Error:
        return "error";
    }
    return "error";
}

void DiagnosticEngine::report(const DiagnosticSeverity  severity,
                              std::string               id,
                              std::optional<SourceSpan> span,
                              std::string               message)
{
    Diagnostic diagnostic;
    diagnostic.severity = severity;
    diagnostic.id       = std::move(id);
    diagnostic.message  = std::move(message);
    diagnostic.span     = span;
    diagnostics_.push_back(std::move(diagnostic));
}

void DiagnosticEngine::error(std::string id, std::optional<SourceSpan> span, std::string message)
{
    report(DiagnosticSeverity::Error, std::move(id), span, std::move(message));
}

void DiagnosticEngine::warning(std::string id, std::optional<SourceSpan> span, std::string message)
{
    report(DiagnosticSeverity::Warning, std::move(id), span, std::move(message));
}

void DiagnosticEngine::append(std::vector<Diagnostic> diagnostics)
{
    diagnostics_.insert(diagnostics_.end(),
                        std::make_move_iterator(diagnostics.begin()),
                        std::make_move_iterator(diagnostics.end()));
}

bool DiagnosticEngine::hasErrors() const
{
    return containsErrors(diagnostics_);
}

std::vector<Diagnostic> DiagnosticEngine::take()
{
    std::vector<Diagnostic> out;
    out.swap(diagnostics_);
    return out;
}

bool containsErrors(const std::vector<Diagnostic>& diagnostics)
{
    for (const Diagnostic& d : diagnostics)
    {
        if (d.severity == DiagnosticSeverity::Error)
        {
            return true;
        }
    }
    return false;
}

}  // namespace tryrun
