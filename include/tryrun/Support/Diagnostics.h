//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Diagnostic records produced by the toolchain and returned to callers.
///
/// The same record type is used in two coordinate spaces: the toolchain emits
/// spans in merged-unit offsets, and the diagnostic mapper rewrites them into
/// the caller's buffer offsets.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SUPPORT_DIAGNOSTICS_H
#define TRYRUN_SUPPORT_DIAGNOSTICS_H

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tryrun
{

/// @file
/// @brief Diagnostic collection and reporting interfaces.

/// @brief Severity level for a diagnostic message.
enum class DiagnosticSeverity
{
    /// @brief Suppressed detail, kept for completeness.
    Hidden,

    /// @brief Informational note.
    Info,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Returns the wire name of a severity (`Hidden`, `Info`, ...).
[[nodiscard]] llvm::StringRef severityName(DiagnosticSeverity severity);

/// @brief Returns the lower-case name used in rendered output lines.
[[nodiscard]] llvm::StringRef severityLabel(DiagnosticSeverity severity);

/// @brief Half-open span `[start, end)`; bytes of merged text before mapping,
///        characters of the owner text after.
struct SourceSpan
{
    /// @brief Inclusive start offset.
    std::uint32_t start{0};

    /// @brief Exclusive end offset.
    std::uint32_t end{0};

    [[nodiscard]] std::uint32_t length() const
    {
        return end - start;
    }

    friend bool operator==(const SourceSpan& lhs, const SourceSpan& rhs)
    {
        return lhs.start == rhs.start && lhs.end == rhs.end;
    }
};

/// @brief Single diagnostic record.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticSeverity severity{DiagnosticSeverity::Error};

    /// @brief Stable diagnostic identifier.
    std::string id;

    /// @brief Human-readable message text.
    std::string message;

    /// @brief Source span; absent for diagnostics without a location.
    std::optional<SourceSpan> span;

    /// @brief Owning buffer id or file name once mapped; empty otherwise.
    std::string location;

    /// @brief False when the diagnostic could not be tied to caller text.
    bool attributable{true};
};

/// @brief Accumulates diagnostics emitted while compiling one unit.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] severity Severity level.
    /// @param[in] id Stable diagnostic identifier.
    /// @param[in] span Optional source span.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticSeverity severity, std::string id, std::optional<SourceSpan> span, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(std::string id, std::optional<SourceSpan> span, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(std::string id, std::optional<SourceSpan> span, std::string message);

    /// @brief Appends already-built diagnostics in order.
    void append(std::vector<Diagnostic> diagnostics);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Returns all recorded diagnostics in insertion order.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

    /// @brief Moves the recorded diagnostics out of the engine.
    [[nodiscard]] std::vector<Diagnostic> take();

private:
    std::vector<Diagnostic> diagnostics_;
};

/// @brief Returns whether any diagnostic in `diagnostics` is an error.
[[nodiscard]] bool containsErrors(const std::vector<Diagnostic>& diagnostics);

}  // namespace tryrun

#endif  // TRYRUN_SUPPORT_DIAGNOSTICS_H
