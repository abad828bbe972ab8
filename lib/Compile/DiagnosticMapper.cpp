//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Compile/DiagnosticMapper.h"

#include "tryrun/Support/SourceLocation.h"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace tryrun
{

DiagnosticMapper::DiagnosticMapper(const CompilationUnit& unit, const Workspace& workspace)
    : unit_(unit)
    , workspace_(workspace)
{
}

Diagnostic DiagnosticMapper::map(const Diagnostic& merged) const
{
    Diagnostic mapped = merged;
    mapped.location.clear();

    std::optional<MappedSpan> owner;
    if (merged.span)
    {
        owner = unit_.sourceMap.map(merged.span->start, merged.span->end);
    }
    if (!owner)
    {
        mapped.span         = SourceSpan{0, 0};
        mapped.attributable = false;
        return mapped;
    }

    const llvm::StringRef text = ownerText(owner->ownerId);
    const auto            limit =
        static_cast<std::uint32_t>(unit_.sourceMap.ownerLength(owner->ownerId).value_or(text.size()));
    const std::uint32_t   start = std::min(owner->span.start, limit);
    const std::uint32_t   end   = std::clamp(owner->span.end, start, limit);

    // Callers address their text in characters; the source map works in bytes.
    SourceSpan span;
    span.start          = static_cast<std::uint32_t>(toCharacterOffset(text, start));
    span.end            = static_cast<std::uint32_t>(toCharacterOffset(text, end));
    mapped.span         = span;
    mapped.location     = owner->ownerId;
    mapped.attributable = merged.attributable && owner->attributable;
    return mapped;
}

std::vector<Diagnostic> DiagnosticMapper::mapAll(const std::vector<Diagnostic>& merged) const
{
    std::vector<Diagnostic> mapped;
    mapped.reserve(merged.size());
    for (const Diagnostic& diagnostic : merged)
    {
        mapped.push_back(map(diagnostic));
    }
    return mapped;
}

std::string DiagnosticMapper::render(const Diagnostic& mapped) const
{
    const std::size_t    offset   = mapped.span ? mapped.span->start : 0;
    const SourceLocation location = locateCharacter(ownerText(mapped.location), offset, mapped.location);

    std::string line = location.str();
    line += ": ";
    line += severityLabel(mapped.severity).str();
    line += " ";
    line += mapped.id;
    line += ": ";
    line += mapped.message;
    return line;
}

std::string DiagnosticMapper::renderAll(const std::vector<Diagnostic>& mapped) const
{
    std::string text;
    for (const Diagnostic& diagnostic : mapped)
    {
        text += render(diagnostic);
        text += '\n';
    }
    return text;
}

llvm::StringRef DiagnosticMapper::ownerText(const llvm::StringRef ownerId) const
{
    if (const Buffer* buffer = workspace_.findBuffer(ownerId))
    {
        return buffer->content;
    }
    if (const WorkspaceFile* file = workspace_.findFile(ownerId))
    {
        return file->text;
    }
    return {};
}

}  // namespace tryrun
