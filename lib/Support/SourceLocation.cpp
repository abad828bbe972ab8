//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source-location rendering and line/column conversions.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Support/SourceLocation.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace tryrun
{
namespace
{

bool isContinuationByte(const char c)
{
    return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}

}  // namespace

std::string SourceLocation::str() const
{
    std::ostringstream out;
    out << file << '(' << line << ',' << column << ')';
    return out.str();
}

SourceLocation locate(const llvm::StringRef text, const std::size_t offset, std::string file)
{
    SourceLocation    location;
    const std::size_t end = std::min(offset, text.size());
    location.file         = std::move(file);
    for (std::size_t i = 0; i < end; ++i)
    {
        if (text[i] == '\n')
        {
            ++location.line;
            location.column = 1;
        }
        else
        {
            ++location.column;
        }
    }
    return location;
}

std::optional<std::size_t> offsetOf(const llvm::StringRef text, const std::uint32_t line, const std::uint32_t column)
{
    if (line == 0 || column == 0)
    {
        return std::nullopt;
    }

    std::size_t lineStart = 0;
    for (std::uint32_t current = 1; current < line; ++current)
    {
        const std::size_t newline = text.find('\n', lineStart);
        if (newline == llvm::StringRef::npos)
        {
            return std::nullopt;
        }
        lineStart = newline + 1;
    }

    std::size_t lineEnd = text.find('\n', lineStart);
    if (lineEnd == llvm::StringRef::npos)
    {
        lineEnd = text.size();
    }
    return std::min(lineStart + (column - 1), lineEnd);
}

std::size_t characterCount(const llvm::StringRef text)
{
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](const char c) {
        return !isContinuationByte(c);
    }));
}

std::size_t toCharacterOffset(const llvm::StringRef text, const std::size_t byteOffset)
{
    std::size_t end = std::min(byteOffset, text.size());
    while (end > 0 && end < text.size() && isContinuationByte(text[end]))
    {
        --end;
    }
    return characterCount(text.take_front(end));
}

std::optional<std::size_t> toByteOffset(const llvm::StringRef text, const std::size_t characterOffset)
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (isContinuationByte(text[i]))
        {
            continue;
        }
        if (seen == characterOffset)
        {
            return i;
        }
        ++seen;
    }
    if (seen == characterOffset)
    {
        return text.size();
    }
    return std::nullopt;
}

SourceLocation locateCharacter(const llvm::StringRef text, const std::size_t characterOffset, std::string file)
{
    const std::size_t end = toByteOffset(text, characterOffset).value_or(text.size());
    SourceLocation    location;
    location.file = std::move(file);
    for (std::size_t i = 0; i < end; ++i)
    {
        if (text[i] == '\n')
        {
            ++location.line;
            location.column = 1;
        }
        else if (!isContinuationByte(text[i]))
        {
            ++location.column;
        }
    }
    return location;
}

}  // namespace tryrun
