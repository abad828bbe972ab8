//===----------------------------------------------------------------------===//
///
/// @file
/// Line/column primitives and offset conversions for source text.
///
/// Internal offsets count UTF-8 bytes. Offsets exchanged with callers count
/// characters (Unicode code points).
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SUPPORT_SOURCE_LOCATION_H
#define TRYRUN_SUPPORT_SOURCE_LOCATION_H

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace tryrun
{

/// @brief Identifies a concrete position in a named piece of source text.
struct SourceLocation
{
    /// @brief Buffer id or file name; may be empty.
    std::string file;

    /// @brief 1-based source line.
    std::uint32_t line{1};

    /// @brief 1-based source column, in the unit of the producing call.
    std::uint32_t column{1};

    /// @brief Formats this location as `file(line,col)`.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

/// @brief Computes the line/column of `offset` within `text`.
/// @param[in] text Source text.
/// @param[in] offset Byte offset, clamped to the text size.
/// @param[in] file Name recorded in the result.
/// @return 1-based location.
[[nodiscard]] SourceLocation locate(llvm::StringRef text, std::size_t offset, std::string file = {});

/// @brief Converts a 1-based line/column into a byte offset within `text`.
///
/// A column one past the end of a line addresses the line terminator.
///
/// @return Offset, or `std::nullopt` when the line does not exist.
[[nodiscard]] std::optional<std::size_t> offsetOf(llvm::StringRef text, std::uint32_t line, std::uint32_t column);

/// @brief Returns the number of characters in UTF-8 `text`.
[[nodiscard]] std::size_t characterCount(llvm::StringRef text);

/// @brief Converts a byte offset into a character offset.
///
/// An offset inside a multibyte sequence resolves to the character that
/// sequence encodes. Offsets past the end clamp to the character count.
[[nodiscard]] std::size_t toCharacterOffset(llvm::StringRef text, std::size_t byteOffset);

/// @brief Converts a character offset into a byte offset.
/// @return Byte offset, or `std::nullopt` past the last character.
[[nodiscard]] std::optional<std::size_t> toByteOffset(llvm::StringRef text, std::size_t characterOffset);

/// @brief Like `locate`, for a character offset and with character columns.
[[nodiscard]] SourceLocation locateCharacter(llvm::StringRef text, std::size_t characterOffset, std::string file = {});

}  // namespace tryrun

#endif  // TRYRUN_SUPPORT_SOURCE_LOCATION_H
