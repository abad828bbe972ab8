//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Offset-translation table between merged compiler input and caller sources.
///
/// The merged translation unit is a concatenation of segments. Each segment
/// either copies a contiguous run of a buffer or file, or is scaffolding
/// synthesized by assembly. The table is built while the text is assembled
/// and is the only source of truth for coordinate translation.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_WORKSPACE_SOURCE_MAP_H
#define TRYRUN_WORKSPACE_SOURCE_MAP_H

#include "tryrun/Support/Diagnostics.h"
#include "tryrun/Workspace/Workspace.h"

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tryrun
{

/// @brief Where the text of a segment came from.
enum class SegmentOrigin
{
    /// @brief Caller buffer content.
    Buffer,

    /// @brief Auxiliary workspace file content.
    File,

    /// @brief Text synthesized during assembly.
    Scaffolding,
};

/// @brief One contiguous run of merged text.
struct SourceSegment
{
    /// @brief Start of the run in merged coordinates.
    std::size_t mergedOffset{0};

    /// @brief Run length in bytes.
    std::size_t length{0};

    /// @brief Text origin.
    SegmentOrigin origin{SegmentOrigin::Scaffolding};

    /// @brief Buffer id or file name; empty for scaffolding.
    std::string ownerId;

    /// @brief Start of the run in owner coordinates.
    std::size_t ownerOffset{0};

    [[nodiscard]] std::size_t mergedEnd() const
    {
        return mergedOffset + length;
    }

    [[nodiscard]] bool owned() const
    {
        return origin != SegmentOrigin::Scaffolding;
    }
};

/// @brief A merged span translated into owner coordinates.
struct MappedSpan
{
    /// @brief Owning buffer id or file name.
    std::string ownerId;

    /// @brief Owner kind.
    SegmentOrigin origin{SegmentOrigin::Buffer};

    /// @brief Half-open span in owner coordinates.
    SourceSpan span;

    /// @brief False when the span was moved onto an owner it does not follow.
    bool attributable{true};
};

/// @brief Ordered segment table for one merged translation unit.
class SourceMap final
{
public:
    /// @brief Appends a segment; segments must be added in merged order.
    void addSegment(SourceSegment segment);

    /// @brief Records the full length of an owner's original text.
    void setOwnerLength(llvm::StringRef ownerId, std::size_t length);

    /// @brief Returns the recorded length of an owner's original text.
    [[nodiscard]] std::optional<std::size_t> ownerLength(llvm::StringRef ownerId) const;

    /// @brief Returns segments in merged order.
    [[nodiscard]] const std::vector<SourceSegment>& segments() const
    {
        return segments_;
    }

    /// @brief Translates a merged span into owner coordinates.
    ///
    /// An offset equal to a segment's end belongs to that segment. Spans that
    /// start in scaffolding clamp to the end of the nearest preceding owned
    /// segment, or, in leading scaffolding, to the start of the next one with
    /// `attributable` cleared. The end is clamped into the start's segment.
    ///
    /// @return Owner span, or `std::nullopt` when the unit has no owned text.
    [[nodiscard]] std::optional<MappedSpan> map(std::size_t start, std::size_t end) const;

    /// @brief Translates an owner offset into merged coordinates.
    ///
    /// When an owner is split into several runs, the run containing the
    /// offset wins over the one ending at it.
    ///
    /// @return Merged offset, or `std::nullopt` when the offset was not copied.
    [[nodiscard]] std::optional<std::size_t> toMerged(llvm::StringRef ownerId, std::size_t ownerOffset) const;

private:
    std::vector<SourceSegment>                   segments_;
    std::unordered_map<std::string, std::size_t> ownerLengths_;
};

/// @brief Builds merged text and its source map side by side.
class SourceAssembler final
{
public:
    /// @brief Appends synthesized text.
    void appendScaffolding(llvm::StringRef text);

    /// @brief Appends a run copied from a buffer or file.
    /// @param[in] origin `Buffer` or `File`.
    /// @param[in] ownerId Owning buffer id or file name.
    /// @param[in] text Copied text.
    /// @param[in] ownerOffset Offset of `text` inside the owner.
    void appendOwned(SegmentOrigin origin, llvm::StringRef ownerId, llvm::StringRef text, std::size_t ownerOffset = 0);

    /// @brief Appends a newline unless the text already ends with one.
    void ensureNewline();

    /// @brief Current merged length.
    [[nodiscard]] std::size_t size() const
    {
        return text_.size();
    }

    /// @brief Merged text assembled so far.
    [[nodiscard]] llvm::StringRef text() const
    {
        return text_;
    }

    [[nodiscard]] SourceMap& sourceMap()
    {
        return map_;
    }

    /// @brief Moves the merged text out.
    [[nodiscard]] std::string takeText();

    /// @brief Moves the source map out.
    [[nodiscard]] SourceMap takeSourceMap();

private:
    std::string text_;
    SourceMap   map_;
};

/// @brief How assembled text is laid out for the compiler.
enum class CompileStrategy
{
    /// @brief Buffers wrapped in a synthetic entry point.
    Script,

    /// @brief Buffers compiled as top-level code.
    Program,
};

/// @brief Merged translation unit handed to a toolchain.
struct CompilationUnit
{
    /// @brief Mode requested by the caller.
    WorkspaceMode mode{WorkspaceMode::Script};

    /// @brief Layout selected by assembly.
    CompileStrategy strategy{CompileStrategy::Script};

    /// @brief True when the merged text defines an entry point.
    bool hasEntryPoint{false};

    /// @brief Merged source text.
    std::string text;

    /// @brief Offset-translation table for `text`.
    SourceMap sourceMap;

    /// @brief Id of the first buffer; anchor for unit-level diagnostics.
    std::string primaryOwnerId;

    /// @brief Name the merged text is compiled under.
    std::string fileName{"main.cpp"};
};

}  // namespace tryrun

#endif  // TRYRUN_WORKSPACE_SOURCE_MAP_H
