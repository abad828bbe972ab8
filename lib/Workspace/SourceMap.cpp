//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Workspace/SourceMap.h"

#include <algorithm>
#include <utility>

namespace tryrun
{
namespace
{

std::uint32_t narrow(const std::size_t value)
{
    return static_cast<std::uint32_t>(value);
}

MappedSpan spanIn(const SourceSegment& segment, const std::size_t start, const std::size_t end)
{
    const std::size_t clampedEnd = std::clamp(end, start, segment.mergedEnd());
    MappedSpan        mapped;
    mapped.ownerId    = segment.ownerId;
    mapped.origin     = segment.origin;
    mapped.span.start = narrow(segment.ownerOffset + (start - segment.mergedOffset));
    mapped.span.end   = narrow(segment.ownerOffset + (clampedEnd - segment.mergedOffset));
    return mapped;
}

MappedSpan collapsedAt(const SourceSegment& segment, const std::size_t ownerOffset, const bool attributable)
{
    MappedSpan mapped;
    mapped.ownerId      = segment.ownerId;
    mapped.origin       = segment.origin;
    mapped.span.start   = narrow(ownerOffset);
    mapped.span.end     = narrow(ownerOffset);
    mapped.attributable = attributable;
    return mapped;
}

}  // namespace

void SourceMap::addSegment(SourceSegment segment)
{
    segments_.push_back(std::move(segment));
}

void SourceMap::setOwnerLength(const llvm::StringRef ownerId, const std::size_t length)
{
    ownerLengths_[ownerId.str()] = length;
}

std::optional<std::size_t> SourceMap::ownerLength(const llvm::StringRef ownerId) const
{
    const auto it = ownerLengths_.find(ownerId.str());
    if (it == ownerLengths_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<MappedSpan> SourceMap::map(const std::size_t start, const std::size_t end) const
{
    // Strict containment wins over touching the end of the previous segment,
    // so the first byte of a buffer never maps to the run before it.
    const SourceSegment* touching = nullptr;
    for (const SourceSegment& segment : segments_)
    {
        if (!segment.owned())
        {
            continue;
        }
        if (start >= segment.mergedOffset && start < segment.mergedEnd())
        {
            return spanIn(segment, start, end);
        }
        if (start == segment.mergedEnd() && !touching)
        {
            touching = &segment;
        }
    }
    if (touching)
    {
        return spanIn(*touching, start, end);
    }

    const SourceSegment* preceding = nullptr;
    const SourceSegment* following = nullptr;
    for (const SourceSegment& segment : segments_)
    {
        if (!segment.owned())
        {
            continue;
        }
        if (segment.mergedEnd() <= start)
        {
            preceding = &segment;
        }
        else if (!following && segment.mergedOffset >= start)
        {
            following = &segment;
        }
    }
    if (preceding)
    {
        return collapsedAt(*preceding, preceding->ownerOffset + preceding->length, true);
    }
    if (following)
    {
        return collapsedAt(*following, following->ownerOffset, false);
    }
    return std::nullopt;
}

std::optional<std::size_t> SourceMap::toMerged(const llvm::StringRef ownerId, const std::size_t ownerOffset) const
{
    // A run that contains the offset wins over one that merely ends there.
    const SourceSegment* touching = nullptr;
    for (const SourceSegment& segment : segments_)
    {
        if (!segment.owned() || segment.ownerId != ownerId || ownerOffset < segment.ownerOffset)
        {
            continue;
        }
        if (ownerOffset < segment.ownerOffset + segment.length)
        {
            return segment.mergedOffset + (ownerOffset - segment.ownerOffset);
        }
        if (ownerOffset == segment.ownerOffset + segment.length && !touching)
        {
            touching = &segment;
        }
    }
    if (touching)
    {
        return touching->mergedEnd();
    }
    return std::nullopt;
}

void SourceAssembler::appendScaffolding(const llvm::StringRef text)
{
    if (text.empty())
    {
        return;
    }
    SourceSegment segment;
    segment.mergedOffset = text_.size();
    segment.length       = text.size();
    segment.origin       = SegmentOrigin::Scaffolding;
    text_.append(text.data(), text.size());
    map_.addSegment(std::move(segment));
}

void SourceAssembler::appendOwned(const SegmentOrigin   origin,
                                  const llvm::StringRef ownerId,
                                  const llvm::StringRef text,
                                  const std::size_t     ownerOffset)
{
    // Empty runs are kept so an empty buffer still has an anchor.
    SourceSegment segment;
    segment.mergedOffset = text_.size();
    segment.length       = text.size();
    segment.origin       = origin;
    segment.ownerId      = ownerId.str();
    segment.ownerOffset  = ownerOffset;
    text_.append(text.data(), text.size());
    map_.addSegment(std::move(segment));
}

void SourceAssembler::ensureNewline()
{
    if (!text_.empty() && text_.back() != '\n')
    {
        appendScaffolding("\n");
    }
}

std::string SourceAssembler::takeText()
{
    return std::move(text_);
}

SourceMap SourceAssembler::takeSourceMap()
{
    return std::move(map_);
}

}  // namespace tryrun
