//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Compile/Toolchain.h"

namespace tryrun
{

OutputBuffer::OutputBuffer(const std::size_t maxBytes)
    : maxBytes_(maxBytes)
{
}

void OutputBuffer::append(const llvm::StringRef chunk)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t           room = maxBytes_ > text_.size() ? maxBytes_ - text_.size() : 0;
    if (chunk.size() > room)
    {
        truncated_ = true;
    }
    const llvm::StringRef kept = chunk.take_front(room);
    text_.append(kept.data(), kept.size());
}

std::string OutputBuffer::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return text_;
}

bool OutputBuffer::truncated() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return truncated_;
}

}  // namespace tryrun
