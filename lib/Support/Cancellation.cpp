//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "tryrun/Support/Cancellation.h"

#include <utility>

namespace tryrun
{

CancellationToken::CancellationToken(std::shared_ptr<std::atomic_bool> state)
    : state_(std::move(state))
{
}

bool CancellationToken::isCancellationRequested() const
{
    return state_ && state_->load(std::memory_order_relaxed);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<std::atomic_bool>(false))
{
}

CancellationToken CancellationSource::token() const
{
    return CancellationToken(state_);
}

void CancellationSource::cancel()
{
    state_->store(true, std::memory_order_relaxed);
}

bool CancellationSource::isCancellationRequested() const
{
    return state_->load(std::memory_order_relaxed);
}

}  // namespace tryrun
