//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Cooperative cancellation tokens shared by the scheduler, sandbox, and
/// toolchain subprocesses.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SUPPORT_CANCELLATION_H
#define TRYRUN_SUPPORT_CANCELLATION_H

#include <atomic>
#include <memory>

namespace tryrun
{

/// @brief Read-only view of a cancellation flag.
///
/// A default-constructed token is never cancelled.
class CancellationToken final
{
public:
    CancellationToken() = default;

    /// @brief Returns whether cancellation has been requested.
    /// @return `true` when cancellation is requested.
    [[nodiscard]] bool isCancellationRequested() const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic_bool> state);

    std::shared_ptr<std::atomic_bool> state_;
};

/// @brief Owner side of a cancellation flag.
class CancellationSource final
{
public:
    CancellationSource();

    /// @brief Returns a token observing this source.
    [[nodiscard]] CancellationToken token() const;

    /// @brief Requests cancellation for every token of this source.
    void cancel();

    /// @brief Returns whether `cancel` was called.
    [[nodiscard]] bool isCancellationRequested() const;

private:
    std::shared_ptr<std::atomic_bool> state_;
};

}  // namespace tryrun

#endif  // TRYRUN_SUPPORT_CANCELLATION_H
