//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error taxonomy carried through `llvm::Error` across the pipeline.
///
/// Compilation failures and runtime faults are not errors; they are recovered
/// into the run result. Everything that changes the transport status is an
/// error of one of the kinds below.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SUPPORT_ERROR_H
#define TRYRUN_SUPPORT_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <string>
#include <system_error>

namespace tryrun
{

/// @brief Error classes surfaced at the service boundary.
enum class ErrorKind
{
    /// @brief Payload is unparseable or lacks required fields.
    MalformedRequest,

    /// @brief Completion position lies outside the buffer.
    InvalidPosition,

    /// @brief Compilation or run setup exceeded the infrastructure budget.
    InfrastructureTimeout,

    /// @brief Submitted code exceeded the user-code budget.
    UserCodeTimeout,

    /// @brief The compiler toolchain could not be launched or misbehaved.
    ToolchainFailure,

    /// @brief The hosting scheduler cancelled the request.
    Cancelled,
};

/// @brief Returns a stable lower-case name for an error kind.
[[nodiscard]] llvm::StringRef errorKindName(ErrorKind kind);

/// @brief `llvm::ErrorInfo` payload tagged with an `ErrorKind`.
class PipelineError final : public llvm::ErrorInfo<PipelineError>
{
public:
    static char ID;

    PipelineError(ErrorKind kind, std::string message);

    [[nodiscard]] ErrorKind kind() const
    {
        return kind_;
    }

    /// @brief Message text without the kind prefix that `log` adds.
    [[nodiscard]] const std::string& text() const
    {
        return message_;
    }

    void                          log(llvm::raw_ostream& os) const override;
    [[nodiscard]] std::error_code convertToErrorCode() const override;

private:
    ErrorKind   kind_;
    std::string message_;
};

/// @brief Creates a `PipelineError`.
[[nodiscard]] llvm::Error makePipelineError(ErrorKind kind, const llvm::Twine& message);

/// @brief Consumes `error`, returning its kind and message.
///
/// Errors that are not `PipelineError`s are classified as toolchain failures.
///
/// @param[in] error Error to consume.
/// @param[out] message Rendered error message.
/// @return Classified error kind.
ErrorKind classifyError(llvm::Error error, std::string& message);

}  // namespace tryrun

#endif  // TRYRUN_SUPPORT_ERROR_H
