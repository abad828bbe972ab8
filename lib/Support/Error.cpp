//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the pipeline error payload and classification helpers.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Support/Error.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace tryrun
{

char PipelineError::ID = 0;

llvm::StringRef errorKindName(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::MalformedRequest:
        return "malformed_request";
    case ErrorKind::InvalidPosition:
        return "invalid_position";
    case ErrorKind::InfrastructureTimeout:
        return "infrastructure_timeout";
    case ErrorKind::UserCodeTimeout:
        return "user_code_timeout";
    case ErrorKind::ToolchainFailure:
        return "toolchain_failure";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

PipelineError::PipelineError(const ErrorKind kind, std::string message)
    : kind_(kind)
    , message_(std::move(message))
{
}

void PipelineError::log(llvm::raw_ostream& os) const
{
    os << errorKindName(kind_) << ": " << message_;
}

std::error_code PipelineError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makePipelineError(const ErrorKind kind, const llvm::Twine& message)
{
    return llvm::make_error<PipelineError>(kind, message.str());
}

ErrorKind classifyError(llvm::Error error, std::string& message)
{
    ErrorKind kind = ErrorKind::ToolchainFailure;
    message.clear();
    llvm::handleAllErrors(
        std::move(error),
        [&kind, &message](const PipelineError& pipelineError) {
            kind    = pipelineError.kind();
            message = pipelineError.text();
        },
        [&message](const llvm::ErrorInfoBase& other) { message = other.message(); });
    return kind;
}

}  // namespace tryrun
