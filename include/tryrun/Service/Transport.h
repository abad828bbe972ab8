//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Stdio framing utilities for the execution daemon.
///
/// Request and response envelopes are encoded with `Content-Length` framing
/// over stdio and decoded into LLVM JSON values.
///
//===----------------------------------------------------------------------===//
#ifndef TRYRUN_SERVICE_TRANSPORT_H
#define TRYRUN_SERVICE_TRANSPORT_H

#include "llvm/Support/JSON.h"

#include <iosfwd>
#include <mutex>
#include <string>

namespace tryrun::service
{

/// @brief Result of reading one framed message.
enum class ReadStatus
{
    /// @brief A full message was read and parsed.
    Message,

    /// @brief The input stream ended before another header block.
    EndOfStream,

    /// @brief Framing or JSON parsing failed; the stream may continue.
    Malformed,
};

/// @brief Stdio transport with `Content-Length` framing.
class StdioTransport final
{
public:
    /// @brief Creates a transport over input and output streams.
    /// @param[in] in Input stream.
    /// @param[in] out Output stream.
    StdioTransport(std::istream& in, std::ostream& out);

    /// @brief Reads one framed message.
    /// @param[out] message Parsed JSON payload.
    /// @param[out] error Parsing/framing error text when read fails.
    /// @return Read status.
    [[nodiscard]] ReadStatus readMessage(llvm::json::Value& message, std::string& error);

    /// @brief Writes one framed message. Safe to call from worker threads.
    /// @param[in] message JSON payload to write.
    /// @return `true` when write succeeds.
    [[nodiscard]] bool writeMessage(const llvm::json::Value& message);

private:
    std::istream& input_;
    std::ostream& output_;
    std::mutex    writeMutex_;
};

}  // namespace tryrun::service

#endif  // TRYRUN_SERVICE_TRANSPORT_H
