//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framed stdio transport.
///
//===----------------------------------------------------------------------===//

#include "tryrun/Service/Transport.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace tryrun::service
{
namespace
{

/// Returns the declared length, or nullopt when the line is not a length header.
std::optional<std::size_t> parseContentLengthHeader(const std::string& line)
{
    llvm::StringRef header = line;
    const auto      colon  = header.find(':');
    if (colon == llvm::StringRef::npos || !header.take_front(colon).trim().equals_insensitive("Content-Length"))
    {
        return std::nullopt;
    }
    const llvm::StringRef digits = header.drop_front(colon + 1).trim();
    if (digits.empty())
    {
        return std::nullopt;
    }
    std::size_t value = 0;
    for (const char ch : digits)
    {
        if (ch < '0' || ch > '9')
        {
            return std::nullopt;
        }
        value = value * 10U + static_cast<std::size_t>(ch - '0');
    }
    return value;
}

}  // namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

ReadStatus StdioTransport::readMessage(llvm::json::Value& message, std::string& error)
{
    std::optional<std::size_t> contentLength;
    bool                       hasHeaders = false;
    std::string                line;
    while (std::getline(input_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            if (!hasHeaders)
            {
                continue;
            }
            break;
        }

        hasHeaders = true;
        if (const auto parsedLength = parseContentLengthHeader(line))
        {
            contentLength = parsedLength;
        }
    }

    if (!hasHeaders)
    {
        return ReadStatus::EndOfStream;
    }

    if (!contentLength)
    {
        error = "missing Content-Length header";
        return ReadStatus::Malformed;
    }

    std::string payload(*contentLength, '\0');
    input_.read(payload.data(), static_cast<std::streamsize>(*contentLength));
    if (input_.gcount() != static_cast<std::streamsize>(*contentLength))
    {
        error = "truncated message payload";
        return ReadStatus::EndOfStream;
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(payload);
    if (!parsed)
    {
        error = "invalid JSON payload: " + llvm::toString(parsed.takeError());
        return ReadStatus::Malformed;
    }

    message = std::move(*parsed);
    return ReadStatus::Message;
}

bool StdioTransport::writeMessage(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();

    std::lock_guard<std::mutex> lock(writeMutex_);
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    output_.flush();
    return static_cast<bool>(output_);
}

}  // namespace tryrun::service
