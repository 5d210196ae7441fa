//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements incremental `Content-Length` framing.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/JsonRpcFramer.h"

#include "llvm/Support/raw_ostream.h"

#include <tuple>
#include <utility>

namespace fsmcp::lsp
{
namespace
{

constexpr llvm::StringRef HeaderTerminator = "\r\n\r\n";

bool parseContentLengthValue(llvm::StringRef value, std::size_t& contentLength)
{
    value = value.trim();
    if (value.empty())
    {
        return false;
    }
    std::size_t parsed = 0;
    for (const char ch : value)
    {
        if (ch < '0' || ch > '9')
        {
            return false;
        }
        parsed = parsed * 10U + static_cast<std::size_t>(ch - '0');
        if (parsed > JsonRpcFramer::MaxPayloadBytes)
        {
            return false;
        }
    }
    contentLength = parsed;
    return true;
}

bool parseHeaderBlock(llvm::StringRef block, std::size_t& contentLength, std::string& error)
{
    bool sawLength = false;
    while (!block.empty())
    {
        llvm::StringRef line;
        std::tie(line, block) = block.split("\r\n");
        if (line.empty())
        {
            continue;
        }

        const auto [name, value] = line.split(':');
        if (name.size() == line.size())
        {
            error = "malformed header line '" + line.str() + "'";
            return false;
        }
        if (name.trim().equals_insensitive("Content-Length"))
        {
            if (!parseContentLengthValue(value, contentLength))
            {
                error = "invalid Content-Length value '" + value.trim().str() + "'";
                return false;
            }
            sawLength = true;
        }
    }

    if (!sawLength)
    {
        error = "missing Content-Length header";
        return false;
    }
    return true;
}

}  // namespace

void JsonRpcFramer::append(const llvm::StringRef chunk)
{
    buffer_.append(chunk.data(), chunk.size());
}

FrameResult JsonRpcFramer::next(std::string& payload, std::string& error)
{
    const std::size_t headerEnd = buffer_.find(HeaderTerminator.data(), 0, HeaderTerminator.size());
    if (headerEnd == std::string::npos)
    {
        if (buffer_.size() > MaxHeaderBytes)
        {
            error = "header block exceeds " + std::to_string(MaxHeaderBytes) + " bytes without terminator";
            buffer_.clear();
            return FrameResult::MalformedHeader;
        }
        return FrameResult::NeedMoreData;
    }

    std::size_t contentLength = 0U;
    if (!parseHeaderBlock(llvm::StringRef(buffer_.data(), headerEnd), contentLength, error))
    {
        buffer_.erase(0, headerEnd + HeaderTerminator.size());
        return FrameResult::MalformedHeader;
    }

    const std::size_t payloadStart = headerEnd + HeaderTerminator.size();
    if (buffer_.size() - payloadStart < contentLength)
    {
        return FrameResult::NeedMoreData;
    }

    payload.assign(buffer_, payloadStart, contentLength);
    buffer_.erase(0, payloadStart + contentLength);
    return FrameResult::Payload;
}

std::vector<std::string> JsonRpcFramer::drain(std::vector<std::string>* errors)
{
    std::vector<std::string> payloads;
    while (true)
    {
        std::string       payload;
        std::string       error;
        const FrameResult result = next(payload, error);
        if (result == FrameResult::NeedMoreData)
        {
            break;
        }
        if (result == FrameResult::MalformedHeader)
        {
            if (errors)
            {
                errors->push_back(std::move(error));
            }
            continue;
        }
        payloads.push_back(std::move(payload));
    }
    return payloads;
}

void JsonRpcFramer::reset()
{
    buffer_.clear();
}

std::string encodeMessage(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();

    std::string framed = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
    framed += payload;
    return framed;
}

bool parsePayload(const llvm::StringRef payload, llvm::json::Value& message, std::string& error)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(payload);
    if (!parsed)
    {
        error = "invalid JSON payload: " + llvm::toString(parsed.takeError());
        return false;
    }

    message = std::move(*parsed);
    return true;
}

}  // namespace fsmcp::lsp
