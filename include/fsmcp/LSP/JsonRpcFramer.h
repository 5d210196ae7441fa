//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Incremental `Content-Length` framing for JSON-RPC byte streams.
///
/// Bytes arrive from a subprocess pipe in arbitrary chunks. The framer
/// buffers them and yields complete payloads one at a time, independent of
/// how headers and payloads were split across reads.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_JSON_RPC_FRAMER_H
#define FSMCP_LSP_JSON_RPC_FRAMER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <string>
#include <vector>

namespace fsmcp::lsp
{

/// @brief Outcome of one framer extraction step.
enum class FrameResult
{
    /// @brief No complete message is buffered yet.
    NeedMoreData,

    /// @brief One complete payload was extracted.
    Payload,

    /// @brief A header block was unusable and has been discarded.
    MalformedHeader,
};

/// @brief Reassembles framed payloads from a chunked byte stream.
class JsonRpcFramer final
{
public:
    /// @brief Upper bound for a header block without its terminator.
    static constexpr std::size_t MaxHeaderBytes = 8192U;

    /// @brief Upper bound accepted for a declared payload length.
    static constexpr std::size_t MaxPayloadBytes = 256U * 1024U * 1024U;

    /// @brief Appends raw bytes read from the stream.
    /// @param[in] chunk Received bytes.
    void append(llvm::StringRef chunk);

    /// @brief Extracts the next complete payload.
    /// @param[out] payload Payload text when `Payload` is returned.
    /// @param[out] error Description when `MalformedHeader` is returned.
    /// @return Extraction outcome. Call again until `NeedMoreData`.
    [[nodiscard]] FrameResult next(std::string& payload, std::string& error);

    /// @brief Extracts every complete payload, skipping malformed headers.
    /// @param[out] errors Optional sink for malformed-header descriptions.
    /// @return Complete payloads in stream order.
    [[nodiscard]] std::vector<std::string> drain(std::vector<std::string>* errors = nullptr);

    /// @brief Returns the number of buffered, not yet consumed bytes.
    [[nodiscard]] std::size_t bufferedBytes() const
    {
        return buffer_.size();
    }

    /// @brief Drops all buffered bytes.
    void reset();

private:
    std::string buffer_;
};

/// @brief Serializes and frames one JSON-RPC message.
/// @param[in] message JSON payload.
/// @return `Content-Length: <n>\r\n\r\n<payload>` bytes.
[[nodiscard]] std::string encodeMessage(const llvm::json::Value& message);

/// @brief Parses one payload into JSON.
/// @param[in] payload Payload text.
/// @param[out] message Parsed message.
/// @param[out] error Parse error text when parsing fails.
/// @return `true` when the payload is valid JSON.
[[nodiscard]] bool parsePayload(llvm::StringRef payload, llvm::json::Value& message, std::string& error);

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_JSON_RPC_FRAMER_H
