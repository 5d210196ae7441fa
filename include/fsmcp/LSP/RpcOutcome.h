//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Completion record for one JSON-RPC request.
///
/// Outcomes travel through futures and callbacks as plain values and are
/// converted to `llvm::Error` only at the API boundary, where the caller is
/// guaranteed to inspect them.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_RPC_OUTCOME_H
#define FSMCP_LSP_RPC_OUTCOME_H

#include "fsmcp/Support/ClientError.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <string>

namespace fsmcp::lsp
{

/// @brief Completion status of a request.
enum class RpcStatus
{
    /// @brief The server answered with a result.
    Ok,

    /// @brief The server answered with an error object.
    RemoteError,

    /// @brief No answer arrived before the deadline.
    Timeout,

    /// @brief The connection went away while the request was pending.
    Unavailable,

    /// @brief The client was not ready to issue the request.
    NotReady,

    /// @brief The request could not be written to the stream.
    ProtocolError,
};

/// @brief Completion record for one request. Produced exactly once.
struct RpcOutcome final
{
    /// @brief Completion status.
    RpcStatus status{RpcStatus::Ok};

    /// @brief Result payload for `Ok`.
    llvm::json::Value result{nullptr};

    /// @brief Remote error code for `RemoteError`.
    std::int64_t errorCode{0};

    /// @brief Human-readable failure description.
    std::string errorMessage;

    [[nodiscard]] bool ok() const
    {
        return status == RpcStatus::Ok;
    }
};

/// @brief Returns a stable lowercase name for a status.
[[nodiscard]] llvm::StringRef rpcStatusName(RpcStatus status);

/// @brief Maps a request status onto the error taxonomy.
[[nodiscard]] ClientErrorKind toClientErrorKind(RpcStatus status);

/// @brief Converts an outcome into its result or a `ClientError`.
/// @param[in] outcome Completed outcome.
/// @return Result payload or error.
[[nodiscard]] llvm::Expected<llvm::json::Value> takeResult(RpcOutcome outcome);

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_RPC_OUTCOME_H
