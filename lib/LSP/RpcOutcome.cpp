//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request outcome conversions.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/RpcOutcome.h"

#include <utility>

namespace fsmcp::lsp
{

llvm::StringRef rpcStatusName(const RpcStatus status)
{
    switch (status)
    {
    case RpcStatus::Ok:
        return "ok";
    case RpcStatus::RemoteError:
        return "remote-error";
    case RpcStatus::Timeout:
        return "timeout";
    case RpcStatus::Unavailable:
        return "unavailable";
    case RpcStatus::NotReady:
        return "not-ready";
    case RpcStatus::ProtocolError:
        return "protocol-error";
    }
    return "unknown";
}

ClientErrorKind toClientErrorKind(const RpcStatus status)
{
    switch (status)
    {
    case RpcStatus::RemoteError:
        return ClientErrorKind::RemoteError;
    case RpcStatus::Timeout:
        return ClientErrorKind::Timeout;
    case RpcStatus::Unavailable:
        return ClientErrorKind::Unavailable;
    case RpcStatus::NotReady:
        return ClientErrorKind::NotReady;
    case RpcStatus::Ok:
    case RpcStatus::ProtocolError:
        break;
    }
    return ClientErrorKind::ProtocolError;
}

llvm::Expected<llvm::json::Value> takeResult(RpcOutcome outcome)
{
    if (outcome.ok())
    {
        return std::move(outcome.result);
    }
    return makeClientError(toClientErrorKind(outcome.status), std::move(outcome.errorMessage), outcome.errorCode);
}

}  // namespace fsmcp::lsp
