//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error taxonomy for the language-intelligence client engine.
///
/// Every failure surfaced by a client or the router is an `llvm::Error`
/// carrying a `ClientError` payload, so callers can branch on the condition
/// while still getting a printable message naming operation and target.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_SUPPORT_CLIENT_ERROR_H
#define FSMCP_SUPPORT_CLIENT_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>

namespace fsmcp
{

/// @brief Failure condition reported by the client engine.
enum class ClientErrorKind
{
    /// @brief The analysis server process could not be started.
    LaunchFailure,

    /// @brief The `initialize` exchange timed out or was rejected.
    HandshakeFailure,

    /// @brief The client is not in the `Ready` state.
    NotReady,

    /// @brief A request exceeded its deadline.
    Timeout,

    /// @brief A message could not be framed or parsed.
    ProtocolError,

    /// @brief The server answered with an explicit error response.
    RemoteError,

    /// @brief The server process went away while the request was pending.
    Unavailable,

    /// @brief Caller supplied an unusable argument.
    InvalidArgument,

    /// @brief Document content could not be read or written.
    StorageFailure,
};

/// @brief Returns a stable lowercase name for an error kind.
/// @param[in] kind Error kind.
/// @return Kind name such as `timeout`.
[[nodiscard]] llvm::StringRef clientErrorKindName(ClientErrorKind kind);

/// @brief `llvm::ErrorInfo` payload for client engine failures.
class ClientError final : public llvm::ErrorInfo<ClientError>
{
public:
    static char ID;

    /// @brief Creates an error payload.
    /// @param[in] kind Failure condition.
    /// @param[in] message Human-readable description.
    /// @param[in] remoteCode JSON-RPC error code for `RemoteError`.
    ClientError(ClientErrorKind kind, std::string message, std::int64_t remoteCode = 0);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    [[nodiscard]] ClientErrorKind kind() const
    {
        return kind_;
    }

    /// @brief Description without the remote code suffix `message()` adds.
    [[nodiscard]] const std::string& detail() const
    {
        return detail_;
    }

    [[nodiscard]] std::int64_t remoteCode() const
    {
        return remoteCode_;
    }

private:
    ClientErrorKind kind_;
    std::string     detail_;
    std::int64_t    remoteCode_{0};
};

/// @brief Convenience constructor for a `ClientError`.
/// @param[in] kind Failure condition.
/// @param[in] message Human-readable description.
/// @param[in] remoteCode JSON-RPC error code for `RemoteError`.
/// @return Error owning a `ClientError` payload.
[[nodiscard]] llvm::Error makeClientError(ClientErrorKind kind, std::string message, std::int64_t remoteCode = 0);

/// @brief Prefixes an error with operation and target context.
///
/// `ClientError` payloads keep their kind and remote code; any other payload
/// is converted into a `ClientError` of `fallbackKind`.
///
/// @param[in] error Error to annotate. Must be a failure.
/// @param[in] operation Operation name, for example `textDocument/completion`.
/// @param[in] target Target path.
/// @param[in] fallbackKind Kind assigned to foreign payloads.
/// @return Annotated error.
[[nodiscard]] llvm::Error withContext(llvm::Error     error,
                                      llvm::StringRef operation,
                                      llvm::StringRef target,
                                      ClientErrorKind fallbackKind = ClientErrorKind::ProtocolError);

/// @brief Consumes an error and returns its `ClientError` kind.
/// @param[in] error Error to inspect. Must be a failure.
/// @return Kind of the first `ClientError` payload, or `ProtocolError`.
[[nodiscard]] ClientErrorKind takeClientErrorKind(llvm::Error error);

}  // namespace fsmcp

#endif  // FSMCP_SUPPORT_CLIENT_ERROR_H
