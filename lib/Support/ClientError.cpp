//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the client engine error payload and context helpers.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/Support/ClientError.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace fsmcp
{

char ClientError::ID = 0;

llvm::StringRef clientErrorKindName(const ClientErrorKind kind)
{
    switch (kind)
    {
    case ClientErrorKind::LaunchFailure:
        return "launch failure";
    case ClientErrorKind::HandshakeFailure:
        return "handshake failure";
    case ClientErrorKind::NotReady:
        return "not ready";
    case ClientErrorKind::Timeout:
        return "timeout";
    case ClientErrorKind::ProtocolError:
        return "protocol error";
    case ClientErrorKind::RemoteError:
        return "remote error";
    case ClientErrorKind::Unavailable:
        return "unavailable";
    case ClientErrorKind::InvalidArgument:
        return "invalid argument";
    case ClientErrorKind::StorageFailure:
        return "storage failure";
    }
    return "unknown";
}

ClientError::ClientError(const ClientErrorKind kind, std::string message, const std::int64_t remoteCode)
    : kind_(kind)
    , detail_(std::move(message))
    , remoteCode_(remoteCode)
{
}

void ClientError::log(llvm::raw_ostream& os) const
{
    os << detail_;
    if (kind_ == ClientErrorKind::RemoteError)
    {
        os << " (code " << remoteCode_ << ")";
    }
}

std::error_code ClientError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeClientError(const ClientErrorKind kind, std::string message, const std::int64_t remoteCode)
{
    return llvm::make_error<ClientError>(kind, std::move(message), remoteCode);
}

llvm::Error withContext(llvm::Error           error,
                        const llvm::StringRef operation,
                        const llvm::StringRef target,
                        const ClientErrorKind fallbackKind)
{
    const std::string prefix = operation.str() + " failed for '" + target.str() + "': ";

    ClientErrorKind kind       = fallbackKind;
    std::int64_t    remoteCode = 0;
    std::string     detail;
    llvm::handleAllErrors(
        std::move(error),
        [&](const ClientError& clientError) {
            kind       = clientError.kind();
            remoteCode = clientError.remoteCode();
            detail     = clientError.detail();
        },
        [&](const llvm::ErrorInfoBase& other) { detail = other.message(); });
    return makeClientError(kind, prefix + detail, remoteCode);
}

ClientErrorKind takeClientErrorKind(llvm::Error error)
{
    ClientErrorKind kind = ClientErrorKind::ProtocolError;
    llvm::handleAllErrors(
        std::move(error),
        [&kind](const ClientError& clientError) { kind = clientError.kind(); },
        [](const llvm::ErrorInfoBase&) {});
    return kind;
}

}  // namespace fsmcp
