//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Byte-stream connection to one analysis server.
///
/// The process client only sees this interface; subprocess management lives
/// in `ProcessTransport`, and tests substitute an in-memory implementation.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_TRANSPORT_H
#define FSMCP_LSP_TRANSPORT_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <functional>
#include <string>

namespace fsmcp::lsp
{

/// @brief Callbacks a transport invokes from its own threads.
struct TransportCallbacks final
{
    /// @brief Raw bytes read from the server's stdout.
    std::function<void(std::string chunk)> onData;

    /// @brief One line read from the server's stderr, without terminator.
    std::function<void(std::string line)> onStderr;

    /// @brief The stream ended. Invoked at most once.
    std::function<void(std::string reason)> onClosed;
};

/// @brief Abstract duplex connection to an analysis server.
class Transport
{
public:
    virtual ~Transport() = default;

    /// @brief Launches the server and begins delivering callbacks.
    /// @param[in] callbacks Callback set, kept until the transport stops.
    /// @return Error describing a launch failure.
    [[nodiscard]] virtual llvm::Error start(TransportCallbacks callbacks) = 0;

    /// @brief Queues bytes for the server's stdin without waiting for the server.
    /// @param[in] bytes Framed message bytes.
    /// @return Error when the stream is closed or the write fails.
    [[nodiscard]] virtual llvm::Error write(llvm::StringRef bytes) = 0;

    /// @brief Stops the server and releases its resources. Idempotent.
    virtual void terminate() = 0;

    /// @brief Returns whether the server is running.
    [[nodiscard]] virtual bool running() const = 0;

    /// @brief Returns a short description used in log lines.
    [[nodiscard]] virtual std::string describe() const = 0;
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_TRANSPORT_H
