//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request/response correlation for one JSON-RPC connection.
///
/// The correlator allocates request ids, tracks pending requests with their
/// deadlines and routes incoming messages. It is not thread-safe: every call,
/// including timer expiry, runs on the owning client's event loop.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_RPC_CORRELATOR_H
#define FSMCP_LSP_RPC_CORRELATOR_H

#include "fsmcp/LSP/EventLoop.h"
#include "fsmcp/LSP/Logger.h"
#include "fsmcp/LSP/RpcOutcome.h"
#include "fsmcp/LSP/Telemetry.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace fsmcp::lsp
{

/// @brief JSON-RPC error code for unknown methods.
inline constexpr std::int64_t MethodNotFoundCode = -32601;

/// @brief Tracks in-flight requests and dispatches incoming messages.
class RpcCorrelator final
{
public:
    /// @brief Invoked exactly once with the outcome of a request.
    using Completion = std::function<void(RpcOutcome outcome)>;

    /// @brief Writes one framed message to the connection.
    using WriteFn = std::function<llvm::Error(llvm::StringRef bytes)>;

    /// @brief Receives server notifications.
    using NotificationHandler = std::function<void(llvm::StringRef method, const llvm::json::Value& params)>;

    /// @brief Answers server-to-client requests. `RemoteError` outcomes are
    /// sent as error responses.
    using RequestHandler = std::function<RpcOutcome(llvm::StringRef method, const llvm::json::Value& params)>;

    /// @brief Creates a correlator bound to a loop and a writer.
    /// @param[in] name Client name used in logs and telemetry.
    /// @param[in] loop Owning event loop; used for deadline timers.
    /// @param[in] write Connection writer.
    /// @param[in] logger Shared logger.
    /// @param[in] telemetry Optional request telemetry recorder.
    RpcCorrelator(std::string name, EventLoop& loop, WriteFn write, Logger& logger, Telemetry* telemetry = nullptr);
    ~RpcCorrelator();

    RpcCorrelator(const RpcCorrelator&)            = delete;
    RpcCorrelator& operator=(const RpcCorrelator&) = delete;

    void setNotificationHandler(NotificationHandler handler);
    void setRequestHandler(RequestHandler handler);

    /// @brief Writes a request and registers its completion.
    ///
    /// A write failure completes the request with `Unavailable` before this
    /// call returns.
    ///
    /// @param[in] method LSP method name.
    /// @param[in] params Request params.
    /// @param[in] timeout Deadline measured from now.
    /// @param[in] completion Completion callback.
    /// @return Allocated request id.
    std::int64_t sendRequest(llvm::StringRef           method,
                             llvm::json::Value         params,
                             std::chrono::milliseconds timeout,
                             Completion                completion);

    /// @brief Writes a notification.
    /// @param[in] method LSP method name.
    /// @param[in] params Notification params.
    /// @return `true` when the message was written.
    bool sendNotification(llvm::StringRef method, llvm::json::Value params);

    /// @brief Routes one parsed incoming message.
    /// @param[in] message Parsed JSON-RPC message.
    void handleMessage(const llvm::json::Value& message);

    /// @brief Completes every pending request with the same status.
    /// @param[in] status Completion status, typically `Unavailable`.
    /// @param[in] reason Failure description.
    void failAll(RpcStatus status, const std::string& reason);

    /// @brief Returns the number of requests awaiting completion.
    [[nodiscard]] std::size_t pendingCount() const
    {
        return pending_.size();
    }

    /// @brief Returns the most recently allocated id, or `0` if none.
    [[nodiscard]] std::int64_t lastIssuedId() const
    {
        return nextId_ - 1;
    }

private:
    using Clock = std::chrono::steady_clock;

    struct PendingRequest final
    {
        std::string        method;
        Completion         completion;
        EventLoop::TimerId timer{0};
        Clock::time_point  start;
    };

    void handleResponse(const llvm::json::Object& message, const llvm::json::Value& id);
    void handleServerRequest(llvm::StringRef method, const llvm::json::Value& id, const llvm::json::Value& params);
    void expire(std::int64_t id, std::chrono::milliseconds timeout);
    void complete(std::int64_t id, RpcOutcome outcome);
    bool writeMessage(const llvm::json::Value& message, std::string& error);

    std::string                            name_;
    EventLoop&                             loop_;
    WriteFn                                write_;
    Logger&                                logger_;
    Telemetry*                             telemetry_;
    NotificationHandler                    notificationHandler_;
    RequestHandler                         requestHandler_;
    std::map<std::int64_t, PendingRequest> pending_;
    std::int64_t                           nextId_{1};
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_RPC_CORRELATOR_H
