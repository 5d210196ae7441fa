//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Client for one analysis server process.
///
/// A `ProcessClient` owns the server connection, the handshake state machine,
/// the set of documents opened on the server and the diagnostics it pushed.
/// All of that state lives on the client's event loop; public methods post
/// work there and hand back futures or wait on them with a bound.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_PROCESS_CLIENT_H
#define FSMCP_LSP_PROCESS_CLIENT_H

#include "fsmcp/LSP/ClientConfig.h"
#include "fsmcp/LSP/DiagnosticsCache.h"
#include "fsmcp/LSP/DocumentStore.h"
#include "fsmcp/LSP/EventLoop.h"
#include "fsmcp/LSP/JsonRpcFramer.h"
#include "fsmcp/LSP/Logger.h"
#include "fsmcp/LSP/RpcCorrelator.h"
#include "fsmcp/LSP/RpcOutcome.h"
#include "fsmcp/LSP/Telemetry.h"
#include "fsmcp/LSP/Transport.h"
#include "fsmcp/Support/FileStorage.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace fsmcp::lsp
{

/// @brief Lifecycle state of a process client.
enum class ClientState
{
    Unstarted,
    Starting,
    AwaitingHandshake,
    Ready,
    Failed,
    Exited,
};

/// @brief Returns a stable lowercase name for a state.
[[nodiscard]] llvm::StringRef clientStateName(ClientState state);

/// @brief Timing and location settings for one client.
struct ClientOptions final
{
    /// @brief Project root sent as `rootUri`.
    std::string projectRoot;

    std::chrono::milliseconds handshakeTimeout{15000};
    std::chrono::milliseconds requestTimeout{5000};
    std::chrono::milliseconds shutdownTimeout{2000};
};

/// @brief Connection to one analysis server process.
class ProcessClient final
{
public:
    /// @brief Extra time callers wait beyond a loop-enforced deadline.
    static constexpr std::chrono::milliseconds WaitGrace{1000};

    /// @brief Longest a transport may take to stop its server.
    static constexpr std::chrono::milliseconds StopGrace{3000};

    /// @brief Creates an unstarted client.
    /// @param[in] config Server family settings.
    /// @param[in] options Timeouts and project root.
    /// @param[in] transport Connection to launch on `start`.
    /// @param[in] storage Source of document text for `ensureOpen`.
    /// @param[in] logger Shared logger.
    /// @param[in] telemetry Optional request telemetry recorder.
    ProcessClient(ServerConfig               config,
                  ClientOptions              options,
                  std::unique_ptr<Transport> transport,
                  DocumentStorage&           storage,
                  Logger&                    logger,
                  Telemetry*                 telemetry = nullptr);

    /// @brief Shuts the server down and stops the loop. Must not run on the loop.
    ~ProcessClient();

    ProcessClient(const ProcessClient&)            = delete;
    ProcessClient& operator=(const ProcessClient&) = delete;

    [[nodiscard]] const ServerConfig& config() const
    {
        return config_;
    }

    [[nodiscard]] const std::string& name() const
    {
        return config_.name;
    }

    [[nodiscard]] ClientState state() const
    {
        return state_.load();
    }

    /// @brief Launches the server and begins the handshake. Idempotent.
    /// @return Future completed when the handshake succeeds or fails.
    std::shared_future<RpcOutcome> start();

    /// @brief Starts the client if needed and waits for the handshake.
    /// @return `LaunchFailure`, `HandshakeFailure` or `NotReady` on failure.
    [[nodiscard]] llvm::Error waitUntilReady();

    /// @brief Issues a request.
    ///
    /// Fails immediately with `NotReady` unless the client is `Ready`.
    ///
    /// @param[in] method LSP method name.
    /// @param[in] params Request params.
    /// @param[in] timeout Deadline; the configured request timeout when unset.
    /// @return Future completed exactly once.
    std::future<RpcOutcome> sendRequest(std::string                              method,
                                        llvm::json::Value                        params,
                                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @brief Issues a request and waits for its result.
    /// @return Result payload or `ClientError`.
    [[nodiscard]] llvm::Expected<llvm::json::Value>
    request(std::string                              method,
            llvm::json::Value                        params,
            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @brief Sends a notification; dropped with a log line unless `Ready`.
    void sendNotification(std::string method, llvm::json::Value params);

    /// @brief Makes sure the server has the document open.
    ///
    /// Waits for the handshake, then sends `didOpen` with version 1 when the
    /// document is not open yet. Already-open documents are left untouched.
    ///
    /// @param[in] path Absolute path.
    /// @return Current document version.
    [[nodiscard]] llvm::Expected<std::int64_t> ensureOpen(llvm::StringRef path);

    /// @brief Sends the full new text of an open document.
    /// @param[in] path Absolute path.
    /// @param[in] text New full text.
    /// @return New document version, previous version plus one.
    [[nodiscard]] llvm::Expected<std::int64_t> notifyChanged(llvm::StringRef path, std::string text);

    /// @brief Sends `didClose` and forgets the document and its diagnostics.
    [[nodiscard]] llvm::Error closeDocument(llvm::StringRef path);

    /// @brief Returns the synchronized state of an open document.
    [[nodiscard]] llvm::Expected<DocumentSnapshot> documentSnapshot(llvm::StringRef path);

    /// @brief Returns the latest diagnostics pushed for `path`, or an empty set.
    /// @return Diagnostics array, or `Timeout`/`Unavailable` when the loop does not answer.
    [[nodiscard]] llvm::Expected<llvm::json::Array> cachedDiagnostics(llvm::StringRef path);

    /// @brief Waits for diagnostics describing at least `minVersion`.
    /// @return Diagnostics array or `Timeout`.
    [[nodiscard]] llvm::Expected<llvm::json::Array>
    waitForDiagnostics(llvm::StringRef path, std::int64_t minVersion, std::chrono::milliseconds timeout);

    /// @brief Returns the capabilities the server reported in `initialize`.
    [[nodiscard]] llvm::json::Value serverCapabilities();

    /// @brief Returns the number of requests awaiting a response.
    [[nodiscard]] std::size_t pendingRequestCount();

    /// @brief Sends `shutdown` (when ready) and `exit`, then stops the server.
    ///
    /// Safe to call repeatedly; only the first call has an effect. Returns
    /// within the shutdown timeout plus the termination grace.
    void shutdown();

private:
    /// Runs `fn` on the loop and waits at most `bound` for its result.
    template <typename Fn>
    llvm::Expected<std::invoke_result_t<Fn&>> callOnLoop(Fn fn, std::chrono::milliseconds bound);
    std::chrono::milliseconds                 loopBound() const;

    void launch();
    void onInitializeCompleted(RpcOutcome outcome);
    void settleHandshake(RpcOutcome outcome);
    void handleData(const std::string& chunk);
    void handleTransportClosed(const std::string& reason);
    void handleNotification(llvm::StringRef method, const llvm::json::Value& params);
    void handlePublishDiagnostics(const llvm::json::Value& params);
    RpcOutcome handleServerRequest(llvm::StringRef method, const llvm::json::Value& params);
    void       finishShutdown(const std::string& reason);
    void       failOutstanding(const std::string& reason);
    llvm::json::Value initializeParams() const;
    std::string       displayPath(llvm::StringRef path) const;

    ServerConfig               config_;
    ClientOptions              options_;
    DocumentStorage&           storage_;
    Logger&                    logger_;
    std::unique_ptr<Transport> transport_;
    EventLoop                  loop_;
    RpcCorrelator              correlator_;
    JsonRpcFramer              framer_;
    DocumentStore              documents_;
    DiagnosticsCache           diagnostics_;
    llvm::json::Value          capabilities_{nullptr};

    std::atomic<ClientState>       state_{ClientState::Unstarted};
    std::atomic<bool>              startRequested_{false};
    std::atomic<bool>              shutdownRequested_{false};
    std::atomic<bool>              launchFailed_{false};
    std::promise<RpcOutcome>       handshakePromise_;
    std::shared_future<RpcOutcome> handshake_;
    bool                           handshakeSettled_{false};
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_PROCESS_CLIENT_H
