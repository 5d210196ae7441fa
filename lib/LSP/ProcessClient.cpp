//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the analysis server process client.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/ProcessClient.h"

#include "fsmcp/Support/ClientError.h"
#include "fsmcp/Support/Uri.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"

#include <type_traits>
#include <utility>

namespace fsmcp::lsp
{
namespace
{

/// `notifyChanged` loop results that are not versions.
constexpr std::int64_t NotOpenVersion  = 0;
constexpr std::int64_t NotReadyVersion = -1;

RpcOutcome failure(const RpcStatus status, std::string message)
{
    return RpcOutcome{status, nullptr, 0, std::move(message)};
}

}  // namespace

llvm::StringRef clientStateName(const ClientState state)
{
    switch (state)
    {
    case ClientState::Unstarted:
        return "unstarted";
    case ClientState::Starting:
        return "starting";
    case ClientState::AwaitingHandshake:
        return "awaiting-handshake";
    case ClientState::Ready:
        return "ready";
    case ClientState::Failed:
        return "failed";
    case ClientState::Exited:
        return "exited";
    }
    return "unknown";
}

ProcessClient::ProcessClient(ServerConfig               config,
                             ClientOptions              options,
                             std::unique_ptr<Transport> transport,
                             DocumentStorage&           storage,
                             Logger&                    logger,
                             Telemetry*                 telemetry)
    : config_(std::move(config))
    , options_(std::move(options))
    , storage_(storage)
    , logger_(logger)
    , transport_(std::move(transport))
    , loop_([this](const std::string& message) { logger_.error(config_.name, message); })
    , correlator_(
          config_.name,
          loop_,
          [this](const llvm::StringRef bytes) -> llvm::Error {
              if (!transport_)
              {
                  return makeClientError(ClientErrorKind::Unavailable, "no transport");
              }
              return transport_->write(bytes);
          },
          logger_,
          telemetry)
    , handshake_(handshakePromise_.get_future().share())
{
    correlator_.setNotificationHandler(
        [this](const llvm::StringRef method, const llvm::json::Value& params) { handleNotification(method, params); });
    correlator_.setRequestHandler([this](const llvm::StringRef method, const llvm::json::Value& params) {
        return handleServerRequest(method, params);
    });
}

ProcessClient::~ProcessClient()
{
    shutdown();
    loop_.shutdown();
}

template <typename Fn>
llvm::Expected<std::invoke_result_t<Fn&>> ProcessClient::callOnLoop(Fn fn, const std::chrono::milliseconds bound)
{
    using Result = std::invoke_result_t<Fn&>;
    if (loop_.isLoopThread())
    {
        return fn();
    }
    auto                promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future  = promise->get_future();
    if (!loop_.post([promise, fn]() { promise->set_value(fn()); }))
    {
        return makeClientError(ClientErrorKind::Unavailable, "analysis server '" + config_.name + "' is stopping");
    }
    // The task keeps its own promise and still runs if the caller gives up.
    if (future.wait_for(bound) != std::future_status::ready)
    {
        return makeClientError(
            ClientErrorKind::Timeout,
            llvm::formatv("analysis server '{0}' did not answer within {1} ms", config_.name, bound.count()).str());
    }
    return future.get();
}

std::chrono::milliseconds ProcessClient::loopBound() const
{
    return options_.requestTimeout + WaitGrace;
}

std::shared_future<RpcOutcome> ProcessClient::start()
{
    if (!startRequested_.exchange(true))
    {
        if (!loop_.post([this]() { launch(); }))
        {
            logger_.error(config_.name, "cannot start: client is stopping");
        }
    }
    return handshake_;
}

llvm::Error ProcessClient::waitUntilReady()
{
    std::shared_future<RpcOutcome> handshake = start();
    if (handshake.wait_for(options_.handshakeTimeout + WaitGrace) != std::future_status::ready)
    {
        return makeClientError(ClientErrorKind::HandshakeFailure,
                               "timed out waiting for '" + config_.name + "' to initialize");
    }

    const RpcOutcome& outcome = handshake.get();
    if (!outcome.ok())
    {
        return makeClientError(launchFailed_.load() ? ClientErrorKind::LaunchFailure
                                                    : ClientErrorKind::HandshakeFailure,
                               outcome.errorMessage);
    }
    const ClientState current = state();
    if (current != ClientState::Ready)
    {
        return makeClientError(ClientErrorKind::NotReady,
                               "analysis server '" + config_.name + "' is " + clientStateName(current).str());
    }
    return llvm::Error::success();
}

std::future<RpcOutcome> ProcessClient::sendRequest(std::string                                    method,
                                                   llvm::json::Value                              params,
                                                   const std::optional<std::chrono::milliseconds> timeout)
{
    const std::chrono::milliseconds deadline = timeout ? *timeout : options_.requestTimeout;
    auto                            promise  = std::make_shared<std::promise<RpcOutcome>>();
    std::future<RpcOutcome>         future   = promise->get_future();

    auto notReady = [this](const std::string& requestMethod) {
        return failure(RpcStatus::NotReady,
                       "analysis server '" + config_.name + "' is " + clientStateName(state()).str() +
                           "; cannot send " + requestMethod);
    };
    if (state() != ClientState::Ready)
    {
        promise->set_value(notReady(method));
        return future;
    }

    const bool posted = loop_.post([this, promise, notReady, method, params = std::move(params), deadline]() {
        if (state_.load() != ClientState::Ready)
        {
            promise->set_value(notReady(method));
            return;
        }
        correlator_.sendRequest(method, params, deadline, [promise](RpcOutcome outcome) {
            promise->set_value(std::move(outcome));
        });
    });
    if (!posted)
    {
        promise->set_value(failure(RpcStatus::Unavailable, "analysis server '" + config_.name + "' is stopping"));
    }
    return future;
}

llvm::Expected<llvm::json::Value> ProcessClient::request(std::string                                    method,
                                                         llvm::json::Value                              params,
                                                         const std::optional<std::chrono::milliseconds> timeout)
{
    const std::chrono::milliseconds deadline = timeout ? *timeout : options_.requestTimeout;
    std::future<RpcOutcome>         future   = sendRequest(method, std::move(params), deadline);
    if (future.wait_for(deadline + WaitGrace) != std::future_status::ready)
    {
        return makeClientError(ClientErrorKind::Timeout,
                               method + " was not answered within " + std::to_string(deadline.count()) + " ms");
    }
    return takeResult(future.get());
}

void ProcessClient::sendNotification(std::string method, llvm::json::Value params)
{
    const bool posted = loop_.post([this, method = std::move(method), params = std::move(params)]() {
        const ClientState current = state_.load();
        if (current != ClientState::Ready && method != "initialized" && method != "exit")
        {
            logger_.info(config_.name, "dropping " + method + " while " + clientStateName(current).str());
            return;
        }
        [[maybe_unused]] const bool sent = correlator_.sendNotification(method, params);
    });
    if (!posted)
    {
        logger_.info(config_.name, "dropping notification: client is stopping");
    }
}

llvm::Expected<std::int64_t> ProcessClient::ensureOpen(const llvm::StringRef path)
{
    if (llvm::Error error = waitUntilReady())
    {
        return std::move(error);
    }

    const std::string                 key  = path.str();
    llvm::Expected<std::optional<std::int64_t>> open = callOnLoop(
        [this, key]() -> std::optional<std::int64_t> {
            if (const DocumentSnapshot* document = documents_.lookup(key))
            {
                return document->version;
            }
            return std::nullopt;
        },
        loopBound());
    if (!open)
    {
        return open.takeError();
    }
    if (*open)
    {
        return **open;
    }

    llvm::Expected<std::string> text = storage_.readText(path);
    if (!text)
    {
        return text.takeError();
    }

    llvm::Expected<std::int64_t> version = callOnLoop(
        [this, key, text = std::move(*text)]() -> std::int64_t {
            if (state_.load() != ClientState::Ready)
            {
                return NotReadyVersion;
            }
            // Another caller may have opened the document in the meantime.
            if (const DocumentSnapshot* document = documents_.lookup(key))
            {
                return document->version;
            }

            const std::string languageId = languageIdForPath(config_, key);
            [[maybe_unused]] const bool sent = correlator_.sendNotification(
                "textDocument/didOpen",
                llvm::json::Object{
                    {"textDocument",
                     llvm::json::Object{
                         {"uri", pathToUri(key)},
                         {"languageId", languageId},
                         {"version", 1},
                         {"text", text},
                     }},
                });
            [[maybe_unused]] const bool opened = documents_.open(key, languageId, text);
            logger_.info(config_.name, "opened " + displayPath(key) + " as " + languageId);
            return 1;
        },
        loopBound());
    if (!version)
    {
        return version.takeError();
    }
    if (*version == NotReadyVersion)
    {
        return makeClientError(ClientErrorKind::NotReady,
                               "analysis server '" + config_.name + "' is " + clientStateName(state()).str());
    }
    return *version;
}

llvm::Expected<std::int64_t> ProcessClient::notifyChanged(const llvm::StringRef path, std::string text)
{
    const std::string            key     = path.str();
    llvm::Expected<std::int64_t> version = callOnLoop(
        [this, key, text = std::move(text)]() -> std::int64_t {
            if (state_.load() != ClientState::Ready)
            {
                return NotReadyVersion;
            }
            const std::int64_t next = documents_.applyFullTextChange(key, text);
            if (next == NotOpenVersion)
            {
                return NotOpenVersion;
            }
            [[maybe_unused]] const bool sent = correlator_.sendNotification(
                "textDocument/didChange",
                llvm::json::Object{
                    {"textDocument", llvm::json::Object{{"uri", pathToUri(key)}, {"version", next}}},
                    {"contentChanges", llvm::json::Array{llvm::json::Object{{"text", text}}}},
                });
            logger_.trace(config_.name, "changed " + displayPath(key) + " to version " + llvm::Twine(next));
            return next;
        },
        loopBound());

    if (!version)
    {
        return version.takeError();
    }
    if (*version == NotReadyVersion)
    {
        return makeClientError(ClientErrorKind::NotReady,
                               "analysis server '" + config_.name + "' is " + clientStateName(state()).str());
    }
    if (*version == NotOpenVersion)
    {
        return makeClientError(ClientErrorKind::InvalidArgument, "document '" + key + "' is not open");
    }
    return *version;
}

llvm::Error ProcessClient::closeDocument(const llvm::StringRef path)
{
    const std::string    key    = path.str();
    llvm::Expected<bool> closed = callOnLoop(
        [this, key]() {
            if (!documents_.close(key))
            {
                return false;
            }
            diagnostics_.erase(key);
            if (state_.load() == ClientState::Ready)
            {
                [[maybe_unused]] const bool sent = correlator_.sendNotification(
                    "textDocument/didClose",
                    llvm::json::Object{{"textDocument", llvm::json::Object{{"uri", pathToUri(key)}}}});
            }
            logger_.info(config_.name, "closed " + displayPath(key));
            return true;
        },
        loopBound());
    if (!closed)
    {
        return closed.takeError();
    }
    if (!*closed)
    {
        return makeClientError(ClientErrorKind::InvalidArgument, "document '" + key + "' is not open");
    }
    return llvm::Error::success();
}

llvm::Expected<DocumentSnapshot> ProcessClient::documentSnapshot(const llvm::StringRef path)
{
    const std::string                               key      = path.str();
    llvm::Expected<std::optional<DocumentSnapshot>> snapshot = callOnLoop(
        [this, key]() -> std::optional<DocumentSnapshot> {
            if (const DocumentSnapshot* document = documents_.lookup(key))
            {
                return *document;
            }
            return std::nullopt;
        },
        loopBound());
    if (!snapshot)
    {
        return snapshot.takeError();
    }
    if (!*snapshot)
    {
        return makeClientError(ClientErrorKind::InvalidArgument, "document '" + key + "' is not open");
    }
    return **snapshot;
}

llvm::Expected<llvm::json::Array> ProcessClient::cachedDiagnostics(const llvm::StringRef path)
{
    const std::string key = path.str();
    return callOnLoop(
        [this, key]() {
            if (const DiagnosticsEntry* entry = diagnostics_.lookup(key))
            {
                return entry->diagnostics;
            }
            return llvm::json::Array();
        },
        loopBound());
}

llvm::Expected<llvm::json::Array> ProcessClient::waitForDiagnostics(const llvm::StringRef           path,
                                                                    const std::int64_t              minVersion,
                                                                    const std::chrono::milliseconds timeout)
{
    const std::string       key     = path.str();
    auto                    promise = std::make_shared<std::promise<RpcOutcome>>();
    std::future<RpcOutcome> future  = promise->get_future();

    const bool posted = loop_.post([this, key, minVersion, timeout, promise]() {
        if (state_.load() != ClientState::Ready)
        {
            promise->set_value(failure(RpcStatus::NotReady,
                                       "analysis server '" + config_.name + "' is " +
                                           clientStateName(state_.load()).str()));
            return;
        }
        const DiagnosticsCache::WaiterId waiter =
            diagnostics_.addWaiter(key, minVersion, [promise](RpcOutcome outcome) {
                promise->set_value(std::move(outcome));
            });
        if (waiter == 0)
        {
            return;
        }
        loop_.scheduleAfter(timeout, [this, waiter, key, minVersion, timeout]() {
            diagnostics_.failWaiter(waiter,
                                    failure(RpcStatus::Timeout,
                                            llvm::formatv("no diagnostics for {0} version {1} within {2} ms",
                                                          displayPath(key),
                                                          minVersion,
                                                          timeout.count())
                                                .str()));
        });
    });
    if (!posted)
    {
        return makeClientError(ClientErrorKind::Unavailable, "analysis server '" + config_.name + "' is stopping");
    }

    if (future.wait_for(timeout + WaitGrace) != std::future_status::ready)
    {
        return makeClientError(ClientErrorKind::Timeout, "no diagnostics for '" + key + "'");
    }
    RpcOutcome outcome = future.get();
    if (!outcome.ok())
    {
        return makeClientError(toClientErrorKind(outcome.status), std::move(outcome.errorMessage));
    }
    if (auto* diagnostics = outcome.result.getAsArray())
    {
        return std::move(*diagnostics);
    }
    return llvm::json::Array();
}

llvm::json::Value ProcessClient::serverCapabilities()
{
    llvm::Expected<llvm::json::Value> capabilities = callOnLoop([this]() { return capabilities_; }, loopBound());
    if (!capabilities)
    {
        logger_.error(config_.name, "capabilities unavailable: " + llvm::toString(capabilities.takeError()));
        return nullptr;
    }
    return std::move(*capabilities);
}

std::size_t ProcessClient::pendingRequestCount()
{
    llvm::Expected<std::size_t> count = callOnLoop([this]() { return correlator_.pendingCount(); }, loopBound());
    if (!count)
    {
        logger_.error(config_.name, "request count unavailable: " + llvm::toString(count.takeError()));
        return 0;
    }
    return *count;
}

void ProcessClient::shutdown()
{
    if (shutdownRequested_.exchange(true))
    {
        return;
    }

    if (state() == ClientState::Ready)
    {
        std::future<RpcOutcome> future = sendRequest("shutdown", nullptr, options_.shutdownTimeout);
        if (future.wait_for(options_.shutdownTimeout + WaitGrace) == std::future_status::ready)
        {
            const RpcOutcome outcome = future.get();
            if (!outcome.ok())
            {
                logger_.info(config_.name, "shutdown request failed: " + outcome.errorMessage);
            }
        }
    }

    llvm::Expected<bool> finished = callOnLoop(
        [this]() {
            finishShutdown("analysis server '" + config_.name + "' was shut down");
            return true;
        },
        StopGrace + WaitGrace);
    if (!finished)
    {
        logger_.error(config_.name, "shutdown incomplete: " + llvm::toString(finished.takeError()));
    }
}

void ProcessClient::launch()
{
    if (shutdownRequested_.load())
    {
        return;
    }
    if (!transport_)
    {
        launchFailed_.store(true);
        state_.store(ClientState::Failed);
        settleHandshake(failure(RpcStatus::Unavailable, "analysis server '" + config_.name + "' has no transport"));
        return;
    }

    state_.store(ClientState::Starting);
    logger_.info(config_.name, "starting " + transport_->describe());

    TransportCallbacks callbacks;
    callbacks.onData = [this](std::string chunk) {
        if (!loop_.post([this, chunk = std::move(chunk)]() { handleData(chunk); }))
        {
            logger_.trace(config_.name, "dropping server output after shutdown");
        }
    };
    callbacks.onStderr = [this](std::string line) { logger_.info(config_.name, "stderr: " + line); };
    callbacks.onClosed = [this](std::string reason) {
        if (!loop_.post([this, reason = std::move(reason)]() { handleTransportClosed(reason); }))
        {
            logger_.trace(config_.name, "server closed after shutdown: " + reason);
        }
    };

    if (llvm::Error error = transport_->start(std::move(callbacks)))
    {
        const std::string message = llvm::toString(std::move(error));
        logger_.error(config_.name, "launch failed: " + message);
        launchFailed_.store(true);
        state_.store(ClientState::Failed);
        settleHandshake(failure(RpcStatus::Unavailable, message));
        return;
    }

    state_.store(ClientState::AwaitingHandshake);
    correlator_.sendRequest("initialize", initializeParams(), options_.handshakeTimeout, [this](RpcOutcome outcome) {
        onInitializeCompleted(std::move(outcome));
    });
}

void ProcessClient::onInitializeCompleted(RpcOutcome outcome)
{
    if (!outcome.ok())
    {
        const std::string message = "initialize failed (" + rpcStatusName(outcome.status).str() + "): " +
                                    outcome.errorMessage;
        logger_.error(config_.name, message);
        if (state_.load() != ClientState::Exited)
        {
            state_.store(ClientState::Failed);
        }
        if (transport_)
        {
            transport_->terminate();
        }
        settleHandshake(RpcOutcome{outcome.status, nullptr, outcome.errorCode, message});
        return;
    }
    if (state_.load() != ClientState::AwaitingHandshake)
    {
        settleHandshake(failure(RpcStatus::Unavailable,
                                "analysis server '" + config_.name + "' stopped during the handshake"));
        return;
    }

    capabilities_ = nullptr;
    if (const auto* result = outcome.result.getAsObject())
    {
        if (const llvm::json::Value* capabilities = result->get("capabilities"))
        {
            capabilities_ = *capabilities;
        }
    }

    state_.store(ClientState::Ready);
    logger_.info(config_.name, "initialized");
    [[maybe_unused]] const bool sent = correlator_.sendNotification("initialized", llvm::json::Object{});
    settleHandshake(RpcOutcome{});
}

void ProcessClient::settleHandshake(RpcOutcome outcome)
{
    if (handshakeSettled_)
    {
        return;
    }
    handshakeSettled_ = true;
    handshakePromise_.set_value(std::move(outcome));
}

void ProcessClient::handleData(const std::string& chunk)
{
    framer_.append(chunk);
    while (true)
    {
        std::string       payload;
        std::string       error;
        const FrameResult result = framer_.next(payload, error);
        if (result == FrameResult::NeedMoreData)
        {
            return;
        }
        if (result == FrameResult::MalformedHeader)
        {
            logger_.error(config_.name, "protocol error: " + error);
            continue;
        }

        llvm::json::Value message(nullptr);
        if (!parsePayload(payload, message, error))
        {
            logger_.error(config_.name, "dropping message: " + error);
            continue;
        }
        correlator_.handleMessage(message);
    }
}

void ProcessClient::handleTransportClosed(const std::string& reason)
{
    const ClientState previous = state_.load();
    if (previous != ClientState::Failed)
    {
        state_.store(ClientState::Exited);
    }
    if (previous == ClientState::Ready || previous == ClientState::AwaitingHandshake)
    {
        logger_.error(config_.name, "analysis server exited: " + reason);
    }
    else
    {
        logger_.info(config_.name, "analysis server exited: " + reason);
    }
    framer_.reset();
    failOutstanding("analysis server '" + config_.name + "' exited: " + reason);
    settleHandshake(failure(RpcStatus::Unavailable, "analysis server '" + config_.name + "' exited: " + reason));
}

void ProcessClient::handleNotification(const llvm::StringRef method, const llvm::json::Value& params)
{
    if (method == "textDocument/publishDiagnostics")
    {
        handlePublishDiagnostics(params);
        return;
    }

    if (method == "window/logMessage" || method == "window/showMessage")
    {
        const auto* object = params.getAsObject();
        if (!object)
        {
            return;
        }
        const auto message = object->getString("message");
        const auto type    = object->getInteger("type");
        const llvm::StringRef text = message ? *message : llvm::StringRef("<no message>");
        if (type && *type == 1)
        {
            logger_.error(config_.name, "server: " + text);
        }
        else
        {
            logger_.info(config_.name, "server: " + text);
        }
        return;
    }

    logger_.trace(config_.name, "unhandled notification " + method);
}

void ProcessClient::handlePublishDiagnostics(const llvm::json::Value& params)
{
    const auto* object = params.getAsObject();
    if (!object)
    {
        logger_.error(config_.name, "publishDiagnostics params are not an object");
        return;
    }
    const auto uri = object->getString("uri");
    if (!uri)
    {
        logger_.error(config_.name, "publishDiagnostics without a document uri");
        return;
    }

    const std::string path = uriToPath(*uri);
    llvm::json::Array diagnostics;
    if (const auto* array = object->getArray("diagnostics"))
    {
        diagnostics = *array;
    }

    std::int64_t version = 0;
    if (const auto published = object->getInteger("version"))
    {
        version = *published;
    }
    else if (const DocumentSnapshot* document = documents_.lookup(path))
    {
        version = document->version;
    }

    logger_.info(config_.name,
                 llvm::formatv("diagnostics for {0}: {1} issue(s) at version {2}",
                               displayPath(path),
                               diagnostics.size(),
                               version));
    diagnostics_.publish(path, std::move(diagnostics), version);
}

RpcOutcome ProcessClient::handleServerRequest(const llvm::StringRef method, const llvm::json::Value& params)
{
    if (method == "workspace/configuration")
    {
        llvm::json::Array results;
        if (const auto* object = params.getAsObject())
        {
            if (const auto* items = object->getArray("items"))
            {
                for (std::size_t i = 0; i < items->size(); ++i)
                {
                    results.push_back(nullptr);
                }
            }
        }
        RpcOutcome outcome;
        outcome.result = std::move(results);
        return outcome;
    }
    if (method == "client/registerCapability" || method == "client/unregisterCapability" ||
        method == "window/workDoneProgress/create")
    {
        return RpcOutcome{};
    }
    logger_.trace(config_.name, "rejecting server request " + method);
    return RpcOutcome{RpcStatus::RemoteError, nullptr, MethodNotFoundCode, "Method not found: " + method.str()};
}

void ProcessClient::finishShutdown(const std::string& reason)
{
    if (transport_ && transport_->running())
    {
        [[maybe_unused]] const bool sent = correlator_.sendNotification("exit", nullptr);
    }
    if (transport_)
    {
        transport_->terminate();
    }
    state_.store(ClientState::Exited);
    failOutstanding(reason);
    for (const DocumentSnapshot& document : documents_.snapshots())
    {
        logger_.info(config_.name,
                     "dropping " + displayPath(document.path) + " at version " + llvm::Twine(document.version));
    }
    documents_.clear();
    settleHandshake(failure(RpcStatus::Unavailable, reason));
    logger_.info(config_.name, "stopped");
}

void ProcessClient::failOutstanding(const std::string& reason)
{
    correlator_.failAll(RpcStatus::Unavailable, reason);
    diagnostics_.failAll(RpcStatus::Unavailable, reason);
}

llvm::json::Value ProcessClient::initializeParams() const
{
    const std::string rootUri = pathToUri(options_.projectRoot);
    return llvm::json::Object{
        {"processId", static_cast<std::int64_t>(llvm::sys::Process::getProcessId())},
        {"clientInfo", llvm::json::Object{{"name", "fsmcp"}}},
        {"rootUri", rootUri},
        {"workspaceFolders",
         llvm::json::Array{llvm::json::Object{
             {"uri", rootUri},
             {"name", llvm::sys::path::filename(options_.projectRoot).str()},
         }}},
        {"capabilities",
         llvm::json::Object{
             {"textDocument",
              llvm::json::Object{
                  {"synchronization",
                   llvm::json::Object{{"willSave", true}, {"didSave", true}, {"willSaveWaitUntil", true}}},
                  {"completion", llvm::json::Object{{"completionItem", llvm::json::Object{{"snippetSupport", true}}}}},
                  {"publishDiagnostics", llvm::json::Object{{"versionSupport", true}}},
                  {"definition", llvm::json::Object{{"linkSupport", true}}},
              }},
             {"workspace",
              llvm::json::Object{
                  {"configuration", true},
                  {"didChangeConfiguration", llvm::json::Object{{"dynamicRegistration", true}}},
              }},
         }},
    };
}

std::string ProcessClient::displayPath(const llvm::StringRef path) const
{
    llvm::StringRef relative = path;
    if (!options_.projectRoot.empty() && relative.consume_front(options_.projectRoot) &&
        (relative.empty() || llvm::sys::path::is_separator(relative.front())))
    {
        relative = relative.ltrim("/\\");
        return relative.empty() ? std::string(".") : relative.str();
    }
    return path.str();
}

}  // namespace fsmcp::lsp
