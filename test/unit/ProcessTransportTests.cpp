//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "TestDoubles.h"
#include "fsmcp/LSP/ClientConfig.h"
#include "fsmcp/LSP/JsonRpcFramer.h"
#include "fsmcp/LSP/Logger.h"
#include "fsmcp/LSP/ProcessClient.h"
#include "fsmcp/LSP/ProcessTransport.h"
#include "fsmcp/Support/ClientError.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#ifndef FSMCP_FAKE_SERVER_PATH
#error "FSMCP_FAKE_SERVER_PATH must name the fake language server executable"
#endif

namespace
{

using fsmcp::ClientErrorKind;
using fsmcp::test::expectErrorKind;
using fsmcp::test::expectSuccess;
using fsmcp::test::waitUntil;

/// Collects everything a transport reports through its callbacks.
class CallbackRecorder final
{
public:
    fsmcp::lsp::TransportCallbacks callbacks()
    {
        fsmcp::lsp::TransportCallbacks result;
        result.onData = [this](std::string chunk) {
            std::lock_guard<std::mutex> lock(mutex_);
            framer_.append(chunk);
            for (const std::string& payload : framer_.drain())
            {
                llvm::json::Value message(nullptr);
                std::string       error;
                if (fsmcp::lsp::parsePayload(payload, message, error))
                {
                    messages_.push_back(std::move(message));
                }
            }
        };
        result.onStderr = [this](std::string line) {
            std::lock_guard<std::mutex> lock(mutex_);
            stderrLines_.push_back(std::move(line));
        };
        result.onClosed = [this](std::string reason) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++closedCount_;
            closedReason_ = std::move(reason);
        };
        return result;
    }

    /// Returns the response with numeric `id`, or `null`.
    llvm::json::Value response(const std::int64_t id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const llvm::json::Value& message : messages_)
        {
            const auto* object = message.getAsObject();
            if (object && object->getInteger("id") == id && !object->get("method"))
            {
                return message;
            }
        }
        return nullptr;
    }

    bool hasResponse(const std::int64_t id) const
    {
        return response(id).getAsObject() != nullptr;
    }

    bool sawStderr(const std::string& text) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const std::string& line : stderrLines_)
        {
            if (line.find(text) != std::string::npos)
            {
                return true;
            }
        }
        return false;
    }

    int closedCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closedCount_;
    }

    std::string closedReason() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closedReason_;
    }

private:
    mutable std::mutex             mutex_;
    fsmcp::lsp::JsonRpcFramer      framer_;
    std::vector<llvm::json::Value> messages_;
    std::vector<std::string>       stderrLines_;
    int                            closedCount_{0};
    std::string                    closedReason_;
};

std::string request(const std::int64_t id, const std::string& method, llvm::json::Value params)
{
    return fsmcp::lsp::encodeMessage(
        llvm::json::Object{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}});
}

std::string notification(const std::string& method)
{
    return fsmcp::lsp::encodeMessage(
        llvm::json::Object{{"jsonrpc", "2.0"}, {"method", method}, {"params", llvm::json::Object{}}});
}

std::unique_ptr<fsmcp::lsp::ProcessTransport> fakeServer(std::vector<std::string> args)
{
    return std::make_unique<fsmcp::lsp::ProcessTransport>(FSMCP_FAKE_SERVER_PATH,
                                                          std::move(args),
                                                          std::filesystem::temp_directory_path().string());
}

bool testMissingProgram()
{
    CallbackRecorder             recorder;
    fsmcp::lsp::ProcessTransport transport("fsmcp-no-such-language-server", {"--stdio"}, "/");
    if (!expectErrorKind(transport.start(recorder.callbacks()), ClientErrorKind::LaunchFailure, "missing program"))
    {
        return false;
    }
    if (transport.running() || transport.pid() != -1)
    {
        std::cerr << "a failed launch must not leave a running child\n";
        return false;
    }
    return expectErrorKind(transport.write("x"), ClientErrorKind::Unavailable, "write without a child");
}

bool testExchange()
{
    CallbackRecorder                              recorder;
    std::unique_ptr<fsmcp::lsp::ProcessTransport> transport = fakeServer({"--stderr-banner"});
    if (!expectSuccess(transport->start(recorder.callbacks()), "start fake server"))
    {
        return false;
    }
    if (!transport->running() || transport->pid() <= 0 ||
        transport->describe().find("pid") == std::string::npos)
    {
        std::cerr << "started transport should report its child\n";
        return false;
    }

    if (!expectSuccess(transport->write(request(1, "initialize", llvm::json::Object{})), "write initialize"))
    {
        return false;
    }
    if (!waitUntil([&recorder]() { return recorder.hasResponse(1); }))
    {
        std::cerr << "timeout waiting for initialize response\n";
        return false;
    }
    const llvm::json::Value initialize = recorder.response(1);
    const auto*             result     = initialize.getAsObject()->getObject("result");
    if (!result || !result->getObject("capabilities"))
    {
        std::cerr << "initialize response should carry capabilities\n";
        return false;
    }
    if (!waitUntil([&recorder]() { return recorder.sawStderr("fake language server starting"); }))
    {
        std::cerr << "stderr lines should be forwarded\n";
        return false;
    }

    if (!expectSuccess(transport->write(request(2, "shutdown", nullptr)), "write shutdown") ||
        !waitUntil([&recorder]() { return recorder.hasResponse(2); }) ||
        !expectSuccess(transport->write(notification("exit")), "write exit"))
    {
        return false;
    }
    if (!waitUntil([&recorder]() { return recorder.closedCount() == 1; }))
    {
        std::cerr << "transport should report the server exit\n";
        return false;
    }
    if (recorder.closedReason().find("exited with code 0") == std::string::npos || transport->running())
    {
        std::cerr << "clean exit should be reported with code 0: " << recorder.closedReason() << "\n";
        return false;
    }
    transport->terminate();
    if (recorder.closedCount() != 1)
    {
        std::cerr << "close must be reported once\n";
        return false;
    }
    return true;
}

bool testCrashReportsExitCode()
{
    CallbackRecorder                              recorder;
    std::unique_ptr<fsmcp::lsp::ProcessTransport> transport = fakeServer({"--crash-after-initialized"});
    if (!expectSuccess(transport->start(recorder.callbacks()), "start crashing server"))
    {
        return false;
    }
    if (!expectSuccess(transport->write(request(1, "initialize", llvm::json::Object{})), "write initialize") ||
        !waitUntil([&recorder]() { return recorder.hasResponse(1); }) ||
        !expectSuccess(transport->write(notification("initialized")), "write initialized"))
    {
        return false;
    }
    if (!waitUntil([&recorder]() { return recorder.closedCount() == 1; }))
    {
        std::cerr << "crash should close the transport\n";
        return false;
    }
    if (recorder.closedReason().find("exited with code 3") == std::string::npos)
    {
        std::cerr << "crash reason should carry the exit code: " << recorder.closedReason() << "\n";
        return false;
    }
    return expectErrorKind(transport->write(notification("exit")), ClientErrorKind::Unavailable, "write after crash");
}

bool testExitBeforeHandshake()
{
    CallbackRecorder                              recorder;
    std::unique_ptr<fsmcp::lsp::ProcessTransport> transport = fakeServer({"--exit-immediately"});
    if (!expectSuccess(transport->start(recorder.callbacks()), "start exiting server"))
    {
        return false;
    }
    if (!waitUntil([&recorder]() { return recorder.closedCount() == 1; }))
    {
        std::cerr << "early exit should close the transport\n";
        return false;
    }
    if (recorder.closedReason().find("exited with code 4") == std::string::npos)
    {
        std::cerr << "early exit should report code 4: " << recorder.closedReason() << "\n";
        return false;
    }
    return true;
}

bool testTerminate()
{
    CallbackRecorder                              recorder;
    std::unique_ptr<fsmcp::lsp::ProcessTransport> transport = fakeServer({});
    if (!expectSuccess(transport->start(recorder.callbacks()), "start fake server"))
    {
        return false;
    }

    const auto start = std::chrono::steady_clock::now();
    transport->terminate();
    transport->terminate();
    if (std::chrono::steady_clock::now() - start >
        fsmcp::lsp::ProcessTransport::ExitGrace + fsmcp::lsp::ProcessTransport::TerminateGrace +
            std::chrono::seconds(1))
    {
        std::cerr << "terminate should be bounded by its grace periods\n";
        return false;
    }
    if (transport->running() || recorder.closedCount() != 1)
    {
        std::cerr << "terminate should stop the child and report the close once\n";
        return false;
    }
    if (!expectErrorKind(transport->write(notification("exit")), ClientErrorKind::Unavailable, "write after stop"))
    {
        return false;
    }
    return expectErrorKind(transport->start(recorder.callbacks()), ClientErrorKind::LaunchFailure, "restart");
}

/// Starts `transport` and sends the handshake messages.
bool startInitialized(CallbackRecorder& recorder, fsmcp::lsp::ProcessTransport& transport)
{
    if (!expectSuccess(transport.start(recorder.callbacks()), "start fake server") ||
        !expectSuccess(transport.write(request(1, "initialize", llvm::json::Object{})), "write initialize"))
    {
        return false;
    }
    if (!waitUntil([&recorder]() { return recorder.hasResponse(1); }))
    {
        std::cerr << "timeout waiting for initialize response\n";
        return false;
    }
    return expectSuccess(transport.write(notification("initialized")), "write initialized");
}

bool testWriteDoesNotWaitForReader()
{
    CallbackRecorder                              recorder;
    std::unique_ptr<fsmcp::lsp::ProcessTransport> transport = fakeServer({"--stop-reading-after-initialized"});
    if (!startInitialized(recorder, *transport))
    {
        return false;
    }

    // Far more than a pipe holds; the server never reads any of it.
    const std::string text(1024U * 1024U, 'x');
    const std::string change =
        fsmcp::lsp::encodeMessage(llvm::json::Object{{"jsonrpc", "2.0"},
                                                     {"method", "textDocument/didChange"},
                                                     {"params", llvm::json::Object{{"text", text}}}});
    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 8; ++i)
    {
        if (!expectSuccess(transport->write(change), "queue large change"))
        {
            return false;
        }
    }
    if (std::chrono::steady_clock::now() - start > std::chrono::seconds(1))
    {
        std::cerr << "writes to a server that stopped reading should only queue\n";
        return false;
    }
    if (!transport->running() || recorder.closedCount() != 0)
    {
        std::cerr << "a full input pipe is not a closed transport\n";
        return false;
    }

    const auto stopStart = std::chrono::steady_clock::now();
    transport->terminate();
    if (std::chrono::steady_clock::now() - stopStart >
        fsmcp::lsp::ProcessTransport::ExitGrace + fsmcp::lsp::ProcessTransport::TerminateGrace +
            std::chrono::seconds(1))
    {
        std::cerr << "terminate should not wait for queued input to drain\n";
        return false;
    }
    if (transport->running() || recorder.closedCount() != 1)
    {
        std::cerr << "terminate should stop a server that stopped reading\n";
        return false;
    }
    return true;
}

bool testOutputClosedWhileRunning()
{
    CallbackRecorder                              recorder;
    std::unique_ptr<fsmcp::lsp::ProcessTransport> transport = fakeServer({"--close-stdout-after-initialized"});
    if (!startInitialized(recorder, *transport))
    {
        return false;
    }

    // The child idles for many seconds after closing stdout.
    if (!waitUntil([&recorder]() { return recorder.closedCount() == 1; }, std::chrono::milliseconds(2000)))
    {
        std::cerr << "closing stdout should close the transport while the child still runs\n";
        return false;
    }
    if (recorder.closedReason().find("closed its output stream") == std::string::npos)
    {
        std::cerr << "close reason should name the output stream: " << recorder.closedReason() << "\n";
        return false;
    }
    if (transport->running() ||
        !expectErrorKind(transport->write(notification("exit")), ClientErrorKind::Unavailable, "write after close"))
    {
        std::cerr << "a transport with a closed output stream should refuse writes\n";
        return false;
    }

    const auto stopStart = std::chrono::steady_clock::now();
    transport->terminate();
    if (std::chrono::steady_clock::now() - stopStart >
        fsmcp::lsp::ProcessTransport::ExitGrace + fsmcp::lsp::ProcessTransport::TerminateGrace +
            std::chrono::seconds(1))
    {
        std::cerr << "terminate should end a child that closed stdout\n";
        return false;
    }
    if (recorder.closedCount() != 1)
    {
        std::cerr << "close must be reported once: " << recorder.closedCount() << "\n";
        return false;
    }
    return true;
}

bool testClientBoundedWhenServerStopsReading()
{
    fsmcp::test::InMemoryStorage storage{"/work"};
    fsmcp::lsp::Logger           logger{fsmcp::lsp::TraceLevel::Off, &llvm::nulls()};
    storage.put("/work/src/big.ts", std::string(4U * 1024U * 1024U, 'x'));

    fsmcp::lsp::ServerConfig server = fsmcp::lsp::defaultRouterConfig("/work").servers.front();
    server.args                     = {"--stop-reading-after-initialized"};
    fsmcp::lsp::ClientOptions options;
    options.projectRoot      = "/work";
    options.handshakeTimeout = std::chrono::milliseconds(5000);
    options.requestTimeout   = std::chrono::milliseconds(500);
    options.shutdownTimeout  = std::chrono::milliseconds(300);
    fsmcp::lsp::ProcessClient client(server, options, fakeServer(server.args), storage, logger);

    const auto                   start   = std::chrono::steady_clock::now();
    llvm::Expected<std::int64_t> version = client.ensureOpen("/work/src/big.ts");
    if (!version)
    {
        return expectSuccess(version.takeError(), "open a document larger than the pipe");
    }
    if (!expectErrorKind(client.request("textDocument/hover", llvm::json::Object{}),
                         ClientErrorKind::Timeout,
                         "request to a server that stopped reading"))
    {
        return false;
    }
    if (client.pendingRequestCount() != 0)
    {
        std::cerr << "timed out request should be forgotten\n";
        return false;
    }
    client.shutdown();
    if (std::chrono::steady_clock::now() - start > std::chrono::seconds(5))
    {
        std::cerr << "a server that stops reading must not stall the client\n";
        return false;
    }
    return client.state() == fsmcp::lsp::ClientState::Exited;
}

}  // namespace

bool runProcessTransportTests()
{
    bool ok = true;
    ok      = testMissingProgram() && ok;
    ok      = testExchange() && ok;
    ok      = testCrashReportsExitCode() && ok;
    ok      = testExitBeforeHandshake() && ok;
    ok      = testTerminate() && ok;
    ok      = testWriteDoesNotWaitForReader() && ok;
    ok      = testOutputClosedWhileRunning() && ok;
    ok      = testClientBoundedWhenServerStopsReading() && ok;
    return ok;
}
