//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `fsmcp-lsp` language intelligence driver.
///
/// The driver builds one client router for a project root, runs a single
/// query (diagnostics, completion, definition or format) against the
/// analysis server routed for the file and prints the result as JSON.
/// SIGINT and SIGTERM trigger an orderly shutdown of every server.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/ClientConfig.h"
#include "fsmcp/LSP/ClientRouter.h"
#include "fsmcp/LSP/Logger.h"
#include "fsmcp/LSP/RpcOutcome.h"
#include "fsmcp/Support/ClientError.h"
#include "fsmcp/Support/FileStorage.h"
#include "fsmcp/Version.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <optional>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

namespace
{

/// @brief Parsed command line.
struct DriverOptions final
{
    std::optional<std::string>  configPath;
    std::optional<std::string>  projectRoot;
    std::optional<std::int64_t> diagnosticsWaitMs;
    std::optional<std::string>  trace;
    std::string                 command;
    std::vector<std::string>    positional;
};

/// @brief Diagnostics wait used by the driver when nothing else sets one.
constexpr std::int64_t DefaultDiagnosticsWaitMs = 2000;

bool isKnownCommand(const llvm::StringRef command)
{
    return command == "diagnostics" || command == "completion" || command == "definition" || command == "format";
}

void printUsage()
{
    llvm::errs() << "Usage: fsmcp-lsp [options] <diagnostics|completion|definition|format> <file> [line character]\n"
                 << "Try: fsmcp-lsp --help\n";
}

void printHelp()
{
    llvm::errs() << "NAME\n"
                 << "  fsmcp-lsp - query language servers for a project file\n\n"
                 << "SYNOPSIS\n"
                 << "  fsmcp-lsp [options] diagnostics <file>\n"
                 << "  fsmcp-lsp [options] completion <file> <line> <character>\n"
                 << "  fsmcp-lsp [options] definition <file> <line> <character>\n"
                 << "  fsmcp-lsp [options] format <file>\n\n"
                 << "DESCRIPTION\n"
                 << "  Launches the analysis server configured for the file extension, synchronizes the file\n"
                 << "  and prints the server's answer as JSON on stdout. Positions are zero-based; the\n"
                 << "  character offset counts UTF-16 code units. `format` writes the formatted text back.\n\n"
                 << "OPTIONS\n"
                 << "  --config <file>\n"
                 << "      JSON router configuration (servers, routes, timeouts, formatting, trace).\n"
                 << "  --root <dir>\n"
                 << "      Project root. Overrides the configuration and MCP_BASE_DIR. Defaults to the\n"
                 << "      current directory.\n"
                 << "  --diagnostics-wait-ms <N>\n"
                 << "      How long `diagnostics` waits for the server to publish for the current version\n"
                 << "      (default: 2000; 0 returns whatever is cached).\n"
                 << "  --trace <off|basic|verbose>\n"
                 << "      Log level on stderr. Overrides FSMCP_LSP_TRACE.\n"
                 << "  --version, -V\n"
                 << "      Print the version and exit.\n"
                 << "  --help, -h\n"
                 << "      Print this help text.\n";
}

/// @brief Parses argv into `options`.
/// @return Empty string on success, otherwise a diagnostic.
std::string parseArguments(const int argc, char** argv, DriverOptions& options)
{
    for (int i = 1; i < argc; ++i)
    {
        const llvm::StringRef arg(argv[i]);
        const auto            takeValue = [&](std::string& value) -> bool {
            if (i + 1 >= argc)
            {
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--config")
        {
            if (!takeValue(value))
            {
                return "--config requires a value";
            }
            options.configPath = value;
        }
        else if (arg == "--root")
        {
            if (!takeValue(value))
            {
                return "--root requires a value";
            }
            options.projectRoot = value;
        }
        else if (arg == "--diagnostics-wait-ms")
        {
            std::int64_t waitMs = 0;
            if (!takeValue(value) || llvm::StringRef(value).getAsInteger(10, waitMs) || waitMs < 0)
            {
                return "--diagnostics-wait-ms requires a non-negative integer";
            }
            options.diagnosticsWaitMs = waitMs;
        }
        else if (arg == "--trace")
        {
            if (!takeValue(value))
            {
                return "--trace requires a value";
            }
            options.trace = value;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            return "unknown option '" + arg.str() + "'";
        }
        else if (options.command.empty())
        {
            if (!isKnownCommand(arg))
            {
                return "unknown command '" + arg.str() + "'";
            }
            options.command = arg.str();
        }
        else
        {
            options.positional.push_back(arg.str());
        }
    }

    if (options.command.empty())
    {
        return "missing command";
    }
    const bool        positional = options.command == "completion" || options.command == "definition";
    const std::size_t expected   = positional ? 3U : 1U;
    if (options.positional.size() != expected)
    {
        return options.command + (positional ? " expects <file> <line> <character>" : " expects <file>");
    }
    return {};
}

bool parsePosition(const std::string& text, std::uint32_t& value)
{
    return !llvm::StringRef(text).getAsInteger(10, value);
}

/// @brief Builds the router configuration from defaults, file, environment and flags.
llvm::Error buildConfig(const DriverOptions& options, fsmcp::lsp::RouterConfig& config)
{
    llvm::SmallString<256> cwd;
    if (const std::error_code ec = llvm::sys::fs::current_path(cwd))
    {
        return fsmcp::makeClientError(fsmcp::ClientErrorKind::InvalidArgument,
                                      "cannot determine the current directory: " + ec.message());
    }

    config                 = fsmcp::lsp::defaultRouterConfig(cwd.str().str());
    config.diagnosticsWait = std::chrono::milliseconds(DefaultDiagnosticsWaitMs);
    if (options.configPath)
    {
        if (llvm::Error error = fsmcp::lsp::loadRouterConfig(*options.configPath, config))
        {
            return error;
        }
    }
    fsmcp::lsp::applyEnvironmentOverrides(config);

    if (options.projectRoot)
    {
        config.projectRoot = *options.projectRoot;
    }
    config.projectRoot = fsmcp::normalizeAbsolutePath(config.projectRoot);
    if (options.diagnosticsWaitMs)
    {
        config.diagnosticsWait = std::chrono::milliseconds(*options.diagnosticsWaitMs);
    }
    if (options.trace && !fsmcp::lsp::parseTraceLevel(*options.trace, config.traceLevel))
    {
        return fsmcp::makeClientError(fsmcp::ClientErrorKind::InvalidArgument,
                                      "unknown trace level '" + *options.trace + "'");
    }
    return llvm::Error::success();
}

/// @brief Runs the selected query and prints its JSON result.
llvm::Error runCommand(fsmcp::lsp::ClientRouter& router, const DriverOptions& options)
{
    const std::string& file = options.positional.front();
    llvm::json::Value  output(nullptr);

    if (options.command == "diagnostics")
    {
        llvm::Expected<llvm::json::Array> diagnostics = router.getDiagnostics(file);
        if (!diagnostics)
        {
            return diagnostics.takeError();
        }
        output = std::move(*diagnostics);
    }
    else if (options.command == "format")
    {
        llvm::Expected<fsmcp::lsp::FormatResult> formatted = router.formatDocument(file);
        if (!formatted)
        {
            return formatted.takeError();
        }
        llvm::json::Object result{{"applied", formatted->applied}, {"message", formatted->message}};
        if (formatted->newContent)
        {
            result["newContent"] = *formatted->newContent;
        }
        output = std::move(result);
    }
    else
    {
        std::uint32_t line      = 0;
        std::uint32_t character = 0;
        if (!parsePosition(options.positional[1], line) || !parsePosition(options.positional[2], character))
        {
            return fsmcp::makeClientError(fsmcp::ClientErrorKind::InvalidArgument,
                                          "line and character must be non-negative integers");
        }
        llvm::Expected<llvm::json::Value> result = options.command == "completion"
                                                       ? router.getCompletions(file, line, character)
                                                       : router.getDefinition(file, line, character);
        if (!result)
        {
            return result.takeError();
        }
        output = std::move(*result);
    }

    llvm::outs() << llvm::formatv("{0:2}", output) << "\n";
    llvm::outs().flush();
    return llvm::Error::success();
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);
    for (int i = 1; i < argc; ++i)
    {
        const llvm::StringRef arg(argv[i]);
        if (arg == "--version" || arg == "-V")
        {
            llvm::outs() << "fsmcp-lsp " << fsmcp::kVersionString << "\n";
            return 0;
        }
        if (arg == "--help" || arg == "-h")
        {
            printHelp();
            return 0;
        }
    }

    DriverOptions options;
    if (const std::string problem = parseArguments(argc, argv, options); !problem.empty())
    {
        llvm::errs() << "[fsmcp-lsp] " << problem << "\n";
        printUsage();
        return 2;
    }

    fsmcp::lsp::RouterConfig config;
    if (llvm::Error error = buildConfig(options, config))
    {
        llvm::errs() << "[fsmcp-lsp] " << llvm::toString(std::move(error)) << "\n";
        return 2;
    }

    // Signals are blocked before any worker thread exists so that only the
    // watcher below receives them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    fsmcp::lsp::Logger      logger(config.traceLevel);
    fsmcp::FileStorage      storage(config.projectRoot);
    llvm::Expected<std::unique_ptr<fsmcp::lsp::ClientRouter>> created =
        fsmcp::lsp::ClientRouter::create(config, storage, logger);
    if (!created)
    {
        llvm::errs() << "[fsmcp-lsp] " << llvm::toString(created.takeError()) << "\n";
        return 2;
    }
    fsmcp::lsp::ClientRouter& router = **created;

    router.telemetry().setSink([&logger](const fsmcp::lsp::RequestMetric& metric) {
        logger.trace("telemetry",
                     llvm::formatv("client={0} method={1} latency_us={2} outcome={3}",
                                   metric.client,
                                   metric.method,
                                   metric.latencyMicros,
                                   fsmcp::lsp::rpcStatusName(metric.outcome)));
    });

    std::atomic<bool> finished{false};
    std::atomic<int>  receivedSignal{0};
    std::thread       watcher([&]() {
        int signal = 0;
        if (sigwait(&signals, &signal) != 0 || finished.load())
        {
            return;
        }
        receivedSignal.store(signal);
        logger.info("fsmcp-lsp", llvm::formatv("received signal {0}, shutting down", signal));
        router.shutdownAll();
    });

    int exitCode = 0;
    if (llvm::Error error = runCommand(router, options))
    {
        llvm::errs() << "[fsmcp-lsp] " << llvm::toString(std::move(error)) << "\n";
        exitCode = 1;
    }

    router.shutdownAll();
    finished.store(true);
    pthread_kill(watcher.native_handle(), SIGTERM);
    watcher.join();

    if (const int signal = receivedSignal.load(); signal != 0)
    {
        return 128 + signal;
    }
    return exitCode;
}
