//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the client router.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/ClientRouter.h"

#include "fsmcp/LSP/ProcessTransport.h"
#include "fsmcp/LSP/TextEdits.h"
#include "fsmcp/Support/ClientError.h"
#include "fsmcp/Support/Uri.h"
#include "llvm/Support/FormatVariadic.h"

#include <utility>

namespace fsmcp::lsp
{

TransportFactory processTransportFactory()
{
    return [](const ServerConfig& server, const RouterConfig& config) -> std::unique_ptr<Transport> {
        return std::make_unique<ProcessTransport>(server.command, server.args, config.projectRoot);
    };
}

llvm::Expected<std::unique_ptr<ClientRouter>> ClientRouter::create(RouterConfig     config,
                                                                   DocumentStorage& storage,
                                                                   Logger&          logger,
                                                                   TransportFactory factory)
{
    if (llvm::Error error = validateRouterConfig(config))
    {
        return std::move(error);
    }
    if (!factory)
    {
        factory = processTransportFactory();
    }
    return std::unique_ptr<ClientRouter>(new ClientRouter(std::move(config), storage, logger, std::move(factory)));
}

ClientRouter::ClientRouter(RouterConfig config, DocumentStorage& storage, Logger& logger, TransportFactory factory)
    : config_(std::move(config))
    , storage_(storage)
    , logger_(logger)
{
    ClientOptions options;
    options.projectRoot      = config_.projectRoot;
    options.handshakeTimeout = config_.handshakeTimeout;
    options.requestTimeout   = config_.requestTimeout;
    options.shutdownTimeout  = config_.shutdownTimeout;

    clients_.reserve(config_.servers.size());
    for (const ServerConfig& server : config_.servers)
    {
        auto client =
            std::make_unique<ProcessClient>(server, options, factory(server, config_), storage_, logger_, &telemetry_);
        clientsByName_.emplace(server.name, client.get());
        clients_.push_back(std::move(client));
    }
    defaultClient_ = clientsByName_.at(config_.defaultServer);
}

ClientRouter::~ClientRouter()
{
    shutdownAll();
}

ProcessClient& ClientRouter::selectClient(const llvm::StringRef path)
{
    const std::string extension = normalizedExtension(path);
    const auto        route     = config_.routes.find(extension);
    if (route != config_.routes.end())
    {
        if (ProcessClient* routed = client(route->second))
        {
            return *routed;
        }
    }
    logger_.info("router",
                 "no server routed for extension '" + extension + "', defaulting to " + defaultClient_->name());
    return *defaultClient_;
}

ProcessClient* ClientRouter::client(const llvm::StringRef name)
{
    const auto it = clientsByName_.find(name.str());
    return it == clientsByName_.end() ? nullptr : it->second;
}

llvm::Expected<llvm::json::Array> ClientRouter::getDiagnostics(const llvm::StringRef path)
{
    llvm::Expected<PreparedDocument> prepared = prepareDocument(path, "diagnostics");
    if (!prepared)
    {
        return prepared.takeError();
    }

    if (config_.diagnosticsWait.count() == 0)
    {
        return prepared->client->cachedDiagnostics(prepared->path);
    }

    llvm::Expected<llvm::json::Array> diagnostics =
        prepared->client->waitForDiagnostics(prepared->path, prepared->version, config_.diagnosticsWait);
    if (!diagnostics)
    {
        return withContext(diagnostics.takeError(), "diagnostics", path);
    }
    return diagnostics;
}

llvm::Expected<llvm::json::Value> ClientRouter::getCompletions(const llvm::StringRef path,
                                                               const std::uint32_t   line,
                                                               const std::uint32_t   character)
{
    return positionRequest("textDocument/completion", path, line, character);
}

llvm::Expected<llvm::json::Value> ClientRouter::getDefinition(const llvm::StringRef path,
                                                              const std::uint32_t   line,
                                                              const std::uint32_t   character)
{
    return positionRequest("textDocument/definition", path, line, character);
}

llvm::Expected<FormatResult> ClientRouter::formatDocument(const llvm::StringRef path)
{
    constexpr llvm::StringRef Operation = "textDocument/formatting";

    llvm::Expected<PreparedDocument> prepared = prepareDocument(path, Operation);
    if (!prepared)
    {
        return prepared.takeError();
    }
    ProcessClient& client = *prepared->client;

    llvm::Expected<llvm::json::Value> result = client.request(
        Operation.str(),
        llvm::json::Object{
            {"textDocument", llvm::json::Object{{"uri", pathToUri(prepared->path)}}},
            {"options",
             llvm::json::Object{
                 {"tabSize", config_.formatting.tabSize},
                 {"insertSpaces", config_.formatting.insertSpaces},
             }},
        });
    if (!result)
    {
        return withContext(result.takeError(), Operation, path);
    }

    llvm::Expected<std::vector<TextEdit>> edits = parseTextEdits(*result);
    if (!edits)
    {
        return withContext(edits.takeError(), Operation, path);
    }
    if (edits->empty())
    {
        return FormatResult{false, std::nullopt, "No formatting changes needed or returned by the server."};
    }

    llvm::Expected<DocumentSnapshot> snapshot = client.documentSnapshot(prepared->path);
    if (!snapshot)
    {
        return withContext(snapshot.takeError(), Operation, path);
    }
    llvm::Expected<EditApplication> applied = applyTextEdits(snapshot->text, std::move(*edits));
    if (!applied)
    {
        return withContext(applied.takeError(), Operation, path);
    }
    if (!applied->changed)
    {
        return FormatResult{false, std::nullopt, "Formatting edits left the document unchanged."};
    }

    if (llvm::Error error = storage_.writeText(prepared->path, applied->text))
    {
        return withContext(std::move(error), Operation, path, ClientErrorKind::StorageFailure);
    }
    llvm::Expected<std::int64_t> version = client.notifyChanged(prepared->path, applied->text);
    if (!version)
    {
        return withContext(version.takeError(), Operation, path);
    }

    logger_.info(client.name(),
                 llvm::formatv("formatted {0} with {1} edit(s); now version {2}",
                               path,
                               applied->editCount,
                               *version));
    return FormatResult{true,
                        std::move(applied->text),
                        llvm::formatv("Applied {0} formatting edit(s).", applied->editCount).str()};
}

llvm::Error ClientRouter::closeDocument(const llvm::StringRef path)
{
    llvm::Expected<std::string> resolved = storage_.resolvePath(path);
    if (!resolved)
    {
        return withContext(resolved.takeError(), "textDocument/didClose", path, ClientErrorKind::InvalidArgument);
    }
    if (llvm::Error error = selectClient(*resolved).closeDocument(*resolved))
    {
        return withContext(std::move(error), "textDocument/didClose", path);
    }
    return llvm::Error::success();
}

void ClientRouter::shutdownAll()
{
    if (shutDown_.exchange(true))
    {
        return;
    }
    logger_.info("router", "shutting down all analysis servers");
    for (const std::unique_ptr<ProcessClient>& client : clients_)
    {
        client->shutdown();
    }
    logger_.info("router", "all analysis servers shut down");
}

llvm::Expected<ClientRouter::PreparedDocument> ClientRouter::prepareDocument(const llvm::StringRef path,
                                                                             const llvm::StringRef operation)
{
    if (shutDown_.load())
    {
        return makeClientError(ClientErrorKind::NotReady,
                               operation.str() + " failed for '" + path.str() + "': router is shut down");
    }

    llvm::Expected<std::string> resolved = storage_.resolvePath(path);
    if (!resolved)
    {
        return withContext(resolved.takeError(), operation, path, ClientErrorKind::InvalidArgument);
    }

    PreparedDocument prepared;
    prepared.client = &selectClient(*resolved);
    prepared.path   = std::move(*resolved);

    llvm::Expected<std::int64_t> version = prepared.client->ensureOpen(prepared.path);
    if (!version)
    {
        return withContext(version.takeError(), operation, path);
    }
    prepared.version = *version;

    if (!config_.resyncOnQuery)
    {
        return prepared;
    }

    llvm::Expected<std::string> onDisk = storage_.readText(prepared.path);
    if (!onDisk)
    {
        return withContext(onDisk.takeError(), operation, path, ClientErrorKind::StorageFailure);
    }
    llvm::Expected<DocumentSnapshot> synced = prepared.client->documentSnapshot(prepared.path);
    if (!synced)
    {
        return withContext(synced.takeError(), operation, path);
    }
    if (synced->text != *onDisk)
    {
        llvm::Expected<std::int64_t> resynced = prepared.client->notifyChanged(prepared.path, std::move(*onDisk));
        if (!resynced)
        {
            return withContext(resynced.takeError(), operation, path);
        }
        logger_.info(prepared.client->name(),
                     llvm::formatv("resynced {0} from disk at version {1}", path, *resynced));
        prepared.version = *resynced;
    }
    return prepared;
}

llvm::Expected<llvm::json::Value> ClientRouter::positionRequest(const llvm::StringRef method,
                                                                const llvm::StringRef path,
                                                                const std::uint32_t   line,
                                                                const std::uint32_t   character)
{
    llvm::Expected<PreparedDocument> prepared = prepareDocument(path, method);
    if (!prepared)
    {
        return prepared.takeError();
    }

    llvm::Expected<llvm::json::Value> result = prepared->client->request(
        method.str(),
        llvm::json::Object{
            {"textDocument", llvm::json::Object{{"uri", pathToUri(prepared->path)}}},
            {"position", llvm::json::Object{{"line", line}, {"character", character}}},
        });
    if (!result)
    {
        return withContext(result.takeError(), method, path);
    }
    return result;
}

}  // namespace fsmcp::lsp
