//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements router configuration parsing and validation.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/ClientConfig.h"

#include "fsmcp/Support/ClientError.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"

#include <memory>
#include <optional>
#include <utility>

namespace fsmcp::lsp
{
namespace
{

std::optional<std::vector<std::string>> parseStringArrayValue(const llvm::json::Value& value)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        return std::nullopt;
    }

    std::vector<std::string> out;
    out.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return std::nullopt;
        }
        out.emplace_back(text->str());
    }
    return out;
}

std::optional<std::map<std::string, std::string>> parseExtensionMap(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }

    std::map<std::string, std::string> out;
    for (const auto& [key, target] : *object)
    {
        const auto text = target.getAsString();
        if (!text)
        {
            return std::nullopt;
        }
        std::string extension = llvm::StringRef(key).lower();
        if (extension.empty() || extension.front() != '.')
        {
            extension.insert(extension.begin(), '.');
        }
        out.insert_or_assign(std::move(extension), text->str());
    }
    return out;
}

void applyMilliseconds(const llvm::json::Object& object, llvm::StringRef key, std::chrono::milliseconds& out)
{
    if (const auto value = object.getInteger(key))
    {
        if (*value >= 0)
        {
            out = std::chrono::milliseconds(*value);
        }
    }
}

std::optional<ServerConfig> parseServer(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }

    ServerConfig server;
    if (const auto name = object->getString("name"))
    {
        server.name = name->str();
    }
    if (const auto command = object->getString("command"))
    {
        server.command = command->str();
    }
    if (const auto* argsValue = object->get("args"))
    {
        if (auto args = parseStringArrayValue(*argsValue))
        {
            server.args = std::move(*args);
        }
    }
    if (const auto* languageIdsValue = object->get("languageIds"))
    {
        if (auto languageIds = parseStringArrayValue(*languageIdsValue))
        {
            server.languageIds = std::move(*languageIds);
        }
    }
    if (const auto* extensionsValue = object->get("extensions"))
    {
        if (auto extensions = parseExtensionMap(*extensionsValue))
        {
            server.extensionLanguageIds = std::move(*extensions);
        }
    }
    if (const auto fallback = object->getString("fallbackLanguageId"))
    {
        server.fallbackLanguageId = fallback->str();
    }
    else if (!server.languageIds.empty())
    {
        server.fallbackLanguageId = server.languageIds.front();
    }
    return server;
}

void applyServers(const llvm::json::Object& settings, RouterConfig& config)
{
    const auto* serversValue = settings.getArray("servers");
    if (!serversValue)
    {
        return;
    }

    std::vector<ServerConfig> servers;
    for (const llvm::json::Value& entry : *serversValue)
    {
        if (auto server = parseServer(entry))
        {
            servers.push_back(std::move(*server));
        }
    }
    config.servers = std::move(servers);

    if (!settings.get("routes"))
    {
        config.routes.clear();
        for (const ServerConfig& server : config.servers)
        {
            for (const auto& [extension, _] : server.extensionLanguageIds)
            {
                config.routes.emplace(extension, server.name);
            }
        }
    }
    if (!settings.get("defaultServer") && !config.servers.empty() && !findServer(config, config.defaultServer))
    {
        config.defaultServer = config.servers.front().name;
    }
}

void applyTimeouts(const llvm::json::Object& settings, RouterConfig& config)
{
    const auto* timeouts = settings.getObject("timeouts");
    if (!timeouts)
    {
        return;
    }
    applyMilliseconds(*timeouts, "handshakeMs", config.handshakeTimeout);
    applyMilliseconds(*timeouts, "requestMs", config.requestTimeout);
    applyMilliseconds(*timeouts, "shutdownMs", config.shutdownTimeout);
    applyMilliseconds(*timeouts, "diagnosticsWaitMs", config.diagnosticsWait);
}

void applyFormatting(const llvm::json::Object& settings, RouterConfig& config)
{
    const auto* formatting = settings.getObject("formatting");
    if (!formatting)
    {
        return;
    }
    if (const auto tabSize = formatting->getInteger("tabSize"))
    {
        if (*tabSize > 0)
        {
            config.formatting.tabSize = static_cast<std::uint32_t>(*tabSize);
        }
    }
    if (const auto insertSpaces = formatting->getBoolean("insertSpaces"))
    {
        config.formatting.insertSpaces = *insertSpaces;
    }
}

}  // namespace

RouterConfig defaultRouterConfig(std::string projectRoot)
{
    ServerConfig typescript;
    typescript.name        = "typescript";
    typescript.command     = "typescript-language-server";
    typescript.args        = {"--stdio"};
    typescript.languageIds = {"javascript", "typescript", "javascriptreact", "typescriptreact"};
    typescript.extensionLanguageIds = {
        {".ts", "typescript"},
        {".tsx", "typescriptreact"},
        {".js", "javascript"},
        {".jsx", "javascriptreact"},
        {".mjs", "javascript"},
        {".cjs", "javascript"},
    };
    typescript.fallbackLanguageId = "typescript";

    RouterConfig config;
    config.projectRoot = std::move(projectRoot);
    for (const auto& [extension, _] : typescript.extensionLanguageIds)
    {
        config.routes.emplace(extension, typescript.name);
    }
    config.defaultServer = typescript.name;
    config.servers.push_back(std::move(typescript));
    return config;
}

bool applyRouterSettings(const llvm::json::Value& settings, RouterConfig& config)
{
    const auto* object = settings.getAsObject();
    if (!object)
    {
        return false;
    }

    if (const auto projectRoot = object->getString("projectRoot"))
    {
        config.projectRoot = projectRoot->str();
    }
    applyServers(*object, config);
    if (const auto* routesValue = object->get("routes"))
    {
        if (auto routes = parseExtensionMap(*routesValue))
        {
            config.routes = std::move(*routes);
        }
    }
    if (const auto defaultServer = object->getString("defaultServer"))
    {
        config.defaultServer = defaultServer->str();
    }
    applyTimeouts(*object, config);
    applyFormatting(*object, config);
    if (const auto resync = object->getBoolean("resyncOnQuery"))
    {
        config.resyncOnQuery = *resync;
    }
    if (const auto trace = object->getString("trace"))
    {
        TraceLevel level = config.traceLevel;
        if (parseTraceLevel(*trace, level))
        {
            config.traceLevel = level;
        }
    }
    return true;
}

llvm::Error loadRouterConfig(const llvm::StringRef path, RouterConfig& config)
{
    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return makeClientError(ClientErrorKind::InvalidArgument,
                               "cannot read config '" + path.str() + "': " + buffer.getError().message());
    }

    llvm::Expected<llvm::json::Value> settings = llvm::json::parse((*buffer)->getBuffer());
    if (!settings)
    {
        return makeClientError(ClientErrorKind::InvalidArgument,
                               "invalid JSON in config '" + path.str() + "': " + llvm::toString(settings.takeError()));
    }
    if (!applyRouterSettings(*settings, config))
    {
        return makeClientError(ClientErrorKind::InvalidArgument, "config '" + path.str() + "' is not a JSON object");
    }
    return llvm::Error::success();
}

void applyEnvironmentOverrides(RouterConfig& config)
{
    if (const auto baseDir = llvm::sys::Process::GetEnv("MCP_BASE_DIR"))
    {
        if (!baseDir->empty())
        {
            config.projectRoot = *baseDir;
        }
    }
    if (const auto trace = llvm::sys::Process::GetEnv("FSMCP_LSP_TRACE"))
    {
        TraceLevel level = config.traceLevel;
        if (parseTraceLevel(*trace, level))
        {
            config.traceLevel = level;
        }
    }
}

llvm::Error validateRouterConfig(const RouterConfig& config)
{
    auto invalid = [](const llvm::Twine& message) {
        return makeClientError(ClientErrorKind::InvalidArgument, message.str());
    };

    if (config.projectRoot.empty())
    {
        return invalid("project root is not set");
    }
    if (config.servers.empty())
    {
        return invalid("no analysis servers are configured");
    }

    llvm::StringSet<> names;
    for (const ServerConfig& server : config.servers)
    {
        if (server.name.empty())
        {
            return invalid("a configured server has no name");
        }
        if (!names.insert(server.name).second)
        {
            return invalid("server name '" + server.name + "' is configured twice");
        }
        if (server.command.empty())
        {
            return invalid("server '" + server.name + "' has no command");
        }
    }

    for (const auto& [extension, serverName] : config.routes)
    {
        if (names.count(serverName) == 0U)
        {
            return invalid("route for '" + extension + "' names unknown server '" + serverName + "'");
        }
    }
    if (names.count(config.defaultServer) == 0U)
    {
        return invalid("default server '" + config.defaultServer + "' is not configured");
    }

    if (config.handshakeTimeout.count() <= 0 || config.requestTimeout.count() <= 0 ||
        config.shutdownTimeout.count() <= 0)
    {
        return invalid("handshake, request and shutdown timeouts must be positive");
    }
    if (config.diagnosticsWait.count() < 0)
    {
        return invalid("diagnostics wait must not be negative");
    }
    return llvm::Error::success();
}

std::string normalizedExtension(const llvm::StringRef path)
{
    return llvm::sys::path::extension(path).lower();
}

std::string languageIdForPath(const ServerConfig& server, const llvm::StringRef path)
{
    const auto it = server.extensionLanguageIds.find(normalizedExtension(path));
    if (it != server.extensionLanguageIds.end())
    {
        return it->second;
    }
    return server.fallbackLanguageId;
}

const ServerConfig* findServer(const RouterConfig& config, const llvm::StringRef name)
{
    for (const ServerConfig& server : config.servers)
    {
        if (server.name == name)
        {
            return &server;
        }
    }
    return nullptr;
}

}  // namespace fsmcp::lsp
