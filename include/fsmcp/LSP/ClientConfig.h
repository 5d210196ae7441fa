//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Configuration for analysis server families and the client router.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_CLIENT_CONFIG_H
#define FSMCP_LSP_CLIENT_CONFIG_H

#include "fsmcp/LSP/Logger.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fsmcp::lsp
{

/// @brief Launch and language settings for one analysis server family.
struct ServerConfig final
{
    /// @brief Unique family name, for example `typescript`.
    std::string name;

    /// @brief Program name or path, resolved on `PATH`.
    std::string command;

    /// @brief Program arguments.
    std::vector<std::string> args;

    /// @brief Language ids the server handles.
    std::vector<std::string> languageIds;

    /// @brief Lowercase extension (with dot) to language id.
    std::map<std::string, std::string> extensionLanguageIds;

    /// @brief Language id used when no extension rule matches.
    std::string fallbackLanguageId;
};

/// @brief Options sent with `textDocument/formatting`.
struct FormattingOptions final
{
    std::uint32_t tabSize{2};
    bool          insertSpaces{true};
};

/// @brief Router configuration. Immutable once the router is built.
struct RouterConfig final
{
    /// @brief Absolute project root; servers start here and paths resolve here.
    std::string projectRoot;

    /// @brief Configured server families.
    std::vector<ServerConfig> servers;

    /// @brief Lowercase extension (with dot) to server name.
    std::map<std::string, std::string> routes;

    /// @brief Server used for extensions without a route.
    std::string defaultServer;

    std::chrono::milliseconds handshakeTimeout{15000};
    std::chrono::milliseconds requestTimeout{5000};
    std::chrono::milliseconds shutdownTimeout{2000};

    /// @brief Bounded wait for fresh diagnostics; `0` returns the cache as is.
    std::chrono::milliseconds diagnosticsWait{0};

    FormattingOptions formatting;

    /// @brief Pushes on-disk changes to the server before each query.
    bool resyncOnQuery{true};

    TraceLevel traceLevel{TraceLevel::Basic};
};

/// @brief Returns the built-in configuration: one TypeScript/JavaScript family.
/// @param[in] projectRoot Absolute project root.
/// @return Default configuration.
[[nodiscard]] RouterConfig defaultRouterConfig(std::string projectRoot);

/// @brief Applies a settings object on top of `config`.
///
/// Recognized keys: `projectRoot`, `servers`, `routes`, `defaultServer`,
/// `timeouts`, `formatting`, `resyncOnQuery`, `trace`. Unknown keys and
/// mistyped values are ignored. When `servers` is given without `routes`,
/// routes are derived from each server's extension map.
///
/// @param[in] settings Settings object.
/// @param[in,out] config Configuration to update.
/// @return `true` when `settings` was an object.
[[nodiscard]] bool applyRouterSettings(const llvm::json::Value& settings, RouterConfig& config);

/// @brief Reads a JSON settings file and applies it on top of `config`.
/// @param[in] path Settings file path.
/// @param[in,out] config Configuration to update.
/// @return Error when the file cannot be read or is not a JSON object.
[[nodiscard]] llvm::Error loadRouterConfig(llvm::StringRef path, RouterConfig& config);

/// @brief Applies `MCP_BASE_DIR` and `FSMCP_LSP_TRACE` when set.
void applyEnvironmentOverrides(RouterConfig& config);

/// @brief Checks that a configuration can build a router.
/// @param[in] config Configuration to check.
/// @return `InvalidArgument` error naming the first problem.
[[nodiscard]] llvm::Error validateRouterConfig(const RouterConfig& config);

/// @brief Returns the lowercase extension of `path` including the dot.
[[nodiscard]] std::string normalizedExtension(llvm::StringRef path);

/// @brief Picks the language id for `path` from the server's extension map.
[[nodiscard]] std::string languageIdForPath(const ServerConfig& server, llvm::StringRef path);

/// @brief Returns the configured server named `name`, or `nullptr`.
[[nodiscard]] const ServerConfig* findServer(const RouterConfig& config, llvm::StringRef name);

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_CLIENT_CONFIG_H
