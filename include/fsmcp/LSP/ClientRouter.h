//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Caller-facing language intelligence operations.
///
/// The router owns one `ProcessClient` per configured server family, picks
/// the client for a file by extension and exposes diagnostics, completion,
/// definition and formatting. The driver builds exactly one router and passes
/// it by reference; `shutdownAll` tears every client down once.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_CLIENT_ROUTER_H
#define FSMCP_LSP_CLIENT_ROUTER_H

#include "fsmcp/LSP/ClientConfig.h"
#include "fsmcp/LSP/Logger.h"
#include "fsmcp/LSP/ProcessClient.h"
#include "fsmcp/LSP/Telemetry.h"
#include "fsmcp/LSP/Transport.h"
#include "fsmcp/Support/FileStorage.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fsmcp::lsp
{

/// @brief Creates the transport for one server family.
using TransportFactory = std::function<std::unique_ptr<Transport>(const ServerConfig&, const RouterConfig&)>;

/// @brief Outcome of `formatDocument`.
struct FormatResult final
{
    /// @brief `true` when the document text changed and was written back.
    bool applied{false};

    /// @brief New document text when `applied`.
    std::optional<std::string> newContent;

    /// @brief Human-readable summary.
    std::string message;
};

/// @brief Returns the subprocess transport factory used outside of tests.
[[nodiscard]] TransportFactory processTransportFactory();

/// @brief Routes language intelligence requests to analysis servers.
class ClientRouter final
{
public:
    /// @brief Validates `config` and builds a router.
    /// @param[in] config Router configuration.
    /// @param[in] storage Document storage; must outlive the router.
    /// @param[in] logger Shared logger; must outlive the router.
    /// @param[in] factory Transport factory; subprocesses when empty.
    /// @return Router or `InvalidArgument`.
    [[nodiscard]] static llvm::Expected<std::unique_ptr<ClientRouter>>
    create(RouterConfig config, DocumentStorage& storage, Logger& logger, TransportFactory factory = {});

    /// @brief Runs `shutdownAll`.
    ~ClientRouter();

    ClientRouter(const ClientRouter&)            = delete;
    ClientRouter& operator=(const ClientRouter&) = delete;

    [[nodiscard]] const RouterConfig& config() const
    {
        return config_;
    }

    [[nodiscard]] Telemetry& telemetry()
    {
        return telemetry_;
    }

    /// @brief Picks the client for a file by its extension.
    ///
    /// Extensions without a route fall back to the default client.
    ///
    /// @param[in] path File path; only the extension is inspected.
    /// @return Selected client.
    [[nodiscard]] ProcessClient& selectClient(llvm::StringRef path);

    /// @brief Returns the client for a server family, or `nullptr`.
    [[nodiscard]] ProcessClient* client(llvm::StringRef name);

    /// @brief Returns diagnostics the server published for a file.
    ///
    /// Opens the file when needed. Without a diagnostics wait, returns the
    /// cached set (empty when nothing was published yet); otherwise waits for
    /// diagnostics of the current document version.
    ///
    /// @param[in] path Absolute or project-relative path.
    /// @return Diagnostics array or error.
    [[nodiscard]] llvm::Expected<llvm::json::Array> getDiagnostics(llvm::StringRef path);

    /// @brief Requests completion items at a position.
    /// @return `CompletionList`, `CompletionItem[]` or `null`, as sent by the server.
    [[nodiscard]] llvm::Expected<llvm::json::Value>
    getCompletions(llvm::StringRef path, std::uint32_t line, std::uint32_t character);

    /// @brief Requests the definition of the symbol at a position.
    /// @return `Location`, `Location[]`, `LocationLink[]` or `null`.
    [[nodiscard]] llvm::Expected<llvm::json::Value>
    getDefinition(llvm::StringRef path, std::uint32_t line, std::uint32_t character);

    /// @brief Formats a document and writes the result back through storage.
    [[nodiscard]] llvm::Expected<FormatResult> formatDocument(llvm::StringRef path);

    /// @brief Sends `didClose` for a file opened by an earlier operation.
    [[nodiscard]] llvm::Error closeDocument(llvm::StringRef path);

    /// @brief Shuts every client down. Only the first call has an effect.
    void shutdownAll();

private:
    struct PreparedDocument final
    {
        ProcessClient* client{nullptr};
        std::string    path;
        std::int64_t   version{0};
    };

    ClientRouter(RouterConfig config, DocumentStorage& storage, Logger& logger, TransportFactory factory);

    llvm::Expected<PreparedDocument> prepareDocument(llvm::StringRef path, llvm::StringRef operation);
    llvm::Expected<llvm::json::Value>
    positionRequest(llvm::StringRef method, llvm::StringRef path, std::uint32_t line, std::uint32_t character);

    RouterConfig                                    config_;
    DocumentStorage&                                storage_;
    Logger&                                         logger_;
    Telemetry                                       telemetry_;
    std::vector<std::unique_ptr<ProcessClient>>     clients_;
    std::unordered_map<std::string, ProcessClient*> clientsByName_;
    ProcessClient*                                  defaultClient_{nullptr};
    std::atomic<bool>                               shutDown_{false};
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_CLIENT_ROUTER_H
