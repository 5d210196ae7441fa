//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Latest pushed diagnostics per document, with version-keyed waiters.
///
/// Servers publish diagnostics asynchronously after a document changes. Each
/// cached set is tagged with the document version it describes so callers can
/// wait for diagnostics of the version they just sent instead of sleeping.
/// Only the owning client's event loop touches the cache.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_DIAGNOSTICS_CACHE_H
#define FSMCP_LSP_DIAGNOSTICS_CACHE_H

#include "fsmcp/LSP/RpcOutcome.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>

namespace fsmcp::lsp
{

/// @brief Diagnostics set for one document.
struct DiagnosticsEntry final
{
    /// @brief Opaque LSP `Diagnostic` objects.
    llvm::json::Array diagnostics;

    /// @brief Document version the set describes.
    std::int64_t version{0};
};

/// @brief Per-path diagnostics cache.
class DiagnosticsCache final
{
public:
    /// @brief Receives an `Ok` outcome whose result is the diagnostics array,
    /// or a failure outcome.
    using Waiter   = std::function<void(RpcOutcome outcome)>;
    using WaiterId = std::uint64_t;

    /// @brief Replaces the set for `path` and wakes satisfied waiters.
    /// @param[in] path Absolute path.
    /// @param[in] diagnostics New diagnostics set; overwrites the previous one.
    /// @param[in] version Document version the set describes.
    void publish(const std::string& path, llvm::json::Array diagnostics, std::int64_t version);

    /// @brief Returns the cached set for `path`, or `nullptr`.
    [[nodiscard]] const DiagnosticsEntry* lookup(const std::string& path) const;

    /// @brief Waits for diagnostics of at least `minVersion`.
    ///
    /// A waiter already satisfied by the cache is invoked before returning.
    ///
    /// @param[in] path Absolute path.
    /// @param[in] minVersion Lowest acceptable document version.
    /// @param[in] waiter Callback invoked exactly once.
    /// @return Waiter id, or `0` when the waiter completed immediately.
    WaiterId addWaiter(const std::string& path, std::int64_t minVersion, Waiter waiter);

    /// @brief Completes a still-pending waiter with `outcome`.
    /// @param[in] id Waiter id from `addWaiter`.
    /// @param[in] outcome Outcome to deliver, typically `Timeout`.
    /// @return `true` when the waiter was still pending.
    bool failWaiter(WaiterId id, RpcOutcome outcome);

    /// @brief Completes every pending waiter with a failure status.
    void failAll(RpcStatus status, const std::string& reason);

    /// @brief Drops the cached set for `path`. Waiters stay registered.
    void erase(const std::string& path);

    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

    [[nodiscard]] std::size_t waiterCount() const
    {
        return waiters_.size();
    }

private:
    struct PendingWaiter final
    {
        std::string  path;
        std::int64_t minVersion{0};
        Waiter       waiter;
    };

    std::unordered_map<std::string, DiagnosticsEntry> entries_;
    std::map<WaiterId, PendingWaiter>                 waiters_;
    WaiterId                                          nextWaiterId_{1};
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_DIAGNOSTICS_CACHE_H
