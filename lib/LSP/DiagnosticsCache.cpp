//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the diagnostics cache.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/DiagnosticsCache.h"

#include <utility>
#include <vector>

namespace fsmcp::lsp
{

void DiagnosticsCache::publish(const std::string& path, llvm::json::Array diagnostics, const std::int64_t version)
{
    DiagnosticsEntry& entry = entries_[path];
    entry.diagnostics       = std::move(diagnostics);
    entry.version           = version;

    std::vector<Waiter> ready;
    for (auto it = waiters_.begin(); it != waiters_.end();)
    {
        if (it->second.path == path && it->second.minVersion <= version)
        {
            ready.push_back(std::move(it->second.waiter));
            it = waiters_.erase(it);
            continue;
        }
        ++it;
    }

    // Waiters run after the map is consistent; they may register new waiters.
    for (Waiter& waiter : ready)
    {
        RpcOutcome outcome;
        outcome.result = llvm::json::Array(entry.diagnostics);
        waiter(std::move(outcome));
    }
}

const DiagnosticsEntry* DiagnosticsCache::lookup(const std::string& path) const
{
    const auto it = entries_.find(path);
    return it == entries_.end() ? nullptr : &it->second;
}

DiagnosticsCache::WaiterId DiagnosticsCache::addWaiter(const std::string& path,
                                                       const std::int64_t minVersion,
                                                       Waiter             waiter)
{
    if (const DiagnosticsEntry* entry = lookup(path); entry && entry->version >= minVersion)
    {
        RpcOutcome outcome;
        outcome.result = llvm::json::Array(entry->diagnostics);
        waiter(std::move(outcome));
        return 0;
    }

    const WaiterId id = nextWaiterId_++;
    waiters_.emplace(id, PendingWaiter{path, minVersion, std::move(waiter)});
    return id;
}

bool DiagnosticsCache::failWaiter(const WaiterId id, RpcOutcome outcome)
{
    const auto it = waiters_.find(id);
    if (it == waiters_.end())
    {
        return false;
    }
    Waiter waiter = std::move(it->second.waiter);
    waiters_.erase(it);
    waiter(std::move(outcome));
    return true;
}

void DiagnosticsCache::failAll(const RpcStatus status, const std::string& reason)
{
    std::map<WaiterId, PendingWaiter> waiters;
    waiters.swap(waiters_);
    for (auto& [_, pending] : waiters)
    {
        pending.waiter(RpcOutcome{status, nullptr, 0, reason});
    }
}

void DiagnosticsCache::erase(const std::string& path)
{
    entries_.erase(path);
}

}  // namespace fsmcp::lsp
