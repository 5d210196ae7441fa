//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "fsmcp/LSP/DiagnosticsCache.h"
#include "llvm/Support/JSON.h"

namespace
{

llvm::json::Array diagnosticsWithMessage(const std::string& message)
{
    return llvm::json::Array{llvm::json::Object{{"message", message}, {"severity", 1}}};
}

std::size_t diagnosticCount(const fsmcp::lsp::RpcOutcome& outcome)
{
    const auto* array = outcome.result.getAsArray();
    return array ? array->size() : 0U;
}

bool testPublishAndLookup()
{
    fsmcp::lsp::DiagnosticsCache cache;
    if (cache.lookup("/work/a.ts") != nullptr)
    {
        std::cerr << "empty cache should have no entries\n";
        return false;
    }

    cache.publish("/work/a.ts", diagnosticsWithMessage("first"), 1);
    cache.publish("/work/a.ts", llvm::json::Array{}, 2);

    const auto* entry = cache.lookup("/work/a.ts");
    if (!entry || entry->version != 2 || !entry->diagnostics.empty() || cache.size() != 1)
    {
        std::cerr << "a newer publish should overwrite the cached set\n";
        return false;
    }

    cache.erase("/work/a.ts");
    if (cache.lookup("/work/a.ts") != nullptr)
    {
        std::cerr << "erase should drop the cached set\n";
        return false;
    }
    return true;
}

bool testWaitersWakeOnMatchingVersion()
{
    fsmcp::lsp::DiagnosticsCache        cache;
    std::vector<fsmcp::lsp::RpcOutcome> delivered;

    const auto id = cache.addWaiter("/work/a.ts", 2, [&delivered](fsmcp::lsp::RpcOutcome outcome) {
        delivered.push_back(std::move(outcome));
    });
    if (id == 0 || cache.waiterCount() != 1)
    {
        std::cerr << "waiter without cached diagnostics should stay pending\n";
        return false;
    }

    cache.publish("/work/other.ts", diagnosticsWithMessage("elsewhere"), 5);
    cache.publish("/work/a.ts", diagnosticsWithMessage("stale"), 1);
    if (!delivered.empty())
    {
        std::cerr << "other paths and older versions must not wake the waiter\n";
        return false;
    }

    cache.publish("/work/a.ts", diagnosticsWithMessage("fresh"), 2);
    if (delivered.size() != 1 || !delivered[0].ok() || diagnosticCount(delivered[0]) != 1 ||
        cache.waiterCount() != 0)
    {
        std::cerr << "publish of the awaited version should deliver once\n";
        return false;
    }

    if (cache.failWaiter(id, fsmcp::lsp::RpcOutcome{fsmcp::lsp::RpcStatus::Timeout, nullptr, 0, "late"}))
    {
        std::cerr << "completed waiter must not be failed afterwards\n";
        return false;
    }
    return true;
}

bool testSatisfiedWaiterCompletesImmediately()
{
    fsmcp::lsp::DiagnosticsCache cache;
    cache.publish("/work/a.ts", diagnosticsWithMessage("cached"), 3);

    bool       called = false;
    const auto id     = cache.addWaiter("/work/a.ts", 2, [&called](const fsmcp::lsp::RpcOutcome& outcome) {
        called = outcome.ok() && diagnosticCount(outcome) == 1;
    });
    if (id != 0 || !called || cache.waiterCount() != 0)
    {
        std::cerr << "a waiter satisfied by the cache should complete before returning\n";
        return false;
    }
    return true;
}

bool testFailures()
{
    fsmcp::lsp::DiagnosticsCache       cache;
    std::vector<fsmcp::lsp::RpcStatus> statuses;
    auto                               record = [&statuses](const fsmcp::lsp::RpcOutcome& outcome) {
        statuses.push_back(outcome.status);
    };

    const auto timed = cache.addWaiter("/work/a.ts", 1, record);
    cache.addWaiter("/work/b.ts", 1, record);
    cache.addWaiter("/work/c.ts", 1, record);

    if (!cache.failWaiter(timed, fsmcp::lsp::RpcOutcome{fsmcp::lsp::RpcStatus::Timeout, nullptr, 0, "slow"}))
    {
        std::cerr << "pending waiter should accept a failure\n";
        return false;
    }
    cache.failAll(fsmcp::lsp::RpcStatus::Unavailable, "server exited");

    if (statuses.size() != 3 || statuses[0] != fsmcp::lsp::RpcStatus::Timeout ||
        statuses[1] != fsmcp::lsp::RpcStatus::Unavailable || statuses[2] != fsmcp::lsp::RpcStatus::Unavailable ||
        cache.waiterCount() != 0)
    {
        std::cerr << "every waiter should complete exactly once on failure\n";
        return false;
    }
    return true;
}

}  // namespace

bool runDiagnosticsCacheTests()
{
    bool ok = true;
    ok      = testPublishAndLookup() && ok;
    ok      = testWaitersWakeOnMatchingVersion() && ok;
    ok      = testSatisfiedWaiterCompletesImmediately() && ok;
    ok      = testFailures() && ok;
    return ok;
}
