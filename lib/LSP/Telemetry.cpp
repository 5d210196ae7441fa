//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request telemetry recording and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/Telemetry.h"

#include <utility>

namespace fsmcp::lsp
{

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(const RequestMetric& metric)
{
    RequestMetricSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++requestCounts_[metric.method];
        ++outcomeCounts_[static_cast<int>(metric.outcome)];
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

std::uint64_t Telemetry::requestCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = requestCounts_.find(std::string(method));
    return it == requestCounts_.end() ? 0U : it->second;
}

std::uint64_t Telemetry::outcomeCount(const RpcStatus outcome) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = outcomeCounts_.find(static_cast<int>(outcome));
    return it == outcomeCounts_.end() ? 0U : it->second;
}

}  // namespace fsmcp::lsp
