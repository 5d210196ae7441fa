//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request telemetry aggregation and sink integration.
///
/// Every request a client issues to its analysis server produces one sample
/// with its latency and outcome. Samples are counted per method and forwarded
/// to an optional sink for tracing and tests.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_TELEMETRY_H
#define FSMCP_LSP_TELEMETRY_H

#include "fsmcp/LSP/RpcOutcome.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fsmcp::lsp
{

/// @brief Immutable telemetry sample for a completed request.
struct RequestMetric final
{
    /// @brief Name of the client that issued the request.
    std::string client;

    /// @brief LSP method name.
    std::string method;

    /// @brief Time from write to completion in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief How the request completed.
    RpcStatus outcome{RpcStatus::Ok};
};

/// @brief Sink callback invoked for each telemetry sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Thread-safe request telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded metrics.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one request metric sample.
    /// @param[in] metric Completed request sample.
    void record(const RequestMetric& metric);

    /// @brief Returns total recorded request count for the method.
    /// @param[in] method LSP method name.
    /// @return Number of samples recorded for `method`.
    [[nodiscard]] std::uint64_t requestCount(std::string_view method) const;

    /// @brief Returns the number of samples recorded with `outcome`.
    [[nodiscard]] std::uint64_t outcomeCount(RpcStatus outcome) const;

private:
    mutable std::mutex                             mutex_;
    RequestMetricSink                              sink_;
    std::unordered_map<std::string, std::uint64_t> requestCounts_;
    std::unordered_map<int, std::uint64_t>         outcomeCounts_;
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_TELEMETRY_H
