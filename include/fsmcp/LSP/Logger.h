//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Thread-safe line logger shared by clients, transports and the router.
///
/// Lines are written as `[fsmcp][scope] message` to an LLVM output stream and
/// gated by the configured trace level.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_LOGGER_H
#define FSMCP_LSP_LOGGER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <atomic>
#include <mutex>

namespace llvm
{
class raw_ostream;
}  // namespace llvm

namespace fsmcp::lsp
{

/// @brief Trace verbosity level for client logs.
enum class TraceLevel
{
    /// @brief Only errors are written.
    Off,

    /// @brief Lifecycle events, window messages and errors.
    Basic,

    /// @brief Every message sent and received.
    Verbose,
};

/// @brief Parses a trace level name (`off`, `basic`, `verbose`).
/// @param[in] name Level name, case-insensitive.
/// @param[out] level Parsed level.
/// @return `true` when `name` is a known level.
[[nodiscard]] bool parseTraceLevel(llvm::StringRef name, TraceLevel& level);

/// @brief Serializes logging from multiple threads onto one stream.
class Logger final
{
public:
    /// @brief Creates a logger.
    /// @param[in] level Initial trace level.
    /// @param[in] out Destination stream; `nullptr` selects `llvm::errs()`.
    explicit Logger(TraceLevel level = TraceLevel::Basic, llvm::raw_ostream* out = nullptr);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(TraceLevel level);

    [[nodiscard]] TraceLevel level() const
    {
        return level_.load(std::memory_order_relaxed);
    }

    /// @brief Returns whether messages at `level` are written.
    [[nodiscard]] bool enabled(TraceLevel level) const;

    /// @brief Writes an error line regardless of trace level.
    void error(llvm::StringRef scope, const llvm::Twine& message);

    /// @brief Writes a lifecycle line at `Basic` level.
    void info(llvm::StringRef scope, const llvm::Twine& message);

    /// @brief Writes a per-message trace line at `Verbose` level.
    void trace(llvm::StringRef scope, const llvm::Twine& message);

private:
    void write(llvm::StringRef scope, const llvm::Twine& message);

    std::atomic<TraceLevel> level_;
    llvm::raw_ostream&      out_;
    std::mutex              mutex_;
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_LOGGER_H
