//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the serialized line logger.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/Logger.h"

#include "llvm/Support/raw_ostream.h"

namespace fsmcp::lsp
{

bool parseTraceLevel(const llvm::StringRef name, TraceLevel& level)
{
    const std::string normalized = name.trim().lower();
    if (normalized == "off")
    {
        level = TraceLevel::Off;
        return true;
    }
    if (normalized == "basic" || normalized == "messages")
    {
        level = TraceLevel::Basic;
        return true;
    }
    if (normalized == "verbose")
    {
        level = TraceLevel::Verbose;
        return true;
    }
    return false;
}

Logger::Logger(const TraceLevel level, llvm::raw_ostream* out)
    : level_(level)
    , out_(out ? *out : llvm::errs())
{
}

void Logger::setLevel(const TraceLevel level)
{
    level_.store(level, std::memory_order_relaxed);
}

bool Logger::enabled(const TraceLevel level) const
{
    return static_cast<int>(level) <= static_cast<int>(level_.load(std::memory_order_relaxed));
}

void Logger::error(const llvm::StringRef scope, const llvm::Twine& message)
{
    write(scope, "error: " + message);
}

void Logger::info(const llvm::StringRef scope, const llvm::Twine& message)
{
    if (enabled(TraceLevel::Basic))
    {
        write(scope, message);
    }
}

void Logger::trace(const llvm::StringRef scope, const llvm::Twine& message)
{
    if (enabled(TraceLevel::Verbose))
    {
        write(scope, message);
    }
}

void Logger::write(const llvm::StringRef scope, const llvm::Twine& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[fsmcp]";
    if (!scope.empty())
    {
        out_ << "[" << scope << "]";
    }
    out_ << " " << message << "\n";
    out_.flush();
}

}  // namespace fsmcp::lsp
