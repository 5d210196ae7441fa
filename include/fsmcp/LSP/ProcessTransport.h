//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// POSIX subprocess transport speaking over stdio pipes.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_PROCESS_TRANSPORT_H
#define FSMCP_LSP_PROCESS_TRANSPORT_H

#include "fsmcp/LSP/Transport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace fsmcp::lsp
{

/// @brief Runs an analysis server as a child process.
///
/// The program is resolved on `PATH` and started without a shell, with its
/// working directory set to the project root. `write` only queues bytes; a
/// single I/O thread drains the queue into the non-blocking stdin pipe, reads
/// stdout and stderr, and reports the close as soon as stdout ends or either
/// pipe fails.
class ProcessTransport final : public Transport
{
public:
    /// @brief Grace period after closing stdin before `SIGTERM`.
    static constexpr std::chrono::milliseconds ExitGrace{200};

    /// @brief Grace period after `SIGTERM` before `SIGKILL`.
    static constexpr std::chrono::milliseconds TerminateGrace{1000};

    /// @brief Creates an idle transport.
    /// @param[in] command Program name or path.
    /// @param[in] args Arguments, excluding the program name.
    /// @param[in] workingDirectory Directory the child starts in.
    ProcessTransport(std::string command, std::vector<std::string> args, std::string workingDirectory);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&)            = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    [[nodiscard]] llvm::Error start(TransportCallbacks callbacks) override;
    [[nodiscard]] llvm::Error write(llvm::StringRef bytes) override;
    void                      terminate() override;
    [[nodiscard]] bool        running() const override;
    [[nodiscard]] std::string describe() const override;

    /// @brief Returns the child pid, or `-1` before a successful start.
    [[nodiscard]] pid_t pid() const
    {
        return pid_;
    }

private:
    void        ioLoop();
    std::string flushInput();
    void        wakeLocked();
    void        drainWakePipe();
    void        notifyClosed(const std::string& reason);
    std::string reap();
    bool        tryReap(std::chrono::milliseconds window, std::string& reason);
    void        markReaped();
    void        signalChild(int signal);
    bool        waitReaped(std::chrono::milliseconds timeout);
    void        closeFds();

    std::string              command_;
    std::vector<std::string> args_;
    std::string              workingDirectory_;
    TransportCallbacks       callbacks_;

    pid_t pid_{-1};
    int   stdinFd_{-1};
    int   stdoutFd_{-1};
    int   stderrFd_{-1};
    int   wakeReadFd_{-1};
    int   wakeWriteFd_{-1};

    std::thread ioThread_;

    /// Guards the descriptors, `pendingInput_` and the two flags below.
    std::mutex  writeMutex_;
    std::string pendingInput_;
    bool        inputClosing_{false};
    bool        stopping_{false};

    std::mutex              reapMutex_;
    std::condition_variable reapedCv_;
    bool                    reaped_{false};
    std::atomic<bool>       running_{false};
    std::atomic<bool>       terminating_{false};
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_PROCESS_TRANSPORT_H
