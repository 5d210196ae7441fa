//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the subprocess transport.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/ProcessTransport.h"

#include "fsmcp/Support/ClientError.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Program.h"

#include <cerrno>
#include <csignal>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

#if defined(__linux__)
#include <sys/prctl.h>
#endif

namespace fsmcp::lsp
{
namespace
{

constexpr std::size_t ReadChunkBytes = 65536U;

/// Input queued for a server that does not drain its stdin.
constexpr std::size_t MaxPendingInputBytes = 64U * 1024U * 1024U;

/// How long a closed output stream waits for the child's exit status.
constexpr std::chrono::milliseconds CloseReapWindow{250};
constexpr std::chrono::milliseconds ReapPollInterval{10};

void closeFd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

bool makePipe(int fds[2])
{
    return ::pipe2(fds, O_CLOEXEC) == 0;
}

bool setNonBlocking(const int fd)
{
    const int flags = ::fcntl(fd, F_GETFL);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void ignoreSigpipeOnce()
{
    static std::once_flag once;
    std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

std::string describeWaitStatus(const int status)
{
    if (WIFEXITED(status))
    {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status))
    {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "ended with status " + std::to_string(status);
}

/// Splits complete lines off `pending` and forwards them.
void flushLines(std::string& pending, const std::function<void(std::string)>& sink, const bool final)
{
    std::size_t start = 0U;
    while (true)
    {
        const std::size_t newline = pending.find('\n', start);
        if (newline == std::string::npos)
        {
            break;
        }
        std::size_t end = newline;
        if (end > start && pending[end - 1U] == '\r')
        {
            --end;
        }
        if (sink)
        {
            sink(pending.substr(start, end - start));
        }
        start = newline + 1U;
    }
    pending.erase(0, start);
    if (final && !pending.empty())
    {
        if (sink)
        {
            sink(pending);
        }
        pending.clear();
    }
}

}  // namespace

ProcessTransport::ProcessTransport(std::string command, std::vector<std::string> args, std::string workingDirectory)
    : command_(std::move(command))
    , args_(std::move(args))
    , workingDirectory_(std::move(workingDirectory))
{
}

ProcessTransport::~ProcessTransport()
{
    terminate();
}

llvm::Error ProcessTransport::start(TransportCallbacks callbacks)
{
    if (pid_ >= 0)
    {
        return makeClientError(ClientErrorKind::LaunchFailure, "'" + command_ + "' was already started");
    }
    ignoreSigpipeOnce();

    llvm::ErrorOr<std::string> program = llvm::sys::findProgramByName(command_);
    if (!program)
    {
        return makeClientError(ClientErrorKind::LaunchFailure,
                               "cannot find '" + command_ + "': " + program.getError().message());
    }

    // argv and the working directory are prepared before fork; the child only
    // calls async-signal-safe functions.
    std::vector<char*> argv;
    argv.reserve(args_.size() + 2U);
    argv.push_back(command_.data());
    for (std::string& arg : args_)
    {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const char* cwd = workingDirectory_.empty() ? nullptr : workingDirectory_.c_str();

    int stdinPipe[2]  = {-1, -1};
    int stdoutPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};
    int execPipe[2]   = {-1, -1};
    int wakePipe[2]   = {-1, -1};
    auto closeAll     = [&]() {
        for (int* fds : {stdinPipe, stdoutPipe, stderrPipe, execPipe, wakePipe})
        {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
    };
    if (!makePipe(stdinPipe) || !makePipe(stdoutPipe) || !makePipe(stderrPipe) || !makePipe(execPipe) ||
        !makePipe(wakePipe) || !setNonBlocking(stdinPipe[1]) || !setNonBlocking(wakePipe[0]) ||
        !setNonBlocking(wakePipe[1]))
    {
        const int savedErrno = errno;
        closeAll();
        return makeClientError(ClientErrorKind::LaunchFailure,
                               "cannot create pipes for '" + command_ + "': " + std::strerror(savedErrno));
    }

    const pid_t child = ::fork();
    if (child < 0)
    {
        const int savedErrno = errno;
        closeAll();
        return makeClientError(ClientErrorKind::LaunchFailure,
                               "cannot fork for '" + command_ + "': " + std::strerror(savedErrno));
    }

    if (child == 0)
    {
#if defined(__linux__)
        ::prctl(PR_SET_PDEATHSIG, SIGTERM);
#endif
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t unblocked;
        sigemptyset(&unblocked);
        ::sigprocmask(SIG_SETMASK, &unblocked, nullptr);
        ::dup2(stdinPipe[0], STDIN_FILENO);
        ::dup2(stdoutPipe[1], STDOUT_FILENO);
        ::dup2(stderrPipe[1], STDERR_FILENO);
        int childErrno = 0;
        if (cwd != nullptr && ::chdir(cwd) != 0)
        {
            childErrno = errno;
        }
        else
        {
            ::execv(program->c_str(), argv.data());
            childErrno = errno;
        }
        [[maybe_unused]] const ssize_t ignored = ::write(execPipe[1], &childErrno, sizeof(childErrno));
        _exit(127);
    }

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);
    closeFd(execPipe[1]);

    // The exec pipe is close-on-exec: EOF means exec succeeded.
    int     childErrno = 0;
    ssize_t readBytes  = 0;
    do
    {
        readBytes = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (readBytes < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (readBytes > 0)
    {
        int status = 0;
        while (::waitpid(child, &status, 0) < 0 && errno == EINTR)
        {
        }
        closeAll();
        return makeClientError(ClientErrorKind::LaunchFailure,
                               "cannot execute '" + *program + "' in '" + workingDirectory_ +
                                   "': " + std::strerror(childErrno));
    }

    pid_         = child;
    stdinFd_     = stdinPipe[1];
    stdoutFd_    = stdoutPipe[0];
    stderrFd_    = stderrPipe[0];
    wakeReadFd_  = wakePipe[0];
    wakeWriteFd_ = wakePipe[1];
    callbacks_   = std::move(callbacks);
    running_.store(true);
    ioThread_ = std::thread([this]() { ioLoop(); });
    return llvm::Error::success();
}

llvm::Error ProcessTransport::write(const llvm::StringRef bytes)
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (stdinFd_ < 0 || inputClosing_ || !running_.load())
    {
        return makeClientError(ClientErrorKind::Unavailable, "'" + command_ + "' is not running");
    }
    if (pendingInput_.size() + bytes.size() > MaxPendingInputBytes)
    {
        return makeClientError(ClientErrorKind::Unavailable,
                               llvm::formatv("'{0}' is not reading its input ({1} bytes queued)",
                                             command_,
                                             pendingInput_.size())
                                   .str());
    }
    pendingInput_.append(bytes.data(), bytes.size());
    wakeLocked();
    return llvm::Error::success();
}

void ProcessTransport::terminate()
{
    if (pid_ < 0)
    {
        return;
    }
    if (terminating_.exchange(true))
    {
        if (ioThread_.joinable() && ioThread_.get_id() != std::this_thread::get_id())
        {
            ioThread_.join();
        }
        return;
    }

    // Queued input (typically `exit`) is flushed before stdin closes.
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        inputClosing_ = true;
        wakeLocked();
    }

    if (!waitReaped(ExitGrace))
    {
        signalChild(SIGTERM);
        if (!waitReaped(TerminateGrace))
        {
            signalChild(SIGKILL);
        }
    }

    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        stopping_ = true;
        wakeLocked();
    }
    if (ioThread_.joinable() && ioThread_.get_id() != std::this_thread::get_id())
    {
        ioThread_.join();
    }
    closeFds();
}

bool ProcessTransport::running() const
{
    return running_.load();
}

std::string ProcessTransport::describe() const
{
    std::string text = command_;
    for (const std::string& arg : args_)
    {
        text += ' ';
        text += arg;
    }
    if (pid_ >= 0)
    {
        text += " (pid " + std::to_string(pid_) + ")";
    }
    return text;
}

void ProcessTransport::ioLoop()
{
    std::string stderrPending;
    bool        stderrOpen = true;
    bool        stopped    = false;
    std::string closeReason;
    char        chunk[ReadChunkBytes];

    while (closeReason.empty())
    {
        int inputFd = -1;
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            if (stopping_)
            {
                stopped = true;
                break;
            }
            if (inputClosing_ && pendingInput_.empty())
            {
                closeFd(stdinFd_);
            }
            if (!pendingInput_.empty())
            {
                inputFd = stdinFd_;
            }
        }

        pollfd fds[4] = {
            {stdoutFd_, POLLIN, 0},
            {stderrOpen ? stderrFd_ : -1, POLLIN, 0},
            {wakeReadFd_, POLLIN, 0},
            {inputFd, POLLOUT, 0},
        };
        const int ready = ::poll(fds, 4, -1);
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            closeReason = std::string("could not be polled: ") + std::strerror(errno);
            break;
        }

        if ((fds[2].revents & POLLIN) != 0)
        {
            drainWakePipe();
        }

        if (inputFd >= 0 && (fds[3].revents & (POLLOUT | POLLERR | POLLHUP)) != 0)
        {
            closeReason = flushInput();
        }

        if (stderrOpen && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0)
        {
            const ssize_t n = ::read(stderrFd_, chunk, sizeof(chunk));
            if (n > 0)
            {
                stderrPending.append(chunk, static_cast<std::size_t>(n));
                flushLines(stderrPending, callbacks_.onStderr, false);
            }
            else if (n == 0 || errno != EINTR)
            {
                stderrOpen = false;
            }
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0)
        {
            const ssize_t n = ::read(stdoutFd_, chunk, sizeof(chunk));
            if (n > 0)
            {
                if (callbacks_.onData)
                {
                    callbacks_.onData(std::string(chunk, static_cast<std::size_t>(n)));
                }
            }
            else if (n == 0)
            {
                closeReason = "closed its output stream";
            }
            else if (errno != EINTR)
            {
                closeReason = std::string("output stream failed: ") + std::strerror(errno);
            }
        }
    }

    flushLines(stderrPending, callbacks_.onStderr, true);
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        running_.store(false);
        pendingInput_.clear();
        closeFd(stdinFd_);
    }

    if (stopped)
    {
        notifyClosed(reap());
        return;
    }

    // A stream that ends because the child exited reports the exit status.
    // A child that keeps running is reported now and reaped once it stops.
    std::string status;
    if (tryReap(CloseReapWindow, status))
    {
        notifyClosed(status);
        return;
    }
    notifyClosed(closeReason);
    [[maybe_unused]] const std::string late = reap();
}

std::string ProcessTransport::flushInput()
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    while (!pendingInput_.empty() && stdinFd_ >= 0)
    {
        const ssize_t n = ::write(stdinFd_, pendingInput_.data(), pendingInput_.size());
        if (n >= 0)
        {
            pendingInput_.erase(0, static_cast<std::size_t>(n));
            continue;
        }
        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            return {};
        }
        const std::string reason = std::string("input stream failed: ") + std::strerror(errno);
        pendingInput_.clear();
        closeFd(stdinFd_);
        return reason;
    }
    return {};
}

void ProcessTransport::wakeLocked()
{
    if (wakeWriteFd_ >= 0)
    {
        // A full wake pipe already guarantees a pending wakeup.
        const char wake = 'x';
        [[maybe_unused]] const ssize_t ignored = ::write(wakeWriteFd_, &wake, 1);
    }
}

void ProcessTransport::drainWakePipe()
{
    char buffer[64];
    while (::read(wakeReadFd_, buffer, sizeof(buffer)) > 0)
    {
    }
}

void ProcessTransport::notifyClosed(const std::string& reason)
{
    if (callbacks_.onClosed)
    {
        callbacks_.onClosed("'" + command_ + "' " + reason);
    }
}

std::string ProcessTransport::reap()
{
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            const std::string reason = std::string("could not be reaped: ") + std::strerror(errno);
            markReaped();
            return reason;
        }
    }
    markReaped();
    return describeWaitStatus(status);
}

bool ProcessTransport::tryReap(const std::chrono::milliseconds window, std::string& reason)
{
    const auto deadline = std::chrono::steady_clock::now() + window;
    while (true)
    {
        int         status = 0;
        const pid_t result = ::waitpid(pid_, &status, WNOHANG);
        if (result == pid_)
        {
            markReaped();
            reason = describeWaitStatus(status);
            return true;
        }
        if (result < 0 && errno != EINTR)
        {
            reason = std::string("could not be reaped: ") + std::strerror(errno);
            markReaped();
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(ReapPollInterval);
    }
}

void ProcessTransport::markReaped()
{
    {
        std::lock_guard<std::mutex> lock(reapMutex_);
        reaped_ = true;
    }
    reapedCv_.notify_all();
}

void ProcessTransport::signalChild(const int signal)
{
    std::lock_guard<std::mutex> lock(reapMutex_);
    if (!reaped_)
    {
        ::kill(pid_, signal);
    }
}

bool ProcessTransport::waitReaped(const std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(reapMutex_);
    return reapedCv_.wait_for(lock, timeout, [this]() { return reaped_; });
}

void ProcessTransport::closeFds()
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    closeFd(stdinFd_);
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
    closeFd(wakeReadFd_);
    closeFd(wakeWriteFd_);
}

}  // namespace fsmcp::lsp
