//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Single-consumer task loop with one-shot timers.
///
/// Each process client owns one loop. Every mutation of client state runs as
/// a task on the loop thread, so the client needs no locks around its maps;
/// other threads only post tasks.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_EVENT_LOOP_H
#define FSMCP_LSP_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace fsmcp::lsp
{

/// @brief Worker thread executing posted tasks and expired timers in order.
class EventLoop final
{
public:
    using Task      = std::function<void()>;
    using TimerId   = std::uint64_t;
    using ErrorSink = std::function<void(const std::string& message)>;

    /// @brief Starts the worker thread.
    /// @param[in] errorSink Receives the text of exceptions escaping tasks.
    explicit EventLoop(ErrorSink errorSink = {});
    ~EventLoop();

    EventLoop(const EventLoop&)            = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// @brief Queues a task behind all previously posted tasks.
    /// @param[in] task Task body.
    /// @return `false` when the loop is stopping and the task was dropped.
    [[nodiscard]] bool post(Task task);

    /// @brief Schedules a one-shot timer.
    /// @param[in] delay Delay from now.
    /// @param[in] task Task body run on expiry.
    /// @return Timer id, or `0` when the loop is stopping.
    TimerId scheduleAfter(std::chrono::milliseconds delay, Task task);

    /// @brief Cancels a pending timer.
    /// @param[in] timer Timer id from `scheduleAfter`.
    /// @return `true` when the timer was pending and is now cancelled.
    bool cancelTimer(TimerId timer);

    /// @brief Returns whether the caller runs on the loop thread.
    [[nodiscard]] bool isLoopThread() const;

    /// @brief Runs remaining queued tasks, drops timers and joins the worker.
    ///
    /// Called from the loop thread, only marks the loop as stopping.
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_EVENT_LOOP_H
