//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "fsmcp/LSP/EventLoop.h"

namespace
{

bool testFifoOrder()
{
    fsmcp::lsp::EventLoop loop;
    std::mutex            mutex;
    std::vector<int>      order;
    std::promise<void>    done;
    for (int i = 0; i < 50; ++i)
    {
        if (!loop.post([&mutex, &order, i]() {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            }))
        {
            std::cerr << "post should succeed on a running loop\n";
            return false;
        }
    }
    if (!loop.post([&done]() { done.set_value(); }))
    {
        std::cerr << "post should succeed on a running loop\n";
        return false;
    }
    if (done.get_future().wait_for(std::chrono::seconds(3)) != std::future_status::ready)
    {
        std::cerr << "timeout waiting for posted tasks\n";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex);
    for (int i = 0; i < 50; ++i)
    {
        if (order[static_cast<std::size_t>(i)] != i)
        {
            std::cerr << "tasks must run in posting order\n";
            return false;
        }
    }
    return true;
}

bool testLoopThreadIdentity()
{
    fsmcp::lsp::EventLoop loop;
    if (loop.isLoopThread())
    {
        std::cerr << "the caller thread is not the loop thread\n";
        return false;
    }
    std::promise<bool> inside;
    if (!loop.post([&loop, &inside]() { inside.set_value(loop.isLoopThread()); }))
    {
        std::cerr << "post should succeed on a running loop\n";
        return false;
    }
    std::future<bool> result = inside.get_future();
    if (result.wait_for(std::chrono::seconds(3)) != std::future_status::ready || !result.get())
    {
        std::cerr << "tasks should observe that they run on the loop thread\n";
        return false;
    }
    return true;
}

bool testTimers()
{
    fsmcp::lsp::EventLoop loop;
    std::atomic<bool>     cancelledFired{false};
    std::promise<void>    fired;
    const auto            start = std::chrono::steady_clock::now();

    const fsmcp::lsp::EventLoop::TimerId cancelled =
        loop.scheduleAfter(std::chrono::milliseconds(30), [&cancelledFired]() { cancelledFired.store(true); });
    const fsmcp::lsp::EventLoop::TimerId kept =
        loop.scheduleAfter(std::chrono::milliseconds(60), [&fired]() { fired.set_value(); });
    if (cancelled == 0 || kept == 0 || cancelled == kept)
    {
        std::cerr << "timer ids should be distinct and non-zero\n";
        return false;
    }
    if (!loop.cancelTimer(cancelled))
    {
        std::cerr << "cancelling a pending timer should succeed\n";
        return false;
    }
    if (loop.cancelTimer(cancelled))
    {
        std::cerr << "cancelling a timer twice should report false\n";
        return false;
    }

    if (fired.get_future().wait_for(std::chrono::seconds(3)) != std::future_status::ready)
    {
        std::cerr << "timeout waiting for timer\n";
        return false;
    }
    if (std::chrono::steady_clock::now() - start < std::chrono::milliseconds(60))
    {
        std::cerr << "timer fired before its delay\n";
        return false;
    }
    if (cancelledFired.load())
    {
        std::cerr << "a cancelled timer must not fire\n";
        return false;
    }
    return true;
}

bool testTaskFailureIsReported()
{
    std::mutex            mutex;
    std::string           reported;
    fsmcp::lsp::EventLoop loop([&mutex, &reported](const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        reported = message;
    });
    std::promise<void> after;
    const bool         postedThrow = loop.post([]() { throw std::runtime_error("boom"); });
    const bool         postedAfter = loop.post([&after]() { after.set_value(); });
    if (!postedThrow || !postedAfter)
    {
        std::cerr << "post should succeed on a running loop\n";
        return false;
    }
    if (after.get_future().wait_for(std::chrono::seconds(3)) != std::future_status::ready)
    {
        std::cerr << "a throwing task must not stop the loop\n";
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (reported.find("boom") == std::string::npos)
    {
        std::cerr << "task failure should reach the error sink\n";
        return false;
    }
    return true;
}

bool testShutdownDrainsQueue()
{
    fsmcp::lsp::EventLoop loop;
    std::atomic<int>      ran{0};
    for (int i = 0; i < 10; ++i)
    {
        if (!loop.post([&ran]() { ran.fetch_add(1); }))
        {
            std::cerr << "post should succeed on a running loop\n";
            return false;
        }
    }
    loop.shutdown();
    if (ran.load() != 10)
    {
        std::cerr << "shutdown should run tasks queued before it\n";
        return false;
    }
    if (loop.post([]() {}))
    {
        std::cerr << "post after shutdown should be rejected\n";
        return false;
    }
    if (loop.scheduleAfter(std::chrono::milliseconds(1), []() {}) != 0)
    {
        std::cerr << "timers after shutdown should be rejected\n";
        return false;
    }
    return true;
}

}  // namespace

bool runEventLoopTests()
{
    bool ok = true;
    ok      = testFifoOrder() && ok;
    ok      = testLoopThreadIdentity() && ok;
    ok      = testTimers() && ok;
    ok      = testTaskFailureIsReported() && ok;
    ok      = testShutdownDrainsQueue() && ok;
    return ok;
}
