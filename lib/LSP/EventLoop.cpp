//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the single-consumer task loop.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/EventLoop.h"

#include <condition_variable>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace fsmcp::lsp
{

class EventLoop::Impl final
{
public:
    explicit Impl(ErrorSink errorSink)
        : errorSink_(std::move(errorSink))
        , worker_([this]() { run(); })
    {
    }

    ~Impl()
    {
        shutdown();
        if (worker_.joinable())
        {
            worker_.detach();
        }
    }

    bool post(Task task)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return false;
            }
            queue_.push_back(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    TimerId scheduleAfter(const std::chrono::milliseconds delay, Task task)
    {
        TimerId id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return 0;
            }
            id             = nextTimerId_++;
            const auto due = Clock::now() + delay;
            timerIndex_.emplace(id, timers_.emplace(due, TimerEntry{id, std::move(task)}));
        }
        cv_.notify_one();
        return id;
    }

    bool cancelTimer(const TimerId timer)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = timerIndex_.find(timer);
        if (it == timerIndex_.end())
        {
            return false;
        }
        timers_.erase(it->second);
        timerIndex_.erase(it);
        return true;
    }

    bool isLoopThread() const
    {
        return std::this_thread::get_id() == worker_.get_id();
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            timers_.clear();
            timerIndex_.clear();
        }
        cv_.notify_all();
        if (!isLoopThread() && worker_.joinable())
        {
            worker_.join();
        }
    }

private:
    using Clock = std::chrono::steady_clock;

    struct TimerEntry final
    {
        TimerId id{0};
        Task    task;
    };

    using TimerMap = std::multimap<Clock::time_point, TimerEntry>;

    void run()
    {
        while (true)
        {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                while (true)
                {
                    if (!queue_.empty())
                    {
                        task = std::move(queue_.front());
                        queue_.pop_front();
                        break;
                    }
                    if (stopping_)
                    {
                        return;
                    }
                    if (timers_.empty())
                    {
                        cv_.wait(lock);
                        continue;
                    }
                    const auto earliest = timers_.begin();
                    if (earliest->first <= Clock::now())
                    {
                        task = std::move(earliest->second.task);
                        timerIndex_.erase(earliest->second.id);
                        timers_.erase(earliest);
                        break;
                    }
                    cv_.wait_until(lock, earliest->first);
                }
            }

            try
            {
                task();
            } catch (const std::exception& ex)
            {
                if (errorSink_)
                {
                    errorSink_(std::string("event loop task failed: ") + ex.what());
                }
            }
        }
    }

    ErrorSink                                       errorSink_;
    std::mutex                                      mutex_;
    std::condition_variable                         cv_;
    std::deque<Task>                                queue_;
    TimerMap                                        timers_;
    std::unordered_map<TimerId, TimerMap::iterator> timerIndex_;
    TimerId                                         nextTimerId_{1};
    bool                                            stopping_{false};
    std::thread                                     worker_;
};

EventLoop::EventLoop(ErrorSink errorSink)
    : impl_(std::make_unique<Impl>(std::move(errorSink)))
{
}

EventLoop::~EventLoop() = default;

bool EventLoop::post(Task task)
{
    return impl_->post(std::move(task));
}

EventLoop::TimerId EventLoop::scheduleAfter(const std::chrono::milliseconds delay, Task task)
{
    return impl_->scheduleAfter(delay, std::move(task));
}

bool EventLoop::cancelTimer(const TimerId timer)
{
    return impl_->cancelTimer(timer);
}

bool EventLoop::isLoopThread() const
{
    return impl_->isLoopThread();
}

void EventLoop::shutdown()
{
    impl_->shutdown();
}

}  // namespace fsmcp::lsp
