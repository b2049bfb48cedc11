#pragma once

#include "mdns_browser/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace mdns_browser
{

// Single threaded reactor driving the transport, timers and posted tasks.
// Everything that touches discovery state runs on its worker thread.
class EventLoop
{
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    explicit EventLoop(Transport& transport, std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50));
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Start();
    // Joins the worker, pending tasks and timers are dropped
    void Stop();
    [[nodiscard]] bool Running() const;

    // Thread safe
    void Post(Task task);
    // Runs the task on the worker and waits for it to finish, rethrowing its
    // exception. Runs inline on the worker itself or when the loop is not running.
    void Invoke(Task task);

    TimerId ScheduleAfter(Clock::duration delay, Task task);
    void CancelTimer(TimerId id);
    [[nodiscard]] std::size_t PendingTimers() const;

    // One iteration: due timers, posted tasks, then waits on the transport for
    // at most maxWait (less if a timer is due earlier)
    void RunOnce(std::chrono::milliseconds maxWait);

    [[nodiscard]] bool InLoopThread() const;

private:
    void RunDueTimers();
    void RunPostedTasks();
    void RunTask(const Task& task);
    [[nodiscard]] std::chrono::milliseconds NextWait(std::chrono::milliseconds maxWait) const;

    Transport& m_transport;
    const std::chrono::milliseconds m_pollInterval;

    std::atomic<bool> m_running{false};
    std::thread m_thread;
    std::atomic<std::thread::id> m_loopThreadId{};

    mutable std::mutex m_mutex;
    std::deque<Task> m_tasks;
    std::multimap<Clock::time_point, TimerId> m_deadlines;
    std::unordered_map<TimerId, Task> m_timers;
    TimerId m_nextTimerId{1};
};

}
