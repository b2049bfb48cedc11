#include "mdns_browser/event_loop.hpp"
#include "mdns_browser/log.hpp"

#include <algorithm>
#include <future>
#include <vector>

#include <fmt/core.h>

namespace mdns_browser
{

EventLoop::EventLoop(Transport& transport, std::chrono::milliseconds pollInterval)
: m_transport(transport)
, m_pollInterval(pollInterval)
{}

EventLoop::~EventLoop()
{
    Stop();
}

void EventLoop::Start()
{
    if (m_running.exchange(true, std::memory_order_acq_rel) == true) {
        Log(LogLevel::Info, "Event loop already started.");
        return;
    }

    m_thread = std::thread([this](){
        m_loopThreadId.store(std::this_thread::get_id());
        while (m_running.load(std::memory_order_acquire)) {
            RunOnce(m_pollInterval);
        }
    });
}

void EventLoop::Stop()
{
    if (m_running.exchange(false, std::memory_order_acq_rel) == false) {
        return;
    }

    if (InLoopThread()) {
        Log(LogLevel::Error, "Event loop can not be joined from its own thread.");
        return;
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_loopThreadId.store(std::thread::id());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.clear();
    m_deadlines.clear();
    m_timers.clear();
}

bool EventLoop::Running() const
{
    return m_running.load(std::memory_order_acquire);
}

void EventLoop::Post(Task task)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.push_back(std::move(task));
}

void EventLoop::Invoke(Task task)
{
    if (InLoopThread() || !Running()) {
        task();
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    Post([task = std::move(task), done](){
        try {
            task();
            done->set_value();
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    });
    finished.get();
}

EventLoop::TimerId EventLoop::ScheduleAfter(Clock::duration delay, Task task)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const TimerId id = m_nextTimerId++;
    m_deadlines.emplace(Clock::now() + delay, id);
    m_timers.emplace(id, std::move(task));
    return id;
}

void EventLoop::CancelTimer(TimerId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_timers.erase(id);
}

std::size_t EventLoop::PendingTimers() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.size();
}

void EventLoop::RunOnce(std::chrono::milliseconds maxWait)
{
    RunDueTimers();
    RunPostedTasks();
    m_transport.Poll(NextWait(maxWait));
}

bool EventLoop::InLoopThread() const
{
    return m_loopThreadId.load() == std::this_thread::get_id();
}

void EventLoop::RunDueTimers()
{
    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = Clock::now();
        while (!m_deadlines.empty() && m_deadlines.begin()->first <= now) {
            const auto id = m_deadlines.begin()->second;
            m_deadlines.erase(m_deadlines.begin());
            auto timer = m_timers.find(id);
            if (timer != m_timers.end()) {
                due.push_back(std::move(timer->second));
                m_timers.erase(timer);
            }
        }
    }
    for (const auto& task : due) {
        RunTask(task);
    }
}

void EventLoop::RunPostedTasks()
{
    std::deque<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tasks.swap(m_tasks);
    }
    for (const auto& task : tasks) {
        RunTask(task);
    }
}

void EventLoop::RunTask(const Task& task)
{
    try {
        task();
    } catch (const std::exception& e) {
        Log(LogLevel::Error, fmt::format("Event loop task failed: {}", e.what()));
    }
}

std::chrono::milliseconds EventLoop::NextWait(std::chrono::milliseconds maxWait) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_tasks.empty()) {
        return std::chrono::milliseconds(0);
    }
    // Cancelled timers leave their deadline behind, waking early for them is harmless
    if (!m_deadlines.empty()) {
        const auto untilTimer = std::chrono::ceil<std::chrono::milliseconds>(m_deadlines.begin()->first - Clock::now());
        if (untilTimer < maxWait) {
            return std::max(untilTimer, std::chrono::milliseconds(0));
        }
    }
    return maxWait;
}

}
