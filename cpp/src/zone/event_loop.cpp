#include "zone/event_loop.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace zonechat::zone
{

namespace
{
constexpr int64_t kMaxIdleWaitMs = 100;
} // namespace

int64_t SystemClock::now_ms() const
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

EventLoop::EventLoop(Clock &clock) : m_clock(clock) {}

EventLoop::~EventLoop() = default;

void EventLoop::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_posted.push_back(std::move(task));
    }
    m_cv.notify_one();
}

TimerId EventLoop::schedule_every(int64_t interval_ms, Task task)
{
    if (interval_ms <= 0)
    {
        throw std::invalid_argument("EventLoop: timer interval must be positive");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const TimerId id = m_next_id++;
    m_timers.emplace(id, Timer{m_clock.now_ms() + interval_ms, interval_ms,
                               std::make_shared<Task>(std::move(task))});
    return id;
}

TimerId EventLoop::schedule_after(int64_t delay_ms, Task task)
{
    if (delay_ms < 0)
    {
        throw std::invalid_argument("EventLoop: timer delay must not be negative");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const TimerId id = m_next_id++;
    m_timers.emplace(id, Timer{m_clock.now_ms() + delay_ms, 0,
                               std::make_shared<Task>(std::move(task))});
    return id;
}

void EventLoop::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_timers.erase(id);
}

bool EventLoop::pop_due_timer(int64_t now, std::shared_ptr<Task> &out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto best = m_timers.end();
    for (auto it = m_timers.begin(); it != m_timers.end(); ++it)
    {
        if (it->second.next_due <= now &&
            (best == m_timers.end() || it->second.next_due < best->second.next_due))
        {
            best = it;
        }
    }
    if (best == m_timers.end())
    {
        return false;
    }
    out = best->second.task;
    if (best->second.interval > 0)
    {
        Timer &t = best->second;
        t.next_due += t.interval;
        if (t.next_due <= now)
        {
            t.next_due = now + t.interval;
        }
    }
    else
    {
        m_timers.erase(best);
    }
    return true;
}

size_t EventLoop::poll()
{
    size_t ran = 0;

    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::swap(batch, m_posted);
    }
    for (auto &task : batch)
    {
        task();
        ++ran;
    }

    const int64_t now = m_clock.now_ms();
    std::shared_ptr<Task> due;
    while (pop_due_timer(now, due))
    {
        (*due)();
        ++ran;
    }
    return ran;
}

void EventLoop::run()
{
    LOGGER_DEBUG("EventLoop: running");
    while (true)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stop_requested)
            {
                m_stop_requested = false;
                break;
            }
        }

        poll();

        std::unique_lock<std::mutex> lock(m_mutex);
        int64_t wait_ms = kMaxIdleWaitMs;
        const int64_t now = m_clock.now_ms();
        for (const auto &[id, timer] : m_timers)
        {
            wait_ms = std::min(wait_ms, std::max<int64_t>(0, timer.next_due - now));
        }
        m_cv.wait_for(lock, std::chrono::milliseconds(wait_ms),
                      [this] { return m_stop_requested || !m_posted.empty(); });
    }
    LOGGER_DEBUG("EventLoop: stopped");
}

void EventLoop::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = true;
    }
    m_cv.notify_all();
}

size_t EventLoop::timer_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.size();
}

size_t EventLoop::pending_tasks() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_posted.size();
}

} // namespace zonechat::zone
