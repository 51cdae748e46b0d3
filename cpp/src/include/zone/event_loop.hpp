#pragma once
/**
 * @file event_loop.hpp
 * @brief Single-threaded event loop with posted tasks and timers.
 *
 * Every state mutation in a zonechat client happens inside a task run by its
 * EventLoop. Background threads (the ZeroMQ worker) only call post().
 *
 * ## Ordering
 *
 * poll() first runs every task posted before the call (FIFO), then every timer
 * whose due time is <= clock.now_ms(), earliest first (ties by creation order).
 * A periodic timer is rescheduled to `due + interval`; if that is already in the
 * past (the loop fell behind) it is pushed to `now + interval` instead, so a
 * stalled loop never fires a burst of catch-up ticks.
 *
 * ## Threading
 *
 * post() and stop() are safe from any thread. The remaining methods are meant
 * for the loop thread but are internally locked.
 */
#include "zonechat_core_export.h"
#include "zone/clock.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace zonechat::zone
{

using TimerId = uint64_t;
inline constexpr TimerId kInvalidTimer = 0;

class ZONECHAT_CORE_EXPORT EventLoop
{
  public:
    using Task = std::function<void()>;

    explicit EventLoop(Clock &clock);
    ~EventLoop();

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    /** @brief Queues @p task for the next poll(). Thread-safe. */
    void post(Task task);

    /**
     * @brief Runs @p task every @p interval_ms, first at now + interval.
     * @throws std::invalid_argument if @p interval_ms <= 0.
     */
    TimerId schedule_every(int64_t interval_ms, Task task);

    /**
     * @brief Runs @p task once at now + @p delay_ms.
     * @throws std::invalid_argument if @p delay_ms < 0.
     */
    TimerId schedule_after(int64_t delay_ms, Task task);

    /** @brief Cancels a timer. Unknown ids (already fired, already cancelled) are ignored. */
    void cancel(TimerId id);

    /** @brief Runs ready work once. Returns the number of tasks and timers run. */
    size_t poll();

    /** @brief Polls until stop() is called. Waits at most 100 ms between polls. */
    void run();

    /** @brief Makes run() return after its current iteration. Thread-safe. */
    void stop();

    [[nodiscard]] int64_t now_ms() const { return m_clock.now_ms(); }
    [[nodiscard]] Clock &clock() noexcept { return m_clock; }
    [[nodiscard]] size_t timer_count() const;
    [[nodiscard]] size_t pending_tasks() const;

  private:
    struct Timer
    {
        int64_t next_due{0};
        int64_t interval{0}; ///< 0 for one-shot timers
        std::shared_ptr<Task> task;
    };

    bool pop_due_timer(int64_t now, std::shared_ptr<Task> &out);

    Clock &m_clock;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Task> m_posted;
    std::map<TimerId, Timer> m_timers;
    TimerId m_next_id{1};
    bool m_stop_requested{false};
};

} // namespace zonechat::zone
