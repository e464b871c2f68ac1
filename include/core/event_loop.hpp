#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace core
{

/**
 * EventLoop: one sequential queue for tasks and timers.
 *
 * Any thread may post() / post_after() / cancel(). Handlers only run inside
 * run() or run_pending(), one at a time, on the thread that called it.
 * The clock is injectable so tests can step time by hand:
 *
 *   auto now = Clock::time_point{};
 *   EventLoop loop([&] { return now; });
 *   loop.post_after(500ms, fn);
 *   now += 500ms;
 *   loop.run_pending();   // fn runs here
 */
class EventLoop
{
  public:
    using Clock   = std::chrono::steady_clock;
    using NowFn   = std::function<Clock::time_point()>;
    using Task    = std::function<void()>;
    using TimerId = std::uint64_t;

    EventLoop();
    explicit EventLoop(NowFn now);
    EventLoop(const EventLoop &)            = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    void    post(Task t);
    TimerId post_after(std::chrono::milliseconds delay, Task t);
    // false when the timer already fired, was cancelled, or never existed
    bool    cancel(TimerId id);

    // Run everything ready now, including tasks and timers that handlers make
    // ready during this call. Returns the number of handlers run.
    std::size_t run_pending();

    // Block running handlers until stop(). Waits on the real steady clock.
    void run();
    void stop();

    bool              in_loop_thread() const;
    Clock::time_point now() const { return now_(); }
    std::size_t       pending_timers() const;

  private:
    // ordered by (deadline, id) so equal deadlines fire in post order
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    bool pop_ready(Task &out);

    NowFn                          now_;
    mutable std::mutex             mu_;
    std::condition_variable        cv_;
    std::deque<Task>               ready_;
    std::map<TimerKey, Task>       timers_;
    std::map<TimerId, TimerKey>    timer_index_;
    TimerId                        next_timer_id_{1};
    std::atomic_bool               stop_{false};
    std::atomic<std::thread::id>   loop_thread_{};
};

}  // namespace core
