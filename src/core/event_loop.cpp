#include "core/event_loop.hpp"
#include "util/log.hpp"

namespace core
{

EventLoop::EventLoop() : now_([] { return Clock::now(); }) {}

EventLoop::EventLoop(NowFn now) : now_(std::move(now))
{
    if (!now_)
        now_ = [] { return Clock::now(); };
}

void EventLoop::post(Task t)
{
    if (!t)
        return;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ready_.push_back(std::move(t));
    }
    cv_.notify_one();
}

EventLoop::TimerId EventLoop::post_after(std::chrono::milliseconds delay, Task t)
{
    if (!t)
        return 0;
    if (delay.count() < 0)
        delay = std::chrono::milliseconds(0);

    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        id = next_timer_id_++;
        const TimerKey key{now_() + delay, id};
        timers_.emplace(key, std::move(t));
        timer_index_.emplace(id, key);
    }
    cv_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = timer_index_.find(id);
    if (it == timer_index_.end())
        return false;
    timers_.erase(it->second);
    timer_index_.erase(it);
    return true;
}

std::size_t EventLoop::pending_timers() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return timers_.size();
}

bool EventLoop::pop_ready(Task &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!ready_.empty())
    {
        out = std::move(ready_.front());
        ready_.pop_front();
        return true;
    }
    if (timers_.empty())
        return false;

    auto first = timers_.begin();
    if (first->first.first > now_())
        return false;  // earliest timer not due yet

    out = std::move(first->second);
    timer_index_.erase(first->first.second);
    timers_.erase(first);
    return true;
}

std::size_t EventLoop::run_pending()
{
    loop_thread_.store(std::this_thread::get_id());
    std::size_t n = 0;
    Task        t;
    while (pop_ready(t))
    {
        t();
        t = nullptr;
        ++n;
    }
    return n;
}

void EventLoop::run()
{
    loop_thread_.store(std::this_thread::get_id());
    LOG_DEBUG("event loop running");
    while (!stop_.load())
    {
        (void)run_pending();

        std::unique_lock<std::mutex> lk(mu_);
        if (stop_.load())
            break;
        if (!ready_.empty())
            continue;
        if (timers_.empty())
        {
            cv_.wait(lk, [this] { return stop_.load() || !ready_.empty() || !timers_.empty(); });
        }
        else
        {
            const auto wait = timers_.begin()->first.first - now_();
            if (wait > Clock::duration::zero())
                cv_.wait_for(lk, wait);
        }
    }
    LOG_DEBUG("event loop stopped");
}

void EventLoop::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_.store(true);
    }
    cv_.notify_all();
}

bool EventLoop::in_loop_thread() const
{
    return loop_thread_.load() == std::this_thread::get_id();
}

}  // namespace core
