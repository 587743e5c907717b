#include <algorithm>
#include <tweenkit/logger.hpp>
#include <tweenkit/scheduler.hpp>

namespace tweenkit
{

TimerHandle ManualScheduler::schedule(Callback cb, double delay_ms)
{
    return queue_.push(std::move(cb), now_ms_ + std::max(delay_ms, 0.0));
}

void ManualScheduler::cancel(TimerHandle handle)
{
    if (handle == INVALID_TIMER)
        return;
    queue_.erase(handle);
}

size_t ManualScheduler::advance(double ms)
{
    const double target = now_ms_ + std::max(ms, 0.0);
    size_t       fired  = 0;
    Callback     cb;

    while (!queue_.empty() && queue_.next_due() <= target)
    {
        now_ms_ = std::max(now_ms_, queue_.next_due());
        if (!queue_.pop_due(now_ms_, cb))
            break;
        if (cb)
            cb();
        ++fired;
    }

    now_ms_ = target;
    TWEENKIT_LOG_TRACE("scheduler", "advance to {} fired {} timers", now_ms_, fired);
    return fired;
}

bool ManualScheduler::run_next()
{
    if (queue_.empty())
        return false;

    now_ms_ = std::max(now_ms_, queue_.next_due());
    Callback cb;
    if (!queue_.pop_due(now_ms_, cb))
        return false;
    if (cb)
        cb();
    return true;
}

}   // namespace tweenkit
