#include <algorithm>
#include <chrono>
#include <limits>
#include <thread>
#include <tweenkit/logger.hpp>
#include <tweenkit/properties.hpp>
#include <tweenkit/scheduler.hpp>

namespace tweenkit
{

namespace
{

using Duration = std::chrono::duration<double, std::milli>;

// Sleep for most of the wait, then spin for the last millisecond.
void wait_until(double target_ms, double (*clock)())
{
    double remaining = target_ms - clock();
    if (remaining <= 0.0)
        return;

    double sleep_ms = remaining - 1.0;
    if (sleep_ms > 0.0)
    {
        std::this_thread::sleep_for(
            std::chrono::duration_cast<std::chrono::microseconds>(Duration{sleep_ms}));
    }

    while (clock() < target_ms)
    {
        std::this_thread::yield();
    }
}

}   // anonymous namespace

TimerHandle LoopScheduler::schedule(Callback cb, double delay_ms)
{
    return queue_.push(std::move(cb), now() + std::max(delay_ms, 0.0));
}

void LoopScheduler::cancel(TimerHandle handle)
{
    if (handle == INVALID_TIMER)
        return;
    queue_.erase(handle);
}

double LoopScheduler::now() const
{
    return util::now();
}

size_t LoopScheduler::run()
{
    return run_until(std::numeric_limits<double>::infinity());
}

size_t LoopScheduler::run_for(double duration_ms)
{
    return run_until(now() + std::max(duration_ms, 0.0));
}

size_t LoopScheduler::run_until(double deadline_ms)
{
    quit_requested_ = false;
    size_t   fired  = 0;
    Callback cb;

    while (!quit_requested_ && !queue_.empty())
    {
        double due = queue_.next_due();
        if (due > deadline_ms)
        {
            wait_until(deadline_ms, util::now);
            break;
        }

        wait_until(due, util::now);
        if (!queue_.pop_due(now(), cb))
            continue;
        if (cb)
            cb();
        ++fired;
    }

    TWEENKIT_LOG_DEBUG("scheduler", "loop exited after {} callbacks, {} pending", fired,
                       queue_.size());
    return fired;
}

}   // namespace tweenkit
