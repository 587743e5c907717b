#include <tweenkit/scheduler.hpp>

namespace tweenkit
{

TimerHandle TimerQueue::push(Scheduler::Callback cb, double due_ms)
{
    TimerHandle handle = next_handle_++;
    timers_.emplace(std::make_pair(due_ms, handle), std::move(cb));
    due_by_handle_.emplace(handle, due_ms);
    return handle;
}

bool TimerQueue::erase(TimerHandle handle)
{
    auto it = due_by_handle_.find(handle);
    if (it == due_by_handle_.end())
        return false;

    timers_.erase(std::make_pair(it->second, handle));
    due_by_handle_.erase(it);
    return true;
}

double TimerQueue::next_due() const
{
    return timers_.begin()->first.first;
}

bool TimerQueue::pop_due(double now_ms, Scheduler::Callback& out)
{
    if (timers_.empty())
        return false;

    auto it = timers_.begin();
    if (it->first.first > now_ms)
        return false;

    out = std::move(it->second);
    due_by_handle_.erase(it->first.second);
    timers_.erase(it);
    return true;
}

}   // namespace tweenkit
