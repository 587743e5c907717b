#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace tweenkit
{

// Opaque handle for a scheduled callback. 0 never names a live timer.
using TimerHandle = uint64_t;

inline constexpr TimerHandle INVALID_TIMER = 0;

// Host timer capability: one-shot delayed callbacks plus a millisecond clock.
// Implementations are single-threaded; callbacks run on the thread that
// drives the scheduler.
class Scheduler
{
   public:
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    // Runs `cb` once, no earlier than `delay_ms` after now().
    virtual TimerHandle schedule(Callback cb, double delay_ms) = 0;

    // Cancels a pending timer. Unknown or already-fired handles are ignored.
    virtual void cancel(TimerHandle handle) = 0;

    // Milliseconds on the scheduler's clock.
    virtual double now() const = 0;
};

// Timer bookkeeping shared by the concrete schedulers: ordered by due time,
// then by scheduling order.
class TimerQueue
{
   public:
    TimerHandle push(Scheduler::Callback cb, double due_ms);
    bool        erase(TimerHandle handle);

    bool   empty() const { return timers_.empty(); }
    size_t size() const { return timers_.size(); }

    // Due time of the earliest timer. Only valid when !empty().
    double next_due() const;

    // Removes and returns the earliest timer if it is due at `now_ms`.
    bool pop_due(double now_ms, Scheduler::Callback& out);

    void clear()
    {
        timers_.clear();
        due_by_handle_.clear();
    }

   private:
    // Keyed by (due time, handle); handles increase monotonically, so equal
    // due times fire in scheduling order.
    std::map<std::pair<double, TimerHandle>, Scheduler::Callback> timers_;
    std::unordered_map<TimerHandle, double>                       due_by_handle_;
    TimerHandle                                                   next_handle_ = 1;
};

// Deterministic scheduler driven by an explicit clock. Nothing fires until
// advance() or run_next() is called.
class ManualScheduler : public Scheduler
{
   public:
    explicit ManualScheduler(double start_ms = 0.0) : now_ms_(start_ms) {}

    TimerHandle schedule(Callback cb, double delay_ms) override;
    void        cancel(TimerHandle handle) override;
    double      now() const override { return now_ms_; }

    // Moves the clock without firing anything.
    void set_time(double ms) { now_ms_ = ms; }

    // Moves the clock forward by `ms`, firing every timer that falls due on
    // the way (including timers scheduled by callbacks) at its own due time.
    // Returns the number of callbacks fired.
    size_t advance(double ms);

    // Jumps to the earliest pending timer and fires it. Returns false when
    // nothing is pending.
    bool run_next();

    size_t pending() const { return queue_.size(); }

   private:
    double     now_ms_;
    TimerQueue queue_;
};

// Wall-clock scheduler. now() is epoch milliseconds; run() sleeps until each
// timer is due and fires it on the calling thread.
class LoopScheduler : public Scheduler
{
   public:
    LoopScheduler() = default;

    LoopScheduler(const LoopScheduler&)            = delete;
    LoopScheduler& operator=(const LoopScheduler&) = delete;

    TimerHandle schedule(Callback cb, double delay_ms) override;
    void        cancel(TimerHandle handle) override;
    double      now() const override;

    // Fires timers until none remain or quit() is called. Returns the number
    // of callbacks fired.
    size_t run();

    // Like run(), but returns after `duration_ms` of wall time at the latest.
    size_t run_for(double duration_ms);

    // Makes run()/run_for() return after the current callback.
    void quit() { quit_requested_ = true; }

    size_t pending() const { return queue_.size(); }

   private:
    TimerQueue        queue_;
    std::atomic<bool> quit_requested_{false};

    size_t run_until(double deadline_ms);
};

}   // namespace tweenkit
