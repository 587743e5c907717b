#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tweenkit/easing.hpp>
#include <tweenkit/properties.hpp>
#include <tweenkit/scheduler.hpp>

namespace tweenkit
{

class Tweenable;
class Tween;
class HookRegistry;
class FilterRegistry;

// Invoked every tick with the live current state.
using StepFn = std::function<void(PropertyMap& current)>;

// Invoked once when a run completes (naturally or via stop(true)).
using CompleteFn = std::function<void(PropertyMap& current)>;

// Longhand arguments for Tweenable::tween(). Unset fields fall back to the
// engine defaults.
struct TweenConfig
{
    std::optional<PropertyMap> from;
    PropertyMap                to;
    std::optional<double>      duration;   // ms
    std::optional<std::string> easing;
    StepFn                     step;
    CompleteFn                 callback;
};

enum class TweenState
{
    Animating,   // ticks are being scheduled
    Paused,      // pause() called, waiting for resume()
    Stopped,     // stop() without goto_end; current left where it was
    Finished,    // completed, current == to
};

const char* tween_state_name(TweenState state);

// Fixed for the lifetime of one run. Only `timestamp` changes, when a paused
// run is resumed.
struct RunParameters
{
    Tweenable*      owner     = nullptr;
    HookRegistry*   hooks     = nullptr;
    FilterRegistry* filters   = nullptr;
    Scheduler*      scheduler = nullptr;

    PropertyMap to;
    PropertyMap original_state;
    double      duration  = 0.0;   // ms
    double      timestamp = 0.0;   // scheduler ms at the logical start
    int         fps       = 30;
    EasingFn    easing_func;
    StepFn      step;
    CompleteFn  callback;

    std::weak_ptr<Tween> controller;
};

// Shared between the tick handler and the controller.
struct RunState
{
    PropertyMap           current;
    bool                  is_animating = false;
    bool                  is_paused    = false;
    bool                  is_stopped   = false;
    std::optional<double> paused_at_time;
    TimerHandle           loop_id = INVALID_TIMER;
};

// Controller for one tween run, returned by Tweenable::tween(). Always owned
// through a std::shared_ptr. Once the run is finished or stopped every
// mutator is a no-op.
class Tween : public std::enable_shared_from_this<Tween>
{
   public:
    Tween(RunParameters params, RunState state);
    ~Tween();

    Tween(const Tween&)            = delete;
    Tween& operator=(const Tween&) = delete;

    // Cancels the pending tick. With goto_end, snaps current to the target
    // values, marks the run finished and fires the completion callback.
    // Without it, current keeps its last values and the callback never fires.
    Tween& stop(bool goto_end = false);

    // Cancels the pending tick and remembers when the pause started.
    Tween& pause();

    // Shifts the logical start forward by the time spent paused, then
    // schedules the next tick at the run's frame rate.
    Tween& resume();

    // Live view of the current state; it is updated in place every tick.
    PropertyMap&       get() { return state_.current; }
    const PropertyMap& get() const { return state_.current; }

    TweenState state() const;
    bool       is_animating() const { return state_.is_animating && !state_.is_stopped; }
    bool       is_paused() const { return state_.is_paused; }

    // Milliseconds of animated (non-paused) time as of now().
    double elapsed() const;

    const RunParameters& parameters() const { return params_; }
    const RunState&      run_state() const { return state_; }

   private:
    friend class Tweenable;

    RunParameters params_;
    RunState      state_;

    void start();
    void schedule_tick();
    void cancel_tick();
    void on_tick();

    // Called by the owning engine when it is destroyed.
    void detach();
};

}   // namespace tweenkit
