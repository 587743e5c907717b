#include <algorithm>
#include <tweenkit/filters.hpp>
#include <tweenkit/hooks.hpp>
#include <tweenkit/logger.hpp>
#include <tweenkit/tween.hpp>

#include "tick.hpp"

namespace tweenkit
{

namespace
{
constexpr const char* STEP_HOOK = "step";
}   // anonymous namespace

const char* tween_state_name(TweenState state)
{
    switch (state)
    {
        case TweenState::Animating:
            return "animating";
        case TweenState::Paused:
            return "paused";
        case TweenState::Stopped:
            return "stopped";
        case TweenState::Finished:
            return "finished";
    }
    return "unknown";
}

Tween::Tween(RunParameters params, RunState state)
    : params_(std::move(params)), state_(std::move(state))
{
    if (!params_.step)
        params_.step = [](PropertyMap&) {};
    if (!params_.callback)
        params_.callback = [](PropertyMap&) {};
    if (!params_.easing_func)
        params_.easing_func = formula::linear;
}

Tween::~Tween()
{
    cancel_tick();
}

// ─── Controller surface ─────────────────────────────────────────────────────

Tween& Tween::stop(bool goto_end)
{
    // The completion callback may drop the last outside reference
    auto self = weak_from_this().lock();

    cancel_tick();

    if (goto_end)
    {
        // A stopped run is inert; it may already have been replaced
        if (!state_.is_animating || state_.is_stopped)
            return *this;

        util::simple_copy(state_.current, params_.to);
        state_.is_animating   = false;
        state_.is_paused      = false;
        state_.paused_at_time.reset();
        TWEENKIT_LOG_DEBUG("tween", "tween finished after {} ms", params_.duration);
        params_.callback(state_.current);
    }
    else if (state_.is_animating && !state_.is_stopped)
    {
        state_.is_stopped = true;
        state_.is_paused  = false;
        TWEENKIT_LOG_DEBUG("tween", "tween stopped before completion");
    }

    return *this;
}

Tween& Tween::pause()
{
    if (!is_animating() || state_.is_paused)
        return *this;

    cancel_tick();
    state_.paused_at_time = params_.scheduler->now();
    state_.is_paused      = true;
    return *this;
}

Tween& Tween::resume()
{
    if (!is_animating())
        return *this;

    if (state_.is_paused)
    {
        const double paused_for = params_.scheduler->now() - state_.paused_at_time.value_or(0.0);
        params_.timestamp += std::max(paused_for, 0.0);
        state_.is_paused = false;
        state_.paused_at_time.reset();
        TWEENKIT_LOG_DEBUG("tween", "resumed after {} ms paused", paused_for);
    }

    if (state_.loop_id == INVALID_TIMER)
        schedule_tick();
    return *this;
}

TweenState Tween::state() const
{
    if (state_.is_stopped)
        return TweenState::Stopped;
    if (!state_.is_animating)
        return TweenState::Finished;
    if (state_.is_paused)
        return TweenState::Paused;
    return TweenState::Animating;
}

double Tween::elapsed() const
{
    if (!state_.is_animating)
        return params_.duration;

    const double now = state_.is_paused ? state_.paused_at_time.value_or(params_.timestamp)
                                        : params_.scheduler->now();
    return std::clamp(now - params_.timestamp, 0.0, params_.duration);
}

// ─── Scheduling loop ────────────────────────────────────────────────────────

void Tween::start()
{
    state_.is_animating = true;
    schedule_tick();
}

void Tween::schedule_tick()
{
    if (!params_.scheduler)
        return;

    std::weak_ptr<Tween> weak = weak_from_this();
    state_.loop_id            = params_.scheduler->schedule(
        [weak]()
        {
            if (auto self = weak.lock())
                self->on_tick();
        },
        frame_interval_ms(params_.fps));
}

void Tween::cancel_tick()
{
    if (state_.loop_id != INVALID_TIMER && params_.scheduler)
        params_.scheduler->cancel(state_.loop_id);
    state_.loop_id = INVALID_TIMER;
}

void Tween::on_tick()
{
    auto self = weak_from_this().lock();

    // This timer has fired; the handle is spent
    state_.loop_id = INVALID_TIMER;

    const double now = params_.scheduler->now();
    switch (next_tick_action(params_, state_, now))
    {
        case TickAction::Halt:
            return;
        case TickAction::Finish:
            stop(true);
            return;
        case TickAction::Continue:
            break;
    }

    if (params_.filters)
        params_.filters->apply(
            FilterPoint::BeforeTween, state_.current, params_.original_state, params_.to);

    interpolate(now, params_, state_);

    if (params_.filters)
        params_.filters->apply(
            FilterPoint::AfterTween, state_.current, params_.original_state, params_.to);

    if (params_.hooks && params_.hooks->has(STEP_HOOK))
        params_.hooks->invoke(STEP_HOOK, state_.current);

    params_.step(state_.current);

    // Hooks and the step callback may have paused, stopped or resumed the run
    if (is_animating() && !state_.is_paused && state_.loop_id == INVALID_TIMER)
        schedule_tick();
}

void Tween::detach()
{
    stop(false);
    params_.owner = nullptr;
    params_.hooks = nullptr;
}

}   // namespace tweenkit
