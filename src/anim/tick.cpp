#include "tick.hpp"

#include <tweenkit/config.hpp>

namespace tweenkit
{

TickAction next_tick_action(const RunParameters& params, const RunState& state, double now)
{
    if (state.is_stopped || state.is_paused)
        return TickAction::Halt;

    if (now < params.timestamp + params.duration && state.is_animating)
        return TickAction::Continue;

    return TickAction::Finish;
}

void interpolate(double now, const RunParameters& params, RunState& state)
{
    const double elapsed = now - params.timestamp;

    for (auto& [key, value] : state.current)
    {
        auto target = params.to.find(key);
        if (target == params.to.end())
            continue;

        auto start_it = params.original_state.find(key);
        if (start_it == params.original_state.end())
            continue;

        const double start = start_it->second;
        value = params.easing_func(elapsed, start, target->second - start, params.duration);
    }
}

double frame_interval_ms(int fps)
{
    return fps > 0 ? 1000.0 / static_cast<double>(fps) : 1000.0 / static_cast<double>(DEFAULT_FPS);
}

}   // namespace tweenkit
