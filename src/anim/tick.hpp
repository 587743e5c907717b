#pragma once

#include <tweenkit/tween.hpp>

namespace tweenkit
{

// What the scheduling loop does with a tick that fires at `now`.
enum class TickAction
{
    Continue,   // interpolate, dispatch hooks, reschedule
    Finish,     // duration elapsed: stop(true)
    Halt,       // run paused or stopped: do nothing, schedule nothing
};

TickAction next_tick_action(const RunParameters& params, const RunState& state, double now);

// Writes the eased value for `now` into every property of state.current that
// also appears in params.to. Other properties are left alone and no property
// is ever added.
void interpolate(double now, const RunParameters& params, RunState& state);

// Nominal delay between ticks.
double frame_interval_ms(int fps);

}   // namespace tweenkit
