#include <tweenkit/tweenkit.hpp>

using namespace tweenkit;

// Pauses a fade halfway through, resumes it 500 ms later, then chains a
// second tween from the completion callback.
int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    LoopScheduler loop;
    Tweenable     engine(loop);
    engine.set_fps(10);

    engine.add_hook("step",
                    [](PropertyMap& current)
                    { TWEENKIT_LOG_INFO("example", "opacity {}", current.at("opacity")); });

    auto fade_out = engine.tween({{"opacity", 1.0}}, {{"opacity", 0.0}}, 1000.0,
                                 [&engine](PropertyMap&)
                                 {
                                     TWEENKIT_LOG_INFO("example", "faded out, fading back in");
                                     engine.tween({{"opacity", 0.0}}, {{"opacity", 1.0}}, 500.0);
                                 });
    if (!fade_out)
        return 1;

    loop.schedule([fade_out] { fade_out->pause(); }, 500.0);
    loop.schedule(
        [fade_out]
        {
            TWEENKIT_LOG_INFO("example", "resuming after {} ms animated", fade_out->elapsed());
            fade_out->resume();
        },
        1000.0);

    loop.run();
    TWEENKIT_LOG_INFO("example", "final state: {}", tween_state_name(fade_out->state()));
    return 0;
}
