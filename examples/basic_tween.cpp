#include <tweenkit/tweenkit.hpp>

using namespace tweenkit;

// Slides a point across the screen on the wall clock, logging each frame.
int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    LoopScheduler loop;
    Tweenable     engine(loop, EngineOptions::from_env(EngineOptions{.fps = 20}));

    TweenConfig config;
    config.from     = PropertyMap{{"x", 0.0}, {"y", 0.0}};
    config.to       = PropertyMap{{"x", 640.0}, {"y", 480.0}};
    config.duration = 1000.0;
    config.easing   = "easeInOutCubic";
    config.step     = [](PropertyMap& current)
    { TWEENKIT_LOG_INFO("example", "x={} y={}", current.at("x"), current.at("y")); };
    config.callback = [](PropertyMap& current)
    { TWEENKIT_LOG_INFO("example", "done at x={} y={}", current.at("x"), current.at("y")); };

    if (!engine.tween(config))
    {
        TWEENKIT_LOG_ERROR("example", "tween rejected");
        return 1;
    }

    loop.run();
    return 0;
}
