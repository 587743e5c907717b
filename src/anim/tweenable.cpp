#include <tweenkit/logger.hpp>
#include <tweenkit/tweenable.hpp>

namespace tweenkit
{

Tweenable::Tweenable(Scheduler& scheduler, const EngineOptions& options)
    : Tweenable(scheduler, options, FilterRegistry::global(), EasingRegistry::global())
{
}

Tweenable::Tweenable(Scheduler&            scheduler,
                     const EngineOptions&  options,
                     FilterRegistry&       filters,
                     const EasingRegistry& easings)
    : scheduler_(scheduler), filters_(filters), easings_(easings)
{
    configure(options);
}

Tweenable::~Tweenable()
{
    if (active_)
        active_->detach();
}

// ─── Configuration ──────────────────────────────────────────────────────────

Tweenable& Tweenable::configure(const EngineOptions& options)
{
    EngineOptions opts = options.normalized();
    fps_               = opts.fps;
    easing_            = std::move(opts.easing);
    duration_          = opts.duration;
    TWEENKIT_LOG_DEBUG("engine", "configured fps={} easing={} duration={}", fps_, easing_,
                       duration_);
    return *this;
}

void Tweenable::set_fps(int fps)
{
    if (fps > 0)
        fps_ = fps;
    else
        TWEENKIT_LOG_WARN("engine", "Ignoring non-positive fps {}", fps);
}

void Tweenable::set_default_easing(std::string easing)
{
    easing_ = easing.empty() ? std::string(DEFAULT_EASING) : std::move(easing);
}

void Tweenable::set_default_duration(double ms)
{
    if (ms > 0.0)
        duration_ = ms;
    else
        TWEENKIT_LOG_WARN("engine", "Ignoring non-positive duration {}", ms);
}

// ─── Tweens ─────────────────────────────────────────────────────────────────

bool Tweenable::is_animating() const
{
    return active_ && active_->is_animating();
}

std::shared_ptr<Tween> Tweenable::tween(const TweenConfig& config)
{
    if (is_animating())
    {
        TWEENKIT_LOG_DEBUG("engine", "tween() ignored: a tween is already animating");
        return nullptr;
    }

    RunParameters params;
    params.owner     = this;
    params.hooks     = &hooks_;
    params.filters   = &filters_;
    params.scheduler = &scheduler_;
    params.to        = config.to;
    params.duration  = (config.duration && *config.duration > 0.0) ? *config.duration : duration_;
    params.fps       = fps_;
    params.step      = config.step;
    params.callback  = config.callback;

    const std::string easing_name =
        (config.easing && !config.easing->empty()) ? *config.easing : easing_;
    params.easing_func = easings_.resolve(easing_name);

    RunState state;
    state.current = config.from.value_or(PropertyMap{});

    params.original_state = state.current;
    params.timestamp      = scheduler_.now();

    filters_.apply(FilterPoint::TweenCreated, state.current, params.original_state, params.to);

    auto controller = std::make_shared<Tween>(std::move(params), std::move(state));
    controller->params_.controller = controller;

    // The previous run is over; drop it before starting the new one
    active_ = controller;
    controller->start();

    TWEENKIT_LOG_DEBUG("engine", "tween started: {} properties over {} ms with '{}'",
                       controller->state_.current.size(), controller->params_.duration,
                       easing_name);
    return controller;
}

std::shared_ptr<Tween> Tweenable::tween(const PropertyMap& from,
                                        const PropertyMap& to,
                                        double             duration,
                                        CompleteFn         callback,
                                        const std::string& easing)
{
    TweenConfig config;
    config.from     = from;
    config.to       = to;
    config.callback = std::move(callback);
    if (duration > 0.0)
        config.duration = duration;
    if (!easing.empty())
        config.easing = easing;
    return tween(config);
}

// ─── Hooks ──────────────────────────────────────────────────────────────────

HookId Tweenable::add_hook(const std::string& name, HookRegistry::HookFn fn)
{
    return hooks_.add(name, std::move(fn));
}

bool Tweenable::remove_hook(const std::string& name, HookId id)
{
    return hooks_.remove(name, id);
}

void Tweenable::remove_hook(const std::string& name)
{
    hooks_.clear(name);
}

}   // namespace tweenkit
