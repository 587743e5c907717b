#pragma once

#include <memory>
#include <string>
#include <tweenkit/config.hpp>
#include <tweenkit/easing.hpp>
#include <tweenkit/filters.hpp>
#include <tweenkit/hooks.hpp>
#include <tweenkit/properties.hpp>
#include <tweenkit/scheduler.hpp>
#include <tweenkit/tween.hpp>

namespace tweenkit
{

// Tweening engine instance. Holds the default frame rate, duration and easing
// plus the per-instance hooks, and runs at most one tween at a time.
//
// The scheduler (and any registries passed in) must outlive the engine.
// Destroying the engine stops its active tween without completing it.
class Tweenable
{
   public:
    explicit Tweenable(Scheduler& scheduler, const EngineOptions& options = {});
    Tweenable(Scheduler&            scheduler,
              const EngineOptions&  options,
              FilterRegistry&       filters,
              const EasingRegistry& easings);
    ~Tweenable();

    Tweenable(const Tweenable&)            = delete;
    Tweenable& operator=(const Tweenable&) = delete;

    // ─── Configuration ──────────────────────────────────────────────────

    // Replaces all defaults. Unset or invalid fields take the built-in
    // defaults (30 fps, "linear", 500 ms).
    Tweenable& configure(const EngineOptions& options);

    int  fps() const { return fps_; }
    void set_fps(int fps);

    const std::string& default_easing() const { return easing_; }
    void               set_default_easing(std::string easing);

    double default_duration() const { return duration_; }
    void   set_default_duration(double ms);

    // ─── Tweens ─────────────────────────────────────────────────────────

    // Starts a tween and returns its controller, or nullptr if a tween is
    // already animating on this engine (the running one is left untouched).
    std::shared_ptr<Tween> tween(const TweenConfig& config);

    // Shorthand form. duration <= 0 and an empty easing use the defaults.
    std::shared_ptr<Tween> tween(const PropertyMap& from,
                                 const PropertyMap& to,
                                 double             duration = 0.0,
                                 CompleteFn         callback = {},
                                 const std::string& easing   = {});

    bool is_animating() const;

    // Controller of the most recent run, or nullptr if none was started.
    std::shared_ptr<Tween> active_tween() const { return active_; }

    // ─── Hooks ──────────────────────────────────────────────────────────

    HookId add_hook(const std::string& name, HookRegistry::HookFn fn);

    // Removes one hook. Returns false if it was not registered.
    bool remove_hook(const std::string& name, HookId id);

    // Removes every hook registered under name.
    void remove_hook(const std::string& name);

    HookRegistry&       hooks() { return hooks_; }
    const HookRegistry& hooks() const { return hooks_; }

    Scheduler& scheduler() { return scheduler_; }

   private:
    Scheduler&            scheduler_;
    FilterRegistry&       filters_;
    const EasingRegistry& easings_;

    int         fps_      = DEFAULT_FPS;
    std::string easing_   = DEFAULT_EASING;
    double      duration_ = DEFAULT_DURATION_MS;

    HookRegistry           hooks_;
    std::shared_ptr<Tween> active_;
};

}   // namespace tweenkit
