#include <tweenkit/easing.hpp>
#include <tweenkit/logger.hpp>

namespace tweenkit
{

namespace
{
constexpr const char* LINEAR = "linear";
}   // anonymous namespace

EasingRegistry::EasingRegistry()
{
    formulas_.emplace(LINEAR, EasingFn(formula::linear));
}

EasingRegistry& EasingRegistry::global()
{
    static EasingRegistry registry;
    static std::once_flag builtins_flag;
    std::call_once(builtins_flag, [] { registry.register_builtins(); });
    return registry;
}

bool EasingRegistry::add(const std::string& name, EasingFn fn)
{
    if (name.empty() || !fn)
    {
        TWEENKIT_LOG_WARN("easing", "Rejected easing registration '{}'", name);
        return false;
    }

    std::lock_guard lock(mutex_);
    formulas_[name] = std::move(fn);
    return true;
}

bool EasingRegistry::remove(const std::string& name)
{
    if (name == LINEAR)
        return false;

    std::lock_guard lock(mutex_);
    return formulas_.erase(name) > 0;
}

bool EasingRegistry::contains(const std::string& name) const
{
    std::lock_guard lock(mutex_);
    return formulas_.count(name) > 0;
}

std::optional<EasingFn> EasingRegistry::find(const std::string& name) const
{
    std::lock_guard lock(mutex_);
    auto            it = formulas_.find(name);
    if (it == formulas_.end())
        return std::nullopt;
    return it->second;
}

EasingFn EasingRegistry::resolve(const std::string& name) const
{
    std::lock_guard lock(mutex_);
    auto            it = formulas_.find(name);
    if (it != formulas_.end())
        return it->second;

    TWEENKIT_LOG_WARN("easing", "Unknown easing '{}', falling back to linear", name);
    return formulas_.at(LINEAR);
}

std::vector<std::string> EasingRegistry::names() const
{
    std::lock_guard          lock(mutex_);
    std::vector<std::string> out;
    out.reserve(formulas_.size());
    for (const auto& [name, fn] : formulas_)
        out.push_back(name);
    return out;
}

void EasingRegistry::register_builtins()
{
    add(LINEAR, formula::linear);
    add("easeInCubic", formula::in_cubic);
    add("easeOutCubic", formula::out_cubic);
    add("easeInOutCubic", formula::in_out_cubic);
    add("bounce", formula::out_bounce);
    add("elastic", formula::out_elastic);
    add("spring", formula::damped_spring);
    add("decelerate", formula::out_quad);
    add("bezierOutCubic", formula::from_curve(ease::ease_out_cubic));
    add("bezierOutQuart", formula::from_curve(ease::ease_out_quart));
    add("bezierInOutCubic", formula::from_curve(ease::ease_in_out_cubic));
}

}   // namespace tweenkit
