#include <cstdlib>
#include <limits>
#include <optional>
#include <tweenkit/config.hpp>
#include <tweenkit/logger.hpp>

namespace tweenkit
{

namespace
{

const char* env_value(const char* name)
{
    const char* env = std::getenv(name);
    return (env && env[0] != '\0') ? env : nullptr;
}

std::optional<double> parse_number(const char* name, const char* text, double max_value)
{
    char*  end   = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !(value > 0.0))
    {
        TWEENKIT_LOG_WARN("config", "Ignoring {}='{}': expected a positive number", name, text);
        return std::nullopt;
    }
    if (value > max_value)
    {
        TWEENKIT_LOG_WARN("config", "Ignoring {}='{}': larger than {}", name, text, max_value);
        return std::nullopt;
    }
    return value;
}

}   // anonymous namespace

EngineOptions EngineOptions::from_env(EngineOptions base)
{
    if (const char* fps = env_value("TWEENKIT_FPS"))
    {
        if (auto v = parse_number("TWEENKIT_FPS", fps,
                                  static_cast<double>(std::numeric_limits<int>::max())))
            base.fps = static_cast<int>(*v);
    }

    if (const char* easing = env_value("TWEENKIT_EASING"))
        base.easing = easing;

    if (const char* duration = env_value("TWEENKIT_DURATION"))
    {
        if (auto v = parse_number("TWEENKIT_DURATION", duration,
                                  std::numeric_limits<double>::max()))
            base.duration = *v;
    }

    return base;
}

EngineOptions EngineOptions::from_env()
{
    return from_env(EngineOptions{});
}

EngineOptions EngineOptions::normalized() const
{
    EngineOptions out = *this;
    if (out.fps <= 0)
    {
        TWEENKIT_LOG_WARN("config", "fps {} is not positive, using {}", out.fps, DEFAULT_FPS);
        out.fps = DEFAULT_FPS;
    }
    if (out.easing.empty())
        out.easing = DEFAULT_EASING;
    if (!(out.duration > 0.0))
        out.duration = DEFAULT_DURATION_MS;
    return out;
}

}   // namespace tweenkit
