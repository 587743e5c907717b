#pragma once

#include <string>

namespace tweenkit
{

inline constexpr int    DEFAULT_FPS         = 30;
inline constexpr double DEFAULT_DURATION_MS = 500.0;
inline constexpr char   DEFAULT_EASING[]    = "linear";

// Engine-wide defaults. Non-positive numbers and an empty easing name mean
// "use the default".
struct EngineOptions
{
    int         fps      = DEFAULT_FPS;
    std::string easing   = DEFAULT_EASING;
    double      duration = DEFAULT_DURATION_MS;

    // Returns `base` with TWEENKIT_FPS, TWEENKIT_EASING and TWEENKIT_DURATION
    // applied where set. Malformed or out-of-range values are logged and
    // ignored.
    static EngineOptions from_env(EngineOptions base);
    static EngineOptions from_env();

    // Copy with every unset or invalid field replaced by its default.
    EngineOptions normalized() const;
};

}   // namespace tweenkit
