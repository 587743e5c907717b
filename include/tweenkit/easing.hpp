#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tweenkit
{

// Easing contract: (elapsed ms, start value, change in value, duration ms)
// -> interpolated value. Must return `start` at elapsed == 0 and
// `start + delta` at elapsed == duration.
using EasingFn = std::function<double(double elapsed, double start, double delta, double duration)>;

// Normalized curve: maps progress t in [0,1] to eased progress.
using CurveFn = double (*)(double);

// Normalized curves: each one is the matching formula below evaluated with
// start 0, delta 1 and duration 1.
namespace ease
{
double linear(double t);
double ease_in(double t);
double ease_out(double t);
double ease_in_out(double t);
double bounce(double t);
double elastic(double t);
double spring(double t);
double decelerate(double t);

// CSS-style cubic-bezier timing curve with fixed end points (0,0) and (1,1).
struct CubicBezier
{
    double x1, y1, x2, y2;
    double operator()(double t) const;
};

inline constexpr CubicBezier ease_out_cubic{0.215, 0.61, 0.355, 1.0};
inline constexpr CubicBezier ease_out_quart{0.165, 0.84, 0.44, 1.0};
inline constexpr CubicBezier ease_in_out_cubic{0.645, 0.045, 0.355, 1.0};
}   // namespace ease

// Formulas in the easing contract.
namespace formula
{
// c * t / d + b
double linear(double elapsed, double start, double delta, double duration);

// Elapsed time outside [0, duration] is clamped, and a non-positive duration
// yields start + delta.
double in_cubic(double elapsed, double start, double delta, double duration);
double out_cubic(double elapsed, double start, double delta, double duration);
double in_out_cubic(double elapsed, double start, double delta, double duration);
double out_bounce(double elapsed, double start, double delta, double duration);
double out_elastic(double elapsed, double start, double delta, double duration);
double damped_spring(double elapsed, double start, double delta, double duration);
double out_quad(double elapsed, double start, double delta, double duration);

// Lifts a normalized curve into the easing contract.
EasingFn from_curve(std::function<double(double)> curve);
}   // namespace formula

// Named easing formulas. "linear" is always present and cannot be removed.
// Thread-safe.
class EasingRegistry
{
   public:
    EasingRegistry();

    EasingRegistry(const EasingRegistry&)            = delete;
    EasingRegistry& operator=(const EasingRegistry&) = delete;

    // Process-wide registry, pre-populated with the built-in formulas.
    static EasingRegistry& global();

    // Registers (or replaces) a formula. Returns false for an empty name or
    // an empty function.
    bool add(const std::string& name, EasingFn fn);

    // Removes a formula. "linear" is never removed.
    bool remove(const std::string& name);

    bool contains(const std::string& name) const;

    std::optional<EasingFn> find(const std::string& name) const;

    // Like find(), but falls back to linear for unknown names.
    EasingFn resolve(const std::string& name) const;

    std::vector<std::string> names() const;

    // Registers linear, the built-in formulas and the bezier presets.
    void register_builtins();

   private:
    mutable std::mutex              mutex_;
    std::map<std::string, EasingFn> formulas_;
};

}   // namespace tweenkit
