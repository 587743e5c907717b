#include <algorithm>
#include <cmath>
#include <tweenkit/easing.hpp>

namespace tweenkit
{

namespace formula
{

namespace
{

constexpr double PI = 3.14159265358979323846;

// Fraction of the duration that has elapsed, clamped to [0, 1].
double progress(double elapsed, double duration)
{
    if (duration <= 0.0)
        return 1.0;
    return std::clamp(elapsed / duration, 0.0, 1.0);
}

}   // anonymous namespace

double linear(double elapsed, double start, double delta, double duration)
{
    return delta * elapsed / duration + start;
}

double in_cubic(double elapsed, double start, double delta, double duration)
{
    const double t = progress(elapsed, duration);
    return delta * t * t * t + start;
}

double out_cubic(double elapsed, double start, double delta, double duration)
{
    const double t = progress(elapsed, duration) - 1.0;
    return delta * (t * t * t + 1.0) + start;
}

double in_out_cubic(double elapsed, double start, double delta, double duration)
{
    double t = progress(elapsed, duration) * 2.0;
    if (t < 1.0)
        return delta / 2.0 * t * t * t + start;
    t -= 2.0;
    return delta / 2.0 * (t * t * t + 2.0) + start;
}

double out_bounce(double elapsed, double start, double delta, double duration)
{
    double t = progress(elapsed, duration);

    if (t < 1.0 / 2.75)
        return delta * (7.5625 * t * t) + start;

    if (t < 2.0 / 2.75)
    {
        t -= 1.5 / 2.75;
        return delta * (7.5625 * t * t + 0.75) + start;
    }

    if (t < 2.5 / 2.75)
    {
        t -= 2.25 / 2.75;
        return delta * (7.5625 * t * t + 0.9375) + start;
    }

    t -= 2.625 / 2.75;
    return delta * (7.5625 * t * t + 0.984375) + start;
}

double out_elastic(double elapsed, double start, double delta, double duration)
{
    const double t = progress(elapsed, duration);
    if (t <= 0.0)
        return start;
    if (t >= 1.0)
        return start + delta;

    // Period 0.3 of the duration, no amplitude boost
    constexpr double period = 0.3;
    constexpr double shift  = period / 4.0;
    return delta * std::pow(2.0, -10.0 * t) * std::sin((t - shift) * (2.0 * PI) / period) + delta +
           start;
}

double damped_spring(double elapsed, double start, double delta, double duration)
{
    const double t = progress(elapsed, duration);
    if (t >= 1.0)
        return start + delta;

    constexpr double damping = 6.0;
    constexpr double freq    = 4.5;
    return delta * (1.0 - std::exp(-damping * t) * std::cos(freq * PI * t)) + start;
}

double out_quad(double elapsed, double start, double delta, double duration)
{
    const double t = progress(elapsed, duration);
    return -delta * t * (t - 2.0) + start;
}

EasingFn from_curve(std::function<double(double)> curve)
{
    return [curve = std::move(curve)](double elapsed, double start, double delta, double duration)
    { return start + delta * curve(progress(elapsed, duration)); };
}

}   // namespace formula

namespace ease
{

double linear(double t)
{
    return t;
}

double ease_in(double t)
{
    return formula::in_cubic(t, 0.0, 1.0, 1.0);
}

double ease_out(double t)
{
    return formula::out_cubic(t, 0.0, 1.0, 1.0);
}

double ease_in_out(double t)
{
    return formula::in_out_cubic(t, 0.0, 1.0, 1.0);
}

double bounce(double t)
{
    return formula::out_bounce(t, 0.0, 1.0, 1.0);
}

double elastic(double t)
{
    return formula::out_elastic(t, 0.0, 1.0, 1.0);
}

double spring(double t)
{
    return formula::damped_spring(t, 0.0, 1.0, 1.0);
}

double decelerate(double t)
{
    return formula::out_quad(t, 0.0, 1.0, 1.0);
}

double CubicBezier::operator()(double t) const
{
    if (t <= 0.0)
        return 0.0;
    if (t >= 1.0)
        return 1.0;

    auto sample = [](double a, double b, double u)
    {
        const double v = 1.0 - u;
        return 3.0 * v * v * u * a + 3.0 * v * u * u * b + u * u * u;
    };
    auto slope = [](double a, double b, double u)
    {
        const double v = 1.0 - u;
        return 3.0 * v * v * a + 6.0 * v * u * (b - a) + 3.0 * u * u * (1.0 - b);
    };

    // Solve x(u) == t by Newton iteration, then evaluate y(u)
    double u = t;
    for (int i = 0; i < 8; ++i)
    {
        const double dx = slope(x1, x2, u);
        if (std::abs(dx) < 1e-9)
            break;
        u = std::clamp(u - (sample(x1, x2, u) - t) / dx, 0.0, 1.0);
    }
    return sample(y1, y2, u);
}

}   // namespace ease

}   // namespace tweenkit
