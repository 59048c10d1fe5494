/**
 * @file math.hpp
 * @brief tiny clamped interpolation + guarded division helpers uwu
 *
 * ACI 318 is basically a pile of tables with linear interpolation between the
 * rows, so this header keeps exactly one blessed way of doing that: a clamped
 * `lerp` that never extrapolates past the table edges. column strip shares,
 * torsional stiffness ratios, and l2/l1 lookups all route through here so the
 * interpolation arithmetic lives in a single place instead of being re-typed
 * at every call site fr fr.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 *
 * @note compiled with GCC 15.2+ in -std=c++2c mode (C++26 baby!)
 * @note header-only, constexpr, zero allocations
 *
 * example (basic usage):
 * @code
 * using namespace fsa::common;
 * constexpr double share = lerp(1.25, 0.0, 1.00, 2.5, 0.75);
 * // share == 0.875, halfway between 100% and 75% uwu
 * @endcode
 */
#pragma once

#include <cmath>
#include <limits>

namespace fsa::common {

/**
 * @brief clamps a scalar into [lo, hi] without std::clamp's precondition drama
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - same inputs = same output, no state touched
 * - tolerates lo > hi by swapping, so table rows written in descending order
 *   still clamp correctly
 *
 * @param[in] value scalar to clamp
 * @param[in] lo lower bound
 * @param[in] hi upper bound
 * @return value limited to the closed interval
 */
[[nodiscard]] constexpr auto clamp_between(double value, double lo, double hi) noexcept -> double
{
    if (lo > hi) {
        const double tmp = lo;
        lo = hi;
        hi = tmp;
    }
    if (value < lo) {
        return lo;
    }
    if (value > hi) {
        return hi;
    }
    return value;
}

/**
 * @brief linear interpolation between (x0, y0) and (x1, y1), clamped at both ends
 *
 * the single interpolation primitive for every ACI table lookup. x outside
 * [x0, x1] pins to the nearest endpoint value, so out-of-range inputs degrade
 * to the table edge instead of extrapolating into nonsense.
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - referential transparency applies (same inputs = same output)
 * - no side effects, no throws, just math uwu
 * - constexpr friendly so table lookups fold at compile time
 *
 * @param[in] x query abscissa
 * @param[in] x0 first table abscissa
 * @param[in] y0 value at x0
 * @param[in] x1 second table abscissa (x1 != x0 for a real interpolation)
 * @param[in] y1 value at x1
 * @return interpolated value, or y0 when the interval is degenerate
 *
 * @complexity O(1) time, O(1) space
 *
 * example (edge case handling):
 * @code
 * auto below = fsa::common::lerp(-3.0, 0.0, 1.0, 2.5, 0.75);
 * // below == 1.0 because we clamp instead of extrapolating
 * @endcode
 */
[[nodiscard]] constexpr auto lerp(double x, double x0, double y0, double x1, double y1) noexcept -> double
{
    const double span = x1 - x0;
    if (span == 0.0) {
        return y0;
    }
    const double t = clamp_between((x - x0) / span, 0.0, 1.0);
    return y0 + ((y1 - y0) * t);
}

/**
 * @brief division that returns a fallback instead of dividing by (near) zero
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] numerator dividend
 * @param[in] denominator divisor
 * @param[in] fallback value returned when |denominator| is below tolerance
 * @return numerator / denominator or fallback
 *
 * @note tolerance is 1e-300 so only true zeros (and denormal dust) trip it
 */
[[nodiscard]] constexpr auto safe_divide(double numerator, double denominator, double fallback = 0.0) noexcept
    -> double
{
    constexpr double kTiny = 1.0e-300;
    if (denominator > -kTiny && denominator < kTiny) {
        return fallback;
    }
    return numerator / denominator;
}

/**
 * @brief rectangular section torsion constant C = (1 - 0.63 x/y) x^3 y / 3
 *
 * the ACI R8.10.5.2 approximation for a single rectangle. inputs are sorted
 * internally so callers can pass (width, depth) in any order; x is always the
 * shorter side.
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] side_a one side of the rectangle [m]
 * @param[in] side_b other side of the rectangle [m]
 * @return torsion constant [m^4], zero when either side is non-positive
 */
[[nodiscard]] constexpr auto torsion_constant(double side_a, double side_b) noexcept -> double
{
    if (side_a <= 0.0 || side_b <= 0.0) {
        return 0.0;
    }
    const double x = side_a < side_b ? side_a : side_b;
    const double y = side_a < side_b ? side_b : side_a;
    return (1.0 - (0.63 * x / y)) * (x * x * x) * y / 3.0;
}

/**
 * @brief gross moment of inertia of a b x h rectangle about its centroid
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto rectangle_inertia(double width, double height) noexcept -> double
{
    return width * (height * height * height) / 12.0;
}

}  // namespace fsa::common
