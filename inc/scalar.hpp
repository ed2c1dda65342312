#pragma once

#include <concepts>
#include <limits>
#include <type_traits>

namespace wet {

/**
 * @brief Compute square root using Newton's method (constexpr)
 *
 * Returns 0 for negative inputs, matching the behaviour expected by callers
 * that clamp rounding noise around zero.
 *
 * @tparam T Floating-point type
 * @param x  Value to compute square root of
 *
 * @return Square root of x, or 0 if x <= 0
 */
template<typename T>
constexpr T sqrt(T x) {
    if (x <= T{0})
        return T{0};
    if (x == std::numeric_limits<T>::infinity())
        return x;

    T guess = x > T{1} ? x / T{2} : T{1};
    for (int i = 0; i < 100; ++i) {
        T next = (guess + x / guess) / T{2};
        if (next == guess)
            break;
        guess = next;
    }
    return guess;
}

template<typename T>
constexpr T abs(T x) {
    return x >= T{0} ? x : -x;
}

// Clamp x into [lo, hi]; keeps acos/asin arguments inside their domain
template<typename T>
constexpr T clamp(T x, T lo, T hi) {
    if (x < lo)
        return lo;
    if (x > hi)
        return hi;
    return x;
}

} // namespace wet

namespace wetmelon::geometry {

/**
 * @brief Scalar types usable as rotation coefficients
 */
template<typename T>
concept BaseFloat = std::floating_point<T>;

/**
 * @brief Default tolerance for approximate comparisons
 *
 * Rotations built from trigonometric functions rarely match bit-for-bit, so
 * every approx_eq() in the library defaults to this value.
 */
template<BaseFloat T>
[[nodiscard]] constexpr T approx_epsilon() {
    return T{1e-5};
}

/**
 * @brief Absolute-difference comparison |a - b| <= eps
 */
template<BaseFloat T>
[[nodiscard]] constexpr bool approx_eq(T a, T b, T eps = approx_epsilon<T>()) {
    return wet::abs(a - b) <= eps;
}

} // namespace wetmelon::geometry
