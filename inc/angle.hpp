#pragma once

#include <cmath>
#include <compare>
#include <numbers>
#include <utility>

#include "scalar.hpp"

namespace wetmelon::geometry {

template<BaseFloat T>
struct Deg;

/**
 * @ingroup geometry
 * @brief Angle in radians
 *
 * Strong type so that angles cannot be confused with lengths or with degrees.
 * Converts implicitly from Deg<T>.
 *
 * @tparam T Floating-point type
 */
template<BaseFloat T>
struct Rad {
    using value_type = T;

    T value{};

    constexpr Rad() = default;
    constexpr explicit Rad(T v) : value(v) {}
    constexpr Rad(const Deg<T>& d);

    [[nodiscard]] static constexpr Rad zero() { return Rad{}; }
    [[nodiscard]] static constexpr Rad full_turn() { return Rad{T{2} * std::numbers::pi_v<T>}; }
    [[nodiscard]] static constexpr Rad turn_div_2() { return Rad{std::numbers::pi_v<T>}; }
    [[nodiscard]] static constexpr Rad turn_div_4() { return Rad{std::numbers::pi_v<T> / T{2}}; }

    [[nodiscard]] T sin() const { return std::sin(value); }
    [[nodiscard]] T cos() const { return std::cos(value); }
    [[nodiscard]] T tan() const { return std::tan(value); }

    // (sin, cos) pair, the form every rotation constructor needs
    [[nodiscard]] std::pair<T, T> sin_cos() const { return {std::sin(value), std::cos(value)}; }

    // Inverse trig; arguments outside [-1, 1] are clamped rather than producing NaN
    [[nodiscard]] static Rad acos(T x) { return Rad{std::acos(wet::clamp(x, T{-1}, T{1}))}; }
    [[nodiscard]] static Rad asin(T x) { return Rad{std::asin(wet::clamp(x, T{-1}, T{1}))}; }
    [[nodiscard]] static Rad atan(T x) { return Rad{std::atan(x)}; }
    [[nodiscard]] static Rad atan2(T y, T x) { return Rad{std::atan2(y, x)}; }

    /**
     * @brief Wrap into [0, 2π)
     */
    [[nodiscard]] Rad normalized() const {
        const T turn = full_turn().value;
        T       r = value - turn * std::floor(value / turn);
        if (r >= turn) {
            r -= turn;
        }
        return Rad{r};
    }

    [[nodiscard]] constexpr bool approx_eq(const Rad& other, T eps = approx_epsilon<T>()) const {
        return geometry::approx_eq(value, other.value, eps);
    }

    constexpr Rad& operator+=(const Rad& rhs) {
        value += rhs.value;
        return *this;
    }
    constexpr Rad& operator-=(const Rad& rhs) {
        value -= rhs.value;
        return *this;
    }
    constexpr Rad& operator*=(T s) {
        value *= s;
        return *this;
    }
    constexpr Rad& operator/=(T s) {
        value /= s;
        return *this;
    }

    [[nodiscard]] constexpr Rad operator-() const { return Rad{-value}; }
    [[nodiscard]] constexpr Rad operator+(const Rad& rhs) const { return Rad{value + rhs.value}; }
    [[nodiscard]] constexpr Rad operator-(const Rad& rhs) const { return Rad{value - rhs.value}; }
    [[nodiscard]] constexpr Rad operator*(T s) const { return Rad{value * s}; }
    [[nodiscard]] constexpr Rad operator/(T s) const { return Rad{value / s}; }
    [[nodiscard]] constexpr T   operator/(const Rad& rhs) const { return value / rhs.value; }

    constexpr auto operator<=>(const Rad&) const = default;
};

/**
 * @ingroup geometry
 * @brief Angle in degrees, converted to Rad<T> wherever a rotation is built
 */
template<BaseFloat T>
struct Deg {
    using value_type = T;

    T value{};

    constexpr Deg() = default;
    constexpr explicit Deg(T v) : value(v) {}
    constexpr Deg(const Rad<T>& r) : value(r.value * T{180} / std::numbers::pi_v<T>) {}

    [[nodiscard]] static constexpr Deg full_turn() { return Deg{T{360}}; }

    [[nodiscard]] T sin() const { return Rad<T>(*this).sin(); }
    [[nodiscard]] T cos() const { return Rad<T>(*this).cos(); }
    [[nodiscard]] T tan() const { return Rad<T>(*this).tan(); }

    [[nodiscard]] Deg normalized() const { return Deg{Rad<T>(*this).normalized()}; }

    [[nodiscard]] constexpr bool approx_eq(const Deg& other, T eps = approx_epsilon<T>()) const {
        return geometry::approx_eq(value, other.value, eps);
    }

    [[nodiscard]] constexpr Deg operator-() const { return Deg{-value}; }
    [[nodiscard]] constexpr Deg operator+(const Deg& rhs) const { return Deg{value + rhs.value}; }
    [[nodiscard]] constexpr Deg operator-(const Deg& rhs) const { return Deg{value - rhs.value}; }
    [[nodiscard]] constexpr Deg operator*(T s) const { return Deg{value * s}; }
    [[nodiscard]] constexpr Deg operator/(T s) const { return Deg{value / s}; }

    constexpr auto operator<=>(const Deg&) const = default;
};

template<BaseFloat T>
constexpr Rad<T>::Rad(const Deg<T>& d) : value(d.value * std::numbers::pi_v<T> / T{180}) {}

template<BaseFloat T>
[[nodiscard]] constexpr Rad<T> operator*(T s, const Rad<T>& a) {
    return a * s;
}

template<BaseFloat T>
[[nodiscard]] constexpr Deg<T> operator*(T s, const Deg<T>& a) {
    return a * s;
}

template<BaseFloat T>
[[nodiscard]] constexpr Rad<T> rad(T v) {
    return Rad<T>{v};
}

template<BaseFloat T>
[[nodiscard]] constexpr Deg<T> deg(T v) {
    return Deg<T>{v};
}

using Radf = Rad<float>;
using Radd = Rad<double>;
using Degf = Deg<float>;
using Degd = Deg<double>;

} // namespace wetmelon::geometry
