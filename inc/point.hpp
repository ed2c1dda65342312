#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <initializer_list>

#include "matrix.hpp"

namespace wetmelon::geometry {

/**
 * @ingroup geometry
 * @brief Position in N-dimensional space
 *
 * Distinct from ColVec: points can be offset by vectors and subtracted from
 * each other, but not added or scaled. Rotations act on a point through its
 * displacement from the origin (to_vec / from_vec).
 *
 * @tparam N Dimension
 * @tparam T Scalar type
 */
template<size_t N, typename T = double>
struct Point {
    static_assert(std::is_floating_point_v<T>, "Point coordinate type must be floating point");

    using scalar_type = T;
    using vector_type = ColVec<N, T>;

    static constexpr size_t dimension = N;

    constexpr Point() = default;
    constexpr Point(const Point&) = default;
    constexpr Point& operator=(const Point&) = default;
    constexpr Point(Point&&) = default;
    constexpr Point& operator=(Point&&) = default;
    constexpr ~Point() = default;

    constexpr Point(std::initializer_list<T> values) {
        size_t i = 0;
        for (const auto& val : values) {
            if (i < N) {
                coords_[i] = val;
            }
            ++i;
        }
    }

    [[nodiscard]] static constexpr Point origin() { return Point{}; }

    [[nodiscard]] static constexpr Point from_vec(const vector_type& v) {
        Point p;
        for (size_t i = 0; i < N; ++i) {
            p.coords_[i] = v[i];
        }
        return p;
    }

    [[nodiscard]] constexpr vector_type to_vec() const { return vector_type(coords_); }

    constexpr const T& operator[](size_t idx) const { return coords_[idx]; }
    constexpr T&       operator[](size_t idx) { return coords_[idx]; }

    [[nodiscard]] constexpr T x() const { return coords_[0]; }
    [[nodiscard]] constexpr T y() const
        requires(N >= 2)
    { return coords_[1]; }
    [[nodiscard]] constexpr T z() const
        requires(N >= 3)
    { return coords_[2]; }

    constexpr Point& operator+=(const vector_type& v) {
        for (size_t i = 0; i < N; ++i) {
            coords_[i] += v[i];
        }
        return *this;
    }

    constexpr Point& operator-=(const vector_type& v) {
        for (size_t i = 0; i < N; ++i) {
            coords_[i] -= v[i];
        }
        return *this;
    }

    [[nodiscard]] constexpr Point operator+(const vector_type& v) const {
        Point p = *this;
        p += v;
        return p;
    }

    [[nodiscard]] constexpr Point operator-(const vector_type& v) const {
        Point p = *this;
        p -= v;
        return p;
    }

    // Displacement from rhs to *this
    [[nodiscard]] constexpr vector_type operator-(const Point& rhs) const { return to_vec() - rhs.to_vec(); }

    [[nodiscard]] constexpr bool operator==(const Point&) const = default;

    [[nodiscard]] constexpr bool approx_eq(const Point& other, T eps = approx_epsilon<T>()) const {
        for (size_t i = 0; i < N; ++i) {
            if (!geometry::approx_eq(coords_[i], other.coords_[i], eps)) {
                return false;
            }
        }
        return true;
    }

private:
    std::array<T, N> coords_{};
};

template<typename T>
using Point2 = Point<2, T>;

template<typename T>
using Point3 = Point<3, T>;

/**
 * @brief Anything a rotation can act on as a point
 */
template<typename P>
concept PointLike = requires(const P p, const typename P::vector_type v) {
    typename P::scalar_type;
    typename P::vector_type;
    { P::from_vec(v) } -> std::same_as<P>;
    { p.to_vec() } -> std::same_as<typename P::vector_type>;
};

} // namespace wetmelon::geometry
