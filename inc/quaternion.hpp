#pragma once

#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <type_traits>

#include "angle.hpp"
#include "matrix.hpp"
#include "rotation.hpp"

namespace wetmelon::geometry {

/**
 * @ingroup rotation
 * @brief Quaternion w + xi + yj + zk
 *
 * Unit quaternions are a 3D rotation representation in their own right
 * (models Rotation3) and the canonical partner of Basis3. Composition follows
 * the Hamilton product, matching matrix multiplication order: `a.concat(b)`
 * applies `b` first.
 */
template<BaseFloat T>
struct Quaternion : public Matrix<4, 1, T>, public Rotation3Base<Quaternion<T>, T> {
    using value_type = T;

    // Component accessors (w + vector part x,y,z)
    constexpr T&       w() { return this->data_[0][0]; }
    constexpr const T& w() const { return this->data_[0][0]; }
    constexpr T&       x() { return this->data_[1][0]; }
    constexpr const T& x() const { return this->data_[1][0]; }
    constexpr T&       y() { return this->data_[2][0]; }
    constexpr const T& y() const { return this->data_[2][0]; }
    constexpr T&       z() { return this->data_[3][0]; }
    constexpr const T& z() const { return this->data_[3][0]; }

    // Default constructor (identity)
    constexpr Quaternion() : Matrix<4, 1, T>() { w() = T{1}; }
    constexpr Quaternion(const Quaternion&) = default;
    constexpr Quaternion& operator=(const Quaternion&) = default;
    constexpr Quaternion(Quaternion&&) = default;
    constexpr Quaternion& operator=(Quaternion&&) = default;
    constexpr ~Quaternion() = default;

    constexpr Quaternion(T w_, T x_, T y_, T z_) : Matrix<4, 1, T>() {
        w() = w_;
        x() = x_;
        y() = y_;
        z() = z_;
    }

    // Scalar part plus vector part
    constexpr Quaternion(T s, const Vec3<T>& v) : Quaternion(s, v[0], v[1], v[2]) {}

    [[nodiscard]] static constexpr Quaternion identity() { return Quaternion{T{1}, T{0}, T{0}, T{0}}; }
    [[nodiscard]] static constexpr Quaternion one() { return identity(); }

    [[nodiscard]] constexpr Vec3<T> vector_part() const { return Vec3<T>{x(), y(), z()}; }

    // Norms
    [[nodiscard]] constexpr T norm_squared() const { return (w() * w()) + (x() * x()) + (y() * y()) + (z() * z()); }
    [[nodiscard]] constexpr T norm() const { return wet::sqrt(norm_squared()); }

    // Normalization utilities
    [[nodiscard]] constexpr std::optional<Quaternion> normalized_safe(T eps = T{1e-9}) const {
        T n2 = norm_squared();
        if (n2 <= eps) {
            return std::nullopt;
        }
        T inv_n = T{1} / wet::sqrt(n2);
        return Quaternion{w() * inv_n, x() * inv_n, y() * inv_n, z() * inv_n};
    }

    constexpr bool normalize_in_place(T eps = T{1e-9}) {
        auto n = normalized_safe(eps);
        if (!n) {
            return false;
        }
        *this = *n;
        return true;
    }

    [[nodiscard]] constexpr Quaternion normalized(T eps = T{1e-9}) const { return normalized_safe(eps).value_or(*this); }

    // Conjugate and inverse
    [[nodiscard]] constexpr Quaternion conjugate() const { return Quaternion{w(), -x(), -y(), -z()}; }

    [[nodiscard]] constexpr std::optional<Quaternion> inverse(T eps = T{1e-9}) const {
        T n2 = norm_squared();
        if (n2 <= eps) {
            return std::nullopt;
        }
        T inv_n2 = T{1} / n2;
        return Quaternion{w() * inv_n2, -x() * inv_n2, -y() * inv_n2, -z() * inv_n2};
    }

    // Hamilton product
    [[nodiscard]] constexpr Quaternion operator*(const Quaternion& rhs) const {
        return Quaternion{
            w() * rhs.w() - x() * rhs.x() - y() * rhs.y() - z() * rhs.z(),
            w() * rhs.x() + x() * rhs.w() + y() * rhs.z() - z() * rhs.y(),
            w() * rhs.y() - x() * rhs.z() + y() * rhs.w() + z() * rhs.x(),
            w() * rhs.z() + x() * rhs.y() - y() * rhs.x() + z() * rhs.w()
        };
    }

    constexpr Quaternion& operator*=(const Quaternion& rhs) { return *this = (*this) * rhs; }

    // Scalar multiply/divide
    [[nodiscard]] constexpr Quaternion operator*(T scalar) const {
        return Quaternion{w() * scalar, x() * scalar, y() * scalar, z() * scalar};
    }

    [[nodiscard]] constexpr Quaternion operator/(T scalar) const {
        return Quaternion{w() / scalar, x() / scalar, y() / scalar, z() / scalar};
    }

    [[nodiscard]] constexpr Quaternion operator-() const { return Quaternion{-w(), -x(), -y(), -z()}; }

    [[nodiscard]] constexpr bool operator==(const Quaternion& rhs) const {
        return static_cast<const Matrix<4, 1, T>&>(*this) == static_cast<const Matrix<4, 1, T>&>(rhs);
    }

    [[nodiscard]] constexpr bool approx_eq(const Quaternion& other, T eps = approx_epsilon<T>()) const {
        return Matrix<4, 1, T>::approx_eq(other, eps);
    }

    // (w, x, y, z)
    [[nodiscard]] constexpr std::array<T, 4> to_array() const { return {w(), x(), y(), z()}; }

    [[nodiscard]] static constexpr Quaternion from_array(const std::array<T, 4>& wxyz) {
        return Quaternion{wxyz[0], wxyz[1], wxyz[2], wxyz[3]};
    }

    /**
     * @brief Rotate a 3D vector (q v q*), assuming a unit quaternion
     */
    [[nodiscard]] constexpr Vec3<T> rotate_vector(const Vec3<T>& v) const {
        const Vec3<T> qv = vector_part();
        const Vec3<T> t = qv.cross(v) * T{2};
        return v + t * w() + qv.cross(t);
    }

    [[nodiscard]] constexpr Quaternion concat(const Quaternion& other) const { return (*this) * other; }

    /**
     * @brief Inverse rotation
     *
     * The zero quaternion has no inverse; inverting it is a precondition
     * violation and throws std::bad_optional_access.
     */
    [[nodiscard]] constexpr Quaternion invert() const { return inverse().value(); }

    /**
     * @brief Rotation by `angle` about a unit `axis`
     *
     * The axis is used as given; it is not renormalized.
     */
    [[nodiscard]] static Quaternion from_axis_angle(const Vec3<T>& axis, Rad<T> angle) {
        const auto [s, c] = (angle * T{0.5}).sin_cos();
        return Quaternion{c, axis * s};
    }

    /**
     * @brief Rotation about x, then y, then z: qz * qy * qx
     */
    [[nodiscard]] static Quaternion from_euler(Rad<T> x, Rad<T> y, Rad<T> z) {
        return Quaternion::from_angle_z(z) * Quaternion::from_angle_y(y) * Quaternion::from_angle_x(x);
    }

    /**
     * @brief Shortest-arc rotation taking unit `a` onto unit `b`
     *
     * Built as axis-angle with the angle from atan2(|a x b|, a . b), which stays
     * accurate when `b` is close to `a` or to `-a`. When `a x b` vanishes the
     * vectors are parallel (identity) or opposite. For opposite vectors every
     * axis perpendicular to `a` is a shortest arc; the one perpendicular to +x
     * (or +y when `a` is along x) is used.
     */
    [[nodiscard]] static Quaternion between_vectors(const Vec3<T>& a, const Vec3<T>& b) {
        const Vec3<T> c = a.cross(b);
        const T       s = c.norm();
        const T       d = dot(a, b);
        if (s <= std::numeric_limits<T>::epsilon()) {
            if (d > T{0}) {
                return one();
            }
            Vec3<T> axis = Vec3<T>::unit_x().cross(a);
            if (dot(axis, axis) <= std::numeric_limits<T>::epsilon()) {
                axis = Vec3<T>::unit_y().cross(a);
            }
            return from_axis_angle(axis.normalized(), Rad<T>::turn_div_2());
        }
        return from_axis_angle(c / s, Rad<T>::atan2(s, d));
    }

    /**
     * @brief Rotation taking +z onto `dir` and +y towards `up`, via Mat3 look_at
     */
    [[nodiscard]] static Quaternion look_at(const Vec3<T>& dir, const Vec3<T>& up) {
        return from_matrix(mat::look_at(dir, up)).value();
    }

    /**
     * @brief Equivalent rotation matrix
     *
     * Scale is divided out (2 / |q|^2), so any non-zero quaternion gives the
     * rotation of its unit multiple. The zero quaternion gives a NaN matrix.
     */
    [[nodiscard]] constexpr Mat3<T> to_matrix() const {
        const T s = T{2} / norm_squared();
        const T ww = w();
        const T xx = x();
        const T yy = y();
        const T zz = z();

        Mat3<T> R;
        R(0, 0) = T{1} - s * (yy * yy + zz * zz);
        R(0, 1) = s * (xx * yy - zz * ww);
        R(0, 2) = s * (xx * zz + yy * ww);

        R(1, 0) = s * (xx * yy + zz * ww);
        R(1, 1) = T{1} - s * (xx * xx + zz * zz);
        R(1, 2) = s * (yy * zz - xx * ww);

        R(2, 0) = s * (xx * zz - yy * ww);
        R(2, 1) = s * (yy * zz + xx * ww);
        R(2, 2) = T{1} - s * (xx * xx + yy * yy);
        return R;
    }

    // Defined in basis.hpp
    [[nodiscard]] Basis3<T> to_basis() const;

    [[nodiscard]] constexpr Quaternion to_quaternion() const { return *this; }

    /**
     * @brief Quaternion from a rotation matrix (Shepperd's method)
     *
     * @return Unit quaternion, or nullopt if R is too degenerate to normalize
     */
    [[nodiscard]] static constexpr std::optional<Quaternion> from_matrix(const Mat3<T>& R, T eps = T{1e-6}) {
        T          trace = R.trace();
        Quaternion q;
        if (trace > T{0}) {
            T s = wet::sqrt(trace + T{1});
            q.w() = T{0.5} * s;
            T inv_s = T{0.5} / s;
            q.x() = (R(2, 1) - R(1, 2)) * inv_s;
            q.y() = (R(0, 2) - R(2, 0)) * inv_s;
            q.z() = (R(1, 0) - R(0, 1)) * inv_s;
        } else if (R(0, 0) > R(1, 1) && R(0, 0) > R(2, 2)) {
            T s = wet::sqrt(T{1} + R(0, 0) - R(1, 1) - R(2, 2));
            if (s <= eps)
                return std::nullopt;
            T inv_s = T{0.5} / s;
            q.x() = T{0.5} * s;
            q.y() = (R(0, 1) + R(1, 0)) * inv_s;
            q.z() = (R(0, 2) + R(2, 0)) * inv_s;
            q.w() = (R(2, 1) - R(1, 2)) * inv_s;
        } else if (R(1, 1) > R(2, 2)) {
            T s = wet::sqrt(T{1} + R(1, 1) - R(0, 0) - R(2, 2));
            if (s <= eps)
                return std::nullopt;
            T inv_s = T{0.5} / s;
            q.x() = (R(0, 1) + R(1, 0)) * inv_s;
            q.y() = T{0.5} * s;
            q.z() = (R(1, 2) + R(2, 1)) * inv_s;
            q.w() = (R(0, 2) - R(2, 0)) * inv_s;
        } else {
            T s = wet::sqrt(T{1} + R(2, 2) - R(0, 0) - R(1, 1));
            if (s <= eps)
                return std::nullopt;
            T inv_s = T{0.5} / s;
            q.x() = (R(0, 2) + R(2, 0)) * inv_s;
            q.y() = (R(1, 2) + R(2, 1)) * inv_s;
            q.z() = T{0.5} * s;
            q.w() = (R(1, 0) - R(0, 1)) * inv_s;
        }
        if (!q.normalize_in_place(eps))
            return std::nullopt;
        return q;
    }

    /**
     * @brief Spherical linear interpolation, t clamped to [0, 1]
     */
    [[nodiscard]] static Quaternion slerp(const Quaternion& a, const Quaternion& b, T t) {
        t = wet::clamp(t, T{0}, T{1});

        T          cos_theta = dot(a, b);
        Quaternion b_adj = b;
        if (cos_theta < T{0}) {
            cos_theta = -cos_theta;
            b_adj = -b;
        }

        // Nearly parallel: fall back to normalized lerp
        if (cos_theta > T{1} - T{1e-6}) {
            return (a * (T{1} - t) + b_adj * t).normalized();
        }

        const T theta = std::acos(cos_theta);
        const T sin_theta = std::sin(theta);
        const T w1 = std::sin((T{1} - t) * theta) / sin_theta;
        const T w2 = std::sin(t * theta) / sin_theta;
        return (a * w1 + b_adj * w2).normalized();
    }

    [[nodiscard]] friend constexpr T dot(const Quaternion& a, const Quaternion& b) {
        return a.w() * b.w() + a.x() * b.x() + a.y() * b.y() + a.z() * b.z();
    }

    [[nodiscard]] constexpr Quaternion operator+(const Quaternion& rhs) const {
        return Quaternion{w() + rhs.w(), x() + rhs.x(), y() + rhs.y(), z() + rhs.z()};
    }
};

// Scalar multiply (scalar on left)
template<BaseFloat T>
[[nodiscard]] constexpr Quaternion<T> operator*(T scalar, const Quaternion<T>& q) {
    return q * scalar;
}

using Quatf = Quaternion<float>;
using Quatd = Quaternion<double>;

} // namespace wetmelon::geometry
