#pragma once

#include <array>
#include <optional>

#include "angle.hpp"
#include "matrix.hpp"
#include "point.hpp"
#include "quaternion.hpp"
#include "rotation.hpp"

namespace wetmelon::geometry {

namespace detail {

// Decoded coefficients are only accepted as a proper rotation: orthonormal
// columns and no reflection
template<typename T, size_t N>
[[nodiscard]] constexpr bool is_rotation_matrix(const Matrix<N, N, T>& m, T eps) {
    return m.is_orthogonal(eps) && geometry::approx_eq(m.determinant(), T{1}, eps);
}

} // namespace detail

/**
 * @ingroup rotation
 * @brief Two-dimensional rotation matrix
 *
 * The wrapped matrix is orthogonal with determinant +1. Construction is
 * restricted to rotation-preserving operations (one, from_angle, look_at,
 * between_vectors, concat, invert, validated from_array) so the invariant
 * holds for the lifetime of the value.
 *
 * Example: rotating the unit x vector by π/2 gives the unit y vector
 * @code
 * auto rot = Basis2<double>::from_angle(Rad<double>::turn_div_4());
 * auto y = rot.rotate_vector(Vec2<double>::unit_x()); // ≈ (0, 1)
 * @endcode
 *
 * @tparam S Scalar type
 */
template<BaseFloat S>
struct Basis2 : public RotationBase<Basis2<S>, Point2<S>> {
    using value_type = S;

    // Identity rotation
    constexpr Basis2() : mat_(Mat2<S>::identity()) {}

    [[nodiscard]] static constexpr Basis2 one() { return Basis2{}; }

    /**
     * @brief Counter-clockwise rotation by theta
     */
    [[nodiscard]] static Basis2 from_angle(Rad<S> theta) { return Basis2{mat::from_angle(theta)}; }

    [[nodiscard]] static constexpr Basis2 look_at(const Vec2<S>& dir, const Vec2<S>& up) {
        return Basis2{mat::look_at(dir, up)};
    }

    /**
     * @brief Rotation taking unit `a` onto unit `b`
     *
     * Uses the signed angle atan2(a × b, a · b), so the rotation turns
     * counter-clockwise exactly when `b` lies counter-clockwise of `a`.
     */
    [[nodiscard]] static Basis2 between_vectors(const Vec2<S>& a, const Vec2<S>& b) {
        return from_angle(Rad<S>::atan2(a.cross(b), dot(a, b)));
    }

    [[nodiscard]] constexpr Vec2<S> rotate_vector(const Vec2<S>& vec) const { return mat_ * vec; }

    [[nodiscard]] constexpr Basis2 concat(const Basis2& other) const { return Basis2{mat_ * other.mat_}; }

    // TODO: the matrix is orthogonal, so the transpose would do instead of a general inverse
    [[nodiscard]] constexpr Basis2 invert() const { return Basis2{mat_.inverse().value()}; }

    [[nodiscard]] constexpr bool approx_eq(const Basis2& other, S eps = approx_epsilon<S>()) const {
        return mat_.approx_eq(other.mat_, eps);
    }

    [[nodiscard]] constexpr bool operator==(const Basis2&) const = default;

    [[nodiscard]] constexpr const Mat2<S>& matrix() const { return mat_; }
    [[nodiscard]] constexpr Mat2<S>        to_matrix() const { return mat_; }
    [[nodiscard]] constexpr Basis2         to_basis() const { return *this; }

    /**
     * @brief Row-major coefficients of the rotation matrix
     */
    [[nodiscard]] constexpr std::array<S, 4> to_array() const { return mat_.to_array(); }

    /**
     * @brief Decode row-major coefficients
     *
     * @return The rotation, or nullopt if the coefficients are not a proper
     *         rotation within eps
     */
    [[nodiscard]] static constexpr std::optional<Basis2> from_array(const std::array<S, 4>& coeffs,
                                                                    S                       eps = approx_epsilon<S>()) {
        const auto m = Mat2<S>::from_array(coeffs);
        if (!detail::is_rotation_matrix(m, eps)) {
            return std::nullopt;
        }
        return Basis2{m};
    }

private:
    constexpr explicit Basis2(const Mat2<S>& m) : mat_(m) {}

    Mat2<S> mat_;
};

/**
 * @ingroup rotation
 * @brief Three-dimensional rotation matrix
 *
 * Same orthogonality invariant and construction discipline as Basis2, with
 * conversions to and from Quaternion.
 *
 * @tparam S Scalar type
 */
template<BaseFloat S>
struct Basis3 : public Rotation3Base<Basis3<S>, S> {
    using value_type = S;

    // Identity rotation
    constexpr Basis3() : mat_(Mat3<S>::identity()) {}

    [[nodiscard]] static constexpr Basis3 one() { return Basis3{}; }

    /**
     * @brief Rotation matrix of a quaternion
     *
     * The quaternion's scale does not matter; a zero quaternion gives NaN.
     */
    [[nodiscard]] static constexpr Basis3 from_quaternion(const Quaternion<S>& q) { return Basis3{q.to_matrix()}; }

    [[nodiscard]] static constexpr Basis3 look_at(const Vec3<S>& dir, const Vec3<S>& up) {
        return Basis3{mat::look_at(dir, up)};
    }

    [[nodiscard]] static Basis3 between_vectors(const Vec3<S>& a, const Vec3<S>& b) {
        return from_quaternion(Quaternion<S>::between_vectors(a, b));
    }

    [[nodiscard]] static Basis3 from_axis_angle(const Vec3<S>& axis, Rad<S> angle) {
        return Basis3{mat::from_axis_angle(axis, angle)};
    }

    [[nodiscard]] static Basis3 from_euler(Rad<S> x, Rad<S> y, Rad<S> z) { return Basis3{mat::from_euler(x, y, z)}; }

    // Direct forms of the single-axis constructors, skipping the axis-angle detour
    [[nodiscard]] static Basis3 from_angle_x(Rad<S> theta) { return Basis3{mat::from_angle_x(theta)}; }
    [[nodiscard]] static Basis3 from_angle_y(Rad<S> theta) { return Basis3{mat::from_angle_y(theta)}; }
    [[nodiscard]] static Basis3 from_angle_z(Rad<S> theta) { return Basis3{mat::from_angle_z(theta)}; }

    [[nodiscard]] constexpr Vec3<S> rotate_vector(const Vec3<S>& vec) const { return mat_ * vec; }

    [[nodiscard]] constexpr Basis3 concat(const Basis3& other) const { return Basis3{mat_ * other.mat_}; }

    [[nodiscard]] constexpr Basis3 invert() const { return Basis3{mat_.inverse().value()}; }

    [[nodiscard]] constexpr bool approx_eq(const Basis3& other, S eps = approx_epsilon<S>()) const {
        return mat_.approx_eq(other.mat_, eps);
    }

    [[nodiscard]] constexpr bool operator==(const Basis3&) const = default;

    [[nodiscard]] constexpr const Mat3<S>& matrix() const { return mat_; }
    [[nodiscard]] constexpr Mat3<S>        to_matrix() const { return mat_; }
    [[nodiscard]] constexpr Basis3         to_basis() const { return *this; }

    [[nodiscard]] constexpr Quaternion<S> to_quaternion() const { return Quaternion<S>::from_matrix(mat_).value(); }

    [[nodiscard]] constexpr std::array<S, 9> to_array() const { return mat_.to_array(); }

    [[nodiscard]] static constexpr std::optional<Basis3> from_array(const std::array<S, 9>& coeffs,
                                                                    S                       eps = approx_epsilon<S>()) {
        const auto m = Mat3<S>::from_array(coeffs);
        if (!detail::is_rotation_matrix(m, eps)) {
            return std::nullopt;
        }
        return Basis3{m};
    }

private:
    constexpr explicit Basis3(const Mat3<S>& m) : mat_(m) {}

    Mat3<S> mat_;
};

// ============================================================================
// Deferred implementations (need full type definitions)
// ============================================================================

template<BaseFloat T>
Basis3<T> Quaternion<T>::to_basis() const {
    return Basis3<T>::from_quaternion(*this);
}

using Basis2f = Basis2<float>;
using Basis2d = Basis2<double>;

using Basis3f = Basis3<float>;
using Basis3d = Basis3<double>;

} // namespace wetmelon::geometry
