#pragma once

#include <concepts>

#include "angle.hpp"
#include "matrix.hpp"
#include "point.hpp"
#include "scalar.hpp"

namespace wetmelon::geometry {

// Forward declarations
template<BaseFloat S>
struct Basis2;

template<BaseFloat S>
struct Basis3;

template<BaseFloat T>
struct Quaternion;

/**
 * @ingroup rotation
 * @brief A transformation that fixes the origin and produces circular motion
 *
 * Every rotation representation over the point space P provides:
 *  - `R::one()`                   identity (no-op) rotation
 *  - `R::look_at(dir, up)`        canonical forward axis onto `dir`, `up` fixing roll
 *  - `R::between_vectors(a, b)`   shortest arc taking unit `a` onto unit `b`
 *  - `r.rotate_vector(v)`         rotate a free vector
 *  - `r.rotate_point(p)`          rotate a point through its vector from the origin
 *  - `r.concat(s)`                composition; applied to a vector, `s` acts first
 *  - `r.invert()`                 `r.concat(r.invert())` ≈ `one()`
 *  - `r.concat_self(s)`, `r.invert_self()`   in-place forms
 *  - `r.approx_eq(s, eps)`        comparison with a scalar tolerance
 *
 * concat must be associative with one() as a two-sided identity.
 */
template<typename R, typename P>
concept Rotation = PointLike<P> && BaseFloat<typename P::scalar_type> && std::copyable<R> && std::equality_comparable<R> &&
                   requires(const R r, R m, const typename P::vector_type v, const P p, const typename P::scalar_type eps) {
                       { R::one() } -> std::same_as<R>;
                       { R::look_at(v, v) } -> std::same_as<R>;
                       { R::between_vectors(v, v) } -> std::same_as<R>;
                       { r.rotate_vector(v) } -> std::same_as<typename P::vector_type>;
                       { r.rotate_point(p) } -> std::same_as<P>;
                       { r.concat(r) } -> std::same_as<R>;
                       { r.invert() } -> std::same_as<R>;
                       { r.approx_eq(r, eps) } -> std::same_as<bool>;
                       m.concat_self(r);
                       m.invert_self();
                   };

/**
 * @ingroup rotation
 * @brief A rotation of the plane, convertible to a 2×2 matrix and to Basis2
 */
template<typename R, typename S>
concept Rotation2 = Rotation<R, Point2<S>> && requires(const R r, const Rad<S> theta) {
    { R::from_angle(theta) } -> std::same_as<R>;
    { r.to_matrix() } -> std::same_as<Mat2<S>>;
    { r.to_basis() } -> std::same_as<Basis2<S>>;
};

/**
 * @ingroup rotation
 * @brief A rotation of 3D space, convertible to a 3×3 matrix, Basis3 and Quaternion
 */
template<typename R, typename S>
concept Rotation3 = Rotation<R, Point3<S>> && requires(const R r, const Vec3<S> axis, const Rad<S> angle) {
    { R::from_axis_angle(axis, angle) } -> std::same_as<R>;
    { R::from_euler(angle, angle, angle) } -> std::same_as<R>;
    { R::from_angle_x(angle) } -> std::same_as<R>;
    { R::from_angle_y(angle) } -> std::same_as<R>;
    { R::from_angle_z(angle) } -> std::same_as<R>;
    { r.to_matrix() } -> std::same_as<Mat3<S>>;
    { r.to_basis() } -> std::same_as<Basis3<S>>;
    { r.to_quaternion() } -> std::same_as<Quaternion<S>>;
};

/**
 * @ingroup rotation
 * @brief Default operations shared by all rotation representations (CRTP)
 *
 * Derived must provide rotate_vector(), concat() and invert(); the point and
 * in-place forms are derived from them. Derived may hide any of these with a
 * specialized version.
 *
 * @tparam Derived Concrete rotation type
 * @tparam P Point type acted upon
 */
template<typename Derived, PointLike P>
struct RotationBase {
    using point_type = P;
    using vector_type = typename P::vector_type;
    using scalar_type = typename P::scalar_type;

    [[nodiscard]] constexpr P rotate_point(const P& point) const {
        return P::from_vec(self().rotate_vector(point.to_vec()));
    }

    constexpr void concat_self(const Derived& other) { self() = self().concat(other); }

    constexpr void invert_self() { self() = self().invert(); }

    // Stateless: lets Derived default its own comparison
    [[nodiscard]] constexpr bool operator==(const RotationBase&) const = default;

protected:
    [[nodiscard]] constexpr const Derived& self() const { return static_cast<const Derived&>(*this); }
    [[nodiscard]] constexpr Derived&       self() { return static_cast<Derived&>(*this); }
};

/**
 * @ingroup rotation
 * @brief 3D defaults: single-axis constructors expressed through from_axis_angle()
 */
template<typename Derived, BaseFloat S>
struct Rotation3Base : RotationBase<Derived, Point3<S>> {
    // Pitch
    [[nodiscard]] static Derived from_angle_x(Rad<S> theta) { return Derived::from_axis_angle(Vec3<S>::unit_x(), theta); }

    // Yaw
    [[nodiscard]] static Derived from_angle_y(Rad<S> theta) { return Derived::from_axis_angle(Vec3<S>::unit_y(), theta); }

    // Roll
    [[nodiscard]] static Derived from_angle_z(Rad<S> theta) { return Derived::from_axis_angle(Vec3<S>::unit_z(), theta); }

    [[nodiscard]] constexpr bool operator==(const Rotation3Base&) const = default;
};

} // namespace wetmelon::geometry
