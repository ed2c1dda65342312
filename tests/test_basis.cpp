#include <cmath>
#include <numbers>
#include <optional>

#include <doctest/doctest.h>

#include "basis.hpp"

using namespace wetmelon::geometry;

constexpr double kPi = std::numbers::pi;

TEST_SUITE("Basis2") {
    TEST_CASE("Quarter turn maps x onto y") {
        const auto rot = Basis2<double>::from_angle(Rad<double>{kPi / 2.0});
        const auto v = rot.rotate_vector(Vec2<double>::unit_x());
        CHECK(v[0] == doctest::Approx(0.0));
        CHECK(v[1] == doctest::Approx(1.0));

        const auto p = rot.rotate_point(Point2<double>{2.0, 0.0});
        CHECK(p.approx_eq(Point2<double>{0.0, 2.0}));
    }

    TEST_CASE("Two eighth turns make a quarter turn") {
        const auto eighth = Basis2<double>::from_angle(Rad<double>{kPi / 4.0});
        const auto quarter = eighth.concat(eighth);
        CHECK(quarter.approx_eq(Basis2<double>::from_angle(Rad<double>{kPi / 2.0})));

        auto accumulated = Basis2<double>::one();
        accumulated.concat_self(eighth);
        accumulated.concat_self(eighth);
        CHECK(accumulated.approx_eq(quarter));
    }

    TEST_CASE("Identity") {
        const auto id = Basis2<float>::one();
        CHECK(id == Basis2<float>{});
        CHECK(id.matrix() == Mat2<float>::identity());

        const Vec2<float> v{3.0f, -4.0f};
        CHECK(id.rotate_vector(v) == v);

        const auto r = Basis2<float>::from_angle(Rad<float>{0.7f});
        CHECK(r.concat(id) == r);
        CHECK(id.concat(r) == r);
    }

    TEST_CASE("Inverse") {
        const auto r = Basis2<double>::from_angle(Rad<double>{1.3});
        CHECK(r.concat(r.invert()).approx_eq(Basis2<double>::one()));
        CHECK(r.invert().concat(r).approx_eq(Basis2<double>::one()));
        CHECK(r.invert().approx_eq(Basis2<double>::from_angle(Rad<double>{-1.3})));

        auto s = r;
        s.invert_self();
        CHECK(s == r.invert());
    }

    TEST_CASE("Between vectors uses the signed angle") {
        const auto ex = Vec2<double>::unit_x();
        const auto ey = Vec2<double>::unit_y();

        const auto ccw = Basis2<double>::between_vectors(ex, ey);
        CHECK(ccw.rotate_vector(ex).approx_eq(ey));

        // Clockwise targets rotate clockwise instead of overshooting
        const auto cw = Basis2<double>::between_vectors(ey, ex);
        CHECK(cw.rotate_vector(ey).approx_eq(ex));
        CHECK(cw.approx_eq(ccw.invert()));

        const Vec2<double> diag{std::sqrt(0.5), -std::sqrt(0.5)};
        CHECK(Basis2<double>::between_vectors(ex, diag).rotate_vector(ex).approx_eq(diag));

        CHECK(Basis2<double>::between_vectors(ex, ex).approx_eq(Basis2<double>::one()));
        CHECK(Basis2<double>::between_vectors(ex, -ex).rotate_vector(ex).approx_eq(-ex));
    }

    TEST_CASE("Look at") {
        const Vec2<double> dir{-1.0, 1.0};
        const auto         r = Basis2<double>::look_at(dir, Vec2<double>::unit_y());
        CHECK(r.rotate_vector(Vec2<double>::unit_x()).approx_eq(dir.normalized()));
        CHECK(r.matrix().is_orthogonal());

        SUBCASE("Zero direction is singular and cannot be inverted") {
            const auto degenerate = Basis2<double>::look_at(Vec2<double>{}, Vec2<double>::unit_y());
            CHECK_THROWS_AS(static_cast<void>(degenerate.invert()), std::bad_optional_access);
        }
    }

    TEST_CASE("Coefficient array") {
        const auto r = Basis2<double>::from_angle(Rad<double>{0.4});
        const auto coeffs = r.to_array();
        CHECK(coeffs[0] == doctest::Approx(std::cos(0.4)));
        CHECK(coeffs[1] == doctest::Approx(-std::sin(0.4)));
        CHECK(coeffs[2] == doctest::Approx(std::sin(0.4)));

        const auto decoded = Basis2<double>::from_array(coeffs);
        REQUIRE(decoded.has_value());
        CHECK(*decoded == r);

        SUBCASE("Rejects coefficients that are not a rotation") {
            CHECK_FALSE(Basis2<double>::from_array({2.0, 0.0, 0.0, 2.0}).has_value());
            CHECK_FALSE(Basis2<double>::from_array({1.0, 1.0, 0.0, 1.0}).has_value());
            // Reflection
            CHECK_FALSE(Basis2<double>::from_array({1.0, 0.0, 0.0, -1.0}).has_value());
            CHECK_FALSE(Basis2<double>::from_array({0.0, 0.0, 0.0, 0.0}).has_value());
        }

        SUBCASE("Tolerance is configurable") {
            const std::array<double, 4> noisy{1.0 + 1e-4, 0.0, 0.0, 1.0};
            CHECK_FALSE(Basis2<double>::from_array(noisy).has_value());
            CHECK(Basis2<double>::from_array(noisy, 1e-3).has_value());
        }
    }

    TEST_CASE("Conversions") {
        const auto r = Basis2<double>::from_angle(Rad<double>{-0.9});
        CHECK(r.to_matrix() == r.matrix());
        CHECK(r.to_basis() == r);
    }
}

TEST_SUITE("Basis3") {
    TEST_CASE("Quarter turn about z maps x onto y") {
        const auto rot = Basis3<double>::from_axis_angle(Vec3<double>::unit_z(), Rad<double>{kPi / 2.0});
        const auto v = rot.rotate_vector(Vec3<double>::unit_x());
        CHECK(v[0] == doctest::Approx(0.0));
        CHECK(v[1] == doctest::Approx(1.0));
        CHECK(v[2] == doctest::Approx(0.0));

        const auto p = rot.rotate_point(Point3<double>{1.0, 0.0, 5.0});
        CHECK(p.approx_eq(Point3<double>{0.0, 1.0, 5.0}));
    }

    TEST_CASE("Identity and inverse") {
        const auto r = Basis3<double>::from_euler(Rad<double>{0.2}, Rad<double>{-1.1}, Rad<double>{2.5});
        CHECK(r.concat(Basis3<double>::one()) == r);
        CHECK(Basis3<double>::one().concat(r) == r);
        CHECK(r.concat(r.invert()).approx_eq(Basis3<double>::one()));
        CHECK(r.invert().concat(r).approx_eq(Basis3<double>::one()));
        CHECK(r.invert().matrix().approx_eq(r.matrix().transpose()));
    }

    TEST_CASE("Single-axis constructors agree with axis-angle") {
        const Rad<double> theta{0.83};
        CHECK(Basis3<double>::from_angle_x(theta).approx_eq(Basis3<double>::from_axis_angle(Vec3<double>::unit_x(), theta)));
        CHECK(Basis3<double>::from_angle_y(theta).approx_eq(Basis3<double>::from_axis_angle(Vec3<double>::unit_y(), theta)));
        CHECK(Basis3<double>::from_angle_z(theta).approx_eq(Basis3<double>::from_axis_angle(Vec3<double>::unit_z(), theta)));
    }

    TEST_CASE("Euler order") {
        const Rad<double> x{0.4};
        const Rad<double> y{0.9};
        const Rad<double> z{-0.3};

        const auto         r = Basis3<double>::from_euler(x, y, z);
        const Vec3<double> v{1.0, 2.0, 3.0};

        const auto expected = Basis3<double>::from_angle_z(z).rotate_vector(
            Basis3<double>::from_angle_y(y).rotate_vector(Basis3<double>::from_angle_x(x).rotate_vector(v)));
        CHECK(r.rotate_vector(v).approx_eq(expected));

        // Rotations about different axes do not commute
        const auto reversed = Basis3<double>::from_angle_x(x).concat(Basis3<double>::from_angle_y(y)).concat(Basis3<double>::from_angle_z(z));
        CHECK_FALSE(r.approx_eq(reversed));

        const auto y_z_swapped = Basis3<double>::from_angle_y(y).concat(Basis3<double>::from_angle_z(z)).concat(Basis3<double>::from_angle_x(x));
        CHECK_FALSE(r.approx_eq(y_z_swapped));
    }

    TEST_CASE("Between vectors") {
        const Vec3<double> a = Vec3<double>{1.0, 2.0, 2.0} / 3.0;
        const Vec3<double> b = Vec3<double>{0.0, -0.6, 0.8};

        const auto r = Basis3<double>::between_vectors(a, b);
        CHECK(r.rotate_vector(a).approx_eq(b));
        CHECK(r.matrix().is_orthogonal());
        CHECK(r.matrix().determinant() == doctest::Approx(1.0));

        const auto flip = Basis3<double>::between_vectors(a, -a);
        CHECK(flip.rotate_vector(a).approx_eq(-a));
    }

    TEST_CASE("Look at") {
        const Vec3<double> dir{0.0, 0.0, -1.0};
        const auto         r = Basis3<double>::look_at(dir, Vec3<double>::unit_y());
        CHECK(r.rotate_vector(Vec3<double>::unit_z()).approx_eq(dir));
        CHECK(r.rotate_vector(Vec3<double>::unit_y()).approx_eq(Vec3<double>::unit_y()));
        CHECK(r.matrix().determinant() == doctest::Approx(1.0));

        SUBCASE("Direction parallel to up is singular and cannot be inverted") {
            const auto degenerate = Basis3<double>::look_at(Vec3<double>::unit_y(), Vec3<double>::unit_y());
            CHECK(degenerate.matrix().determinant() == 0.0);
            CHECK_THROWS_AS(static_cast<void>(degenerate.invert()), std::bad_optional_access);
        }
    }

    TEST_CASE("Quaternion round trip") {
        const auto r = Basis3<double>::from_axis_angle(Vec3<double>{2.0, -1.0, 2.0} / 3.0, Rad<double>{2.2});
        const auto q = r.to_quaternion();
        CHECK(q.norm() == doctest::Approx(1.0));
        CHECK(Basis3<double>::from_quaternion(q).approx_eq(r));
        CHECK(q.to_basis().approx_eq(r));

        // Both signs of a quaternion describe the same rotation
        CHECK(Basis3<double>::from_quaternion(-q).approx_eq(r));
    }

    TEST_CASE("Coefficient array") {
        const auto r = Basis3<float>::from_angle_z(Rad<float>{0.5f});
        const auto coeffs = r.to_array();
        CHECK(coeffs[8] == 1.0f);
        CHECK(coeffs[1] == doctest::Approx(-std::sin(0.5)).epsilon(1e-6));

        const auto decoded = Basis3<float>::from_array(coeffs);
        REQUIRE(decoded.has_value());
        CHECK(*decoded == r);

        CHECK_FALSE(Basis3<float>::from_array({1, 0, 0, 0, 1, 0, 0, 0, -1}).has_value());
        CHECK_FALSE(Basis3<float>::from_array({1, 0, 0, 0, 1, 0, 0, 0, 0}).has_value());
        CHECK_FALSE(Basis3<float>::from_array({1, 1, 0, 0, 1, 0, 0, 0, 1}).has_value());
    }

    TEST_CASE("Conversions") {
        const auto r = Basis3<double>::from_angle_y(Rad<double>{1.0});
        CHECK(r.to_matrix() == r.matrix());
        CHECK(r.to_basis() == r);
    }
}
