#include <cmath>
#include <numbers>

#include <doctest/doctest.h>

#include "angle.hpp"
#include "scalar.hpp"

using namespace wetmelon::geometry;

constexpr double kPi = std::numbers::pi;

TEST_SUITE("Scalar helpers") {
    TEST_CASE("constexpr sqrt") {
        static_assert(wet::sqrt(4.0) > 1.999999 && wet::sqrt(4.0) < 2.000001);
        static_assert(wet::sqrt(0.0) == 0.0);
        static_assert(wet::sqrt(-1.0) == 0.0);

        CHECK(wet::sqrt(2.0) == doctest::Approx(std::sqrt(2.0)).epsilon(1e-12));
        CHECK(wet::sqrt(1e-8f) == doctest::Approx(1e-4).epsilon(1e-5));
        CHECK(wet::sqrt(1e12) == doctest::Approx(1e6).epsilon(1e-12));
    }

    TEST_CASE("abs and clamp") {
        static_assert(wet::abs(-3.0) == 3.0);
        static_assert(wet::clamp(2.0, -1.0, 1.0) == 1.0);
        static_assert(wet::clamp(-2.0, -1.0, 1.0) == -1.0);
        static_assert(wet::clamp(0.5, -1.0, 1.0) == 0.5);
    }

    TEST_CASE("Approximate equality") {
        CHECK(approx_eq(1.0, 1.0 + 1e-7));
        CHECK_FALSE(approx_eq(1.0, 1.001));
        CHECK(approx_eq(1.0f, 1.001f, 1e-2f));
        static_assert(approx_epsilon<float>() == 1e-5f);
    }
}

TEST_SUITE("Angles") {
    TEST_CASE("Degree and radian conversion") {
        Rad<double> r = Deg<double>{180.0};
        CHECK(r.value == doctest::Approx(kPi));

        Deg<double> d = Rad<double>{kPi / 2.0};
        CHECK(d.value == doctest::Approx(90.0));

        CHECK(Rad<double>::full_turn().value == doctest::Approx(2.0 * kPi));
        CHECK(Rad<double>::turn_div_2().value == doctest::Approx(kPi));
        CHECK(Rad<double>::turn_div_4().value == doctest::Approx(kPi / 2.0));
        CHECK(Rad<double>::zero().value == 0.0);
    }

    TEST_CASE("Trigonometry") {
        const auto a = Rad<double>{kPi / 6.0};
        CHECK(a.sin() == doctest::Approx(0.5));
        CHECK(a.cos() == doctest::Approx(std::sqrt(3.0) / 2.0));
        CHECK(Rad<double>{kPi / 4.0}.tan() == doctest::Approx(1.0));

        const auto [s, c] = a.sin_cos();
        CHECK(s == doctest::Approx(0.5));
        CHECK(c == doctest::Approx(std::sqrt(3.0) / 2.0));

        CHECK(Deg<double>{90.0}.sin() == doctest::Approx(1.0));
        CHECK(Deg<double>{180.0}.cos() == doctest::Approx(-1.0));
    }

    TEST_CASE("Inverse trigonometry") {
        CHECK(Rad<double>::acos(0.0).value == doctest::Approx(kPi / 2.0));
        CHECK(Rad<double>::asin(1.0).value == doctest::Approx(kPi / 2.0));
        CHECK(Rad<double>::atan(1.0).value == doctest::Approx(kPi / 4.0));
        CHECK(Rad<double>::atan2(-1.0, 0.0).value == doctest::Approx(-kPi / 2.0));

        SUBCASE("Arguments slightly outside [-1, 1] are clamped") {
            CHECK(Rad<double>::acos(1.0 + 1e-12).value == 0.0);
            CHECK(Rad<double>::acos(-1.0 - 1e-12).value == doctest::Approx(kPi));
            CHECK_FALSE(std::isnan(Rad<double>::asin(1.0000001).value));
        }
    }

    TEST_CASE("Normalization") {
        CHECK(Rad<double>{-kPi / 2.0}.normalized().value == doctest::Approx(3.0 * kPi / 2.0));
        CHECK(Rad<double>{5.0 * kPi}.normalized().value == doctest::Approx(kPi));
        CHECK(Rad<double>{2.0 * kPi}.normalized().value == doctest::Approx(0.0));
        CHECK(Deg<double>{-90.0}.normalized().value == doctest::Approx(270.0));
        CHECK(Deg<double>{720.0 + 45.0}.normalized().value == doctest::Approx(45.0));
    }

    TEST_CASE("Arithmetic and comparison") {
        auto a = Rad<float>{1.0f};
        auto b = Rad<float>{0.5f};

        CHECK((a + b).value == 1.5f);
        CHECK((a - b).value == 0.5f);
        CHECK((-a).value == -1.0f);
        CHECK((a * 2.0f).value == 2.0f);
        CHECK((2.0f * a).value == 2.0f);
        CHECK((a / 4.0f).value == 0.25f);
        CHECK(a / b == 2.0f);

        a += b;
        CHECK(a.value == 1.5f);
        a -= b;
        a *= 3.0f;
        CHECK(a.value == 3.0f);
        a /= 3.0f;
        CHECK(a.value == 1.0f);

        CHECK(b < a);
        CHECK(a == Rad<float>{1.0f});
        CHECK(a.approx_eq(Rad<float>{1.000001f}));

        CHECK((Deg<float>{30.0f} + Deg<float>{60.0f}).value == 90.0f);
        CHECK((2.0f * deg(45.0f)).value == 90.0f);
        CHECK(rad(0.25) == Rad<double>{0.25});
    }
}
