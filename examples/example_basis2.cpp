#include <numbers>

#include "basis.hpp"
#include "fmt/core.h"
#include "format.hpp"

int main() {
    using namespace wetmelon::geometry;

    fmt::print("=== Planar Rotations ===\n\n");

    // Quarter turn counter-clockwise
    const auto quarter = Basis2d::from_angle(Radd{std::numbers::pi / 2.0});
    fmt::print("Quarter turn:\n{:.4f}\n", quarter);
    fmt::print("x axis -> {:.4f}\n", quarter.rotate_vector(Vec2<double>::unit_x()));
    fmt::print("(2, 1) -> {:.4f}\n\n", quarter.rotate_point(Point2<double>{2.0, 1.0}));

    // Composition
    fmt::print("=== Composition ===\n");
    const auto eighth = Basis2d::from_angle(Degd{45.0});
    const auto two_eighths = eighth.concat(eighth);
    fmt::print("45 deg twice:\n{:.4f}\n", two_eighths);
    fmt::print("Matches the quarter turn: {}\n\n", two_eighths.approx_eq(quarter));

    // Inversion
    fmt::print("=== Inversion ===\n");
    const auto undo = quarter.invert();
    fmt::print("Inverse:\n{:.4f}\n", undo);
    fmt::print("r * r^-1 is identity: {}\n\n", quarter.concat(undo).approx_eq(Basis2d::one()));

    // Aligning vectors
    fmt::print("=== Between Vectors ===\n");
    const Vec2<double> from{1.0, 0.0};
    const Vec2<double> to = Vec2<double>{1.0, -1.0}.normalized();
    const auto         align = Basis2d::between_vectors(from, to);
    fmt::print("{:.4f} -> {:.4f} via\n{:.4f}\n", from, align.rotate_vector(from), align);

    // Serialization
    fmt::print("\n=== Coefficients ===\n");
    const auto coeffs = align.to_array();
    fmt::print("Row-major: [{:.4f}, {:.4f}, {:.4f}, {:.4f}]\n", coeffs[0], coeffs[1], coeffs[2], coeffs[3]);
    if (const auto decoded = Basis2d::from_array(coeffs)) {
        fmt::print("Decoded back: {}\n", decoded->approx_eq(align));
    }
    fmt::print("Scaled matrix accepted: {}\n", Basis2d::from_array({2.0, 0.0, 0.0, 2.0}).has_value());

    return 0;
}
