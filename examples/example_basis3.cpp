#include <numbers>

#include "basis.hpp"
#include "fmt/core.h"
#include "format.hpp"
#include "quaternion.hpp"

int main() {
    using namespace wetmelon::geometry;

    constexpr double pi = std::numbers::pi;

    fmt::print("=== Spatial Rotations ===\n\n");

    const auto yaw = Basis3d::from_axis_angle(Vec3<double>::unit_z(), Radd{pi / 2.0});
    fmt::print("90 deg about z:\n{:.4f}\n", yaw);
    fmt::print("x axis -> {:.4f}\n\n", yaw.rotate_vector(Vec3<double>::unit_x()));

    // Euler angles: x first, then y, then z
    fmt::print("=== Euler Angles ===\n");
    const Radd pitch{0.1};
    const Radd yaw_angle{-0.4};
    const Radd roll{0.7};
    const auto euler = Basis3d::from_euler(pitch, yaw_angle, roll);
    const auto chained = Basis3d::from_angle_z(roll).concat(Basis3d::from_angle_y(yaw_angle)).concat(Basis3d::from_angle_x(pitch));
    fmt::print("from_euler({}, {}, {}):\n{:.4f}\n", pitch, yaw_angle, roll, euler);
    fmt::print("Equal to Rz * Ry * Rx: {}\n\n", euler.approx_eq(chained));

    // Quaternion round trip
    fmt::print("=== Quaternion Conversion ===\n");
    const auto q = euler.to_quaternion();
    fmt::print("{:.4f}\n", q);
    fmt::print("Back to matrix matches: {}\n\n", Basis3d::from_quaternion(q).approx_eq(euler));

    // Camera-style orientation
    fmt::print("=== Look At ===\n");
    const Vec3<double> target_dir{1.0, 1.0, 0.0};
    const auto         look = Basis3d::look_at(target_dir, Vec3<double>::unit_z());
    fmt::print("Forward (+z) -> {:.4f}\n", look.rotate_vector(Vec3<double>::unit_z()));
    fmt::print("Up (+y) -> {:.4f}\n\n", look.rotate_vector(Vec3<double>::unit_y()));

    // Shortest arc, both representations
    fmt::print("=== Between Vectors ===\n");
    const Vec3<double> a = Vec3<double>::unit_x();
    const Vec3<double> b = Vec3<double>{0.0, 1.0, 1.0}.normalized();
    const auto         arc = Quatd::between_vectors(a, b);
    fmt::print("Quaternion: {:.4f}\n", arc);
    fmt::print("Basis3 maps a onto {:.4f}\n", Basis3d::between_vectors(a, b).rotate_vector(a));

    // Interpolate half way
    const auto half = Quatd::slerp(Quatd::one(), arc, 0.5);
    fmt::print("Half way: {:.4f}\n", half.rotate_vector(a));

    return 0;
}
