#pragma once

#include <array>
#include <cstddef>
#include <optional>

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "basis.hpp"
#include "matrix.hpp"
#include "quaternion.hpp"

// ============================================================================
// Conversions between the fixed-size geometry types and Eigen
// ============================================================================
namespace wetmelon::geometry {

template<size_t R, size_t C, typename T>
[[nodiscard]] Eigen::Matrix<T, static_cast<int>(R), static_cast<int>(C)> to_eigen(const Matrix<R, C, T>& m) {
    Eigen::Matrix<T, static_cast<int>(R), static_cast<int>(C)> result;
    for (size_t r = 0; r < R; ++r) {
        for (size_t c = 0; c < C; ++c) {
            result(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = m(r, c);
        }
    }
    return result;
}

template<typename T, int R, int C, int Options, int MaxR, int MaxC>
[[nodiscard]] Matrix<static_cast<size_t>(R), static_cast<size_t>(C), T> from_eigen(const Eigen::Matrix<T, R, C, Options, MaxR, MaxC>& m) {
    static_assert(R > 0 && C > 0, "from_eigen needs fixed-size Eigen matrices");

    Matrix<static_cast<size_t>(R), static_cast<size_t>(C), T> result;
    for (int r = 0; r < R; ++r) {
        for (int c = 0; c < C; ++c) {
            result(static_cast<size_t>(r), static_cast<size_t>(c)) = m(r, c);
        }
    }
    return result;
}

// Vectors keep their ColVec type on the way back
template<typename T, int N, int Options, int MaxR, int MaxC>
[[nodiscard]] ColVec<static_cast<size_t>(N), T> vec_from_eigen(const Eigen::Matrix<T, N, 1, Options, MaxR, MaxC>& v) {
    return ColVec<static_cast<size_t>(N), T>(from_eigen(v));
}

template<BaseFloat T>
[[nodiscard]] Eigen::Quaternion<T> to_eigen(const Quaternion<T>& q) {
    return Eigen::Quaternion<T>(q.w(), q.x(), q.y(), q.z());
}

template<BaseFloat T>
[[nodiscard]] Quaternion<T> from_eigen(const Eigen::Quaternion<T>& q) {
    return Quaternion<T>{q.w(), q.x(), q.y(), q.z()};
}

template<BaseFloat S>
[[nodiscard]] Eigen::Matrix<S, 2, 2> to_eigen(const Basis2<S>& b) {
    return to_eigen(b.matrix());
}

template<BaseFloat S>
[[nodiscard]] Eigen::Matrix<S, 3, 3> to_eigen(const Basis3<S>& b) {
    return to_eigen(b.matrix());
}

/**
 * @brief Basis3 from an Eigen rotation matrix
 *
 * @return nullopt unless m is a proper rotation within eps
 */
template<BaseFloat S>
[[nodiscard]] std::optional<Basis3<S>> basis_from_eigen(const Eigen::Matrix<S, 3, 3>& m, S eps = approx_epsilon<S>()) {
    return Basis3<S>::from_array(from_eigen(m).to_array(), eps);
}

} // namespace wetmelon::geometry
