#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <type_traits>

#include "angle.hpp"
#include "scalar.hpp"

namespace wetmelon::geometry {

/**
 * @ingroup linear_algebra
 * @brief Fixed-size, stack-allocated matrix
 *
 * Row-major storage, column-vector convention: `A * v` transforms `v`, and
 * `A * B` applied to a vector applies `B` first.
 *
 * @tparam Rows Number of rows
 * @tparam Cols Number of columns
 * @tparam T Element type (floating-point)
 */
template<size_t Rows, size_t Cols, typename T = double>
struct Matrix {
protected:
    std::array<std::array<T, Cols>, Rows> data_{};

    template<size_t, size_t, typename>
    friend struct Matrix;

public:
    static_assert(std::is_floating_point_v<T>, "Matrix element type must be floating-point");

    using value_type = T;

    /**
     * @brief Default constructor, initializes all elements to zero
     */
    constexpr Matrix() = default;
    constexpr Matrix(const Matrix&) = default;
    constexpr Matrix& operator=(const Matrix&) = default;
    constexpr Matrix(Matrix&&) = default;
    constexpr Matrix& operator=(Matrix&&) = default;
    constexpr ~Matrix() = default;

    /**
     * @brief Type conversion constructor from another matrix with different element type
     */
    template<typename U>
    constexpr Matrix(const Matrix<Rows, Cols, U>& other) : Matrix() {
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                data_[r][c] = static_cast<T>(other.data_[r][c]);
            }
        }
    }

    /**
     * @brief Constructor from nested initializer list (row by row)
     */
    constexpr Matrix(std::initializer_list<std::initializer_list<T>> init) : Matrix() {
        size_t r = 0;
        for (const auto& row : init) {
            size_t c = 0;
            for (const auto& val : row) {
                if (r < Rows && c < Cols) {
                    data_[r][c] = val;
                }
                ++c;
            }
            ++r;
        }
    }

    /**
     * @brief Constructor from std::array, enables class template argument deduction
     */
    constexpr Matrix(const std::array<std::array<T, Cols>, Rows>& arr) : data_(arr) {}

    [[nodiscard]] static constexpr Matrix zeros() { return Matrix{}; }

    [[nodiscard]] static constexpr Matrix identity()
        requires(Rows == Cols)
    {
        Matrix result{};
        for (size_t r = 0; r < Rows; ++r) {
            result.data_[r][r] = T{1};
        }
        return result;
    }

    /**
     * @brief Build a matrix from row-major coefficients
     */
    [[nodiscard]] static constexpr Matrix from_array(const std::array<T, Rows * Cols>& coeffs) {
        Matrix result;
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                result.data_[r][c] = coeffs[r * Cols + c];
            }
        }
        return result;
    }

    /**
     * @brief Row-major coefficients
     */
    [[nodiscard]] constexpr std::array<T, Rows * Cols> to_array() const {
        std::array<T, Rows * Cols> coeffs{};
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                coeffs[r * Cols + c] = data_[r][c];
            }
        }
        return coeffs;
    }

    [[nodiscard]] static constexpr size_t rows() { return Rows; }
    [[nodiscard]] static constexpr size_t cols() { return Cols; }

    /**
     * @brief Get const pointer to data in row-major order
     */
    [[nodiscard]] constexpr const T* data() const { return &data_[0][0]; }
    [[nodiscard]] constexpr T*       data() { return &data_[0][0]; }

    [[nodiscard]] constexpr const T* begin() const { return data(); }
    [[nodiscard]] constexpr const T* end() const { return data() + (Rows * Cols); }

    constexpr T&       operator()(size_t row, size_t col) { return data_[row][col]; }
    constexpr const T& operator()(size_t row, size_t col) const { return data_[row][col]; }

    constexpr Matrix& operator+=(const Matrix& other) {
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                data_[r][c] += other.data_[r][c];
            }
        }
        return *this;
    }

    constexpr Matrix& operator-=(const Matrix& other) {
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                data_[r][c] -= other.data_[r][c];
            }
        }
        return *this;
    }

    constexpr Matrix& operator*=(T scalar) {
        for (auto& row : data_) {
            for (auto& val : row) {
                val *= scalar;
            }
        }
        return *this;
    }

    constexpr Matrix& operator/=(T scalar) {
        for (auto& row : data_) {
            for (auto& val : row) {
                val /= scalar;
            }
        }
        return *this;
    }

    /**
     * @brief Exact element-wise equality
     */
    [[nodiscard]] constexpr bool operator==(const Matrix& other) const { return data_ == other.data_; }

    [[nodiscard]] constexpr Matrix operator-() const {
        Matrix result;
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                result.data_[r][c] = -data_[r][c];
            }
        }
        return result;
    }

    [[nodiscard]] constexpr Matrix operator+(const Matrix& other) const {
        Matrix result = *this;
        result += other;
        return result;
    }

    [[nodiscard]] constexpr Matrix operator-(const Matrix& other) const {
        Matrix result = *this;
        result -= other;
        return result;
    }

    /**
     * @brief Matrix multiplication operator
     * @tparam P Number of columns in right-hand matrix
     * @param rhs Right-hand matrix (Cols × P)
     * @return Result matrix (Rows × P)
     */
    template<size_t P>
    [[nodiscard]] constexpr Matrix<Rows, P, T> operator*(const Matrix<Cols, P, T>& rhs) const {
        Matrix<Rows, P, T> result;
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < P; ++c) {
                T accum = T{0};
                for (size_t k = 0; k < Cols; ++k) {
                    accum += data_[r][k] * rhs.data_[k][c];
                }
                result.data_[r][c] = accum;
            }
        }
        return result;
    }

    [[nodiscard]] constexpr Matrix<Cols, Rows, T> transpose() const {
        Matrix<Cols, Rows, T> result;
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                result.data_[c][r] = data_[r][c];
            }
        }
        return result;
    }

    [[nodiscard]] constexpr T trace() const
        requires(Rows == Cols)
    {
        T accum = T{0};
        for (size_t i = 0; i < Rows; ++i) {
            accum += data_[i][i];
        }
        return accum;
    }

    /**
     * @brief Frobenius norm of the matrix
     */
    [[nodiscard]] constexpr T norm() const {
        T sum_sq = T{0};
        for (const auto& row : data_) {
            for (const auto& val : row) {
                sum_sq += val * val;
            }
        }
        return wet::sqrt(sum_sq);
    }

    [[nodiscard]] constexpr T determinant() const
        requires(Rows == Cols && (Rows == 2 || Rows == 3))
    {
        if constexpr (Rows == 2) {
            return (data_[0][0] * data_[1][1]) - (data_[0][1] * data_[1][0]);
        } else {
            const T a = data_[0][0], b = data_[0][1], c = data_[0][2];
            const T d = data_[1][0], e = data_[1][1], f = data_[1][2];
            const T g = data_[2][0], h = data_[2][1], i = data_[2][2];
            return a * (e * i - f * h) - b * (d * i - f * g) + c * (d * h - e * g);
        }
    }

    /**
     * @brief Matrix inverse via the adjugate
     *
     * @return Inverse matrix if invertible, nullopt if singular
     */
    [[nodiscard]] constexpr std::optional<Matrix> inverse() const
        requires(Rows == Cols && (Rows == 2 || Rows == 3))
    {
        if constexpr (Rows == 2) {
            const T det = determinant();
            if (det == T{0}) {
                return std::nullopt;
            }

            const T inv_det = T{1} / det;
            Matrix  result;
            result.data_[0][0] = data_[1][1] * inv_det;
            result.data_[0][1] = -data_[0][1] * inv_det;
            result.data_[1][0] = -data_[1][0] * inv_det;
            result.data_[1][1] = data_[0][0] * inv_det;
            return result;
        } else {
            const T a = data_[0][0], b = data_[0][1], c = data_[0][2];
            const T d = data_[1][0], e = data_[1][1], f = data_[1][2];
            const T g = data_[2][0], h = data_[2][1], i = data_[2][2];

            // Cofactors for first row (used for determinant)
            const T c00 = e * i - f * h;
            const T c01 = -(d * i - f * g);
            const T c02 = d * h - e * g;

            const T det = a * c00 + b * c01 + c * c02;
            if (wet::abs(det) < T{1e-30}) {
                return std::nullopt;
            }

            const T inv_det = T{1} / det;
            Matrix  result;

            // Adjugate matrix (transpose of cofactor matrix)
            result.data_[0][0] = c00 * inv_det;
            result.data_[0][1] = (c * h - b * i) * inv_det;
            result.data_[0][2] = (b * f - c * e) * inv_det;
            result.data_[1][0] = c01 * inv_det;
            result.data_[1][1] = (a * i - c * g) * inv_det;
            result.data_[1][2] = (c * d - a * f) * inv_det;
            result.data_[2][0] = c02 * inv_det;
            result.data_[2][1] = (b * g - a * h) * inv_det;
            result.data_[2][2] = (a * e - b * d) * inv_det;
            return result;
        }
    }

    /**
     * @brief Element-wise approximate equality
     */
    [[nodiscard]] constexpr bool approx_eq(const Matrix& other, T eps = approx_epsilon<T>()) const {
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                if (!geometry::approx_eq(data_[r][c], other.data_[r][c], eps)) {
                    return false;
                }
            }
        }
        return true;
    }

    /**
     * @brief True if the columns are orthonormal within eps (Mᵀ·M ≈ I)
     */
    [[nodiscard]] constexpr bool is_orthogonal(T eps = approx_epsilon<T>()) const
        requires(Rows == Cols)
    {
        return (transpose() * (*this)).approx_eq(identity(), eps);
    }

    [[nodiscard]] constexpr Matrix<1, Cols, T> row(size_t r_idx) const {
        Matrix<1, Cols, T> result;
        result.data_[0] = data_[r_idx];
        return result;
    }

    [[nodiscard]] constexpr Matrix<Rows, 1, T> col(size_t c_idx) const {
        Matrix<Rows, 1, T> result;
        for (size_t r = 0; r < Rows; ++r) {
            result.data_[r][0] = data_[r][c_idx];
        }
        return result;
    }
};

template<typename T>
using Mat2 = Matrix<2, 2, T>;

template<typename T>
using Mat3 = Matrix<3, 3, T>;

// Scalar multiplication (scalar * matrix)
template<typename T, size_t N, size_t M, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr Matrix<N, M, T> operator*(Scalar scalar, const Matrix<N, M, T>& mat) {
    Matrix<N, M, T> result = mat;
    result *= static_cast<T>(scalar);
    return result;
}

// Scalar multiplication (matrix * scalar)
template<typename T, size_t N, size_t M, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr Matrix<N, M, T> operator*(const Matrix<N, M, T>& mat, Scalar scalar) {
    return scalar * mat;
}

template<typename T, size_t N, size_t M, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr Matrix<N, M, T> operator/(const Matrix<N, M, T>& mat, Scalar scalar) {
    Matrix<N, M, T> result = mat;
    result /= static_cast<T>(scalar);
    return result;
}

/**
 * @brief Column vector specialization of Matrix<N, 1, T>
 * @ingroup linear_algebra
 * @tparam N Vector dimension
 * @tparam T Element type
 */
template<size_t N, typename T = double>
struct ColVec : public Matrix<N, 1, T> {
    constexpr ColVec() = default;
    constexpr ColVec(const ColVec&) = default;
    constexpr ColVec& operator=(const ColVec&) = default;
    constexpr ColVec(ColVec&&) = default;
    constexpr ColVec& operator=(ColVec&&) = default;
    constexpr ~ColVec() = default;

    constexpr ColVec(std::initializer_list<T> values) : Matrix<N, 1, T>() {
        size_t i = 0;
        for (const auto& val : values) {
            if (i < N) {
                this->data_[i][0] = val;
            }
            ++i;
        }
    }

    // Constructor from std::array<T, N> - enables CTAD
    constexpr ColVec(const std::array<T, N>& arr) : Matrix<N, 1, T>() {
        for (size_t i = 0; i < N; ++i) {
            this->data_[i][0] = arr[i];
        }
    }

    template<typename U>
    constexpr ColVec(const Matrix<N, 1, U>& other) : Matrix<N, 1, T>(other) {}

    [[nodiscard]] static constexpr ColVec unit_x()
        requires(N >= 1)
    { return unit(0); }

    [[nodiscard]] static constexpr ColVec unit_y()
        requires(N >= 2)
    { return unit(1); }

    [[nodiscard]] static constexpr ColVec unit_z()
        requires(N >= 3)
    { return unit(2); }

    constexpr const T& operator[](size_t idx) const { return this->data_[idx][0]; }
    constexpr T&       operator[](size_t idx) { return this->data_[idx][0]; }

    /**
     * @brief Dot product (inner product)
     */
    [[nodiscard]] friend constexpr T dot(const ColVec<N, T>& vec1, const ColVec<N, T>& vec2) {
        T result = 0;
        for (std::size_t i = 0; i < N; ++i) {
            result += vec1.data_[i][0] * vec2.data_[i][0];
        }
        return result;
    }

    /**
     * @brief Cross product for 3D vectors
     */
    template<size_t D = N>
    [[nodiscard]] constexpr ColVec<3, T> cross(const ColVec<3, T>& other) const
        requires(D == 3)
    {
        return ColVec<3, T>{
            this->data_[1][0] * other.data_[2][0] - this->data_[2][0] * other.data_[1][0],
            this->data_[2][0] * other.data_[0][0] - this->data_[0][0] * other.data_[2][0],
            this->data_[0][0] * other.data_[1][0] - this->data_[1][0] * other.data_[0][0]
        };
    }

    /**
     * @brief 2D cross product (perp-dot): z component of the 3D cross product
     *
     * Positive when `other` lies counter-clockwise of `*this`.
     */
    template<size_t D = N>
    [[nodiscard]] constexpr T cross(const ColVec<2, T>& other) const
        requires(D == 2)
    {
        return this->data_[0][0] * other.data_[1][0] - this->data_[1][0] * other.data_[0][0];
    }

    [[nodiscard]] constexpr T norm() const { return wet::sqrt(dot(*this, *this)); }

    /**
     * @brief Normalized vector (unit length); the zero vector is returned unchanged
     */
    [[nodiscard]] constexpr ColVec normalized() const {
        T n = norm();
        if (n == 0) {
            return *this;
        }
        return *this * (T(1) / n);
    }

private:
    [[nodiscard]] static constexpr ColVec unit(size_t axis) {
        ColVec v;
        v.data_[axis][0] = T{1};
        return v;
    }
};

template<typename T, size_t N>
[[nodiscard]] constexpr ColVec<N, T> operator+(const ColVec<N, T>& lhs, const ColVec<N, T>& rhs) {
    return ColVec<N, T>(static_cast<const Matrix<N, 1, T>&>(lhs) + static_cast<const Matrix<N, 1, T>&>(rhs));
}

template<typename T, size_t N>
[[nodiscard]] constexpr ColVec<N, T> operator-(const ColVec<N, T>& lhs, const ColVec<N, T>& rhs) {
    return ColVec<N, T>(static_cast<const Matrix<N, 1, T>&>(lhs) - static_cast<const Matrix<N, 1, T>&>(rhs));
}

template<typename T, size_t N, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr ColVec<N, T> operator*(const ColVec<N, T>& vec, Scalar scalar) {
    return ColVec<N, T>(static_cast<const Matrix<N, 1, T>&>(vec) * scalar);
}

template<typename T, size_t N, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr ColVec<N, T> operator*(Scalar scalar, const ColVec<N, T>& vec) {
    return vec * scalar;
}

template<typename T, size_t N, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr ColVec<N, T> operator/(const ColVec<N, T>& vec, Scalar scalar) {
    return ColVec<N, T>(static_cast<const Matrix<N, 1, T>&>(vec) / scalar);
}

template<typename T, size_t N>
[[nodiscard]] constexpr ColVec<N, T> operator-(const ColVec<N, T>& vec) {
    return ColVec<N, T>(-static_cast<const Matrix<N, 1, T>&>(vec));
}

// Matrix-vector product keeping the ColVec type
template<typename T, size_t N>
[[nodiscard]] constexpr ColVec<N, T> operator*(const Matrix<N, N, T>& mat, const ColVec<N, T>& vec) {
    return ColVec<N, T>(mat * static_cast<const Matrix<N, 1, T>&>(vec));
}

// Deduce ColVec<N, T> from variadic constructor arguments, e.g. ColVec vec{1.0f, 2.0f, 3.0f};
// Integer literals deduce to double
template<typename T, typename... Args>
    requires(std::is_integral_v<T> && (std::is_integral_v<Args> && ...))
ColVec(T, Args...) -> ColVec<1 + sizeof...(Args), double>;

template<typename T, typename... Args>
    requires(!std::is_integral_v<T> || !(std::is_integral_v<Args> && ...))
ColVec(T, Args...) -> ColVec<1 + sizeof...(Args), T>;

template<typename T, size_t N>
ColVec(const std::array<T, N>&) -> ColVec<N, T>;

template<typename T>
using Vec2 = ColVec<2, T>;

template<typename T>
using Vec3 = ColVec<3, T>;

namespace mat {

/**
 * @brief Matrix whose columns are the given vectors
 */
template<typename T, size_t N, typename... Cols>
[[nodiscard]] constexpr Matrix<N, N, T> from_cols(const ColVec<N, T>& first, const Cols&... rest) {
    static_assert(sizeof...(Cols) + 1 == N, "from_cols needs one column per dimension");
    const std::array<ColVec<N, T>, N> cols{first, rest...};

    Matrix<N, N, T> result;
    for (size_t c = 0; c < N; ++c) {
        for (size_t r = 0; r < N; ++r) {
            result(r, c) = cols[c][r];
        }
    }
    return result;
}

/**
 * @brief Counter-clockwise 2D rotation by theta
 */
template<BaseFloat T>
[[nodiscard]] Mat2<T> from_angle(Rad<T> theta) {
    const auto [s, c] = theta.sin_cos();
    return Mat2<T>{
        {c, -s},
        {s, c},
    };
}

/**
 * @brief 2D rotation taking +x onto `dir`
 *
 * A 2D rotation has a single degree of freedom, fully fixed by `dir`; `up` is
 * accepted for symmetry with the 3D form and does not affect the result.
 */
template<BaseFloat T>
[[nodiscard]] constexpr Mat2<T> look_at(const Vec2<T>& dir, [[maybe_unused]] const Vec2<T>& up) {
    const Vec2<T> d = dir.normalized();
    return from_cols(d, Vec2<T>{-d[1], d[0]});
}

/**
 * @brief 3D rotation taking +z onto `dir` and +y into the plane of `dir` and `up`
 *
 * Columns are (side, up', dir) with side = normalize(up × dir) and
 * up' = dir × side. `dir` parallel to `up` gives a zero side column.
 */
template<BaseFloat T>
[[nodiscard]] constexpr Mat3<T> look_at(const Vec3<T>& dir, const Vec3<T>& up) {
    const Vec3<T> d = dir.normalized();
    const Vec3<T> side = up.cross(d).normalized();
    const Vec3<T> up_ortho = d.cross(side).normalized();
    return from_cols(side, up_ortho, d);
}

/**
 * @brief Rotation by `angle` about a unit `axis` (Rodrigues' formula)
 *
 * The axis is used as given; it is not renormalized.
 */
template<BaseFloat T>
[[nodiscard]] Mat3<T> from_axis_angle(const Vec3<T>& axis, Rad<T> angle) {
    const auto [s, c] = angle.sin_cos();
    const T t = T{1} - c;
    const T ux = axis[0];
    const T uy = axis[1];
    const T uz = axis[2];

    return Mat3<T>{
        {t * ux * ux + c,      t * ux * uy - s * uz, t * ux * uz + s * uy},
        {t * ux * uy + s * uz, t * uy * uy + c,      t * uy * uz - s * ux},
        {t * ux * uz - s * uy, t * uy * uz + s * ux, t * uz * uz + c     },
    };
}

template<BaseFloat T>
[[nodiscard]] Mat3<T> from_angle_x(Rad<T> theta) {
    const auto [s, c] = theta.sin_cos();
    return Mat3<T>{
        {T{1}, T{0}, T{0}},
        {T{0}, c,    -s  },
        {T{0}, s,    c   },
    };
}

template<BaseFloat T>
[[nodiscard]] Mat3<T> from_angle_y(Rad<T> theta) {
    const auto [s, c] = theta.sin_cos();
    return Mat3<T>{
        {c,    T{0}, s   },
        {T{0}, T{1}, T{0}},
        {-s,   T{0}, c   },
    };
}

template<BaseFloat T>
[[nodiscard]] Mat3<T> from_angle_z(Rad<T> theta) {
    const auto [s, c] = theta.sin_cos();
    return Mat3<T>{
        {c,    -s,   T{0}},
        {s,    c,    T{0}},
        {T{0}, T{0}, T{1}},
    };
}

/**
 * @brief Rotation about x, then y, then z
 *
 * Equal to Rz(z) * Ry(y) * Rx(x): applied to a vector, the x rotation acts
 * first (pitch), then y (yaw), then z (roll).
 */
template<BaseFloat T>
[[nodiscard]] Mat3<T> from_euler(Rad<T> x, Rad<T> y, Rad<T> z) {
    const auto [sx, cx] = x.sin_cos();
    const auto [sy, cy] = y.sin_cos();
    const auto [sz, cz] = z.sin_cos();

    return Mat3<T>{
        {cy * cz, sx * sy * cz - cx * sz, cx * sy * cz + sx * sz},
        {cy * sz, sx * sy * sz + cx * cz, cx * sy * sz - sx * cz},
        {-sy,     sx * cy,                cx * cy               },
    };
}

} // namespace mat

} // namespace wetmelon::geometry
