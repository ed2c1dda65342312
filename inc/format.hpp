#pragma once

#include <cstddef>

#include "angle.hpp"
#include "basis.hpp"
#include "matrix.hpp"
#include "point.hpp"
#include "quaternion.hpp"

// ============================================================================
// fmt::formatter specializations
//
// Element format specs pass through to every coefficient, e.g.
// fmt::format("{:.3f}", basis) -> "Basis3 [[1.000, 0.000, ...], ...]"
#include "fmt/core.h"
#include "fmt/format.h"

namespace wetmelon::geometry::detail {

template<typename T, typename Elem, typename OutputIt>
OutputIt format_sequence(const fmt::formatter<T>& elem_fmt, const Elem& get, size_t n, OutputIt out,
                         fmt::format_context& ctx) {
    *out++ = '[';
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) {
            out = fmt::format_to(out, ", ");
        }
        ctx.advance_to(out);
        out = elem_fmt.format(get(i), ctx);
    }
    *out++ = ']';
    return out;
}

template<size_t R, size_t C, typename T>
auto format_rows(const fmt::formatter<T>& elem_fmt, const Matrix<R, C, T>& m, fmt::format_context& ctx) {
    auto out = ctx.out();
    *out++ = '[';
    for (size_t r = 0; r < R; ++r) {
        if (r > 0) {
            out = fmt::format_to(out, ", ");
        }
        out = format_sequence(elem_fmt, [&](size_t c) { return m(r, c); }, C, out, ctx);
    }
    *out++ = ']';
    return out;
}

} // namespace wetmelon::geometry::detail

template<size_t R, size_t C, typename T>
struct fmt::formatter<wetmelon::geometry::Matrix<R, C, T>> : fmt::formatter<T> {
    auto format(const wetmelon::geometry::Matrix<R, C, T>& m, fmt::format_context& ctx) const {
        return wetmelon::geometry::detail::format_rows<R, C, T>(*this, m, ctx);
    }
};

// Vectors print flat: [x, y, z]
template<size_t N, typename T>
struct fmt::formatter<wetmelon::geometry::ColVec<N, T>> : fmt::formatter<T> {
    auto format(const wetmelon::geometry::ColVec<N, T>& v, fmt::format_context& ctx) const {
        return wetmelon::geometry::detail::format_sequence<T>(*this, [&](size_t i) { return v[i]; }, N, ctx.out(), ctx);
    }
};

template<size_t N, typename T>
struct fmt::formatter<wetmelon::geometry::Point<N, T>> : fmt::formatter<T> {
    auto format(const wetmelon::geometry::Point<N, T>& p, fmt::format_context& ctx) const {
        auto out = fmt::format_to(ctx.out(), "Point{} ", N);
        return wetmelon::geometry::detail::format_sequence<T>(*this, [&](size_t i) { return p[i]; }, N, out, ctx);
    }
};

template<wetmelon::geometry::BaseFloat T>
struct fmt::formatter<wetmelon::geometry::Rad<T>> : fmt::formatter<T> {
    auto format(const wetmelon::geometry::Rad<T>& a, fmt::format_context& ctx) const {
        auto out = fmt::formatter<T>::format(a.value, ctx);
        return fmt::format_to(out, " rad");
    }
};

template<wetmelon::geometry::BaseFloat T>
struct fmt::formatter<wetmelon::geometry::Deg<T>> : fmt::formatter<T> {
    auto format(const wetmelon::geometry::Deg<T>& a, fmt::format_context& ctx) const {
        auto out = fmt::formatter<T>::format(a.value, ctx);
        return fmt::format_to(out, " deg");
    }
};

template<wetmelon::geometry::BaseFloat T>
struct fmt::formatter<wetmelon::geometry::Quaternion<T>> : fmt::formatter<T> {
    auto format(const wetmelon::geometry::Quaternion<T>& q, fmt::format_context& ctx) const {
        const auto wxyz = q.to_array();
        auto       out = fmt::format_to(ctx.out(), "Quaternion ");
        return wetmelon::geometry::detail::format_sequence<T>(*this, [&](size_t i) { return wxyz[i]; }, 4, out, ctx);
    }
};

template<wetmelon::geometry::BaseFloat S>
struct fmt::formatter<wetmelon::geometry::Basis2<S>> : fmt::formatter<S> {
    auto format(const wetmelon::geometry::Basis2<S>& b, fmt::format_context& ctx) const {
        ctx.advance_to(fmt::format_to(ctx.out(), "Basis2 "));
        return wetmelon::geometry::detail::format_rows<2, 2, S>(*this, b.matrix(), ctx);
    }
};

template<wetmelon::geometry::BaseFloat S>
struct fmt::formatter<wetmelon::geometry::Basis3<S>> : fmt::formatter<S> {
    auto format(const wetmelon::geometry::Basis3<S>& b, fmt::format_context& ctx) const {
        ctx.advance_to(fmt::format_to(ctx.out(), "Basis3 "));
        return wetmelon::geometry::detail::format_rows<3, 3, S>(*this, b.matrix(), ctx);
    }
};
