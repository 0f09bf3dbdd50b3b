#ifndef GRIDVEC_CORE_INVOCATION_HPP
#define GRIDVEC_CORE_INVOCATION_HPP

/// \file invocation.hpp
/// \brief Serial host-side enumeration of the invocations of a call shape.
///
/// The real dispatch runtime lives outside this library and may run
/// invocations in any order across any number of lanes. This header provides
/// the reference behaviour for the host: every coordinate of a call shape,
/// visited exactly once in row-major order (last dimension fastest).
///
/// ```cpp
/// gridvec::grid_argument<std::array<int, 2>> idx(gridvec::grid_descriptor<2>::identity());
/// gridvec::launch(gridvec::call_shape<2>{ 4, 8 }, [&](std::array<int, 2> ij) { image[ij[0]][ij[1]] = 0; }, idx);
/// ```

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

#include <gridvec/core/grid_descriptor.hpp>
#include <gridvec/core/grid_shape.hpp>
#include <gridvec/core/macros.hpp>

namespace gridvec {

/// \brief Extents of the dispatch grid, one per dimension.
template<std::size_t N> using call_shape = std::array<std::uint32_t, N>;

/// \brief Number of invocations in a call shape; zero when any extent is zero.
template<std::size_t N>
[[nodiscard]] constexpr auto invocation_count(const call_shape<N> &shape) noexcept -> std::size_t {
    return compute_total_size(shape);
}

/// \brief Coordinate of the invocation at row-major position `flat`.
///
/// Lets a parallel dispatcher hand out flat ranges and recover coordinates.
/// `flat` must be below `invocation_count(shape)`.
template<std::size_t N>
[[nodiscard]] constexpr auto unflatten_coord(std::size_t flat, const call_shape<N> &shape) noexcept
  -> invocation_coord<N> {
    return unflatten_index(flat, shape);
}

/// \brief Call `func(coord)` for every coordinate of `shape` in row-major order.
template<std::size_t N, typename Func> constexpr void for_each_invocation(const call_shape<N> &shape, Func &&func) {
    static_assert(N >= 1, "for_each_invocation requires at least one dimension");
    const std::size_t count = invocation_count(shape);
    invocation_coord<N> t{};
    for (std::size_t flat = 0; flat < count; ++flat) {
        func(static_cast<const invocation_coord<N> &>(t));
        // Odometer increment, last dimension fastest.
        for (std::size_t i = N; i-- > 0;) {
            if (++t[i] < shape[i]) { break; }
            t[i] = 0;
        }
    }
}

/// \brief Run `kernel` once per invocation, passing each argument's value for that invocation.
///
/// Every argument must be callable with an `invocation_coord<N>`; typically a
/// `grid_argument` whose dimension matches the call shape.
template<std::size_t N, typename Kernel, typename... Args>
constexpr void launch(const call_shape<N> &shape, Kernel &&kernel, const Args &...args) {
    for_each_invocation(shape, [&](const invocation_coord<N> &t) { kernel(args(t)...); });
}

}// namespace gridvec

#endif// GRIDVEC_CORE_INVOCATION_HPP
