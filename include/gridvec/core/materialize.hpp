#ifndef GRIDVEC_CORE_MATERIALIZE_HPP
#define GRIDVEC_CORE_MATERIALIZE_HPP

/// \file materialize.hpp
/// \brief Turns a grid descriptor and an invocation coordinate into a typed value.
///
/// The destination's static type selects the layout; there is no runtime tag:
///
/// | Destination              | Grid dim | Result                              |
/// |--------------------------|----------|-------------------------------------|
/// | `std::array<T, N>`       | N        | `out[i]       = T(v[i])`            |
/// | `gridvec::vector<T, N>`  | N        | `out[N - 1 - i] = T(v[i])`          |
/// | scalar `T`               | 1        | `out          = T(v[0])`            |
///
/// where `v[i] = offset[i] + t[i] * stride[i]`.
///
/// **Vector order:** the vector layout is the exact index reversal of the array
/// layout. The surrounding kernel system stores vector components with the
/// highest grid dimension first, so `vector[0]` is the *last* grid dimension.
/// This is the expected result, not a defect.
///
/// **Casting:** components are computed in `std::int64_t` and converted with
/// `static_cast`, i.e. modular wrap-around for narrower integers and ordinary
/// value conversion for floating point. Nothing saturates.
///
/// Combinations outside the table (scalar on a grid of dimension N != 1, or a
/// destination whose dimension differs from the grid's) fail to compile;
/// `can_materialize_v` reports them without triggering the error.

#include <array>
#include <cstddef>
#include <type_traits>

#include <gridvec/core/grid_descriptor.hpp>
#include <gridvec/core/macros.hpp>
#include <gridvec/core/shape.hpp>
#include <gridvec/core/static_for.hpp>

namespace gridvec {

namespace detail {

    template<typename Dest, std::size_t N, typename = void> struct materializer {
        static constexpr bool valid = false;
    };

    // Ascending order: component i of the grid lands in slot i.
    template<typename T, std::size_t N> struct materializer<std::array<T, N>, N, std::enable_if_t<is_scalar_v<T>>> {
        static constexpr bool valid = true;

        GRIDVEC_FORCEINLINE static constexpr void
          load(const grid_descriptor<N> &grid, const invocation_coord<N> &t, std::array<T, N> &out) noexcept {
            static_for<static_cast<std::intmax_t>(N)>([&](auto i) {
                constexpr auto dim = static_cast<std::size_t>(decltype(i)::value);
                out[dim] = static_cast<T>(grid.component(dim, t));
            });
        }
    };

    // Reversed order: component i of the grid lands in slot N - 1 - i.
    template<typename T, std::size_t N> struct materializer<vector<T, N>, N, std::enable_if_t<is_scalar_v<T>>> {
        static constexpr bool valid = true;

        GRIDVEC_FORCEINLINE static constexpr void
          load(const grid_descriptor<N> &grid, const invocation_coord<N> &t, vector<T, N> &out) noexcept {
            static_for<static_cast<std::intmax_t>(N)>([&](auto i) {
                constexpr auto dim = static_cast<std::size_t>(decltype(i)::value);
                out[N - 1 - dim] = static_cast<T>(grid.component(dim, t));
            });
        }
    };

    template<typename T> struct materializer<T, 1, std::enable_if_t<is_scalar_v<T>>> {
        static constexpr bool valid = true;

        GRIDVEC_FORCEINLINE static constexpr void
          load(const grid_descriptor<1> &grid, const invocation_coord<1> &t, T &out) noexcept {
            out = static_cast<T>(grid.component(0, t));
        }
    };

}// namespace detail

/// \brief True when a `Dest` can be materialized from a grid of dimension N.
template<typename Dest, std::size_t N>
inline constexpr bool can_materialize_v = detail::materializer<std::remove_cv_t<Dest>, N>::valid;

/// \brief Write the value of coordinate `t` into `out`, laid out by `Dest`'s shape.
///
/// \param grid Descriptor of the bound grid argument.
/// \param t Coordinate of the current invocation.
/// \param out Destination; its static type selects array, vector or scalar layout.
template<typename Dest, std::size_t N>
GRIDVEC_FLATTEN constexpr void load(const grid_descriptor<N> &grid, const invocation_coord<N> &t, Dest &out) noexcept {
    static_assert(!std::is_const_v<Dest>, "gridvec::load: destination must be writable");
    static_assert(shape_traits<Dest>::valid,
      "gridvec::load: destination must be a scalar, std::array<T, N> or gridvec::vector<T, N>");
    static_assert(!is_scalar_v<Dest> || N == 1, "gridvec::load: scalar materialization requires a one-dimensional grid");
    static_assert(is_scalar_v<Dest> || !shape_traits<Dest>::valid || can_materialize_v<Dest, N>,
      "gridvec::load: destination dimension must equal the grid dimension");
    if constexpr (can_materialize_v<Dest, N>) { detail::materializer<Dest, N>::load(grid, t, out); }
}

/// \brief Return the value of coordinate `t` as a `Dest`.
///
/// cv-qualifiers on `Dest` are dropped: `materialize<const int>` returns `int`.
///
/// ```cpp
/// constexpr gridvec::grid_descriptor<2> grid({ 10, 20 }, { 2, 3 });
/// auto a = gridvec::materialize<std::array<int, 2>>(grid, { 0, 1 });       // { 10, 23 }
/// auto v = gridvec::materialize<gridvec::vector<int, 2>>(grid, { 0, 1 });  // { 23, 10 }
/// ```
template<typename Dest, std::size_t N>
[[nodiscard]] GRIDVEC_FLATTEN constexpr auto materialize(const grid_descriptor<N> &grid, const invocation_coord<N> &t) noexcept
  -> std::remove_cv_t<Dest> {
    std::remove_cv_t<Dest> out{};
    load(grid, t, out);
    return out;
}

}// namespace gridvec

#endif// GRIDVEC_CORE_MATERIALIZE_HPP
