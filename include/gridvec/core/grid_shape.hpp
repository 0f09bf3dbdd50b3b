#ifndef GRIDVEC_CORE_GRID_SHAPE_HPP
#define GRIDVEC_CORE_GRID_SHAPE_HPP

/// \file grid_shape.hpp
/// \brief Row-major index arithmetic over the extents of a dispatch grid.
///
/// A dispatch grid of shape `[D0][D1]...[D(N-1)]` is enumerated in row-major
/// (C-style) order: the rightmost dimension varies fastest. These helpers map
/// between an N-dimensional coordinate and its flat position in that order:
/// - `compute_strides`: row-major strides of a shape
/// - `compute_total_size`: number of points in a shape
/// - `flatten_index`: coordinate -> flat position
/// - `unflatten_index`: flat position -> coordinate
///
/// They are used by the host invocation loop to schedule work by flat index
/// and by the runtime binding layer to address its table of materializers.
///
/// **Thread Safety:** All functions are constexpr and hold no state.
///
/// ```cpp
/// std::array<std::size_t, 3> shape = { 10, 20, 30 };
/// auto strides = compute_strides(shape);                  // { 600, 30, 1 }
/// auto flat = flatten_index(std::array<std::size_t, 3>{ 5, 10, 15 }, strides);  // 3315
/// auto coord = unflatten_index(flat, shape);              // { 5, 10, 15 }
/// ```

#include <array>
#include <cstddef>

#include <gridvec/core/macros.hpp>

namespace gridvec {

/// \brief Number of points in a grid of the given shape; the empty product is 1.
template<typename Extent, std::size_t N>
[[nodiscard]] GRIDVEC_FORCEINLINE constexpr auto compute_total_size(const std::array<Extent, N> &shape) noexcept
  -> std::size_t {
    std::size_t total = 1;
    for (std::size_t i = 0; i < N; ++i) { total *= static_cast<std::size_t>(shape[i]); }
    return total;
}

/// \brief Row-major strides of a shape.
///
/// ```
/// stride[N-1] = 1
/// stride[i]   = shape[i+1] * shape[i+2] * ... * shape[N-1]
/// ```
template<typename Extent, std::size_t N>
[[nodiscard]] GRIDVEC_FORCEINLINE constexpr auto compute_strides(const std::array<Extent, N> &shape) noexcept
  -> std::array<std::size_t, N> {
    std::array<std::size_t, N> strides{};
    if constexpr (N > 0) {
        strides[N - 1] = 1;
        for (std::size_t i = N - 1; i > 0; --i) { strides[i - 1] = strides[i] * static_cast<std::size_t>(shape[i]); }
    }
    return strides;
}

/// \brief Flat row-major position of a coordinate.
template<typename Index, std::size_t N>
[[nodiscard]] GRIDVEC_FLATTEN GRIDVEC_FORCEINLINE constexpr auto flatten_index(const std::array<Index, N> &coord,
  const std::array<std::size_t, N> &strides) noexcept -> std::size_t {
    std::size_t flat = 0;
    for (std::size_t i = 0; i < N; ++i) { flat += static_cast<std::size_t>(coord[i]) * strides[i]; }
    return flat;
}

/// \brief Coordinate of the flat row-major position `flat` inside `shape`.
///
/// `flat` must be below `compute_total_size(shape)`; every extent must be non-zero.
template<typename Extent, std::size_t N>
[[nodiscard]] GRIDVEC_FLATTEN GRIDVEC_FORCEINLINE constexpr auto unflatten_index(std::size_t flat,
  const std::array<Extent, N> &shape) noexcept -> std::array<Extent, N> {
    const auto strides = compute_strides(shape);
    std::array<Extent, N> coord{};
    for (std::size_t i = 0; i < N; ++i) {
        coord[i] = static_cast<Extent>(flat / strides[i]);
        flat %= strides[i];
    }
    return coord;
}

}// namespace gridvec

#endif// GRIDVEC_CORE_GRID_SHAPE_HPP
