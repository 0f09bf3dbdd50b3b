#ifndef GRIDVEC_CORE_GRID_DESCRIPTOR_HPP
#define GRIDVEC_CORE_GRID_DESCRIPTOR_HPP

/// \file grid_descriptor.hpp
/// \brief Offset/stride addressing for one N-dimensional grid argument.
///
/// A grid argument turns the coordinate of the current invocation into a
/// per-dimension value with a linear formula:
///
/// ```
/// v[i] = offset[i] + t[i] * stride[i]        for i in [0, N)
/// ```
///
/// **Stride semantics:**
/// - stride 1, offset 0: the value is the coordinate itself (`identity()`)
/// - stride 0: every invocation sees `offset[i]` (broadcast)
/// - negative stride: values decrease as the coordinate grows (reversed iteration)
///
/// No bounds are enforced beyond the dimension agreement guaranteed by the
/// type: a descriptor of dimension N only accepts coordinates of dimension N.
///
/// **Thread Safety:** Descriptors are immutable after construction and can be
/// shared by any number of concurrent invocations.
///
/// **Usage Pattern:**
/// ```cpp
/// constexpr gridvec::grid_descriptor<2> grid({ 10, 20 }, { 2, 3 });
/// gridvec::invocation_coord<2> t = { 0, 1 };
/// grid.component(0, t);  // 10 + 0 * 2 = 10
/// grid.component(1, t);  // 20 + 1 * 3 = 23
/// ```

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <gridvec/core/errors.hpp>
#include <gridvec/core/macros.hpp>

namespace gridvec {

/// \brief Coordinate of one invocation inside the dispatch grid.
///
/// Produced by the dispatcher, borrowed read-only for one materialization.
template<std::size_t N> using invocation_coord = std::array<std::uint32_t, N>;

/// \brief Signed type every grid component is computed in before the element cast.
using grid_value_t = std::int64_t;

/// \brief Immutable per-dimension offset and stride of a grid argument.
///
/// \tparam N Grid dimension (at least one).
template<std::size_t N> class grid_descriptor {
    static_assert(N >= 1, "grid_descriptor requires at least one dimension");

  public:
    static constexpr std::size_t dims = N;

    /// \brief Construct from exactly N offsets and N strides.
    ///
    /// The arity is part of the parameter types, so a mismatch does not compile.
    constexpr grid_descriptor(const std::array<int, N> &offset, const std::array<int, N> &stride) noexcept
      : offset_(offset), stride_(stride) {}

    /// \brief Offset 0 and stride 1 in every dimension.
    [[nodiscard]] static constexpr auto identity() noexcept -> grid_descriptor {
        std::array<int, N> offset{};
        std::array<int, N> stride{};
        for (std::size_t i = 0; i < N; ++i) { stride[i] = 1; }
        return grid_descriptor(offset, stride);
    }

    [[nodiscard]] static constexpr auto dimensions() noexcept -> std::size_t { return N; }

    [[nodiscard]] constexpr auto offset(std::size_t i) const noexcept -> int { return offset_[i]; }
    [[nodiscard]] constexpr auto stride(std::size_t i) const noexcept -> int { return stride_[i]; }
    [[nodiscard]] constexpr auto offsets() const noexcept -> const std::array<int, N> & { return offset_; }
    [[nodiscard]] constexpr auto strides() const noexcept -> const std::array<int, N> & { return stride_; }

    /// \brief Value of dimension `i` for coordinate `t`: `offset[i] + t[i] * stride[i]`.
    ///
    /// Evaluated in 64-bit signed arithmetic, which cannot overflow for 32-bit
    /// offsets, strides and coordinates; narrowing happens later, in the
    /// destination's element cast.
    [[nodiscard]] GRIDVEC_FORCEINLINE constexpr auto component(std::size_t i, const invocation_coord<N> &t) const noexcept
      -> grid_value_t {
        return static_cast<grid_value_t>(offset_[i])
               + static_cast<grid_value_t>(t[i]) * static_cast<grid_value_t>(stride_[i]);
    }

  private:
    std::array<int, N> offset_;
    std::array<int, N> stride_;
};

/// \brief Build a descriptor from run-time sized sequences.
///
/// \throws arity_mismatch when either sequence does not hold exactly N values.
/// Nothing is constructed on failure.
template<std::size_t N>
[[nodiscard]] auto make_grid_descriptor(const std::vector<int> &offset, const std::vector<int> &stride)
  -> grid_descriptor<N> {
    if (GRIDVEC_UNLIKELY(offset.size() != N || stride.size() != N)) {
        throw arity_mismatch("gridvec::make_grid_descriptor", N, offset.size(), stride.size());
    }
    std::array<int, N> offset_values{};
    std::array<int, N> stride_values{};
    for (std::size_t i = 0; i < N; ++i) {
        offset_values[i] = offset[i];
        stride_values[i] = stride[i];
    }
    return grid_descriptor<N>(offset_values, stride_values);
}

}// namespace gridvec

#endif// GRIDVEC_CORE_GRID_DESCRIPTOR_HPP
