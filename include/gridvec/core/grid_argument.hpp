#ifndef GRIDVEC_CORE_GRID_ARGUMENT_HPP
#define GRIDVEC_CORE_GRID_ARGUMENT_HPP

/// \file grid_argument.hpp
/// \brief Statically typed binding of a grid argument to a kernel parameter.
///
/// `grid_argument<P, Dim>` is what a binding record looks like when the kernel
/// parameter type is known at compile time: the representation is resolved by
/// `vectorize_t<P, Dim>` when the type is instantiated, the descriptor's
/// dimension follows from it, and each call materializes one invocation.
///
/// ```cpp
/// // Parameter declared as vector<int, 2>, natural dimension requested.
/// gridvec::grid_argument<gridvec::vector<int, 2>> arg({ 10, 20 }, { 2, 3 });
/// auto v = arg({ 0, 1 });   // gridvec::vector<int, 2>{ { 23, 10 } }
///
/// // Offsets and strides only known at run time.
/// using arg_t = gridvec::grid_argument<std::array<int, 3>>;
/// arg_t runtime_arg(gridvec::make_grid_descriptor<arg_t::dims>(offsets, strides));
/// ```

#include <array>
#include <cstddef>

#include <gridvec/core/grid_descriptor.hpp>
#include <gridvec/core/materialize.hpp>
#include <gridvec/core/shape.hpp>
#include <gridvec/core/vectorize.hpp>

namespace gridvec {

template<typename P, int Dim = wildcard_dim> class grid_argument {
  public:
    using parameter_type = P;
    using value_type = vectorize_t<P, Dim>;
    static constexpr std::size_t dims = shape_traits<value_type>::dims;
    static constexpr vectorize_rule rule = vectorize<P, Dim>::rule;
    using descriptor_type = grid_descriptor<dims>;

    constexpr explicit grid_argument(const descriptor_type &grid) noexcept : grid_(grid) {}

    constexpr grid_argument(const std::array<int, dims> &offset, const std::array<int, dims> &stride) noexcept
      : grid_(offset, stride) {}

    [[nodiscard]] constexpr auto descriptor() const noexcept -> const descriptor_type & { return grid_; }

    [[nodiscard]] constexpr auto operator()(const invocation_coord<dims> &t) const noexcept -> value_type {
        return materialize<value_type>(grid_, t);
    }

  private:
    descriptor_type grid_;
};

}// namespace gridvec

#endif// GRIDVEC_CORE_GRID_ARGUMENT_HPP
