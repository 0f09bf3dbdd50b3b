#ifndef GRIDVEC_CORE_BIND_HPP
#define GRIDVEC_CORE_BIND_HPP

/// \file bind.hpp
/// \brief Run-time binding of grid arguments to parameters known by descriptor.
///
/// The external kernel-binding framework reflects kernel parameters at run time,
/// so it cannot name `std::array<int, 3>` in a template argument. This header
/// gives it the same mechanism through run-time values:
///
/// - `bind(parameter, requested_dim)` applies the vectorization rules of
///   vectorize.hpp to a `type_descriptor` and returns the representation.
/// - `bind_grid(parameter, requested_dim, offsets, strides)` additionally
///   checks the descriptor arity and produces an immutable `grid_binding`.
/// - `materialize(binding, coord)` computes the value of one invocation.
///
/// **Resolution happens once.** `bind_grid` selects the materializer for the
/// bound representation from a compile-time generated function pointer table
/// (one entry per shape, element type and dimension up to `GRIDVEC_MAX_DIMS`).
/// Every later `materialize` call is one indirect call into a fully inlined,
/// statically typed materializer: no shape tests, no branching on layout.
///
/// **Failure model.** `bind` and `bind_grid` throw `unsupported_vectorization`
/// or `arity_mismatch`. Once a `grid_binding` exists, `materialize` cannot fail.
///
/// ```cpp
/// const auto binding = gridvec::bind_grid(gridvec::describe<gridvec::vector<int, 2>>(),
///                                         gridvec::wildcard_dim, { 10, 20 }, { 2, 3 });
/// const auto value = gridvec::materialize(binding, gridvec::dynamic_coord{ 0, 1 });
/// value.as<gridvec::vector<int, 2>>();   // { 23, 10 }
/// ```

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <vector>

#include <gridvec/core/errors.hpp>
#include <gridvec/core/grid_descriptor.hpp>
#include <gridvec/core/grid_shape.hpp>
#include <gridvec/core/macros.hpp>
#include <gridvec/core/materialize.hpp>
#include <gridvec/core/representation_value.hpp>
#include <gridvec/core/shape.hpp>
#include <gridvec/core/vectorize.hpp>

namespace gridvec {

/// \brief Coordinate handed to run-time bound arguments; entries past the bound dimension are ignored.
using dynamic_coord = std::array<std::uint32_t, max_grid_dims>;

/// \brief Resolve the representation of a run-time described parameter.
///
/// Applies the rules of `vectorize<P, Dim>` in the same order. Every rule binds
/// the parameter type itself, so on success the result equals `parameter`.
///
/// \throws unsupported_vectorization when no rule matches, when the parameter
/// is wider than `GRIDVEC_MAX_DIMS`, or when its element type is not a
/// `scalar_type` enumerator.
[[nodiscard]] inline auto bind(const type_descriptor &parameter, int requested_dim) -> type_descriptor {
    const auto rule = match_rule(parameter, requested_dim);
    if (GRIDVEC_UNLIKELY(!rule.has_value() || static_cast<std::size_t>(parameter.dims) > max_grid_dims
                         || static_cast<std::size_t>(parameter.element) >= scalar_type_count)) {
        throw unsupported_vectorization(parameter, requested_dim);
    }
    return parameter;
}

class grid_binding;

namespace detail {

    using materialize_fn = representation_value (*)(const grid_binding &, const dynamic_coord &) noexcept;

    template<typename P> auto materialize_entry(const grid_binding &binding, const dynamic_coord &t) noexcept
      -> representation_value;

}// namespace detail

/// \brief Immutable result of binding a grid argument to one kernel parameter.
///
/// Holds the resolved representation, the descriptor values and the
/// materializer selected for them. Safe to share between threads.
class grid_binding {
  public:
    [[nodiscard]] auto parameter() const noexcept -> const type_descriptor & { return parameter_; }
    [[nodiscard]] auto representation() const noexcept -> const type_descriptor & { return representation_; }
    [[nodiscard]] auto requested_dim() const noexcept -> int { return requested_dim_; }
    [[nodiscard]] auto rule() const noexcept -> vectorize_rule { return rule_; }
    [[nodiscard]] auto dimensions() const noexcept -> std::size_t { return static_cast<std::size_t>(representation_.dims); }
    [[nodiscard]] auto offset(std::size_t i) const noexcept -> int { return offset_[i]; }
    [[nodiscard]] auto stride(std::size_t i) const noexcept -> int { return stride_[i]; }

    /// \brief The first N offsets and strides as a statically sized descriptor.
    ///
    /// N must equal `dimensions()`.
    template<std::size_t N> [[nodiscard]] auto descriptor() const noexcept -> grid_descriptor<N> {
        static_assert(N <= max_grid_dims, "grid_binding::descriptor: N exceeds GRIDVEC_MAX_DIMS");
        std::array<int, N> offset{};
        std::array<int, N> stride{};
        for (std::size_t i = 0; i < N; ++i) {
            offset[i] = offset_[i];
            stride[i] = stride_[i];
        }
        return grid_descriptor<N>(offset, stride);
    }

  private:
    friend auto bind_grid(const type_descriptor &, int, const std::vector<int> &, const std::vector<int> &)
      -> grid_binding;
    friend auto materialize(const grid_binding &, const dynamic_coord &) noexcept -> representation_value;

    grid_binding(const type_descriptor &parameter,
      int requested_dim,
      vectorize_rule rule,
      const std::array<int, max_grid_dims> &offset,
      const std::array<int, max_grid_dims> &stride,
      detail::materialize_fn fn) noexcept
      : parameter_(parameter), representation_(parameter), requested_dim_(requested_dim), rule_(rule),
        offset_(offset), stride_(stride), fn_(fn) {}

    type_descriptor parameter_;
    type_descriptor representation_;
    int requested_dim_;
    vectorize_rule rule_;
    std::array<int, max_grid_dims> offset_;
    std::array<int, max_grid_dims> stride_;
    detail::materialize_fn fn_;
};

namespace detail {

    template<typename P>
    auto materialize_entry(const grid_binding &binding, const dynamic_coord &t) noexcept -> representation_value {
        constexpr std::size_t N = shape_traits<P>::dims;
        invocation_coord<N> coord{};
        for (std::size_t i = 0; i < N; ++i) { coord[i] = t[i]; }
        return representation_value::from(gridvec::materialize<P>(binding.template descriptor<N>(), coord));
    }

    // ========================================================================
    // Materializer table: (shape kind, element type, dimension - 1) -> entry
    // ========================================================================

    inline constexpr std::size_t shape_kind_count = 3;
    inline constexpr std::array<std::size_t, 3> materialize_table_shape = { shape_kind_count,
        scalar_type_count,
        max_grid_dims };
    inline constexpr std::size_t materialize_table_size = compute_total_size(materialize_table_shape);

    template<shape_kind Kind, scalar_type Element, std::size_t N> struct representation_for {
        using type = void;
    };

    template<scalar_type Element, std::size_t N> struct representation_for<shape_kind::array, Element, N> {
        using type = std::array<scalar_type_t<Element>, N>;
    };

    template<scalar_type Element, std::size_t N> struct representation_for<shape_kind::vector, Element, N> {
        using type = vector<scalar_type_t<Element>, N>;
    };

    template<scalar_type Element> struct representation_for<shape_kind::scalar, Element, 1> {
        using type = scalar_type_t<Element>;
    };

    template<std::size_t Flat> GRIDVEC_CPP20_CONSTEVAL auto make_materialize_entry() noexcept -> materialize_fn {
        constexpr auto index = unflatten_index(Flat, materialize_table_shape);
        using P = typename representation_for<static_cast<shape_kind>(index[0]),
          static_cast<scalar_type>(index[1]),
          index[2] + 1>::type;
        if constexpr (std::is_void_v<P>) {
            // Scalars exist only for one-dimensional grids; bind() never selects these slots.
            return nullptr;
        } else {
            return &materialize_entry<P>;
        }
    }

    template<std::size_t... Flat>
    GRIDVEC_CPP20_CONSTEVAL auto make_materialize_table(std::index_sequence<Flat...> /*flat*/) noexcept
      -> std::array<materialize_fn, sizeof...(Flat)> {
        return { make_materialize_entry<Flat>()... };
    }

    inline constexpr auto materialize_table = make_materialize_table(std::make_index_sequence<materialize_table_size>{});

    [[nodiscard]] inline auto select_materializer(const type_descriptor &representation) noexcept -> materialize_fn {
        constexpr auto strides = compute_strides(materialize_table_shape);
        const std::array<std::size_t, 3> index = { static_cast<std::size_t>(representation.kind),
            static_cast<std::size_t>(representation.element),
            static_cast<std::size_t>(representation.dims - 1) };
        return materialize_table[flatten_index(index, strides)];
    }

}// namespace detail

/// \brief Bind a grid argument to a parameter and fix its materializer.
///
/// \param parameter Descriptor of the kernel parameter type.
/// \param requested_dim Requested dimension, or `wildcard_dim`.
/// \param offset One offset per dimension of the resolved representation.
/// \param stride One stride per dimension of the resolved representation.
/// \throws unsupported_vectorization when no rule matches.
/// \throws arity_mismatch when `offset` or `stride` does not match the resolved dimension.
[[nodiscard]] inline auto bind_grid(const type_descriptor &parameter,
  int requested_dim,
  const std::vector<int> &offset,
  const std::vector<int> &stride) -> grid_binding {
    const type_descriptor representation = bind(parameter, requested_dim);
    const auto dims = static_cast<std::size_t>(representation.dims);
    if (GRIDVEC_UNLIKELY(offset.size() != dims || stride.size() != dims)) {
        throw arity_mismatch("gridvec::bind_grid", dims, offset.size(), stride.size());
    }

    std::array<int, max_grid_dims> offset_values{};
    std::array<int, max_grid_dims> stride_values{};
    for (std::size_t i = 0; i < dims; ++i) {
        offset_values[i] = offset[i];
        stride_values[i] = stride[i];
    }
    // bind() succeeded, so the rule exists and the table slot is populated.
    const auto rule = *match_rule(representation, requested_dim);
    return grid_binding(
      parameter, requested_dim, rule, offset_values, stride_values, detail::select_materializer(representation));
}

/// \brief Value of the bound grid argument for one invocation.
///
/// Reads the first `binding.dimensions()` entries of `t`. Cannot fail and keeps
/// no state between calls.
[[nodiscard]] inline auto materialize(const grid_binding &binding, const dynamic_coord &t) noexcept
  -> representation_value {
    return binding.fn_(binding, t);
}

}// namespace gridvec

#endif// GRIDVEC_CORE_BIND_HPP
