#ifndef GRIDVEC_CORE_REPRESENTATION_VALUE_HPP
#define GRIDVEC_CORE_REPRESENTATION_VALUE_HPP

/// \file representation_value.hpp
/// \brief Run-time holder for a value materialized through a `grid_binding`.
///
/// The statically typed path returns the representation type directly. The
/// run-time binding layer cannot, so it returns a `representation_value`: the
/// bound `type_descriptor` plus up to `GRIDVEC_MAX_DIMS` components, each held
/// in its exact element type. Components are stored in the value's own layout,
/// so for a vector representation `get<T>(0)` is the *last* grid dimension.
///
/// The holder is a fixed-size aggregate; building one never allocates.

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <variant>

#include <gridvec/core/errors.hpp>
#include <gridvec/core/macros.hpp>
#include <gridvec/core/shape.hpp>

namespace gridvec {

/// \brief Largest dimension the run-time binding layer handles.
inline constexpr std::size_t max_grid_dims = GRIDVEC_MAX_DIMS;

/// \brief One component in its element type; alternatives follow `scalar_type` order.
using scalar_value = std::variant<std::int8_t,
  std::int16_t,
  std::int32_t,
  std::int64_t,
  std::uint8_t,
  std::uint16_t,
  std::uint32_t,
  std::uint64_t,
  float,
  double>;

static_assert(std::variant_size_v<scalar_value> == scalar_type_count,
  "scalar_value must hold one alternative per scalar_type");

class representation_value {
  public:
    /// \brief Capture a statically typed representation.
    template<typename P> [[nodiscard]] static auto from(const P &value) noexcept -> representation_value {
        using traits = shape_traits<P>;
        static_assert(traits::valid, "representation_value::from requires a scalar, std::array or gridvec::vector");
        static_assert(traits::dims <= max_grid_dims, "representation exceeds GRIDVEC_MAX_DIMS");

        representation_value result;
        result.type_ = describe<P>();
        if constexpr (traits::kind == shape_kind::scalar) {
            result.components_[0] = canonical(value);
        } else {
            for (std::size_t i = 0; i < traits::dims; ++i) { result.components_[i] = canonical(value[i]); }
        }
        return result;
    }

    [[nodiscard]] auto type() const noexcept -> const type_descriptor & { return type_; }
    [[nodiscard]] auto kind() const noexcept -> shape_kind { return type_.kind; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return static_cast<std::size_t>(type_.dims); }

    [[nodiscard]] auto component(std::size_t i) const -> const scalar_value & {
        if (i >= size()) { throw std::out_of_range("gridvec::representation_value: component index out of range"); }
        return components_[i];
    }

    /// \brief Component `i` in element type `T`.
    ///
    /// \throws representation_mismatch if `T` is not the bound element type.
    template<typename T> [[nodiscard]] auto get(std::size_t i) const -> T {
        using canonical_t = scalar_type_t<detail::scalar_type_of<T>()>;
        const auto &slot = component(i);
        if (GRIDVEC_UNLIKELY(!std::holds_alternative<canonical_t>(slot))) {
            throw representation_mismatch(type_, type_descriptor{ shape_kind::scalar, detail::scalar_type_of<T>(), 1 });
        }
        return static_cast<T>(std::get<canonical_t>(slot));
    }

    /// \brief Rebuild the statically typed representation.
    ///
    /// \throws representation_mismatch if `P` does not describe the bound representation.
    template<typename P> [[nodiscard]] auto as() const -> P {
        using traits = shape_traits<P>;
        static_assert(traits::valid, "representation_value::as requires a scalar, std::array or gridvec::vector");
        using element_t = typename traits::element_type;

        if (GRIDVEC_UNLIKELY(describe<P>() != type_)) { throw representation_mismatch(type_, describe<P>()); }
        P out{};
        if constexpr (traits::kind == shape_kind::scalar) {
            out = get<element_t>(0);
        } else {
            for (std::size_t i = 0; i < traits::dims; ++i) { out[i] = get<element_t>(i); }
        }
        return out;
    }

  private:
    // `long` and `long long` (or `char` and `signed char`) share a scalar_type;
    // store every element as the fixed-width alternative of its scalar_type.
    template<typename T> static auto canonical(T value) noexcept -> scalar_value {
        using canonical_t = scalar_type_t<detail::scalar_type_of<T>()>;
        return scalar_value(std::in_place_type<canonical_t>, static_cast<canonical_t>(value));
    }

    type_descriptor type_{};
    std::array<scalar_value, max_grid_dims> components_{};
};

}// namespace gridvec

#endif// GRIDVEC_CORE_REPRESENTATION_VALUE_HPP
