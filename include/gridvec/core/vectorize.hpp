#ifndef GRIDVEC_CORE_VECTORIZE_HPP
#define GRIDVEC_CORE_VECTORIZE_HPP

/// \file vectorize.hpp
/// \brief Compile-time resolution of the representation a grid argument is bound as.
///
/// Given a kernel parameter type `P` and a requested dimension `Dim` (at least
/// one, or `wildcard_dim` for "P's own dimension"), `vectorize<P, Dim>` names
/// the representation type the value must be materialized into. The rules are
/// tried in order and the first match wins:
///
/// 1. `std::array<T, N>`, `Dim == N` or wildcard  -> `std::array<T, N>` (ordered array)
/// 2. `gridvec::vector<T, N>`, `Dim == N` or wildcard -> `gridvec::vector<T, N>` (reversed vector)
/// 3. scalar `T`, `Dim == 1` or wildcard -> `T`
/// 4. anything else: no `type` member, `is_vectorizable_v` is false and
///    `vectorize_t` fails to compile.
///
/// The same rule set is available at run time through `match_rule()`, which
/// the binding layer uses for parameters it only knows by `type_descriptor`.
/// Both paths share `dimension_matches()`, so they cannot disagree.
///
/// ```cpp
/// static_assert(std::is_same_v<gridvec::vectorize_t<std::array<int, 3>, gridvec::wildcard_dim>,
///                              std::array<int, 3>>);
/// static_assert(!gridvec::is_vectorizable_v<float, 2>);
/// ```

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>

#include <gridvec/core/errors.hpp>
#include <gridvec/core/shape.hpp>

namespace gridvec {

/// \brief The rule that produced a representation, which also names the materializer used.
enum class vectorize_rule : std::uint8_t { ordered_array, reversed_vector, scalar };

/// \brief True when `requested` selects a type of dimension `natural`.
[[nodiscard]] constexpr auto dimension_matches(std::size_t natural, int requested) noexcept -> bool {
    return requested == wildcard_dim || (requested >= 1 && static_cast<std::size_t>(requested) == natural);
}

namespace detail {

    template<typename P, int Dim, typename = void> struct ordered_array_rule {
        static constexpr bool matches = false;
    };

    template<typename T, std::size_t N, int Dim>
    struct ordered_array_rule<std::array<T, N>,
      Dim,
      std::enable_if_t<is_scalar_v<T> && (N >= 1) && dimension_matches(N, Dim)>> {
        static constexpr bool matches = true;
        static constexpr vectorize_rule rule = vectorize_rule::ordered_array;
        static constexpr std::size_t dims = N;
        using type = std::array<T, N>;
    };

    template<typename P, int Dim, typename = void> struct reversed_vector_rule {
        static constexpr bool matches = false;
    };

    template<typename T, std::size_t N, int Dim>
    struct reversed_vector_rule<vector<T, N>, Dim, std::enable_if_t<is_scalar_v<T> && dimension_matches(N, Dim)>> {
        static constexpr bool matches = true;
        static constexpr vectorize_rule rule = vectorize_rule::reversed_vector;
        static constexpr std::size_t dims = N;
        using type = vector<T, N>;
    };

    template<typename P, int Dim, typename = void> struct scalar_rule {
        static constexpr bool matches = false;
    };

    template<typename P, int Dim> struct scalar_rule<P, Dim, std::enable_if_t<is_scalar_v<P> && dimension_matches(1, Dim)>> {
        static constexpr bool matches = true;
        static constexpr vectorize_rule rule = vectorize_rule::scalar;
        static constexpr std::size_t dims = 1;
        using type = P;
    };

    // Rule 4: nothing matched.
    struct no_rule {};

    template<typename P, int Dim>
    using select_rule_t = std::conditional_t<ordered_array_rule<P, Dim>::matches,
      ordered_array_rule<P, Dim>,
      std::conditional_t<reversed_vector_rule<P, Dim>::matches,
        reversed_vector_rule<P, Dim>,
        std::conditional_t<scalar_rule<P, Dim>::matches, scalar_rule<P, Dim>, no_rule>>>;

}// namespace detail

/// \brief Representation of parameter type `P` for requested dimension `Dim`.
///
/// Members when a rule matches: `type`, `rule`, `dims`. None otherwise.
template<typename P, int Dim> struct vectorize : detail::select_rule_t<std::remove_cv_t<P>, Dim> {};

namespace detail {

    template<typename P, int Dim, typename = void> struct has_vectorization : std::false_type {};
    template<typename P, int Dim>
    struct has_vectorization<P, Dim, std::void_t<typename vectorize<P, Dim>::type>> : std::true_type {};

    template<typename P, int Dim> struct require_vectorization {
        static_assert(has_vectorization<P, Dim>::value,
          "gridvec::vectorize_t: unsupported vectorization, the parameter type is not a scalar, std::array or "
          "gridvec::vector of the requested dimension");
        using type = typename vectorize<P, Dim>::type;
    };

}// namespace detail

/// \brief True when some rule maps `(P, Dim)` to a representation.
template<typename P, int Dim> inline constexpr bool is_vectorizable_v = detail::has_vectorization<P, Dim>::value;

/// \brief The representation type; a compile error when no rule matches.
template<typename P, int Dim> using vectorize_t = typename detail::require_vectorization<P, Dim>::type;

/// \brief Run-time evaluation of the same rules over a `type_descriptor`.
///
/// Returns the matching rule, or `std::nullopt` for rule 4. A descriptor that
/// cannot describe a real type (dimension below one, scalar with a dimension
/// other than one) matches nothing.
[[nodiscard]] constexpr auto match_rule(const type_descriptor &parameter, int requested_dim) noexcept
  -> std::optional<vectorize_rule> {
    if (parameter.dims < 1) { return std::nullopt; }
    const auto natural = static_cast<std::size_t>(parameter.dims);
    switch (parameter.kind) {
    case shape_kind::array:
        if (dimension_matches(natural, requested_dim)) { return vectorize_rule::ordered_array; }
        break;
    case shape_kind::vector:
        if (dimension_matches(natural, requested_dim)) { return vectorize_rule::reversed_vector; }
        break;
    case shape_kind::scalar:
        if (natural == 1 && dimension_matches(1, requested_dim)) { return vectorize_rule::scalar; }
        break;
    }
    return std::nullopt;
}

}// namespace gridvec

#endif// GRIDVEC_CORE_VECTORIZE_HPP
