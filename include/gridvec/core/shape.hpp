#ifndef GRIDVEC_CORE_SHAPE_HPP
#define GRIDVEC_CORE_SHAPE_HPP

/// \file shape.hpp
/// \brief Representation shapes a grid argument can be bound as.
///
/// A kernel parameter receives its grid value in one of three shapes:
/// - **scalar**: an integer of up to 64 bits (not `bool` or a character type),
///   `float` or `double` (one-dimensional grids only)
/// - **array**: `std::array<T, N>`, components in ascending dimension order
/// - **vector**: `gridvec::vector<T, N>`, components in *descending* dimension
///   order (the vector convention is the transpose of the array convention)
///
/// `shape_traits<P>` classifies a static type, `type_descriptor` carries the
/// same classification at run time for the binding layer.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include <gridvec/core/macros.hpp>

namespace gridvec {

/// \brief Layout of a materialized grid value.
enum class shape_kind : std::uint8_t { scalar, array, vector };

/// \brief Element types the runtime binding layer can materialize into.
enum class scalar_type : std::uint8_t { int8, int16, int32, int64, uint8, uint16, uint32, uint64, float32, float64 };

inline constexpr std::size_t scalar_type_count = 10;

/// \brief Fixed-size vector whose component 0 holds the highest grid dimension.
///
/// The storage is a plain aggregate so it can be brace-initialized and used in
/// constant expressions: `gridvec::vector<int, 2>{ { 23, 10 } }`.
template<typename T, std::size_t N> struct vector {
    static_assert(N >= 1, "gridvec::vector requires at least one component");

    std::array<T, N> components;

    using value_type = T;

    [[nodiscard]] static constexpr auto size() noexcept -> std::size_t { return N; }

    constexpr auto operator[](std::size_t i) noexcept -> T & { return components[i]; }
    constexpr auto operator[](std::size_t i) const noexcept -> const T & { return components[i]; }

    friend constexpr auto operator==(const vector &lhs, const vector &rhs) noexcept -> bool {
        for (std::size_t i = 0; i < N; ++i) {
            if (!(lhs.components[i] == rhs.components[i])) { return false; }
        }
        return true;
    }
    friend constexpr auto operator!=(const vector &lhs, const vector &rhs) noexcept -> bool { return !(lhs == rhs); }
};

/// \brief Sentinel dimension meaning "use the parameter type's natural dimension".
inline constexpr int wildcard_dim = -1;

namespace detail {

    template<typename T>
    inline constexpr bool is_character_v = std::is_same_v<T, wchar_t> || std::is_same_v<T, char16_t>
                                           || std::is_same_v<T, char32_t>
#if defined(__cpp_char8_t)
                                           || std::is_same_v<T, char8_t>
#endif
      ;

    template<typename T>
    inline constexpr bool is_numeric_v = (std::is_integral_v<T> && !std::is_same_v<T, bool> && !is_character_v<T>
                                           && sizeof(T) <= 8)
                                         || std::is_same_v<T, float> || std::is_same_v<T, double>;

}// namespace detail

/// \brief True for the numeric types a grid component may be cast to.
///
/// Exactly the types a `scalar_type` can describe: integers of up to 64 bits
/// (not `bool`, not the character types), `float` and `double`.
template<typename T> inline constexpr bool is_scalar_v = detail::is_numeric_v<std::remove_cv_t<T>>;

/// \brief Classifies a static type as one of the representation shapes.
///
/// Types that are none of the three shapes get `valid == false` and no
/// other members.
template<typename T, typename = void> struct shape_traits {
    static constexpr bool valid = false;
};

template<typename T> struct shape_traits<T, std::enable_if_t<is_scalar_v<T>>> {
    static constexpr bool valid = true;
    static constexpr shape_kind kind = shape_kind::scalar;
    static constexpr std::size_t dims = 1;
    using element_type = T;
};

template<typename T, std::size_t N> struct shape_traits<std::array<T, N>, std::enable_if_t<is_scalar_v<T> && (N >= 1)>> {
    static constexpr bool valid = true;
    static constexpr shape_kind kind = shape_kind::array;
    static constexpr std::size_t dims = N;
    using element_type = T;
};

template<typename T, std::size_t N> struct shape_traits<vector<T, N>, std::enable_if_t<is_scalar_v<T>>> {
    static constexpr bool valid = true;
    static constexpr shape_kind kind = shape_kind::vector;
    static constexpr std::size_t dims = N;
    using element_type = T;
};

namespace detail {

    template<typename T> GRIDVEC_CPP20_CONSTEVAL auto scalar_type_of() noexcept -> scalar_type {
        static_assert(is_scalar_v<T>, "scalar_type_of requires an arithmetic, non-bool type");
        if constexpr (std::is_floating_point_v<T>) {
            static_assert(sizeof(T) == 4 || sizeof(T) == 8, "only 32 and 64 bit floating point elements are supported");
            return sizeof(T) == 4 ? scalar_type::float32 : scalar_type::float64;
        } else if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) == 1) { return scalar_type::int8; }
            if constexpr (sizeof(T) == 2) { return scalar_type::int16; }
            if constexpr (sizeof(T) == 4) { return scalar_type::int32; }
            static_assert(sizeof(T) <= 8, "integer elements wider than 64 bits are not supported");
            return scalar_type::int64;
        } else {
            if constexpr (sizeof(T) == 1) { return scalar_type::uint8; }
            if constexpr (sizeof(T) == 2) { return scalar_type::uint16; }
            if constexpr (sizeof(T) == 4) { return scalar_type::uint32; }
            static_assert(sizeof(T) <= 8, "integer elements wider than 64 bits are not supported");
            return scalar_type::uint64;
        }
    }

}// namespace detail

/// \brief Canonical fixed-width C++ type for each `scalar_type`.
template<scalar_type S> struct scalar_type_traits;
template<> struct scalar_type_traits<scalar_type::int8> { using type = std::int8_t; };
template<> struct scalar_type_traits<scalar_type::int16> { using type = std::int16_t; };
template<> struct scalar_type_traits<scalar_type::int32> { using type = std::int32_t; };
template<> struct scalar_type_traits<scalar_type::int64> { using type = std::int64_t; };
template<> struct scalar_type_traits<scalar_type::uint8> { using type = std::uint8_t; };
template<> struct scalar_type_traits<scalar_type::uint16> { using type = std::uint16_t; };
template<> struct scalar_type_traits<scalar_type::uint32> { using type = std::uint32_t; };
template<> struct scalar_type_traits<scalar_type::uint64> { using type = std::uint64_t; };
template<> struct scalar_type_traits<scalar_type::float32> { using type = float; };
template<> struct scalar_type_traits<scalar_type::float64> { using type = double; };

template<scalar_type S> using scalar_type_t = typename scalar_type_traits<S>::type;

/// \brief Run-time description of a parameter type.
///
/// The external binding layer only knows a kernel parameter through
/// reflection data, so it describes the type with a `(kind, element, dims)`
/// triple. A scalar has `dims == 1`. Descriptors are not validated on
/// construction; `bind()` rejects malformed ones.
struct type_descriptor {
    shape_kind kind = shape_kind::scalar;
    scalar_type element = scalar_type::int32;
    int dims = 1;

    friend constexpr auto operator==(const type_descriptor &lhs, const type_descriptor &rhs) noexcept -> bool {
        return lhs.kind == rhs.kind && lhs.element == rhs.element && lhs.dims == rhs.dims;
    }
    friend constexpr auto operator!=(const type_descriptor &lhs, const type_descriptor &rhs) noexcept -> bool {
        return !(lhs == rhs);
    }
};

/// \brief Build the descriptor of a static representation type.
template<typename P> constexpr auto describe() noexcept -> type_descriptor {
    static_assert(shape_traits<P>::valid, "describe<P>() requires a scalar, std::array or gridvec::vector type");
    using traits = shape_traits<P>;
    return type_descriptor{ traits::kind,
        detail::scalar_type_of<typename traits::element_type>(),
        static_cast<int>(traits::dims) };
}

[[nodiscard]] inline auto to_string(scalar_type type) -> std::string {
    switch (type) {
    case scalar_type::int8: return "int8";
    case scalar_type::int16: return "int16";
    case scalar_type::int32: return "int32";
    case scalar_type::int64: return "int64";
    case scalar_type::uint8: return "uint8";
    case scalar_type::uint16: return "uint16";
    case scalar_type::uint32: return "uint32";
    case scalar_type::uint64: return "uint64";
    case scalar_type::float32: return "float32";
    case scalar_type::float64: return "float64";
    }
    return "unknown";
}

[[nodiscard]] inline auto to_string(shape_kind kind) -> std::string {
    switch (kind) {
    case shape_kind::scalar: return "scalar";
    case shape_kind::array: return "array";
    case shape_kind::vector: return "vector";
    }
    return "unknown";
}

/// \brief Render a descriptor the way it would be spelled in a kernel signature.
///
/// `int32`, `float32[3]`, `vector<uint16,2>`. A scalar descriptor carrying a
/// dimension other than one is rendered with it so diagnostics show the defect.
[[nodiscard]] inline auto to_string(const type_descriptor &type) -> std::string {
    const std::string element = to_string(type.element);
    switch (type.kind) {
    case shape_kind::scalar:
        return type.dims == 1 ? element : element + " (dims=" + std::to_string(type.dims) + ")";
    case shape_kind::array: return element + "[" + std::to_string(type.dims) + "]";
    case shape_kind::vector: return "vector<" + element + "," + std::to_string(type.dims) + ">";
    }
    return "unknown";
}

}// namespace gridvec

#endif// GRIDVEC_CORE_SHAPE_HPP
