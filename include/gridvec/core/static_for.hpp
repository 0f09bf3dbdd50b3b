#ifndef GRIDVEC_CORE_STATIC_FOR_HPP
#define GRIDVEC_CORE_STATIC_FOR_HPP

/// \file static_for.hpp
/// \brief Compile-time unrolled loop over a range of grid dimensions.
///
/// `static_for<Begin, End, Step>(func)` invokes `func` once per value in the
/// half-open range `[Begin, End)` with an `std::integral_constant` carrying
/// the value, so the callable can use it as an array index or as a template
/// argument. The loop is emitted as a single fold expression: there is no
/// runtime induction variable and nothing left for the optimizer to unroll.
///
/// Grid dimensions are small (a handful at most), so unlike a general
/// purpose unroller this one never splits the range into blocks.
///
/// ```cpp
/// std::array<std::int64_t, 3> v{};
/// gridvec::static_for<3>([&](auto i) { v[i] = offset[i] + t[i] * stride[i]; });
/// ```

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

#include <gridvec/core/macros.hpp>

namespace gridvec {

namespace detail {

    template<std::intmax_t Begin, std::intmax_t End, std::intmax_t Step>
    [[nodiscard]] constexpr auto compute_range_count() noexcept -> std::size_t {
        static_assert(Step != 0, "static_for requires a non-zero step");

        if constexpr (Step > 0) {
            static_assert(Begin <= End, "static_for with a positive step requires Begin <= End");
            if constexpr (Begin == End) { return 0; }
            const auto distance = End - Begin;
            return static_cast<std::size_t>((distance + Step - 1) / Step);
        } else {
            static_assert(Begin >= End, "static_for with a negative step requires Begin >= End");
            if constexpr (Begin == End) { return 0; }
            const auto distance = Begin - End;
            const auto magnitude = -Step;
            return static_cast<std::size_t>((distance + magnitude - 1) / magnitude);
        }
        GRIDVEC_UNREACHABLE();
    }

    template<typename Func, std::intmax_t Begin, std::intmax_t Step, std::size_t... Is>
    GRIDVEC_FORCEINLINE constexpr void static_loop_impl(Func &func, std::index_sequence<Is...> /*indices*/) {
        // The comma fold keeps the iterations in ascending order.
        (func(std::integral_constant<std::intmax_t, Begin + (Step * static_cast<std::intmax_t>(Is))>{}), ...);
    }

}// namespace detail

/// \brief Invoke `func` for every value of `[Begin, End)` advancing by `Step`.
///
/// \tparam Begin First value passed to `func`.
/// \tparam End One past the last value (exclusive bound).
/// \tparam Step Increment between values; negative steps walk downwards.
/// \param func Callable accepting `std::integral_constant<std::intmax_t, V>`.
template<std::intmax_t Begin, std::intmax_t End, std::intmax_t Step = 1, typename Func>
GRIDVEC_FORCEINLINE constexpr void static_for(Func &&func) {
    constexpr auto count = detail::compute_range_count<Begin, End, Step>();
    if constexpr (count == 0) {
        return;
    } else {
        detail::static_loop_impl<std::remove_reference_t<Func>, Begin, Step>(func, std::make_index_sequence<count>{});
    }
}

/// \brief Shorthand for `static_for<0, End>`.
template<std::intmax_t End, typename Func> GRIDVEC_FORCEINLINE constexpr void static_for(Func &&func) {
    static_for<0, End>(std::forward<Func>(func));
}

}// namespace gridvec

#endif// GRIDVEC_CORE_STATIC_FOR_HPP
