#ifndef GRIDVEC_UNDEF_MACROS_HPP
#define GRIDVEC_UNDEF_MACROS_HPP

/// \file undef_macros.hpp
/// \brief Removes the portability macros defined by macros.hpp.
///
/// Included last by the umbrella header so that `GRIDVEC_*` helper macros do
/// not leak into user code. `GRIDVEC_MAX_DIMS` is configuration, not a helper,
/// and stays defined.
///
/// The include guard of macros.hpp is released as well, so a core header
/// included after the umbrella header re-establishes the helpers it needs.

#ifdef GRIDVEC_UNREACHABLE
    #undef GRIDVEC_UNREACHABLE
#endif

#ifdef GRIDVEC_FLATTEN
    #undef GRIDVEC_FLATTEN
#endif

#ifdef GRIDVEC_FORCEINLINE
    #undef GRIDVEC_FORCEINLINE
#endif

#ifdef GRIDVEC_LIKELY
    #undef GRIDVEC_LIKELY
#endif

#ifdef GRIDVEC_UNLIKELY
    #undef GRIDVEC_UNLIKELY
#endif

#ifdef GRIDVEC_CPP20_CONSTEVAL
    #undef GRIDVEC_CPP20_CONSTEVAL
#endif

#ifdef GRIDVEC_CORE_MACROS_HPP
    #undef GRIDVEC_CORE_MACROS_HPP
#endif

#endif// GRIDVEC_UNDEF_MACROS_HPP
