#ifndef GRIDVEC_CORE_MACROS_HPP
#define GRIDVEC_CORE_MACROS_HPP

/// \file macros.hpp
/// \brief Compiler-specific macros, attributes and compile-time configuration.
///
/// This header provides portable macros for compiler-specific features including:
/// - Unreachable code markers for optimization
/// - Branch prediction hints
/// - Forced inlining and flattening of the per-invocation path
/// - Library configuration (`GRIDVEC_MAX_DIMS`)
///
/// Supports: GCC, Clang, MSVC, and other C++17-compliant compilers.

// ============================================================================
// GRIDVEC_MAX_DIMS: Largest grid dimension known to the runtime binding layer
// ============================================================================
/// \def GRIDVEC_MAX_DIMS
/// \brief Upper bound on the dimension of a runtime-bound grid argument.
///
/// The static API (`grid_descriptor<N>`, `materialize<Dest>`) has no limit.
/// The runtime binding layer pre-instantiates one materializer per
/// (shape, element type, dimension) triple, so its table grows linearly with
/// this value. Override it on the command line (or through the CMake cache
/// variable of the same name) when kernels bind wider grids.
#ifndef GRIDVEC_MAX_DIMS
    // NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
    #define GRIDVEC_MAX_DIMS 8
#endif

#if GRIDVEC_MAX_DIMS < 1
    #error "GRIDVEC_MAX_DIMS must be at least 1"
#endif

// ============================================================================
// GRIDVEC_UNREACHABLE: Mark code paths as unreachable for optimization
// ============================================================================
/// \def GRIDVEC_UNREACHABLE
/// \brief Indicates that a code path is unreachable, enabling aggressive optimization.
///
/// **Warning**: Using this macro on a reachable code path results in undefined behavior.
/// Only use it after exhaustive switches over enumerations whose values have
/// already been validated.
#if defined(__GNUC__) || defined(__clang__)
    // NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
    #define GRIDVEC_UNREACHABLE() __builtin_unreachable()

#elif defined(_MSC_VER)
    #define GRIDVEC_UNREACHABLE() __assume(false)

#else
    #define GRIDVEC_UNREACHABLE() \
        do {                      \
        } while (false)

#endif

// ============================================================================
// GRIDVEC_FLATTEN: Request flattening of callees into this function
// ============================================================================
/// \def GRIDVEC_FLATTEN
/// \brief Request that all callees be inlined into this function (GCC/Clang).
///
/// Applied to the materializers so that the per-dimension loop, the
/// component arithmetic and the element cast collapse into a handful of
/// multiply-adds with no calls left in the per-invocation path.
///
/// **Note**: Only available on GCC/Clang. No-op on other compilers.
#if defined(__GNUC__) || defined(__clang__)
    #define GRIDVEC_FLATTEN __attribute__((flatten))
#else
    #define GRIDVEC_FLATTEN
#endif

// ============================================================================
// GRIDVEC_FORCEINLINE: Force function inlining across compilers
// ============================================================================
/// \def GRIDVEC_FORCEINLINE
/// \brief Forces the compiler to inline a function regardless of heuristics.
#ifdef _MSC_VER
    #define GRIDVEC_FORCEINLINE __forceinline

#elif defined(__GNUC__) || defined(__clang__)
    #define GRIDVEC_FORCEINLINE inline __attribute__((always_inline))

#else
    #define GRIDVEC_FORCEINLINE inline

#endif

// ============================================================================
// GRIDVEC_LIKELY / GRIDVEC_UNLIKELY: Branch prediction hints
// ============================================================================
/// \def GRIDVEC_LIKELY
/// \brief Hint that a condition is expected to be true.
/// \def GRIDVEC_UNLIKELY
/// \brief Hint that a condition is expected to be false (bind-time failures).
#if defined(__GNUC__) || defined(__clang__)
    // NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
    #define GRIDVEC_LIKELY(x) __builtin_expect(!!(x), 1)
    // NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
    #define GRIDVEC_UNLIKELY(x) __builtin_expect(!!(x), 0)

#else
    #define GRIDVEC_LIKELY(x) (x)
    #define GRIDVEC_UNLIKELY(x) (x)

#endif

// ============================================================================
// C++20 Feature Detection
// ============================================================================

#if __cplusplus >= 202002L
    #define GRIDVEC_CPP20_CONSTEVAL consteval
#else
    #define GRIDVEC_CPP20_CONSTEVAL constexpr
#endif

#endif// GRIDVEC_CORE_MACROS_HPP
