#pragma once

/// \file gridvec.hpp
/// \brief Umbrella header aggregating the public gridvec API surface.
///
/// Downstream projects include <gridvec/gridvec.hpp> to get grid descriptors,
/// materialization, the vectorization resolver, the run-time binding layer and
/// the host invocation loop.

// clang-format off
// IMPORTANT: Include order matters! macros.hpp must come first, undef_macros.hpp must come last
// NOLINTBEGIN(llvm-include-order)
#include <gridvec/core/macros.hpp>
#include <gridvec/core/static_for.hpp>
#include <gridvec/core/shape.hpp>
#include <gridvec/core/errors.hpp>
#include <gridvec/core/grid_shape.hpp>
#include <gridvec/core/grid_descriptor.hpp>
#include <gridvec/core/materialize.hpp>
#include <gridvec/core/vectorize.hpp>
#include <gridvec/core/representation_value.hpp>
#include <gridvec/core/bind.hpp>
#include <gridvec/core/grid_argument.hpp>
#include <gridvec/core/invocation.hpp>
#include <gridvec/core/undef_macros.hpp>
// NOLINTEND(llvm-include-order)
// clang-format on
