#ifndef GRIDVEC_CORE_ERRORS_HPP
#define GRIDVEC_CORE_ERRORS_HPP

/// \file errors.hpp
/// \brief Exceptions raised while constructing descriptors and binding parameters.
///
/// Every failure of this library happens at construction or bind time. Once a
/// binding exists, per-invocation materialization has no error path, so none
/// of these types is ever thrown while a grid is being dispatched.
///
/// All exceptions derive from `gridvec::binding_error` (itself a
/// `std::runtime_error`) and their messages start with the API that threw.

#include <cstddef>
#include <stdexcept>
#include <string>

#include <gridvec/core/shape.hpp>

namespace gridvec {

namespace detail {

    [[nodiscard]] inline auto dim_to_string(int dim) -> std::string {
        return dim == wildcard_dim ? std::string("*") : std::to_string(dim);
    }

}// namespace detail

/// \brief Common base of every error reported by gridvec.
class binding_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// \brief Offset and stride sequences disagree with each other or with the grid dimension.
class arity_mismatch : public binding_error {
  public:
    /// \param api Name of the throwing function, used as the message prefix.
    arity_mismatch(const std::string &api, std::size_t expected, std::size_t offset_count, std::size_t stride_count)
      : binding_error(api + ": expected " + std::to_string(expected) + " offsets and "
                      + std::to_string(expected) + " strides, got " + std::to_string(offset_count) + " offsets and "
                      + std::to_string(stride_count) + " strides"),
        expected_(expected), offset_count_(offset_count), stride_count_(stride_count) {}

    [[nodiscard]] auto expected() const noexcept -> std::size_t { return expected_; }
    [[nodiscard]] auto offset_count() const noexcept -> std::size_t { return offset_count_; }
    [[nodiscard]] auto stride_count() const noexcept -> std::size_t { return stride_count_; }

  private:
    std::size_t expected_;
    std::size_t offset_count_;
    std::size_t stride_count_;
};

/// \brief No vectorization rule matches a parameter type and requested dimension.
class unsupported_vectorization : public binding_error {
  public:
    unsupported_vectorization(const type_descriptor &parameter, int requested_dim)
      : binding_error("gridvec::bind: cannot vectorize grid argument to parameter of type " + to_string(parameter)
                      + " with requested dimension " + detail::dim_to_string(requested_dim)),
        parameter_(parameter), requested_dim_(requested_dim) {}

    [[nodiscard]] auto parameter() const noexcept -> const type_descriptor & { return parameter_; }
    [[nodiscard]] auto requested_dim() const noexcept -> int { return requested_dim_; }

  private:
    type_descriptor parameter_;
    int requested_dim_;
};

/// \brief A runtime value was read back as a type other than the bound representation.
class representation_mismatch : public binding_error {
  public:
    representation_mismatch(const type_descriptor &bound, const type_descriptor &requested)
      : binding_error("gridvec::representation_value: value is bound as " + to_string(bound) + ", not "
                      + to_string(requested)) {}
};

}// namespace gridvec

#endif// GRIDVEC_CORE_ERRORS_HPP
