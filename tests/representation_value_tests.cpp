#include <gridvec/core/representation_value.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <variant>

namespace {
using gridvec::describe;
using gridvec::representation_value;
using gridvec::scalar_type;
using gridvec::shape_kind;
using gridvec::vector;
}// namespace

TEST_CASE("representation_value captures scalars", "[representation_value]") {
    const auto value = representation_value::from(17);

    REQUIRE(value.kind() == shape_kind::scalar);
    REQUIRE(value.size() == 1);
    REQUIRE(value.type() == describe<int>());
    REQUIRE(value.get<int>(0) == 17);
    REQUIRE(value.as<int>() == 17);
    REQUIRE(std::holds_alternative<std::int32_t>(value.component(0)));
}

TEST_CASE("representation_value keeps array components in index order", "[representation_value]") {
    const auto value = representation_value::from(std::array<double, 3>{ 1.5, -2.0, 4.25 });

    REQUIRE(value.kind() == shape_kind::array);
    REQUIRE(value.size() == 3);
    REQUIRE(value.get<double>(0) == 1.5);
    REQUIRE(value.get<double>(2) == 4.25);
    REQUIRE(value.as<std::array<double, 3>>() == std::array<double, 3>{ 1.5, -2.0, 4.25 });
}

TEST_CASE("representation_value keeps vector components in vector order", "[representation_value]") {
    const auto value = representation_value::from(vector<std::uint16_t, 2>{ { 23, 10 } });

    REQUIRE(value.kind() == shape_kind::vector);
    REQUIRE(value.type().element == scalar_type::uint16);
    REQUIRE(value.get<std::uint16_t>(0) == 23);
    REQUIRE(value.get<std::uint16_t>(1) == 10);
    REQUIRE(value.as<vector<std::uint16_t, 2>>() == vector<std::uint16_t, 2>{ { 23, 10 } });
}

TEST_CASE("representation_value stores elements in their fixed-width alternative", "[representation_value]") {
    const auto value = representation_value::from(std::array<long long, 2>{ -1, 2 });

    REQUIRE(value.type().element == scalar_type::int64);
    REQUIRE(std::holds_alternative<std::int64_t>(value.component(0)));
    REQUIRE(value.get<std::int64_t>(0) == -1);
    REQUIRE(value.get<long long>(1) == 2);
}

TEST_CASE("representation_value rejects reads of another element type", "[representation_value][error]") {
    const auto value = representation_value::from(std::array<int, 2>{ 1, 2 });

    REQUIRE_THROWS_AS(value.get<float>(0), gridvec::representation_mismatch);
    REQUIRE_THROWS_AS(value.get<std::uint32_t>(1), gridvec::representation_mismatch);
    REQUIRE_THROWS_AS(value.get<std::int16_t>(0), gridvec::binding_error);
}

TEST_CASE("representation_value rejects rebuilding another representation", "[representation_value][error]") {
    using vector2 = vector<int, 2>;
    using array3 = std::array<int, 3>;
    using float_array2 = std::array<float, 2>;
    const auto value = representation_value::from(std::array<int, 2>{ 1, 2 });

    REQUIRE_THROWS_AS(value.as<vector2>(), gridvec::representation_mismatch);
    REQUIRE_THROWS_AS(value.as<array3>(), gridvec::representation_mismatch);
    REQUIRE_THROWS_AS(value.as<float_array2>(), gridvec::representation_mismatch);
    REQUIRE_THROWS_AS(value.as<int>(), gridvec::representation_mismatch);
}

TEST_CASE("representation_value bounds-checks component access", "[representation_value][error]") {
    const auto value = representation_value::from(vector<int, 2>{ { 3, 4 } });

    REQUIRE_NOTHROW(value.component(1));
    REQUIRE_THROWS_AS(value.component(2), std::out_of_range);
    REQUIRE_THROWS_AS(value.get<int>(gridvec::max_grid_dims), std::out_of_range);
}

TEST_CASE("an int32 scalar value describes as the default descriptor", "[representation_value]") {
    const representation_value value = representation_value::from(std::int32_t{ 0 });

    REQUIRE(value.type() == gridvec::type_descriptor{});
    REQUIRE(value.as<std::int32_t>() == 0);
}
