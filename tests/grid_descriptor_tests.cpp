#include <gridvec/core/grid_descriptor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {
using gridvec::grid_descriptor;
using gridvec::invocation_coord;

constexpr grid_descriptor<2> kScenario({ 10, 20 }, { 2, 3 });

static_assert(grid_descriptor<3>::dimensions() == 3, "dimension is part of the type");
static_assert(kScenario.offset(1) == 20 && kScenario.stride(1) == 3, "accessors return construction values");
static_assert(kScenario.component(0, invocation_coord<2>{ 0, 1 }) == 10, "v0 = 10 + 0 * 2");
static_assert(kScenario.component(1, invocation_coord<2>{ 0, 1 }) == 23, "v1 = 20 + 1 * 3");
static_assert(grid_descriptor<4>::identity().component(2, invocation_coord<4>{ 1, 2, 3, 4 }) == 3,
  "identity grids reproduce the coordinate");

}// namespace

TEST_CASE("grid_descriptor exposes offsets and strides", "[grid_descriptor]") {
    const grid_descriptor<3> grid({ 1, -2, 3 }, { 4, 0, -6 });

    REQUIRE(grid.offsets() == std::array<int, 3>{ 1, -2, 3 });
    REQUIRE(grid.strides() == std::array<int, 3>{ 4, 0, -6 });
    REQUIRE(grid.offset(1) == -2);
    REQUIRE(grid.stride(2) == -6);
}

TEST_CASE("grid_descriptor components follow offset + t * stride", "[grid_descriptor][component]") {
    const grid_descriptor<3> grid({ 7, -3, 100 }, { 5, 2, -4 });

    for (std::uint32_t x = 0; x < 4; ++x) {
        for (std::uint32_t y = 0; y < 4; ++y) {
            for (std::uint32_t z = 0; z < 4; ++z) {
                const invocation_coord<3> t = { x, y, z };
                REQUIRE(grid.component(0, t) == 7 + static_cast<std::int64_t>(x) * 5);
                REQUIRE(grid.component(1, t) == -3 + static_cast<std::int64_t>(y) * 2);
                REQUIRE(grid.component(2, t) == 100 - static_cast<std::int64_t>(z) * 4);
            }
        }
    }
}

TEST_CASE("zero stride broadcasts the offset", "[grid_descriptor][broadcast]") {
    const grid_descriptor<2> grid({ 42, 0 }, { 0, 1 });

    for (std::uint32_t x = 0; x < 16; ++x) {
        REQUIRE(grid.component(0, invocation_coord<2>{ x, 9 }) == 42);
        REQUIRE(grid.component(1, invocation_coord<2>{ x, 9 }) == 9);
    }
}

TEST_CASE("component arithmetic does not overflow for extreme 32-bit inputs", "[grid_descriptor][limits]") {
    constexpr int big = std::numeric_limits<int>::max();
    const grid_descriptor<1> grid({ big }, { big });
    const invocation_coord<1> t = { std::numeric_limits<std::uint32_t>::max() };

    const std::int64_t expected =
      static_cast<std::int64_t>(big) + static_cast<std::int64_t>(t[0]) * static_cast<std::int64_t>(big);
    REQUIRE(grid.component(0, t) == expected);
}

TEST_CASE("make_grid_descriptor accepts matching sequences", "[grid_descriptor][runtime]") {
    const auto grid = gridvec::make_grid_descriptor<2>(std::vector<int>{ 10, 20 }, std::vector<int>{ 2, 3 });

    REQUIRE(grid.offsets() == kScenario.offsets());
    REQUIRE(grid.strides() == kScenario.strides());
}

TEST_CASE("make_grid_descriptor rejects offset and stride of different lengths", "[grid_descriptor][arity]") {
    const std::vector<int> offset = { 1, 2 };
    const std::vector<int> stride = { 1, 2, 3 };

    REQUIRE_THROWS_AS(gridvec::make_grid_descriptor<2>(offset, stride), gridvec::arity_mismatch);
    REQUIRE_THROWS_AS(gridvec::make_grid_descriptor<3>(offset, stride), gridvec::arity_mismatch);

    try {
        (void)gridvec::make_grid_descriptor<2>(offset, stride);
        FAIL("arity_mismatch expected");
    } catch (const gridvec::arity_mismatch &error) {
        REQUIRE(error.expected() == 2);
        REQUIRE(error.offset_count() == 2);
        REQUIRE(error.stride_count() == 3);
        REQUIRE(std::string(error.what()).rfind("gridvec::make_grid_descriptor:", 0) == 0);
    }
}

TEST_CASE("make_grid_descriptor rejects sequences of the wrong dimension", "[grid_descriptor][arity]") {
    const std::vector<int> three = { 1, 2, 3 };

    REQUIRE_THROWS_AS(gridvec::make_grid_descriptor<2>(three, three), gridvec::arity_mismatch);
    REQUIRE_THROWS_AS(gridvec::make_grid_descriptor<1>(std::vector<int>{}, std::vector<int>{}), gridvec::arity_mismatch);
    REQUIRE_THROWS_AS(gridvec::make_grid_descriptor<2>(three, three), gridvec::binding_error);
}
