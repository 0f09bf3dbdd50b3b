#include <gridvec/core/materialize.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace {
using gridvec::can_materialize_v;
using gridvec::grid_descriptor;
using gridvec::invocation_coord;
using gridvec::materialize;
using gridvec::vector;

// std::array comparison is not constexpr before C++20.
template<typename T, std::size_t N>
constexpr auto same_components(const std::array<T, N> &lhs, const std::array<T, N> &rhs) -> bool {
    for (std::size_t i = 0; i < N; ++i) {
        if (lhs[i] != rhs[i]) { return false; }
    }
    return true;
}

constexpr grid_descriptor<2> kPlane({ 10, 20 }, { 2, 3 });
constexpr invocation_coord<2> kPlaneCoord = { 0, 1 };
constexpr grid_descriptor<1> kLine({ 5 }, { 4 });
constexpr invocation_coord<1> kLineCoord = { 3 };

// offset=[10,20], stride=[2,3], t=[0,1]
static_assert(same_components(materialize<std::array<int, 2>>(kPlane, kPlaneCoord), std::array<int, 2>{ 10, 23 }),
  "array materialization keeps index order");
static_assert(materialize<vector<int, 2>>(kPlane, kPlaneCoord) == vector<int, 2>{ { 23, 10 } },
  "vector materialization reverses index order");
static_assert(!can_materialize_v<int, 2>, "scalar materialization is rejected for two-dimensional grids");

// offset=[5], stride=[4], t=[3]
static_assert(materialize<int>(kLine, kLineCoord) == 17, "scalar materialization of a one-dimensional grid");
static_assert(same_components(materialize<std::array<int, 1>>(kLine, kLineCoord), std::array<int, 1>{ 17 }),
  "array materialization of a one-dimensional grid");
static_assert(materialize<vector<int, 1>>(kLine, kLineCoord) == vector<int, 1>{ { 17 } },
  "one-component vectors equal one-component arrays");

static_assert(can_materialize_v<std::array<float, 3>, 3>, "arrays of the grid dimension are legal");
static_assert(can_materialize_v<vector<std::uint16_t, 4>, 4>, "vectors of the grid dimension are legal");
static_assert(can_materialize_v<double, 1>, "floating point scalars are legal on one-dimensional grids");
static_assert(!can_materialize_v<std::array<int, 2>, 3>, "array dimension must equal the grid dimension");
static_assert(!can_materialize_v<vector<int, 3>, 2>, "vector dimension must equal the grid dimension");
static_assert(!can_materialize_v<int, 3>, "scalars need a one-dimensional grid");
static_assert(!can_materialize_v<bool, 1>, "bool is not a numeric representation");

static_assert(std::is_same_v<decltype(materialize<vector<short, 3>>(grid_descriptor<3>::identity(), {})), vector<short, 3>>,
  "materialize returns the destination type");
static_assert(std::is_same_v<decltype(materialize<const int>(kLine, kLineCoord)), int>, "cv-qualifiers are dropped");
static_assert(materialize<const int>(kLine, kLineCoord) == 17, "const scalar destinations materialize");
static_assert(same_components(materialize<const std::array<int, 2>>(kPlane, kPlaneCoord), std::array<int, 2>{ 10, 23 }),
  "const array destinations materialize");
static_assert(can_materialize_v<const volatile double, 1>, "cv-qualified destinations are legal");
static_assert(gridvec::wildcard_dim == -1, "the wildcard sentinel comes with the shape vocabulary");

}// namespace

TEST_CASE("array materialization yields offset + t * stride in index order", "[materialize][array]") {
    const grid_descriptor<3> grid({ -7, 0, 1000 }, { 3, -2, 11 });

    for (std::uint32_t x = 0; x < 5; ++x) {
        for (std::uint32_t y = 0; y < 5; ++y) {
            for (std::uint32_t z = 0; z < 5; ++z) {
                const invocation_coord<3> t = { x, y, z };
                const auto out = materialize<std::array<int, 3>>(grid, t);
                REQUIRE(out[0] == -7 + static_cast<int>(x) * 3);
                REQUIRE(out[1] == 0 - static_cast<int>(y) * 2);
                REQUIRE(out[2] == 1000 + static_cast<int>(z) * 11);
            }
        }
    }
}

// The vector layout is deliberately the transpose of the array layout:
// vector[0] carries the LAST grid dimension. Do not "fix" this ordering.
TEST_CASE("vector materialization is the exact index reversal of array materialization", "[materialize][vector]") {
    const grid_descriptor<4> grid({ 1, 2, 3, 4 }, { 10, -20, 30, 0 });

    for (std::uint32_t x = 0; x < 3; ++x) {
        for (std::uint32_t w = 0; w < 3; ++w) {
            const invocation_coord<4> t = { x, w, x + w, 7 };
            const auto as_array = materialize<std::array<long long, 4>>(grid, t);
            const auto as_vector = materialize<vector<long long, 4>>(grid, t);
            for (std::size_t i = 0; i < 4; ++i) { REQUIRE(as_vector[i] == as_array[4 - 1 - i]); }
        }
    }
}

TEST_CASE("concrete two-dimensional scenario", "[materialize][scenario]") {
    const auto as_array = materialize<std::array<int, 2>>(kPlane, kPlaneCoord);
    const auto as_vector = materialize<vector<int, 2>>(kPlane, kPlaneCoord);

    REQUIRE(as_array == std::array<int, 2>{ 10, 23 });
    REQUIRE(as_vector[0] == 23);
    REQUIRE(as_vector[1] == 10);
    STATIC_REQUIRE_FALSE(can_materialize_v<int, 2>);
}

TEST_CASE("concrete one-dimensional scenario", "[materialize][scenario]") {
    REQUIRE(materialize<int>(kLine, kLineCoord) == 17);
    REQUIRE(materialize<std::array<int, 1>>(kLine, kLineCoord) == std::array<int, 1>{ 17 });
}

TEST_CASE("load writes into an existing destination", "[materialize][load]") {
    std::array<unsigned, 2> out = { 99, 99 };
    gridvec::load(kPlane, invocation_coord<2>{ 4, 4 }, out);
    REQUIRE(out == std::array<unsigned, 2>{ 18, 32 });

    double scalar = -1.0;
    gridvec::load(kLine, invocation_coord<1>{ 2 }, scalar);
    REQUIRE(scalar == 13.0);
}

TEST_CASE("narrowing casts truncate instead of saturating", "[materialize][cast]") {
    const grid_descriptor<2> grid({ 250, -1 }, { 50, 0 });
    const invocation_coord<2> t = { 1, 0 };

    // 300 wraps to 44 in eight bits, -1 wraps to 255.
    const auto u8 = materialize<std::array<std::uint8_t, 2>>(grid, t);
    REQUIRE(u8[0] == 44);
    REQUIRE(u8[1] == 255);

    const auto i8 = materialize<std::array<std::int8_t, 2>>(grid, t);
    REQUIRE(i8[0] == 44);
    REQUIRE(i8[1] == -1);

    const auto u32 = materialize<vector<std::uint32_t, 2>>(grid, t);
    REQUIRE(u32[0] == 0xFFFFFFFFU);
    REQUIRE(u32[1] == 300U);
}

TEST_CASE("floating point destinations receive the exact integer value", "[materialize][cast]") {
    const grid_descriptor<2> grid({ -3, 1 }, { 2, 1000 });
    const auto out = materialize<vector<float, 2>>(grid, invocation_coord<2>{ 5, 2 });

    REQUIRE(out[0] == 2001.0F);
    REQUIRE(out[1] == 7.0F);
}

TEST_CASE("negative strides iterate in reverse", "[materialize][stride]") {
    const grid_descriptor<1> grid({ 9 }, { -1 });

    for (std::uint32_t x = 0; x < 10; ++x) {
        REQUIRE(materialize<int>(grid, invocation_coord<1>{ x }) == 9 - static_cast<int>(x));
    }
}

TEST_CASE("broadcast strides keep every dimension but one constant", "[materialize][stride]") {
    const grid_descriptor<3> grid({ 4, 5, 6 }, { 0, 1, 0 });

    for (std::uint32_t x = 0; x < 3; ++x) {
        const auto out = materialize<std::array<int, 3>>(grid, invocation_coord<3>{ x, x, x });
        REQUIRE(out == std::array<int, 3>{ 4, 5 + static_cast<int>(x), 6 });
    }
}
