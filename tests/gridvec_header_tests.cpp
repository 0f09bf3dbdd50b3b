#include <gridvec/gridvec.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace {

struct index_collector {
    std::vector<int> *values;

    void operator()(int x) const { values->push_back(x); }
};

}// namespace

TEST_CASE("gridvec umbrella header exposes static materialization", "[gridvec][header]") {
    const gridvec::grid_descriptor<2> grid({ 10, 20 }, { 2, 3 });

    REQUIRE(gridvec::materialize<std::array<int, 2>>(grid, { 0, 1 }) == std::array<int, 2>{ 10, 23 });
    REQUIRE(gridvec::materialize<gridvec::vector<int, 2>>(grid, { 0, 1 }) == gridvec::vector<int, 2>{ { 23, 10 } });
}

TEST_CASE("gridvec umbrella header exposes the vectorization resolver", "[gridvec][header]") {
    STATIC_REQUIRE(gridvec::is_vectorizable_v<std::array<int, 3>, gridvec::wildcard_dim>);
    STATIC_REQUIRE_FALSE(gridvec::is_vectorizable_v<int, 2>);
}

TEST_CASE("gridvec umbrella header exposes run-time binding", "[gridvec][header]") {
    const auto binding =
      gridvec::bind_grid(gridvec::describe<gridvec::vector<int, 2>>(), gridvec::wildcard_dim, { 10, 20 }, { 2, 3 });
    const auto value = gridvec::materialize(binding, gridvec::dynamic_coord{ 0, 1 });

    REQUIRE(value.as<gridvec::vector<int, 2>>() == gridvec::vector<int, 2>{ { 23, 10 } });
    REQUIRE_THROWS_AS(gridvec::bind(gridvec::describe<int>(), 2), gridvec::unsupported_vectorization);
}

TEST_CASE("gridvec umbrella header exposes launch", "[gridvec][header]") {
    std::vector<int> values;
    gridvec::launch(gridvec::call_shape<1>{ 3 }, index_collector{ &values }, gridvec::grid_argument<int>({ 5 }, { 4 }));

    REQUIRE(values == std::vector<int>{ 5, 9, 13 });
}

TEST_CASE("gridvec umbrella header leaves no helper macros behind", "[gridvec][header]") {
#ifdef GRIDVEC_FORCEINLINE
    FAIL("GRIDVEC_FORCEINLINE leaked out of the umbrella header");
#endif
#ifdef GRIDVEC_UNREACHABLE
    FAIL("GRIDVEC_UNREACHABLE leaked out of the umbrella header");
#endif
    REQUIRE(gridvec::max_grid_dims == GRIDVEC_MAX_DIMS);
}
