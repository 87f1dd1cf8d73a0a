#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "agentspace/core/errors.hpp"
#include "agentspace/core/types.hpp"
#include <string>
#include <unordered_set>

using namespace agentspace::core;
using Catch::Matchers::WithinAbs;

TEST_CASE("Cell operations", "[types]") {
    SECTION("Cell equality") {
        Cell c1{5, 10};
        Cell c2{5, 10};
        Cell c3{3, 10};
        Cell c4{5, 7};

        REQUIRE(c1 == c2);
        REQUIRE(c1 != c3);
        REQUIRE(c1 != c4);
    }

    SECTION("Cell comparison for sorting") {
        Cell c1{1, 1};
        Cell c2{1, 2};
        Cell c3{2, 1};

        REQUIRE(c1 < c2);
        REQUIRE(c1 < c3);
        REQUIRE(c2 < c3);
    }

    SECTION("Cell hash") {
        CellHash hasher;
        REQUIRE(hasher(Cell{5, 10}) == hasher(Cell{5, 10}));
        REQUIRE(hasher(Cell{5, 10}) != hasher(Cell{10, 5}));

        std::unordered_set<Cell, CellHash> cells{{0, 0}, {0, 1}, {0, 0}};
        REQUIRE(cells.size() == 2);
    }
}

TEST_CASE("Vec2 arithmetic", "[types]") {
    Vec2 a{3.0, 4.0};
    Vec2 b{1.0, -2.0};

    REQUIRE(a + b == Vec2{4.0, 2.0});
    REQUIRE(a - b == Vec2{2.0, 6.0});
    REQUIRE(a * 2.0 == Vec2{6.0, 8.0});
    REQUIRE(0.5 * a == Vec2{1.5, 2.0});
    REQUIRE(a / 2.0 == Vec2{1.5, 2.0});
    REQUIRE_THAT(norm(a), WithinAbs(5.0, 1e-12));

    SECTION("Normalize yields unit vectors") {
        Vec2 unit = normalize(a);
        REQUIRE_THAT(unit.x, WithinAbs(0.6, 1e-12));
        REQUIRE_THAT(unit.y, WithinAbs(0.8, 1e-12));
    }

    SECTION("Normalizing the zero vector stays finite") {
        Vec2 unit = normalize(Vec2{});
        REQUIRE(unit == Vec2{0.0, 0.0});
    }
}

TEST_CASE("Error messages name the offending agent or cell", "[types]") {
    OccupiedCellError occupied({2, 3}, 7);
    REQUIRE(occupied.occupant() == 7);
    REQUIRE(occupied.cell() == Cell{2, 3});
    REQUIRE(std::string(occupied.what()).find("(2,3)") != std::string::npos);

    NotFoundError missing(42);
    REQUIRE(missing.id() == 42);
    REQUIRE(std::string(missing.what()).find("42") != std::string::npos);

    CapacityExceededError full(100, 100);
    REQUIRE(full.capacity() == 100);

    // All of them are catchable as SpaceError
    REQUIRE_THROWS_AS(throw OutOfBoundsError({-1, 0}, 10, 10), SpaceError);
}
