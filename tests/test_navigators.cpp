#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "agentspace/adapters/road_graph_navigator.hpp"
#include "agentspace/adapters/straight_line_navigator.hpp"
#include <stdexcept>

using namespace agentspace::core;
using agentspace::adapters::RoadGraphNavigator;
using agentspace::adapters::StraightLineNavigator;
using Catch::Matchers::WithinAbs;

namespace {

// 0 -- 1 -- 2 along the x axis, a long detour 0 -- 3 -- 2, and node 4 on its own
RoadGraphNavigator make_network() {
    std::vector<Vec2> nodes = {{0.0, 0.0}, {1.0, 0.0}, {2.0, 0.0}, {1.0, 3.0}, {5.0, 5.0}};
    std::vector<RoadGraphNavigator::Road> roads = {{0, 1}, {1, 2}, {0, 3}, {3, 2}};
    return RoadGraphNavigator(std::move(nodes), roads);
}

} // namespace

TEST_CASE("RoadGraphNavigator shortest paths", "[navigator][road]") {
    auto nav = make_network();

    REQUIRE(nav.node_count() == 5);
    REQUIRE(nav.shortest_path(0, 2) == std::vector<std::size_t>{0, 1, 2});
    REQUIRE(nav.shortest_path(2, 0) == std::vector<std::size_t>{2, 1, 0});
    REQUIRE(nav.shortest_path(1, 1) == std::vector<std::size_t>{1});
    REQUIRE(nav.shortest_path(0, 4).empty());
    REQUIRE_THROWS_AS(nav.shortest_path(0, 9), std::out_of_range);

    REQUIRE(nav.nearest_node_id({4.9, 5.2}) == 4);
    REQUIRE(nav.nearest_node({1.1, 2.6}) == Vec2{1.0, 3.0});
}

TEST_CASE("RoadGraphNavigator route following", "[navigator][road]") {
    auto nav = make_network();
    const AgentId agent = 1;

    REQUIRE(nav.is_stationary(agent));
    REQUIRE(nav.plan_route(agent, {0.1, 0.0}, {2.0, 0.0}));
    REQUIRE(!nav.is_stationary(agent));

    auto progress = nav.move_along_route(agent, {0.0, 0.0}, 0.5);
    REQUIRE_THAT(progress.pos.x, WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(progress.pos.y, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(progress.remaining, WithinAbs(0.0, 1e-12));
    REQUIRE(!nav.is_stationary(agent));

    progress = nav.move_along_route(agent, progress.pos, 2.0);
    REQUIRE(progress.pos == Vec2{2.0, 0.0});
    REQUIRE_THAT(progress.remaining, WithinAbs(0.5, 1e-12));
    REQUIRE(nav.is_stationary(agent));

    SECTION("Stationary agents do not move") {
        auto idle = nav.move_along_route(agent, {2.0, 0.0}, 1.0);
        REQUIRE(idle.pos == Vec2{2.0, 0.0});
        REQUIRE(idle.remaining == 1.0);
    }

    SECTION("Unreachable destinations leave no route") {
        REQUIRE(!nav.plan_route(agent, {0.0, 0.0}, {5.0, 5.0}));
        REQUIRE(nav.is_stationary(agent));
    }

    SECTION("Random routes only pick reachable nodes") {
        Rng rng(11);
        for (int i = 0; i < 20; ++i) {
            REQUIRE(nav.plan_random_route(agent, {0.0, 0.0}, rng));
            nav.forget(agent);
        }
    }
}

TEST_CASE("RoadGraphNavigator routes end on the destination", "[navigator][road]") {
    auto nav = make_network();
    const AgentId agent = 2;

    SECTION("Destination between two nodes") {
        REQUIRE(nav.plan_route(agent, {0.0, 0.0}, {1.4, 0.0}));
        auto progress = nav.move_along_route(agent, {0.0, 0.0}, 5.0);
        REQUIRE(progress.pos == Vec2{1.4, 0.0});
        REQUIRE_THAT(progress.remaining, WithinAbs(3.6, 1e-12));
        REQUIRE(nav.is_stationary(agent));
    }

    SECTION("Origin and destination share their nearest node") {
        REQUIRE(nav.plan_route(agent, {0.0, 0.0}, {0.3, 0.0}));
        auto progress = nav.move_along_route(agent, {0.0, 0.0}, 0.1);
        REQUIRE_THAT(progress.pos.x, WithinAbs(0.1, 1e-12));
        REQUIRE(!nav.is_stationary(agent));

        progress = nav.move_along_route(agent, progress.pos, 1.0);
        REQUIRE(progress.pos == Vec2{0.3, 0.0});
        REQUIRE(nav.is_stationary(agent));
    }
}

TEST_CASE("RoadGraphNavigator rejects malformed networks", "[navigator][road]") {
    REQUIRE_THROWS_AS(RoadGraphNavigator({}, {}), std::invalid_argument);
    REQUIRE_THROWS_AS(RoadGraphNavigator({{0.0, 0.0}}, {{0, 1}}), std::invalid_argument);
}

TEST_CASE("StraightLineNavigator", "[navigator][straight]") {
    const AgentId agent = 7;

    SECTION("Moves along the segment and snaps onto the destination") {
        StraightLineNavigator nav(PlaneGeometry({10.0, 10.0}, false));
        REQUIRE(nav.plan_route(agent, {0.0, 0.0}, {3.0, 4.0}));

        auto progress = nav.move_along_route(agent, {0.0, 0.0}, 2.0);
        REQUIRE_THAT(progress.pos.x, WithinAbs(1.2, 1e-12));
        REQUIRE_THAT(progress.pos.y, WithinAbs(1.6, 1e-12));
        REQUIRE(progress.remaining == 0.0);
        REQUIRE(!nav.is_stationary(agent));

        progress = nav.move_along_route(agent, progress.pos, 10.0);
        REQUIRE(progress.pos == Vec2{3.0, 4.0});
        REQUIRE_THAT(progress.remaining, WithinAbs(7.0, 1e-9));
        REQUIRE(nav.is_stationary(agent));
    }

    SECTION("Takes the short way across a periodic seam") {
        StraightLineNavigator nav(PlaneGeometry({10.0, 10.0}, true));
        REQUIRE_THAT(nav.distance({9.0, 5.0}, {1.0, 5.0}), WithinAbs(2.0, 1e-12));

        nav.plan_route(agent, {9.0, 5.0}, {1.0, 5.0});
        auto progress = nav.move_along_route(agent, {9.0, 5.0}, 1.5);
        REQUIRE_THAT(progress.pos.x, WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(progress.pos.y, WithinAbs(5.0, 1e-12));
    }

    SECTION("Random routes stay inside the plane") {
        StraightLineNavigator nav(PlaneGeometry({2.0, 3.0}, false));
        Rng rng(5);
        REQUIRE(nav.plan_random_route(agent, {1.0, 1.0}, rng));
        auto progress = nav.move_along_route(agent, {1.0, 1.0}, 100.0);
        REQUIRE(progress.pos.x >= 0.0);
        REQUIRE(progress.pos.x <= 2.0);
        REQUIRE(progress.pos.y >= 0.0);
        REQUIRE(progress.pos.y <= 3.0);
        REQUIRE(nav.is_stationary(agent));
    }

    SECTION("forget drops the route") {
        StraightLineNavigator nav(PlaneGeometry({10.0, 10.0}, false));
        nav.plan_route(agent, {0.0, 0.0}, {5.0, 5.0});
        nav.forget(agent);
        REQUIRE(nav.is_stationary(agent));
        REQUIRE(nav.nearest_node({12.0, -1.0}) == Vec2{10.0, 0.0});
    }
}
