#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "agentspace/adapters/road_graph_navigator.hpp"
#include "agentspace/adapters/straight_line_navigator.hpp"
#include "agentspace/rules/outbreak.hpp"
#include <algorithm>
#include <memory>

using namespace agentspace::core;
using namespace agentspace::rules;
using agentspace::adapters::RoadGraphNavigator;
using agentspace::adapters::StraightLineNavigator;
using Catch::Matchers::WithinAbs;

namespace {

// Outbreak already running, no participants yet
OutbreakModel make_active_model(agentspace::ports::NavigatorPtr navigator, std::uint64_t seed = 3) {
    OutbreakConfig config;
    config.countdown = 0;
    OutbreakState state{config, std::move(navigator), config.venue, 0, std::nullopt};
    return OutbreakModel(ContinuousSpace({config.extent, config.periodic, 0.1}), std::move(state), seed);
}

OutbreakModel make_active_model(std::uint64_t seed = 3) {
    OutbreakConfig config;
    return make_active_model(
        std::make_unique<StraightLineNavigator>(PlaneGeometry(config.extent, config.periodic)), seed);
}

Participant zombie_with(double speed, double vision) {
    Participant p;
    p.zombie = true;
    p.speed = speed;
    p.vision = vision;
    return p;
}

Participant human_with(double speed, double capacity) {
    Participant p;
    p.speed = speed;
    p.km_capacity = capacity;
    p.vision = 0.01;
    return p;
}

} // namespace

TEST_CASE("Zombie closes in and captures its prey", "[outbreak]") {
    auto model = make_active_model();
    AgentId hunter = model.add_agent(zombie_with(0.05, 0.8), {0.1, 0.1});
    AgentId prey = model.add_agent(human_with(0.0, 1.0), {0.4, 0.5});

    Scheduler scheduler(outbreak_order);
    auto hunter_only = [&](AgentId id, OutbreakModel& m) {
        if (id == hunter) {
            outbreak_step(id, m);
        }
    };

    const auto& nav = *model.properties().navigator;
    double last_distance = nav.distance(model.store().position(hunter), model.store().position(prey));

    int ticks = 0;
    while (!model.store().fields(prey).zombie && ticks < 20) {
        scheduler.step(model, hunter_only);
        ++ticks;

        double d = nav.distance(model.store().position(hunter), model.store().position(prey));
        REQUIRE(d <= last_distance);
        last_distance = d;
    }

    REQUIRE(model.store().fields(prey).zombie);
    REQUIRE(ticks <= 11);

    const auto& zombie = model.store().fields(hunter);
    const auto& victim = model.store().fields(prey);
    REQUIRE(!zombie.victim);
    REQUIRE(zombie.stay_still == 200);
    REQUIRE(victim.stay_still == 400);
    REQUIRE(count_zombies(model) == 2);
}

TEST_CASE("Zombie follows the road onto prey standing between nodes", "[outbreak][road]") {
    std::vector<Vec2> nodes = {{0.0, 0.5}, {1.0, 0.5}};
    std::vector<RoadGraphNavigator::Road> roads = {{0, 1}};
    auto model = make_active_model(std::make_unique<RoadGraphNavigator>(std::move(nodes), roads));

    AgentId hunter = model.add_agent(zombie_with(0.05, 0.8), {0.0, 0.5});
    AgentId prey = model.add_agent(human_with(0.0, 1.0), {0.5, 0.5});

    Scheduler scheduler(outbreak_order);
    auto hunter_only = [&](AgentId id, OutbreakModel& m) {
        if (id == hunter) {
            outbreak_step(id, m);
        }
    };

    const auto& nav = *model.properties().navigator;
    double last_distance = nav.distance(model.store().position(hunter), model.store().position(prey));

    int ticks = 0;
    while (!model.store().fields(prey).zombie && ticks < 50) {
        scheduler.step(model, hunter_only);
        ++ticks;

        double d = nav.distance(model.store().position(hunter), model.store().position(prey));
        REQUIRE(d < last_distance);
        last_distance = d;
    }

    REQUIRE(model.store().fields(prey).zombie);
    REQUIRE(ticks <= 12);
    REQUIRE(model.store().position(hunter) == Vec2{0.5, 0.5});
}

TEST_CASE("Prey selection", "[outbreak]") {
    auto model = make_active_model();
    AgentId hunter = model.add_agent(zombie_with(0.01, 0.3), {0.5, 0.5});

    SECTION("Nobody in sight") {
        model.add_agent(human_with(0.0, 1.0), {0.9, 0.9});
        REQUIRE(!nearest_prey(hunter, model));
    }

    SECTION("Equal distances go to the lower id") {
        AgentId first = model.add_agent(human_with(0.0, 1.0), {0.75, 0.5});
        model.add_agent(human_with(0.0, 1.0), {0.25, 0.5});
        REQUIRE(nearest_prey(hunter, model) == first);
    }

    SECTION("Zombies are not prey") {
        model.add_agent(zombie_with(0.0, 0.0), {0.55, 0.5});
        AgentId human = model.add_agent(human_with(0.0, 1.0), {0.7, 0.5});
        REQUIRE(nearest_prey(hunter, model) == human);
    }

    SECTION("A removed victim is dropped") {
        AgentId human = model.add_agent(human_with(0.0, 1.0), {0.6, 0.5});
        model.store().fields(hunter).victim = human;
        model.store().fields(hunter).speed = 0.0;
        model.store().remove(human);

        outbreak_step(hunter, model);
        REQUIRE(!model.store().fields(hunter).victim);
        REQUIRE(!model.properties().navigator->is_stationary(hunter));
    }
}

TEST_CASE("Humans flee and rest", "[outbreak]") {
    auto model = make_active_model();
    auto& nav = *model.properties().navigator;

    SECTION("A stationary human picks a destination") {
        AgentId human = model.add_agent(human_with(0.0, 1.0), {0.5, 0.5});
        REQUIRE(nav.is_stationary(human));
        outbreak_step(human, model);
        REQUIRE(!nav.is_stationary(human));
        REQUIRE(model.store().fields(human).km_travelled == 0.0);
    }

    SECTION("Running past capacity forces a rest") {
        AgentId human = model.add_agent(human_with(0.1, 0.0), {0.5, 0.5});
        outbreak_step(human, model);
        const auto& fields = model.store().fields(human);
        REQUIRE(fields.stay_still == model.properties().config.resting_time);
        REQUIRE(fields.km_travelled == 0.0);
    }

    SECTION("Resting agents wait") {
        Participant tired = human_with(0.1, 1.0);
        tired.stay_still = 2;
        AgentId human = model.add_agent(tired, {0.5, 0.5});

        outbreak_step(human, model);
        REQUIRE(model.store().fields(human).stay_still == 1);
        REQUIRE(model.store().position(human) == Vec2{0.5, 0.5});
        REQUIRE(nav.is_stationary(human));
    }
}

TEST_CASE("Countdown turns patient zero", "[outbreak][integration]") {
    OutbreakConfig config;
    config.total_participants = 10;
    config.countdown = 3;
    PlaneGeometry geometry(config.extent, config.periodic);

    auto model = make_outbreak_model(config, std::make_unique<StraightLineNavigator>(geometry), 21);
    REQUIRE(model.store().size() == 10);
    REQUIRE(model.properties().patient_zero == AgentId{1});
    REQUIRE(model.properties().venue == config.venue);

    Scheduler scheduler(outbreak_order);
    scheduler.run(model, 2, outbreak_step, outbreak_tick);
    REQUIRE(count_zombies(model) == 0);

    scheduler.step(model, outbreak_step, outbreak_tick);
    REQUIRE(model.properties().clock == 3);
    REQUIRE(count_zombies(model) == 1);
    REQUIRE(model.store().fields(1).zombie);

    SECTION("Patient zero is faster and sees less once turned") {
        const auto& zero = model.store().fields(1);
        REQUIRE(zero.speed <= 2.0 * config.max_speed);
        REQUIRE(zero.vision <= config.max_vision / 3.0 + 1e-12);
    }

    SECTION("Participants walk toward the venue before the outbreak") {
        auto fresh = make_outbreak_model(config, std::make_unique<StraightLineNavigator>(geometry), 21);
        AgentId id = 2;
        const auto& nav = *fresh.properties().navigator;
        double before = nav.distance(fresh.store().position(id), fresh.properties().venue);
        scheduler.step(fresh, outbreak_step, outbreak_tick);
        double after = nav.distance(fresh.store().position(id), fresh.properties().venue);
        REQUIRE(after <= before);
        REQUIRE_THAT(before - after, WithinAbs(std::min(before, fresh.store().fields(id).speed), 1e-9));
    }
}

TEST_CASE("Outbreak model rejects a missing navigator", "[outbreak]") {
    REQUIRE_THROWS_AS(make_outbreak_model(OutbreakConfig{}, nullptr, 1), std::invalid_argument);
}
