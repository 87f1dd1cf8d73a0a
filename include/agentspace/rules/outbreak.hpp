#pragma once

#include "agentspace/core/continuous_space.hpp"
#include "agentspace/core/model.hpp"
#include "agentspace/core/scheduler.hpp"
#include "agentspace/ports/navigator.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace agentspace::rules {

struct Participant {
    bool zombie = false;
    double speed = 0.0;         // distance per tick
    double vision = 0.0;        // radius within which prey is spotted
    int stay_still = 0;         // ticks left to rest
    double km_travelled = 0.0;  // distance run since the last rest
    double km_capacity = 0.0;   // distance that can be run before resting
    std::optional<core::AgentId> victim;
};

struct OutbreakConfig {
    int total_participants = 50;
    double max_speed = 0.005;
    double max_vision = 0.02;
    double max_capacity = 2.0;
    int resting_time = 400;
    int countdown = 1500;
    double capture_distance = 0.0;
    core::Vec2 extent{1.0, 1.0};
    bool periodic = false;
    core::Vec2 venue{0.5, 0.5};
    int max_route_attempts = 100;
};

struct OutbreakState {
    OutbreakConfig config;
    ports::NavigatorPtr navigator;
    core::Vec2 venue;
    int clock = 0;
    std::optional<core::AgentId> patient_zero;
};

using OutbreakModel = core::Model<core::ContinuousSpace, Participant, OutbreakState>;

inline constexpr core::ScheduleOrder outbreak_order = core::ScheduleOrder::ById;

// Participants start at random positions with a route to the venue; the
// first one created carries the infection.
OutbreakModel make_outbreak_model(const OutbreakConfig& config, ports::NavigatorPtr navigator,
                                  std::uint64_t seed);

void turn_to_zombie(Participant& participant);
void initiate_resting(Participant& participant, int resting_time, double factor = 1.0);

// Before the countdown everyone walks to the venue. Afterwards resting
// agents wait, zombies hunt and humans flee.
void outbreak_step(core::AgentId id, OutbreakModel& model);
// Advances the outbreak clock and infects patient zero when it hits the countdown.
void outbreak_tick(OutbreakModel& model);

// Closest human within the hunter's vision; ties go to the lower id.
std::optional<core::AgentId> nearest_prey(core::AgentId hunter, const OutbreakModel& model);

std::size_t count_zombies(const OutbreakModel& model);

} // namespace agentspace::rules
