#pragma once

#include "agentspace/core/continuous_space.hpp"
#include "agentspace/core/model.hpp"
#include "agentspace/core/scheduler.hpp"
#include <cstdint>

namespace agentspace::rules {

struct Bird {
    core::Vec2 vel;
    double speed = 1.0;
};

struct FlockingConfig {
    int n_birds = 100;
    double speed = 1.0;
    double cohere_factor = 0.25;
    double separation = 4.0;
    double separate_factor = 0.25;
    double match_factor = 0.01;
    double visual_distance = 5.0;
    core::Vec2 extent{100.0, 100.0};
    bool periodic = true;
};

using FlockingModel = core::Model<core::ContinuousSpace, Bird, FlockingConfig>;

inline constexpr core::ScheduleOrder flocking_order = core::ScheduleOrder::Randomly;

// Birds at uniformly random positions with velocity components in [1, 2).
FlockingModel make_flocking_model(const FlockingConfig& config, std::uint64_t seed);

// Unit heading the bird adopts this tick: half its old velocity plus the
// cohesion, separation and alignment pulls of the birds it can see.
core::Vec2 flocking_heading(core::AgentId id, const FlockingModel& model);

void flocking_step(core::AgentId id, FlockingModel& model);

} // namespace agentspace::rules
