#pragma once

#include "agentspace/core/grid_space.hpp"
#include "agentspace/core/model.hpp"
#include "agentspace/core/scheduler.hpp"
#include <cstddef>
#include <cstdint>

namespace agentspace::rules {

struct Resident {
    int group = 0;
    bool happy = false;
};

struct SegregationConfig {
    int width = 30;
    int height = 30;
    int min_to_be_happy = 3;
    double grid_occupation = 0.8;
    bool periodic = false;
    int max_placement_attempts = 1000;
};

using SegregationModel = core::Model<core::GridSpace, Resident, SegregationConfig>;

inline constexpr core::ScheduleOrder segregation_order = core::ScheduleOrder::ById;

// Fills width*height*grid_occupation random empty cells, the first half of
// the residents in group 1 and the rest in group 2. Occupations of 1.0 and
// above leave unhappy residents nowhere to go and raise CapacityExceededError.
SegregationModel make_segregation_model(const SegregationConfig& config, std::uint64_t seed);

int same_group_neighbors(core::AgentId id, const SegregationModel& model);

// Happy once enough Moore neighbors share the group, otherwise moves to a
// random empty cell.
void segregation_step(core::AgentId id, SegregationModel& model);

std::size_t count_happy(const SegregationModel& model);

} // namespace agentspace::rules
