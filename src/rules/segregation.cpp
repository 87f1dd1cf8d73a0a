#include "agentspace/rules/segregation.hpp"
#include "agentspace/core/introspection.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace agentspace::rules {

SegregationModel make_segregation_model(const SegregationConfig& config, std::uint64_t seed) {
    if (config.grid_occupation < 0.0) {
        throw std::invalid_argument("grid_occupation must not be negative");
    }

    core::GridSpace space({config.width, config.height, config.periodic, config.max_placement_attempts});
    const std::size_t capacity = space.capacity();
    const auto n_agents = static_cast<std::size_t>(capacity * config.grid_occupation + 1e-9);

    if (n_agents >= capacity) {
        throw core::CapacityExceededError(n_agents, capacity);
    }

    SegregationModel model(std::move(space), config, seed);
    for (std::size_t n = 0; n < n_agents; ++n) {
        int group = 2 * n < n_agents ? 1 : 2;
        model.add_agent(Resident{group, false});
    }

    spdlog::info("Segregation model: {} residents on {}x{} grid, threshold {}, seed {}",
                 n_agents, config.width, config.height, config.min_to_be_happy, seed);
    return model;
}

int same_group_neighbors(core::AgentId id, const SegregationModel& model) {
    const auto& store = model.store();
    const auto& resident = store.get(id);

    int same = 0;
    for (core::AgentId neighbor : model.space().query_moore_neighbors(resident.pos)) {
        if (store.fields(neighbor).group == resident.fields.group) {
            ++same;
        }
    }
    return same;
}

void segregation_step(core::AgentId id, SegregationModel& model) {
    if (same_group_neighbors(id, model) >= model.properties().min_to_be_happy) {
        model.store().set_field(id, &Resident::happy, true);
        return;
    }

    model.store().relocate(id, model.space().random_empty_cell(model.rng()));
}

std::size_t count_happy(const SegregationModel& model) {
    return core::count_agents(model, &Resident::happy);
}

} // namespace agentspace::rules
