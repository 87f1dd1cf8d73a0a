#include "agentspace/rules/flocking.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace agentspace::rules {

FlockingModel make_flocking_model(const FlockingConfig& config, std::uint64_t seed) {
    if (config.n_birds < 0) {
        throw std::invalid_argument("Number of birds must not be negative");
    }
    if (!(config.visual_distance > 0.0)) {
        throw std::invalid_argument("visual_distance must be positive");
    }

    core::ContinuousSpace space({config.extent, config.periodic, config.visual_distance / 1.5});
    FlockingModel model(std::move(space), config, seed);

    std::uniform_real_distribution<double> component(0.0, 1.0);
    for (int i = 0; i < config.n_birds; ++i) {
        double vx = component(model.rng()) + 1.0;
        double vy = component(model.rng()) + 1.0;
        model.add_agent(Bird{{vx, vy}, config.speed});
    }

    spdlog::info("Flocking model: {} birds in {}x{} ({}), seed {}",
                 config.n_birds, config.extent.x, config.extent.y,
                 config.periodic ? "periodic" : "bounded", seed);
    return model;
}

core::Vec2 flocking_heading(core::AgentId id, const FlockingModel& model) {
    const auto& config = model.properties();
    const auto& store = model.store();
    const auto& space = model.space();
    const auto& bird = store.get(id);

    core::Vec2 cohere;
    core::Vec2 separate;
    core::Vec2 match;

    auto neighbors = space.query_radius(bird.pos, config.visual_distance, id);
    for (core::AgentId other_id : neighbors) {
        const auto& other = store.get(other_id);
        const core::Vec2 heading = space.displacement(bird.pos, other.pos);

        cohere += heading;
        if (space.distance(bird.pos, other.pos) < config.separation) {
            separate -= heading;
        }
        match += other.fields.vel;
    }

    // No neighbors leaves all three pulls at zero
    const double n = static_cast<double>(std::max<std::size_t>(neighbors.size(), 1));
    cohere = cohere / n * config.cohere_factor;
    separate = separate / n * config.separate_factor;
    match = match / n * config.match_factor;

    return core::normalize((bird.fields.vel + cohere + separate + match) * 0.5);
}

void flocking_step(core::AgentId id, FlockingModel& model) {
    const core::Vec2 heading = flocking_heading(id, model);

    auto& store = model.store();
    auto& bird = store.fields(id);
    bird.vel = heading;
    store.relocate(id, store.position(id) + heading * bird.speed);
}

} // namespace agentspace::rules
