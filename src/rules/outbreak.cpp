#include "agentspace/rules/outbreak.hpp"
#include "agentspace/core/introspection.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace agentspace::rules {

namespace {

// Moves the agent along its route and returns the unspent budget.
double advance(core::AgentId id, OutbreakModel& model, double budget) {
    auto& store = model.store();
    auto progress = model.properties().navigator->move_along_route(id, store.position(id), budget);
    store.relocate(id, progress.pos);
    return progress.remaining;
}

bool is_prey(core::AgentId id, const OutbreakModel& model) {
    return model.store().contains(id) && !model.store().fields(id).zombie;
}

// Starts a random route if the agent has none. False when no route could be planned.
bool ensure_route(core::AgentId id, OutbreakModel& model) {
    auto& navigator = *model.properties().navigator;
    if (!navigator.is_stationary(id)) {
        return true;
    }
    if (navigator.plan_random_route(id, model.store().position(id), model.rng())) {
        return true;
    }
    spdlog::debug("Agent {} has nowhere to go this tick", id);
    return false;
}

void hunter_mode(core::AgentId id, OutbreakModel& model) {
    auto& state = model.properties();
    auto& navigator = *state.navigator;
    auto& store = model.store();
    auto& zombie = store.fields(id);

    if (!zombie.victim) {
        zombie.victim = nearest_prey(id, model);
    }

    if (zombie.victim && is_prey(*zombie.victim, model) &&
        navigator.plan_route(id, store.position(id), store.position(*zombie.victim))) {
        const core::AgentId victim_id = *zombie.victim;
        advance(id, model, zombie.speed);

        if (navigator.distance(store.position(id), store.position(victim_id)) <= state.config.capture_distance) {
            auto& victim = store.fields(victim_id);
            turn_to_zombie(victim);
            zombie.victim.reset();
            initiate_resting(zombie, state.config.resting_time, 0.5);
            initiate_resting(victim, state.config.resting_time, 1.0);
            navigator.forget(victim_id);
            spdlog::debug("Agent {} infected agent {} at tick {}", id, victim_id, model.tick());
        }
        return;
    }

    // Lost the target, or never had one: wander
    zombie.victim.reset();
    if (ensure_route(id, model)) {
        advance(id, model, zombie.speed);
    }
}

void hunted_mode(core::AgentId id, OutbreakModel& model) {
    auto& human = model.store().fields(id);

    if (!ensure_route(id, model)) {
        return;
    }

    double remaining = advance(id, model, human.speed);
    human.km_travelled += human.speed - remaining;

    if (human.km_travelled > human.km_capacity) {
        initiate_resting(human, model.properties().config.resting_time);
        human.km_travelled = 0.0;
    }
}

} // namespace

OutbreakModel make_outbreak_model(const OutbreakConfig& config, ports::NavigatorPtr navigator,
                                  std::uint64_t seed) {
    if (!navigator) {
        throw std::invalid_argument("Outbreak model needs a navigator");
    }
    if (config.total_participants < 0) {
        throw std::invalid_argument("Number of participants must not be negative");
    }

    const double spacing = config.max_vision > 0.0 ? config.max_vision : config.extent.x;
    core::ContinuousSpace space({config.extent, config.periodic, spacing});

    OutbreakModel model(std::move(space), OutbreakState{config, std::move(navigator), {}, 0, std::nullopt}, seed);
    auto& state = model.properties();
    auto& nav = *state.navigator;
    state.venue = nav.nearest_node(config.venue);

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (int i = 0; i < config.total_participants; ++i) {
        Participant participant;
        participant.speed = config.max_speed * (0.5 * unit(model.rng()) + 0.5);
        participant.vision = config.max_vision * (0.5 * unit(model.rng()) + 0.5);
        participant.km_capacity = config.max_capacity * (0.75 * unit(model.rng()) + 0.25);

        const core::AgentId id = model.add_agent(participant);

        // Some start positions have no connection to the venue; try elsewhere
        int attempts = 1;
        while (!nav.plan_route(id, model.store().position(id), state.venue)) {
            if (attempts >= config.max_route_attempts) {
                throw std::runtime_error("No start position with a route to the venue found for agent " +
                                         std::to_string(id));
            }
            model.store().relocate(id, model.space().random_position(model.rng()));
            ++attempts;
        }

        if (!state.patient_zero) {
            state.patient_zero = id;
        }
    }

    spdlog::info("Outbreak model: {} participants heading to {}, countdown {}, seed {}",
                 config.total_participants, core::to_string(state.venue), config.countdown, seed);
    return model;
}

void turn_to_zombie(Participant& participant) {
    participant.zombie = true;
    participant.vision /= 3.0;
    participant.speed *= 2.0;
}

void initiate_resting(Participant& participant, int resting_time, double factor) {
    participant.stay_still = static_cast<int>(std::lround(resting_time * factor));
}

void outbreak_step(core::AgentId id, OutbreakModel& model) {
    auto& participant = model.store().fields(id);

    if (model.properties().clock < model.properties().config.countdown) {
        advance(id, model, participant.speed);
        return;
    }

    if (participant.stay_still > 0) {
        --participant.stay_still;
        return;
    }

    if (participant.zombie) {
        hunter_mode(id, model);
    } else {
        hunted_mode(id, model);
    }
}

void outbreak_tick(OutbreakModel& model) {
    auto& state = model.properties();
    ++state.clock;

    if (state.clock == state.config.countdown && state.patient_zero &&
        model.store().contains(*state.patient_zero)) {
        turn_to_zombie(model.store().fields(*state.patient_zero));
        spdlog::info("Agent {} turned at tick {}", *state.patient_zero, model.tick());
    }
}

std::optional<core::AgentId> nearest_prey(core::AgentId hunter, const OutbreakModel& model) {
    const auto& store = model.store();
    const auto& navigator = *model.properties().navigator;
    const auto& zombie = store.get(hunter);

    auto candidates = model.space().query_radius(zombie.pos, zombie.fields.vision, hunter);
    std::sort(candidates.begin(), candidates.end());

    std::optional<core::AgentId> best;
    double best_distance = std::numeric_limits<double>::infinity();
    for (core::AgentId candidate : candidates) {
        if (store.fields(candidate).zombie) {
            continue;
        }
        double d = navigator.distance(zombie.pos, store.position(candidate));
        if (d < best_distance) {
            best_distance = d;
            best = candidate;
        }
    }
    return best;
}

std::size_t count_zombies(const OutbreakModel& model) {
    return core::count_agents(model, &Participant::zombie);
}

} // namespace agentspace::rules
