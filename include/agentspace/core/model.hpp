#pragma once

#include "agentspace/core/agent_store.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace agentspace::core {

enum class ModelPhase {
    Idle,
    Stepping
};

/**
 * Everything a simulation step may touch: agents, their space, model-level
 * properties, the random stream and the tick counter. Rules receive the
 * model by reference; there is no other shared state.
 */
template<SpatialIndexImpl Space, typename Fields, typename Properties>
class Model {
public:
    using Store = AgentStore<Space, Fields>;
    using Position = typename Space::Position;
    using SpaceType = Space;
    using FieldsType = Fields;
    using PropertiesType = Properties;

    Model(Space space, Properties properties, std::uint64_t seed)
        : store_(std::move(space))
        , properties_(std::move(properties))
        , rng_(seed)
        , seed_(seed) {}

    Store& store() noexcept { return store_; }
    const Store& store() const noexcept { return store_; }
    const Space& space() const noexcept { return store_.space(); }

    Properties& properties() noexcept { return properties_; }
    const Properties& properties() const noexcept { return properties_; }

    Rng& rng() noexcept { return rng_; }
    std::uint64_t seed() const noexcept { return seed_; }

    Tick tick() const noexcept { return tick_; }
    ModelPhase phase() const noexcept { return phase_; }
    bool stepping() const noexcept { return phase_ == ModelPhase::Stepping; }

    AgentId add_agent(Fields fields, const Position& pos) {
        return store_.create(std::move(fields), pos);
    }

    // Places the agent at a random position; on a grid, a random empty cell.
    AgentId add_agent(Fields fields) {
        return store_.create(std::move(fields), space().random_position(rng_));
    }

    // Tick state machine, driven by the Scheduler
    void begin_tick() {
        if (phase_ == ModelPhase::Stepping) {
            throw std::logic_error("A tick is already in progress");
        }
        phase_ = ModelPhase::Stepping;
    }

    void finish_tick() noexcept {
        phase_ = ModelPhase::Idle;
        ++tick_;
    }

    void abort_tick() noexcept { phase_ = ModelPhase::Idle; }

    void require_quiescent(const std::string& operation) const {
        if (phase_ != ModelPhase::Idle) {
            throw std::logic_error(operation + " is only allowed between ticks");
        }
    }

private:
    Store store_;
    Properties properties_;
    Rng rng_;
    std::uint64_t seed_;
    Tick tick_ = 0;
    ModelPhase phase_ = ModelPhase::Idle;
};

} // namespace agentspace::core
