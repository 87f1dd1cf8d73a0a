#include "agentspace/simulation.hpp"
#include "agentspace/adapters/straight_line_navigator.hpp"
#include <spdlog/spdlog.h>
#include <functional>
#include <stdexcept>

namespace agentspace {

std::optional<Scenario> parse_scenario(std::string_view name) {
    if (name == "flocking") return Scenario::Flocking;
    if (name == "segregation") return Scenario::Segregation;
    if (name == "outbreak") return Scenario::Outbreak;
    return std::nullopt;
}

std::string_view to_string(Scenario scenario) noexcept {
    switch (scenario) {
        case Scenario::Flocking:
            return "flocking";
        case Scenario::Segregation:
            return "segregation";
        case Scenario::Outbreak:
            return "outbreak";
    }
    return "unknown";
}

class Simulation::Runner {
public:
    virtual ~Runner() = default;

    virtual void step() = 0;
    virtual core::Tick tick() const = 0;
    virtual core::ScheduleOrder order() const = 0;
    virtual std::size_t live_agents() const = 0;
    virtual std::size_t observed() const = 0;
    virtual std::uint64_t last_relocations() const = 0;
    virtual const core::StoreCounters& counters() const = 0;
    virtual bool converged() const = 0;
};

namespace {

template<typename M>
class ModelRunner final : public Simulation::Runner {
public:
    using AgentRule = std::function<void(core::AgentId, M&)>;
    using TickRule = std::function<void(M&)>;
    using Observer = std::function<std::size_t(const M&)>;
    using Convergence = std::function<bool(const M&, std::uint64_t)>;

    ModelRunner(M model, core::ScheduleOrder order, AgentRule agent_rule, TickRule tick_rule,
                Observer observe, Convergence converged)
        : model_(std::move(model))
        , scheduler_(order)
        , agent_rule_(std::move(agent_rule))
        , tick_rule_(std::move(tick_rule))
        , observe_(std::move(observe))
        , converged_(std::move(converged)) {}

    void step() override {
        const auto before = model_.store().counters().relocated;
        scheduler_.step(model_, agent_rule_, tick_rule_);
        last_relocations_ = model_.store().counters().relocated - before;
    }

    core::Tick tick() const override { return model_.tick(); }
    core::ScheduleOrder order() const override { return scheduler_.order(); }
    std::size_t live_agents() const override { return model_.store().size(); }
    std::size_t observed() const override { return observe_(model_); }
    std::uint64_t last_relocations() const override { return last_relocations_; }
    const core::StoreCounters& counters() const override { return model_.store().counters(); }

    bool converged() const override {
        return model_.tick() > 0 && converged_(model_, last_relocations_);
    }

private:
    M model_;
    core::Scheduler scheduler_;
    AgentRule agent_rule_;
    TickRule tick_rule_;
    Observer observe_;
    Convergence converged_;
    std::uint64_t last_relocations_ = 0;
};

} // namespace

Simulation::Simulation(SimulationConfig config)
    : config_(std::move(config)) {
}

Simulation::~Simulation() = default;

std::unique_ptr<Simulation::Runner> Simulation::build_runner() const {
    switch (config_.scenario) {
        case Scenario::Flocking: {
            auto flocking = config_.flocking;
            if (config_.num_agents > 0) {
                flocking.n_birds = config_.num_agents;
            }
            return std::make_unique<ModelRunner<rules::FlockingModel>>(
                rules::make_flocking_model(flocking, config_.seed),
                rules::flocking_order,
                rules::flocking_step,
                core::NoTickRule{},
                [](const rules::FlockingModel& model) { return model.store().size(); },
                [](const rules::FlockingModel&, std::uint64_t) { return false; });
        }

        case Scenario::Segregation: {
            auto segregation = config_.segregation;
            if (config_.num_agents > 0) {
                segregation.grid_occupation = static_cast<double>(config_.num_agents) /
                    (static_cast<double>(segregation.width) * segregation.height);
            }
            return std::make_unique<ModelRunner<rules::SegregationModel>>(
                rules::make_segregation_model(segregation, config_.seed),
                rules::segregation_order,
                rules::segregation_step,
                core::NoTickRule{},
                rules::count_happy,
                // A tick without relocations is a fixed point
                [](const rules::SegregationModel&, std::uint64_t relocations) { return relocations == 0; });
        }

        case Scenario::Outbreak: {
            auto outbreak = config_.outbreak;
            if (config_.num_agents > 0) {
                outbreak.total_participants = config_.num_agents;
            }
            auto navigator = std::make_unique<adapters::StraightLineNavigator>(
                core::PlaneGeometry(outbreak.extent, outbreak.periodic));
            return std::make_unique<ModelRunner<rules::OutbreakModel>>(
                rules::make_outbreak_model(outbreak, std::move(navigator), config_.seed),
                rules::outbreak_order,
                rules::outbreak_step,
                rules::outbreak_tick,
                rules::count_zombies,
                [](const rules::OutbreakModel& model, std::uint64_t) {
                    return !model.store().empty() && rules::count_zombies(model) == model.store().size();
                });
        }
    }
    throw std::invalid_argument("Unknown scenario");
}

bool Simulation::initialize() {
    spdlog::info("Initializing {} simulation with seed {}", to_string(config_.scenario), config_.seed);

    try {
        runner_ = build_runner();
    } catch (const core::CapacityExceededError& e) {
        spdlog::error("Population does not fit: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Failed to build model: {}", e.what());
        return false;
    }

    metrics_collector_.reset();
    update_metrics();

    spdlog::info("Initialized {} agents, {} scheduling", runner_->live_agents(),
                 core::to_string(runner_->order()));
    initialized_ = true;
    return true;
}

bool Simulation::run() {
    if (!runner_) {
        spdlog::error("Simulation not initialized");
        return false;
    }

    spdlog::info("Starting simulation");
    metrics_collector_.start_timer();

    try {
        while (!is_complete()) {
            step();
        }
    } catch (const std::exception& e) {
        metrics_collector_.stop_timer();
        spdlog::error("Simulation stopped at tick {}: {}", runner_->tick(), e.what());
        return false;
    }

    metrics_collector_.stop_timer();
    update_metrics();

    if (runner_->converged()) {
        spdlog::info("Reached a stable state after {} ticks", runner_->tick());
    } else if (runner_->tick() >= config_.max_ticks) {
        spdlog::warn("Reached maximum ticks limit");
    }

    save_outputs();

    spdlog::info("Simulation completed in {} ticks", runner_->tick());
    return true;
}

void Simulation::step() {
    if (!initialized_) {
        if (!initialize()) {
            return;
        }
    }

    if (is_complete()) {
        return;
    }

    runner_->step();

    core::TickTrace trace;
    trace.tick = runner_->tick();
    trace.live_agents = runner_->live_agents();
    trace.relocations = runner_->last_relocations();
    trace.observed = runner_->observed();
    metrics_collector_.record_tick_trace(trace);

    if (config_.verbose) {
        spdlog::debug("Tick {}: {} agents, {} relocations, {} observed",
                      trace.tick, trace.live_agents, trace.relocations, trace.observed);
    }
}

void Simulation::reset() {
    if (!initialized_) {
        return;
    }

    initialized_ = false;
    runner_.reset();
    initialize();
}

bool Simulation::is_complete() const {
    if (!runner_) {
        return false;
    }

    return runner_->converged() || runner_->tick() >= config_.max_ticks;
}

core::Tick Simulation::get_current_tick() const {
    return runner_ ? runner_->tick() : 0;
}

void Simulation::update_metrics() {
    metrics_collector_.set_ticks(runner_->tick());
    metrics_collector_.record_store_counters(runner_->counters());
    metrics_collector_.set_population(runner_->live_agents(), runner_->observed());
}

void Simulation::save_outputs() {
    if (!config_.metrics_output.empty()) {
        try {
            core::emit_metrics_json(config_.metrics_output, metrics_collector_.get_snapshot());
            spdlog::info("Saved metrics to {}", config_.metrics_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save metrics: {}", e.what());
        }
    }

    if (!config_.trace_output.empty()) {
        try {
            core::emit_trace_csv(config_.trace_output, metrics_collector_.get_traces());
            spdlog::info("Saved trace to {}", config_.trace_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save trace: {}", e.what());
        }
    }
}

} // namespace agentspace
