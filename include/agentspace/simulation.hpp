#pragma once

#include "agentspace/core/metrics.hpp"
#include "agentspace/rules/flocking.hpp"
#include "agentspace/rules/outbreak.hpp"
#include "agentspace/rules/segregation.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace agentspace {

enum class Scenario {
    Flocking,
    Segregation,
    Outbreak
};

std::optional<Scenario> parse_scenario(std::string_view name);
std::string_view to_string(Scenario scenario) noexcept;

struct SimulationConfig {
    Scenario scenario = Scenario::Segregation;
    int num_agents = 0;  // 0 keeps the population configured for the scenario
    uint64_t seed = 42;
    int max_ticks = 100;
    std::filesystem::path trace_output;
    std::filesystem::path metrics_output;
    bool verbose = false;

    rules::FlockingConfig flocking;
    rules::SegregationConfig segregation;
    rules::OutbreakConfig outbreak;
};

class Simulation {
public:
    explicit Simulation(SimulationConfig config);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    bool initialize();
    bool run();

    void step();
    void reset();
    bool is_complete() const;
    core::Tick get_current_tick() const;

    core::MetricsSnapshot get_metrics() const { return metrics_collector_.get_snapshot(); }
    std::vector<core::TickTrace> get_traces() const { return metrics_collector_.get_traces(); }
    const SimulationConfig& config() const noexcept { return config_; }

    // Type-erased scenario model and its rules
    class Runner;

private:
    SimulationConfig config_;
    std::unique_ptr<Runner> runner_;
    core::MetricsCollector metrics_collector_;
    bool initialized_ = false;

    std::unique_ptr<Runner> build_runner() const;
    void update_metrics();
    void save_outputs();
};

} // namespace agentspace
