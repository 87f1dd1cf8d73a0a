#pragma once

#include "agentspace/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace agentspace::core {

struct MetricsSnapshot {
    Tick ticks = 0;
    std::uint64_t created = 0;
    std::uint64_t removed = 0;
    std::uint64_t relocated = 0;
    std::size_t live_agents = 0;
    std::size_t observed = 0;
    std::chrono::milliseconds wall_time{0};
};

struct TickTrace {
    Tick tick;
    std::size_t live_agents;
    std::uint64_t relocations;  // relocations during this tick
    std::size_t observed;       // scenario-defined count, e.g. happy agents
};

// Single-threaded: filled by the simulation between ticks.
class MetricsCollector {
public:
    MetricsCollector() = default;

    void record_store_counters(const StoreCounters& counters) { counters_ = counters; }
    void set_ticks(Tick ticks) { ticks_ = ticks; }
    void set_population(std::size_t live_agents, std::size_t observed) {
        live_agents_ = live_agents;
        observed_ = observed;
    }

    void record_tick_trace(const TickTrace& trace) { traces_.push_back(trace); }

    MetricsSnapshot get_snapshot() const;
    const std::vector<TickTrace>& get_traces() const noexcept { return traces_; }

    void reset();

    void start_timer() { start_time_ = std::chrono::steady_clock::now(); }
    void stop_timer() {
        auto end_time = std::chrono::steady_clock::now();
        wall_time_ = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_);
    }

private:
    StoreCounters counters_;
    Tick ticks_{0};
    std::size_t live_agents_{0};
    std::size_t observed_{0};

    std::vector<TickTrace> traces_;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::milliseconds wall_time_{0};
};

void emit_metrics_json(const std::filesystem::path& path, const MetricsSnapshot& metrics);
void emit_trace_csv(const std::filesystem::path& path, const std::vector<TickTrace>& traces);

} // namespace agentspace::core
