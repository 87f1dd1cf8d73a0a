#include "agentspace/core/metrics.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace agentspace::core {

MetricsSnapshot MetricsCollector::get_snapshot() const {
    MetricsSnapshot snapshot;
    snapshot.ticks = ticks_;
    snapshot.created = counters_.created;
    snapshot.removed = counters_.removed;
    snapshot.relocated = counters_.relocated;
    snapshot.live_agents = live_agents_;
    snapshot.observed = observed_;
    snapshot.wall_time = wall_time_;
    return snapshot;
}

void MetricsCollector::reset() {
    counters_ = StoreCounters{};
    ticks_ = 0;
    live_agents_ = 0;
    observed_ = 0;
    wall_time_ = std::chrono::milliseconds{0};
    traces_.clear();
}

void emit_metrics_json(const std::filesystem::path& path, const MetricsSnapshot& metrics) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open metrics file: " + path.string());
    }

    file << "{\n";
    file << "  \"ticks\": " << metrics.ticks << ",\n";
    file << "  \"created\": " << metrics.created << ",\n";
    file << "  \"removed\": " << metrics.removed << ",\n";
    file << "  \"relocated\": " << metrics.relocated << ",\n";
    file << "  \"live_agents\": " << metrics.live_agents << ",\n";
    file << "  \"observed\": " << metrics.observed << ",\n";
    file << "  \"wall_time_ms\": " << metrics.wall_time.count() << ",\n";

    double relocations_per_tick = metrics.ticks > 0 ?
        static_cast<double>(metrics.relocated) / metrics.ticks : 0.0;
    file << "  \"relocations_per_tick\": " << std::fixed << std::setprecision(4) << relocations_per_tick << "\n";
    file << "}\n";
}

void emit_trace_csv(const std::filesystem::path& path, const std::vector<TickTrace>& traces) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open trace file: " + path.string());
    }

    file << "tick,live_agents,relocations,observed\n";

    for (const auto& trace : traces) {
        file << trace.tick << ","
             << trace.live_agents << ","
             << trace.relocations << ","
             << trace.observed << "\n";
    }
}

} // namespace agentspace::core
