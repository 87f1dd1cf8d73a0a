#pragma once

#include "agentspace/core/types.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstddef>
#include <exception>
#include <string_view>
#include <utility>
#include <vector>

namespace agentspace::core {

enum class ScheduleOrder {
    ById,       // insertion order
    Randomly    // fresh permutation every tick, drawn from the model's rng
};

std::string_view to_string(ScheduleOrder order) noexcept;

struct StepReport {
    std::size_t scheduled = 0;  // ids in the tick's snapshot
    std::size_t processed = 0;  // rule invocations
    std::size_t skipped = 0;    // snapshot ids removed before their turn

    StepReport& operator+=(const StepReport& other) noexcept {
        scheduled += other.scheduled;
        processed += other.processed;
        skipped += other.skipped;
        return *this;
    }
};

struct NoTickRule {
    template<typename M>
    void operator()(M&) const noexcept {}
};

/**
 * Drives a model one tick at a time.
 *
 * A tick snapshots the live ids, runs the agent rule once per snapshot id
 * that is still alive, then runs the tick rule and advances the tick
 * counter. Updates are sequential: a rule sees every change made earlier in
 * the same tick. If a rule throws, the tick stops there, effects already
 * applied stay applied, the tick counter does not advance and the error
 * reaches the caller.
 */
class Scheduler {
public:
    explicit Scheduler(ScheduleOrder order = ScheduleOrder::ById) : order_(order) {}

    ScheduleOrder order() const noexcept { return order_; }

    template<typename M, typename AgentRule, typename TickRule = NoTickRule>
    StepReport step(M& model, AgentRule&& agent_rule, TickRule&& tick_rule = {}) const {
        model.begin_tick();
        TickGuard<M> guard(model);

        StepReport report;
        auto ids = model.store().all_ids();
        report.scheduled = ids.size();

        if (order_ == ScheduleOrder::Randomly) {
            std::shuffle(ids.begin(), ids.end(), model.rng());
        }

        for (AgentId id : ids) {
            if (!model.store().contains(id)) {
                ++report.skipped;
                continue;
            }

            try {
                agent_rule(id, model);
            } catch (const std::exception& e) {
                spdlog::error("Tick {} aborted at agent {}: {}", model.tick(), id, e.what());
                throw;
            }
            ++report.processed;
        }

        tick_rule(model);

        guard.commit();
        spdlog::debug("Tick {} done: {} processed, {} skipped, {} live",
                      model.tick(), report.processed, report.skipped, model.store().size());
        return report;
    }

    template<typename M, typename AgentRule, typename TickRule = NoTickRule>
    StepReport run(M& model, int ticks, AgentRule&& agent_rule, TickRule&& tick_rule = {}) const {
        StepReport total;
        for (int i = 0; i < ticks; ++i) {
            total += step(model, agent_rule, tick_rule);
        }
        return total;
    }

private:
    template<typename M>
    class TickGuard {
    public:
        explicit TickGuard(M& model) : model_(model) {}
        ~TickGuard() {
            if (!committed_) {
                model_.abort_tick();
            }
        }

        TickGuard(const TickGuard&) = delete;
        TickGuard& operator=(const TickGuard&) = delete;

        void commit() noexcept {
            committed_ = true;
            model_.finish_tick();
        }

    private:
        M& model_;
        bool committed_ = false;
    };

    ScheduleOrder order_;
};

} // namespace agentspace::core
