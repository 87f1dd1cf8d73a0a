#pragma once

#include "agentspace/core/types.hpp"
#include <cstddef>
#include <functional>
#include <type_traits>
#include <vector>

namespace agentspace::core {

template<typename Position, typename Value>
struct AgentView {
    AgentId id;
    Position pos;
    Value value;
};

// Position and one projected field of every live agent, in id order.
// Only valid between ticks.
template<typename M, typename Projection>
auto snapshot(const M& model, Projection&& project) {
    using Fields = typename M::FieldsType;
    using Value = std::decay_t<std::invoke_result_t<Projection&, const Fields&>>;

    model.require_quiescent("snapshot");

    std::vector<AgentView<typename M::Position, Value>> views;
    views.reserve(model.store().size());
    model.store().for_each([&](const auto& record) {
        views.push_back({record.id, record.pos, std::invoke(project, record.fields)});
    });
    return views;
}

template<typename M, typename Predicate>
std::size_t count_agents(const M& model, Predicate&& predicate) {
    std::size_t count = 0;
    model.store().for_each([&](const auto& record) {
        if (std::invoke(predicate, record.fields)) {
            ++count;
        }
    });
    return count;
}

} // namespace agentspace::core
