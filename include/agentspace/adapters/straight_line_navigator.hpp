#pragma once

#include "agentspace/core/continuous_space.hpp"
#include "agentspace/ports/navigator.hpp"
#include <unordered_map>

namespace agentspace::adapters {

// Routes are straight segments across an open plane; every point is a node.
class StraightLineNavigator : public agentspace::ports::INavigator {
public:
    explicit StraightLineNavigator(agentspace::core::PlaneGeometry geometry);
    ~StraightLineNavigator() override = default;

    agentspace::core::Vec2 nearest_node(const agentspace::core::Vec2& coords) const override;
    bool plan_route(agentspace::core::AgentId agent,
                    const agentspace::core::Vec2& from,
                    const agentspace::core::Vec2& destination) override;
    bool plan_random_route(agentspace::core::AgentId agent,
                           const agentspace::core::Vec2& from,
                           agentspace::core::Rng& rng) override;
    bool is_stationary(agentspace::core::AgentId agent) const override;
    double distance(const agentspace::core::Vec2& a, const agentspace::core::Vec2& b) const override;
    agentspace::ports::RouteProgress move_along_route(agentspace::core::AgentId agent,
                                                      const agentspace::core::Vec2& from,
                                                      double budget) override;
    void forget(agentspace::core::AgentId agent) override;

private:
    agentspace::core::PlaneGeometry geometry_;
    std::unordered_map<agentspace::core::AgentId, agentspace::core::Vec2> destinations_;
};

} // namespace agentspace::adapters
