#pragma once

#include "agentspace/core/types.hpp"
#include <memory>

namespace agentspace::ports {

struct RouteProgress {
    agentspace::core::Vec2 pos;
    double remaining;   // unspent part of the movement budget
};

// Route planning and route following for agents that travel between
// destinations instead of stepping cell by cell. The navigator keeps the
// active route of every agent; the model keeps the agents' positions.
class INavigator {
public:
    virtual ~INavigator() = default;

    // Coordinates of the network node closest to coords.
    virtual agentspace::core::Vec2 nearest_node(const agentspace::core::Vec2& coords) const = 0;

    virtual bool plan_route(
        agentspace::core::AgentId agent,
        const agentspace::core::Vec2& from,
        const agentspace::core::Vec2& destination
    ) = 0;

    virtual bool plan_random_route(
        agentspace::core::AgentId agent,
        const agentspace::core::Vec2& from,
        agentspace::core::Rng& rng
    ) = 0;

    // True when the agent has no route left to follow.
    virtual bool is_stationary(agentspace::core::AgentId agent) const = 0;

    virtual double distance(const agentspace::core::Vec2& a, const agentspace::core::Vec2& b) const = 0;

    virtual RouteProgress move_along_route(
        agentspace::core::AgentId agent,
        const agentspace::core::Vec2& from,
        double budget
    ) = 0;

    virtual void forget(agentspace::core::AgentId agent) = 0;
};

using NavigatorPtr = std::unique_ptr<INavigator>;

} // namespace agentspace::ports
