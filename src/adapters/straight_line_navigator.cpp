#include "agentspace/adapters/straight_line_navigator.hpp"

namespace agentspace::adapters {

using agentspace::core::AgentId;
using agentspace::core::Vec2;

StraightLineNavigator::StraightLineNavigator(agentspace::core::PlaneGeometry geometry)
    : geometry_(geometry) {
}

Vec2 StraightLineNavigator::nearest_node(const Vec2& coords) const {
    return geometry_.normalize(coords);
}

bool StraightLineNavigator::plan_route(AgentId agent, const Vec2& /*from*/, const Vec2& destination) {
    destinations_[agent] = geometry_.normalize(destination);
    return true;
}

bool StraightLineNavigator::plan_random_route(AgentId agent, const Vec2& from, agentspace::core::Rng& rng) {
    return plan_route(agent, from, geometry_.random_position(rng));
}

bool StraightLineNavigator::is_stationary(AgentId agent) const {
    return destinations_.find(agent) == destinations_.end();
}

double StraightLineNavigator::distance(const Vec2& a, const Vec2& b) const {
    return geometry_.distance(a, b);
}

agentspace::ports::RouteProgress StraightLineNavigator::move_along_route(
    AgentId agent, const Vec2& from, double budget) {
    auto it = destinations_.find(agent);
    if (it == destinations_.end()) {
        return {from, budget};
    }

    const Vec2 destination = it->second;
    const double left = geometry_.distance(from, destination);

    if (budget >= left) {
        destinations_.erase(it);
        return {destination, budget - left};
    }

    const Vec2 direction = agentspace::core::normalize(geometry_.displacement(from, destination));
    return {geometry_.normalize(from + direction * budget), 0.0};
}

void StraightLineNavigator::forget(AgentId agent) {
    destinations_.erase(agent);
}

} // namespace agentspace::adapters
