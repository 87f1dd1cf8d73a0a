#pragma once

#include "agentspace/ports/navigator.hpp"
#include <boost/graph/adjacency_list.hpp>
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace agentspace::adapters {

/**
 * Navigator over an undirected road network. Nodes carry plane coordinates,
 * roads are weighted by their Euclidean length, and routes are shortest
 * paths between the nodes nearest to origin and destination. Agents move
 * along the polyline of the route's node coordinates and finish on the
 * destination itself; an agent already standing on the first road of its
 * route starts from where it stands.
 */
class RoadGraphNavigator : public agentspace::ports::INavigator {
public:
    using NodeId = std::size_t;

    struct Road {
        NodeId from;
        NodeId to;
    };

    RoadGraphNavigator(std::vector<agentspace::core::Vec2> nodes, const std::vector<Road>& roads);
    ~RoadGraphNavigator() override = default;

    std::size_t node_count() const noexcept { return nodes_.size(); }
    const agentspace::core::Vec2& node_position(NodeId node) const { return nodes_.at(node); }
    NodeId nearest_node_id(const agentspace::core::Vec2& coords) const;
    // Empty when to is unreachable from from.
    std::vector<NodeId> shortest_path(NodeId from, NodeId to) const;

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
    using RoadGraph = boost::adjacency_list<
        boost::vecS,
        boost::vecS,
        boost::undirectedS,
        boost::no_property,
        boost::property<boost::edge_weight_t, double>
    >;

    struct Route {
        std::vector<agentspace::core::Vec2> waypoints;
        std::size_t next = 0;
    };

    static constexpr int RANDOM_ROUTE_ATTEMPTS = 16;

    std::vector<agentspace::core::Vec2> nodes_;
    RoadGraph graph_;
    std::unordered_map<agentspace::core::AgentId, Route> routes_;
};

} // namespace agentspace::adapters
