#include "agentspace/adapters/road_graph_navigator.hpp"
#include <boost/graph/dijkstra_shortest_paths.hpp>
#include <boost/property_map/property_map.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace agentspace::adapters {

using agentspace::core::AgentId;
using agentspace::core::Vec2;

namespace {

bool on_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
    using agentspace::core::norm;
    const double length = norm(b - a);
    return norm(p - a) + norm(b - p) - length <= 1e-9 * std::max(1.0, length);
}

} // namespace

RoadGraphNavigator::RoadGraphNavigator(std::vector<Vec2> nodes, const std::vector<Road>& roads)
    : nodes_(std::move(nodes))
    , graph_(nodes_.size()) {
    if (nodes_.empty()) {
        throw std::invalid_argument("Road network needs at least one node");
    }

    for (const auto& road : roads) {
        if (road.from >= nodes_.size() || road.to >= nodes_.size()) {
            throw std::invalid_argument("Road references unknown node");
        }
        double length = agentspace::core::norm(nodes_[road.to] - nodes_[road.from]);
        boost::add_edge(road.from, road.to, length, graph_);
    }
}

RoadGraphNavigator::NodeId RoadGraphNavigator::nearest_node_id(const Vec2& coords) const {
    NodeId best = 0;
    double best_distance = std::numeric_limits<double>::infinity();
    for (NodeId node = 0; node < nodes_.size(); ++node) {
        double d = distance(coords, nodes_[node]);
        if (d < best_distance) {
            best_distance = d;
            best = node;
        }
    }
    return best;
}

std::vector<RoadGraphNavigator::NodeId> RoadGraphNavigator::shortest_path(NodeId from, NodeId to) const {
    if (from >= nodes_.size() || to >= nodes_.size()) {
        throw std::out_of_range("Unknown road network node");
    }

    std::vector<RoadGraph::vertex_descriptor> predecessors(boost::num_vertices(graph_));
    std::vector<double> distances(boost::num_vertices(graph_));
    auto index = boost::get(boost::vertex_index, graph_);

    boost::dijkstra_shortest_paths(graph_, from,
        boost::predecessor_map(boost::make_iterator_property_map(predecessors.begin(), index))
            .distance_map(boost::make_iterator_property_map(distances.begin(), index)));

    if (to != from && predecessors[to] == to) {
        return {};
    }

    std::vector<NodeId> path;
    for (NodeId node = to; node != from; node = predecessors[node]) {
        path.push_back(node);
    }
    path.push_back(from);

    std::reverse(path.begin(), path.end());
    return path;
}

Vec2 RoadGraphNavigator::nearest_node(const Vec2& coords) const {
    return nodes_[nearest_node_id(coords)];
}

bool RoadGraphNavigator::plan_route(AgentId agent, const Vec2& from, const Vec2& destination) {
    auto path = shortest_path(nearest_node_id(from), nearest_node_id(destination));
    if (path.empty()) {
        routes_.erase(agent);
        spdlog::debug("No road connects agent {} to its destination", agent);
        return false;
    }

    Route route;
    route.waypoints.reserve(path.size() + 1);
    for (NodeId node : path) {
        route.waypoints.push_back(nodes_[node]);
    }
    auto& waypoints = route.waypoints;

    // Routes end on the destination itself, e.g. prey standing mid-road
    if (!(waypoints.back() == destination)) {
        if (waypoints.size() >= 2 && on_segment(destination, waypoints[waypoints.size() - 2], waypoints.back())) {
            waypoints.back() = destination;
        } else {
            waypoints.push_back(destination);
        }
    }

    // An agent already on the first road does not walk back to its start node
    if (waypoints.size() >= 2 && on_segment(from, waypoints[0], waypoints[1])) {
        waypoints.erase(waypoints.begin());
    }

    routes_[agent] = std::move(route);
    return true;
}

bool RoadGraphNavigator::plan_random_route(AgentId agent, const Vec2& from, agentspace::core::Rng& rng) {
    std::uniform_int_distribution<NodeId> pick(0, nodes_.size() - 1);
    for (int attempt = 0; attempt < RANDOM_ROUTE_ATTEMPTS; ++attempt) {
        if (plan_route(agent, from, nodes_[pick(rng)])) {
            return true;
        }
    }
    spdlog::warn("Agent {} found no reachable random destination after {} attempts",
                 agent, RANDOM_ROUTE_ATTEMPTS);
    return false;
}

bool RoadGraphNavigator::is_stationary(AgentId agent) const {
    return routes_.find(agent) == routes_.end();
}

double RoadGraphNavigator::distance(const Vec2& a, const Vec2& b) const {
    return agentspace::core::norm(b - a);
}

agentspace::ports::RouteProgress RoadGraphNavigator::move_along_route(
    AgentId agent, const Vec2& from, double budget) {
    auto it = routes_.find(agent);
    if (it == routes_.end()) {
        return {from, budget};
    }

    Route& route = it->second;
    Vec2 pos = from;

    while (budget > 0.0 && route.next < route.waypoints.size()) {
        const Vec2& waypoint = route.waypoints[route.next];
        double leg = distance(pos, waypoint);
        if (budget >= leg) {
            pos = waypoint;
            budget -= leg;
            ++route.next;
        } else {
            pos += agentspace::core::normalize(waypoint - pos) * budget;
            budget = 0.0;
        }
    }

    if (route.next >= route.waypoints.size()) {
        routes_.erase(it);
    }

    return {pos, budget};
}

void RoadGraphNavigator::forget(AgentId agent) {
    routes_.erase(agent);
}

} // namespace agentspace::adapters
