#include "agentspace/core/grid_space.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace agentspace::core {

GridSpace::GridSpace(GridConfig config) : config_(config) {
    if (config_.width <= 0 || config_.height <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive");
    }
    if (config_.max_placement_attempts < 0) {
        throw std::invalid_argument("max_placement_attempts must not be negative");
    }
}

std::size_t GridSpace::capacity() const noexcept {
    return static_cast<std::size_t>(config_.width) * static_cast<std::size_t>(config_.height);
}

bool GridSpace::in_bounds(const Cell& cell) const noexcept {
    return cell.x >= 0 && cell.x < config_.width &&
           cell.y >= 0 && cell.y < config_.height;
}

void GridSpace::require_in_bounds(const Cell& cell) const {
    if (!in_bounds(cell)) {
        throw OutOfBoundsError(cell, config_.width, config_.height);
    }
}

void GridSpace::insert(AgentId id, const Cell& cell) {
    require_in_bounds(cell);

    if (contains(id)) {
        throw std::invalid_argument("Agent " + std::to_string(id) + " is already placed");
    }

    if (auto occupant = agent_at(cell)) {
        throw OccupiedCellError(cell, *occupant);
    }

    index_.insert(Entry{id, cell});
}

void GridSpace::remove(AgentId id) {
    auto& ids = index_.get<by_id>();
    auto it = ids.find(id);
    if (it == ids.end()) {
        throw NotFoundError(id);
    }
    ids.erase(it);
}

void GridSpace::relocate(AgentId id, const Cell& cell) {
    auto& ids = index_.get<by_id>();
    auto it = ids.find(id);
    if (it == ids.end()) {
        throw NotFoundError(id);
    }

    require_in_bounds(cell);

    if (it->cell == cell) {
        return;
    }

    if (auto occupant = agent_at(cell)) {
        throw OccupiedCellError(cell, *occupant);
    }

    const Cell previous = it->cell;
    bool updated = ids.modify(it,
        [&cell](Entry& entry) { entry.cell = cell; },
        [&previous](Entry& entry) { entry.cell = previous; });

    if (!updated) {
        throw OccupiedCellError(cell, agent_at(cell).value_or(id));
    }
}

bool GridSpace::contains(AgentId id) const {
    const auto& ids = index_.get<by_id>();
    return ids.find(id) != ids.end();
}

Cell GridSpace::position_of(AgentId id) const {
    const auto& ids = index_.get<by_id>();
    auto it = ids.find(id);
    if (it == ids.end()) {
        throw NotFoundError(id);
    }
    return it->cell;
}

std::optional<AgentId> GridSpace::agent_at(const Cell& cell) const {
    const auto& cells = index_.get<by_cell>();
    auto it = cells.find(cell);
    if (it != cells.end()) {
        return it->id;
    }
    return std::nullopt;
}

bool GridSpace::is_empty(const Cell& cell) const {
    return !agent_at(cell).has_value();
}

std::vector<Cell> GridSpace::nearby_cells(const Cell& center, int r) const {
    require_in_bounds(center);
    if (r < 0) {
        throw std::invalid_argument("Neighborhood radius must not be negative");
    }

    std::vector<Cell> cells;
    for (int dy = -r; dy <= r; ++dy) {
        for (int dx = -r; dx <= r; ++dx) {
            if (dx == 0 && dy == 0) {
                continue;
            }

            Cell next{center.x + dx, center.y + dy};
            if (config_.periodic) {
                next.x = ((next.x % config_.width) + config_.width) % config_.width;
                next.y = ((next.y % config_.height) + config_.height) % config_.height;
                if (next == center) {
                    continue;
                }
            } else if (!in_bounds(next)) {
                continue;
            }
            cells.push_back(next);
        }
    }

    // Small periodic grids fold the neighborhood onto itself
    if (config_.periodic) {
        std::sort(cells.begin(), cells.end());
        cells.erase(std::unique(cells.begin(), cells.end()), cells.end());
    }

    return cells;
}

std::vector<AgentId> GridSpace::nearby_ids(const Cell& center, int r) const {
    std::vector<AgentId> ids;
    for (const auto& cell : nearby_cells(center, r)) {
        if (auto occupant = agent_at(cell)) {
            ids.push_back(*occupant);
        }
    }
    return ids;
}

std::vector<Cell> GridSpace::empty_cells() const {
    std::vector<Cell> cells;
    cells.reserve(capacity() - size());
    for (int y = 0; y < config_.height; ++y) {
        for (int x = 0; x < config_.width; ++x) {
            Cell cell{x, y};
            if (is_empty(cell)) {
                cells.push_back(cell);
            }
        }
    }
    return cells;
}

Cell GridSpace::random_empty_cell(Rng& rng) const {
    if (full()) {
        throw CapacityExceededError(size(), capacity());
    }

    std::uniform_int_distribution<int> x_dist(0, config_.width - 1);
    std::uniform_int_distribution<int> y_dist(0, config_.height - 1);

    for (int attempt = 0; attempt < config_.max_placement_attempts; ++attempt) {
        Cell candidate{x_dist(rng), y_dist(rng)};
        if (is_empty(candidate)) {
            return candidate;
        }
    }

    spdlog::warn("Random placement gave up after {} attempts at occupancy {}/{}, scanning for free cells",
                 config_.max_placement_attempts, size(), capacity());

    auto free_cells = empty_cells();
    if (free_cells.empty()) {
        throw CapacityExceededError(size(), capacity());
    }

    std::uniform_int_distribution<std::size_t> pick(0, free_cells.size() - 1);
    return free_cells[pick(rng)];
}

} // namespace agentspace::core
