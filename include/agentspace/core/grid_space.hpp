#pragma once

#include "agentspace/core/errors.hpp"
#include "agentspace/core/types.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/tag.hpp>
#include <optional>
#include <vector>

namespace agentspace::core {

struct GridConfig {
    int width = 0;
    int height = 0;
    bool periodic = false;
    // Random probes tried before random placement falls back to a scan
    int max_placement_attempts = 1000;
};

/**
 * Discrete 2D grid where every cell holds at most one agent.
 *
 * The agent-to-cell association is kept in a two-way hashed index, so both
 * "where is agent a" and "who is at cell c" are O(1). The unique cell index
 * is what enforces single occupancy.
 */
class GridSpace {
public:
    using Position = Cell;

    explicit GridSpace(GridConfig config);

    int width() const noexcept { return config_.width; }
    int height() const noexcept { return config_.height; }
    bool periodic() const noexcept { return config_.periodic; }
    const GridConfig& config() const noexcept { return config_; }

    std::size_t capacity() const noexcept;
    std::size_t size() const noexcept { return index_.size(); }
    bool full() const noexcept { return size() >= capacity(); }

    bool in_bounds(const Cell& cell) const noexcept;

    // Throws OutOfBoundsError or OccupiedCellError; the index is unchanged on failure.
    void insert(AgentId id, const Cell& cell);
    void remove(AgentId id);
    // Moves an agent in a single index update. Relocating onto the agent's own cell is a no-op.
    void relocate(AgentId id, const Cell& cell);

    bool contains(AgentId id) const;
    Cell position_of(AgentId id) const;
    std::optional<AgentId> agent_at(const Cell& cell) const;
    bool is_empty(const Cell& cell) const;

    // Cells within Chebyshev distance r of center, center excluded. Wraps when periodic.
    std::vector<Cell> nearby_cells(const Cell& center, int r = 1) const;
    std::vector<AgentId> nearby_ids(const Cell& center, int r = 1) const;
    std::vector<AgentId> query_moore_neighbors(const Cell& center) const {
        return nearby_ids(center, 1);
    }

    std::vector<Cell> empty_cells() const;
    Cell random_empty_cell(Rng& rng) const;
    Cell random_position(Rng& rng) const { return random_empty_cell(rng); }

private:
    struct Entry {
        AgentId id;
        Cell cell;
    };

    struct by_id {};
    struct by_cell {};

    using Index = boost::multi_index::multi_index_container<
        Entry,
        boost::multi_index::indexed_by<
            boost::multi_index::hashed_unique<
                boost::multi_index::tag<by_id>,
                boost::multi_index::member<Entry, AgentId, &Entry::id>
            >,
            boost::multi_index::hashed_unique<
                boost::multi_index::tag<by_cell>,
                boost::multi_index::member<Entry, Cell, &Entry::cell>,
                CellHash
            >
        >
    >;

    GridConfig config_;
    Index index_;

    void require_in_bounds(const Cell& cell) const;
};

} // namespace agentspace::core
