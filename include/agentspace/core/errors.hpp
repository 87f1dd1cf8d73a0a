#pragma once

#include "agentspace/core/types.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace agentspace::core {

// Base of every error raised by the spatial index and the agent store.
class SpaceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Target cell of a single-occupancy grid already holds another agent.
// Recoverable: callers pick another cell.
class OccupiedCellError : public SpaceError {
public:
    OccupiedCellError(const Cell& cell, AgentId occupant)
        : SpaceError("Cell " + to_string(cell) + " is occupied by agent " + std::to_string(occupant))
        , cell_(cell)
        , occupant_(occupant) {}

    const Cell& cell() const noexcept { return cell_; }
    AgentId occupant() const noexcept { return occupant_; }

private:
    Cell cell_;
    AgentId occupant_;
};

class NotFoundError : public SpaceError {
public:
    explicit NotFoundError(AgentId id)
        : SpaceError("Unknown agent " + std::to_string(id))
        , id_(id) {}

    AgentId id() const noexcept { return id_; }

private:
    AgentId id_;
};

class OutOfBoundsError : public SpaceError {
public:
    OutOfBoundsError(const Cell& cell, int width, int height)
        : SpaceError("Cell " + to_string(cell) + " lies outside the " +
                     std::to_string(width) + "x" + std::to_string(height) + " grid")
        , cell_(cell) {}

    const Cell& cell() const noexcept { return cell_; }

private:
    Cell cell_;
};

// A bounded search for a free cell gave up, or no free cell exists at all.
class CapacityExceededError : public SpaceError {
public:
    CapacityExceededError(std::size_t occupied, std::size_t capacity)
        : SpaceError("No free cell available: " + std::to_string(occupied) + " of " +
                     std::to_string(capacity) + " cells occupied")
        , occupied_(occupied)
        , capacity_(capacity) {}

    std::size_t occupied() const noexcept { return occupied_; }
    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t occupied_;
    std::size_t capacity_;
};

} // namespace agentspace::core
