#pragma once

#include "agentspace/core/errors.hpp"
#include "agentspace/core/types.hpp"
#include <concepts>
#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace agentspace::core {

template<typename T>
concept SpatialIndexImpl = requires(T space, const T& view, AgentId id, const typename T::Position& pos) {
    space.insert(id, pos);
    space.remove(id);
    space.relocate(id, pos);
    { view.position_of(id) } -> std::convertible_to<typename T::Position>;
    { view.contains(id) } -> std::same_as<bool>;
    { view.size() } -> std::convertible_to<std::size_t>;
};

/**
 * Owns the agent records of a model and keeps the spatial index in step.
 *
 * Every path that changes an agent's position (create, relocate, remove)
 * updates the record and the index together, so between operations the
 * index always mirrors the records. Domain fields are reachable for
 * writing, positions only through relocate().
 *
 * Ids are handed out in increasing order and never reused. Records are kept
 * ordered by id, so id order is also insertion order.
 */
template<SpatialIndexImpl Space, typename Fields>
class AgentStore {
public:
    using Position = typename Space::Position;

    struct Record {
        AgentId id;
        Position pos;
        Fields fields;
    };

    explicit AgentStore(Space space) : space_(std::move(space)) {}

    // Fails with the index's error (e.g. OccupiedCellError) without consuming an id.
    AgentId create(Fields fields, const Position& pos) {
        const AgentId id = next_id_;
        space_.insert(id, pos);
        records_.emplace(id, Record{id, space_.position_of(id), std::move(fields)});
        ++next_id_;
        ++counters_.created;
        return id;
    }

    void remove(AgentId id) {
        auto it = find_record(id);
        space_.remove(id);
        records_.erase(it);
        ++counters_.removed;
    }

    void relocate(AgentId id, const Position& pos) {
        auto it = find_record(id);
        space_.relocate(id, pos);
        Position stored = space_.position_of(id);
        if (!(stored == it->second.pos)) {
            it->second.pos = stored;
            ++counters_.relocated;
        }
    }

    const Record& get(AgentId id) const { return find_record(id)->second; }
    const Position& position(AgentId id) const { return get(id).pos; }

    Fields& fields(AgentId id) { return find_record(id)->second.fields; }
    const Fields& fields(AgentId id) const { return get(id).fields; }

    template<typename Value, typename Arg>
    void set_field(AgentId id, Value Fields::*field, Arg&& value) {
        fields(id).*field = std::forward<Arg>(value);
    }

    bool contains(AgentId id) const { return records_.find(id) != records_.end(); }
    std::size_t size() const noexcept { return records_.size(); }
    bool empty() const noexcept { return records_.empty(); }

    // Ids live at the time of the call, in insertion order. Later mutations
    // never change a snapshot that was already taken.
    std::vector<AgentId> all_ids() const {
        std::vector<AgentId> ids;
        ids.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            ids.push_back(id);
        }
        return ids;
    }

    template<typename Visitor>
    void for_each(Visitor&& visit) const {
        for (const auto& [id, record] : records_) {
            visit(record);
        }
    }

    const Space& space() const noexcept { return space_; }
    const StoreCounters& counters() const noexcept { return counters_; }

private:
    Space space_;
    std::map<AgentId, Record> records_;
    AgentId next_id_ = 1;
    StoreCounters counters_;

    typename std::map<AgentId, Record>::iterator find_record(AgentId id) {
        auto it = records_.find(id);
        if (it == records_.end()) {
            throw NotFoundError(id);
        }
        return it;
    }

    typename std::map<AgentId, Record>::const_iterator find_record(AgentId id) const {
        auto it = records_.find(id);
        if (it == records_.end()) {
            throw NotFoundError(id);
        }
        return it;
    }
};

} // namespace agentspace::core
