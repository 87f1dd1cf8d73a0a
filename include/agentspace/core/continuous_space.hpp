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

// Bounded plane [0, extent.x] x [0, extent.y], optionally a torus.
class PlaneGeometry {
public:
    PlaneGeometry(Vec2 extent, bool periodic);

    const Vec2& extent() const noexcept { return extent_; }
    bool periodic() const noexcept { return periodic_; }

    // Wraps into [0, extent) when periodic, clamps into [0, extent] otherwise.
    Vec2 normalize(const Vec2& pos) const noexcept;
    // Shortest vector leading from `from` to `to`, taking wraparound into account.
    Vec2 displacement(const Vec2& from, const Vec2& to) const noexcept;
    double distance(const Vec2& a, const Vec2& b) const noexcept;

    Vec2 random_position(Rng& rng) const;

private:
    Vec2 extent_;
    bool periodic_;
};

struct ContinuousConfig {
    Vec2 extent{1.0, 1.0};
    bool periodic = true;
    // Target bucket edge length; roughly the typical query radius
    double spacing = 1.0;
};

/**
 * Continuous 2D space with bucketed radius queries.
 *
 * The extent is split into equally sized buckets no larger than the
 * configured spacing. A radius query only inspects the buckets the query
 * disc can touch, so its cost depends on local density rather than on the
 * total population.
 */
class ContinuousSpace {
public:
    using Position = Vec2;

    explicit ContinuousSpace(ContinuousConfig config);

    const PlaneGeometry& geometry() const noexcept { return geometry_; }
    const Vec2& extent() const noexcept { return geometry_.extent(); }
    bool periodic() const noexcept { return geometry_.periodic(); }
    int columns() const noexcept { return columns_; }
    int rows() const noexcept { return rows_; }

    std::size_t size() const noexcept { return index_.size(); }

    Vec2 normalize(const Vec2& pos) const noexcept { return geometry_.normalize(pos); }
    Vec2 displacement(const Vec2& from, const Vec2& to) const noexcept {
        return geometry_.displacement(from, to);
    }
    double distance(const Vec2& a, const Vec2& b) const noexcept {
        return geometry_.distance(a, b);
    }

    // Positions are normalized (wrapped or clamped) before they are stored.
    void insert(AgentId id, const Vec2& pos);
    void remove(AgentId id);
    void relocate(AgentId id, const Vec2& pos);

    bool contains(AgentId id) const;
    Vec2 position_of(AgentId id) const;

    // Ids stored within Euclidean distance <= radius of center.
    std::vector<AgentId> query_radius(const Vec2& center, double radius,
                                      std::optional<AgentId> exclude = std::nullopt) const;

    Vec2 random_position(Rng& rng) const { return geometry_.random_position(rng); }

private:
    struct Bucket {
        int x;
        int y;

        bool operator==(const Bucket& other) const noexcept {
            return x == other.x && y == other.y;
        }
    };

    struct BucketHash {
        std::size_t operator()(const Bucket& bucket) const noexcept;
    };

    struct Entry {
        AgentId id;
        Vec2 pos;
        Bucket bucket;
    };

    struct by_id {};
    struct by_bucket {};

    using Index = boost::multi_index::multi_index_container<
        Entry,
        boost::multi_index::indexed_by<
            boost::multi_index::hashed_unique<
                boost::multi_index::tag<by_id>,
                boost::multi_index::member<Entry, AgentId, &Entry::id>
            >,
            boost::multi_index::hashed_non_unique<
                boost::multi_index::tag<by_bucket>,
                boost::multi_index::member<Entry, Bucket, &Entry::bucket>,
                BucketHash
            >
        >
    >;

    PlaneGeometry geometry_;
    int columns_;
    int rows_;
    double bucket_width_;
    double bucket_height_;
    Index index_;

    Bucket bucket_of(const Vec2& pos) const noexcept;
    std::vector<int> bucket_span(int center, int reach, int count) const;
};

} // namespace agentspace::core
