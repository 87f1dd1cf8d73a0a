#include "agentspace/core/continuous_space.hpp"
#include <boost/functional/hash.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace agentspace::core {

PlaneGeometry::PlaneGeometry(Vec2 extent, bool periodic)
    : extent_(extent)
    , periodic_(periodic) {
    if (!(extent_.x > 0.0) || !(extent_.y > 0.0)) {
        throw std::invalid_argument("Continuous extent must be positive");
    }
}

namespace {

double wrap_coordinate(double value, double extent) noexcept {
    double wrapped = std::fmod(value, extent);
    if (wrapped < 0.0) {
        wrapped += extent;
    }
    // fmod of a tiny negative value can round up to the extent itself
    if (wrapped >= extent) {
        wrapped = 0.0;
    }
    return wrapped;
}

} // namespace

Vec2 PlaneGeometry::normalize(const Vec2& pos) const noexcept {
    if (periodic_) {
        return {wrap_coordinate(pos.x, extent_.x), wrap_coordinate(pos.y, extent_.y)};
    }
    return {std::clamp(pos.x, 0.0, extent_.x), std::clamp(pos.y, 0.0, extent_.y)};
}

Vec2 PlaneGeometry::displacement(const Vec2& from, const Vec2& to) const noexcept {
    Vec2 delta = to - from;
    if (periodic_) {
        delta.x = std::remainder(delta.x, extent_.x);
        delta.y = std::remainder(delta.y, extent_.y);
    }
    return delta;
}

double PlaneGeometry::distance(const Vec2& a, const Vec2& b) const noexcept {
    return norm(displacement(a, b));
}

Vec2 PlaneGeometry::random_position(Rng& rng) const {
    std::uniform_real_distribution<double> x_dist(0.0, extent_.x);
    std::uniform_real_distribution<double> y_dist(0.0, extent_.y);
    double x = x_dist(rng);
    double y = y_dist(rng);
    return {x, y};
}

std::size_t ContinuousSpace::BucketHash::operator()(const Bucket& bucket) const noexcept {
    std::size_t seed = 0;
    boost::hash_combine(seed, bucket.x);
    boost::hash_combine(seed, bucket.y);
    return seed;
}

ContinuousSpace::ContinuousSpace(ContinuousConfig config)
    : geometry_(config.extent, config.periodic) {
    if (!(config.spacing > 0.0)) {
        throw std::invalid_argument("Bucket spacing must be positive");
    }

    columns_ = std::max(1, static_cast<int>(std::ceil(config.extent.x / config.spacing)));
    rows_ = std::max(1, static_cast<int>(std::ceil(config.extent.y / config.spacing)));

    // Equal buckets keep the wrapped neighborhood of a bucket symmetric
    bucket_width_ = config.extent.x / columns_;
    bucket_height_ = config.extent.y / rows_;
}

ContinuousSpace::Bucket ContinuousSpace::bucket_of(const Vec2& pos) const noexcept {
    int bx = static_cast<int>(std::floor(pos.x / bucket_width_));
    int by = static_cast<int>(std::floor(pos.y / bucket_height_));
    return {std::clamp(bx, 0, columns_ - 1), std::clamp(by, 0, rows_ - 1)};
}

void ContinuousSpace::insert(AgentId id, const Vec2& pos) {
    if (contains(id)) {
        throw std::invalid_argument("Agent " + std::to_string(id) + " is already placed");
    }

    const Vec2 stored = normalize(pos);
    index_.insert(Entry{id, stored, bucket_of(stored)});
}

void ContinuousSpace::remove(AgentId id) {
    auto& ids = index_.get<by_id>();
    auto it = ids.find(id);
    if (it == ids.end()) {
        throw NotFoundError(id);
    }
    ids.erase(it);
}

void ContinuousSpace::relocate(AgentId id, const Vec2& pos) {
    auto& ids = index_.get<by_id>();
    auto it = ids.find(id);
    if (it == ids.end()) {
        throw NotFoundError(id);
    }

    const Vec2 stored = normalize(pos);
    const Bucket bucket = bucket_of(stored);
    ids.modify(it, [&stored, &bucket](Entry& entry) {
        entry.pos = stored;
        entry.bucket = bucket;
    });
}

bool ContinuousSpace::contains(AgentId id) const {
    const auto& ids = index_.get<by_id>();
    return ids.find(id) != ids.end();
}

Vec2 ContinuousSpace::position_of(AgentId id) const {
    const auto& ids = index_.get<by_id>();
    auto it = ids.find(id);
    if (it == ids.end()) {
        throw NotFoundError(id);
    }
    return it->pos;
}

std::vector<int> ContinuousSpace::bucket_span(int center, int reach, int count) const {
    std::vector<int> span;

    if (2 * static_cast<long long>(reach) + 1 >= count) {
        span.resize(count);
        for (int i = 0; i < count; ++i) {
            span[i] = i;
        }
        return span;
    }

    if (periodic()) {
        for (int offset = -reach; offset <= reach; ++offset) {
            span.push_back(((center + offset) % count + count) % count);
        }
    } else {
        for (int i = std::max(0, center - reach); i <= std::min(count - 1, center + reach); ++i) {
            span.push_back(i);
        }
    }
    return span;
}

std::vector<AgentId> ContinuousSpace::query_radius(const Vec2& center, double radius,
                                                   std::optional<AgentId> exclude) const {
    if (!(radius >= 0.0)) {
        throw std::invalid_argument("Query radius must not be negative");
    }

    const Vec2 origin = normalize(center);
    const Bucket home = bucket_of(origin);

    // One extra bucket absorbs rounding at bucket borders
    auto reach_for = [radius](double bucket_size, int count) {
        double buckets = std::floor(radius / bucket_size) + 1.0;
        return buckets >= count ? count : static_cast<int>(buckets);
    };

    const auto xs = bucket_span(home.x, reach_for(bucket_width_, columns_), columns_);
    const auto ys = bucket_span(home.y, reach_for(bucket_height_, rows_), rows_);

    const auto& buckets = index_.get<by_bucket>();
    std::vector<AgentId> found;

    for (int by : ys) {
        for (int bx : xs) {
            auto [first, last] = buckets.equal_range(Bucket{bx, by});
            for (auto it = first; it != last; ++it) {
                if (exclude && it->id == *exclude) {
                    continue;
                }
                if (distance(origin, it->pos) <= radius) {
                    found.push_back(it->id);
                }
            }
        }
    }

    return found;
}

} // namespace agentspace::core
