#pragma once

#include <boost/functional/hash.hpp>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>

namespace agentspace::core {

using AgentId = std::uint64_t;
using Tick = int;
using Rng = std::mt19937_64;

struct Cell {
    int x;
    int y;

    bool operator==(const Cell& other) const noexcept {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Cell& other) const noexcept {
        if (x != other.x) return x < other.x;
        return y < other.y;
    }
};

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Vec2& other) const noexcept {
        return x == other.x && y == other.y;
    }

    Vec2& operator+=(const Vec2& other) noexcept {
        x += other.x;
        y += other.y;
        return *this;
    }

    Vec2& operator-=(const Vec2& other) noexcept {
        x -= other.x;
        y -= other.y;
        return *this;
    }

    friend Vec2 operator+(Vec2 a, const Vec2& b) noexcept { return a += b; }
    friend Vec2 operator-(Vec2 a, const Vec2& b) noexcept { return a -= b; }
    friend Vec2 operator*(const Vec2& a, double c) noexcept { return {a.x * c, a.y * c}; }
    friend Vec2 operator*(double c, const Vec2& a) noexcept { return {a.x * c, a.y * c}; }
    friend Vec2 operator/(const Vec2& a, double c) noexcept { return {a.x / c, a.y / c}; }
};

inline double norm(const Vec2& v) noexcept {
    return std::hypot(v.x, v.y);
}

// Unit vector in the direction of v; the zero vector maps to itself.
inline Vec2 normalize(const Vec2& v) noexcept {
    const double length = norm(v);
    if (length == 0.0) {
        return {};
    }
    return v / length;
}

// Counters maintained by the agent store, read by metrics collection.
struct StoreCounters {
    std::uint64_t created = 0;
    std::uint64_t removed = 0;
    std::uint64_t relocated = 0;
};

struct CellHash {
    std::size_t operator()(const Cell& cell) const noexcept {
        std::size_t seed = 0;
        boost::hash_combine(seed, cell.x);
        boost::hash_combine(seed, cell.y);
        return seed;
    }
};

inline std::size_t hash_value(const Cell& cell) {
    return CellHash{}(cell);
}

inline std::string to_string(const Cell& cell) {
    return "(" + std::to_string(cell.x) + "," + std::to_string(cell.y) + ")";
}

inline std::string to_string(const Vec2& v) {
    return "(" + std::to_string(v.x) + "," + std::to_string(v.y) + ")";
}

} // namespace agentspace::core
