#pragma once

#include <boost/functional/hash.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>

namespace swarmsearch::core {

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

using Tick = int;
using AgentId = int;
using TargetId = int;

struct Claim {
    TargetId target;
    Cell reported;
    AgentId reporter;
    Tick tick;

    bool operator==(const Claim& other) const noexcept {
        return target == other.target && reported == other.reported &&
               reporter == other.reporter && tick == other.tick;
    }
};

struct CellHash {
    std::size_t operator()(const Cell& cell) const noexcept {
        std::size_t seed = 0;
        boost::hash_combine(seed, cell.x);
        boost::hash_combine(seed, cell.y);
        return seed;
    }
};

// Ranges (sensor, communication, vote tolerance) are Euclidean.
inline double euclidean(const Cell& a, const Cell& b) noexcept {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

inline bool within_range(const Cell& a, const Cell& b, double range) noexcept {
    const long dx = a.x - b.x;
    const long dy = a.y - b.y;
    return static_cast<double>(dx * dx + dy * dy) <= range * range;
}

inline int manhattan(const Cell& a, const Cell& b) noexcept {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline Cell clamp_to(const Cell& cell, int width, int height) noexcept {
    return {std::clamp(cell.x, 0, width - 1), std::clamp(cell.y, 0, height - 1)};
}

// Manhattan-greedy step: close the x gap first, then y.
inline Cell step_toward(const Cell& from, const Cell& to) noexcept {
    if (from.x != to.x) {
        return {from.x + (to.x > from.x ? 1 : -1), from.y};
    }
    if (from.y != to.y) {
        return {from.x, from.y + (to.y > from.y ? 1 : -1)};
    }
    return from;
}

} // namespace swarmsearch::core
