#pragma once

#include "swarmsearch/core/types.hpp"
#include <optional>
#include <random>
#include <vector>

namespace swarmsearch::core {

enum class MotionKind {
    Stationary,
    RandomWalk,   // dx, dy drawn from {-1, 0, 1} every move interval
    Waypoints     // one greedy step toward the next waypoint of a fixed cycle
};

struct Target {
    TargetId id;
    Cell pos;
    MotionKind motion = MotionKind::Stationary;
    std::vector<Cell> waypoints;
    std::size_t waypoint_index = 0;
};

// Frozen copy of the ground truth for one tick. Agents observe through this,
// never through the live world.
struct WorldView {
    int width = 0;
    int height = 0;
    Tick tick = 0;
    std::vector<Target> targets;

    bool is_valid_cell(const Cell& cell) const noexcept {
        return cell.x >= 0 && cell.x < width && cell.y >= 0 && cell.y < height;
    }

    std::vector<Target> targets_within(const Cell& position, double radius) const;
};

class GridWorld {
public:
    GridWorld(int width, int height, std::vector<Target> targets, uint64_t seed, int move_interval);

    void advance();

    std::vector<Target> targets_within(const Cell& position, double radius) const;
    WorldView snapshot() const;

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    Tick current_tick() const noexcept { return tick_; }
    const std::vector<Target>& targets() const noexcept { return targets_; }

    bool is_valid_cell(const Cell& cell) const noexcept {
        return cell.x >= 0 && cell.x < width_ && cell.y >= 0 && cell.y < height_;
    }

private:
    int width_;
    int height_;
    std::vector<Target> targets_;
    std::mt19937_64 rng_;
    int move_interval_;
    Tick tick_ = 0;

    void move_target(Target& target);
};

class WorldBuilder {
public:
    explicit WorldBuilder(uint64_t seed) : rng_(seed), seed_(seed) {}

    WorldBuilder& with_dimensions(int width, int height);
    WorldBuilder& with_target(Cell pos, MotionKind motion = MotionKind::Stationary,
                              std::vector<Cell> waypoints = {});
    WorldBuilder& with_random_targets(int n_targets, MotionKind motion = MotionKind::RandomWalk);
    WorldBuilder& with_move_interval(int ticks);

    std::optional<GridWorld> build();

private:
    std::mt19937_64 rng_;
    uint64_t seed_;
    int width_ = 0;
    int height_ = 0;
    int move_interval_ = 5;
    std::vector<Target> target_specs_;
    int random_targets_ = 0;
    MotionKind random_motion_ = MotionKind::RandomWalk;

    Cell random_cell();
};

} // namespace swarmsearch::core
