#include "swarmsearch/core/world.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace swarmsearch::core {

namespace {

std::vector<Target> collect_within(const std::vector<Target>& targets, const Cell& position, double radius) {
    std::vector<Target> visible;
    for (const auto& target : targets) {
        if (within_range(position, target.pos, radius)) {
            visible.push_back(target);
        }
    }
    return visible;
}

} // namespace

std::vector<Target> WorldView::targets_within(const Cell& position, double radius) const {
    return collect_within(targets, position, radius);
}

GridWorld::GridWorld(int width, int height, std::vector<Target> targets, uint64_t seed, int move_interval)
    : width_(width)
    , height_(height)
    , targets_(std::move(targets))
    , rng_(seed)
    , move_interval_(std::max(1, move_interval)) {
}

void GridWorld::advance() {
    ++tick_;
    if (tick_ % move_interval_ != 0) {
        return;
    }

    for (auto& target : targets_) {
        move_target(target);
    }
}

void GridWorld::move_target(Target& target) {
    switch (target.motion) {
    case MotionKind::Stationary:
        return;

    case MotionKind::RandomWalk: {
        std::uniform_int_distribution<int> step(-1, 1);
        const int dx = step(rng_);
        const int dy = step(rng_);
        target.pos = clamp_to({target.pos.x + dx, target.pos.y + dy}, width_, height_);
        return;
    }

    case MotionKind::Waypoints: {
        if (target.waypoints.empty()) {
            return;
        }
        if (target.pos == target.waypoints[target.waypoint_index]) {
            target.waypoint_index = (target.waypoint_index + 1) % target.waypoints.size();
        }
        target.pos = clamp_to(step_toward(target.pos, target.waypoints[target.waypoint_index]),
                              width_, height_);
        return;
    }
    }
}

std::vector<Target> GridWorld::targets_within(const Cell& position, double radius) const {
    return collect_within(targets_, position, radius);
}

WorldView GridWorld::snapshot() const {
    return WorldView{width_, height_, tick_, targets_};
}

WorldBuilder& WorldBuilder::with_dimensions(int width, int height) {
    width_ = width;
    height_ = height;
    return *this;
}

WorldBuilder& WorldBuilder::with_target(Cell pos, MotionKind motion, std::vector<Cell> waypoints) {
    Target target;
    target.id = static_cast<TargetId>(target_specs_.size());
    target.pos = pos;
    target.motion = motion;
    target.waypoints = std::move(waypoints);
    target_specs_.push_back(std::move(target));
    return *this;
}

WorldBuilder& WorldBuilder::with_random_targets(int n_targets, MotionKind motion) {
    random_targets_ = n_targets;
    random_motion_ = motion;
    return *this;
}

WorldBuilder& WorldBuilder::with_move_interval(int ticks) {
    move_interval_ = ticks;
    return *this;
}

Cell WorldBuilder::random_cell() {
    std::uniform_int_distribution<int> xs(0, width_ - 1);
    std::uniform_int_distribution<int> ys(0, height_ - 1);
    const int x = xs(rng_);
    const int y = ys(rng_);
    return {x, y};
}

std::optional<GridWorld> WorldBuilder::build() {
    if (width_ <= 0 || height_ <= 0) {
        return std::nullopt;
    }

    auto targets = target_specs_;

    for (const auto& target : targets) {
        const bool waypoints_valid = std::all_of(target.waypoints.begin(), target.waypoints.end(),
            [this](const Cell& c) { return c.x >= 0 && c.x < width_ && c.y >= 0 && c.y < height_; });
        if (target.pos.x < 0 || target.pos.x >= width_ ||
            target.pos.y < 0 || target.pos.y >= height_ || !waypoints_valid) {
            spdlog::error("Target {} at ({},{}) lies outside the {}x{} grid",
                          target.id, target.pos.x, target.pos.y, width_, height_);
            return std::nullopt;
        }
    }

    if (static_cast<long>(targets.size()) + random_targets_ > static_cast<long>(width_) * height_) {
        spdlog::error("{} targets do not fit a {}x{} grid", targets.size() + random_targets_, width_, height_);
        return std::nullopt;
    }

    // Random targets start on cells no other target holds.
    std::unordered_set<Cell, CellHash> used_cells;
    for (const auto& target : targets) {
        used_cells.insert(target.pos);
    }

    for (int i = 0; i < random_targets_; ++i) {
        Target target;
        target.id = static_cast<TargetId>(targets.size());
        do {
            target.pos = random_cell();
        } while (used_cells.count(target.pos) > 0);
        used_cells.insert(target.pos);
        target.motion = random_motion_;
        if (random_motion_ == MotionKind::Waypoints) {
            constexpr int WAYPOINTS_PER_TARGET = 3;
            target.waypoints.push_back(target.pos);
            for (int w = 1; w < WAYPOINTS_PER_TARGET; ++w) {
                target.waypoints.push_back(random_cell());
            }
        }
        targets.push_back(std::move(target));
    }

    // Motion uses a stream separate from placement.
    return GridWorld(width_, height_, std::move(targets), seed_ ^ 0x9e3779b97f4a7c15ULL, move_interval_);
}

} // namespace swarmsearch::core
