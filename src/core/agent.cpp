#include "swarmsearch/core/agent.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace swarmsearch::core {

Agent::Agent(AgentId id, Cell start, bool byzantine, std::size_t target_count,
             std::size_t history_capacity)
    : id_(id)
    , start_(start)
    , position_(start)
    , byzantine_(byzantine)
    , beliefs_(target_count)
    , search_(start)
    , history_(std::max<std::size_t>(1, history_capacity))
    , located_(target_count, false) {
    history_.push_back(start);
}

void Agent::fit_battery(const BatteryParams& params, uint64_t seed) {
    battery_.emplace(params, seed);
}

int Agent::observe(const WorldView& view, double sensor_range) {
    beliefs_.clear_observations();

    int sightings = 0;
    for (const auto& target : view.targets_within(position_, sensor_range)) {
        beliefs_.observe(target.id, target.pos, view.tick);
        ++sightings;

        if (target.pos == position_ && !located_[target.id]) {
            located_[target.id] = true;
            spdlog::debug("Agent {} located target {} at ({},{}) on tick {}",
                          id_, target.id, target.pos.x, target.pos.y, view.tick);
        }
    }

    // A believed position inside sensor range with nothing seen there is stale.
    for (TargetId target = 0; target < static_cast<TargetId>(beliefs_.size()); ++target) {
        if (beliefs_.observation(target)) {
            continue;
        }
        if (const auto& belief = beliefs_.get(target);
            belief && within_range(position_, belief->position, sensor_range)) {
            spdlog::debug("Agent {} dropped stale belief for target {} at ({},{})",
                          id_, target, belief->position.x, belief->position.y);
            beliefs_.invalidate(target);
            drop_pursuit_of(target);
        }
        if (const auto& lead = beliefs_.lead(target);
            lead && within_range(position_, *lead, sensor_range)) {
            beliefs_.drop_lead(target);
            drop_pursuit_of(target);
        }
    }

    return sightings;
}

bool Agent::accept_consensus(TargetId target, const VoteBucket& winner, Tick tick, double tolerance) {
    const auto& current = beliefs_.get(target);
    const bool flipped = current && euclidean(current->position, winner.anchor) > tolerance;

    beliefs_.adopt(target, Belief{
        winner.anchor,
        winner.votes,
        tick,
        winner.includes_self ? Provenance::SelfObserved : Provenance::Consensus
    });

    if (flipped) {
        drop_pursuit_of(target);
    }
    return flipped;
}

bool Agent::follow_lead(TargetId target, const Cell& position) {
    if (beliefs_.has(target) || located_.at(target)) {
        return false;
    }
    beliefs_.set_lead(target, position);
    return true;
}

bool Agent::transmits() {
    return !battery_ || battery_->transmits();
}

void Agent::drop_pursuit_of(TargetId target) {
    if (pursuit_ && *pursuit_ == target) {
        pursuit_.reset();
        search_.reset(position_);
    }
}

// Beliefs first, leads where there is none; located targets are done.
std::optional<std::pair<TargetId, Cell>> Agent::nearest_goal() const {
    std::optional<std::pair<TargetId, Cell>> nearest;
    int best = std::numeric_limits<int>::max();

    for (TargetId target = 0; target < static_cast<TargetId>(beliefs_.size()); ++target) {
        if (located_[target]) {
            continue;
        }

        std::optional<Cell> goal;
        if (const auto& belief = beliefs_.get(target)) {
            goal = belief->position;
        } else {
            goal = beliefs_.lead(target);
        }
        if (!goal) {
            continue;
        }

        const int d = manhattan(position_, *goal);
        if (d < best) {
            best = d;
            nearest = std::make_pair(target, *goal);
        }
    }
    return nearest;
}

bool Agent::draw_power() {
    if (!battery_) {
        return true;
    }
    const bool was_depleted = battery_->depleted();
    const bool powered = battery_->draw();
    if (!powered && !was_depleted) {
        spdlog::debug("Agent {} ran out of power at ({},{})", id_, position_.x, position_.y);
    }
    return powered;
}

void Agent::move(int width, int height) {
    if (!draw_power()) {
        return;
    }

    Cell next = position_;
    if (auto goal = nearest_goal()) {
        pursuit_ = goal->first;
        next = step_toward(position_, goal->second);
    } else {
        pursuit_.reset();
        next = search_.next_move(position_, width, height);
    }
    step_to(next, width, height);
}

void Agent::wander(const Cell& step, int width, int height) {
    if (!draw_power()) {
        return;
    }
    step_to({position_.x + step.x, position_.y + step.y}, width, height);
}

void Agent::step_to(Cell next, int width, int height) {
    next = clamp_to(next, width, height);
    if (next != position_) {
        distance_travelled_ += manhattan(position_, next);
        position_ = next;
        history_.push_back(position_);
    }
}

} // namespace swarmsearch::core
