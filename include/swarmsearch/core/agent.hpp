#pragma once

#include "swarmsearch/core/battery.hpp"
#include "swarmsearch/core/belief.hpp"
#include "swarmsearch/core/spiral.hpp"
#include "swarmsearch/core/vote.hpp"
#include "swarmsearch/core/world.hpp"
#include <boost/circular_buffer.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace swarmsearch::core {

class Agent {
public:
    static constexpr std::size_t DEFAULT_HISTORY = 20;

    Agent(AgentId id, Cell start, bool byzantine, std::size_t target_count,
          std::size_t history_capacity = DEFAULT_HISTORY);

    AgentId id() const noexcept { return id_; }
    const Cell& position() const noexcept { return position_; }
    const Cell& start() const noexcept { return start_; }
    bool is_byzantine() const noexcept { return byzantine_; }
    int distance_travelled() const noexcept { return distance_travelled_; }

    const BeliefStore& beliefs() const noexcept { return beliefs_; }
    BeliefStore& beliefs() noexcept { return beliefs_; }
    const SpiralSearch& search() const noexcept { return search_; }
    const boost::circular_buffer<Cell>& history() const noexcept { return history_; }
    const std::optional<Battery>& battery() const noexcept { return battery_; }

    std::optional<TargetId> pursuit() const noexcept { return pursuit_; }
    bool has_located(TargetId target) const { return located_.at(target); }

    void fit_battery(const BatteryParams& params, uint64_t seed);

    // Returns the number of targets seen this tick.
    int observe(const WorldView& view, double sensor_range);

    // True when the belief moved by more than `tolerance` (a flip).
    bool accept_consensus(TargetId target, const VoteBucket& winner, Tick tick, double tolerance);

    bool follow_lead(TargetId target, const Cell& position);

    bool transmits();

    void move(int width, int height);

    void wander(const Cell& step, int width, int height);

private:
    AgentId id_;
    Cell start_;
    Cell position_;
    bool byzantine_;
    BeliefStore beliefs_;
    SpiralSearch search_;
    boost::circular_buffer<Cell> history_;
    std::vector<bool> located_;
    std::optional<TargetId> pursuit_;
    std::optional<Battery> battery_;
    int distance_travelled_ = 0;

    std::optional<std::pair<TargetId, Cell>> nearest_goal() const;
    void drop_pursuit_of(TargetId target);
    bool draw_power();
    void step_to(Cell next, int width, int height);
};

} // namespace swarmsearch::core
