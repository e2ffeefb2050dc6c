#pragma once

#include "swarmsearch/core/belief.hpp"
#include "swarmsearch/core/consensus.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <vector>

namespace swarmsearch::core {

struct BeliefView {
    TargetId target;
    Cell position;
    int confidence;
    Tick updated_tick;
    Provenance provenance;

    bool operator==(const BeliefView&) const = default;
};

struct AgentView {
    AgentId id;
    Cell pos;
    bool is_byzantine;
    std::vector<BeliefView> beliefs;
    std::vector<Cell> recent_positions;
    int distance_travelled;
    std::optional<double> battery;

    bool operator==(const AgentView&) const = default;
};

struct TargetView {
    TargetId id;
    Cell pos;

    bool operator==(const TargetView&) const = default;
};

struct StepSnapshot {
    Tick tick = 0;
    std::vector<TargetView> targets;
    std::vector<AgentView> agents;
    std::optional<double> competitive_ratio;

    bool operator==(const StepSnapshot&) const = default;
};

struct TargetFind {
    TargetId target;
    Tick tick;
    AgentId finder;
    Cell point;
    int finder_distance;
    int fleet_distance;     // every agent's travel up to the find
    int optimal_distance;
};

struct MetricsSummary {
    Tick ticks = 0;
    int targets_total = 0;
    int targets_located = 0;
    std::optional<double> competitive_ratio;
    uint64_t claims_sent = 0;
    uint64_t belief_updates = 0;
    uint64_t belief_flips = 0;
    uint64_t ties = 0;
    uint64_t sightings = 0;
    std::chrono::milliseconds wall_time{0};
};

class MetricsEvaluator {
public:
    MetricsEvaluator() = default;

    // Safe to call from the observation workers.
    void record_sighting(int count = 1) { sightings_.fetch_add(count, std::memory_order_relaxed); }

    void record_exchange(const ExchangeStats& stats);

    void observe(const StepSnapshot& snapshot);

    // Fleet travel up to the latest find over the sum of offline optima of
    // the located targets. Undefined with nothing located or a zero optimum.
    std::optional<double> competitive_ratio() const;
    std::optional<double> target_ratio(TargetId target) const;

    const std::vector<std::optional<TargetFind>>& finds() const noexcept { return finds_; }
    int located_count() const;

    MetricsSummary summarize() const;
    void reset();

    void start_timer() { start_time_ = std::chrono::steady_clock::now(); }
    void stop_timer() {
        auto end_time = std::chrono::steady_clock::now();
        wall_time_ = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_);
    }

private:
    std::atomic<uint64_t> sightings_{0};
    uint64_t claims_sent_ = 0;
    uint64_t belief_updates_ = 0;
    uint64_t belief_flips_ = 0;
    uint64_t ties_ = 0;

    std::vector<Cell> starts_;
    std::vector<std::optional<TargetFind>> finds_;
    Tick last_tick_ = 0;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::milliseconds wall_time_{0};
};

// Undefined when no honest agent holds a belief.
std::optional<double> belief_accuracy(const StepSnapshot& snapshot, double tolerance);

void emit_metrics_json(const std::filesystem::path& path, const MetricsSummary& summary);

} // namespace swarmsearch::core
