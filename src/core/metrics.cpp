#include "swarmsearch/core/metrics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace swarmsearch::core {

void MetricsEvaluator::record_exchange(const ExchangeStats& stats) {
    claims_sent_ += stats.claims_sent;
    belief_updates_ += stats.updates;
    belief_flips_ += stats.flips;
    ties_ += stats.ties;
}

void MetricsEvaluator::observe(const StepSnapshot& snapshot) {
    if (starts_.empty()) {
        for (const auto& agent : snapshot.agents) {
            starts_.push_back(agent.pos);
        }
    }
    if (finds_.size() < snapshot.targets.size()) {
        finds_.resize(snapshot.targets.size());
    }

    for (const auto& target : snapshot.targets) {
        if (finds_[target.id]) {
            continue;
        }

        auto finder = std::find_if(snapshot.agents.begin(), snapshot.agents.end(),
            [&](const AgentView& a) { return a.pos == target.pos; });
        if (finder == snapshot.agents.end()) {
            continue;
        }

        int optimal = std::numeric_limits<int>::max();
        for (const auto& start : starts_) {
            optimal = std::min(optimal, manhattan(start, target.pos));
        }

        int fleet = 0;
        for (const auto& agent : snapshot.agents) {
            fleet += agent.distance_travelled;
        }

        finds_[target.id] = TargetFind{
            target.id, snapshot.tick, finder->id, target.pos, finder->distance_travelled, fleet, optimal
        };
        spdlog::info("Target {} located by agent {} at ({},{}) on tick {}, fleet travel {} (optimum {})",
                     target.id, finder->id, target.pos.x, target.pos.y, snapshot.tick, fleet, optimal);
    }

    last_tick_ = snapshot.tick;
}

std::optional<double> MetricsEvaluator::competitive_ratio() const {
    long actual = 0;
    long optimal = 0;
    bool any = false;

    // Travel only grows, so the latest find carries the fleet total.
    for (const auto& find : finds_) {
        if (!find) {
            continue;
        }
        any = true;
        actual = std::max<long>(actual, find->fleet_distance);
        optimal += find->optimal_distance;
    }

    if (!any || optimal == 0) {
        return std::nullopt;
    }
    return static_cast<double>(actual) / static_cast<double>(optimal);
}

std::optional<double> MetricsEvaluator::target_ratio(TargetId target) const {
    if (target < 0 || static_cast<std::size_t>(target) >= finds_.size() || !finds_[target]) {
        return std::nullopt;
    }
    const auto& find = *finds_[target];
    if (find.optimal_distance == 0) {
        return std::nullopt;
    }
    return static_cast<double>(find.fleet_distance) / find.optimal_distance;
}

int MetricsEvaluator::located_count() const {
    return static_cast<int>(std::count_if(finds_.begin(), finds_.end(),
        [](const auto& find) { return find.has_value(); }));
}

MetricsSummary MetricsEvaluator::summarize() const {
    MetricsSummary summary;
    summary.ticks = last_tick_;
    summary.targets_total = static_cast<int>(finds_.size());
    summary.targets_located = located_count();
    summary.competitive_ratio = competitive_ratio();
    summary.claims_sent = claims_sent_;
    summary.belief_updates = belief_updates_;
    summary.belief_flips = belief_flips_;
    summary.ties = ties_;
    summary.sightings = sightings_.load(std::memory_order_relaxed);
    summary.wall_time = wall_time_;
    return summary;
}

void MetricsEvaluator::reset() {
    sightings_.store(0, std::memory_order_relaxed);
    claims_sent_ = 0;
    belief_updates_ = 0;
    belief_flips_ = 0;
    ties_ = 0;
    starts_.clear();
    finds_.clear();
    last_tick_ = 0;
    wall_time_ = std::chrono::milliseconds{0};
}

std::optional<double> belief_accuracy(const StepSnapshot& snapshot, double tolerance) {
    int held = 0;
    int accurate = 0;

    for (const auto& agent : snapshot.agents) {
        if (agent.is_byzantine) {
            continue;
        }
        for (const auto& belief : agent.beliefs) {
            auto truth = std::find_if(snapshot.targets.begin(), snapshot.targets.end(),
                [&](const TargetView& t) { return t.id == belief.target; });
            if (truth == snapshot.targets.end()) {
                continue;
            }
            ++held;
            if (euclidean(truth->pos, belief.position) <= tolerance) {
                ++accurate;
            }
        }
    }

    if (held == 0) {
        return std::nullopt;
    }
    return static_cast<double>(accurate) / held;
}

void emit_metrics_json(const std::filesystem::path& path, const MetricsSummary& summary) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open metrics file: " + path.string());
    }

    file << "{";
    file << "\"ticks\":" << summary.ticks << ",";
    file << "\"targets_total\":" << summary.targets_total << ",";
    file << "\"targets_located\":" << summary.targets_located << ",";
    file << "\"competitive_ratio\":";
    if (summary.competitive_ratio) {
        file << std::fixed << std::setprecision(4) << *summary.competitive_ratio;
    } else {
        file << "null";
    }
    file << ",";
    file << "\"claims_sent\":" << summary.claims_sent << ",";
    file << "\"belief_updates\":" << summary.belief_updates << ",";
    file << "\"belief_flips\":" << summary.belief_flips << ",";
    file << "\"ties\":" << summary.ties << ",";
    file << "\"sightings\":" << summary.sightings << ",";
    file << "\"wall_time_ms\":" << summary.wall_time.count();
    file << "}\n";
}

} // namespace swarmsearch::core
