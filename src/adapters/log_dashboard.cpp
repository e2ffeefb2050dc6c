#include "swarmsearch/adapters/log_dashboard.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>

namespace swarmsearch::adapters {

namespace {

std::string format_ratio(const std::optional<double>& value) {
    return value ? fmt::format("{:.2f}", *value) : std::string("undefined");
}

} // namespace

LogDashboard::LogDashboard(int interval, double tolerance)
    : interval_(std::max(1, interval))
    , tolerance_(tolerance) {
}

void LogDashboard::on_tick(const core::StepSnapshot& snapshot) {
    ++frames_;

    const auto accuracy = core::belief_accuracy(snapshot, tolerance_);
    const auto level = (snapshot.tick % interval_ == 0) ? spdlog::level::info : spdlog::level::debug;

    spdlog::log(level, "Tick {:>3} | ratio {} | honest belief accuracy {}",
                snapshot.tick, format_ratio(snapshot.competitive_ratio), format_ratio(accuracy));

    if (spdlog::should_log(spdlog::level::debug)) {
        log_agents(snapshot);
    }
}

void LogDashboard::log_agents(const core::StepSnapshot& snapshot) const {
    for (const auto& agent : snapshot.agents) {
        std::string beliefs;
        for (const auto& belief : agent.beliefs) {
            beliefs += fmt::format(" t{}=({},{})x{}", belief.target, belief.position.x,
                                   belief.position.y, belief.confidence);
        }
        const auto power = agent.battery ? fmt::format(" battery {:.1f}", *agent.battery) : std::string();
        spdlog::debug("  agent {}{} at ({},{}) travelled {}{}:{}", agent.id,
                      agent.is_byzantine ? "*" : "", agent.pos.x, agent.pos.y,
                      agent.distance_travelled, power, beliefs.empty() ? " searching" : beliefs);
    }
}

void LogDashboard::on_finish(const core::MetricsSummary& summary) {
    spdlog::info("=== Search Results ===");
    spdlog::info("Ticks: {}", summary.ticks);
    spdlog::info("Targets located: {}/{}", summary.targets_located, summary.targets_total);
    spdlog::info("Competitive ratio: {}", format_ratio(summary.competitive_ratio));
    spdlog::info("Claims sent: {}", summary.claims_sent);
    spdlog::info("Belief updates: {} (flips {}, ties {})",
                 summary.belief_updates, summary.belief_flips, summary.ties);
    spdlog::info("Sightings: {}", summary.sightings);
    spdlog::info("Wall time: {}ms", summary.wall_time.count());
}

} // namespace swarmsearch::adapters
