#include "swarmsearch/core/config.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace swarmsearch::core {

namespace {

bool inside(const Cell& cell, int width, int height) {
    return cell.x >= 0 && cell.x < width && cell.y >= 0 && cell.y < height;
}

} // namespace

void validate(const SimulationConfig& config) {
    if (config.width <= 0 || config.height <= 0) {
        throw ConfigError(fmt::format("grid must be positive, got {}x{}", config.width, config.height));
    }
    if (config.agent_count <= 0) {
        throw ConfigError("agent count must be positive");
    }
    if (config.target_count <= 0) {
        throw ConfigError("target count must be positive");
    }
    if (config.byzantine_index &&
        (*config.byzantine_index < 0 || *config.byzantine_index >= config.agent_count)) {
        throw ConfigError(fmt::format("byzantine index {} outside agent range [0, {})",
                                      *config.byzantine_index, config.agent_count));
    }
    if (config.communication_range < 0.0) {
        throw ConfigError("communication range must not be negative");
    }
    if (config.sensor_range < 0.0) {
        throw ConfigError("sensor range must not be negative");
    }
    if (config.vote_tolerance < 0.0) {
        throw ConfigError("vote tolerance must not be negative");
    }
    if (config.min_quorum < 1) {
        throw ConfigError("quorum must be at least 1");
    }
    if (config.step_budget < 0) {
        throw ConfigError("step budget must not be negative");
    }
    if (config.move_interval < 1) {
        throw ConfigError("target move interval must be at least 1");
    }
    if (config.byzantine_policy.lie_probability < 0.0 || config.byzantine_policy.lie_probability > 1.0) {
        throw ConfigError("lie probability must be between 0 and 1");
    }
    if (config.byzantine_policy.erratic_probability < 0.0 || config.byzantine_policy.erratic_probability > 1.0) {
        throw ConfigError("erratic move probability must be between 0 and 1");
    }

    if (config.battery) {
        const auto& battery = *config.battery;
        if (battery.capacity <= 0.0) {
            throw ConfigError("battery capacity must be positive");
        }
        if (battery.min_drain < 0.0 || battery.min_drain > battery.max_drain) {
            throw ConfigError(fmt::format("battery drain band [{}, {}] is invalid",
                                          battery.min_drain, battery.max_drain));
        }
        if (battery.drain_jitter < 0.0 || battery.drain_jitter >= 1.0) {
            throw ConfigError("battery drain jitter must be in [0, 1)");
        }
        if (battery.dropout_probability < 0.0 || battery.dropout_probability > 1.0) {
            throw ConfigError("battery dropout probability must be between 0 and 1");
        }
    }

    if (!config.agent_starts.empty()) {
        if (static_cast<int>(config.agent_starts.size()) != config.agent_count) {
            throw ConfigError(fmt::format("{} agent starts given for {} agents",
                                          config.agent_starts.size(), config.agent_count));
        }
        for (const auto& start : config.agent_starts) {
            if (!inside(start, config.width, config.height)) {
                throw ConfigError(fmt::format("agent start ({},{}) outside grid", start.x, start.y));
            }
        }
    }

    if (!config.target_positions.empty()) {
        if (static_cast<int>(config.target_positions.size()) != config.target_count) {
            throw ConfigError(fmt::format("{} target positions given for {} targets",
                                          config.target_positions.size(), config.target_count));
        }
        for (const auto& pos : config.target_positions) {
            if (!inside(pos, config.width, config.height)) {
                throw ConfigError(fmt::format("target ({},{}) outside grid", pos.x, pos.y));
            }
        }
    }
}

std::vector<Cell> lattice_layout(int agent_count, int width, int height) {
    std::vector<Cell> starts;
    if (agent_count <= 0) {
        return starts;
    }

    const int cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(agent_count))));
    const int rows = (agent_count + cols - 1) / cols;

    for (int i = 0; i < agent_count; ++i) {
        const int c = i % cols;
        const int r = i / cols;
        starts.push_back(clamp_to({(2 * c + 1) * width / (2 * cols), (2 * r + 1) * height / (2 * rows)},
                                  width, height));
    }
    return starts;
}

void apply_scenario(const Scenario& scenario, SimulationConfig& config) {
    config.width = scenario.width;
    config.height = scenario.height;
    config.agent_starts = scenario.agent_starts;
    config.agent_count = static_cast<int>(scenario.agent_starts.size());
    config.target_positions = scenario.target_positions;
    config.target_count = static_cast<int>(scenario.target_positions.size());
    config.byzantine_index = scenario.byzantine_index;
}

ConsensusParams consensus_params(const SimulationConfig& config) {
    ConsensusParams params;
    params.communication_range = config.communication_range;
    params.vote_tolerance = config.vote_tolerance;
    params.min_quorum = config.min_quorum;
    params.byzantine = config.byzantine_policy;
    return params;
}

MotionKind parse_motion(const std::string& name) {
    if (name == "static") return MotionKind::Stationary;
    if (name == "random") return MotionKind::RandomWalk;
    if (name == "waypoint") return MotionKind::Waypoints;
    throw ConfigError(fmt::format("unknown target motion '{}'", name));
}

LieKind parse_lie(const std::string& name) {
    if (name == "offset") return LieKind::FixedOffset;
    if (name == "mimic") return LieKind::MimicOtherTarget;
    if (name == "random") return LieKind::RandomDistortion;
    throw ConfigError(fmt::format("unknown lie policy '{}'", name));
}

std::optional<AgentId> parse_byzantine(const std::string& value) {
    if (value == "none") {
        return std::nullopt;
    }

    std::size_t consumed = 0;
    int index = -1;
    try {
        index = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigError(fmt::format("byzantine must be an agent index or 'none', got '{}'", value));
    }
    if (consumed != value.size()) {
        throw ConfigError(fmt::format("byzantine must be an agent index or 'none', got '{}'", value));
    }
    return index;
}

} // namespace swarmsearch::core
