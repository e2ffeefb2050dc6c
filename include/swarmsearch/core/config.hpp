#pragma once

#include "swarmsearch/core/battery.hpp"
#include "swarmsearch/core/consensus.hpp"
#include "swarmsearch/core/world.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace swarmsearch::core {

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct SimulationConfig {
    int width = 20;
    int height = 20;
    int agent_count = 5;
    int target_count = 3;
    std::optional<AgentId> byzantine_index = 0;

    double communication_range = 5.0;
    double sensor_range = 3.0;
    double vote_tolerance = 1.0;
    int min_quorum = 2;
    int step_budget = 100;
    uint64_t seed = 42;

    MotionKind target_motion = MotionKind::RandomWalk;
    int move_interval = 5;
    ByzantinePolicy byzantine_policy;

    // Explicit placements; empty means random targets and the lattice layout.
    std::vector<Cell> agent_starts;
    std::vector<Cell> target_positions;

    // Unset means unlimited power.
    std::optional<BatteryParams> battery;

    std::size_t history_capacity = 20;
    bool parallel_observation = true;

    std::filesystem::path metrics_output;
};

struct Scenario {
    int width = 0;
    int height = 0;
    std::vector<Cell> agent_starts;
    std::vector<Cell> target_positions;
    std::optional<AgentId> byzantine_index;
};

void apply_scenario(const Scenario& scenario, SimulationConfig& config);

// Throws ConfigError describing the first violated constraint.
void validate(const SimulationConfig& config);

std::vector<Cell> lattice_layout(int agent_count, int width, int height);

ConsensusParams consensus_params(const SimulationConfig& config);

MotionKind parse_motion(const std::string& name);
LieKind parse_lie(const std::string& name);

// Agent index, or "none" for an all-honest swarm.
std::optional<AgentId> parse_byzantine(const std::string& value);

} // namespace swarmsearch::core
