#include "swarmsearch/adapters/scenario_loader_file.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace swarmsearch::adapters {

std::optional<core::Scenario> ScenarioLoaderFile::load(const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    if (!fs::exists(path)) {
        spdlog::error("Scenario file does not exist: {}", path.string());
        return std::nullopt;
    }

    auto grid = read_grid_file(path);
    if (grid.empty() || !validate_grid(grid)) {
        spdlog::error("Invalid scenario format in file: {}", path.string());
        return std::nullopt;
    }

    core::Scenario scenario;
    scenario.width = static_cast<int>(grid[0].size());
    scenario.height = static_cast<int>(grid.size());

    std::optional<core::Cell> byzantine_start;
    std::vector<core::Cell> honest_starts;

    for (int y = 0; y < scenario.height; ++y) {
        for (int x = 0; x < scenario.width; ++x) {
            switch (grid[y][x]) {
            case 'T': scenario.target_positions.push_back({x, y}); break;
            case 'A': honest_starts.push_back({x, y}); break;
            case 'B': byzantine_start = core::Cell{x, y}; break;
            default: break;
            }
        }
    }

    if (byzantine_start) {
        scenario.agent_starts.push_back(*byzantine_start);
        scenario.byzantine_index = 0;
    }
    scenario.agent_starts.insert(scenario.agent_starts.end(), honest_starts.begin(), honest_starts.end());

    spdlog::info("Loaded scenario {}x{} with {} agents and {} targets from {}",
                 scenario.width, scenario.height, scenario.agent_starts.size(),
                 scenario.target_positions.size(), path.string());
    return scenario;
}

std::vector<std::string> ScenarioLoaderFile::read_grid_file(const std::filesystem::path& path) const {
    std::vector<std::string> grid;
    std::ifstream file(path);

    if (!file) {
        spdlog::error("Failed to open file: {}", path.string());
        return {};
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '/') {
            continue;
        }

        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);

        if (!line.empty()) {
            grid.push_back(line);
        }
    }

    return grid;
}

bool ScenarioLoaderFile::validate_grid(const std::vector<std::string>& grid) const {
    const size_t width = grid[0].size();
    int agents = 0;
    int byzantine = 0;
    int targets = 0;

    for (const auto& row : grid) {
        if (row.size() != width) {
            spdlog::error("Inconsistent row width: expected {}, got {}", width, row.size());
            return false;
        }

        for (char c : row) {
            switch (c) {
            case '.': break;
            case 'T': ++targets; break;
            case 'A': ++agents; break;
            case 'B': ++agents; ++byzantine; break;
            default:
                spdlog::error("Invalid character in scenario: '{}'", c);
                return false;
            }
        }
    }

    if (byzantine > 1) {
        spdlog::error("Scenario marks {} Byzantine agents, at most one is supported", byzantine);
        return false;
    }
    if (agents == 0 || targets == 0) {
        spdlog::error("Scenario needs at least one agent and one target (got {} and {})", agents, targets);
        return false;
    }

    return true;
}

} // namespace swarmsearch::adapters
