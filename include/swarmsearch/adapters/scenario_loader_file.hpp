#pragma once

#include "swarmsearch/ports/iscenario_loader.hpp"
#include <string>
#include <vector>

namespace swarmsearch::adapters {

// Text grid: '.' open cell, 'T' target, 'A' honest agent start, 'B' Byzantine
// agent start. Lines starting with '/' are comments. The 'B' agent takes
// index 0; 'A' agents follow in row-major order.
class ScenarioLoaderFile : public swarmsearch::ports::IScenarioLoader {
public:
    ScenarioLoaderFile() = default;
    ~ScenarioLoaderFile() override = default;

    std::optional<core::Scenario> load(const std::filesystem::path& path) override;

private:
    std::vector<std::string> read_grid_file(const std::filesystem::path& path) const;
    bool validate_grid(const std::vector<std::string>& grid) const;
};

} // namespace swarmsearch::adapters
