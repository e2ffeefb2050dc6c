#pragma once

#include "swarmsearch/core/config.hpp"
#include <filesystem>
#include <memory>
#include <optional>

namespace swarmsearch::ports {

class IScenarioLoader {
public:
    virtual ~IScenarioLoader() = default;

    virtual std::optional<core::Scenario> load(const std::filesystem::path& path) = 0;
};

using ScenarioLoaderPtr = std::unique_ptr<IScenarioLoader>;

} // namespace swarmsearch::ports
