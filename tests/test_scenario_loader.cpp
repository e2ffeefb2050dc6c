#include <catch2/catch_test_macros.hpp>
#include "swarmsearch/adapters/scenario_loader_file.hpp"
#include <filesystem>
#include <fstream>

using namespace swarmsearch::adapters;
using swarmsearch::core::Cell;
namespace fs = std::filesystem;

namespace {

fs::path write_scenario(const std::string& name, const std::string& contents) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream file(path);
    file << contents;
    return path;
}

} // namespace

TEST_CASE("ScenarioLoaderFile operations", "[scenario_loader]") {
    ScenarioLoaderFile loader;

    SECTION("Load valid scenario") {
        auto path = write_scenario("test_scenario.txt",
            ".....\n"
            ".A.T.\n"
            "..B..\n"
            "A....\n");

        auto scenario = loader.load(path);
        REQUIRE(scenario.has_value());
        REQUIRE(scenario->width == 5);
        REQUIRE(scenario->height == 4);
        REQUIRE(scenario->target_positions == std::vector<Cell>{{3, 1}});
        REQUIRE(scenario->byzantine_index == 0);

        const std::vector<Cell> starts{{2, 2}, {1, 1}, {0, 3}};
        REQUIRE(scenario->agent_starts == starts);

        fs::remove(path);
    }

    SECTION("Scenario without a Byzantine marker") {
        auto path = write_scenario("test_scenario_honest.txt", "A.T\n...\n..A\n");

        auto scenario = loader.load(path);
        REQUIRE(scenario.has_value());
        REQUIRE(!scenario->byzantine_index);
        REQUIRE(scenario->agent_starts.size() == 2);

        fs::remove(path);
    }

    SECTION("Skip comments, blank lines and carriage returns") {
        auto path = write_scenario("test_scenario_comments.txt",
            "// header\n"
            "\n"
            "A..\r\n"
            "// middle\n"
            "..T\r\n");

        auto scenario = loader.load(path);
        REQUIRE(scenario.has_value());
        REQUIRE(scenario->width == 3);
        REQUIRE(scenario->height == 2);

        fs::remove(path);
    }

    SECTION("Reject non-existent file") {
        REQUIRE(!loader.load("/non/existent/scenario.txt"));
    }

    SECTION("Reject invalid characters") {
        auto path = write_scenario("test_scenario_invalid.txt", "A.#\n..T\n");
        REQUIRE(!loader.load(path));
        fs::remove(path);
    }

    SECTION("Reject ragged rows") {
        auto path = write_scenario("test_scenario_ragged.txt", "A...\n..T\n");
        REQUIRE(!loader.load(path));
        fs::remove(path);
    }

    SECTION("Reject two Byzantine agents") {
        auto path = write_scenario("test_scenario_two_b.txt", "B.B\nA.T\n");
        REQUIRE(!loader.load(path));
        fs::remove(path);
    }

    SECTION("Reject scenarios without agents or targets") {
        auto no_targets = write_scenario("test_scenario_no_t.txt", "A..\n...\n");
        auto no_agents = write_scenario("test_scenario_no_a.txt", "T..\n...\n");
        REQUIRE(!loader.load(no_targets));
        REQUIRE(!loader.load(no_agents));
        fs::remove(no_targets);
        fs::remove(no_agents);
    }
}

TEST_CASE("Bundled sample scenario", "[scenario_loader]") {
    ScenarioLoaderFile loader;
    auto scenario = loader.load(fs::path(SWARMSEARCH_SCENARIO_DIR) / "sample.txt");

    REQUIRE(scenario.has_value());
    REQUIRE(scenario->width == 20);
    REQUIRE(scenario->height == 20);
    REQUIRE(scenario->byzantine_index == 0);

    const std::vector<Cell> starts{{10, 10}, {4, 3}, {8, 3}, {15, 6}, {10, 14}};
    REQUIRE(scenario->agent_starts == starts);

    const std::vector<Cell> targets{{2, 2}, {18, 4}, {10, 15}};
    REQUIRE(scenario->target_positions == targets);
}
