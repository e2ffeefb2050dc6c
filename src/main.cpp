#include "swarmsearch/simulation.hpp"
#include "swarmsearch/adapters/local_claim_channel.hpp"
#include "swarmsearch/adapters/log_dashboard.hpp"
#include "swarmsearch/adapters/scenario_loader_file.hpp"
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;
namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    try {
        // Setup logging
        auto console = spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);

        po::options_description desc("Byzantine-tolerant Swarm Search - Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("config,c", po::value<std::string>(), "Read options from an INI-style file")
            ("scenario", po::value<std::string>(), "Scenario grid file (overrides size, agents, targets)")
            ("width", po::value<int>()->default_value(20), "Grid width")
            ("height", po::value<int>()->default_value(20), "Grid height")
            ("agents,n", po::value<int>()->default_value(5), "Number of agents")
            ("targets,t", po::value<int>()->default_value(3), "Number of targets")
            ("byzantine,b", po::value<std::string>()->default_value("0"), "Byzantine agent index or 'none'")
            ("comm-range", po::value<double>()->default_value(5.0), "Communication range (cells)")
            ("sensor-range", po::value<double>()->default_value(3.0), "Sensor range (cells)")
            ("tolerance", po::value<double>()->default_value(1.0), "Vote bucketing tolerance (cells)")
            ("quorum", po::value<int>()->default_value(2), "Minimum votes for a consensus update")
            ("steps", po::value<int>()->default_value(100), "Step budget")
            ("seed,s", po::value<uint64_t>()->default_value(42), "Random seed")
            ("motion", po::value<std::string>()->default_value("random"), "Target motion: static|random|waypoint")
            ("move-interval", po::value<int>()->default_value(5), "Ticks between target moves")
            ("lie", po::value<std::string>()->default_value("offset"), "Byzantine claims: offset|mimic|random")
            ("lie-offset-x", po::value<int>()->default_value(3), "Fabricated x offset")
            ("lie-offset-y", po::value<int>()->default_value(3), "Fabricated y offset")
            ("erratic", po::value<double>()->default_value(0.0), "Chance per tick of a random Byzantine step")
            ("battery", "Fit every agent with a draining battery")
            ("battery-capacity", po::value<double>()->default_value(100.0), "Battery capacity")
            ("dashboard-interval", po::value<int>()->default_value(10), "Ticks between dashboard lines")
            ("sequential", "Observe agents one by one instead of on a thread pool")
            ("out-metrics", po::value<std::string>()->default_value(""), "Output metrics JSON file")
            ("verbose,v", "Enable verbose logging")
            ("quiet,q", "Suppress info messages");

        // Parse command line, then the optional config file
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Byzantine-tolerant Swarm Search\n";
            std::cout << "Decentralized target search with majority-vote consensus\n\n";
            std::cout << desc << "\n";
            std::cout << "Example:\n";
            std::cout << "  ./swarmsearch_app --scenario scenarios/sample.txt --sensor-range 2 \\\n";
            std::cout << "                    --motion static --steps 100 --out-metrics metrics.json\n";
            return 0;
        }

        if (vm.count("config")) {
            const fs::path config_path = vm["config"].as<std::string>();
            std::ifstream config_file(config_path);
            if (!config_file) {
                spdlog::error("Config file does not exist: {}", config_path.string());
                return 1;
            }
            po::store(po::parse_config_file(config_file, desc), vm);
        }

        po::notify(vm);

        if (vm.count("verbose")) {
            spdlog::set_level(spdlog::level::debug);
        } else if (vm.count("quiet")) {
            spdlog::set_level(spdlog::level::warn);
        } else {
            spdlog::set_level(spdlog::level::info);
        }

        // Build configuration
        swarmsearch::core::SimulationConfig config;
        config.width = vm["width"].as<int>();
        config.height = vm["height"].as<int>();
        config.agent_count = vm["agents"].as<int>();
        config.target_count = vm["targets"].as<int>();
        config.communication_range = vm["comm-range"].as<double>();
        config.sensor_range = vm["sensor-range"].as<double>();
        config.vote_tolerance = vm["tolerance"].as<double>();
        config.min_quorum = vm["quorum"].as<int>();
        config.step_budget = vm["steps"].as<int>();
        config.seed = vm["seed"].as<uint64_t>();
        config.target_motion = swarmsearch::core::parse_motion(vm["motion"].as<std::string>());
        config.move_interval = vm["move-interval"].as<int>();
        config.byzantine_policy.kind = swarmsearch::core::parse_lie(vm["lie"].as<std::string>());
        config.byzantine_policy.offset = {vm["lie-offset-x"].as<int>(), vm["lie-offset-y"].as<int>()};
        config.byzantine_policy.erratic_probability = vm["erratic"].as<double>();
        config.parallel_observation = vm.count("sequential") == 0;
        config.metrics_output = vm["out-metrics"].as<std::string>();

        if (vm.count("battery")) {
            swarmsearch::core::BatteryParams battery;
            battery.capacity = vm["battery-capacity"].as<double>();
            config.battery = battery;
        } else if (!vm["battery-capacity"].defaulted()) {
            spdlog::warn("--battery-capacity is ignored without --battery");
        }

        config.byzantine_index = swarmsearch::core::parse_byzantine(vm["byzantine"].as<std::string>());

        // Load scenario
        if (vm.count("scenario")) {
            swarmsearch::ports::ScenarioLoaderPtr loader = std::make_unique<swarmsearch::adapters::ScenarioLoaderFile>();
            auto scenario = loader->load(vm["scenario"].as<std::string>());
            if (!scenario) {
                spdlog::error("Failed to load scenario");
                return 1;
            }
            for (const char* overridden : {"width", "height", "agents", "targets", "byzantine"}) {
                if (!vm[overridden].defaulted()) {
                    spdlog::warn("--{} is ignored, the scenario file sets it", overridden);
                }
            }
            swarmsearch::core::apply_scenario(*scenario, config);
        }

        // Create simulation
        swarmsearch::adapters::LogDashboard dashboard(vm["dashboard-interval"].as<int>(), config.vote_tolerance);
        swarmsearch::Simulation sim(config, std::make_unique<swarmsearch::adapters::LocalClaimChannel>());
        sim.add_observer(dashboard);

        spdlog::info("Starting search with {} agents, byzantine {}, seed {}",
                     config.agent_count,
                     config.byzantine_index ? std::to_string(*config.byzantine_index) : "none",
                     config.seed);
        spdlog::info("Ranges: communication={:.1f}, sensor={:.1f}, tolerance={:.1f}",
                     config.communication_range, config.sensor_range, config.vote_tolerance);

        // Run simulation
        sim.run();
        return 0;

    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const swarmsearch::core::ConfigError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}
