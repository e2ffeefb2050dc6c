#include "swarmsearch/simulation.hpp"
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <exception>
#include <latch>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace swarmsearch {

Simulation::Simulation(core::SimulationConfig config, std::unique_ptr<ports::IClaimChannel> channel)
    : config_(checked(std::move(config)))
    , channel_(required(std::move(channel)))
    , world_(build_world(config_))
    , agents_(build_agents(config_))
    , engine_(core::consensus_params(config_), *channel_, config_.width, config_.height,
              config_.seed + 1)
    , motion_rng_(config_.seed + 2) {
    spdlog::info("Initialized {}x{} grid with {} agents and {} targets (seed {})",
                 config_.width, config_.height, agents_.size(), world_.targets().size(), config_.seed);
    if (config_.byzantine_index) {
        spdlog::debug("Agent {} fabricates its claims", *config_.byzantine_index);
    }
    if (config_.battery) {
        spdlog::debug("Battery model on, capacity {:.1f}", config_.battery->capacity);
    }

    if (config_.parallel_observation && agents_.size() > 1) {
        const auto workers = std::max(1u, std::min<unsigned>(std::thread::hardware_concurrency(),
                                                             static_cast<unsigned>(agents_.size())));
        pool_ = std::make_unique<boost::asio::thread_pool>(workers);
        spdlog::debug("Observation pool with {} workers", workers);
    }

    // Tick 0: starts fix the offline optimum.
    snapshot_ = make_snapshot();
    metrics_.observe(snapshot_);
    snapshot_.competitive_ratio = metrics_.competitive_ratio();
}

core::SimulationConfig Simulation::checked(core::SimulationConfig config) {
    core::validate(config);
    return config;
}

std::unique_ptr<ports::IClaimChannel> Simulation::required(std::unique_ptr<ports::IClaimChannel> channel) {
    if (!channel) {
        throw std::invalid_argument("simulation needs a claim channel");
    }
    return channel;
}

core::GridWorld Simulation::build_world(const core::SimulationConfig& config) {
    core::WorldBuilder builder(config.seed);
    builder.with_dimensions(config.width, config.height)
           .with_move_interval(config.move_interval);

    if (config.target_positions.empty()) {
        builder.with_random_targets(config.target_count, config.target_motion);
    } else {
        for (const auto& pos : config.target_positions) {
            std::vector<core::Cell> waypoints;
            if (config.target_motion == core::MotionKind::Waypoints) {
                // Patrol between the start and its mirror column.
                waypoints = {pos, {config.width - 1 - pos.x, pos.y}};
            }
            builder.with_target(pos, config.target_motion, std::move(waypoints));
        }
    }

    auto world = builder.build();
    if (!world) {
        throw core::ConfigError("target placement does not fit the grid");
    }
    return std::move(*world);
}

std::vector<core::Agent> Simulation::build_agents(const core::SimulationConfig& config) {
    const auto starts = config.agent_starts.empty()
        ? core::lattice_layout(config.agent_count, config.width, config.height)
        : config.agent_starts;

    std::vector<core::Agent> agents;
    agents.reserve(starts.size());
    for (std::size_t i = 0; i < starts.size(); ++i) {
        const auto id = static_cast<core::AgentId>(i);
        const bool byzantine = config.byzantine_index && *config.byzantine_index == id;
        agents.emplace_back(id, starts[i], byzantine, static_cast<std::size_t>(config.target_count),
                            config.history_capacity);
        if (config.battery) {
            agents.back().fit_battery(*config.battery, config.seed + 3 + i);
        }
    }
    return agents;
}

void Simulation::add_observer(ports::ISnapshotObserver& observer) {
    observers_.push_back(&observer);
}

bool Simulation::tick() {
    if (is_complete()) {
        return false;
    }

    ++tick_;
    world_.advance();

    // Phase 1: every agent observes this tick's frozen view before any claim moves.
    const auto view = world_.snapshot();
    observe_all(view);

    // Phase 2: exchange claims, then vote.
    const auto stats = engine_.run_round(agents_, tick_);
    metrics_.record_exchange(stats);
    if (stats.pairs_in_range > 0) {
        spdlog::debug("Tick {}: {} pairs in range, {} claims, {} updates, {} flips, {} ties",
                      tick_, stats.pairs_in_range, stats.claims_sent, stats.updates,
                      stats.flips, stats.ties);
    }

    // Phase 3: move on the settled beliefs.
    move_all();

    // Publish
    snapshot_ = make_snapshot();
    metrics_.observe(snapshot_);
    snapshot_.competitive_ratio = metrics_.competitive_ratio();

    for (auto* observer : observers_) {
        observer->on_tick(snapshot_);
    }
    return true;
}

void Simulation::observe_all(const core::WorldView& view) {
    if (!pool_) {
        for (auto& agent : agents_) {
            metrics_.record_sighting(agent.observe(view, config_.sensor_range));
        }
        return;
    }

    std::latch observed(static_cast<std::ptrdiff_t>(agents_.size()));
    std::mutex failure_mutex;
    std::exception_ptr failure;

    for (auto& agent : agents_) {
        boost::asio::post(*pool_, [&, this]() {
            try {
                metrics_.record_sighting(agent.observe(view, config_.sensor_range));
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
            }
            observed.count_down();
        });
    }

    // Barrier: consensus must not start before every observation is in.
    observed.wait();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

void Simulation::move_all() {
    const auto& policy = config_.byzantine_policy;
    std::bernoulli_distribution erratic(policy.erratic_probability);

    for (auto& agent : agents_) {
        if (agent.is_byzantine() && policy.erratic_probability > 0.0 && erratic(motion_rng_)) {
            // Stay put or one step in a random direction.
            static constexpr std::array<core::Cell, 5> STEPS{{{0, 0}, {1, 0}, {-1, 0}, {0, 1}, {0, -1}}};
            std::uniform_int_distribution<std::size_t> pick(0, STEPS.size() - 1);
            agent.wander(STEPS[pick(motion_rng_)], config_.width, config_.height);
            continue;
        }
        agent.move(config_.width, config_.height);
    }
}

core::StepSnapshot Simulation::make_snapshot() const {
    core::StepSnapshot snapshot;
    snapshot.tick = tick_;

    for (const auto& target : world_.targets()) {
        snapshot.targets.push_back({target.id, target.pos});
    }

    for (const auto& agent : agents_) {
        core::AgentView view;
        view.id = agent.id();
        view.pos = agent.position();
        view.is_byzantine = agent.is_byzantine();
        view.distance_travelled = agent.distance_travelled();
        view.recent_positions.assign(agent.history().begin(), agent.history().end());
        if (agent.battery()) {
            view.battery = agent.battery()->charge();
        }

        for (core::TargetId target : agent.beliefs().known_targets()) {
            const auto& belief = *agent.beliefs().get(target);
            view.beliefs.push_back({target, belief.position, belief.confidence,
                                    belief.updated_tick, belief.provenance});
        }
        snapshot.agents.push_back(std::move(view));
    }

    return snapshot;
}

void Simulation::run() {
    spdlog::info("Starting search, budget {} ticks", config_.step_budget);
    metrics_.start_timer();

    // Main loop: the budget is the only stop condition.
    while (tick()) {
    }

    metrics_.stop_timer();

    const auto summary = metrics_.summarize();
    spdlog::info("Search finished after {} ticks, {}/{} targets located",
                 tick_, summary.targets_located, summary.targets_total);

    for (auto* observer : observers_) {
        observer->on_finish(summary);
    }
    save_outputs();
}

void Simulation::save_outputs() {
    if (config_.metrics_output.empty()) {
        return;
    }

    try {
        core::emit_metrics_json(config_.metrics_output, metrics_.summarize());
        spdlog::info("Saved metrics to {}", config_.metrics_output.string());
    } catch (const std::exception& e) {
        spdlog::error("Failed to save metrics: {}", e.what());
    }
}

} // namespace swarmsearch
