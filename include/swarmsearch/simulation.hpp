#pragma once

#include "swarmsearch/core/agent.hpp"
#include "swarmsearch/core/config.hpp"
#include "swarmsearch/core/consensus.hpp"
#include "swarmsearch/core/metrics.hpp"
#include "swarmsearch/core/world.hpp"
#include "swarmsearch/ports/iclaim_channel.hpp"
#include "swarmsearch/ports/isnapshot_observer.hpp"
#include <boost/asio/thread_pool.hpp>
#include <memory>
#include <random>
#include <vector>

namespace swarmsearch {

class Simulation {
public:
    Simulation(core::SimulationConfig config, std::unique_ptr<ports::IClaimChannel> channel);

    // Advances one tick. Returns false, changing nothing, once the step
    // budget is spent.
    bool tick();
    void run();

    bool is_complete() const noexcept { return tick_ >= config_.step_budget; }
    core::Tick current_tick() const noexcept { return tick_; }

    const core::StepSnapshot& snapshot() const noexcept { return snapshot_; }
    const core::MetricsEvaluator& metrics() const noexcept { return metrics_; }
    core::MetricsSummary summary() const { return metrics_.summarize(); }

    const core::SimulationConfig& config() const noexcept { return config_; }
    const core::GridWorld& world() const noexcept { return world_; }
    const std::vector<core::Agent>& agents() const noexcept { return agents_; }

    // Observers are not owned and must outlive the simulation's use of them.
    void add_observer(ports::ISnapshotObserver& observer);

private:
    core::SimulationConfig config_;
    std::unique_ptr<ports::IClaimChannel> channel_;
    core::GridWorld world_;
    std::vector<core::Agent> agents_;
    core::ConsensusEngine engine_;
    core::MetricsEvaluator metrics_;
    core::StepSnapshot snapshot_;
    std::vector<ports::ISnapshotObserver*> observers_;
    std::mt19937_64 motion_rng_;
    core::Tick tick_ = 0;

    // Last member: joined before the agents go away.
    std::unique_ptr<boost::asio::thread_pool> pool_;

    static core::SimulationConfig checked(core::SimulationConfig config);
    static std::unique_ptr<ports::IClaimChannel> required(std::unique_ptr<ports::IClaimChannel> channel);
    static core::GridWorld build_world(const core::SimulationConfig& config);
    static std::vector<core::Agent> build_agents(const core::SimulationConfig& config);

    void observe_all(const core::WorldView& view);
    void move_all();
    core::StepSnapshot make_snapshot() const;
    void save_outputs();
};

} // namespace swarmsearch
