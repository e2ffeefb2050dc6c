#include <catch2/catch_test_macros.hpp>
#include "swarmsearch/core/consensus.hpp"
#include "swarmsearch/adapters/local_claim_channel.hpp"

using namespace swarmsearch;
using namespace swarmsearch::core;

namespace {

constexpr int GRID = 20;

Agent agent_at(AgentId id, Cell pos, bool byzantine = false, std::size_t targets = 1) {
    return Agent(id, pos, byzantine, targets);
}

void believe(Agent& agent, TargetId target, Cell pos) {
    agent.beliefs().adopt(target, Belief{pos, 1, 0, Provenance::Consensus});
}

} // namespace

TEST_CASE("Honest majority decides", "[consensus]") {
    adapters::LocalClaimChannel channel;
    ConsensusEngine engine(ConsensusParams{}, channel, GRID, GRID, 7);

    std::vector<Agent> agents;
    agents.push_back(agent_at(0, {10, 10}, true));
    agents.push_back(agent_at(1, {11, 10}));
    agents.push_back(agent_at(2, {9, 10}));
    agents.push_back(agent_at(3, {10, 12}));

    believe(agents[0], 0, {10, 10});
    believe(agents[1], 0, {10, 10});
    believe(agents[2], 0, {10, 10});

    SECTION("Uninformed agent adopts the corroborated position") {
        const auto stats = engine.run_round(agents, 1);

        REQUIRE(stats.pairs_in_range == 6);
        REQUIRE(stats.claims_sent == 9);
        const auto& belief = agents[3].beliefs().get(0);
        REQUIRE(belief);
        REQUIRE(belief->position == Cell{10, 10});
        REQUIRE(belief->confidence == 2);
        REQUIRE(belief->provenance == Provenance::Consensus);
        REQUIRE(belief->updated_tick == 1);
    }

    SECTION("Single corroboration per side is a tie and changes nothing") {
        engine.run_round(agents, 1);
        REQUIRE(agents[1].beliefs().get(0)->position == Cell{10, 10});
        REQUIRE(agents[1].beliefs().get(0)->updated_tick == 0);
    }

    SECTION("Channel is empty after the round") {
        engine.run_round(agents, 1);
        REQUIRE(channel.pending() == 0);
        REQUIRE(channel.get_stats().sent == 9);
    }
}

TEST_CASE("Ties keep the current belief", "[consensus]") {
    adapters::LocalClaimChannel channel;
    ConsensusEngine engine(ConsensusParams{}, channel, GRID, GRID, 7);

    std::vector<Agent> agents;
    agents.push_back(agent_at(0, {10, 10}, true));
    agents.push_back(agent_at(1, {11, 10}));
    agents.push_back(agent_at(2, {9, 10}));
    agents.push_back(agent_at(3, {10, 12}));
    agents.push_back(agent_at(4, {10, 8}));

    believe(agents[3], 0, {5, 5});
    believe(agents[1], 0, {10, 10});
    believe(agents[2], 0, {10, 10});
    believe(agents[0], 0, {12, 12});
    believe(agents[4], 0, {15, 15});

    const auto stats = engine.run_round(agents, 1);

    REQUIRE(stats.ties >= 1);
    REQUIRE(agents[3].beliefs().get(0)->position == Cell{5, 5});
}

TEST_CASE("Direct observation can be outvoted", "[consensus]") {
    adapters::LocalClaimChannel channel;
    ConsensusEngine engine(ConsensusParams{}, channel, GRID, GRID, 7);

    std::vector<Agent> agents;
    agents.push_back(agent_at(0, {10, 10}));
    agents.push_back(agent_at(1, {11, 10}));
    agents.push_back(agent_at(2, {9, 10}));

    agents[0].beliefs().adopt(0, Belief{{8, 8}, 1, 0, Provenance::SelfObserved});
    agents[0].beliefs().observe(0, {8, 8}, 1);
    believe(agents[1], 0, {10, 10});
    believe(agents[2], 0, {10, 10});

    const auto stats = engine.run_round(agents, 1);
    REQUIRE(agents[0].beliefs().get(0)->position == Cell{10, 10});
    REQUIRE(agents[0].beliefs().get(0)->provenance == Provenance::Consensus);
    REQUIRE(stats.flips == 1);
}

TEST_CASE("A reading tied with a lone claim changes nothing", "[consensus]") {
    adapters::LocalClaimChannel channel;
    ConsensusEngine engine(ConsensusParams{}, channel, GRID, GRID, 7);

    std::vector<Agent> agents;
    agents.push_back(agent_at(0, {10, 10}));
    agents.push_back(agent_at(1, {11, 10}));
    believe(agents[1], 0, {10, 10});

    SECTION("An earlier belief survives the tie") {
        believe(agents[0], 0, {3, 3});
        agents[0].beliefs().observe(0, {8, 8}, 1);

        const auto stats = engine.run_round(agents, 1);
        REQUIRE(stats.ties == 1);
        REQUIRE(stats.updates == 0);
        const auto& belief = agents[0].beliefs().get(0);
        REQUIRE(belief);
        REQUIRE(belief->position == Cell{3, 3});
        REQUIRE(belief->provenance == Provenance::Consensus);
        REQUIRE(belief->updated_tick == 0);
        REQUIRE(!agents[0].beliefs().lead(0));
    }

    SECTION("Without a belief the reading only becomes a lead") {
        agents[0].beliefs().observe(0, {8, 8}, 1);

        engine.run_round(agents, 1);
        REQUIRE(!agents[0].beliefs().has(0));
        REQUIRE(agents[0].beliefs().lead(0) == Cell{8, 8});
    }
}

TEST_CASE("A reading nobody contradicts is taken as is", "[consensus]") {
    adapters::LocalClaimChannel channel;
    ConsensusEngine engine(ConsensusParams{}, channel, GRID, GRID, 7);

    std::vector<Agent> agents;
    agents.push_back(agent_at(0, {2, 2}));
    agents.push_back(agent_at(1, {15, 15}));
    agents[0].beliefs().observe(0, {3, 2}, 4);

    const auto stats = engine.run_round(agents, 4);
    REQUIRE(stats.updates == 1);
    const auto& belief = agents[0].beliefs().get(0);
    REQUIRE(belief);
    REQUIRE(belief->position == Cell{3, 2});
    REQUIRE(belief->confidence == 1);
    REQUIRE(belief->provenance == Provenance::SelfObserved);
    REQUIRE(belief->updated_tick == 4);
}

TEST_CASE("Unsettled votes leave a lead to the nearest claim", "[consensus]") {
    adapters::LocalClaimChannel channel;
    ConsensusEngine engine(ConsensusParams{}, channel, GRID, GRID, 7);

    std::vector<Agent> agents;
    agents.push_back(agent_at(0, {10, 10}));
    agents.push_back(agent_at(1, {12, 10}));
    agents.push_back(agent_at(2, {7, 10}));
    believe(agents[1], 0, {13, 10});
    believe(agents[2], 0, {6, 10});

    const auto stats = engine.run_round(agents, 1);
    REQUIRE(stats.ties == 1);
    REQUIRE(!agents[0].beliefs().has(0));
    REQUIRE(agents[0].beliefs().lead(0) == Cell{13, 10});

    // Agents that already believe something take no lead.
    REQUIRE(!agents[1].beliefs().lead(0));
    REQUIRE(!agents[2].beliefs().lead(0));
}

TEST_CASE("Exchange respects communication range and quorum", "[consensus]") {
    adapters::LocalClaimChannel channel;
    ConsensusEngine engine(ConsensusParams{}, channel, GRID, GRID, 7);

    SECTION("Agents out of range exchange nothing") {
        std::vector<Agent> agents;
        agents.push_back(agent_at(0, {0, 0}));
        agents.push_back(agent_at(1, {6, 0}));
        believe(agents[0], 0, {3, 3});

        const auto stats = engine.run_round(agents, 1);
        REQUIRE(stats.pairs_in_range == 0);
        REQUIRE(stats.claims_sent == 0);
        REQUIRE(!agents[1].beliefs().has(0));
    }

    SECTION("Range boundary is inclusive") {
        std::vector<Agent> agents;
        agents.push_back(agent_at(0, {0, 0}));
        agents.push_back(agent_at(1, {3, 4}));

        REQUIRE(engine.exchange(agents, 1).pairs_in_range == 1);
    }

    SECTION("A lone claim does not reach quorum") {
        std::vector<Agent> agents;
        agents.push_back(agent_at(0, {0, 0}));
        agents.push_back(agent_at(1, {2, 0}));
        believe(agents[0], 0, {3, 3});

        engine.run_round(agents, 1);
        REQUIRE(!agents[1].beliefs().has(0));
        REQUIRE(agents[1].beliefs().lead(0) == Cell{3, 3});
    }

    SECTION("A flat battery can lose a whole transmission") {
        BatteryParams drained;
        drained.capacity = 10.0;
        drained.low_charge = 50.0;
        drained.dropout_probability = 1.0;

        std::vector<Agent> agents;
        agents.push_back(agent_at(0, {0, 0}));
        agents.push_back(agent_at(1, {2, 0}));
        agents[0].fit_battery(drained, 3);
        believe(agents[0], 0, {3, 3});

        const auto stats = engine.run_round(agents, 1);
        REQUIRE(stats.pairs_in_range == 1);
        REQUIRE(stats.claims_sent == 0);
        REQUIRE(!agents[1].beliefs().lead(0));
    }
}

TEST_CASE("Byzantine claims", "[consensus][byzantine]") {
    adapters::LocalClaimChannel channel;

    SECTION("Fixed offset is clamped to the grid") {
        ConsensusEngine engine(ConsensusParams{}, channel, GRID, GRID, 7);
        std::vector<Agent> agents;
        agents.push_back(agent_at(0, {17, 17}, true));
        agents.push_back(agent_at(1, {16, 17}));
        believe(agents[0], 0, {18, 15});

        engine.exchange(agents, 1);
        const auto claims = channel.receive(1, 0);
        REQUIRE(claims.size() == 1);
        REQUIRE(claims[0].reported == Cell{19, 18});
    }

    SECTION("Mimic reports another target's position") {
        ConsensusParams params;
        params.byzantine.kind = LieKind::MimicOtherTarget;
        ConsensusEngine engine(params, channel, GRID, GRID, 7);

        std::vector<Agent> agents;
        agents.push_back(agent_at(0, {10, 10}, true, 2));
        agents.push_back(agent_at(1, {11, 10}, false, 2));
        believe(agents[0], 0, {2, 2});
        believe(agents[0], 1, {15, 15});

        engine.exchange(agents, 1);
        REQUIRE(channel.receive(1, 0)[0].reported == Cell{15, 15});
        REQUIRE(channel.receive(1, 1)[0].reported == Cell{2, 2});
    }

    SECTION("Random distortion with zero probability tells the truth") {
        ConsensusParams params;
        params.byzantine.kind = LieKind::RandomDistortion;
        params.byzantine.lie_probability = 0.0;
        ConsensusEngine engine(params, channel, GRID, GRID, 7);

        std::vector<Agent> agents;
        agents.push_back(agent_at(0, {10, 10}, true));
        agents.push_back(agent_at(1, {11, 10}));
        believe(agents[0], 0, {4, 4});

        engine.exchange(agents, 1);
        REQUIRE(channel.receive(1, 0)[0].reported == Cell{4, 4});
    }

    SECTION("Random distortion stays within its range") {
        ConsensusParams params;
        params.byzantine.kind = LieKind::RandomDistortion;
        params.byzantine.lie_probability = 1.0;
        ConsensusEngine engine(params, channel, GRID, GRID, 7);

        std::vector<Agent> agents;
        agents.push_back(agent_at(0, {10, 10}, true));
        agents.push_back(agent_at(1, {11, 10}));
        believe(agents[0], 0, {10, 10});

        for (Tick tick = 1; tick <= 50; ++tick) {
            engine.exchange(agents, tick);
            const Cell lie = channel.receive(1, 0)[0].reported;
            REQUIRE(std::abs(lie.x - 10) <= 5);
            REQUIRE(std::abs(lie.y - 10) <= 5);
        }
    }

    SECTION("A single liar never overturns honest agreement") {
        ConsensusEngine engine(ConsensusParams{}, channel, GRID, GRID, 7);
        std::vector<Agent> agents;
        agents.push_back(agent_at(0, {10, 10}, true));
        agents.push_back(agent_at(1, {11, 10}));
        agents.push_back(agent_at(2, {9, 10}));
        agents[1].beliefs().observe(0, {10, 10}, 1);
        agents[2].beliefs().observe(0, {10, 10}, 1);
        believe(agents[0], 0, {10, 10});

        for (Tick tick = 1; tick <= 10; ++tick) {
            engine.run_round(agents, tick);
            REQUIRE(agents[1].beliefs().get(0)->position == Cell{10, 10});
            REQUIRE(agents[2].beliefs().get(0)->position == Cell{10, 10});
        }
    }
}
