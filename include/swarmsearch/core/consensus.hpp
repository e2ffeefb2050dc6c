#pragma once

#include "swarmsearch/core/agent.hpp"
#include "swarmsearch/core/vote.hpp"
#include "swarmsearch/ports/iclaim_channel.hpp"
#include <optional>
#include <random>
#include <vector>

namespace swarmsearch::core {

enum class LieKind {
    FixedOffset,        // believed position shifted by `offset`
    MimicOtherTarget,   // position believed for a different target
    RandomDistortion    // uniform shift in [-range, range] with `lie_probability`
};

struct ByzantinePolicy {
    LieKind kind = LieKind::FixedOffset;
    Cell offset{3, 3};
    int distortion_range = 5;
    double lie_probability = 0.7;
    double erratic_probability = 0.0;  // chance per tick of a random step instead of the search move
};

struct ConsensusParams {
    double communication_range = 5.0;
    double vote_tolerance = 1.0;
    int min_quorum = 2;
    ByzantinePolicy byzantine;
};

struct ExchangeStats {
    int pairs_in_range = 0;
    int claims_sent = 0;
    int updates = 0;
    int flips = 0;
    int ties = 0;

    ExchangeStats& operator+=(const ExchangeStats& other) noexcept {
        pairs_in_range += other.pairs_in_range;
        claims_sent += other.claims_sent;
        updates += other.updates;
        flips += other.flips;
        ties += other.ties;
        return *this;
    }
};

class ConsensusEngine {
public:
    ConsensusEngine(ConsensusParams params, ports::IClaimChannel& channel,
                    int width, int height, uint64_t seed);

    ExchangeStats exchange(std::vector<Agent>& agents, Tick tick);

    // Runs after every exchange of the tick. An unsettled vote leaves the
    // belief alone and at most gives the agent a lead.
    ExchangeStats resolve(std::vector<Agent>& agents, Tick tick);

    ExchangeStats run_round(std::vector<Agent>& agents, Tick tick);

    const ConsensusParams& params() const noexcept { return params_; }

private:
    ConsensusParams params_;
    ports::IClaimChannel& channel_;
    int width_;
    int height_;
    std::mt19937_64 rng_;

    int send_claims(Agent& from, AgentId to, Tick tick);
    Cell fabricate(const Agent& liar, TargetId target, const Cell& believed);
    std::vector<Vote> collect_votes(const Agent& agent, TargetId target) const;
    static std::optional<Cell> pick_lead(const Agent& agent, const std::vector<Vote>& votes);
};

} // namespace swarmsearch::core
