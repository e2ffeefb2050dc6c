#include "swarmsearch/core/consensus.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace swarmsearch::core {

ConsensusEngine::ConsensusEngine(ConsensusParams params, ports::IClaimChannel& channel,
                                 int width, int height, uint64_t seed)
    : params_(params)
    , channel_(channel)
    , width_(width)
    , height_(height)
    , rng_(seed) {
}

ExchangeStats ConsensusEngine::exchange(std::vector<Agent>& agents, Tick tick) {
    ExchangeStats stats;
    channel_.clear();

    for (std::size_t i = 0; i < agents.size(); ++i) {
        for (std::size_t j = i + 1; j < agents.size(); ++j) {
            auto& a = agents[i];
            auto& b = agents[j];
            if (!within_range(a.position(), b.position(), params_.communication_range)) {
                continue;
            }

            stats.pairs_in_range++;
            stats.claims_sent += send_claims(a, b.id(), tick);
            stats.claims_sent += send_claims(b, a.id(), tick);
        }
    }

    return stats;
}

int ConsensusEngine::send_claims(Agent& from, AgentId to, Tick tick) {
    const auto targets = from.beliefs().claim_targets();
    if (targets.empty()) {
        return 0;
    }
    if (!from.transmits()) {
        spdlog::debug("Agent {} lost its transmission to {} on low battery", from.id(), to);
        return 0;
    }

    int sent = 0;
    for (TargetId target : targets) {
        Cell reported = *from.beliefs().claim_position(target);
        if (from.is_byzantine()) {
            reported = fabricate(from, target, reported);
        }
        channel_.send(to, Claim{target, reported, from.id(), tick});
        ++sent;
    }
    return sent;
}

Cell ConsensusEngine::fabricate(const Agent& liar, TargetId target, const Cell& believed) {
    const auto& policy = params_.byzantine;
    const Cell shifted{believed.x + policy.offset.x, believed.y + policy.offset.y};

    switch (policy.kind) {
    case LieKind::FixedOffset:
        return clamp_to(shifted, width_, height_);

    case LieKind::MimicOtherTarget:
        for (TargetId other : liar.beliefs().claim_targets()) {
            if (other != target) {
                return *liar.beliefs().claim_position(other);
            }
        }
        return clamp_to(shifted, width_, height_);

    case LieKind::RandomDistortion: {
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        if (coin(rng_) >= policy.lie_probability) {
            return believed;
        }
        std::uniform_int_distribution<int> jitter(-policy.distortion_range, policy.distortion_range);
        const int dx = jitter(rng_);
        const int dy = jitter(rng_);
        return clamp_to({believed.x + dx, believed.y + dy}, width_, height_);
    }
    }

    return believed;
}

std::vector<Vote> ConsensusEngine::collect_votes(const Agent& agent, TargetId target) const {
    std::vector<Vote> votes;

    if (const auto& seen = agent.beliefs().observation(target)) {
        votes.push_back(Vote{seen->position, agent.id(), true});
    }
    for (const auto& claim : channel_.receive(agent.id(), target)) {
        votes.push_back(Vote{claim.reported, claim.reporter, false});
    }
    return votes;
}

// Nearest claim by travel distance; ties go to the smaller cell.
std::optional<Cell> ConsensusEngine::pick_lead(const Agent& agent, const std::vector<Vote>& votes) {
    std::optional<Cell> lead;
    for (const auto& vote : votes) {
        if (vote.self_observation) {
            return vote.position;
        }
        if (!lead) {
            lead = vote.position;
            continue;
        }
        const int d = manhattan(agent.position(), vote.position);
        const int best = manhattan(agent.position(), *lead);
        if (d < best || (d == best && vote.position < *lead)) {
            lead = vote.position;
        }
    }
    return lead;
}

ExchangeStats ConsensusEngine::resolve(std::vector<Agent>& agents, Tick tick) {
    ExchangeStats stats;

    for (auto& agent : agents) {
        auto targets = channel_.pending_targets(agent.id());
        auto observed = agent.beliefs().observed_targets();
        targets.insert(targets.end(), observed.begin(), observed.end());
        std::sort(targets.begin(), targets.end());
        targets.erase(std::unique(targets.begin(), targets.end()), targets.end());

        for (TargetId target : targets) {
            const auto votes = collect_votes(agent, target);
            const auto outcome = majority_vote(votes, params_.vote_tolerance, params_.min_quorum);

            // Nobody else spoke: the reading stands on its own.
            const bool lone_reading = votes.size() == 1 && votes.front().self_observation;

            if (outcome.result == VoteResult::Adopted || lone_reading) {
                const auto& winner = outcome.winner ? *outcome.winner : outcome.buckets.front();
                stats.updates++;
                if (agent.accept_consensus(target, winner, tick, params_.vote_tolerance)) {
                    stats.flips++;
                    spdlog::debug("Agent {} target {}: belief flipped to ({},{}) with {} votes",
                                  agent.id(), target, winner.anchor.x, winner.anchor.y, winner.votes);
                }
                continue;
            }

            if (outcome.result == VoteResult::Tie) {
                stats.ties++;
                spdlog::debug("Agent {} target {}: tie across {} buckets, belief kept",
                              agent.id(), target, outcome.buckets.size());
            }

            if (const auto lead = pick_lead(agent, votes); lead && agent.follow_lead(target, *lead)) {
                spdlog::debug("Agent {} target {}: following lead ({},{})",
                              agent.id(), target, lead->x, lead->y);
            }
        }
    }

    channel_.clear();
    return stats;
}

ExchangeStats ConsensusEngine::run_round(std::vector<Agent>& agents, Tick tick) {
    auto stats = exchange(agents, tick);
    stats += resolve(agents, tick);
    return stats;
}

} // namespace swarmsearch::core
