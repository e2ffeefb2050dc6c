#pragma once

#include "swarmsearch/core/types.hpp"
#include <optional>
#include <vector>

namespace swarmsearch::core {

struct Vote {
    Cell position;
    AgentId voter;
    bool self_observation = false;
};

struct VoteBucket {
    Cell anchor;
    int votes = 0;
    bool includes_self = false;
};

enum class VoteResult {
    Adopted,
    Tie,
    NoQuorum,
    NoVotes
};

struct VoteOutcome {
    VoteResult result = VoteResult::NoVotes;
    std::optional<VoteBucket> winner;
    std::vector<VoteBucket> buckets;
};

// Greedy bucketing in vote order: a vote joins the first bucket whose anchor
// lies within `tolerance`, otherwise it opens a new one. A bucket wins only
// with strictly more votes than every other bucket and at least `min_quorum`.
VoteOutcome majority_vote(const std::vector<Vote>& votes, double tolerance, int min_quorum);

const char* to_string(VoteResult result) noexcept;

} // namespace swarmsearch::core
