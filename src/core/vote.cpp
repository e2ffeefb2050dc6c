#include "swarmsearch/core/vote.hpp"
#include <algorithm>

namespace swarmsearch::core {

VoteOutcome majority_vote(const std::vector<Vote>& votes, double tolerance, int min_quorum) {
    VoteOutcome outcome;
    if (votes.empty()) {
        return outcome;
    }

    for (const auto& vote : votes) {
        auto bucket = std::find_if(outcome.buckets.begin(), outcome.buckets.end(),
            [&](const VoteBucket& b) { return euclidean(b.anchor, vote.position) <= tolerance; });

        if (bucket == outcome.buckets.end()) {
            outcome.buckets.push_back(VoteBucket{vote.position, 1, vote.self_observation});
        } else {
            bucket->votes++;
            bucket->includes_self = bucket->includes_self || vote.self_observation;
        }
    }

    auto best = std::max_element(outcome.buckets.begin(), outcome.buckets.end(),
        [](const VoteBucket& a, const VoteBucket& b) { return a.votes < b.votes; });

    const auto leaders = std::count_if(outcome.buckets.begin(), outcome.buckets.end(),
        [&](const VoteBucket& b) { return b.votes == best->votes; });

    if (leaders > 1) {
        outcome.result = VoteResult::Tie;
    } else if (best->votes < min_quorum) {
        outcome.result = VoteResult::NoQuorum;
    } else {
        outcome.result = VoteResult::Adopted;
        outcome.winner = *best;
    }

    return outcome;
}

const char* to_string(VoteResult result) noexcept {
    switch (result) {
    case VoteResult::Adopted: return "adopted";
    case VoteResult::Tie: return "tie";
    case VoteResult::NoQuorum: return "no-quorum";
    case VoteResult::NoVotes: return "no-votes";
    }
    return "unknown";
}

} // namespace swarmsearch::core
