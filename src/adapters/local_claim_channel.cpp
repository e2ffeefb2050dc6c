#include "swarmsearch/adapters/local_claim_channel.hpp"
#include <boost/tuple/tuple.hpp>

namespace swarmsearch::adapters {

void LocalClaimChannel::send(core::AgentId recipient, const core::Claim& claim) {
    stats_.sent++;

    MailboxEntry entry{recipient, claim.target, claim.reporter, claim.reported, claim.tick};
    auto [it, inserted] = mailbox_.insert(entry);
    if (!inserted) {
        mailbox_.replace(it, entry);
        stats_.superseded++;
    }
}

std::vector<core::Claim> LocalClaimChannel::receive(core::AgentId recipient, core::TargetId target) const {
    std::vector<core::Claim> claims;

    auto [first, last] = mailbox_.equal_range(boost::make_tuple(recipient, target));
    for (auto it = first; it != last; ++it) {
        claims.push_back(core::Claim{it->target, it->reported, it->reporter, it->tick});
    }
    return claims;
}

std::vector<core::TargetId> LocalClaimChannel::pending_targets(core::AgentId recipient) const {
    std::vector<core::TargetId> targets;

    auto [first, last] = mailbox_.equal_range(boost::make_tuple(recipient));
    for (auto it = first; it != last; ++it) {
        if (targets.empty() || targets.back() != it->target) {
            targets.push_back(it->target);
        }
    }
    return targets;
}

void LocalClaimChannel::clear() {
    mailbox_.clear();
}

void LocalClaimChannel::reset() {
    mailbox_.clear();
    stats_ = {};
}

swarmsearch::ports::ChannelStats LocalClaimChannel::get_stats() const {
    return stats_;
}

} // namespace swarmsearch::adapters
