#pragma once

#include "swarmsearch/ports/iclaim_channel.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace swarmsearch::adapters {

struct MailboxEntry {
    core::AgentId recipient;
    core::TargetId target;
    core::AgentId reporter;
    core::Cell reported;
    core::Tick tick;
};

namespace bmi = boost::multi_index;

// One claim per (recipient, target, reporter); prefix lookups by recipient or
// by (recipient, target) come back ordered.
using Mailbox = bmi::multi_index_container<
    MailboxEntry,
    bmi::indexed_by<
        bmi::ordered_unique<
            bmi::composite_key<
                MailboxEntry,
                bmi::member<MailboxEntry, core::AgentId, &MailboxEntry::recipient>,
                bmi::member<MailboxEntry, core::TargetId, &MailboxEntry::target>,
                bmi::member<MailboxEntry, core::AgentId, &MailboxEntry::reporter>
            >
        >
    >
>;

// In-process mailbox on the shared logical grid. No latency, no loss.
class LocalClaimChannel : public swarmsearch::ports::IClaimChannel {
public:
    LocalClaimChannel() = default;
    ~LocalClaimChannel() override = default;

    void send(core::AgentId recipient, const core::Claim& claim) override;
    std::vector<core::Claim> receive(core::AgentId recipient, core::TargetId target) const override;
    std::vector<core::TargetId> pending_targets(core::AgentId recipient) const override;
    void clear() override;
    void reset() override;
    swarmsearch::ports::ChannelStats get_stats() const override;

    std::size_t pending() const noexcept { return mailbox_.size(); }

private:
    Mailbox mailbox_;
    swarmsearch::ports::ChannelStats stats_;
};

} // namespace swarmsearch::adapters
