#pragma once

#include "swarmsearch/core/types.hpp"
#include <concepts>
#include <memory>
#include <vector>

namespace swarmsearch::ports {

struct ChannelStats {
    uint64_t sent = 0;
    uint64_t superseded = 0;   // same reporter, target and recipient within one round
};

class IClaimChannel {
public:
    virtual ~IClaimChannel() = default;

    virtual void send(core::AgentId recipient, const core::Claim& claim) = 0;

    // Claims for one (recipient, target), ordered by reporter.
    virtual std::vector<core::Claim> receive(core::AgentId recipient, core::TargetId target) const = 0;

    virtual std::vector<core::TargetId> pending_targets(core::AgentId recipient) const = 0;

    // Drops pending claims; statistics survive.
    virtual void clear() = 0;
    virtual void reset() = 0;
    virtual ChannelStats get_stats() const = 0;
};

template<typename T>
concept ClaimChannelImpl = std::derived_from<T, IClaimChannel>;

using ClaimChannelPtr = std::unique_ptr<IClaimChannel>;

} // namespace swarmsearch::ports
