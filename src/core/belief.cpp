#include "swarmsearch/core/belief.hpp"

namespace swarmsearch::core {

void BeliefStore::observe(TargetId target, const Cell& position, Tick tick) {
    slots_.at(target).observation = Observation{position, tick};
}

void BeliefStore::adopt(TargetId target, const Belief& belief) {
    auto& slot = slots_.at(target);
    slot.belief = belief;
    slot.lead.reset();
}

void BeliefStore::invalidate(TargetId target) {
    slots_.at(target).belief.reset();
}

void BeliefStore::clear_observations() {
    for (auto& slot : slots_) {
        slot.observation.reset();
    }
}

void BeliefStore::set_lead(TargetId target, const Cell& position) {
    slots_.at(target).lead = position;
}

void BeliefStore::drop_lead(TargetId target) {
    slots_.at(target).lead.reset();
}

std::optional<Cell> BeliefStore::claim_position(TargetId target) const {
    const auto& slot = slots_.at(target);
    if (slot.observation) {
        return slot.observation->position;
    }
    if (slot.belief) {
        return slot.belief->position;
    }
    return std::nullopt;
}

std::vector<TargetId> BeliefStore::known_targets() const {
    std::vector<TargetId> known;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].belief) {
            known.push_back(static_cast<TargetId>(i));
        }
    }
    return known;
}

std::vector<TargetId> BeliefStore::observed_targets() const {
    std::vector<TargetId> observed;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].observation) {
            observed.push_back(static_cast<TargetId>(i));
        }
    }
    return observed;
}

std::vector<TargetId> BeliefStore::claim_targets() const {
    std::vector<TargetId> targets;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].observation || slots_[i].belief) {
            targets.push_back(static_cast<TargetId>(i));
        }
    }
    return targets;
}

} // namespace swarmsearch::core
