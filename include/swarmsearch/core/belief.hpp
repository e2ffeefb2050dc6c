#pragma once

#include "swarmsearch/core/types.hpp"
#include <optional>
#include <vector>

namespace swarmsearch::core {

enum class Provenance {
    SelfObserved,
    Consensus
};

struct Belief {
    Cell position;
    int confidence = 1;
    Tick updated_tick = 0;
    Provenance provenance = Provenance::SelfObserved;
};

struct Observation {
    Cell position;
    Tick tick;
};

// Only a vote writes a belief. A lead is an unconfirmed position worth
// walking to and never counts as a belief.
class BeliefStore {
public:
    explicit BeliefStore(std::size_t target_count) : slots_(target_count) {}

    std::size_t size() const noexcept { return slots_.size(); }

    const std::optional<Belief>& get(TargetId target) const { return slots_.at(target).belief; }
    bool has(TargetId target) const { return get(target).has_value(); }

    const std::optional<Observation>& observation(TargetId target) const {
        return slots_.at(target).observation;
    }
    const std::optional<Cell>& lead(TargetId target) const { return slots_.at(target).lead; }

    void observe(TargetId target, const Cell& position, Tick tick);
    void adopt(TargetId target, const Belief& belief);
    void invalidate(TargetId target);
    void clear_observations();

    void set_lead(TargetId target, const Cell& position);
    void drop_lead(TargetId target);

    // This tick's reading, else the belief.
    std::optional<Cell> claim_position(TargetId target) const;

    std::vector<TargetId> known_targets() const;
    std::vector<TargetId> observed_targets() const;
    std::vector<TargetId> claim_targets() const;

private:
    struct Slot {
        std::optional<Belief> belief;
        std::optional<Observation> observation;
        std::optional<Cell> lead;
    };

    std::vector<Slot> slots_;
};

} // namespace swarmsearch::core
