#pragma once

#include "swarmsearch/core/metrics.hpp"
#include <concepts>

namespace swarmsearch::ports {

// Display and reporting layers see the core only through frozen snapshots.
class ISnapshotObserver {
public:
    virtual ~ISnapshotObserver() = default;

    virtual void on_tick(const core::StepSnapshot& snapshot) = 0;
    virtual void on_finish(const core::MetricsSummary& summary) = 0;
};

template<typename T>
concept SnapshotObserverImpl = std::derived_from<T, ISnapshotObserver>;

} // namespace swarmsearch::ports
