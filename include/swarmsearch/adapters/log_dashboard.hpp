#pragma once

#include "swarmsearch/ports/isnapshot_observer.hpp"

namespace swarmsearch::adapters {

// Text dashboard over spdlog: a status line every `interval` ticks at info,
// every tick and per agent at debug.
class LogDashboard : public swarmsearch::ports::ISnapshotObserver {
public:
    explicit LogDashboard(int interval = 10, double tolerance = 1.0);
    ~LogDashboard() override = default;

    void on_tick(const core::StepSnapshot& snapshot) override;
    void on_finish(const core::MetricsSummary& summary) override;

    int frames() const noexcept { return frames_; }

private:
    int interval_;
    double tolerance_;
    int frames_ = 0;

    void log_agents(const core::StepSnapshot& snapshot) const;
};

} // namespace swarmsearch::adapters
