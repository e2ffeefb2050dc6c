#include "swarmsearch/core/battery.hpp"
#include <algorithm>

namespace swarmsearch::core {

Battery::Battery(const BatteryParams& params, uint64_t seed)
    : params_(params)
    , rng_(seed)
    , charge_(params.capacity) {
    std::uniform_real_distribution<double> rate(params_.min_drain, params_.max_drain);
    drain_rate_ = rate(rng_);
}

bool Battery::draw() {
    if (depleted()) {
        return false;
    }

    std::uniform_real_distribution<double> factor(1.0 - params_.drain_jitter, 1.0 + params_.drain_jitter);
    charge_ = std::max(0.0, charge_ - drain_rate_ * factor(rng_));
    return charge_ > 0.0;
}

bool Battery::transmits() {
    if (!low()) {
        return true;
    }
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    return coin(rng_) >= params_.dropout_probability;
}

} // namespace swarmsearch::core
