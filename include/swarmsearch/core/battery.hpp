#pragma once

#include <cstdint>
#include <random>

namespace swarmsearch::core {

struct BatteryParams {
    double capacity = 100.0;
    double min_drain = 0.08;    // per-agent rate drawn once from [min, max]
    double max_drain = 0.12;
    double drain_jitter = 0.1;  // each move costs rate * U(1 - jitter, 1 + jitter)
    double low_charge = 20.0;
    double dropout_probability = 0.3;
};

class Battery {
public:
    Battery(const BatteryParams& params, uint64_t seed);

    double charge() const noexcept { return charge_; }
    double drain_rate() const noexcept { return drain_rate_; }
    bool depleted() const noexcept { return charge_ <= 0.0; }
    bool low() const noexcept { return charge_ < params_.low_charge; }

    // False when the charge ran out and the move is not made.
    bool draw();

    // A low battery loses a whole transmission with `dropout_probability`.
    bool transmits();

private:
    BatteryParams params_;
    std::mt19937_64 rng_;
    double drain_rate_;
    double charge_;
};

} // namespace swarmsearch::core
