#include "swarmsearch/core/spiral.hpp"
#include <algorithm>
#include <cmath>

namespace swarmsearch::core {

int spiral_ring(long index) noexcept {
    if (index <= 0) {
        return 0;
    }

    long root = static_cast<long>(std::sqrt(static_cast<double>(index)));
    while (root * root > index) --root;
    while ((root + 1) * (root + 1) <= index) ++root;

    return static_cast<int>((root + 1) / 2);
}

Cell spiral_offset(long index) noexcept {
    const int r = spiral_ring(index);
    if (r == 0) {
        return {0, 0};
    }

    const long side = 2L * r;
    const long k = index - (side - 1) * (side - 1);

    if (k < side) {
        return {r, static_cast<int>(-(r - 1) + k)};
    }
    if (k < 2 * side) {
        return {static_cast<int>(r - (k - (side - 1))), r};
    }
    if (k < 3 * side) {
        return {-r, static_cast<int>(r - (k - (2 * side - 1)))};
    }
    return {static_cast<int>(-r + (k - (3 * side - 1))), -r};
}

Cell SpiralSearch::next_move(const Cell& position, int width, int height) {
    const int extent = std::max(width, height);
    bool restarted = false;

    for (;;) {
        if (spiral_ring(step_) >= extent) {
            if (restarted) {
                return position;
            }
            reset(position);
            restarted = true;
            continue;
        }

        const Cell cell = cell_at(step_);
        const bool inside = cell.x >= 0 && cell.x < width && cell.y >= 0 && cell.y < height;
        if (inside && cell != position) {
            return step_toward(position, cell);
        }
        ++step_;
    }
}

} // namespace swarmsearch::core
