#pragma once

#include "swarmsearch/core/types.hpp"

namespace swarmsearch::core {

// Ring r >= 1 holds indices [(2r-1)^2, (2r+1)^2), the 8r cells at Chebyshev
// distance r. Consecutive indices are 4-adjacent.
int spiral_ring(long index) noexcept;
Cell spiral_offset(long index) noexcept;

class SpiralSearch {
public:
    explicit SpiralSearch(Cell anchor) : anchor_(anchor) {}

    const Cell& anchor() const noexcept { return anchor_; }
    long step() const noexcept { return step_; }
    int radius() const noexcept { return spiral_ring(step_); }

    Cell cell_at(long index) const noexcept {
        const Cell offset = spiral_offset(index);
        return {anchor_.x + offset.x, anchor_.y + offset.y};
    }

    // Restarts around `position` once the spiral has outgrown the grid.
    Cell next_move(const Cell& position, int width, int height);

    void reset(const Cell& anchor) noexcept {
        anchor_ = anchor;
        step_ = 0;
    }

private:
    Cell anchor_;
    long step_ = 0;
};

} // namespace swarmsearch::core
