#include "particle_grid.h"
#include <algorithm>

void ParticleGrid::resize(int width, int height) {
    width = std::max(0, width);
    height = std::max(0, height);
    const std::size_t n = (std::size_t)width * (std::size_t)height;
    if (width != width_ || height != height_ || occupied_.size() != n) {
        width_ = width; height_ = height;
        occupied_.assign(n, 0);
        cells_.assign(n, ParticleData{});
    } else {
        std::fill(occupied_.begin(), occupied_.end(), (uint8_t)0);
        std::fill(cells_.begin(), cells_.end(), ParticleData{});
    }
    particlesStuck_ = 0;
    maxRadius_ = 1.0f;
}

bool ParticleGrid::place(int x, int y, const ParticleData& data) {
    if (!inBounds(x, y)) return false;
    const int i = idx(x, y);
    if (occupied_[i]) return false;
    occupied_[i] = 1;
    cells_[i] = data;
    ++particlesStuck_;
    return true;
}

NeighborCount ParticleGrid::countNeighbors(int x, int y, NeighborhoodType n) const {
    NeighborCount nc;
    for (const NeighborOffset& o : neighborOffsets(n)) {
        if (occupied(x + o.dx, y + o.dy)) {
            ++nc.count;
            nc.hasAny = true;
        }
    }
    return nc;
}

std::size_t ParticleGrid::countOccupied() const {
    return (std::size_t)std::count(occupied_.begin(), occupied_.end(), (uint8_t)1);
}
