// Dense occupancy grid for the aggregate.
//
// Cells live in a flat row-major arena (index = x + width * y). A cell goes
// from empty to occupied at most once between resizes; the grid keeps
// particlesStuck equal to the number of occupied cells and tracks maxRadius,
// the largest center distance seeded or committed so far.
#pragma once
#include <vector>
#include <cstdint>
#include "policies.h"

struct ParticleData {
    std::size_t age{0};        // insertion order, 0 for every seed cell
    float distance{0.0f};      // distance from center when stuck
    float direction{0.0f};     // approach angle (radians) when stuck
    uint8_t neighborCount{0};  // neighbors present when stuck
};

struct NeighborCount {
    int count{0};
    bool hasAny{false};
};

class ParticleGrid {
public:
    ParticleGrid() = default;
    ParticleGrid(int width, int height) { resize(width, height); }

    // Reallocates when the dimensions change, clears in place otherwise.
    // Counters and maxRadius are reset either way.
    void resize(int width, int height);

    // Occupies an empty cell. Returns false (and changes nothing) when the
    // cell is out of range or already occupied.
    bool place(int x, int y, const ParticleData& data);

    // nullptr for empty or out-of-range cells
    const ParticleData* get(int x, int y) const {
        if (!inBounds(x, y)) return nullptr;
        const int i = idx(x, y);
        return occupied_[i] ? &cells_[i] : nullptr;
    }
    bool occupied(int x, int y) const { return inBounds(x, y) && occupied_[idx(x, y)] != 0; }
    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < width_ && y < height_; }
    // Strictly inside the one-cell border
    bool isInterior(int x, int y) const { return x > 0 && y > 0 && x < width_ - 1 && y < height_ - 1; }

    NeighborCount countNeighbors(int x, int y, NeighborhoodType n) const;

    int width() const { return width_; }
    int height() const { return height_; }
    std::size_t particlesStuck() const { return particlesStuck_; }
    float maxRadius() const { return maxRadius_; }
    void setMaxRadius(float r) { maxRadius_ = r; }
    void raiseMaxRadius(float r) { if (r > maxRadius_) maxRadius_ = r; }

    // Raw occupancy markers (1 = occupied), row-major
    const std::vector<uint8_t>& occupancy() const { return occupied_; }
    // Counts markers directly; used to cross-check particlesStuck
    std::size_t countOccupied() const;

private:
    int width_{0}, height_{0};
    std::vector<uint8_t> occupied_;
    std::vector<ParticleData> cells_;
    std::size_t particlesStuck_{0};
    float maxRadius_{1.0f};

    inline int idx(int x, int y) const { return x + width_ * y; }
};
