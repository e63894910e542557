// Walk/attachment policies for the DLA simulation.
//
// Each policy is a closed enum with cyclic next/prev navigation and a display
// name, plus the pure function that applies it:
//  - NeighborhoodType: offset tables used to test adjacency when sticking
//  - SpawnMode:        where a new walker is released
//  - BoundaryBehavior: how a post-move position is brought back inside the grid
//  - ColorMode:        which ParticleData property drives the color gradient
// None of these touch the grid; they are unit-testable on their own.
#pragma once
#include <cstddef>
#include "vec2.h"

enum class NeighborhoodType { VonNeumann, Moore, Extended };
enum class SpawnMode { Circle, Edges, Corners, Random, Top, Bottom, Left, Right };
enum class BoundaryBehavior { Clamp, Wrap, Bounce, Stick, Absorb };
enum class ColorMode { Age, Distance, Density, Direction };

// Distance kept between a walker and the grid edge.
constexpr float kBoundaryMargin = 1.0f;

struct NeighborOffset {
    int dx;
    int dy;
};

struct OffsetTable {
    const NeighborOffset* data;
    std::size_t size;
    const NeighborOffset* begin() const { return data; }
    const NeighborOffset* end() const { return data + size; }
};

const char* toString(NeighborhoodType n);
NeighborhoodType next(NeighborhoodType n);
NeighborhoodType prev(NeighborhoodType n);
OffsetTable neighborOffsets(NeighborhoodType n);
// Size of the offset table: 4, 8 or 24
int maxNeighbors(NeighborhoodType n);

const char* toString(SpawnMode m);
SpawnMode next(SpawnMode m);
SpawnMode prev(SpawnMode m);

const char* toString(BoundaryBehavior b);
BoundaryBehavior next(BoundaryBehavior b);
BoundaryBehavior prev(BoundaryBehavior b);

const char* toString(ColorMode c);
ColorMode next(ColorMode c);
ColorMode prev(ColorMode c);

// Interior limits for a walker on a width x height grid.
struct WalkBounds {
    float xMax{0.0f};
    float yMax{0.0f};
    static WalkBounds forGrid(int width, int height) {
        return WalkBounds{(float)width - kBoundaryMargin - 1.0f, (float)height - kBoundaryMargin - 1.0f};
    }
    bool onOrOutsideEdge(const Vec2& p) const {
        return p.x <= kBoundaryMargin || p.x >= xMax || p.y <= kBoundaryMargin || p.y >= yMax;
    }
};

// Position transform applied after every walk step. Stick and Absorb clamp
// exactly like Clamp here; Absorb's respawn is decided by the walk loop.
Vec2 applyBoundary(BoundaryBehavior b, const Vec2& p, const WalkBounds& bounds);

struct WalkSettings;

// Steering nudge of a uniformly drawn walk angle: directional drift towards
// walkBiasAngle (degrees) and radial drift towards/away from the grid center.
float applyWalkBias(const WalkSettings& s, float baseAngle, const Vec2& offsetFromCenter);
