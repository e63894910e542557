#include "policies.h"
#include "walk_settings.h"
#include <cmath>

static const NeighborOffset kVonNeumann[] = {
    {-1, 0}, {1, 0}, {0, -1}, {0, 1},
};

static const NeighborOffset kMoore[] = {
    {-1, -1}, {0, -1}, {1, -1},
    {-1,  0},          {1,  0},
    {-1,  1}, {0,  1}, {1,  1},
};

static const NeighborOffset kExtended[] = {
    {-2, -2}, {-1, -2}, {0, -2}, {1, -2}, {2, -2},
    {-2, -1}, {-1, -1}, {0, -1}, {1, -1}, {2, -1},
    {-2,  0}, {-1,  0},          {1,  0}, {2,  0},
    {-2,  1}, {-1,  1}, {0,  1}, {1,  1}, {2,  1},
    {-2,  2}, {-1,  2}, {0,  2}, {1,  2}, {2,  2},
};

template <typename E, std::size_t N>
static E cycle(const E (&order)[N], E cur, int dir) {
    for (std::size_t i = 0; i < N; ++i) {
        if (order[i] == cur) return order[(i + N + dir) % N];
    }
    return order[0];
}

static const NeighborhoodType kNeighborhoodOrder[] = {
    NeighborhoodType::VonNeumann, NeighborhoodType::Moore, NeighborhoodType::Extended,
};
static const SpawnMode kSpawnOrder[] = {
    SpawnMode::Circle, SpawnMode::Edges, SpawnMode::Corners, SpawnMode::Random,
    SpawnMode::Top, SpawnMode::Bottom, SpawnMode::Left, SpawnMode::Right,
};
static const BoundaryBehavior kBoundaryOrder[] = {
    BoundaryBehavior::Clamp, BoundaryBehavior::Wrap, BoundaryBehavior::Bounce,
    BoundaryBehavior::Stick, BoundaryBehavior::Absorb,
};
static const ColorMode kColorModeOrder[] = {
    ColorMode::Age, ColorMode::Distance, ColorMode::Density, ColorMode::Direction,
};

const char* toString(NeighborhoodType n) {
    switch (n) {
        case NeighborhoodType::VonNeumann: return "VonNeumann";
        case NeighborhoodType::Moore:      return "Moore";
        case NeighborhoodType::Extended:   return "Extended";
    }
    return "VonNeumann";
}
NeighborhoodType next(NeighborhoodType n) { return cycle(kNeighborhoodOrder, n, +1); }
NeighborhoodType prev(NeighborhoodType n) { return cycle(kNeighborhoodOrder, n, -1); }

OffsetTable neighborOffsets(NeighborhoodType n) {
    switch (n) {
        case NeighborhoodType::VonNeumann: return {kVonNeumann, sizeof(kVonNeumann) / sizeof(kVonNeumann[0])};
        case NeighborhoodType::Moore:      return {kMoore, sizeof(kMoore) / sizeof(kMoore[0])};
        case NeighborhoodType::Extended:   return {kExtended, sizeof(kExtended) / sizeof(kExtended[0])};
    }
    return {kVonNeumann, 4};
}

int maxNeighbors(NeighborhoodType n) {
    switch (n) {
        case NeighborhoodType::VonNeumann: return 4;
        case NeighborhoodType::Moore:      return 8;
        case NeighborhoodType::Extended:   return 24;
    }
    return 4;
}

const char* toString(SpawnMode m) {
    switch (m) {
        case SpawnMode::Circle:  return "Circle";
        case SpawnMode::Edges:   return "Edges";
        case SpawnMode::Corners: return "Corners";
        case SpawnMode::Random:  return "Random";
        case SpawnMode::Top:     return "Top";
        case SpawnMode::Bottom:  return "Bottom";
        case SpawnMode::Left:    return "Left";
        case SpawnMode::Right:   return "Right";
    }
    return "Circle";
}
SpawnMode next(SpawnMode m) { return cycle(kSpawnOrder, m, +1); }
SpawnMode prev(SpawnMode m) { return cycle(kSpawnOrder, m, -1); }

const char* toString(BoundaryBehavior b) {
    switch (b) {
        case BoundaryBehavior::Clamp:  return "Clamp";
        case BoundaryBehavior::Wrap:   return "Wrap";
        case BoundaryBehavior::Bounce: return "Bounce";
        case BoundaryBehavior::Stick:  return "Stick";
        case BoundaryBehavior::Absorb: return "Absorb";
    }
    return "Absorb";
}
BoundaryBehavior next(BoundaryBehavior b) { return cycle(kBoundaryOrder, b, +1); }
BoundaryBehavior prev(BoundaryBehavior b) { return cycle(kBoundaryOrder, b, -1); }

const char* toString(ColorMode c) {
    switch (c) {
        case ColorMode::Age:       return "Age";
        case ColorMode::Distance:  return "Distance";
        case ColorMode::Density:   return "Density";
        case ColorMode::Direction: return "Direction";
    }
    return "Age";
}
ColorMode next(ColorMode c) { return cycle(kColorModeOrder, c, +1); }
ColorMode prev(ColorMode c) { return cycle(kColorModeOrder, c, -1); }

Vec2 applyBoundary(BoundaryBehavior b, const Vec2& p, const WalkBounds& bounds) {
    const float lo = kBoundaryMargin;
    float x = p.x, y = p.y;
    switch (b) {
        case BoundaryBehavior::Wrap: {
            // Toroidal wrap by the full interior extent
            const float w = bounds.xMax - lo;
            const float h = bounds.yMax - lo;
            if (x < lo) x += w; else if (x > bounds.xMax) x -= w;
            if (y < lo) y += h; else if (y > bounds.yMax) y -= h;
            break;
        }
        case BoundaryBehavior::Bounce:
            if (x < lo) x = lo + (lo - x); else if (x > bounds.xMax) x = bounds.xMax - (x - bounds.xMax);
            if (y < lo) y = lo + (lo - y); else if (y > bounds.yMax) y = bounds.yMax - (y - bounds.yMax);
            break;
        case BoundaryBehavior::Clamp:
        case BoundaryBehavior::Stick:
        case BoundaryBehavior::Absorb:
            x = clampf(x, lo, bounds.xMax);
            y = clampf(y, lo, bounds.yMax);
            break;
    }
    return Vec2(x, y);
}

float applyWalkBias(const WalkSettings& s, float baseAngle, const Vec2& offsetFromCenter) {
    float angle = baseAngle;

    if (s.walkBiasStrength > 0.0f) {
        const float biasRad = toRadians(s.walkBiasAngle);
        angle += s.walkBiasStrength * std::sin(biasRad - baseAngle);
    }

    if (std::fabs(s.radialBias) > 0.001f) {
        const float radial = angleOf(offsetFromCenter);
        // positive = inward, negative = outward
        const float target = s.radialBias > 0.0f ? radial + kPi : radial;
        angle += std::fabs(s.radialBias) * std::sin(target - angle);
    }
    return angle;
}
