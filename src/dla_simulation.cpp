#include "dla_simulation.h"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

// Upper bound on rejection sampling for SpawnMode::Random. When the spawn
// radius exceeds what the grid can hold, the farthest sample is used.
static const int kMaxRandomSpawnTries = 1000;

DlaSimulation::DlaSimulation(const DlaParams& params)
    : numParticles_(params.numParticles),
      stickiness_(params.stickiness),
      seedPattern_(params.seedPattern) {
    reseedRng(params.rngSeed);
    grid_.resize(std::max(kMinGridDim, params.width), std::max(kMinGridDim, params.height));
    reset();
}

void DlaSimulation::reseedRng(uint32_t seed) {
    if (seed == 0) seed = std::random_device{}();
    rng_.seed(seed);
}

float DlaSimulation::uniform(float lo, float hi) {
    std::uniform_real_distribution<float> d(lo, hi);
    return d(rng_);
}

std::size_t DlaSimulation::maxParticles() const {
    const std::size_t area = (std::size_t)grid_.width() * (std::size_t)grid_.height();
    return std::max<std::size_t>(area * 3 / 4, 100);
}

void DlaSimulation::adjustParticles(long delta) {
    const long maxP = (long)maxParticles();
    const long v = (long)numParticles_ + delta;
    numParticles_ = (std::size_t)std::max(100L, std::min(v, maxP));
}

void DlaSimulation::reset() {
    resetWithSeed(seedPattern_);
}

void DlaSimulation::resetWithSeed(SeedPattern pattern) {
    grid_.resize(grid_.width(), grid_.height());
    seedPattern_ = pattern;
    seedGrid(grid_, pattern, rng_);
    paused_ = false;
    spdlog::debug("Seeded {} on {}x{} grid: {} cells, max radius {:.2f}",
                  toString(pattern), grid_.width(), grid_.height(),
                  grid_.particlesStuck(), grid_.maxRadius());
}

void DlaSimulation::resize(int width, int height) {
    width = std::max(kMinGridDim, width);
    height = std::max(kMinGridDim, height);
    if (width == grid_.width() && height == grid_.height()) return;
    grid_.resize(width, height);
    numParticles_ = std::min(numParticles_, maxParticles());
    reset();
}

float DlaSimulation::spawnRadius() const {
    return std::max(grid_.maxRadius() + settings_.spawnRadiusOffset, settings_.minSpawnRadius);
}

Vec2 DlaSimulation::spawnParticle(float spawnRadius) {
    const float w = (float)grid_.width();
    const float h = (float)grid_.height();
    const Vec2 c = center();
    std::uniform_int_distribution<int> pick4(0, 3);

    switch (settings_.spawnMode) {
        case SpawnMode::Circle: {
            const float a = uniform(0.0f, kTwoPi);
            return Vec2(clampf(c.x + spawnRadius * std::cos(a), 1.0f, w - 2.0f),
                        clampf(c.y + spawnRadius * std::sin(a), 1.0f, h - 2.0f));
        }
        case SpawnMode::Edges:
            switch (pick4(rng_)) {
                case 0:  return Vec2(uniform(1.0f, w - 1.0f), 1.0f);
                case 1:  return Vec2(uniform(1.0f, w - 1.0f), h - 2.0f);
                case 2:  return Vec2(1.0f, uniform(1.0f, h - 1.0f));
                default: return Vec2(w - 2.0f, uniform(1.0f, h - 1.0f));
            }
        case SpawnMode::Corners:
            switch (pick4(rng_)) {
                case 0:  return Vec2(1.0f, 1.0f);
                case 1:  return Vec2(w - 2.0f, 1.0f);
                case 2:  return Vec2(1.0f, h - 2.0f);
                default: return Vec2(w - 2.0f, h - 2.0f);
            }
        case SpawnMode::Random: {
            const float minDistSq = spawnRadius * spawnRadius * 0.5f;
            Vec2 best;
            float bestSq = -1.0f;
            for (int i = 0; i < kMaxRandomSpawnTries; ++i) {
                const Vec2 p(uniform(1.0f, w - 1.0f), uniform(1.0f, h - 1.0f));
                const float d2 = lengthSq(p - c);
                if (d2 > minDistSq) return p;
                if (d2 > bestSq) { bestSq = d2; best = p; }
            }
            return best;
        }
        case SpawnMode::Top:    return Vec2(uniform(1.0f, w - 1.0f), 1.0f);
        case SpawnMode::Bottom: return Vec2(uniform(1.0f, w - 1.0f), h - 2.0f);
        case SpawnMode::Left:   return Vec2(1.0f, uniform(1.0f, h - 1.0f));
        case SpawnMode::Right:  return Vec2(w - 2.0f, uniform(1.0f, h - 1.0f));
    }
    return c;
}

bool DlaSimulation::tryStick(const Vec2& pos, const Vec2& approach, float distSq) {
    const int ix = (int)pos.x;
    const int iy = (int)pos.y;
    if (!grid_.isInterior(ix, iy)) return false;

    const NeighborCount nc = grid_.countNeighbors(ix, iy, settings_.neighborhood);
    if (!nc.hasAny || nc.count < settings_.multiContactMin) return false;

    const float distance = std::sqrt(distSq);
    const float p = settings_.effectiveStickiness(nc.count, distance, stickiness_);
    if (u01_(rng_) >= p) return false;

    // An occupied target does not stick; the walker keeps going
    ParticleData data;
    data.age = grid_.particlesStuck();
    data.distance = distance;
    data.direction = angleOf(approach);
    data.neighborCount = (uint8_t)nc.count;
    if (!grid_.place(ix, iy, data)) return false;
    grid_.raiseMaxRadius(distance);
    return true;
}

bool DlaSimulation::step() {
    if (paused_ || isComplete()) return false;

    const Vec2 c = center();
    const float radius = spawnRadius();
    const float escape = radius * settings_.escapeMultiplier;
    const float escapeDistSq = escape * escape;
    const WalkBounds bounds = WalkBounds::forGrid(grid_.width(), grid_.height());
    const bool absorb = settings_.boundaryBehavior == BoundaryBehavior::Absorb;

    Vec2 pos = spawnParticle(radius);
    Vec2 approach = pos - c;

    for (int it = 0; it < settings_.maxWalkIterations; ++it) {
        const Vec2 off = pos - c;
        const float distSq = lengthSq(off);
        if (distSq > escapeDistSq) return true;   // escaped

        if (tryStick(pos, approach, distSq)) return true;

        approach = off;
        const float baseAngle = uniform(0.0f, kTwoPi);
        const float angle = applyWalkBias(settings_, baseAngle, off);
        pos += fromAngle(angle, settings_.walkStepSize);
        pos = applyBoundary(settings_.boundaryBehavior, pos, bounds);

        if (absorb && bounds.onOrOutsideEdge(pos)) return true;  // absorbed at the edge
    }
    return true;  // walk budget exhausted
}
