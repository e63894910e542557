// 2D diffusion-limited aggregation
//
// One step() releases a single walker and follows it until it resolves:
//  - spawn on the configured spawn policy, outside the current structure
//    (spawn radius = max(maxRadius + spawnRadiusOffset, minSpawnRadius))
//  - random walk with directional/radial bias, boundary transform per step
//  - on contact (neighborhood policy, multi-contact minimum) draw against the
//    effective stickiness and commit the particle into the grid
//  - abandon the walker when it leaves the escape radius, is absorbed at an
//    edge, or exhausts maxWalkIterations
// A step therefore adds exactly zero or one particle. Discarded walkers leave
// the grid untouched.
#pragma once
#include <cstdint>
#include <random>
#include "particle_grid.h"
#include "seed_patterns.h"
#include "walk_settings.h"
#include "vec2.h"

struct DlaParams {
    int width = 128;
    int height = 128;
    std::size_t numParticles = 5000;
    float stickiness = 1.0f;          // base stickiness [0.1, 1.0]
    SeedPattern seedPattern = SeedPattern::Point;
    uint32_t rngSeed = 0;             // 0 = seed from std::random_device
};

// Smallest grid dimension the seeding routines are laid out for
constexpr int kMinGridDim = 8;

class DlaSimulation {
public:
    explicit DlaSimulation(const DlaParams& params = {});

    // Advances by one walker. Returns false when paused or complete.
    bool step();

    void reset();
    void resetWithSeed(SeedPattern pattern);
    // Reallocates and re-seeds when the size changes; a no-op otherwise.
    // numParticles is capped at the new maxParticles().
    void resize(int width, int height);
    void reseedRng(uint32_t seed);

    // Accessors
    const ParticleGrid& grid() const { return grid_; }
    const ParticleData* getParticle(int x, int y) const { return grid_.get(x, y); }
    int width() const { return grid_.width(); }
    int height() const { return grid_.height(); }
    std::size_t particlesStuck() const { return grid_.particlesStuck(); }
    float maxRadius() const { return grid_.maxRadius(); }
    std::size_t numParticles() const { return numParticles_; }
    float stickiness() const { return stickiness_; }
    SeedPattern seedPattern() const { return seedPattern_; }
    bool paused() const { return paused_; }
    float progress() const { return numParticles_ ? (float)particlesStuck() / (float)numParticles_ : 1.0f; }
    bool isComplete() const { return particlesStuck() >= numParticles_; }
    // 75% of the grid area, at least 100
    std::size_t maxParticles() const;

    WalkSettings& settings() { return settings_; }
    const WalkSettings& settings() const { return settings_; }
    void setSettings(const WalkSettings& s) { settings_ = s; }

    void setPaused(bool p) { paused_ = p; }
    void togglePause() { paused_ = !paused_; }
    // Raw setters (config import); adjust* clamp
    void setNumParticles(std::size_t n) { numParticles_ = n; }
    void setStickiness(float s) { stickiness_ = s; }
    void setSeedPattern(SeedPattern p) { seedPattern_ = p; }
    void adjustParticles(long delta);
    void adjustStickiness(float delta) { stickiness_ = clampf(stickiness_ + delta, 0.1f, 1.0f); }

    // Spawn position of one walker on the active spawn policy
    Vec2 spawnParticle(float spawnRadius);
    float spawnRadius() const;

private:
    ParticleGrid grid_;
    WalkSettings settings_;
    std::size_t numParticles_{5000};
    float stickiness_{1.0f};
    SeedPattern seedPattern_{SeedPattern::Point};
    bool paused_{false};

    std::mt19937 rng_;
    std::uniform_real_distribution<float> u01_{0.0f, 1.0f};

    Vec2 center() const { return Vec2(grid_.width() * 0.5f, grid_.height() * 0.5f); }
    float uniform(float lo, float hi);
    bool tryStick(const Vec2& pos, const Vec2& approach, float distSq);
};
