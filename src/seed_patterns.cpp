#include "seed_patterns.h"
#include <algorithm>
#include <cctype>
#include <cmath>

static const SeedPattern kSeedOrder[] = {
    SeedPattern::Point, SeedPattern::Line, SeedPattern::Cross, SeedPattern::Circle,
    SeedPattern::Ring, SeedPattern::Block, SeedPattern::NoisePatch, SeedPattern::Scatter,
    SeedPattern::MultiPoint, SeedPattern::Starburst,
};
static const int kSeedCount = (int)(sizeof(kSeedOrder) / sizeof(kSeedOrder[0]));

const char* toString(SeedPattern p) {
    switch (p) {
        case SeedPattern::Point:      return "Point";
        case SeedPattern::Line:       return "Line";
        case SeedPattern::Cross:      return "Cross";
        case SeedPattern::Circle:     return "Circle";
        case SeedPattern::Ring:       return "Ring";
        case SeedPattern::Block:      return "Block";
        case SeedPattern::NoisePatch: return "Noise Patch";
        case SeedPattern::Scatter:    return "Scatter";
        case SeedPattern::MultiPoint: return "Multi-Point";
        case SeedPattern::Starburst:  return "Starburst";
    }
    return "Point";
}

const char* tagOf(SeedPattern p) {
    switch (p) {
        case SeedPattern::NoisePatch: return "NoisePatch";
        case SeedPattern::MultiPoint: return "MultiPoint";
        default: return toString(p);
    }
}

SeedPattern next(SeedPattern p) { return kSeedOrder[((int)p + 1) % kSeedCount]; }
SeedPattern prev(SeedPattern p) { return kSeedOrder[((int)p + kSeedCount - 1) % kSeedCount]; }

SeedPattern seedPatternFromName(const std::string& name) {
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (s == "line") return SeedPattern::Line;
    if (s == "cross") return SeedPattern::Cross;
    if (s == "circle") return SeedPattern::Circle;
    if (s == "ring") return SeedPattern::Ring;
    if (s == "block" || s == "filled") return SeedPattern::Block;
    if (s == "noise" || s == "noise-patch" || s == "noisepatch") return SeedPattern::NoisePatch;
    if (s == "scatter") return SeedPattern::Scatter;
    if (s == "multipoint" || s == "multi-point") return SeedPattern::MultiPoint;
    if (s == "starburst" || s == "spokes" || s == "star") return SeedPattern::Starburst;
    return SeedPattern::Point;
}

// Seed cells carry no history: age 0, no distance/direction/neighbors.
static const ParticleData kSeedCell{};

static void seedPoint(ParticleGrid& g) {
    g.place(g.width() / 2, g.height() / 2, kSeedCell);
    // The point seed reports radius 1 so the first spawn circle is not degenerate
    g.setMaxRadius(1.0f);
}

static void seedLine(ParticleGrid& g) {
    const int cy = g.height() / 2;
    const int halfLen = std::min(20, g.width() / 4);
    for (int x = g.width() / 2 - halfLen; x < g.width() / 2 + halfLen; ++x) g.place(x, cy, kSeedCell);
    g.setMaxRadius((float)halfLen);
}

static void seedCross(ParticleGrid& g) {
    const int cx = g.width() / 2, cy = g.height() / 2;
    const int arm = std::min({10, g.width() / 8, g.height() / 8});
    for (int i = 0; i < arm; ++i) {
        g.place(cx - i, cy, kSeedCell);
        g.place(cx + i, cy, kSeedCell);
        g.place(cx, cy - i, kSeedCell);
        g.place(cx, cy + i, kSeedCell);
    }
    g.setMaxRadius((float)arm);
}

static void seedCircle(ParticleGrid& g) {
    const float cx = g.width() * 0.5f, cy = g.height() * 0.5f;
    const float r = std::min({15.0f, (float)(g.width() / 8), (float)(g.height() / 8)});
    for (int deg = 0; deg < 360; ++deg) {
        const float a = toRadians((float)deg);
        g.place((int)(cx + r * std::cos(a)), (int)(cy + r * std::sin(a)), kSeedCell);
    }
    g.setMaxRadius(r);
}

static void seedRing(ParticleGrid& g) {
    const float cx = g.width() * 0.5f, cy = g.height() * 0.5f;
    const float minDim = (float)std::min(g.width(), g.height());
    const float r = std::max(6.0f, std::min(minDim * 0.30f, minDim * 0.45f));
    const float thickness = 2.5f;
    for (int y = 0; y < g.height(); ++y) {
        for (int x = 0; x < g.width(); ++x) {
            const float d = length(Vec2((float)x - cx, (float)y - cy));
            if (d >= r - thickness && d <= r + thickness) g.place(x, y, kSeedCell);
        }
    }
    g.setMaxRadius(r + thickness);
}

static void seedBlock(ParticleGrid& g) {
    const int cx = g.width() / 2, cy = g.height() / 2;
    const int half = std::max(std::min(g.width(), g.height()) / 8, 4);
    const int x0 = std::max(0, cx - half), x1 = std::min(cx + half, g.width() - 1);
    const int y0 = std::max(0, cy - half), y1 = std::min(cy + half, g.height() - 1);
    for (int y = y0; y <= y1; ++y)
        for (int x = x0; x <= x1; ++x) g.place(x, y, kSeedCell);
    g.setMaxRadius((float)half * 1.414f);
}

// Dense, noisy blob offset towards the upper-left third for lopsided growth.
static void seedNoisePatch(ParticleGrid& g, std::mt19937& rng) {
    const Vec2 center(g.width() * 0.5f, g.height() * 0.5f);
    const float minDim = (float)std::min(g.width(), g.height());
    const float radius = clampf(minDim * 0.22f, 6.0f, 30.0f);
    const int ri = (int)radius;
    const int jitter = std::max(ri / 3, 1);
    std::uniform_int_distribution<int> jit(-jitter, jitter);
    std::uniform_real_distribution<float> u01(0.0f, 1.0f);

    int pcx = g.width() / 3 + jit(rng);
    int pcy = g.height() / 3 + jit(rng);
    pcx = clampi(pcx, 1, g.width() - 2);
    pcy = clampi(pcy, 1, g.height() - 2);

    float maxDist = 1.0f;
    std::size_t placed = 0;
    for (int y = std::max(pcy - ri, 1); y <= std::min(pcy + ri, g.height() - 2); ++y) {
        for (int x = std::max(pcx - ri, 1); x <= std::min(pcx + ri, g.width() - 2); ++x) {
            const float d = length(Vec2((float)(x - pcx), (float)(y - pcy)));
            if (d > radius) continue;
            const float falloff = 1.0f - d / radius;
            const float stickProb = 0.35f + falloff * 0.65f;
            if (u01(rng) < stickProb && g.place(x, y, kSeedCell)) {
                ++placed;
                maxDist = std::max(maxDist, length(Vec2((float)x, (float)y) - center));
            }
        }
    }

    if (placed == 0) {
        g.place(pcx, pcy, kSeedCell);
        maxDist = length(Vec2((float)pcx, (float)pcy) - center);
    }
    g.setMaxRadius(maxDist);
}

static void seedScatter(ParticleGrid& g, std::mt19937& rng) {
    const int cx = g.width() / 2, cy = g.height() / 2;
    const int spread = std::min({20, g.width() / 6, g.height() / 6});
    const int numSeeds = 15;
    std::uniform_real_distribution<float> ang(0.0f, kTwoPi);
    std::uniform_real_distribution<float> rad(0.0f, (float)std::max(spread, 1));
    for (int i = 0; i < numSeeds; ++i) {
        const float a = ang(rng);
        const float r = rad(rng);
        g.place((int)(cx + r * std::cos(a)), (int)(cy + r * std::sin(a)), kSeedCell);
    }
    g.setMaxRadius((float)spread);
}

// Center plus four satellites; the five clusters compete for walkers.
static void seedMultiPoint(ParticleGrid& g) {
    const int cx = g.width() / 2, cy = g.height() / 2;
    const int spread = std::min({25, g.width() / 5, g.height() / 5});
    g.place(cx, cy, kSeedCell);
    g.place(cx - spread, cy, kSeedCell);
    g.place(cx + spread, cy, kSeedCell);
    g.place(cx, cy - spread, kSeedCell);
    g.place(cx, cy + spread, kSeedCell);
    g.setMaxRadius((float)spread);
}

static void seedStarburst(ParticleGrid& g) {
    const float cx = g.width() * 0.5f, cy = g.height() * 0.5f;
    const float minDim = (float)std::min(g.width(), g.height());
    const float spokeLen = clampf(minDim * 0.35f, 8.0f, 40.0f);
    const int spokes = 8;

    g.place((int)cx, (int)cy, kSeedCell);

    for (int s = 0; s < spokes; ++s) {
        const float a = (float)s * (kTwoPi / (float)spokes);
        for (int step = 1; step <= (int)spokeLen; ++step) {
            const int x = (int)std::lround(cx + (float)step * std::cos(a));
            const int y = (int)std::lround(cy + (float)step * std::sin(a));
            if (g.isInterior(x, y)) g.place(x, y, kSeedCell);
        }
    }

    // sparse rim joining the spoke tips
    for (int deg = 0; deg < 360; deg += 4) {
        const float a = toRadians((float)deg);
        const int x = (int)(cx + spokeLen * std::cos(a));
        const int y = (int)(cy + spokeLen * std::sin(a));
        if (g.isInterior(x, y)) g.place(x, y, kSeedCell);
    }
    g.setMaxRadius(spokeLen);
}

void seedGrid(ParticleGrid& grid, SeedPattern pattern, std::mt19937& rng) {
    switch (pattern) {
        case SeedPattern::Point:      seedPoint(grid); break;
        case SeedPattern::Line:       seedLine(grid); break;
        case SeedPattern::Cross:      seedCross(grid); break;
        case SeedPattern::Circle:     seedCircle(grid); break;
        case SeedPattern::Ring:       seedRing(grid); break;
        case SeedPattern::Block:      seedBlock(grid); break;
        case SeedPattern::NoisePatch: seedNoisePatch(grid, rng); break;
        case SeedPattern::Scatter:    seedScatter(grid, rng); break;
        case SeedPattern::MultiPoint: seedMultiPoint(grid); break;
        case SeedPattern::Starburst:  seedStarburst(grid); break;
    }
}
