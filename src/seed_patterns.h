// Initial structures placed on an empty grid before growth starts.
#pragma once
#include <random>
#include <string>
#include "particle_grid.h"

enum class SeedPattern {
    Point,
    Line,
    Cross,
    Circle,
    Ring,
    Block,
    NoisePatch,
    Scatter,
    MultiPoint,
    Starburst
};

const char* toString(SeedPattern p);
// Stable identifier used in config files ("NoisePatch", "MultiPoint", ...)
const char* tagOf(SeedPattern p);
SeedPattern next(SeedPattern p);
SeedPattern prev(SeedPattern p);

// Command-line style names (case-insensitive, with aliases such as "noise",
// "filled" or "star"). Unknown names give Point.
SeedPattern seedPatternFromName(const std::string& name);

// Fills an already cleared grid with the pattern and sets maxRadius.
// NoisePatch and Scatter draw from rng; every pattern leaves at least one
// occupied cell on grids of 8x8 or larger.
void seedGrid(ParticleGrid& grid, SeedPattern pattern, std::mt19937& rng);
