// Braille sampling, color lookup tables and glyph encoding
#include <cstdio>
#include <string>
#include <vector>
#include "../src/braille_sampler.h"
#include "../src/dla_simulation.h"

static int failures = 0;

static const char* verdict(bool ok) {
    if (!ok) ++failures;
    return ok ? "PASS" : "FAIL";
}

static DlaSimulation makeSim(int w, int h, SeedPattern seed) {
    DlaParams p;
    p.width = w; p.height = h;
    p.numParticles = 2000;
    p.seedPattern = seed;
    p.rngSeed = 7;
    return DlaSimulation(p);
}

int main() {
    const ColorLut ice = buildLut(ColorScheme::Ice);

    // Test 1: simulation sizing gives one cell per dot, at least 64x64
    {
        const std::pair<int, int> a = calculateSimulationSize(40, 20);
        const std::pair<int, int> b = calculateSimulationSize(100, 30);
        const std::pair<int, int> c = calculateSimulationSize(0, 0);
        const bool ok = a.first == 80 && a.second == 80 && b.first == 200 && b.second == 120 &&
                        c.first == 64 && c.second == 64;
        std::printf("Test1 calculateSimulationSize -> %s\n", verdict(ok));
    }

    // Test 2: a single point lands on the top-left dot of its glyph
    {
        DlaSimulation sim = makeSim(64, 64, SeedPattern::Point);
        BrailleRenderOptions opts;
        const std::vector<GlyphCell> cells = renderToBraille(sim, 32, 16, ice, opts);
        bool ok = cells.size() == 1;
        if (ok) {
            const GlyphCell& c = cells[0];
            ok = c.x == 16 && c.y == 8 && c.pattern == 0x01 && c.codepoint() == 0x2801 &&
                 c.color == ice[0];
        }
        std::printf("Test2 point seed samples to one glyph -> %s\n", verdict(ok));
    }

    // Test 3: output is row-major and never carries an empty pattern
    {
        DlaSimulation sim = makeSim(64, 64, SeedPattern::Ring);
        for (int i = 0; i < 200; ++i) sim.step();
        BrailleRenderOptions opts;
        opts.colorMode = ColorMode::Distance;
        const std::vector<GlyphCell> cells = renderToBraille(sim, 32, 16, ice, opts);
        bool ok = !cells.empty();
        std::size_t dots = 0;
        for (std::size_t i = 0; i < cells.size(); ++i) {
            if (cells[i].pattern == 0) ok = false;
            if (i > 0) {
                const GlyphCell& a = cells[i - 1];
                const GlyphCell& b = cells[i];
                if (!(a.y < b.y || (a.y == b.y && a.x < b.x))) ok = false;
            }
            for (int bit = 0; bit < 8; ++bit) dots += (cells[i].pattern >> bit) & 1u;
        }
        // One dot per cell at 1:1 scale, so every particle is visible
        ok = ok && dots == sim.particlesStuck();
        std::printf("Test3 row-major non-empty glyphs, %zu dots -> %s\n", dots, verdict(ok));
    }

    // Test 4: rendering is a pure read
    {
        DlaSimulation sim = makeSim(64, 64, SeedPattern::Starburst);
        BrailleRenderOptions opts;
        const std::vector<GlyphCell> a = renderToBraille(sim, 32, 16, ice, opts);
        const std::vector<GlyphCell> b = renderToBraille(sim, 32, 16, ice, opts);
        bool ok = a.size() == b.size();
        for (std::size_t i = 0; ok && i < a.size(); ++i) {
            ok = a[i].x == b[i].x && a[i].y == b[i].y && a[i].pattern == b[i].pattern && a[i].color == b[i].color;
        }
        std::printf("Test4 repeated render is identical -> %s\n", verdict(ok));
    }

    // Test 5: highlight, invert and plain white options
    {
        DlaSimulation sim = makeSim(64, 64, SeedPattern::Point);
        BrailleRenderOptions opts;
        opts.highlightRecent = 5;
        bool ok = renderToBraille(sim, 32, 16, ice, opts)[0].color == kHighlightColor;

        opts.highlightRecent = 0;
        opts.invertColors = true;
        ok = ok && renderToBraille(sim, 32, 16, ice, opts)[0].color == ice[kLutSize - 1];

        opts.invertColors = false;
        opts.colorByValue = false;
        ok = ok && renderToBraille(sim, 32, 16, ice, opts)[0].color == (Rgb{255, 255, 255});
        std::printf("Test5 highlight/invert/white coloring -> %s\n", verdict(ok));
    }

    // Test 6: a coarse canvas merges dots into shared glyphs
    {
        DlaSimulation sim = makeSim(64, 64, SeedPattern::Line);
        BrailleRenderOptions opts;
        const std::vector<GlyphCell> cells = renderToBraille(sim, 32, 16, ice, opts);
        // 32 cells of the line at y=32 fill the top row of 16 glyphs, both columns
        bool ok = cells.size() == 16;
        for (const GlyphCell& c : cells) ok = ok && c.pattern == (0x01 | 0x08) && c.y == 8;
        ok = ok && renderToBraille(sim, 0, 16, ice, opts).empty();
        std::printf("Test6 line seed merges into %zu glyphs -> %s\n", cells.size(), verdict(ok));
    }

    // Test 7: lookup table endpoints, clamping and scheme cycling
    {
        const ColorLut fire = buildLut(ColorScheme::Fire);
        bool ok = ice[0] == (Rgb{20, 40, 90}) && ice[kLutSize - 1] == (Rgb{230, 250, 255});
        ok = ok && fire[0] == (Rgb{60, 0, 0}) && fire[kLutSize - 1] == (Rgb{255, 255, 200});
        ok = ok && mapFromLut(ice, -2.0f) == ice[0] && mapFromLut(ice, 7.0f) == ice[kLutSize - 1];
        ok = ok && mapFromLut(ice, 0.5f) == ice[128];
        ColorScheme s = ColorScheme::Ice;
        for (int i = 0; i < 8; ++i) s = next(s);
        ok = ok && s == ColorScheme::Ice && prev(ColorScheme::Ice) == ColorScheme::Neon;
        ColorScheme parsed = ColorScheme::Ice;
        ok = ok && colorSchemeFromString("Viridis", parsed) && parsed == ColorScheme::Viridis;
        ok = ok && !colorSchemeFromString("Sepia", parsed) && parsed == ColorScheme::Viridis;
        std::printf("Test7 color lookup tables -> %s\n", verdict(ok));
    }

    // Test 8: braille UTF-8 encoding
    {
        const std::string full = brailleUtf8(0xFF);
        const std::string one = brailleUtf8(0x01);
        const bool ok = full == "\xE2\xA3\xBF" && one == "\xE2\xA0\x81" && kBrailleDots[1][3] == 0x80;
        std::printf("Test8 braille UTF-8 encoding -> %s\n", verdict(ok));
    }

    // Test 9: glyph color is the LUT entry of the averaged per-dot value
    {
        // Identity table: red channel = LUT index
        ColorLut index;
        for (int i = 0; i < kLutSize; ++i) index[i] = Rgb{(uint8_t)i, 0, 0};

        ParticleGrid grid(8, 8);
        ParticleData a; a.age = 10; a.distance = 4.0f; a.neighborCount = 2; a.direction = -kPi * 0.5f;
        ParticleData b; b.age = 30; b.distance = 8.0f; b.neighborCount = 4; b.direction = -kPi * 0.5f;
        ParticleData c; c.age = 80; c.distance = 2.0f; c.neighborCount = 8; c.direction = kPi * 0.5f;
        grid.place(0, 0, a);   // glyph (0,0), dot (0,0)
        grid.place(1, 3, b);   // glyph (0,0), dot (1,3)
        grid.place(5, 6, c);   // glyph (2,1), dot (1,2)
        grid.setMaxRadius(8.0f);

        struct Expect { ColorMode mode; int first; int second; };
        const Expect expects[] = {
            {ColorMode::Age,       51,  204},  // (0.1+0.3)/2, 0.8
            {ColorMode::Distance,  191, 64},   // (0.5+1.0)/2, 0.25
            {ColorMode::Density,   96,  255},  // (0.25+0.5)/2, 1.0
            {ColorMode::Direction, 64,  191},  // 0.25, 0.75
        };
        bool ok = true;
        for (const Expect& e : expects) {
            BrailleRenderOptions opts;
            opts.colorMode = e.mode;
            const std::vector<GlyphCell> cells = renderGridToBraille(grid, 100, 4, 2, index, opts);
            if (cells.size() != 2 || cells[0].pattern != (0x01 | 0x80) || cells[1].x != 2 || cells[1].y != 1 ||
                cells[1].pattern != 0x20 || cells[0].color.r != e.first || cells[1].color.r != e.second) {
                std::printf("  %s: got %zu cells\n", toString(e.mode), cells.size());
                ok = false;
            }
        }
        std::printf("Test9 per-mode value averaging picks the expected LUT index -> %s\n", verdict(ok));
    }

    return failures == 0 ? 0 : 1;
}
