#include "braille_sampler.h"
#include <algorithm>
#include "dla_simulation.h"

const uint8_t kBrailleDots[kDotsX][kDotsY] = {
    {0x01, 0x02, 0x04, 0x40},  // left column, rows 0..3
    {0x08, 0x10, 0x20, 0x80},  // right column
};

static float colorValue(const ParticleData& p, ColorMode mode, float invNumParticles, float maxRadius) {
    switch (mode) {
        case ColorMode::Age:       return (float)p.age * invNumParticles;
        case ColorMode::Distance:  return p.distance / maxRadius;
        case ColorMode::Density:   return (float)p.neighborCount / 8.0f;
        case ColorMode::Direction: return (p.direction + kPi) / kTwoPi;
    }
    return 0.0f;
}

std::vector<GlyphCell> renderToBraille(const DlaSimulation& sim, int canvasW, int canvasH,
                                       const ColorLut& lut, const BrailleRenderOptions& opts) {
    return renderGridToBraille(sim.grid(), sim.numParticles(), canvasW, canvasH, lut, opts);
}

std::vector<GlyphCell> renderGridToBraille(const ParticleGrid& grid, std::size_t numParticles,
                                           int canvasW, int canvasH,
                                           const ColorLut& lut, const BrailleRenderOptions& opts) {
    std::vector<GlyphCell> cells;
    if (canvasW <= 0 || canvasH <= 0) return cells;

    const float scaleX = (float)grid.width() / (float)(canvasW * kDotsX);
    const float scaleY = (float)grid.height() / (float)(canvasH * kDotsY);
    const float invNum = 1.0f / (float)std::max<std::size_t>(numParticles, 1);
    const float maxRadius = std::max(grid.maxRadius(), 1.0f);
    const std::size_t stuck = grid.particlesStuck();
    const std::size_t highlight = (std::size_t)std::max(opts.highlightRecent, 0);

    cells.reserve((std::size_t)canvasW * (std::size_t)canvasH / 4);
    for (int cy = 0; cy < canvasH; ++cy) {
        for (int cx = 0; cx < canvasW; ++cx) {
            uint8_t pattern = 0;
            float total = 0.0f;
            int lit = 0;
            bool recent = false;

            for (int dx = 0; dx < kDotsX; ++dx) {
                for (int dy = 0; dy < kDotsY; ++dy) {
                    const int sx = (int)((float)(cx * kDotsX + dx) * scaleX);
                    const int sy = (int)((float)(cy * kDotsY + dy) * scaleY);
                    const ParticleData* p = grid.get(sx, sy);
                    if (!p) continue;
                    pattern |= kBrailleDots[dx][dy];
                    ++lit;
                    if (highlight > 0 && p->age + highlight >= stuck) recent = true;
                    total += colorValue(*p, opts.colorMode, invNum, maxRadius);
                }
            }
            if (pattern == 0) continue;

            GlyphCell cell;
            cell.x = (uint16_t)cx;
            cell.y = (uint16_t)cy;
            cell.pattern = pattern;
            if (recent) {
                cell.color = kHighlightColor;
            } else if (opts.colorByValue) {
                const float avg = total / (float)lit;
                cell.color = mapFromLut(lut, opts.invertColors ? 1.0f - avg : avg);
            } else {
                cell.color = Rgb{255, 255, 255};
            }
            cells.push_back(cell);
        }
    }
    return cells;
}

std::pair<int, int> calculateSimulationSize(int canvasW, int canvasH) {
    return {std::max(canvasW * kDotsX, 64), std::max(canvasH * kDotsY, 64)};
}

std::string brailleUtf8(uint8_t pattern) {
    const uint32_t cp = kBrailleBase + pattern;
    std::string s;
    s += (char)(0xE0 | (cp >> 12));
    s += (char)(0x80 | ((cp >> 6) & 0x3F));
    s += (char)(0x80 | (cp & 0x3F));
    return s;
}
