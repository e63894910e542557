// Braille sampling of the simulation grid.
//
// Every glyph cell covers a 2x4 block of sub-positions (one Unicode braille
// dot each). Sub-positions are nearest-neighbor sampled from the grid, so a
// grid larger than 2*canvasW x 4*canvasH can skip isolated particles; the
// simulation is normally sized with calculateSimulationSize() to avoid that.
//
// Dot bits:
//   (0,0)=0x01  (1,0)=0x08
//   (0,1)=0x02  (1,1)=0x10
//   (0,2)=0x04  (1,2)=0x20
//   (0,3)=0x40  (1,3)=0x80
#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "color_lut.h"
#include "particle_grid.h"
#include "policies.h"

class DlaSimulation;

constexpr uint32_t kBrailleBase = 0x2800;
constexpr int kDotsX = 2;
constexpr int kDotsY = 4;
extern const uint8_t kBrailleDots[kDotsX][kDotsY];

struct GlyphCell {
    uint16_t x{0};        // glyph column
    uint16_t y{0};        // glyph row
    uint8_t pattern{0};   // braille dot bits, never 0
    Rgb color;

    uint32_t codepoint() const { return kBrailleBase + pattern; }
};

struct BrailleRenderOptions {
    ColorMode colorMode = ColorMode::Age;
    int highlightRecent = 0;   // 0 disables highlighting
    bool invertColors = false;
    bool colorByValue = true;  // false: plain white glyphs
};

constexpr Rgb kHighlightColor{255, 255, 255};

// Row-major list of non-empty glyph cells for a canvasW x canvasH canvas.
// Pure read of the simulation; the result is stable for an unchanged grid.
std::vector<GlyphCell> renderToBraille(const DlaSimulation& sim, int canvasW, int canvasH,
                                       const ColorLut& lut, const BrailleRenderOptions& opts);
// Same sampling over a bare grid; numParticles scales the Age color value
std::vector<GlyphCell> renderGridToBraille(const ParticleGrid& grid, std::size_t numParticles,
                                           int canvasW, int canvasH,
                                           const ColorLut& lut, const BrailleRenderOptions& opts);

// Grid size giving one cell per braille dot, at least 64x64
std::pair<int, int> calculateSimulationSize(int canvasW, int canvasH);

// UTF-8 encoding of a braille pattern (always three bytes)
std::string brailleUtf8(uint8_t pattern);
