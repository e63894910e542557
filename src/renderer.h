#pragma once
#include <vector>
#include "braille_sampler.h"
#include "vec2.h"

struct RenderSettings {
    float dotSize = 2.5f;       // pixels per braille dot
    float dotSpacing = 3.0f;    // pixels between dot centers
    bool showDomain = true;
    bool showSpawnCircle = false;
};

struct Viewport {
    int width{1280};
    int height{720};
    Vec2 offset{0,0};   // top-left of the canvas in pixels
    int canvasCols{0};  // glyph cells
    int canvasRows{0};
};

class DlaSimulation;

class Renderer2D {
public:
    static void computeViewport(int fbWidth, int fbHeight, const RenderSettings& rs, Viewport& vp);
    // Pixel center of braille dot (dx, dy) inside glyph cell (cx, cy)
    static Vec2 dotToScreen(int cx, int cy, int dx, int dy, const Viewport& vp, const RenderSettings& rs);
    // Grid coordinate to pixel position for a simulation of the given size
    static Vec2 gridToScreen(const Vec2& gp, const DlaSimulation& sim, const Viewport& vp, const RenderSettings& rs);

    static void drawBackground();
    static void drawDomain(const Viewport& vp, const RenderSettings& rs);
    static void drawGlyphCells(const std::vector<GlyphCell>& cells, const Viewport& vp, const RenderSettings& rs);
    static void drawSpawnCircle(const DlaSimulation& sim, const Viewport& vp, const RenderSettings& rs);
};
