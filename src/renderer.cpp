#include "renderer.h"
#include <cmath>
#include <algorithm>

#ifdef __APPLE__
#include <OpenGL/gl.h>
#else
#include <GL/gl.h>
#endif

#include "dla_simulation.h"

void Renderer2D::computeViewport(int fbWidth, int fbHeight, const RenderSettings& rs, Viewport& vp) {
    vp.width = fbWidth; vp.height = fbHeight;
    // Reserve a fixed sidebar on the left for UI and minimal margins
    const float kSidebar = 360.0f; // pixels
    const float kMargin = 16.0f;   // pixels
    float availW = std::max(0.0f, (float)fbWidth - kSidebar - 2.0f * kMargin);
    float availH = std::max(0.0f, (float)fbHeight - 2.0f * kMargin);
    float cellW = rs.dotSpacing * kDotsX;
    float cellH = rs.dotSpacing * kDotsY;
    vp.canvasCols = std::max(1, (int)(availW / cellW));
    vp.canvasRows = std::max(1, (int)(availH / cellH));
    float usedW = vp.canvasCols * cellW;
    float usedH = vp.canvasRows * cellH;
    vp.offset = Vec2(kSidebar + kMargin + 0.5f * (availW - usedW), kMargin + 0.5f * (availH - usedH));
}

Vec2 Renderer2D::dotToScreen(int cx, int cy, int dx, int dy, const Viewport& vp, const RenderSettings& rs) {
    float s = rs.dotSpacing;
    return Vec2(vp.offset.x + (cx * kDotsX + dx + 0.5f) * s, vp.offset.y + (cy * kDotsY + dy + 0.5f) * s);
}

Vec2 Renderer2D::gridToScreen(const Vec2& gp, const DlaSimulation& sim, const Viewport& vp, const RenderSettings& rs) {
    // Inverse of the sampler's nearest-neighbor scale
    float sx = (vp.canvasCols * kDotsX) / (float)sim.width();
    float sy = (vp.canvasRows * kDotsY) / (float)sim.height();
    return Vec2(vp.offset.x + gp.x * sx * rs.dotSpacing, vp.offset.y + gp.y * sy * rs.dotSpacing);
}

void Renderer2D::drawBackground() {
    glClearColor(0.05f, 0.05f, 0.07f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
}

void Renderer2D::drawDomain(const Viewport& vp, const RenderSettings& rs) {
    glMatrixMode(GL_PROJECTION); glLoadIdentity();
    glOrtho(0, vp.width, vp.height, 0, -1, 1);
    glMatrixMode(GL_MODELVIEW); glLoadIdentity();
    if (!rs.showDomain) return;

    glLineWidth(2.0f);
    glColor3f(0.18f, 0.22f, 0.28f);
    Vec2 o = vp.offset;
    float w = vp.canvasCols * kDotsX * rs.dotSpacing;
    float h = vp.canvasRows * kDotsY * rs.dotSpacing;
    glBegin(GL_LINE_LOOP);
    glVertex2f(o.x, o.y);
    glVertex2f(o.x + w, o.y);
    glVertex2f(o.x + w, o.y + h);
    glVertex2f(o.x, o.y + h);
    glEnd();
}

void Renderer2D::drawGlyphCells(const std::vector<GlyphCell>& cells, const Viewport& vp, const RenderSettings& rs) {
    glEnable(GL_POINT_SMOOTH);
    glPointSize(clampf(rs.dotSize, 1.0f, 12.0f));
    glBegin(GL_POINTS);
    for (const GlyphCell& c : cells) {
        glColor3ub(c.color.r, c.color.g, c.color.b);
        for (int dx = 0; dx < kDotsX; ++dx) {
            for (int dy = 0; dy < kDotsY; ++dy) {
                if (!(c.pattern & kBrailleDots[dx][dy])) continue;
                Vec2 sp = dotToScreen(c.x, c.y, dx, dy, vp, rs);
                glVertex2f(sp.x, sp.y);
            }
        }
    }
    glEnd();
    glDisable(GL_POINT_SMOOTH);
}

void Renderer2D::drawSpawnCircle(const DlaSimulation& sim, const Viewport& vp, const RenderSettings& rs) {
    if (!rs.showSpawnCircle) return;
    const float r = sim.spawnRadius();
    const Vec2 c(sim.width() * 0.5f, sim.height() * 0.5f);
    const int seg = 96;
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glColor4f(0.9f, 0.35f, 0.3f, 0.5f);
    glLineWidth(1.0f);
    glBegin(GL_LINE_LOOP);
    for (int k = 0; k < seg; ++k) {
        float ang = (float)k / seg * kTwoPi;
        Vec2 sp = gridToScreen(c + fromAngle(ang, r), sim, vp, rs);
        glVertex2f(sp.x, sp.y);
    }
    glEnd();
    glDisable(GL_BLEND);
}
