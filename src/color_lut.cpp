#include "color_lut.h"
#include <cmath>
#include <cstddef>
#include <cstring>
#include "vec2.h"

struct GradientStop {
    float t;
    Rgb c;
};

static const GradientStop kIce[] = {
    {0.0f, {20, 40, 90}}, {0.5f, {60, 160, 230}}, {1.0f, {230, 250, 255}},
};
static const GradientStop kFire[] = {
    {0.0f, {60, 0, 0}}, {0.35f, {200, 30, 0}}, {0.7f, {255, 160, 0}}, {1.0f, {255, 255, 200}},
};
static const GradientStop kPlasma[] = {
    {0.0f, {13, 8, 135}}, {0.33f, {156, 23, 158}}, {0.66f, {237, 121, 83}}, {1.0f, {240, 249, 33}},
};
static const GradientStop kViridis[] = {
    {0.0f, {68, 1, 84}}, {0.33f, {49, 104, 142}}, {0.66f, {53, 183, 121}}, {1.0f, {253, 231, 37}},
};
static const GradientStop kRainbow[] = {
    {0.0f, {255, 0, 0}}, {0.2f, {255, 165, 0}}, {0.4f, {255, 255, 0}},
    {0.6f, {0, 200, 0}}, {0.8f, {0, 100, 255}}, {1.0f, {150, 0, 220}},
};
static const GradientStop kGrayscale[] = {
    {0.0f, {60, 60, 60}}, {1.0f, {255, 255, 255}},
};
static const GradientStop kOcean[] = {
    {0.0f, {0, 20, 50}}, {0.4f, {0, 90, 140}}, {0.75f, {0, 180, 170}}, {1.0f, {180, 255, 230}},
};
static const GradientStop kNeon[] = {
    {0.0f, {255, 0, 200}}, {0.5f, {0, 255, 255}}, {1.0f, {180, 255, 0}},
};

struct Gradient {
    const GradientStop* stops;
    int count;
};

template <std::size_t N>
static Gradient gradientOf(const GradientStop (&stops)[N]) {
    return Gradient{stops, (int)N};
}

static Gradient gradientFor(ColorScheme s) {
    switch (s) {
        case ColorScheme::Ice:       return gradientOf(kIce);
        case ColorScheme::Fire:      return gradientOf(kFire);
        case ColorScheme::Plasma:    return gradientOf(kPlasma);
        case ColorScheme::Viridis:   return gradientOf(kViridis);
        case ColorScheme::Rainbow:   return gradientOf(kRainbow);
        case ColorScheme::Grayscale: return gradientOf(kGrayscale);
        case ColorScheme::Ocean:     return gradientOf(kOcean);
        case ColorScheme::Neon:      return gradientOf(kNeon);
    }
    return gradientOf(kIce);
}

static const ColorScheme kSchemeOrder[] = {
    ColorScheme::Ice, ColorScheme::Fire, ColorScheme::Plasma, ColorScheme::Viridis,
    ColorScheme::Rainbow, ColorScheme::Grayscale, ColorScheme::Ocean, ColorScheme::Neon,
};
static const int kSchemeCount = (int)(sizeof(kSchemeOrder) / sizeof(kSchemeOrder[0]));

const char* toString(ColorScheme s) {
    switch (s) {
        case ColorScheme::Ice:       return "Ice";
        case ColorScheme::Fire:      return "Fire";
        case ColorScheme::Plasma:    return "Plasma";
        case ColorScheme::Viridis:   return "Viridis";
        case ColorScheme::Rainbow:   return "Rainbow";
        case ColorScheme::Grayscale: return "Grayscale";
        case ColorScheme::Ocean:     return "Ocean";
        case ColorScheme::Neon:      return "Neon";
    }
    return "Ice";
}

ColorScheme next(ColorScheme s) { return kSchemeOrder[((int)s + 1) % kSchemeCount]; }
ColorScheme prev(ColorScheme s) { return kSchemeOrder[((int)s + kSchemeCount - 1) % kSchemeCount]; }

bool colorSchemeFromString(const char* name, ColorScheme& out) {
    for (ColorScheme s : kSchemeOrder) {
        if (std::strcmp(name, toString(s)) == 0) { out = s; return true; }
    }
    return false;
}

static uint8_t lerp8(uint8_t a, uint8_t b, float f) {
    return (uint8_t)std::lround((float)a + ((float)b - (float)a) * f);
}

ColorLut buildLut(ColorScheme s) {
    const Gradient g = gradientFor(s);
    ColorLut lut;
    int seg = 0;
    for (int i = 0; i < kLutSize; ++i) {
        const float t = (float)i / (float)(kLutSize - 1);
        while (seg < g.count - 2 && t > g.stops[seg + 1].t) ++seg;
        const GradientStop& a = g.stops[seg];
        const GradientStop& b = g.stops[seg + 1];
        const float f = clampf((t - a.t) / (b.t - a.t), 0.0f, 1.0f);
        lut[i] = Rgb{lerp8(a.c.r, b.c.r, f), lerp8(a.c.g, b.c.g, f), lerp8(a.c.b, b.c.b, f)};
    }
    return lut;
}

Rgb mapFromLut(const ColorLut& lut, float t) {
    if (!(t >= 0.0f)) t = 0.0f;  // also catches NaN
    const int i = (int)std::lround(clampf(t, 0.0f, 1.0f) * (float)(kLutSize - 1));
    return lut[i];
}
