// Color schemes and their precomputed lookup tables.
#pragma once
#include <array>
#include <cstdint>

struct Rgb {
    uint8_t r{255}, g{255}, b{255};
};
inline bool operator==(const Rgb& a, const Rgb& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(const Rgb& a, const Rgb& b) { return !(a == b); }

enum class ColorScheme { Ice, Fire, Plasma, Viridis, Rainbow, Grayscale, Ocean, Neon };

const char* toString(ColorScheme s);
ColorScheme next(ColorScheme s);
ColorScheme prev(ColorScheme s);
// Parses a scheme tag ("Fire"); returns false for unknown names
bool colorSchemeFromString(const char* name, ColorScheme& out);

constexpr int kLutSize = 256;
using ColorLut = std::array<Rgb, kLutSize>;

// Piecewise-linear gradient through the scheme's stops, sampled 256 times
ColorLut buildLut(ColorScheme s);
// t is clamped to [0, 1]
Rgb mapFromLut(const ColorLut& lut, float t);
