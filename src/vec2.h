// Minimal 2D vector utilities for walker positions
#pragma once
#include <cmath>

struct Vec2 {
    float x{0}, y{0};
    Vec2() = default;
    Vec2(float _x, float _y) : x(_x), y(_y) {}
    Vec2 operator+(const Vec2& o) const { return Vec2(x + o.x, y + o.y); }
    Vec2 operator-(const Vec2& o) const { return Vec2(x - o.x, y - o.y); }
    Vec2 operator*(float s) const { return Vec2(x * s, y * s); }
    Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }
};

inline float dot(const Vec2& a, const Vec2& b) { return a.x*b.x + a.y*b.y; }
inline float lengthSq(const Vec2& v) { return dot(v, v); }
inline float length(const Vec2& v) { return std::sqrt(dot(v,v)); }
// Angle of v measured from +x, in (-pi, pi]
inline float angleOf(const Vec2& v) { return std::atan2(v.y, v.x); }
inline Vec2 fromAngle(float a, float len) { return Vec2(std::cos(a) * len, std::sin(a) * len); }
inline float clampf(float x, float lo, float hi) {
    return x < lo ? lo : (x > hi ? hi : x);
}
inline int clampi(int x, int lo, int hi) {
    return x < lo ? lo : (x > hi ? hi : x);
}

constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 6.28318530717958647692f;
inline float toRadians(float deg) { return deg * (kPi / 180.0f); }
