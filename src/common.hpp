#pragma once
#include <cmath>
#include <cstdint>
#include <cstdlib>

// World space is +x right, +y up. "Above" a cell is y+1.
struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Vec2i& a, const Vec2i& b) { return !(a == b); }
inline Vec2i operator+(const Vec2i& a, const Vec2i& b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2i operator-(const Vec2i& a, const Vec2i& b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2i operator*(const Vec2i& a, int s) { return {a.x * s, a.y * s}; }

// Row-major ordering (y, then x). Used by the ordered cell sets so every pass
// walks cells in the same order for a given seed.
inline bool operator<(const Vec2i& a, const Vec2i& b) {
    return (a.y != b.y) ? (a.y < b.y) : (a.x < b.x);
}

// Continuous world position handed to spawn sinks.
struct Vec2f {
    float x = 0.0f;
    float y = 0.0f;
};

inline Vec2f toWorld(const Vec2i& p) {
    return {static_cast<float>(p.x), static_cast<float>(p.y)};
}

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

inline bool operator==(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

inline int sign(int v) {
    return (v > 0) - (v < 0);
}

inline float clampf(float v, float lo, float hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline int manhattan(const Vec2i& a, const Vec2i& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline float distance(const Vec2i& a, const Vec2i& b) {
    const float dx = static_cast<float>(a.x - b.x);
    const float dy = static_cast<float>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

inline float distance(const Vec2f& a, const Vec2f& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}
