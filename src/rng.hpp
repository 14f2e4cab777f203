#pragma once
#include <cmath>
#include <cstdint>
#include <cstddef>

// Compile-time tag hashing (FNV-1a) for readable domain separation.
//
// Example:
//   uint32_t s = hashCombine(runSeed, tag32("WALLS"));
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

template <std::size_t N>
constexpr uint32_t tag32(const char (&str)[N]) {
    // N includes the null terminator for string literals.
    return fnv1a32(str, (N > 0) ? (N - 1) : 0);
}

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
//
// The whole generation pipeline draws from a single RNG instance, so the order
// of calls is part of the output. See the stage order in dungeon.cpp.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    // Inclusive on both ends.
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    // Uniform index in [0, count). Returns 0 for empty sets; callers check
    // the count themselves.
    int index(int count) {
        if (count <= 1) return 0;
        return static_cast<int>(nextU32() % static_cast<uint32_t>(count));
    }

    float next01() {
        // [0,1): 24 bits fit a float mantissa exactly, so 1.0f is never produced.
        return static_cast<float>(nextU32() >> 8) * (1.0f / 16777216.0f);
    }

    // [lo, hi)
    float rangef(float lo, float hi) {
        if (hi <= lo) return lo;
        const float v = lo + (hi - lo) * next01();
        return (v < hi) ? v : std::nextafter(hi, lo);
    }

    bool chance(float p) {
        return next01() < p;
    }
};

// A tiny integer hash for stable variation (tile variants, etc).
inline uint32_t hash32(uint32_t x) {
    // Thomas Wang-ish mix
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}
