#pragma once

#include "common.hpp"

#include <set>
#include <vector>

// Small grid helpers shared across the generator stages.

// Unique grid coordinates in row-major order. Ordered so that passes which draw
// from the RNG while iterating stay reproducible for a given seed.
using CellSet = std::set<Vec2i>;

static const Vec2i DIRS4[4] = { {0,1}, {1,0}, {0,-1}, {-1,0} };

// Inclusive integer rectangle: [minX..maxX] x [minY..maxY].
struct IntRect {
    int minX = 0;
    int minY = 0;
    int maxX = -1;
    int maxY = -1;

    bool empty() const { return maxX < minX || maxY < minY; }
    int width() const { return empty() ? 0 : maxX - minX + 1; }
    int height() const { return empty() ? 0 : maxY - minY + 1; }

    bool contains(const Vec2i& p) const {
        return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
    }

    void include(const Vec2i& p) {
        if (empty()) {
            minX = maxX = p.x;
            minY = maxY = p.y;
            return;
        }
        if (p.x < minX) minX = p.x;
        if (p.x > maxX) maxX = p.x;
        if (p.y < minY) minY = p.y;
        if (p.y > maxY) maxY = p.y;
    }
};

inline bool contains(const CellSet& cells, const Vec2i& p) {
    return cells.find(p) != cells.end();
}

inline bool anyNeighbor4In(const CellSet& cells, const Vec2i& p) {
    for (const Vec2i& d : DIRS4) {
        if (contains(cells, p + d)) return true;
    }
    return false;
}

// 4-connected flood fill restricted to `cells`, starting at `start`.
inline CellSet floodFill4(const CellSet& cells, const Vec2i& start) {
    CellSet seen;
    if (!contains(cells, start)) return seen;

    std::vector<Vec2i> stack;
    stack.push_back(start);
    seen.insert(start);

    while (!stack.empty()) {
        const Vec2i p = stack.back();
        stack.pop_back();
        for (const Vec2i& d : DIRS4) {
            const Vec2i n = p + d;
            if (!contains(cells, n)) continue;
            if (!seen.insert(n).second) continue;
            stack.push_back(n);
        }
    }
    return seen;
}
