#include "corridor.hpp"

#include <algorithm>

namespace {

bool insideAnyRoom(const std::vector<Room>& rooms, const Vec2i& p) {
    return std::any_of(rooms.begin(), rooms.end(), [&](const Room& r) { return r.contains(p); });
}

} // namespace

Vec2i pickCorridorAnchor(const Room& room, RNG& rng) {
    const int jx = room.w / 4;
    const int jy = room.h / 4;
    const int x = rng.range(room.pos.x - jx, room.pos.x + jx);
    const int y = rng.range(room.pos.y - jy, room.pos.y + jy);
    return {x, y};
}

std::vector<Vec2i> lPath(const Vec2i& from, const Vec2i& to) {
    std::vector<Vec2i> path;
    path.reserve(static_cast<size_t>(manhattan(from, to) + 1));

    Vec2i cur = from;
    path.push_back(cur);
    while (cur.x != to.x) {
        cur.x += sign(to.x - cur.x);
        path.push_back(cur);
    }
    while (cur.y != to.y) {
        cur.y += sign(to.y - cur.y);
        path.push_back(cur);
    }
    return path;
}

void stampSquare(const Vec2i& center, int width, CellSet& out) {
    if (width <= 0) return;
    const int lo = -(width - 1) / 2;
    const int hi = width / 2;
    for (int dy = lo; dy <= hi; ++dy) {
        for (int dx = lo; dx <= hi; ++dx) {
            out.insert({center.x + dx, center.y + dy});
        }
    }
}

int carveCorridor(const Vec2i& from, const Vec2i& to, int width,
                  const std::vector<Room>& rooms, CellSet& floor) {
    int added = 0;
    CellSet stamp;
    for (const Vec2i& step : lPath(from, to)) {
        stamp.clear();
        stampSquare(step, width, stamp);
        for (const Vec2i& c : stamp) {
            if (insideAnyRoom(rooms, c)) continue;
            if (floor.insert(c).second) ++added;
        }
    }
    return added;
}

int carveCorridors(const RoomGraph& graph, int width, RNG& rng, CellSet& floor) {
    int added = 0;
    for (const RoomConnection& c : graph.connections) {
        if (c.a < 0 || c.b < 0) continue;
        if (c.a >= static_cast<int>(graph.rooms.size()) || c.b >= static_cast<int>(graph.rooms.size())) continue;

        const Room& ra = graph.rooms[static_cast<size_t>(c.a)];
        const Room& rb = graph.rooms[static_cast<size_t>(c.b)];
        const Vec2i pa = pickCorridorAnchor(ra, rng);
        const Vec2i pb = pickCorridorAnchor(rb, rng);
        added += carveCorridor(pa, pb, width, graph.rooms, floor);
    }
    return added;
}
