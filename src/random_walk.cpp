#include "random_walk.hpp"

#include "corridor.hpp"

#include <algorithm>
#include <map>

namespace {

Vec2i walkOnce(const Vec2i& start, const GenConfig& cfg, RNG& rng, CellSet& path) {
    Vec2i cur = start;
    for (int step = 0; step < cfg.walkLength; ++step) {
        const Vec2i dir = DIRS4[rng.index(4)];
        for (int k = 0; k < cfg.corridorWidth; ++k) {
            cur = cur + dir;
            stampSquare(cur, cfg.corridorWidth, path);
        }
    }
    return cur;
}

} // namespace

RoomGraph carveRandomWalk(const GenConfig& cfg, RNG& rng, CellSet& corridorFloor,
                          GenerationStats* stats) {
    RoomGraph g;
    const Vec2i origin{0, 0};

    stampSquare(origin, cfg.corridorWidth, corridorFloor);

    // Walk endpoints in visiting order; repeats are kept so the chain of
    // connections follows the walk.
    std::vector<Vec2i> endpoints;
    endpoints.reserve(static_cast<size_t>(std::max(0, cfg.walkIterations)));

    Vec2i cur = origin;
    for (int it = 0; it < cfg.walkIterations; ++it) {
        cur = walkOnce(cur, cfg, rng, corridorFloor);
        endpoints.push_back(cur);
    }

    std::vector<Vec2i> centers;
    for (const Vec2i& p : endpoints) {
        if (p == origin) continue;
        bool seen = false;
        for (const Vec2i& c : centers) {
            if (c == p) { seen = true; break; }
        }
        if (!seen) centers.push_back(p);
    }

    int bossCenter = -1;
    float bestDist = -1.0f;
    for (size_t i = 0; i < centers.size(); ++i) {
        const float d = distance(origin, centers[i]);
        if (d > bestDist) {
            bestDist = d;
            bossCenter = static_cast<int>(i);
        }
    }

    if (stats) stats->targetRooms = static_cast<int>(centers.size()) + 1;

    Room start;
    start.pos = origin;
    start.w = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
    start.h = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
    start.isStart = true;
    g.rooms.push_back(start);

    std::map<Vec2i, int> roomAt;
    roomAt[origin] = 0;

    for (size_t i = 0; i < centers.size(); ++i) {
        Room r;
        r.pos = centers[i];
        if (static_cast<int>(i) == bossCenter) {
            r.w = cfg.bossRoomSize;
            r.h = cfg.bossRoomSize;
            r.isBoss = true;
        } else {
            r.w = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
            r.h = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
        }
        roomAt[r.pos] = static_cast<int>(g.rooms.size());
        g.rooms.push_back(r);
    }

    if (bossCenter < 0) {
        // Every walk came back to the origin (or there were no walks). Put the
        // boss straight above the start room and carve the way up to it.
        const int offset = cfg.bossRoomSize + cfg.corridorWidth + 10;
        Room boss;
        boss.pos = origin + Vec2i{0, offset};
        boss.w = cfg.bossRoomSize;
        boss.h = cfg.bossRoomSize;
        boss.isBoss = true;
        g.rooms.push_back(boss);
        g.connections.push_back({0, static_cast<int>(g.rooms.size()) - 1});
        for (const Vec2i& p : lPath(origin, boss.pos)) stampSquare(p, cfg.corridorWidth, corridorFloor);
        if (stats) stats->bossForced = true;
    } else {
        int prev = 0;
        for (const Vec2i& p : endpoints) {
            const int idx = roomAt[p];
            if (idx != prev) g.connections.push_back({prev, idx});
            prev = idx;
        }
    }

    if (stats) {
        stats->mainPathRooms = static_cast<int>(g.rooms.size());
        stats->corridorCells = static_cast<int>(corridorFloor.size());
    }
    return g;
}
