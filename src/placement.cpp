#include "placement.hpp"

#include "dungeon_sink.hpp"

#include <cmath>

namespace {

// Rooms that never receive enemies or chests.
bool isSafeRoom(const Room& r) {
    return r.isStart || r.isBoss;
}

const Room* findStartRoom(const std::vector<Room>& rooms) {
    for (const Room& r : rooms) {
        if (r.isStart) return &r;
    }
    return nullptr;
}

// Rooms can overlap (walk layout, forced boss room). Tests the cell against
// every start room box, and every boss room box when `avoidBoss` is set.
bool inExcludedRoom(const std::vector<Room>& rooms, const Vec2i& p, bool avoidBoss) {
    for (const Room& r : rooms) {
        if (!r.isStart && !(avoidBoss && r.isBoss)) continue;
        if (r.contains(p)) return true;
    }
    return false;
}

// Redraws an interior cell of `room` until it leaves the excluded rooms.
// Gives up after kSpawnCellTries draws.
bool drawSpawnCell(const Room& room, const std::vector<Room>& rooms, RNG& rng, Vec2i& out) {
    for (int attempt = 0; attempt < kSpawnCellTries; ++attempt) {
        const Vec2i cell = randomInteriorCell(room, rng);
        if (inExcludedRoom(rooms, cell, true)) continue;
        out = cell;
        return true;
    }
    return false;
}

} // namespace

bool PlacementRecord::isClear(const Vec2f& p) const {
    for (const Vec2f& q : points_) {
        if (distance(p, q) < minDist_) return false;
    }
    return true;
}

bool PlacementRecord::tryAccept(const Vec2f& p) {
    if (!isClear(p)) return false;
    points_.push_back(p);
    return true;
}

bool isNearWall(const CellSet& walls, const Vec2i& p) {
    return anyNeighbor4In(walls, p);
}

Vec2i randomInteriorCell(const Room& room, RNG& rng) {
    const int ix = room.halfW() - 1;
    const int iy = room.halfH() - 1;
    const int x = (ix > 0) ? rng.range(room.pos.x - ix, room.pos.x + ix) : room.pos.x;
    const int y = (iy > 0) ? rng.range(room.pos.y - iy, room.pos.y + iy) : room.pos.y;
    return {x, y};
}

int prefabTargetCount(const Room& room, float density) {
    if (density <= 0.0f) return 0;
    return static_cast<int>(std::lround(static_cast<float>(room.w * room.h) * density));
}

int placeDecorations(const GenConfig& cfg, const std::vector<Room>& rooms,
                     const CellSet& floor, const CellSet& walls, RNG& rng, DungeonSink* sink) {
    if (cfg.catalog.decorationVariants <= 0) return 0;

    const Room* start = findStartRoom(rooms);
    int placed = 0;
    for (const Vec2i& p : floor) {
        // The roll comes first so the RNG stream does not depend on the
        // exclusion tests.
        if (!rng.chance(cfg.decorationDensity)) continue;
        if (isNearWall(walls, p)) continue;
        if (start && start->contains(p)) continue;

        const int variant = rng.index(cfg.catalog.decorationVariants);
        if (sink) sink->emitDecorationCell(p, variant);
        ++placed;
    }
    return placed;
}

int placeLights(const GenConfig& cfg, const std::vector<Room>& rooms, RNG& rng, DungeonSink* sink) {
    if (cfg.lightColors.empty()) return 0;

    int placed = 0;
    for (const Room& room : rooms) {
        // Boss-sized rooms get a fixed, brighter set.
        const int count = (room.w > cfg.bossRoomSize - 3) ? 5 : rng.range(1, 3);

        for (int i = 0; i < count; ++i) {
            if (!rng.chance(cfg.lightDensity)) continue;

            const Vec2i cell = randomInteriorCell(room, rng);
            const Color& color = cfg.lightColors[static_cast<size_t>(rng.index(static_cast<int>(cfg.lightColors.size())))];
            const float intensity = rng.rangef(cfg.minLightIntensity, cfg.maxLightIntensity);
            const float radius = rng.rangef(cfg.minLightRadius, cfg.maxLightRadius);

            if (sink) sink->spawnLight(toWorld(cell), color, intensity, radius);
            ++placed;
        }
    }
    return placed;
}

int placeEnemies(const GenConfig& cfg, const std::vector<Room>& rooms, RNG& rng, DungeonSink* sink) {
    if (cfg.catalog.enemyVariants <= 0 || cfg.maxEnemiesPerRoom <= 0) return 0;

    int placed = 0;
    for (const Room& room : rooms) {
        if (isSafeRoom(room)) continue;
        if (!rng.chance(cfg.enemySpawnChance)) continue;

        const int count = rng.range(1, cfg.maxEnemiesPerRoom);
        for (int i = 0; i < count; ++i) {
            Vec2i cell;
            if (!drawSpawnCell(room, rooms, rng, cell)) continue;
            const int variant = rng.index(cfg.catalog.enemyVariants);
            if (sink) sink->spawnEnemy(toWorld(cell), variant);
            ++placed;
        }
    }
    return placed;
}

int placeChests(const GenConfig& cfg, const std::vector<Room>& rooms, RNG& rng, DungeonSink* sink) {
    if (!cfg.catalog.hasChest) return 0;

    int placed = 0;
    for (const Room& room : rooms) {
        if (isSafeRoom(room)) continue;
        if (!rng.chance(cfg.chestSpawnChance)) continue;

        Vec2i cell;
        if (!drawSpawnCell(room, rooms, rng, cell)) continue;
        if (sink) sink->spawnChest(toWorld(cell));
        ++placed;
    }
    return placed;
}

int placePrefabs(const GenConfig& cfg, const std::vector<Room>& rooms,
                 const CellSet& floor, const CellSet& walls, RNG& rng, DungeonSink* sink) {
    if (cfg.catalog.prefabVariants <= 0) return 0;

    PlacementRecord record(cfg.minDecorationDistance);
    int placed = 0;

    for (const Room& room : rooms) {
        if (room.isStart) continue;

        const int target = prefabTargetCount(room, cfg.prefabDensity);
        if (target <= 0) continue;

        int accepted = 0;
        const int maxAttempts = target * 10;
        for (int attempt = 0; attempt < maxAttempts && accepted < target; ++attempt) {
            const Vec2i cell = randomInteriorCell(room, rng);
            if (!contains(floor, cell)) continue;
            if (isNearWall(walls, cell)) continue;
            if (inExcludedRoom(rooms, cell, false)) continue;
            if (!record.tryAccept(toWorld(cell))) continue;

            const int variant = rng.index(cfg.catalog.prefabVariants);
            if (sink) sink->spawnDecorationPrefab(toWorld(cell), variant);
            ++accepted;
        }
        placed += accepted;
    }
    return placed;
}
