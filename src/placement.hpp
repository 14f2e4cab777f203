#pragma once

#include "dungeon.hpp"

#include <vector>

class DungeonSink;

// Interior-cell draws per enemy or chest before the spawn is dropped.
constexpr int kSpawnCellTries = 10;

// Minimum-spacing record for one placement pass. Brute-force O(n^2) against
// everything accepted so far; pass sizes are bounded by room count and density.
class PlacementRecord {
public:
    explicit PlacementRecord(float minDistance) : minDist_(minDistance) {}

    // True if `p` is at least minDistance away from every accepted point.
    bool isClear(const Vec2f& p) const;

    // Accepts and records `p` if it is clear. Returns whether it was accepted.
    bool tryAccept(const Vec2f& p);

    void clear() { points_.clear(); }
    size_t size() const { return points_.size(); }

private:
    float minDist_ = 0.0f;
    std::vector<Vec2f> points_;
};

bool isNearWall(const CellSet& walls, const Vec2i& p);

// Uniform cell at least one cell inside the room border. An axis with no
// interior collapses to the room center.
Vec2i randomInteriorCell(const Room& room, RNG& rng);

// round(w * h * density)
int prefabTargetCount(const Room& room, float density);

// Each pass returns how many placements it made. `sink` may be null.
// Enemy and chest cells never fall inside a start or boss room box, and
// prefab cells never inside a start room box, even where rooms overlap.
int placeDecorations(const GenConfig& cfg, const std::vector<Room>& rooms,
                     const CellSet& floor, const CellSet& walls, RNG& rng, DungeonSink* sink);
int placeLights(const GenConfig& cfg, const std::vector<Room>& rooms, RNG& rng, DungeonSink* sink);
int placeEnemies(const GenConfig& cfg, const std::vector<Room>& rooms, RNG& rng, DungeonSink* sink);
int placeChests(const GenConfig& cfg, const std::vector<Room>& rooms, RNG& rng, DungeonSink* sink);
int placePrefabs(const GenConfig& cfg, const std::vector<Room>& rooms,
                 const CellSet& floor, const CellSet& walls, RNG& rng, DungeonSink* sink);
