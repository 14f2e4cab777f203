#pragma once
#include "common.hpp"
#include "grid_utils.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

class DungeonSink;

enum class LayoutKind : uint8_t {
    Graph = 0, // directed room-graph growth + branches + L corridors
    Walk,      // chained random walks, rooms at walk endpoints
};

// A room is centered on `pos`. Containment is a Chebyshev box test using
// integer half-extents, and room fill covers both extents inclusively, so a
// room of width 6 spans 7 cells.
struct Room {
    Vec2i pos;
    int w = 0;
    int h = 0;
    bool isStart = false;
    bool isBoss = false;
    // 0 for the main path, 1.. for branch generations.
    int branchDepth = 0;

    int halfW() const { return w / 2; }
    int halfH() const { return h / 2; }
    int minX() const { return pos.x - w / 2; }
    int maxX() const { return pos.x + w / 2; }
    int minY() const { return pos.y - h / 2; }
    int maxY() const { return pos.y + h / 2; }

    bool contains(const Vec2i& p) const {
        return std::abs(p.x - pos.x) <= w / 2 && std::abs(p.y - pos.y) <= h / 2;
    }
};

// Unordered edge between two rooms (indices into the room list).
struct RoomConnection {
    int a = -1;
    int b = -1;
};

struct RoomGraph {
    std::vector<Room> rooms;
    std::vector<RoomConnection> connections;

    int startIndex() const;
    int bossIndex() const;
};

// How many visual variants the downstream renderer/spawner has per category.
// Zero means "nothing to show" and the matching emit/spawn calls are skipped.
struct TileCatalog {
    int floorVariants = 4;
    int wallVariants = 4;
    bool hasNorthWall = true;
    int decorationVariants = 6;
    int enemyVariants = 3;
    int prefabVariants = 5;
    bool hasChest = true;
    bool hasBoss = true;
};

struct GenConfig {
    LayoutKind layout = LayoutKind::Graph;
    uint32_t seed = 1;

    // Room graph
    int minRooms = 8;
    int maxRooms = 12;
    int corridorWidth = 3;
    int minRoomSize = 6;
    int maxRoomSize = 12;
    int bossRoomSize = 15;
    float branchChance = 0.35f;
    int maxBranchDepth = 2;

    // Random-walk layout
    int walkIterations = 10;
    int walkLength = 30;

    // Decoration / lighting
    float decorationDensity = 0.2f;
    float lightDensity = 1.0f;
    float minLightIntensity = 0.5f;
    float maxLightIntensity = 1.5f;
    float minLightRadius = 3.0f;
    float maxLightRadius = 8.0f;
    std::vector<Color> lightColors = {
        {255, 214, 153, 255},
        {255, 170, 90, 255},
        {140, 180, 255, 255},
    };

    // Entities
    float enemySpawnChance = 0.6f;
    float chestSpawnChance = 0.25f;
    int maxEnemiesPerRoom = 3;

    // Spaced prefab decorations
    float prefabDensity = 0.02f;
    float minDecorationDistance = 2.5f;

    TileCatalog catalog;
};

// Normalizes ranges (min <= max) and clamps probabilities to [0,1].
// The config loader already clamps individual keys; this fixes up pairs that
// only make sense together.
GenConfig sanitizeConfig(GenConfig cfg);

struct WallVariant {
    bool north = false;
    int index = -1; // general wall variant; -1 for north walls
};

struct WallCell {
    Vec2i pos;
    WallVariant variant;
};

struct GenerationStats {
    int targetRooms = 0;
    int mainPathRooms = 0;
    int branchRooms = 0;
    int skippedRooms = 0;
    bool bossForced = false;

    int corridorCells = 0;
    int decorations = 0;
    int lights = 0;
    int enemies = 0;
    int chests = 0;
    int prefabs = 0;
};

enum class GenError : uint8_t {
    None = 0,
    MissingBoss, // no boss room or no boss prefab at spawn time
    Reentrant,   // generate() called while a run is in progress
};

const char* genErrorName(GenError e);

struct GenerationResult {
    bool ok = false;
    GenError error = GenError::None;
    std::string message;

    std::vector<Room> rooms;
    std::vector<RoomConnection> connections;
    CellSet floorCells;
    std::vector<WallCell> wallCells;

    Vec2i playerSpawn;
    Vec2i bossRoomCenter;

    GenerationStats stats;
};

// Runs the whole pipeline with the given RNG stream. `sink` may be null, in
// which case only the returned data is produced.
GenerationResult generateDungeon(const GenConfig& cfg, RNG& rng, DungeonSink* sink);

// Owns one generation run at a time and rejects re-entrant calls (for example
// a sink callback that asks for a new dungeon mid-run).
class DungeonGenerator {
public:
    GenerationResult generate(const GenConfig& cfg, DungeonSink* sink);

    bool running() const { return running_; }

private:
    bool running_ = false;
};
