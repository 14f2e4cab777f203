#include "dungeon.hpp"

#include "corridor.hpp"
#include "dungeon_sink.hpp"
#include "placement.hpp"
#include "random_walk.hpp"
#include "rasterize.hpp"
#include "room_graph.hpp"

#include <algorithm>
#include <utility>

namespace {

void orderPair(int& lo, int& hi) {
    if (lo > hi) std::swap(lo, hi);
}

void orderPair(float& lo, float& hi) {
    if (lo > hi) std::swap(lo, hi);
}

float clamp01(float v) {
    return clampf(v, 0.0f, 1.0f);
}

// Resets the re-entrancy flag on every exit path, including a sink that throws.
struct RunGuard {
    bool& flag;
    explicit RunGuard(bool& f) : flag(f) { flag = true; }
    ~RunGuard() { flag = false; }
    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;
};

void emitWalls(const std::vector<WallCell>& walls, const TileCatalog& catalog, DungeonSink* sink) {
    if (!sink) return;
    for (const WallCell& wc : walls) {
        if (wc.variant.north && !catalog.hasNorthWall) continue;
        if (!wc.variant.north && wc.variant.index < 0) continue;
        sink->emitWallCell(wc.pos, wc.variant);
    }
}

} // namespace

GenConfig sanitizeConfig(GenConfig cfg) {
    cfg.minRooms = std::max(1, cfg.minRooms);
    cfg.maxRooms = std::max(1, cfg.maxRooms);
    orderPair(cfg.minRooms, cfg.maxRooms);

    cfg.corridorWidth = std::max(1, cfg.corridorWidth);

    cfg.minRoomSize = std::max(1, cfg.minRoomSize);
    cfg.maxRoomSize = std::max(1, cfg.maxRoomSize);
    orderPair(cfg.minRoomSize, cfg.maxRoomSize);
    cfg.bossRoomSize = std::max(1, cfg.bossRoomSize);

    cfg.branchChance = clamp01(cfg.branchChance);
    cfg.maxBranchDepth = std::max(0, cfg.maxBranchDepth);

    cfg.walkIterations = std::max(0, cfg.walkIterations);
    cfg.walkLength = std::max(0, cfg.walkLength);

    cfg.decorationDensity = clamp01(cfg.decorationDensity);
    cfg.lightDensity = clamp01(cfg.lightDensity);
    cfg.minLightIntensity = std::max(0.0f, cfg.minLightIntensity);
    cfg.maxLightIntensity = std::max(0.0f, cfg.maxLightIntensity);
    orderPair(cfg.minLightIntensity, cfg.maxLightIntensity);
    cfg.minLightRadius = std::max(0.0f, cfg.minLightRadius);
    cfg.maxLightRadius = std::max(0.0f, cfg.maxLightRadius);
    orderPair(cfg.minLightRadius, cfg.maxLightRadius);

    cfg.enemySpawnChance = clamp01(cfg.enemySpawnChance);
    cfg.chestSpawnChance = clamp01(cfg.chestSpawnChance);
    cfg.maxEnemiesPerRoom = std::max(0, cfg.maxEnemiesPerRoom);

    cfg.prefabDensity = clamp01(cfg.prefabDensity);
    cfg.minDecorationDistance = std::max(0.0f, cfg.minDecorationDistance);

    TileCatalog& c = cfg.catalog;
    c.floorVariants = std::max(0, c.floorVariants);
    c.wallVariants = std::max(0, c.wallVariants);
    c.decorationVariants = std::max(0, c.decorationVariants);
    c.enemyVariants = std::max(0, c.enemyVariants);
    c.prefabVariants = std::max(0, c.prefabVariants);
    return cfg;
}

const char* genErrorName(GenError e) {
    switch (e) {
        case GenError::None: return "none";
        case GenError::MissingBoss: return "missing_boss";
        case GenError::Reentrant: return "reentrant";
        default: return "unknown";
    }
}

// Stage order (and therefore RNG consumption order) is fixed:
//   1. room graph (or random walk)   2. branches        3. corridors
//   4. floor variants                5. wall variants   6. decoration cells
//   7. lights   8. enemies   9. chests   10. spaced prefabs
// Boss and player spawns draw nothing.
GenerationResult generateDungeon(const GenConfig& cfgIn, RNG& rng, DungeonSink* sink) {
    const GenConfig cfg = sanitizeConfig(cfgIn);
    GenerationResult res;
    GenerationStats& st = res.stats;

    if (sink) sink->clearPreviousGeneration();

    RoomGraph graph;
    CellSet floor;

    if (cfg.layout == LayoutKind::Walk) {
        CellSet walked;
        graph = carveRandomWalk(cfg, rng, walked, &st);
        floor = rasterizeRooms(graph.rooms);
        floor.insert(walked.begin(), walked.end());
    } else {
        graph = buildRoomGraph(cfg, rng, &st);
        st.branchRooms = expandBranches(graph, cfg, rng);
        floor = rasterizeRooms(graph.rooms);
        st.corridorCells = carveCorridors(graph, cfg.corridorWidth, rng, floor);
    }

    const int startIdx = graph.startIndex();
    const int bossIdx = graph.bossIndex();
    if (startIdx >= 0) res.playerSpawn = graph.rooms[static_cast<size_t>(startIdx)].pos;
    if (bossIdx >= 0) res.bossRoomCenter = graph.rooms[static_cast<size_t>(bossIdx)].pos;

    if (cfg.catalog.floorVariants > 0) {
        for (const Vec2i& p : floor) {
            const int variant = rng.index(cfg.catalog.floorVariants);
            if (sink) sink->emitFloorCell(p, variant);
        }
    }

    const CellSet walls = deriveWalls(floor);
    res.wallCells = classifyWalls(floor, walls, cfg.catalog, rng);
    emitWalls(res.wallCells, cfg.catalog, sink);

    st.decorations = placeDecorations(cfg, graph.rooms, floor, walls, rng, sink);
    st.lights = placeLights(cfg, graph.rooms, rng, sink);
    st.enemies = placeEnemies(cfg, graph.rooms, rng, sink);
    st.chests = placeChests(cfg, graph.rooms, rng, sink);

    res.rooms = graph.rooms;
    res.connections = graph.connections;
    res.floorCells = std::move(floor);

    if (bossIdx < 0 || !cfg.catalog.hasBoss) {
        res.error = GenError::MissingBoss;
        res.message = (bossIdx < 0) ? "no boss room in layout" : "no boss prefab configured";
        return res;
    }
    if (sink) sink->spawnBoss(toWorld(res.bossRoomCenter));

    st.prefabs = placePrefabs(cfg, res.rooms, res.floorCells, walls, rng, sink);

    if (sink) sink->setPlayerSpawn(toWorld(res.playerSpawn));

    res.ok = true;
    return res;
}

GenerationResult DungeonGenerator::generate(const GenConfig& cfg, DungeonSink* sink) {
    if (running_) {
        GenerationResult res;
        res.error = GenError::Reentrant;
        res.message = "generation already in progress";
        return res;
    }

    RunGuard guard(running_);
    RNG rng(cfg.seed);
    return generateDungeon(cfg, rng, sink);
}
