#include "corridor.hpp"
#include "dungeon.hpp"
#include "dungeon_sink.hpp"
#include "placement.hpp"
#include "rasterize.hpp"
#include "recording_sink.hpp"
#include "rng.hpp"
#include "room_graph.hpp"
#include "settings.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

GenerationResult generateWith(GenConfig cfg, uint32_t seed, DungeonSink* sink = nullptr) {
    cfg.seed = seed;
    RNG rng(seed);
    return generateDungeon(cfg, rng, sink);
}

int countStart(const std::vector<Room>& rooms) {
    int n = 0;
    for (const Room& r : rooms) if (r.isStart) ++n;
    return n;
}

int countBoss(const std::vector<Room>& rooms) {
    int n = 0;
    for (const Room& r : rooms) if (r.isBoss) ++n;
    return n;
}

const Room* findBoss(const std::vector<Room>& rooms) {
    for (const Room& r : rooms) if (r.isBoss) return &r;
    return nullptr;
}

CellSet wallSetOf(const GenerationResult& res) {
    CellSet walls;
    for (const WallCell& w : res.wallCells) walls.insert(w.pos);
    return walls;
}

Vec2i cellOf(const Vec2f& p) {
    return {static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y))};
}

bool insideRoomKind(const std::vector<Room>& rooms, const Vec2i& c, bool includeBoss) {
    for (const Room& r : rooms) {
        if ((r.isStart || (includeBoss && r.isBoss)) && r.contains(c)) return true;
    }
    return false;
}

// Enemies and chests inside any start/boss room box, plus prefabs inside any
// start room box.
int safeRoomViolations(const std::vector<Room>& rooms, const RecordingSink& sink) {
    int bad = 0;
    for (const auto& e : sink.enemies()) if (insideRoomKind(rooms, cellOf(e.pos), true)) ++bad;
    for (const auto& c : sink.chests()) if (insideRoomKind(rooms, cellOf(c), true)) ++bad;
    for (const auto& p : sink.prefabs()) if (insideRoomKind(rooms, cellOf(p.pos), false)) ++bad;
    return bad;
}

void checkCommonInvariants(const GenerationResult& res, const std::string& tag) {
    expect(!res.rooms.empty(), tag + ": room list empty");
    expect(countStart(res.rooms) == 1, tag + ": expected exactly one start room");
    expect(countBoss(res.rooms) == 1, tag + ": expected exactly one boss room");
    if (!res.rooms.empty()) {
        expect(res.rooms[0].isStart && res.rooms[0].pos == Vec2i{0, 0}, tag + ": start room not at origin");
    }

    // Floor is one 4-connected component containing every room center.
    const CellSet reach = floodFill4(res.floorCells, {0, 0});
    expect(reach.size() == res.floorCells.size(), tag + ": floor set is not connected");
    for (const Room& r : res.rooms) {
        expect(contains(reach, r.pos), tag + ": room center unreachable from start");
    }

    // Walls: disjoint from floor, adjacent to floor, and complete.
    const CellSet walls = wallSetOf(res);
    expect(walls.size() == res.wallCells.size(), tag + ": duplicate wall cells");
    for (const WallCell& w : res.wallCells) {
        expect(!contains(res.floorCells, w.pos), tag + ": wall cell is also floor");
        expect(anyNeighbor4In(res.floorCells, w.pos), tag + ": wall cell not adjacent to floor");
        expect(w.variant.north == isNorthWall(res.floorCells, w.pos), tag + ": north-wall tag mismatch");
    }
    for (const Vec2i& p : res.floorCells) {
        for (const Vec2i& d : DIRS4) {
            const Vec2i n = p + d;
            if (contains(res.floorCells, n)) continue;
            expect(contains(walls, n), tag + ": floor boundary without wall");
        }
    }
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
        int k = rng.index(5);
        expect(k >= 0 && k < 5, "RNG index() out of bounds");
        float f = rng.rangef(3.0f, 8.0f);
        expect(f >= 3.0f && f < 8.0f, "RNG rangef() out of bounds");
    }
}

void test_rng_full_chance_at_max_draw() {
    // This state makes the next xorshift32 output 0xFFFFFFFF.
    const uint32_t beforeMax = 0x5e6cfce7u;

    RNG a(beforeMax);
    expect(a.next01() < 1.0f, "next01() must stay below 1 on the largest draw");

    RNG b(beforeMax);
    expect(b.chance(1.0f), "chance(1) must always succeed");

    RNG c(beforeMax);
    const float f = c.rangef(3.0f, 8.0f);
    expect(f >= 3.0f && f < 8.0f, "rangef() must exclude hi on the largest draw");

    RNG d(beforeMax);
    expect(!d.chance(0.0f), "chance(0) must never succeed");
}

void test_direction_weights() {
    const auto early = directionWeights(DirectionBias::MainPath, 0.0f);
    const auto late = directionWeights(DirectionBias::MainPath, 1.0f);
    expect(kGrowthDirections[0] == Vec2i{1, 0}, "First scanned direction should be right");
    expect(late[0] < early[0], "Main-path right weight should decay with progress");
    for (int i = 1; i < kDirectionCount; ++i) {
        expect(early[0] > early[static_cast<size_t>(i)], "Main path should favor right");
    }

    const auto branch = directionWeights(DirectionBias::Branch, 0.0f);
    for (int i = 0; i < kDirectionCount - 1; ++i) {
        expect(branch[kDirectionCount - 1] > branch[static_cast<size_t>(i)], "Branches should favor left");
    }
}

void test_weighted_direction_sampling() {
    RNG rng(777u);
    int mainCounts[kDirectionCount] = {};
    int branchCounts[kDirectionCount] = {};

    auto slot = [](const Vec2i& d) {
        for (int i = 0; i < kDirectionCount; ++i) {
            if (kGrowthDirections[static_cast<size_t>(i)] == d) return i;
        }
        return -1;
    };

    for (int i = 0; i < 10000; ++i) {
        const int m = slot(pickWeightedDirection(rng, DirectionBias::MainPath, 0.0f));
        const int b = slot(pickWeightedDirection(rng, DirectionBias::Branch, 0.0f));
        expect(m >= 0 && b >= 0, "Sampled direction not in the direction table");
        if (m >= 0) ++mainCounts[m];
        if (b >= 0) ++branchCounts[b];
    }

    for (int i = 1; i < kDirectionCount; ++i) {
        expect(mainCounts[0] > mainCounts[i], "Right should be the most common main-path direction");
    }
    for (int i = 0; i < kDirectionCount - 1; ++i) {
        expect(branchCounts[kDirectionCount - 1] > branchCounts[i], "Left should be the most common branch direction");
    }
    for (int i = 0; i < kDirectionCount; ++i) {
        expect(mainCounts[i] > 0, "Every main-path direction should be reachable");
    }
}

void test_room_overlap_threshold() {
    Room a;
    a.pos = {0, 0};
    a.w = 6;
    a.h = 6;

    Room b = a;
    // Threshold = (6 + 6) / 2 + 1 + 2 = 9.
    b.pos = {7, 0};
    expect(roomsOverlap(a, b, 1), "Centers 7 apart should overlap at threshold 9");
    b.pos = {9, 0};
    expect(!roomsOverlap(a, b, 1), "Centers exactly at threshold should not overlap");
    b.pos = {7, 7};
    expect(!roomsOverlap(a, b, 1), "Diagonal step of 7 clears threshold 9");
    expect(roomsOverlap(a, b, 6), "Wider corridors widen the clearance");
}

void test_room_contains_and_fill() {
    Room r;
    r.pos = {10, -4};
    r.w = 6;
    r.h = 5;
    expect(r.contains({13, -2}), "Room contains its inclusive corner");
    expect(!r.contains({14, -4}), "Room excludes cells past half-width");

    CellSet floor;
    fillRoom(r, floor);
    expect(floor.size() == static_cast<size_t>(7 * 5), "Room fill covers both extents inclusively");
    for (const Vec2i& p : floor) expect(r.contains(p), "Filled cell outside the room test");
}

void test_corridor_stamp_and_path() {
    CellSet one;
    stampSquare({4, 4}, 1, one);
    expect(one.size() == 1 && contains(one, {4, 4}), "Width-1 stamp is a single cell");

    CellSet two;
    stampSquare({0, 0}, 2, two);
    expect(two.size() == 4, "Width-2 stamp is 2x2");
    expect(contains(two, {1, 1}) && !contains(two, {-1, 0}), "Even widths lean toward +x/+y");

    CellSet three;
    stampSquare({0, 0}, 3, three);
    expect(three.size() == 9 && contains(three, {-1, -1}) && contains(three, {1, 1}), "Width-3 stamp is centered");

    const std::vector<Vec2i> path = lPath({0, 0}, {3, -2});
    expect(path.size() == 6, "L path length is manhattan distance + 1");
    if (path.size() == 6) {
        expect(path[3] == Vec2i{3, 0}, "L path walks X before Y");
        expect(path.back() == Vec2i{3, -2}, "L path ends at the destination");
    }
}

void test_corridor_skips_room_cells() {
    Room r;
    r.pos = {0, 0};
    r.w = 4;
    r.h = 4;
    const std::vector<Room> rooms = {r};

    CellSet floor;
    const int added = carveCorridor({0, 0}, {6, 0}, 1, rooms, floor);
    expect(added == 4, "Only cells outside the room are stamped");
    expect(!contains(floor, {0, 0}) && !contains(floor, {2, 0}), "Room cells are left to the room fill");
    expect(contains(floor, {3, 0}) && contains(floor, {6, 0}), "Corridor reaches past the room");
}

void test_corridor_anchor_is_center_biased() {
    Room r;
    r.pos = {5, 5};
    r.w = 12;
    r.h = 8;
    RNG rng(9u);
    for (int i = 0; i < 500; ++i) {
        const Vec2i p = pickCorridorAnchor(r, rng);
        expect(std::abs(p.x - 5) <= 3 && std::abs(p.y - 5) <= 2, "Corridor anchor outside the quarter box");
    }
}

void test_north_wall_corridor_stub() {
    // Vertical 1-wide stub: only the cap above the top cell is a north wall.
    CellSet vertical = {{0, 0}, {0, 1}, {0, 2}};
    const CellSet vWalls = deriveWalls(vertical);
    expect(vWalls.size() == 8, "Vertical stub has 8 wall neighbors");
    expect(isNorthWall(vertical, {0, 3}), "Cap above stub is a north wall");
    expect(!isNorthWall(vertical, {0, -1}), "Cap below stub is not a north wall");
    expect(!isNorthWall(vertical, {1, 1}), "Side wall is not a north wall");

    // Horizontal stub: every wall directly above is north.
    CellSet horizontal = {{0, 0}, {1, 0}, {2, 0}};
    RNG rng(5u);
    TileCatalog cat;
    const std::vector<WallCell> walls = classifyWalls(horizontal, deriveWalls(horizontal), cat, rng);
    int north = 0;
    for (const WallCell& w : walls) {
        if (w.variant.north) {
            ++north;
            expect(w.pos.y == 1, "North wall should sit above the stub");
            expect(w.variant.index == -1, "North walls carry no general variant");
        } else {
            expect(w.variant.index >= 0 && w.variant.index < cat.wallVariants, "General wall variant out of range");
        }
    }
    expect(north == 3, "Horizontal stub should have 3 north walls");
}

void test_graph_invariants() {
    GenConfig cfg;
    for (uint32_t seed = 1; seed <= 40; ++seed) {
        const GenerationResult res = generateWith(cfg, seed);
        const std::string tag = "graph seed " + std::to_string(seed);
        checkCommonInvariants(res, tag);
        expect(res.ok, tag + ": generation failed");
        expect(res.connections.size() + 1 == res.rooms.size(), tag + ": room graph should be a tree");
        expect(res.playerSpawn == Vec2i{0, 0}, tag + ": player spawn not at origin");

        const Room* boss = findBoss(res.rooms);
        if (boss) expect(res.bossRoomCenter == boss->pos, tag + ": boss center mismatch");

        for (size_t i = 0; i < res.rooms.size(); ++i) {
            for (size_t j = i + 1; j < res.rooms.size(); ++j) {
                const Room& a = res.rooms[i];
                const Room& b = res.rooms[j];
                if (res.stats.bossForced && (a.isBoss || b.isBoss)) continue;
                expect(!roomsOverlap(a, b, cfg.corridorWidth), tag + ": accepted rooms overlap");
            }
        }

        for (const RoomConnection& c : res.connections) {
            const Room& child = res.rooms[static_cast<size_t>(c.b)];
            const Room& parent = res.rooms[static_cast<size_t>(c.a)];
            if (child.branchDepth > 0) {
                expect(!parent.isStart && !parent.isBoss, tag + ": branch grown off start/boss room");
                expect(child.branchDepth <= cfg.maxBranchDepth, tag + ": branch deeper than max depth");
                expect(parent.branchDepth == child.branchDepth - 1, tag + ": branch parent from wrong generation");
            }
        }
    }
}

void test_branches_with_certain_chance() {
    GenConfig cfg;
    cfg.branchChance = 1.0f;
    int totalBranches = 0;
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        const GenerationResult res = generateWith(cfg, seed);
        totalBranches += res.stats.branchRooms;
        int counted = 0;
        for (const Room& r : res.rooms) if (r.branchDepth > 0) ++counted;
        expect(counted == res.stats.branchRooms, "Branch stat should match branch rooms");
        expect(countBoss(res.rooms) == 1, "Branches never add a boss room");
    }
    expect(totalBranches > 0, "branchChance=1 should grow some branches");
}

void test_three_room_scenario() {
    GenConfig cfg;
    cfg.minRooms = 3;
    cfg.maxRooms = 3;
    cfg.corridorWidth = 1;
    cfg.minRoomSize = 6;
    cfg.maxRoomSize = 6;
    cfg.bossRoomSize = 6;
    cfg.branchChance = 0.0f;

    const int seeds = 200;
    int fullRuns = 0;
    for (uint32_t seed = 1; seed <= static_cast<uint32_t>(seeds); ++seed) {
        const GenerationResult res = generateWith(cfg, seed);
        const std::string tag = "3-room seed " + std::to_string(seed);
        checkCommonInvariants(res, tag);

        expect(res.rooms.size() >= 2 && res.rooms.size() <= 3, tag + ": room count out of range");
        expect(res.connections.size() + 1 == res.rooms.size(), tag + ": connection count");
        expect(res.stats.branchRooms == 0, tag + ": no branches expected");
        for (const Room& r : res.rooms) expect(r.branchDepth == 0, tag + ": branch room present");

        const Room* boss = findBoss(res.rooms);
        expect(boss != nullptr, tag + ": missing boss room");
        if (boss) {
            expect(contains(floodFill4(res.floorCells, {0, 0}), boss->pos), tag + ": boss unreachable from origin");
        }

        if (res.rooms.size() == 3) {
            ++fullRuns;
            expect(res.connections.size() == 2, tag + ": 3 rooms should have 2 connections");
            expect(res.rooms[2].isBoss, tag + ": last main-path room should be the boss");
        }
    }
    // The first room can miss every diagonal slot in its 10 tries; that run
    // keeps only start and boss. It must stay rare.
    expect(fullRuns * 100 >= seeds * 95, "3-room scenario should produce 3 rooms on at least 95% of seeds");
}

void test_forced_boss_placement() {
    // Every placement collides: the boss must still appear, straight above.
    GenConfig cfg;
    cfg.minRooms = 2;
    cfg.maxRooms = 2;
    cfg.corridorWidth = 1;
    cfg.minRoomSize = 30;
    cfg.maxRoomSize = 30;
    cfg.bossRoomSize = 2;
    cfg.branchChance = 0.0f;

    const GenerationResult res = generateWith(cfg, 31u);
    expect(res.rooms.size() == 2, "Forced boss scenario should have 2 rooms");
    expect(res.stats.bossForced, "Boss placement should have been forced");
    const Room* boss = findBoss(res.rooms);
    expect(boss && boss->pos == Vec2i{0, cfg.bossRoomSize + cfg.corridorWidth + 10}, "Forced boss sits directly above");
    checkCommonInvariants(res, "forced boss");
}

void test_walk_layout_invariants() {
    GenConfig cfg;
    cfg.layout = LayoutKind::Walk;
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        const GenerationResult res = generateWith(cfg, seed);
        const std::string tag = "walk seed " + std::to_string(seed);
        checkCommonInvariants(res, tag);
        expect(res.ok, tag + ": generation failed");

        const Room* boss = findBoss(res.rooms);
        if (!boss) continue;
        expect(boss->w == cfg.bossRoomSize, tag + ": boss room size");
        if (!res.stats.bossForced) {
            for (const Room& r : res.rooms) {
                expect(distance(Vec2i{0, 0}, r.pos) <= distance(Vec2i{0, 0}, boss->pos),
                       tag + ": boss should be the farthest room");
            }
        }
    }

    cfg.walkIterations = 0;
    const GenerationResult empty = generateWith(cfg, 3u);
    expect(empty.stats.bossForced, "Walk layout without walks should force the boss");
    checkCommonInvariants(empty, "walk without iterations");
}

void test_generate_twice_clears_state() {
    GenConfig cfg;
    DungeonGenerator gen;
    RecordingSink sink;

    cfg.seed = 7u;
    const GenerationResult first = gen.generate(cfg, &sink);
    const size_t firstFloor = sink.floor().size();
    expect(firstFloor == first.floorCells.size(), "Sink floor should match result floor");

    cfg.seed = 99u;
    const GenerationResult second = gen.generate(cfg, &sink);
    expect(sink.clearCount() == 2, "Sink should be cleared once per run");
    expect(sink.floor().size() == second.floorCells.size(), "Second run floor leaked cells from the first");
    for (const auto& kv : sink.floor()) {
        expect(contains(second.floorCells, kv.first), "Sink holds a floor cell the second run did not produce");
    }
    expect(sink.bosses().size() == 1, "Exactly one boss spawn per run");

    DungeonGenerator fresh;
    cfg.seed = 7u;
    const GenerationResult again = fresh.generate(cfg, nullptr);
    expect(again.floorCells == first.floorCells, "Same seed should reproduce the same floor");
    expect(again.rooms.size() == first.rooms.size(), "Same seed should reproduce the same rooms");
}

void test_sink_receives_each_cell_once() {
    GenConfig cfg;
    RecordingSink sink;
    const GenerationResult res = generateWith(cfg, 12u, &sink);

    expect(sink.duplicateCellEmits() == 0, "Cells should be emitted once each");
    expect(sink.floor().size() == res.floorCells.size(), "Every floor cell should be emitted");
    expect(sink.walls().size() == res.wallCells.size(), "Every wall cell should be emitted");
    expect(sink.hasPlayerSpawn(), "Player spawn should be set");
    expect(sink.playerSpawn().x == 0.0f && sink.playerSpawn().y == 0.0f, "Player spawn at start room");
    expect(sink.lights().size() == static_cast<size_t>(res.stats.lights), "Light stat matches spawns");
    for (const auto& l : sink.lights()) {
        expect(l.intensity >= cfg.minLightIntensity && l.intensity <= cfg.maxLightIntensity, "Light intensity out of range");
        expect(l.radius >= cfg.minLightRadius && l.radius <= cfg.maxLightRadius, "Light radius out of range");
    }
    expect(!sink.toAscii().empty(), "ASCII dump should not be empty");
}

void test_decoration_exclusions() {
    GenConfig cfg;
    cfg.decorationDensity = 1.0f;
    RecordingSink sink;
    const GenerationResult res = generateWith(cfg, 21u, &sink);
    const CellSet walls = wallSetOf(res);

    expect(!sink.decorations().empty(), "Full density should decorate something");
    for (const auto& kv : sink.decorations()) {
        expect(contains(res.floorCells, kv.first), "Decoration off the floor");
        expect(!isNearWall(walls, kv.first), "Decoration next to a wall");
        expect(!res.rooms[0].contains(kv.first), "Decoration inside the start room");
    }
}

void test_entities_avoid_safe_rooms() {
    // Square rooms keep room boxes disjoint under the circular clearance, so
    // every ordinary room gets its chest on the first draw.
    GenConfig cfg;
    cfg.minRoomSize = 8;
    cfg.maxRoomSize = 8;
    cfg.enemySpawnChance = 1.0f;
    cfg.chestSpawnChance = 1.0f;

    int checkedRuns = 0;
    for (uint32_t seed = 1; seed <= 15; ++seed) {
        RecordingSink sink;
        const GenerationResult res = generateWith(cfg, seed, &sink);
        expect(safeRoomViolations(res.rooms, sink) == 0, "graph seed " + std::to_string(seed) + ": spawn in start/boss room");
        if (res.stats.bossForced) continue;
        ++checkedRuns;

        int ordinaryRooms = 0;
        for (const Room& r : res.rooms) if (!r.isStart && !r.isBoss) ++ordinaryRooms;

        expect(static_cast<int>(sink.chests().size()) == ordinaryRooms, "One chest per ordinary room at chance 1");
        expect(static_cast<int>(sink.enemies().size()) >= ordinaryRooms, "At least one enemy per ordinary room at chance 1");
        for (const auto& e : sink.enemies()) {
            expect(e.variant >= 0 && e.variant < cfg.catalog.enemyVariants, "Enemy variant out of range");
        }
    }
    expect(checkedRuns > 0, "No run without a forced boss");
}

void test_walk_spawns_avoid_safe_rooms() {
    // Walk-layout rooms sit on walk endpoints and overlap freely.
    GenConfig cfg;
    cfg.layout = LayoutKind::Walk;
    cfg.enemySpawnChance = 1.0f;
    cfg.chestSpawnChance = 1.0f;
    cfg.prefabDensity = 0.1f;

    int enemies = 0;
    int prefabs = 0;
    for (uint32_t seed = 1; seed <= 60; ++seed) {
        RecordingSink sink;
        const GenerationResult res = generateWith(cfg, seed, &sink);
        expect(safeRoomViolations(res.rooms, sink) == 0, "walk seed " + std::to_string(seed) + ": spawn in start/boss room");
        enemies += static_cast<int>(sink.enemies().size());
        prefabs += static_cast<int>(sink.prefabs().size());
    }
    expect(enemies > 0, "Walk layout should still place enemies");
    expect(prefabs > 0, "Walk layout should still place prefabs");
}

void test_overlapping_rooms_spawn_outside_safe_rooms() {
    // Hand-built overlap like a force-placed boss: the middle room is mostly
    // covered by the start and boss room boxes.
    Room start;
    start.pos = {0, 0};
    start.w = 10;
    start.h = 10;
    start.isStart = true;

    Room squeezed;
    squeezed.pos = {3, 0};
    squeezed.w = 10;
    squeezed.h = 10;

    Room boss;
    boss.pos = {6, 4};
    boss.w = 8;
    boss.h = 8;
    boss.isBoss = true;

    Room clear;
    clear.pos = {30, 0};
    clear.w = 10;
    clear.h = 10;

    const std::vector<Room> rooms = {start, squeezed, boss, clear};
    const CellSet floor = rasterizeRooms(rooms);
    const CellSet walls = deriveWalls(floor);

    GenConfig cfg;
    cfg.enemySpawnChance = 1.0f;
    cfg.chestSpawnChance = 1.0f;
    cfg.prefabDensity = 0.1f;
    cfg.minDecorationDistance = 1.0f;

    int enemies = 0;
    int chests = 0;
    for (uint32_t seed = 1; seed <= 50; ++seed) {
        RNG rng(seed);
        RecordingSink sink;
        enemies += placeEnemies(cfg, rooms, rng, &sink);
        chests += placeChests(cfg, rooms, rng, &sink);
        placePrefabs(cfg, rooms, floor, walls, rng, &sink);
        expect(safeRoomViolations(rooms, sink) == 0, "overlap seed " + std::to_string(seed) + ": spawn in start/boss room");
    }
    expect(enemies > 0 && chests > 0, "Overlapping layout should still receive spawns");
}

void test_placement_record_spacing() {
    PlacementRecord rec(1.5f);
    expect(rec.tryAccept({0.0f, 0.0f}), "First placement is always accepted");
    expect(!rec.tryAccept({1.0f, 0.0f}), "Placement 1.0 away must be rejected at min 1.5");
    expect(rec.tryAccept({1.5f, 0.0f}), "Placement exactly at min distance is accepted");
    expect(rec.size() == 2, "Rejected placements are not recorded");
    rec.clear();
    expect(rec.tryAccept({1.0f, 0.0f}), "Cleared record accepts again");
}

void test_prefab_spacing_in_generation() {
    GenConfig cfg;
    cfg.prefabDensity = 0.2f;
    cfg.minDecorationDistance = 3.0f;
    RecordingSink sink;
    generateWith(cfg, 4u, &sink);

    const auto& prefabs = sink.prefabs();
    expect(!prefabs.empty(), "Dense prefab config should place prefabs");
    for (size_t i = 0; i < prefabs.size(); ++i) {
        for (size_t j = i + 1; j < prefabs.size(); ++j) {
            expect(distance(prefabs[i].pos, prefabs[j].pos) >= cfg.minDecorationDistance, "Prefabs closer than min distance");
        }
    }

    Room r;
    r.w = 10;
    r.h = 10;
    expect(prefabTargetCount(r, 0.02f) == 2, "Prefab target is round(w*h*density)");
    r.w = 7;
    r.h = 7;
    expect(prefabTargetCount(r, 0.05f) == 2, "Prefab target rounds to nearest");
    expect(prefabTargetCount(r, 0.0f) == 0, "Zero density places nothing");
}

void test_missing_boss_prefab_is_reported() {
    GenConfig cfg;
    cfg.catalog.hasBoss = false;
    RecordingSink sink;
    const GenerationResult res = generateWith(cfg, 8u, &sink);

    expect(!res.ok, "Missing boss prefab should fail the run");
    expect(res.error == GenError::MissingBoss, "Missing boss prefab error kind");
    expect(!res.message.empty(), "Error should carry a message");
    expect(!res.rooms.empty() && !res.floorCells.empty(), "Layout data survives the error");
    expect(sink.bosses().empty(), "No boss spawned without a prefab");
}

void test_empty_variant_sets_emit_nothing() {
    GenConfig cfg;
    cfg.catalog.floorVariants = 0;
    cfg.catalog.wallVariants = 0;
    cfg.catalog.hasNorthWall = false;
    cfg.catalog.decorationVariants = 0;
    cfg.catalog.enemyVariants = 0;
    cfg.catalog.prefabVariants = 0;
    cfg.catalog.hasChest = false;
    cfg.lightColors.clear();

    RecordingSink sink;
    const GenerationResult res = generateWith(cfg, 15u, &sink);
    expect(res.ok, "Empty variant sets are not an error");
    expect(!res.floorCells.empty() && !res.wallCells.empty(), "Layout still generated");
    expect(sink.floor().empty() && sink.walls().empty() && sink.decorations().empty(), "No tiles emitted");
    expect(sink.lights().empty() && sink.enemies().empty() && sink.chests().empty() && sink.prefabs().empty(),
           "No prefabs spawned");
    expect(sink.bosses().size() == 1, "Boss still spawned");
}

class ReentrantSink : public RecordingSink {
public:
    explicit ReentrantSink(DungeonGenerator& g) : gen(g) {}

    void clearPreviousGeneration() override {
        RecordingSink::clearPreviousGeneration();
        GenConfig cfg;
        nested = gen.generate(cfg, nullptr);
        sawRunning = gen.running();
    }

    DungeonGenerator& gen;
    GenerationResult nested;
    bool sawRunning = false;
};

void test_reentrant_generate_rejected() {
    DungeonGenerator gen;
    ReentrantSink sink(gen);
    GenConfig cfg;
    const GenerationResult outer = gen.generate(cfg, &sink);

    expect(outer.ok, "Outer run should succeed");
    expect(sink.sawRunning, "Generator should report running inside a sink callback");
    expect(!sink.nested.ok && sink.nested.error == GenError::Reentrant, "Nested generate must be rejected");
    expect(!gen.running(), "Generator should be idle after the run");
}

void test_config_file_roundtrip() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "cryptgen_config_test.ini";

    {
        std::ofstream f(path);
        f << "# comment line\n"
          << "layout = walk\n"
          << "seed = 4242\n"
          << "min_rooms = 4 ; trailing comment\n"
          << "max_rooms = 500\n"
          << "corridor_width = 2\n"
          << "branch_chance = 0.75\n"
          << "decoration_density = nope\n"
          << "light_colors = #ff0000, 00ff00\n"
          << "boss_prefab = false\n"
          << "mystery_key = 3\n";
    }

    const GenConfig cfg = loadGenConfig(path.string());
    expect(cfg.layout == LayoutKind::Walk, "layout key parsed");
    expect(cfg.seed == 4242u, "seed key parsed");
    expect(cfg.minRooms == 4, "Trailing ; comment stripped");
    expect(cfg.maxRooms == 200, "max_rooms clamped");
    expect(cfg.corridorWidth == 2, "corridor_width parsed");
    expect(std::fabs(cfg.branchChance - 0.75f) < 1e-6f, "branch_chance parsed");
    expect(std::fabs(cfg.decorationDensity - GenConfig{}.decorationDensity) < 1e-6f, "Invalid value keeps default");
    expect(cfg.lightColors.size() == 2, "light_colors parsed");
    if (cfg.lightColors.size() == 2) {
        expect(cfg.lightColors[0] == Color{255, 0, 0, 255}, "First light color");
        expect(cfg.lightColors[1] == Color{0, 255, 0, 255}, "Second light color");
    }
    expect(!cfg.catalog.hasBoss, "boss_prefab parsed");

    GenConfig tmp;
    expect(!applyConfigKey(tmp, "mystery_key", "3"), "Unknown keys are rejected");
    expect(!applyConfigKey(tmp, "min_rooms", "3x"), "Trailing garbage is rejected");
    expect(applyConfigKey(tmp, "MIN_ROOMS", "5") && tmp.minRooms == 5, "Keys are case-insensitive");

    std::error_code ec;
    fs::remove(path, ec);

    const fs::path defPath = fs::temp_directory_path() / "cryptgen_default_test.ini";
    expect(writeDefaultConfig(defPath.string()), "writeDefaultConfig failed");
    const GenConfig def = loadGenConfig(defPath.string());
    const GenConfig base;
    expect(def.minRooms == base.minRooms && def.maxRooms == base.maxRooms, "Default file room range");
    expect(def.corridorWidth == base.corridorWidth && def.bossRoomSize == base.bossRoomSize, "Default file sizes");
    expect(def.lightColors.size() == base.lightColors.size(), "Default file light palette");
    expect(def.catalog.hasBoss && def.catalog.hasNorthWall, "Default file catalog flags");
    fs::remove(defPath, ec);

    const GenConfig missing = loadGenConfig((fs::temp_directory_path() / "cryptgen_no_such_file.ini").string());
    expect(missing.minRooms == base.minRooms, "Missing config file falls back to defaults");
}

void test_sanitize_config() {
    GenConfig cfg;
    cfg.minRooms = 9;
    cfg.maxRooms = 3;
    cfg.minRoomSize = 12;
    cfg.maxRoomSize = 4;
    cfg.corridorWidth = 0;
    cfg.branchChance = 2.0f;

    const GenConfig s = sanitizeConfig(cfg);
    expect(s.minRooms == 3 && s.maxRooms == 9, "Room range reordered");
    expect(s.minRoomSize == 4 && s.maxRoomSize == 12, "Room size range reordered");
    expect(s.corridorWidth == 1, "Corridor width floored at 1");
    expect(s.branchChance == 1.0f, "branch_chance clamped to 1");

    const GenerationResult res = generateWith(cfg, 2u);
    checkCommonInvariants(res, "sanitized config");
}

} // namespace

int main() {
    std::cout << "Running CryptGen tests...\n";

    test_rng_reproducible();
    test_rng_full_chance_at_max_draw();
    test_direction_weights();
    test_weighted_direction_sampling();
    test_room_overlap_threshold();
    test_room_contains_and_fill();
    test_corridor_stamp_and_path();
    test_corridor_skips_room_cells();
    test_corridor_anchor_is_center_biased();
    test_north_wall_corridor_stub();

    test_graph_invariants();
    test_branches_with_certain_chance();
    test_three_room_scenario();
    test_forced_boss_placement();
    test_walk_layout_invariants();

    test_generate_twice_clears_state();
    test_sink_receives_each_cell_once();
    test_decoration_exclusions();
    test_entities_avoid_safe_rooms();
    test_walk_spawns_avoid_safe_rooms();
    test_overlapping_rooms_spawn_outside_safe_rooms();
    test_placement_record_spacing();
    test_prefab_spacing_in_generation();
    test_missing_boss_prefab_is_reported();
    test_empty_variant_sets_emit_nothing();
    test_reentrant_generate_rejected();

    test_config_file_roundtrip();
    test_sanitize_config();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
