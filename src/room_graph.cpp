#include "room_graph.hpp"

#include <algorithm>

const std::array<Vec2i, kDirectionCount> kGrowthDirections = {{
    { 1,  0}, // right
    { 1,  1}, // up-right
    { 1, -1}, // down-right
    { 0,  1}, // up
    { 0, -1}, // down
    {-1,  1}, // up-left
    {-1, -1}, // down-left
    {-1,  0}, // left
}};

namespace {

Room makeRoom(const Vec2i& pos, int w, int h) {
    Room r;
    r.pos = pos;
    r.w = w;
    r.h = h;
    return r;
}

int sampleTravelDistance(const GenConfig& cfg, RNG& rng) {
    return rng.range(cfg.minRoomSize + cfg.corridorWidth, cfg.maxRoomSize + cfg.corridorWidth);
}

int appendRoom(RoomGraph& g, const Room& r, int parent) {
    g.rooms.push_back(r);
    const int idx = static_cast<int>(g.rooms.size()) - 1;
    if (parent >= 0) g.connections.push_back({parent, idx});
    return idx;
}

} // namespace

int RoomGraph::startIndex() const {
    for (size_t i = 0; i < rooms.size(); ++i) {
        if (rooms[i].isStart) return static_cast<int>(i);
    }
    return -1;
}

int RoomGraph::bossIndex() const {
    for (size_t i = 0; i < rooms.size(); ++i) {
        if (rooms[i].isBoss) return static_cast<int>(i);
    }
    return -1;
}

std::array<float, kDirectionCount> directionWeights(DirectionBias bias, float progress) {
    progress = clampf(progress, 0.0f, 1.0f);
    if (bias == DirectionBias::Branch) {
        // right, up-right, down-right, up, down, up-left, down-left, left
        return {{0.4f, 0.6f, 0.6f, 1.2f, 1.2f, 1.5f, 1.5f, 2.0f}};
    }
    return {{3.0f - 1.0f * progress, 1.5f, 1.5f, 1.0f, 1.0f, 0.3f, 0.3f, 0.2f}};
}

Vec2i pickWeightedDirection(RNG& rng, DirectionBias bias, float progress) {
    const auto weights = directionWeights(bias, progress);

    float total = 0.0f;
    for (float w : weights) total += w;

    float r = rng.next01() * total;
    for (int i = 0; i < kDirectionCount; ++i) {
        const float w = weights[static_cast<size_t>(i)];
        if (r < w) return kGrowthDirections[static_cast<size_t>(i)];
        r -= w;
    }
    // Float round-off can walk off the end of the table.
    return kGrowthDirections[kDirectionCount - 1];
}

bool roomsOverlap(const Room& a, const Room& b, int corridorWidth) {
    const float clearance = static_cast<float>(a.w + b.w) / 2.0f
                          + static_cast<float>(corridorWidth) + 2.0f;
    return distance(a.pos, b.pos) < clearance;
}

bool overlapsAny(const Room& candidate, const std::vector<Room>& rooms, int corridorWidth) {
    return std::any_of(rooms.begin(), rooms.end(), [&](const Room& r) {
        return roomsOverlap(candidate, r, corridorWidth);
    });
}

RoomGraph buildRoomGraph(const GenConfig& cfg, RNG& rng, GenerationStats* stats) {
    RoomGraph g;

    const int target = rng.range(cfg.minRooms, cfg.maxRooms);
    // A start room alone would have no boss; always grow at least one step.
    const int n = std::max(2, target);
    if (stats) stats->targetRooms = target;

    {
        const int w = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
        const int h = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
        Room start = makeRoom({0, 0}, w, h);
        start.isStart = true;
        appendRoom(g, start, -1);
    }

    int current = 0;
    for (int i = 1; i < n; ++i) {
        const bool isBoss = (i == n - 1);
        const float progress = static_cast<float>(i) / static_cast<float>(n);

        bool placed = false;
        for (int attempt = 0; attempt < kRoomPlacementTries && !placed; ++attempt) {
            const Vec2i dir = pickWeightedDirection(rng, DirectionBias::MainPath, progress);

            Room cand;
            if (isBoss) {
                const int dist = cfg.bossRoomSize + cfg.corridorWidth + 5;
                cand = makeRoom(g.rooms[static_cast<size_t>(current)].pos + dir * dist,
                                cfg.bossRoomSize, cfg.bossRoomSize);
                cand.isBoss = true;
            } else {
                const int dist = sampleTravelDistance(cfg, rng);
                const int w = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
                const int h = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
                cand = makeRoom(g.rooms[static_cast<size_t>(current)].pos + dir * dist, w, h);
            }

            if (overlapsAny(cand, g.rooms, cfg.corridorWidth)) continue;

            current = appendRoom(g, cand, current);
            placed = true;
        }

        if (placed) continue;

        if (isBoss) {
            // Straight up from the last placed room, no overlap check. Guarantees
            // every dungeon ends in a boss room.
            const int offset = cfg.bossRoomSize + cfg.corridorWidth + 10;
            Room boss = makeRoom(g.rooms[static_cast<size_t>(current)].pos + Vec2i{0, offset},
                                 cfg.bossRoomSize, cfg.bossRoomSize);
            boss.isBoss = true;
            current = appendRoom(g, boss, current);
            if (stats) stats->bossForced = true;
        } else if (stats) {
            ++stats->skippedRooms;
        }
    }

    if (stats) stats->mainPathRooms = static_cast<int>(g.rooms.size());
    return g;
}

int expandBranches(RoomGraph& graph, const GenConfig& cfg, RNG& rng) {
    std::vector<int> frontier;
    for (size_t i = 0; i < graph.rooms.size(); ++i) {
        const Room& r = graph.rooms[i];
        if (!r.isStart && !r.isBoss) frontier.push_back(static_cast<int>(i));
    }

    int added = 0;
    for (int depth = 1; depth <= cfg.maxBranchDepth && !frontier.empty(); ++depth) {
        std::vector<int> next;

        for (int parent : frontier) {
            if (!rng.chance(cfg.branchChance)) continue;

            const Vec2i dir = pickWeightedDirection(rng, DirectionBias::Branch, 0.0f);
            const int dist = sampleTravelDistance(cfg, rng);
            const int w = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
            const int h = rng.range(cfg.minRoomSize, cfg.maxRoomSize);

            Room cand = makeRoom(graph.rooms[static_cast<size_t>(parent)].pos + dir * dist, w, h);
            cand.branchDepth = depth;

            // Single attempt: a rejected branch is simply not grown.
            if (overlapsAny(cand, graph.rooms, cfg.corridorWidth)) continue;

            next.push_back(appendRoom(graph, cand, parent));
            ++added;
        }

        frontier.swap(next);
    }

    return added;
}
