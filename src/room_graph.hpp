#pragma once

#include "dungeon.hpp"

#include <array>
#include <cstdint>

// Room graph growth
//
// The main path grows from a start room at the origin toward a single boss
// room, stepping in a weighted-random direction each time. Branch expansion
// then hangs short side rooms off the main path. Rooms never overlap under the
// circular clearance test (except a force-placed boss room).

enum class DirectionBias : uint8_t {
    MainPath = 0, // favors +x, fading slightly with progress
    Branch,       // favors -x and backward diagonals
};

constexpr int kDirectionCount = 8;
constexpr int kRoomPlacementTries = 10;

// Fixed scan order for weighted sampling: right, up-right, down-right, up,
// down, up-left, down-left, left.
extern const std::array<Vec2i, kDirectionCount> kGrowthDirections;

std::array<float, kDirectionCount> directionWeights(DirectionBias bias, float progress);

// Draws r in [0, total) and walks the table, returning the first direction
// with r < weight after subtracting the weights before it.
Vec2i pickWeightedDirection(RNG& rng, DirectionBias bias, float progress);

// Circular clearance: centers closer than (wA + wB)/2 + corridorWidth + 2.
bool roomsOverlap(const Room& a, const Room& b, int corridorWidth);
bool overlapsAny(const Room& candidate, const std::vector<Room>& rooms, int corridorWidth);

// Main path only. Always contains exactly one start room and one boss room.
RoomGraph buildRoomGraph(const GenConfig& cfg, RNG& rng, GenerationStats* stats = nullptr);

// Adds up to cfg.maxBranchDepth generations of side rooms. Returns the number
// of rooms added.
int expandBranches(RoomGraph& graph, const GenConfig& cfg, RNG& rng);
