#pragma once

#include "dungeon.hpp"

// Corridor carving
//
// Each connection becomes an L-shaped corridor: horizontal leg first, then
// vertical, between jittered points near the two room centers. Every step of
// the path stamps a corridorWidth x corridorWidth square; cells that fall
// inside any room are left to the room fill.

// Random point within a quarter of each dimension from the room center.
Vec2i pickCorridorAnchor(const Room& room, RNG& rng);

// Cells visited by the L path from `from` to `to` (both inclusive), X first.
std::vector<Vec2i> lPath(const Vec2i& from, const Vec2i& to);

// Offsets [-(width-1)/2 .. width/2]; an even width leans toward +x/+y.
void stampSquare(const Vec2i& center, int width, CellSet& out);

// Stamps one corridor and returns the number of new floor cells it added.
int carveCorridor(const Vec2i& from, const Vec2i& to, int width,
                  const std::vector<Room>& rooms, CellSet& floor);

// Carves every connection of the graph, in connection order. Returns the
// total number of corridor-only floor cells added.
int carveCorridors(const RoomGraph& graph, int width, RNG& rng, CellSet& floor);
