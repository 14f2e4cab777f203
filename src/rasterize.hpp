#pragma once

#include "dungeon.hpp"

// Floor/wall rasterization.
//
// Floor = room boxes (inclusive extents) + corridor stamps.
// Wall  = 4-neighbors of floor that are not floor themselves.

void fillRoom(const Room& room, CellSet& floor);
CellSet rasterizeRooms(const std::vector<Room>& rooms);

// Single pass over the floor set.
CellSet deriveWalls(const CellSet& floor);

// Floor directly below, no floor directly above.
bool isNorthWall(const CellSet& floor, const Vec2i& wall);

// Assigns a variant to every wall cell, in row-major order. North walls are
// tagged; the rest draw a uniform index from the general wall set (-1 when the
// catalog has no general walls).
std::vector<WallCell> classifyWalls(const CellSet& floor, const CellSet& walls,
                                    const TileCatalog& catalog, RNG& rng);
