#pragma once

#include "dungeon.hpp"

// Random-walk layout
//
// Chains cfg.walkIterations walks of cfg.walkLength cardinal steps from the
// origin, each walk starting where the previous one ended. A step advances
// corridorWidth cells one at a time and stamps the corridor cross-section on
// every cell, so the carved path is 4-connected for any width.
//
// Every walk endpoint becomes a room center (deduplicated, first-seen order).
// The endpoint farthest from the origin hosts the boss room. Connections chain
// the rooms in walk order; the walk itself already realized them, so the
// corridor carver does not run for this layout.
RoomGraph carveRandomWalk(const GenConfig& cfg, RNG& rng, CellSet& corridorFloor,
                          GenerationStats* stats = nullptr);
