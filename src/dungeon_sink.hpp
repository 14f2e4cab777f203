#pragma once

#include "common.hpp"
#include "dungeon.hpp"

// Receiver for everything a generation run produces. The generator never
// holds rendering or engine state; a tilemap painter, a prefab spawner or a
// text dump implements this interface instead.
//
// Call order within a run:
//   clearPreviousGeneration, floor cells, wall cells, decoration cells,
//   lights, enemies, chests, boss, decoration prefabs, player spawn.
class DungeonSink {
public:
    virtual ~DungeonSink() = default;

    // Release everything rendered/spawned by the previous run.
    virtual void clearPreviousGeneration() = 0;

    virtual void emitFloorCell(const Vec2i& pos, int variant) = 0;
    virtual void emitWallCell(const Vec2i& pos, const WallVariant& variant) = 0;
    virtual void emitDecorationCell(const Vec2i& pos, int variant) = 0;

    virtual void spawnLight(const Vec2f& pos, const Color& color, float intensity, float radius) = 0;
    virtual void spawnEnemy(const Vec2f& pos, int variant) = 0;
    virtual void spawnChest(const Vec2f& pos) = 0;
    virtual void spawnBoss(const Vec2f& pos) = 0;
    virtual void spawnDecorationPrefab(const Vec2f& pos, int variant) = 0;
    virtual void setPlayerSpawn(const Vec2f& pos) = 0;
};
