#pragma once

#include "dungeon_sink.hpp"

#include <map>
#include <string>
#include <vector>

// Keeps everything a run emits. The headless CLI dumps it as text, the SDL
// viewer draws it, and the tests inspect it.
//
// toAscii() glyphs:
//   '#' wall, '^' north wall, '.' floor, ',' decoration, '*' light,
//   'e' enemy, '$' chest, 'B' boss, '%' prefab, '@' player.
class RecordingSink : public DungeonSink {
public:
    struct Light {
        Vec2f pos;
        Color color;
        float intensity = 0.0f;
        float radius = 0.0f;
    };

    struct Spawn {
        Vec2f pos;
        int variant = -1;
    };

    void clearPreviousGeneration() override;

    void emitFloorCell(const Vec2i& pos, int variant) override;
    void emitWallCell(const Vec2i& pos, const WallVariant& variant) override;
    void emitDecorationCell(const Vec2i& pos, int variant) override;

    void spawnLight(const Vec2f& pos, const Color& color, float intensity, float radius) override;
    void spawnEnemy(const Vec2f& pos, int variant) override;
    void spawnChest(const Vec2f& pos) override;
    void spawnBoss(const Vec2f& pos) override;
    void spawnDecorationPrefab(const Vec2f& pos, int variant) override;
    void setPlayerSpawn(const Vec2f& pos) override;

    // Top row is the highest y. Entities are drawn over tiles.
    std::string toAscii() const;

    const std::map<Vec2i, int>& floor() const { return floor_; }
    const std::map<Vec2i, WallVariant>& walls() const { return walls_; }
    const std::map<Vec2i, int>& decorations() const { return decorations_; }
    const std::vector<Light>& lights() const { return lights_; }
    const std::vector<Spawn>& enemies() const { return enemies_; }
    const std::vector<Vec2f>& chests() const { return chests_; }
    const std::vector<Vec2f>& bosses() const { return bosses_; }
    const std::vector<Spawn>& prefabs() const { return prefabs_; }
    bool hasPlayerSpawn() const { return hasPlayer_; }
    Vec2f playerSpawn() const { return player_; }

    int clearCount() const { return clears_; }
    int duplicateCellEmits() const { return duplicateEmits_; }

private:
    std::map<Vec2i, int> floor_;
    std::map<Vec2i, WallVariant> walls_;
    std::map<Vec2i, int> decorations_;
    std::vector<Light> lights_;
    std::vector<Spawn> enemies_;
    std::vector<Vec2f> chests_;
    std::vector<Vec2f> bosses_;
    std::vector<Spawn> prefabs_;
    Vec2f player_;
    bool hasPlayer_ = false;

    int clears_ = 0;
    int duplicateEmits_ = 0;
};
