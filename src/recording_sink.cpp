#include "recording_sink.hpp"

#include <cmath>

namespace {

Vec2i toCell(const Vec2f& p) {
    return {static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y))};
}

} // namespace

void RecordingSink::clearPreviousGeneration() {
    floor_.clear();
    walls_.clear();
    decorations_.clear();
    lights_.clear();
    enemies_.clear();
    chests_.clear();
    bosses_.clear();
    prefabs_.clear();
    player_ = Vec2f{};
    hasPlayer_ = false;
    duplicateEmits_ = 0;
    ++clears_;
}

void RecordingSink::emitFloorCell(const Vec2i& pos, int variant) {
    if (!floor_.emplace(pos, variant).second) ++duplicateEmits_;
}

void RecordingSink::emitWallCell(const Vec2i& pos, const WallVariant& variant) {
    if (!walls_.emplace(pos, variant).second) ++duplicateEmits_;
}

void RecordingSink::emitDecorationCell(const Vec2i& pos, int variant) {
    if (!decorations_.emplace(pos, variant).second) ++duplicateEmits_;
}

void RecordingSink::spawnLight(const Vec2f& pos, const Color& color, float intensity, float radius) {
    lights_.push_back({pos, color, intensity, radius});
}

void RecordingSink::spawnEnemy(const Vec2f& pos, int variant) {
    enemies_.push_back({pos, variant});
}

void RecordingSink::spawnChest(const Vec2f& pos) {
    chests_.push_back(pos);
}

void RecordingSink::spawnBoss(const Vec2f& pos) {
    bosses_.push_back(pos);
}

void RecordingSink::spawnDecorationPrefab(const Vec2f& pos, int variant) {
    prefabs_.push_back({pos, variant});
}

void RecordingSink::setPlayerSpawn(const Vec2f& pos) {
    player_ = pos;
    hasPlayer_ = true;
}

std::string RecordingSink::toAscii() const {
    IntRect bounds;
    for (const auto& kv : floor_) bounds.include(kv.first);
    for (const auto& kv : walls_) bounds.include(kv.first);
    if (bounds.empty()) return std::string();

    const int w = bounds.width();
    const int h = bounds.height();
    std::vector<std::string> rows(static_cast<size_t>(h), std::string(static_cast<size_t>(w), ' '));

    auto put = [&](const Vec2i& p, char c) {
        if (!bounds.contains(p)) return;
        const size_t row = static_cast<size_t>(bounds.maxY - p.y);
        const size_t col = static_cast<size_t>(p.x - bounds.minX);
        rows[row][col] = c;
    };

    for (const auto& kv : floor_) put(kv.first, '.');
    for (const auto& kv : walls_) put(kv.first, kv.second.north ? '^' : '#');
    for (const auto& kv : decorations_) put(kv.first, ',');
    for (const Light& l : lights_) put(toCell(l.pos), '*');
    for (const Spawn& s : prefabs_) put(toCell(s.pos), '%');
    for (const Vec2f& p : chests_) put(toCell(p), '$');
    for (const Spawn& s : enemies_) put(toCell(s.pos), 'e');
    for (const Vec2f& p : bosses_) put(toCell(p), 'B');
    if (hasPlayer_) put(toCell(player_), '@');

    std::string out;
    out.reserve(static_cast<size_t>((w + 1) * h));
    for (const std::string& r : rows) {
        out += r;
        out += '\n';
    }
    return out;
}
