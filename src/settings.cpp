#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    try {
        size_t used = 0;
        const int parsed = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseU32(const std::string& v, uint32_t& out) {
    const std::string s = trim(v);
    if (s.empty() || s[0] == '-') return false;
    try {
        size_t used = 0;
        const unsigned long long parsed = std::stoull(s, &used, 0);
        if (used != s.size() || parsed > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseFloat(const std::string& v, float& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    try {
        size_t used = 0;
        const float parsed = std::stof(s, &used);
        if (used != s.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseColorList(const std::string& v, std::vector<Color>& out) {
    std::vector<Color> colors;
    std::stringstream ss(v);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        if (toLower(item) == "none") continue;
        Color c;
        if (!parseColorHex(item, c)) return false;
        colors.push_back(c);
    }
    out = std::move(colors);
    return true;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

template <typename T, typename Parse>
bool setClamped(T& field, const std::string& val, Parse parse, T lo, T hi) {
    T v{};
    if (!parse(val, v)) return false;
    field = std::clamp(v, lo, hi);
    return true;
}

} // namespace

const char* layoutKindName(LayoutKind k) {
    switch (k) {
        case LayoutKind::Graph: return "graph";
        case LayoutKind::Walk: return "walk";
        default: return "graph";
    }
}

bool parseLayoutKind(const std::string& s, LayoutKind& out) {
    const std::string v = toLower(trim(s));
    if (v == "graph") {
        out = LayoutKind::Graph;
        return true;
    }
    if (v == "walk" || v == "random_walk") {
        out = LayoutKind::Walk;
        return true;
    }
    return false;
}

bool parseColorHex(const std::string& s, Color& out) {
    std::string v = trim(s);
    if (!v.empty() && v[0] == '#') v.erase(0, 1);
    if (v.size() != 6) return false;

    uint8_t rgb[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i) {
        const int hi = hexDigit(v[static_cast<size_t>(i * 2)]);
        const int lo = hexDigit(v[static_cast<size_t>(i * 2 + 1)]);
        if (hi < 0 || lo < 0) return false;
        rgb[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    out = Color{rgb[0], rgb[1], rgb[2], 255};
    return true;
}

bool applyConfigKey(GenConfig& cfg, const std::string& keyIn, const std::string& val) {
    const std::string key = toLower(trim(keyIn));
    TileCatalog& cat = cfg.catalog;

    if (key == "layout") return parseLayoutKind(val, cfg.layout);
    if (key == "seed") return parseU32(val, cfg.seed);

    if (key == "min_rooms") return setClamped(cfg.minRooms, val, parseInt, 1, 200);
    if (key == "max_rooms") return setClamped(cfg.maxRooms, val, parseInt, 1, 200);
    if (key == "corridor_width") return setClamped(cfg.corridorWidth, val, parseInt, 1, 9);
    if (key == "min_room_size") return setClamped(cfg.minRoomSize, val, parseInt, 2, 64);
    if (key == "max_room_size") return setClamped(cfg.maxRoomSize, val, parseInt, 2, 64);
    if (key == "boss_room_size") return setClamped(cfg.bossRoomSize, val, parseInt, 2, 96);
    if (key == "branch_chance") return setClamped(cfg.branchChance, val, parseFloat, 0.0f, 1.0f);
    if (key == "max_branch_depth") return setClamped(cfg.maxBranchDepth, val, parseInt, 0, 8);

    if (key == "walk_iterations") return setClamped(cfg.walkIterations, val, parseInt, 0, 1000);
    if (key == "walk_length") return setClamped(cfg.walkLength, val, parseInt, 0, 1000);

    if (key == "decoration_density") return setClamped(cfg.decorationDensity, val, parseFloat, 0.0f, 1.0f);
    if (key == "light_density") return setClamped(cfg.lightDensity, val, parseFloat, 0.0f, 1.0f);
    if (key == "min_light_intensity") return setClamped(cfg.minLightIntensity, val, parseFloat, 0.1f, 2.0f);
    if (key == "max_light_intensity") return setClamped(cfg.maxLightIntensity, val, parseFloat, 0.1f, 2.0f);
    if (key == "min_light_radius") return setClamped(cfg.minLightRadius, val, parseFloat, 0.5f, 32.0f);
    if (key == "max_light_radius") return setClamped(cfg.maxLightRadius, val, parseFloat, 0.5f, 32.0f);
    if (key == "light_colors") return parseColorList(val, cfg.lightColors);

    if (key == "enemy_spawn_chance") return setClamped(cfg.enemySpawnChance, val, parseFloat, 0.0f, 1.0f);
    if (key == "chest_spawn_chance") return setClamped(cfg.chestSpawnChance, val, parseFloat, 0.0f, 1.0f);
    if (key == "max_enemies_per_room") return setClamped(cfg.maxEnemiesPerRoom, val, parseInt, 0, 32);

    if (key == "prefab_density") return setClamped(cfg.prefabDensity, val, parseFloat, 0.0f, 1.0f);
    if (key == "min_decoration_distance") return setClamped(cfg.minDecorationDistance, val, parseFloat, 0.0f, 64.0f);

    if (key == "floor_variants") return setClamped(cat.floorVariants, val, parseInt, 0, 64);
    if (key == "wall_variants") return setClamped(cat.wallVariants, val, parseInt, 0, 64);
    if (key == "decoration_variants") return setClamped(cat.decorationVariants, val, parseInt, 0, 64);
    if (key == "enemy_variants") return setClamped(cat.enemyVariants, val, parseInt, 0, 64);
    if (key == "prefab_variants") return setClamped(cat.prefabVariants, val, parseInt, 0, 64);
    if (key == "north_wall") return parseBool(val, cat.hasNorthWall);
    if (key == "chest_prefab") return parseBool(val, cat.hasChest);
    if (key == "boss_prefab") return parseBool(val, cat.hasBoss);

    return false;
}

GenConfig loadGenConfig(const std::string& path) {
    GenConfig cfg;

    std::ifstream f(path);
    if (!f) return cfg;

    std::string line;
    while (std::getline(f, line)) {
        // ';' comments may trail a value. '#' also starts a color value, so it
        // only comments out whole lines.
        const auto semi = line.find(';');
        if (semi != std::string::npos) line = line.substr(0, semi);

        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = trim(line.substr(0, eq));
        const std::string val = trim(line.substr(eq + 1));
        applyConfigKey(cfg, key, val);
    }

    return cfg;
}

bool writeDefaultConfig(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# CryptGen dungeon config
#
# Lines are: key = value
# Comments start with ; (or # at the start of a line)
# Missing keys keep their defaults.

# Layout: graph | walk
layout = graph
seed = 1

# Room graph (graph layout)
min_rooms = 8
max_rooms = 12
corridor_width = 3
min_room_size = 6
max_room_size = 12
boss_room_size = 15
branch_chance = 0.35
max_branch_depth = 2

# Random walk (walk layout)
walk_iterations = 10
walk_length = 30

# Decoration / lighting
decoration_density = 0.2
light_density = 1.0
min_light_intensity = 0.5
max_light_intensity = 1.5
min_light_radius = 3
max_light_radius = 8
light_colors = #ffd699, #ffaa5a, #8cb4ff

# Entities
enemy_spawn_chance = 0.6
chest_spawn_chance = 0.25
max_enemies_per_room = 3

# Spaced prefab decorations
prefab_density = 0.02
min_decoration_distance = 2.5

# Variant counts available to the renderer (0 = emit nothing for that category)
floor_variants = 4
wall_variants = 4
north_wall = true
decoration_variants = 6
enemy_variants = 3
prefab_variants = 5
chest_prefab = true
boss_prefab = true
)INI";

    return static_cast<bool>(f);
}
