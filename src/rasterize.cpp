#include "rasterize.hpp"

void fillRoom(const Room& room, CellSet& floor) {
    for (int y = room.minY(); y <= room.maxY(); ++y) {
        for (int x = room.minX(); x <= room.maxX(); ++x) {
            floor.insert({x, y});
        }
    }
}

CellSet rasterizeRooms(const std::vector<Room>& rooms) {
    CellSet floor;
    for (const Room& r : rooms) fillRoom(r, floor);
    return floor;
}

CellSet deriveWalls(const CellSet& floor) {
    CellSet walls;
    for (const Vec2i& p : floor) {
        for (const Vec2i& d : DIRS4) {
            const Vec2i n = p + d;
            if (contains(floor, n)) continue;
            walls.insert(n);
        }
    }
    return walls;
}

bool isNorthWall(const CellSet& floor, const Vec2i& wall) {
    return contains(floor, {wall.x, wall.y - 1}) && !contains(floor, {wall.x, wall.y + 1});
}

std::vector<WallCell> classifyWalls(const CellSet& floor, const CellSet& walls,
                                    const TileCatalog& catalog, RNG& rng) {
    std::vector<WallCell> out;
    out.reserve(walls.size());

    for (const Vec2i& p : walls) {
        WallCell wc;
        wc.pos = p;
        if (isNorthWall(floor, p)) {
            wc.variant.north = true;
        } else if (catalog.wallVariants > 0) {
            wc.variant.index = rng.index(catalog.wallVariants);
        }
        out.push_back(wc);
    }
    return out;
}
