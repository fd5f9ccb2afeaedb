#include "dungeon_map.hpp"

DungeonMap::DungeonMap(int w, int h) : width(w), height(h) {
    tiles.assign(static_cast<size_t>(w > 0 && h > 0 ? w * h : 0), TileType::Wall);
}

void DungeonMap::fillWalls() {
    for (auto& t : tiles) t = TileType::Wall;
    rooms.clear();
    corridors.clear();
}

void DungeonMap::carveRect(int x, int y, int w, int h) {
    for (int yy = y; yy < y + h; ++yy) {
        for (int xx = x; xx < x + w; ++xx) {
            if (!inBounds(xx, yy)) continue;
            at(xx, yy) = TileType::Floor;
        }
    }
}

void DungeonMap::carveCorridor(const Corridor& c) {
    for (const Vec2i& p : c.path) {
        if (!inBounds(p.x, p.y)) continue;
        at(p.x, p.y) = TileType::Floor;
    }
}

Room& DungeonMap::addRoom(int x, int y, int w, int h) {
    Room r;
    r.id = static_cast<int>(rooms.size());
    r.x = x;
    r.y = y;
    r.w = w;
    r.h = h;
    carveRect(x, y, w, h);
    rooms.push_back(r);
    return rooms.back();
}

const char* tileTypeName(TileType t) {
    switch (t) {
        case TileType::Wall:        return "wall";
        case TileType::Floor:       return "floor";
        case TileType::Door:        return "door";
        case TileType::OutOfBounds: return "out_of_bounds";
    }
    return "wall";
}

const char* roomTypeName(RoomType t) {
    switch (t) {
        case RoomType::Normal:    return "normal";
        case RoomType::Spawn:     return "spawn";
        case RoomType::Boss:      return "boss";
        case RoomType::SpawnBoss: return "spawn_boss";
    }
    return "normal";
}
