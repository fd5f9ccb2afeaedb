#pragma once
#include "area_template.hpp"
#include "common.hpp"
#include <cstdint>
#include <vector>

enum class TileType : uint8_t {
    Wall = 0,
    Floor,
    // Reserved: no generator emits doors yet.
    Door,
    // Sentinel returned by DungeonMap::tileAt() outside the grid; never stored.
    OutOfBounds,
};

enum class RoomType : uint8_t {
    Normal = 0,
    Spawn,
    Boss,
    // A map with a single room uses it as both entrance and boss lair.
    SpawnBoss,
};

struct Room {
    int id = 0;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    RoomType type = RoomType::Normal;

    // Filled by populateRooms().
    int monsters = 0;
    int treasures = 0;
    int traps = 0;

    int x2() const { return x + w; }
    int y2() const { return y + h; }
    int cx() const { return x + w / 2; }
    int cy() const { return y + h / 2; }
    Vec2i center() const { return { cx(), cy() }; }
    int area() const { return w * h; }

    bool isSpawn() const { return type == RoomType::Spawn || type == RoomType::SpawnBoss; }
    bool isBoss() const { return type == RoomType::Boss || type == RoomType::SpawnBoss; }

    bool contains(int px, int py) const {
        return px >= x && px < x2() && py >= y && py < y2();
    }

    // True if this room, grown by `padding` tiles on every side, overlaps
    // `other`. Rooms that do not intersect have at least `padding` wall
    // tiles between them.
    bool intersects(const Room& other, int padding = 0) const {
        return x - padding < other.x2() && other.x < x2() + padding &&
               y - padding < other.y2() && other.y < y2() + padding;
    }
};

struct Corridor {
    int roomA = -1;
    int roomB = -1;
    // Center of roomA to center of roomB, inclusive, 4-connected.
    std::vector<Vec2i> path;
};

class DungeonMap {
public:
    int width = 0;
    int height = 0;
    std::vector<TileType> tiles;

    // Generation order: rooms[i].id == i.
    std::vector<Room> rooms;
    std::vector<Corridor> corridors;

    uint32_t seed = 0;
    AreaTemplate area;

    DungeonMap() = default;
    DungeonMap(int w, int h);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    // Unchecked; callers test inBounds() first.
    TileType& at(int x, int y) { return tiles[static_cast<size_t>(y * width + x)]; }
    const TileType& at(int x, int y) const { return tiles[static_cast<size_t>(y * width + x)]; }

    // Safe for any coordinate.
    TileType tileAt(int x, int y) const {
        if (!inBounds(x, y)) return TileType::OutOfBounds;
        return at(x, y);
    }

    bool isFloor(int x, int y) const { return tileAt(x, y) == TileType::Floor; }

    void fillWalls();
    void carveRect(int x, int y, int w, int h);
    void carveCorridor(const Corridor& c);

    // Appends a room with the next id and carves its rectangle.
    Room& addRoom(int x, int y, int w, int h);
};

const char* tileTypeName(TileType t);
const char* roomTypeName(RoomType t);
