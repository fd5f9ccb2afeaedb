#include "map_checks.hpp"

#include <deque>
#include <sstream>

namespace {

bool sameRoom(const Room& a, const Room& b) {
    return a.id == b.id && a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h &&
           a.type == b.type && a.monsters == b.monsters && a.treasures == b.treasures &&
           a.traps == b.traps;
}

bool sameCorridor(const Corridor& a, const Corridor& b) {
    return a.roomA == b.roomA && a.roomB == b.roomB && a.path == b.path;
}

bool fail(std::string* err, const std::string& msg) {
    if (err) *err = msg;
    return false;
}

} // namespace

bool anyRoomsIntersect(const std::vector<Room>& rooms, int padding) {
    for (size_t i = 0; i < rooms.size(); ++i) {
        for (size_t j = i + 1; j < rooms.size(); ++j) {
            if (rooms[i].intersects(rooms[j], padding)) return true;
        }
    }
    return false;
}

std::vector<uint8_t> floodFloor(const DungeonMap& d, Vec2i start) {
    std::vector<uint8_t> seen(static_cast<size_t>(d.width * d.height), 0);
    if (!d.isFloor(start.x, start.y)) return seen;

    auto idx = [&](int x, int y) { return static_cast<size_t>(y * d.width + x); };

    std::deque<Vec2i> q;
    q.push_back(start);
    seen[idx(start.x, start.y)] = 1;

    const int dirs[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};

    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop_front();
        for (auto& dv : dirs) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (!d.isFloor(nx, ny)) continue;
            const size_t ii = idx(nx, ny);
            if (seen[ii]) continue;
            seen[ii] = 1;
            q.push_back({nx, ny});
        }
    }
    return seen;
}

bool roomsConnected(const DungeonMap& d) {
    if (d.rooms.empty()) return false;
    const Vec2i start = d.rooms.front().center();
    if (!d.isFloor(start.x, start.y)) return false;

    const auto seen = floodFloor(d, start);
    for (const Room& r : d.rooms) {
        if (!d.inBounds(r.cx(), r.cy())) return false;
        if (!seen[static_cast<size_t>(r.cy() * d.width + r.cx())]) return false;
    }
    return true;
}

bool floorWithinFootprints(const DungeonMap& d) {
    std::vector<uint8_t> covered(static_cast<size_t>(d.width * d.height), 0);
    for (const Room& r : d.rooms) {
        for (int y = r.y; y < r.y2(); ++y) {
            for (int x = r.x; x < r.x2(); ++x) {
                if (d.inBounds(x, y)) covered[static_cast<size_t>(y * d.width + x)] = 1;
            }
        }
    }
    for (const Corridor& c : d.corridors) {
        for (const Vec2i& p : c.path) {
            if (d.inBounds(p.x, p.y)) covered[static_cast<size_t>(p.y * d.width + p.x)] = 1;
        }
    }

    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (d.at(x, y) == TileType::Floor && !covered[static_cast<size_t>(y * d.width + x)]) return false;
        }
    }
    return true;
}

int countFloorTiles(const DungeonMap& d) {
    int n = 0;
    for (TileType t : d.tiles) {
        if (t == TileType::Floor) ++n;
    }
    return n;
}

bool sameLayout(const DungeonMap& a, const DungeonMap& b) {
    if (a.width != b.width || a.height != b.height) return false;
    if (a.seed != b.seed) return false;
    if (a.tiles != b.tiles) return false;

    if (a.rooms.size() != b.rooms.size()) return false;
    for (size_t i = 0; i < a.rooms.size(); ++i) {
        if (!sameRoom(a.rooms[i], b.rooms[i])) return false;
    }

    if (a.corridors.size() != b.corridors.size()) return false;
    for (size_t i = 0; i < a.corridors.size(); ++i) {
        if (!sameCorridor(a.corridors[i], b.corridors[i])) return false;
    }
    return true;
}

bool validateLayout(const DungeonMap& d, int padding, std::string* err) {
    if (d.width <= 0 || d.height <= 0) return fail(err, "Map has no area");
    if (d.tiles.size() != static_cast<size_t>(d.width * d.height)) return fail(err, "Tile grid size mismatch");
    if (d.rooms.empty()) return fail(err, "Map has no rooms");

    for (size_t i = 0; i < d.rooms.size(); ++i) {
        const Room& r = d.rooms[i];
        if (r.id != static_cast<int>(i)) {
            std::ostringstream ss;
            ss << "Room " << i << " has id " << r.id;
            return fail(err, ss.str());
        }
        if (r.w <= 0 || r.h <= 0 || r.x < 0 || r.y < 0 || r.x2() > d.width || r.y2() > d.height) {
            std::ostringstream ss;
            ss << "Room " << r.id << " is outside the map (" << r.x << "," << r.y << " " << r.w << "x" << r.h << ")";
            return fail(err, ss.str());
        }
        if (r.monsters < 0 || r.treasures < 0 || r.traps < 0) {
            std::ostringstream ss;
            ss << "Room " << r.id << " has negative feature counts";
            return fail(err, ss.str());
        }
    }

    for (const Corridor& c : d.corridors) {
        for (size_t i = 1; i < c.path.size(); ++i) {
            if (manhattan(c.path[i - 1], c.path[i]) != 1) {
                std::ostringstream ss;
                ss << "Corridor " << c.roomA << "->" << c.roomB << " is not 4-connected at step " << i;
                return fail(err, ss.str());
            }
        }
    }

    const bool rectangular = d.area.algorithm != LayoutAlgorithm::CellularAutomata;
    if (rectangular) {
        for (size_t i = 0; i < d.rooms.size(); ++i) {
            for (size_t j = i + 1; j < d.rooms.size(); ++j) {
                if (d.rooms[i].intersects(d.rooms[j], padding)) {
                    std::ostringstream ss;
                    ss << "Rooms " << i << " and " << j << " intersect with padding " << padding;
                    return fail(err, ss.str());
                }
            }
        }
        if (!floorWithinFootprints(d)) return fail(err, "Floor tile outside every room and corridor");
    }

    if (!roomsConnected(d)) return fail(err, "Not every room is reachable from the first room");
    return true;
}
