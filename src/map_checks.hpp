#pragma once

#include "dungeon_map.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Geometry checks over finished maps.
//
// Generators guarantee these properties by construction; the checks exist so
// tests and the CLI (--check) can prove it rather than trust it.

// True if any pair of rooms intersects with the given padding.
bool anyRoomsIntersect(const std::vector<Room>& rooms, int padding);

// 4-connected flood over Floor tiles. Returns a width*height mask (1 = reached).
std::vector<uint8_t> floodFloor(const DungeonMap& d, Vec2i start);

// Every room center is reachable from the first room's center.
bool roomsConnected(const DungeonMap& d);

// Every Floor tile lies inside a room rectangle or on a corridor path.
bool floorWithinFootprints(const DungeonMap& d);

int countFloorTiles(const DungeonMap& d);

// Same tiles, rooms (bounds, type, feature counts) and corridor paths.
bool sameLayout(const DungeonMap& a, const DungeonMap& b);

// Runs the checks that apply to the map's layout algorithm. Returns false and
// describes the first violation in `err`.
bool validateLayout(const DungeonMap& d, int padding, std::string* err = nullptr);
