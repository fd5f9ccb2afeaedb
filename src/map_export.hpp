#pragma once

#include "dungeon_map.hpp"

#include <filesystem>
#include <string>

// Serializes a generated map to the JSON interchange format:
// width, height, tiles (row-major tags), rooms, corridors, seed and the
// template that produced it.
std::string dungeonMapToJson(const DungeonMap& d);

bool writeDungeonMapJson(const std::filesystem::path& path, const DungeonMap& d, std::string* err = nullptr);

// One text line per map row: '#' wall, '.' floor, '+' door.
// Spawn and boss room centers are marked 'S' and 'B' ('X' for a single room
// that is both).
std::string renderAscii(const DungeonMap& d);

std::string jsonEscape(const std::string& s);
