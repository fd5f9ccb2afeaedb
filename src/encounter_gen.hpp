#pragma once

// Encounter, description and quest derivation for finished maps.
//
// Everything here is a pure function of the populated DungeonMap:
// - no RandomSource draws (variety comes from hashing the map seed with a
//   per-purpose tag and the room id),
// - the map is taken by const reference and never modified,
// - calling twice yields identical results.

#include "dungeon_map.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class EncounterType : uint8_t {
    MonsterPack = 0,
    TreasureRoom,
    TrapGauntlet,
    BossRoom,
    PuzzleChamber,
};

const char* encounterTypeName(EncounterType t);

// Base difficulty before level and head-count scaling.
float encounterBaseDifficulty(EncounterType t);

struct Encounter {
    int roomId = -1;
    EncounterType type = EncounterType::MonsterPack;
    float difficulty = 0.0f;
};

// One entry per room that holds monsters, in room order.
std::vector<Encounter> deriveEncounters(const DungeonMap& d);

// Classification and difficulty for a single room (room must hold monsters).
Encounter encounterForRoom(const DungeonMap& d, const Room& r);

// "A damp chamber, 8 by 6 feet. Flagstones all around. ..."
std::string describeRoom(const DungeonMap& d, const Room& r);

// One line per map: theme name, description and room count.
std::string describeArea(const DungeonMap& d);

struct QuestHook {
    std::string title;
    int difficulty = 1; // 1..10
    int reward = 100;   // difficulty * 100
    std::string location;
};

QuestHook deriveQuest(const DungeonMap& d);
