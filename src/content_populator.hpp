#pragma once

#include "area_template.hpp"
#include "dungeon_map.hpp"
#include "rng.hpp"

// Tiles of room floor per unit of density. A 4x4 room at density 1.0 holds
// one monster (or treasure, or trap) on average.
constexpr int kTilesPerFeature = 16;

// Boss rooms always get a guard in this range.
constexpr int kBossGuardsMin = 2;
constexpr int kBossGuardsMax = 4;

// Expected count for a density over `area` tiles, jittered to an integer:
// the fractional part rounds up with its own probability, so the average over
// many rooms matches density * area / kTilesPerFeature exactly.
int jitteredCount(float density, int area, RandomSource& rng);

// Tags the first room as spawn and the last as boss (a lone room is both), then
// fills monster/treasure/trap counts. Only room types and feature counts are
// touched; geometry and tiles stay as generated.
void populateRooms(DungeonMap& d, const AreaTemplate& area, RandomSource& rng);
