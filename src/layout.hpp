#pragma once

#include "area_template.hpp"
#include "dungeon_map.hpp"
#include "gen_report.hpp"
#include "rng.hpp"

#include <string>

// Layout generators.
//
// Each one fills a freshly sized, all-wall DungeonMap with rooms, corridors
// and floor, drawing every random decision from `rng`. Parameters have already
// been validated (validateTemplate in area_generator.hpp); the generators only
// fail for the bounded conditions documented below, and on failure the map
// contents are unspecified (the caller discards it).
//
// generateArea() picks one of these from AreaTemplate::algorithm.

// Recursive binary space partition, one room per leaf, sibling subtrees joined
// while unwinding. Fails with GenerationTimeout if the depth bound leaves
// fewer than p.minRooms rooms.
bool generateBspLayout(DungeonMap& d, RandomSource& rng, const BspParams& p,
                       GenerationReport& report, std::string* err);

// Cellular automata cave, largest region kept, logical rooms grown inside it.
// Retries with reseeded randomness; fails with DisconnectedMap when every
// attempt leaves less than the minimum playable area.
bool generateCavernLayout(DungeonMap& d, RandomSource& rng, const CavernParams& p,
                          GenerationReport& report, std::string* err);

// Keeps the largest 4-connected floor region and walls off the rest.
// Components are labelled in row-major discovery order and only a strictly
// larger one replaces the current best, so ties go to the region holding the
// lowest (y, x) cell. Returns the kept area (0 for a map with no floor).
int keepLargestRegion(DungeonMap& d);

// Rejection-sampled rooms chained by corridors. Never fails: running out of
// attempts returns the rooms placed so far plus a PartialGeneration warning.
bool generateScatterLayout(DungeonMap& d, RandomSource& rng, const ScatterParams& p,
                           GenerationReport& report, std::string* err);

// Room margin inside a BSP leaf that keeps `padding` walls between siblings.
inline int bspLeafMargin(int padding) {
    const int half = (padding + 1) / 2;
    return half < 1 ? 1 : half;
}

// Effective upper bound for scatter room sides on a given map.
inline int scatterMaxRoomSize(const ScatterParams& p, int width, int height) {
    int m = p.maxRoomSize;
    if (m <= 0) {
        const int shortSide = width < height ? width : height;
        m = shortSide / 3;
        if (m < p.minRoomSize) m = p.minRoomSize;
    }
    return m;
}

// Effective minimum kept cave area on a given map.
inline int cavernMinPlayableArea(const CavernParams& p, int width, int height) {
    if (p.minPlayableArea > 0) return p.minPlayableArea;
    return (width * height) / 8;
}

// Minimum wall gap the selected algorithm keeps between rooms (0 for caverns,
// whose logical rooms share one open region).
inline int layoutPadding(const AreaTemplate& area) {
    switch (area.algorithm) {
        case LayoutAlgorithm::Bsp:              return area.bsp.padding;
        case LayoutAlgorithm::CellularAutomata: return 0;
        case LayoutAlgorithm::SimpleRandom:     return area.scatter.padding;
    }
    return 0;
}
