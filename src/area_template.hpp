#pragma once
#include <cstdint>
#include <string>

enum class AreaTheme : uint8_t {
    Dungeon = 0,
    Cave,
    Forest,
    Ruins,
    Castle,
    Temple,
    Sewers,
    UndergroundCity,
};

constexpr int AREA_THEME_COUNT = 8;

enum class LayoutAlgorithm : uint8_t {
    Bsp = 0,
    CellularAutomata,
    SimpleRandom,
};

// Binary space partition tunables.
struct BspParams {
    int minLeafSize = 6;
    int maxDepth = 4;
    int minRoomSize = 3;
    // Minimum wall tiles kept between rooms of neighbouring leaves.
    int padding = 1;
    // Fewer rooms than this after partitioning is a generation failure.
    int minRooms = 2;
};

// Cellular automata cavern tunables.
struct CavernParams {
    // Probability that a cell starts out as floor.
    float fillProbability = 0.55f;
    int smoothingIterations = 4;
    // A cell becomes floor when at least this many of its 8 neighbours are floor.
    int birthThreshold = 4;
    // Smallest acceptable kept cave, in tiles. 0 = width * height / 8.
    int minPlayableArea = 0;
    int maxRetries = 4;

    // Logical room extraction inside the kept cave.
    int minRoomSize = 2;
    int maxRooms = 10;
    int roomPadding = 1;
};

// Simple random placement tunables.
struct ScatterParams {
    int targetRooms = 10;
    int minRoomSize = 3;
    // 0 = max(minRoomSize, min(width, height) / 3).
    int maxRoomSize = 0;
    int padding = 2;
    int attemptsPerRoom = 30;
};

// Everything a generation call needs besides the seed.
//
// Use templateForTheme() (theme_catalog.hpp) for catalog defaults, then tweak
// individual fields; loadTemplateIni() does the same from a config file.
struct AreaTemplate {
    std::string name = "Dungeon";
    AreaTheme theme = AreaTheme::Dungeon;
    LayoutAlgorithm algorithm = LayoutAlgorithm::Bsp;

    float monsterDensity = 0.5f;
    float treasureDensity = 0.3f;
    float trapDensity = 0.2f;
    int recommendedLevel = 1;

    int width = 48;
    int height = 32;

    BspParams bsp;
    CavernParams cavern;
    ScatterParams scatter;
};
