#pragma once

#include "area_template.hpp"

#include <array>
#include <string>

// Static per-theme configuration: layout preference, default densities and
// the vocabulary used for flavor text. Pure data; nothing here is random.
struct ThemeInfo {
    AreaTheme theme = AreaTheme::Dungeon;
    const char* id = "";          // stable lowercase id (config files, JSON)
    const char* displayName = "";
    const char* description = "";

    LayoutAlgorithm algorithm = LayoutAlgorithm::Bsp;
    float monsterDensity = 0.5f;
    float treasureDensity = 0.3f;
    float trapDensity = 0.2f;
    int recommendedLevel = 1;

    std::array<const char*, 4> roomNouns{};
    std::array<const char*, 4> tileNouns{};
    std::array<const char*, 4> adjectives{};
    std::array<const char*, 4> ambience{};
};

const ThemeInfo& themeInfo(AreaTheme theme);

const std::array<AreaTheme, AREA_THEME_COUNT>& allThemes();

// Catalog defaults for `theme`, including its preferred algorithm.
AreaTemplate templateForTheme(AreaTheme theme);

const char* areaThemeId(AreaTheme theme);
const char* layoutAlgorithmId(LayoutAlgorithm algorithm);

// Accepts ids and display names, case-insensitive ("underground_city",
// "Underground City"). Returns false for unknown names.
bool parseAreaTheme(const std::string& raw, AreaTheme& out);
// Accepts "bsp", "cellular" / "cellular_automata" / "cave", "simple_random" / "scatter".
bool parseLayoutAlgorithm(const std::string& raw, LayoutAlgorithm& out);
