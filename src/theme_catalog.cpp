#include "theme_catalog.hpp"

#include <cctype>

namespace {

using LA = LayoutAlgorithm;

// Order matches AreaTheme.
const std::array<ThemeInfo, AREA_THEME_COUNT> kThemes = {{
    { AreaTheme::Dungeon, "dungeon", "Dungeon",
      "A dark underground dungeon with stone walls",
      LA::Bsp, 0.6f, 0.3f, 0.3f, 1,
      {{ "chamber", "cell", "vault", "guardroom" }},
      {{ "flagstones", "mortared walls", "iron grates", "worn steps" }},
      {{ "damp", "shadowed", "cramped", "forgotten" }},
      {{ "Water drips somewhere out of sight.", "Rusted chains hang from the ceiling.",
         "A cold draft carries the smell of old smoke.", "Scratches mark the passing of long days." }} },

    { AreaTheme::Cave, "cave", "Cave",
      "A natural limestone cave with organic passages",
      LA::CellularAutomata, 0.4f, 0.2f, 0.1f, 2,
      {{ "cavern", "grotto", "hollow", "gallery" }},
      {{ "limestone", "loose scree", "dripstone", "slick rock" }},
      {{ "echoing", "glistening", "narrow", "vaulted" }},
      {{ "Stalactites glitter in the dark.", "An underground stream murmurs nearby.",
         "Bats shift and chitter overhead.", "Pale fungus clings to the walls." }} },

    { AreaTheme::Forest, "forest", "Forest",
      "A dense magical forest with twisted paths",
      LA::SimpleRandom, 0.3f, 0.2f, 0.1f, 1,
      {{ "clearing", "glade", "thicket", "hollow" }},
      {{ "moss", "tangled roots", "fallen leaves", "soft loam" }},
      {{ "sun-dappled", "overgrown", "misty", "whispering" }},
      {{ "Birdsong falls suddenly silent.", "Glowing motes drift between the trunks.",
         "The branches creak without wind.", "Wild mushrooms ring an old stump." }} },

    { AreaTheme::Ruins, "ruins", "Ancient Ruins",
      "Crumbling ancient structures overgrown with nature",
      LA::Bsp, 0.5f, 0.4f, 0.2f, 3,
      {{ "hall", "courtyard", "shrine", "atrium" }},
      {{ "cracked tiles", "toppled columns", "rubble", "ivy-choked stone" }},
      {{ "crumbling", "sunken", "weathered", "half-buried" }},
      {{ "Faded murals hint at a lost empire.", "Roots have split the old masonry.",
         "A broken statue watches the doorway.", "Dust hangs in shafts of light." }} },

    { AreaTheme::Castle, "castle", "Castle",
      "An imposing fortress with fortified halls",
      LA::Bsp, 0.7f, 0.3f, 0.2f, 5,
      {{ "hall", "barracks", "armory", "gallery" }},
      {{ "polished stone", "oak planks", "woven rugs", "arrow slits" }},
      {{ "grand", "fortified", "banner-hung", "austere" }},
      {{ "Tattered banners sway on the walls.", "Torch brackets line the room.",
         "Distant boots echo on stone.", "A suit of armor stands at attention." }} },

    { AreaTheme::Temple, "temple", "Temple",
      "A sacred temple with mystical architecture",
      LA::CellularAutomata, 0.4f, 0.5f, 0.3f, 4,
      {{ "sanctum", "nave", "cloister", "reliquary" }},
      {{ "inlaid marble", "carved glyphs", "incense ash", "gilded mosaics" }},
      {{ "hallowed", "silent", "candlelit", "ornate" }},
      {{ "Old chants seem to linger in the air.", "Candles burn with a steady blue flame.",
         "Offerings lie untouched on an altar.", "Carved eyes follow every step." }} },

    { AreaTheme::Sewers, "sewers", "Sewers",
      "Disgusting underground sewage tunnels",
      LA::CellularAutomata, 0.5f, 0.1f, 0.2f, 2,
      {{ "tunnel", "cistern", "junction", "outflow" }},
      {{ "slime", "brick culverts", "stagnant water", "rusted pipes" }},
      {{ "fetid", "dripping", "murky", "choked" }},
      {{ "Something skitters through the runoff.", "The stench is almost overwhelming.",
         "Water roars through a grate below.", "Rats watch from a crumbling ledge." }} },

    { AreaTheme::UndergroundCity, "underground_city", "Underground City",
      "An ancient dwarven city deep below the surface",
      LA::SimpleRandom, 0.3f, 0.4f, 0.1f, 6,
      {{ "plaza", "forge hall", "market", "gatehouse" }},
      {{ "hewn granite", "bronze inlays", "cobbles", "rune-carved pillars" }},
      {{ "vast", "abandoned", "lantern-lit", "deep-delved" }},
      {{ "Great chains lift a silent elevator.", "Cold forges wait for their smiths.",
         "Stone faces of old kings line the walls.", "The hum of deep machinery never stops." }} },
}};

const std::array<AreaTheme, AREA_THEME_COUNT> kThemeOrder = {{
    AreaTheme::Dungeon, AreaTheme::Cave, AreaTheme::Forest, AreaTheme::Ruins,
    AreaTheme::Castle, AreaTheme::Temple, AreaTheme::Sewers, AreaTheme::UndergroundCity,
}};

// Lowercase, spaces/dashes to underscores, punctuation dropped.
std::string sanitizeId(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    auto pushUnderscore = [&]() {
        if (!out.empty() && out.back() != '_') out.push_back('_');
    };

    for (unsigned char c : raw) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (c == ' ' || c == '_' || c == '-') {
            pushUnderscore();
        }
    }

    while (!out.empty() && out.front() == '_') out.erase(out.begin());
    while (!out.empty() && out.back() == '_') out.pop_back();
    return out;
}

} // namespace

const ThemeInfo& themeInfo(AreaTheme theme) {
    const size_t i = static_cast<size_t>(theme);
    if (i >= kThemes.size()) return kThemes[0];
    return kThemes[i];
}

const std::array<AreaTheme, AREA_THEME_COUNT>& allThemes() {
    return kThemeOrder;
}

AreaTemplate templateForTheme(AreaTheme theme) {
    const ThemeInfo& info = themeInfo(theme);

    AreaTemplate t;
    t.name = info.displayName;
    t.theme = info.theme;
    t.algorithm = info.algorithm;
    t.monsterDensity = info.monsterDensity;
    t.treasureDensity = info.treasureDensity;
    t.trapDensity = info.trapDensity;
    t.recommendedLevel = info.recommendedLevel;
    return t;
}

const char* areaThemeId(AreaTheme theme) {
    return themeInfo(theme).id;
}

const char* layoutAlgorithmId(LayoutAlgorithm algorithm) {
    switch (algorithm) {
        case LayoutAlgorithm::Bsp:              return "bsp";
        case LayoutAlgorithm::CellularAutomata: return "cellular";
        case LayoutAlgorithm::SimpleRandom:     return "simple_random";
    }
    return "bsp";
}

bool parseAreaTheme(const std::string& raw, AreaTheme& out) {
    const std::string v = sanitizeId(raw);
    for (const ThemeInfo& info : kThemes) {
        if (v == info.id || v == sanitizeId(info.displayName)) {
            out = info.theme;
            return true;
        }
    }
    if (v == "city") {
        out = AreaTheme::UndergroundCity;
        return true;
    }
    return false;
}

bool parseLayoutAlgorithm(const std::string& raw, LayoutAlgorithm& out) {
    const std::string v = sanitizeId(raw);
    if (v == "bsp" || v == "binary_space_partition") {
        out = LayoutAlgorithm::Bsp;
        return true;
    }
    if (v == "cellular" || v == "cellular_automata" || v == "cave") {
        out = LayoutAlgorithm::CellularAutomata;
        return true;
    }
    if (v == "simple_random" || v == "simple" || v == "scatter") {
        out = LayoutAlgorithm::SimpleRandom;
        return true;
    }
    return false;
}
