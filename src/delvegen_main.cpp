#include "area_generator.hpp"
#include "encounter_gen.hpp"
#include "layout.hpp"
#include "map_checks.hpp"
#include "map_export.hpp"
#include "template_ini.hpp"
#include "theme_catalog.hpp"
#include "version.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>              Generation seed (0..4294967295). Default: 1.\n"
        << "  --theme <id>            Theme: dungeon, cave, forest, ruins, castle, temple,\n"
        << "                          sewers, underground_city. Default: dungeon.\n"
        << "  --algorithm <id>        Override the layout: bsp, cellular, simple_random.\n"
        << "  --width <n>             Override the map width (8..512).\n"
        << "  --height <n>            Override the map height (8..512).\n"
        << "  --config <path>         Area template INI to load (applied after --theme).\n"
        << "  --write-config <path>   Write a commented default template INI and exit.\n"
        << "  --json <path>           Write the generated map as JSON.\n"
        << "  --ascii                 Print the map as text.\n"
        << "  --describe              Print area, room, encounter and quest text.\n"
        << "  --check                 Verify layout invariants of the generated map.\n"
        << "  --version               Print version.\n"
        << "  --help                  Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static void printDescription(const DungeonMap& d) {
    std::cout << describeArea(d) << "\n";
    for (const Room& r : d.rooms) {
        std::cout << "  [" << r.id << "] " << roomTypeName(r.type) << ": " << describeRoom(d, r) << "\n";
    }

    const auto encounters = deriveEncounters(d);
    if (!encounters.empty()) {
        std::cout << "Encounters:\n";
        for (const Encounter& e : encounters) {
            std::cout << "  room " << e.roomId << " " << encounterTypeName(e.type)
                      << " difficulty=" << e.difficulty << "\n";
        }
    }

    const QuestHook q = deriveQuest(d);
    std::cout << "Quest: " << q.title << " (difficulty " << q.difficulty
              << ", reward " << q.reward << ", " << q.location << ")\n";
}

} // namespace

int main(int argc, char** argv) {
    uint32_t seed = 1;
    AreaTheme theme = AreaTheme::Dungeon;
    bool haveAlgorithm = false;
    LayoutAlgorithm algorithm = LayoutAlgorithm::Bsp;
    uint32_t width = 0;
    uint32_t height = 0;
    std::filesystem::path configPath;
    std::filesystem::path writeConfigPath;
    std::filesystem::path jsonPath;
    bool ascii = false;
    bool describe = false;
    bool check = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << DELVEGEN_APPNAME << " " << DELVEGEN_VERSION << "\n";
            return 0;
        } else if (a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--seed requires a value\n";
                return 2;
            }
            if (!parseU32(v, seed)) {
                std::cerr << "Invalid --seed: " << v << "\n";
                return 2;
            }
        } else if (a == "--theme") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--theme requires a value\n";
                return 2;
            }
            if (!parseAreaTheme(v, theme)) {
                std::cerr << "Unknown theme: " << v << "\n";
                return 2;
            }
        } else if (a == "--algorithm") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--algorithm requires a value\n";
                return 2;
            }
            if (!parseLayoutAlgorithm(v, algorithm)) {
                std::cerr << "Unknown algorithm: " << v << "\n";
                return 2;
            }
            haveAlgorithm = true;
        } else if (a == "--width" || a == "--height") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << a << " requires a value\n";
                return 2;
            }
            uint32_t n = 0;
            if (!parseU32(v, n) || n == 0) {
                std::cerr << "Invalid " << a << ": " << v << "\n";
                return 2;
            }
            (a == "--width" ? width : height) = n;
        } else if (a == "--config") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--config requires a path\n";
                return 2;
            }
            configPath = v;
        } else if (a == "--write-config") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--write-config requires a path\n";
                return 2;
            }
            writeConfigPath = v;
        } else if (a == "--json") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--json requires a path\n";
                return 2;
            }
            jsonPath = v;
        } else if (a == "--ascii") {
            ascii = true;
        } else if (a == "--describe") {
            describe = true;
        } else if (a == "--check") {
            check = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!writeConfigPath.empty()) {
        if (!writeDefaultTemplateIni(writeConfigPath.string())) {
            std::cerr << "Failed to write template: " << writeConfigPath.generic_string() << "\n";
            return 1;
        }
        std::cout << "Wrote template: " << writeConfigPath.generic_string() << "\n";
        return 0;
    }

    AreaTemplate area = templateForTheme(theme);

    if (!configPath.empty()) {
        std::string warns;
        if (!loadTemplateIni(configPath.string(), area, &warns)) {
            std::cerr << "Failed to load template: " << configPath.generic_string() << "\n";
            if (!warns.empty()) std::cerr << warns << "\n";
            return 1;
        }
        if (!warns.empty()) {
            std::cout << warns;
        }
    }

    if (haveAlgorithm) area.algorithm = algorithm;
    if (width) area.width = static_cast<int>(std::min<uint32_t>(width, 0x7FFFFFFFu));
    if (height) area.height = static_cast<int>(std::min<uint32_t>(height, 0x7FFFFFFFu));

    DungeonMap map;
    GenerationReport report;
    std::string err;
    if (!generateArea(seed, area, map, &report, &err)) {
        std::cerr << "Generation FAILED (" << genFailureName(report.failure) << "): " << err << "\n";
        return 1;
    }

    std::cout << "Generated " << area.name << " [" << areaThemeId(area.theme) << "/"
              << layoutAlgorithmId(area.algorithm) << "] seed=" << seed
              << " size=" << map.width << "x" << map.height
              << " rooms=" << map.rooms.size()
              << " corridors=" << map.corridors.size()
              << " floor=" << countFloorTiles(map)
              << "\n";
    for (const GenWarning& w : report.warnings) {
        std::cout << "  warning " << genWarningKindName(w.kind) << ": " << w.message << "\n";
    }

    int rc = 0;

    if (check) {
        std::string cherr;
        if (validateLayout(map, layoutPadding(area), &cherr)) {
            std::cout << "Check OK\n";
        } else {
            std::cout << "Check FAILED: " << cherr << "\n";
            rc = 1;
        }
    }

    if (ascii) std::cout << renderAscii(map);
    if (describe) printDescription(map);

    if (!jsonPath.empty()) {
        std::string jerr;
        if (!writeDungeonMapJson(jsonPath, map, &jerr)) {
            std::cerr << jerr << "\n";
            rc = 1;
        } else {
            std::cout << "Wrote JSON: " << jsonPath.generic_string() << "\n";
        }
    }

    return rc;
}
