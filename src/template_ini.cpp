#include "template_ini.hpp"
#include "theme_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

std::string trim(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

bool restIsSpace(const std::string& s, size_t from) {
    for (size_t i = from; i < s.size(); ++i) {
        if (!std::isspace(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool parseInt(const std::string& raw, int& out) {
    const std::string s = trim(raw);
    try {
        size_t idx = 0;
        const int v = std::stoi(s, &idx, 10);
        if (!restIsSpace(s, idx)) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseFloat(const std::string& raw, float& out) {
    const std::string s = trim(raw);
    try {
        size_t idx = 0;
        const float v = std::stof(s, &idx);
        if (!restIsSpace(s, idx)) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}

struct IniEntry {
    int lineNo = 0;
    std::string key;
    std::string val;
};

int* intField(AreaTemplate& a, const std::string& key) {
    if (key == "width") return &a.width;
    if (key == "height") return &a.height;
    if (key == "recommended_level") return &a.recommendedLevel;

    if (key == "bsp.min_leaf_size") return &a.bsp.minLeafSize;
    if (key == "bsp.max_depth") return &a.bsp.maxDepth;
    if (key == "bsp.min_room_size") return &a.bsp.minRoomSize;
    if (key == "bsp.padding") return &a.bsp.padding;
    if (key == "bsp.min_rooms") return &a.bsp.minRooms;

    if (key == "cavern.smoothing_iterations") return &a.cavern.smoothingIterations;
    if (key == "cavern.birth_threshold") return &a.cavern.birthThreshold;
    if (key == "cavern.min_playable_area") return &a.cavern.minPlayableArea;
    if (key == "cavern.max_retries") return &a.cavern.maxRetries;
    if (key == "cavern.min_room_size") return &a.cavern.minRoomSize;
    if (key == "cavern.max_rooms") return &a.cavern.maxRooms;
    if (key == "cavern.room_padding") return &a.cavern.roomPadding;

    if (key == "scatter.target_rooms") return &a.scatter.targetRooms;
    if (key == "scatter.min_room_size") return &a.scatter.minRoomSize;
    if (key == "scatter.max_room_size") return &a.scatter.maxRoomSize;
    if (key == "scatter.padding") return &a.scatter.padding;
    if (key == "scatter.attempts_per_room") return &a.scatter.attemptsPerRoom;
    return nullptr;
}

float* floatField(AreaTemplate& a, const std::string& key) {
    if (key == "monster_density") return &a.monsterDensity;
    if (key == "treasure_density") return &a.treasureDensity;
    if (key == "trap_density") return &a.trapDensity;
    if (key == "cavern.fill_probability") return &a.cavern.fillProbability;
    return nullptr;
}

} // namespace

bool loadTemplateIni(const std::string& path, AreaTemplate& out, std::string* outWarnings) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (outWarnings) *outWarnings = "Could not open template file: " + path;
        return false;
    }

    std::string contents;
    {
        std::ostringstream oss;
        oss << f.rdbuf();
        contents = oss.str();
    }

    std::istringstream iss(contents);
    std::string line;

    std::string warnings;
    int warnCount = 0;

    std::vector<IniEntry> entries;
    AreaTheme theme = AreaTheme::Dungeon;
    bool haveTheme = false;

    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        stripUtf8Bom(line);

        // Strip comments (# or ;) but do not attempt to handle quoted strings.
        size_t commentPos = std::string::npos;
        size_t pHash = line.find('#');
        size_t pSemi = line.find(';');
        if (pHash != std::string::npos) commentPos = pHash;
        if (pSemi != std::string::npos) commentPos = std::min(commentPos, pSemi);
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        line = trim(std::move(line));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        IniEntry e;
        e.lineNo = lineNo;
        e.key = toLower(trim(line.substr(0, eq)));
        e.val = trim(line.substr(eq + 1));
        if (e.key.empty()) {
            appendWarning(warnings, lineNo, "Empty key", warnCount);
            continue;
        }
        entries.push_back(std::move(e));
    }

    // The theme resets the template, so it is applied before everything else.
    for (const IniEntry& e : entries) {
        if (e.key != "theme") continue;
        AreaTheme t;
        if (!parseAreaTheme(e.val, t)) {
            appendWarning(warnings, e.lineNo, "Unknown theme: " + e.val, warnCount);
            continue;
        }
        theme = t;
        haveTheme = true;
    }
    if (haveTheme) out = templateForTheme(theme);

    for (const IniEntry& e : entries) {
        if (e.key == "theme") continue;

        if (e.key == "name") {
            if (e.val.empty()) {
                appendWarning(warnings, e.lineNo, "Empty name", warnCount);
                continue;
            }
            out.name = e.val;
        } else if (e.key == "algorithm") {
            LayoutAlgorithm la;
            if (!parseLayoutAlgorithm(e.val, la)) {
                appendWarning(warnings, e.lineNo, "Unknown algorithm: " + e.val, warnCount);
                continue;
            }
            out.algorithm = la;
        } else if (int* iv = intField(out, e.key)) {
            int v = 0;
            if (!parseInt(e.val, v)) {
                appendWarning(warnings, e.lineNo, "Invalid int for " + e.key, warnCount);
                continue;
            }
            *iv = v;
        } else if (float* fv = floatField(out, e.key)) {
            float v = 0.0f;
            if (!parseFloat(e.val, v)) {
                appendWarning(warnings, e.lineNo, "Invalid number for " + e.key, warnCount);
                continue;
            }
            *fv = v;
        } else {
            appendWarning(warnings, e.lineNo, "Unknown key: " + e.key, warnCount);
        }
    }

    if (outWarnings) *outWarnings = warnings;
    return true;
}

bool writeDefaultTemplateIni(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    const AreaTemplate d = templateForTheme(AreaTheme::Dungeon);

    f << R"INI(# DelveGen area template
#
# Lines are: key = value
# Comments start with # or ;
#
# theme resets every other value to the catalog defaults for that theme,
# then the remaining keys in this file override them.
# themes: dungeon cave forest ruins castle temple sewers underground_city
)INI";
    f << "theme = " << areaThemeId(d.theme) << "\n";
    f << "name = " << d.name << "\n\n";

    f << "# algorithm: bsp | cellular | simple_random\n";
    f << "algorithm = " << layoutAlgorithmId(d.algorithm) << "\n";
    f << "# width / height: 8..512\n";
    f << "width = " << d.width << "\n";
    f << "height = " << d.height << "\n\n";

    f << "# Expected features per 16 floor tiles of a room (0..1).\n";
    f << "monster_density = " << d.monsterDensity << "\n";
    f << "treasure_density = " << d.treasureDensity << "\n";
    f << "trap_density = " << d.trapDensity << "\n";
    f << "recommended_level = " << d.recommendedLevel << "\n\n";

    f << "# Binary space partition\n";
    f << "bsp.min_leaf_size = " << d.bsp.minLeafSize << "\n";
    f << "bsp.max_depth = " << d.bsp.maxDepth << "\n";
    f << "bsp.min_room_size = " << d.bsp.minRoomSize << "\n";
    f << "bsp.padding = " << d.bsp.padding << "\n";
    f << "bsp.min_rooms = " << d.bsp.minRooms << "\n\n";

    f << "# Cellular automata caverns\n";
    f << "cavern.fill_probability = " << d.cavern.fillProbability << "\n";
    f << "cavern.smoothing_iterations = " << d.cavern.smoothingIterations << "\n";
    f << "cavern.birth_threshold = " << d.cavern.birthThreshold << "\n";
    f << "# min_playable_area: 0 = width * height / 8\n";
    f << "cavern.min_playable_area = " << d.cavern.minPlayableArea << "\n";
    f << "cavern.max_retries = " << d.cavern.maxRetries << "\n";
    f << "cavern.min_room_size = " << d.cavern.minRoomSize << "\n";
    f << "cavern.max_rooms = " << d.cavern.maxRooms << "\n";
    f << "cavern.room_padding = " << d.cavern.roomPadding << "\n\n";

    f << "# Simple random placement\n";
    f << "scatter.target_rooms = " << d.scatter.targetRooms << "\n";
    f << "scatter.min_room_size = " << d.scatter.minRoomSize << "\n";
    f << "# max_room_size: 0 = max(min_room_size, min(width, height) / 3)\n";
    f << "scatter.max_room_size = " << d.scatter.maxRoomSize << "\n";
    f << "scatter.padding = " << d.scatter.padding << "\n";
    f << "scatter.attempts_per_room = " << d.scatter.attemptsPerRoom << "\n";

    return static_cast<bool>(f);
}
