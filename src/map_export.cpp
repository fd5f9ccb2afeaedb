#include "map_export.hpp"
#include "theme_catalog.hpp"

#include <fstream>
#include <sstream>

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

std::string dungeonMapToJson(const DungeonMap& d) {
    std::ostringstream f;

    f << "{\n";
    f << "  \"width\": " << d.width << ",\n";
    f << "  \"height\": " << d.height << ",\n";

    f << "  \"tiles\": [";
    for (int y = 0; y < d.height; ++y) {
        f << "\n    ";
        for (int x = 0; x < d.width; ++x) {
            f << "\"" << tileTypeName(d.at(x, y)) << "\"";
            if (y + 1 < d.height || x + 1 < d.width) f << ",";
        }
    }
    f << "\n  ],\n";

    f << "  \"rooms\": [\n";
    for (size_t i = 0; i < d.rooms.size(); ++i) {
        const Room& r = d.rooms[i];
        f << "    {\"id\": " << r.id
          << ", \"x\": " << r.x
          << ", \"y\": " << r.y
          << ", \"w\": " << r.w
          << ", \"h\": " << r.h
          << ", \"type\": \"" << roomTypeName(r.type) << "\""
          << ", \"monsters\": " << r.monsters
          << ", \"treasures\": " << r.treasures
          << ", \"traps\": " << r.traps << "}";
        if (i + 1 < d.rooms.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n";

    f << "  \"corridors\": [\n";
    for (size_t i = 0; i < d.corridors.size(); ++i) {
        const Corridor& c = d.corridors[i];
        f << "    {\"room_a\": " << c.roomA << ", \"room_b\": " << c.roomB << ", \"path\": [";
        for (size_t k = 0; k < c.path.size(); ++k) {
            if (k) f << ", ";
            f << "[" << c.path[k].x << ", " << c.path[k].y << "]";
        }
        f << "]}";
        if (i + 1 < d.corridors.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n";

    f << "  \"seed\": " << d.seed << ",\n";

    const AreaTemplate& a = d.area;
    f << "  \"template\": {\n";
    f << "    \"name\": \"" << jsonEscape(a.name) << "\",\n";
    f << "    \"theme\": \"" << areaThemeId(a.theme) << "\",\n";
    f << "    \"algorithm\": \"" << layoutAlgorithmId(a.algorithm) << "\",\n";
    f << "    \"monster_density\": " << a.monsterDensity << ",\n";
    f << "    \"treasure_density\": " << a.treasureDensity << ",\n";
    f << "    \"trap_density\": " << a.trapDensity << ",\n";
    f << "    \"recommended_level\": " << a.recommendedLevel << ",\n";
    f << "    \"width\": " << a.width << ",\n";
    f << "    \"height\": " << a.height << "\n";
    f << "  }\n";
    f << "}\n";
    return f.str();
}

bool writeDungeonMapJson(const std::filesystem::path& path, const DungeonMap& d, std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON output for writing: " + path.generic_string();
        return false;
    }
    f << dungeonMapToJson(d);
    if (!f) {
        if (err) *err = "Failed to write JSON output: " + path.generic_string();
        return false;
    }
    return true;
}

std::string renderAscii(const DungeonMap& d) {
    std::vector<std::string> rows(static_cast<size_t>(d.height), std::string(static_cast<size_t>(d.width), '#'));
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            switch (d.at(x, y)) {
                case TileType::Floor: rows[static_cast<size_t>(y)][static_cast<size_t>(x)] = '.'; break;
                case TileType::Door:  rows[static_cast<size_t>(y)][static_cast<size_t>(x)] = '+'; break;
                default: break;
            }
        }
    }

    for (const Room& r : d.rooms) {
        char mark = 0;
        if (r.type == RoomType::SpawnBoss) mark = 'X';
        else if (r.type == RoomType::Spawn) mark = 'S';
        else if (r.type == RoomType::Boss) mark = 'B';
        if (!mark || !d.inBounds(r.cx(), r.cy())) continue;
        rows[static_cast<size_t>(r.cy())][static_cast<size_t>(r.cx())] = mark;
    }

    std::string out;
    out.reserve(static_cast<size_t>((d.width + 1) * d.height));
    for (const std::string& row : rows) {
        out += row;
        out += '\n';
    }
    return out;
}
