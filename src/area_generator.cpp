#include "area_generator.hpp"
#include "content_populator.hpp"
#include "layout.hpp"
#include "rng.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace {

bool bad(std::string* err, const std::string& msg) {
    if (err) *err = msg;
    return false;
}

bool densityOk(float v) {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

std::string intRangeMsg(const char* field, int v, int lo, int hi) {
    std::ostringstream ss;
    ss << field << " must be in [" << lo << ", " << hi << "], got " << v;
    return ss.str();
}

std::string atLeastMsg(const char* field, int v, int lo) {
    std::ostringstream ss;
    ss << field << " must be >= " << lo << ", got " << v;
    return ss.str();
}

bool validateBsp(const AreaTemplate& a, std::string* err) {
    const BspParams& p = a.bsp;
    if (p.minRoomSize < 1) return bad(err, atLeastMsg("bsp.min_room_size", p.minRoomSize, 1));
    if (p.padding < 0) return bad(err, atLeastMsg("bsp.padding", p.padding, 0));
    if (p.maxDepth < 0 || p.maxDepth > kMaxBspDepth) return bad(err, intRangeMsg("bsp.max_depth", p.maxDepth, 0, kMaxBspDepth));
    if (p.minRooms < 1) return bad(err, atLeastMsg("bsp.min_rooms", p.minRooms, 1));

    // Every leaf must fit its room plus the margin on both sides.
    const int needLeaf = p.minRoomSize + 2 * bspLeafMargin(p.padding);
    if (p.minLeafSize < needLeaf) return bad(err, atLeastMsg("bsp.min_leaf_size", p.minLeafSize, needLeaf));
    if (a.width < p.minLeafSize || a.height < p.minLeafSize) {
        std::ostringstream ss;
        ss << "map " << a.width << "x" << a.height << " is smaller than bsp.min_leaf_size " << p.minLeafSize;
        return bad(err, ss.str());
    }
    return true;
}

bool validateCavern(const AreaTemplate& a, std::string* err) {
    const CavernParams& p = a.cavern;
    if (!densityOk(p.fillProbability)) return bad(err, "cavern.fill_probability must be in [0, 1]");
    if (p.smoothingIterations < 0 || p.smoothingIterations > 32) return bad(err, intRangeMsg("cavern.smoothing_iterations", p.smoothingIterations, 0, 32));
    if (p.birthThreshold < 0 || p.birthThreshold > 8) return bad(err, intRangeMsg("cavern.birth_threshold", p.birthThreshold, 0, 8));
    if (p.minPlayableArea < 0) return bad(err, atLeastMsg("cavern.min_playable_area", p.minPlayableArea, 0));
    if (p.maxRetries < 0 || p.maxRetries > 64) return bad(err, intRangeMsg("cavern.max_retries", p.maxRetries, 0, 64));
    if (p.minRoomSize < 1) return bad(err, atLeastMsg("cavern.min_room_size", p.minRoomSize, 1));
    if (p.maxRooms < 1) return bad(err, atLeastMsg("cavern.max_rooms", p.maxRooms, 1));
    if (p.roomPadding < 0) return bad(err, atLeastMsg("cavern.room_padding", p.roomPadding, 0));
    return true;
}

bool validateScatter(const AreaTemplate& a, std::string* err) {
    const ScatterParams& p = a.scatter;
    if (p.targetRooms < 1) return bad(err, atLeastMsg("scatter.target_rooms", p.targetRooms, 1));
    if (p.minRoomSize < 1) return bad(err, atLeastMsg("scatter.min_room_size", p.minRoomSize, 1));
    if (p.maxRoomSize != 0 && p.maxRoomSize < p.minRoomSize) return bad(err, atLeastMsg("scatter.max_room_size", p.maxRoomSize, p.minRoomSize));
    if (p.padding < 0) return bad(err, atLeastMsg("scatter.padding", p.padding, 0));
    if (p.attemptsPerRoom < 1) return bad(err, atLeastMsg("scatter.attempts_per_room", p.attemptsPerRoom, 1));
    if (p.minRoomSize > a.width - 2 || p.minRoomSize > a.height - 2) {
        std::ostringstream ss;
        ss << "scatter.min_room_size " << p.minRoomSize << " does not fit a " << a.width << "x" << a.height
           << " map with a one-tile border";
        return bad(err, ss.str());
    }
    return true;
}

} // namespace

bool validateTemplate(const AreaTemplate& area, std::string* err) {
    if (area.width < kMinMapSide || area.width > kMaxMapSide) return bad(err, intRangeMsg("width", area.width, kMinMapSide, kMaxMapSide));
    if (area.height < kMinMapSide || area.height > kMaxMapSide) return bad(err, intRangeMsg("height", area.height, kMinMapSide, kMaxMapSide));
    if (!densityOk(area.monsterDensity)) return bad(err, "monster_density must be in [0, 1]");
    if (!densityOk(area.treasureDensity)) return bad(err, "treasure_density must be in [0, 1]");
    if (!densityOk(area.trapDensity)) return bad(err, "trap_density must be in [0, 1]");
    if (area.recommendedLevel < 1) return bad(err, atLeastMsg("recommended_level", area.recommendedLevel, 1));

    switch (area.algorithm) {
        case LayoutAlgorithm::Bsp:              return validateBsp(area, err);
        case LayoutAlgorithm::CellularAutomata: return validateCavern(area, err);
        case LayoutAlgorithm::SimpleRandom:     return validateScatter(area, err);
    }
    return bad(err, "unknown layout algorithm");
}

bool generateArea(uint32_t seed,
                  const AreaTemplate& area,
                  DungeonMap& out,
                  GenerationReport* report,
                  std::string* err) {
    GenerationReport local;
    GenerationReport& rep = report ? *report : local;
    rep = GenerationReport{};

    if (!validateTemplate(area, err)) {
        rep.failure = GenFailure::InvalidParameter;
        return false;
    }

    DungeonMap d(area.width, area.height);
    d.seed = seed;
    d.area = area;

    RandomSource rng(seed);

    bool ok = false;
    switch (area.algorithm) {
        case LayoutAlgorithm::Bsp:
            ok = generateBspLayout(d, rng, area.bsp, rep, err);
            break;
        case LayoutAlgorithm::CellularAutomata:
            ok = generateCavernLayout(d, rng, area.cavern, rep, err);
            break;
        case LayoutAlgorithm::SimpleRandom:
            ok = generateScatterLayout(d, rng, area.scatter, rep, err);
            break;
    }
    if (!ok) return false;

    populateRooms(d, area, rng);

    out = std::move(d);
    return true;
}
