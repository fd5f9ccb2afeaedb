#include "area_generator.hpp"
#include "content_populator.hpp"
#include "corridor_router.hpp"
#include "encounter_gen.hpp"
#include "layout.hpp"
#include "map_checks.hpp"
#include "map_export.hpp"
#include "rng.hpp"
#include "template_ini.hpp"
#include "theme_catalog.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

AreaTemplate templateWith(AreaTheme theme, LayoutAlgorithm algorithm) {
    AreaTemplate a = templateForTheme(theme);
    a.algorithm = algorithm;
    return a;
}

const std::vector<LayoutAlgorithm> kAllAlgorithms = {
    LayoutAlgorithm::Bsp,
    LayoutAlgorithm::CellularAutomata,
    LayoutAlgorithm::SimpleRandom,
};

void test_rng_reproducible() {
    RandomSource rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    // Also validate range() stays within bounds.
    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    for (int i = 0; i < 1000; ++i) {
        const double f = rng.nextFloat();
        expect(f >= 0.0 && f < 1.0, "RNG nextFloat() outside [0,1)");
    }

    // Degenerate ranges do not consume a draw.
    RandomSource a(9u);
    RandomSource b(9u);
    expect(a.range(5, 5) == 5, "range(5,5) should return 5");
    expect(a.range(5, 2) == 5, "inverted range should return lo");
    expect(a.nextU32() == b.nextU32(), "degenerate range consumed a draw");
}

void test_rng_zero_seed_and_helpers() {
    RandomSource z(0u);
    expect(z.seed() == 0u, "seed() should report the caller's seed");
    expect(z.state() == RandomSource::kZeroSeedState, "seed 0 should be remapped");
    bool anyNonZero = false;
    for (int i = 0; i < 8; ++i) anyNonZero = anyNonZero || z.nextU32() != 0u;
    expect(anyNonZero, "seed 0 stream should not be stuck at zero");

    const std::vector<int> items = { 10, 20, 30, 40 };
    RandomSource c1(77u);
    RandomSource c2(77u);
    for (int i = 0; i < 50; ++i) {
        const int v = c1.choice(items);
        expect(v == c2.choice(items), "choice() not deterministic");
        expect(v == 10 || v == 20 || v == 30 || v == 40, "choice() returned a foreign value");
    }

    std::vector<int> s1 = { 1, 2, 3, 4, 5, 6, 7, 8 };
    std::vector<int> s2 = s1;
    RandomSource h1(5u);
    RandomSource h2(5u);
    h1.shuffle(s1);
    h2.shuffle(s2);
    expect(s1 == s2, "shuffle() not deterministic");
    int sum = 0;
    for (int v : s1) sum += v;
    expect(sum == 36 && s1.size() == 8, "shuffle() lost elements");

    expect(tag32("ROOMDESC") == fnv1a32("ROOMDESC", 8), "tag32 should match fnv1a32");
    expect(hashCombine(1u, 2u) != hashCombine(2u, 1u), "hashCombine should be order sensitive");
    expect(rand01(0u) == 0.0 && rand01(0xFFFFFFFFu) < 1.0, "rand01 should map into [0,1)");
}

void test_room_intersection_padding() {
    Room a;
    a.x = 2; a.y = 2; a.w = 4; a.h = 4; // covers x 2..5

    Room b;
    b.x = 7; b.y = 2; b.w = 3; b.h = 3; // one wall column (x=6) between them

    expect(!a.intersects(b), "rooms with a gap should not intersect");
    expect(a.intersects(b, 2), "padding 2 should reject a one-tile gap");
    expect(!a.intersects(b, 1), "padding 1 should accept a one-tile gap");

    Room c = b;
    c.x = 5;
    expect(a.intersects(c), "overlapping rooms should intersect");
    expect(c.intersects(a), "intersection should be symmetric");

    Room d = b;
    d.x = 6;
    expect(!a.intersects(d), "touching rooms do not overlap without padding");
    expect(a.intersects(d, 1), "touching rooms violate padding 1");

    expect(a.contains(2, 2) && a.contains(5, 5), "room should contain its corners");
    expect(!a.contains(6, 2) && !a.contains(2, 6), "room x2/y2 are exclusive");

    expect(anyRoomsIntersect({ a, b }, 2), "anyRoomsIntersect should see padding violation");
    expect(!anyRoomsIntersect({ a, b }, 1), "anyRoomsIntersect false positive");
}

void test_tile_access_bounds() {
    DungeonMap d(10, 8);
    expect(d.tiles.size() == 80u, "new map tile count");
    expect(d.tileAt(0, 0) == TileType::Wall, "new map starts as wall");
    expect(d.tileAt(-1, 0) == TileType::OutOfBounds, "x=-1 should be out of bounds");
    expect(d.tileAt(0, 8) == TileType::OutOfBounds, "y=height should be out of bounds");
    expect(d.tileAt(10, 3) == TileType::OutOfBounds, "x=width should be out of bounds");
    expect(!d.isFloor(-5, -5), "isFloor out of bounds");

    const Room& r = d.addRoom(2, 2, 3, 2);
    expect(r.id == 0, "first room id");
    expect(d.isFloor(2, 2) && d.isFloor(4, 3), "addRoom should carve its rectangle");
    expect(!d.isFloor(5, 2) && !d.isFloor(2, 4), "addRoom carved outside its rectangle");
    expect(countFloorTiles(d) == 6, "countFloorTiles after one 3x2 room");

    d.fillWalls();
    expect(d.rooms.empty() && countFloorTiles(d) == 0, "fillWalls should reset the map");
}

void test_l_shaped_path() {
    const Vec2i from{ 1, 1 };
    const Vec2i to{ 4, 3 };

    const auto h = lShapedPath(from, to, CorridorLeg::Horizontal);
    expect(h.size() == 6u, "horizontal-first path length");
    expect(h.front() == from && h.back() == to, "path should include both endpoints");
    bool cornerH = false;
    for (const Vec2i& p : h) cornerH = cornerH || (p == Vec2i{ 4, 1 });
    expect(cornerH, "horizontal-first path should bend at (4,1)");

    const auto v = lShapedPath(from, to, CorridorLeg::Vertical);
    bool cornerV = false;
    for (const Vec2i& p : v) cornerV = cornerV || (p == Vec2i{ 1, 3 });
    expect(cornerV, "vertical-first path should bend at (1,3)");

    for (size_t i = 1; i < h.size(); ++i) {
        expect(manhattan(h[i - 1], h[i]) == 1, "path steps must be 4-adjacent");
    }

    const auto same = lShapedPath(to, to, CorridorLeg::Vertical);
    expect(same.size() == 1u && same.front() == to, "degenerate path is the single point");

    DungeonMap d(20, 12);
    const Room a = d.addRoom(1, 1, 3, 3);
    const Room b = d.addRoom(12, 7, 4, 3);
    RandomSource rng(11u);
    const Corridor c = connectRooms(d, a, b, rng);
    expect(c.roomA == 0 && c.roomB == 1, "corridor endpoints ids");
    expect(c.path.front() == a.center() && c.path.back() == b.center(), "corridor joins room centers");
    for (const Vec2i& p : c.path) {
        expect(d.isFloor(p.x, p.y), "corridor tile not carved");
    }
    d.corridors.push_back(c);
    expect(roomsConnected(d), "two rooms joined by a corridor should be connected");
}

void test_generation_deterministic() {
    for (LayoutAlgorithm la : kAllAlgorithms) {
        const AreaTemplate area = templateWith(AreaTheme::Dungeon, la);
        for (uint32_t seed : { 1u, 42u, 9001u }) {
            DungeonMap a;
            DungeonMap b;
            const bool okA = generateArea(seed, area, a);
            const bool okB = generateArea(seed, area, b);
            const std::string tag = std::string(layoutAlgorithmId(la)) + " seed " + std::to_string(seed);
            expect(okA && okB, "generation failed: " + tag);
            expect(sameLayout(a, b), "same seed produced different maps: " + tag);
            expect(describeArea(a) == describeArea(b), "area text not deterministic: " + tag);
        }
    }
}

void test_seed_sensitivity() {
    for (LayoutAlgorithm la : kAllAlgorithms) {
        const AreaTemplate area = templateWith(AreaTheme::Dungeon, la);
        int identical = 0;
        int pairs = 0;
        for (uint32_t s = 100; s < 150; ++s) {
            DungeonMap a;
            DungeonMap b;
            if (!generateArea(s, area, a) || !generateArea(s + 1000u, area, b)) continue;
            pairs++;
            if (a.tiles == b.tiles) identical++;
        }
        expect(pairs >= 45, std::string("too many failed generations for ") + layoutAlgorithmId(la));
        expect(identical <= 1, std::string("different seeds gave identical tiles for ") + layoutAlgorithmId(la));
    }
}

void test_layout_invariants() {
    for (LayoutAlgorithm la : kAllAlgorithms) {
        for (AreaTheme theme : allThemes()) {
            AreaTemplate area = templateWith(theme, la);
            for (uint32_t seed = 1; seed <= 20; ++seed) {
                DungeonMap d;
                GenerationReport rep;
                std::string err;
                const std::string tag = std::string(layoutAlgorithmId(la)) + "/" + areaThemeId(theme) +
                                        " seed " + std::to_string(seed);
                if (!generateArea(seed, area, d, &rep, &err)) {
                    expect(false, "generation failed: " + tag + ": " + err);
                    continue;
                }

                std::string verr;
                expect(validateLayout(d, layoutPadding(area), &verr), "layout invalid: " + tag + ": " + verr);
                expect(roomsConnected(d), "rooms not connected: " + tag);
                expect(!d.rooms.empty(), "map without rooms: " + tag);

                if (la != LayoutAlgorithm::CellularAutomata) {
                    expect(!anyRoomsIntersect(d.rooms, layoutPadding(area)), "rooms overlap: " + tag);
                }

                expect(d.rooms.front().isSpawn(), "first room should be spawn: " + tag);
                expect(d.rooms.back().isBoss(), "last room should be boss: " + tag);

                // Map border stays wall for the rectangular layouts.
                if (la != LayoutAlgorithm::CellularAutomata) {
                    bool borderWall = true;
                    for (int x = 0; x < d.width; ++x) {
                        borderWall = borderWall && !d.isFloor(x, 0) && !d.isFloor(x, d.height - 1);
                    }
                    for (int y = 0; y < d.height; ++y) {
                        borderWall = borderWall && !d.isFloor(0, y) && !d.isFloor(d.width - 1, y);
                    }
                    expect(borderWall, "floor on the map border: " + tag);
                }
            }
        }
    }
}

void test_cavern_single_region() {
    AreaTemplate area = templateWith(AreaTheme::Cave, LayoutAlgorithm::CellularAutomata);
    for (uint32_t seed = 1; seed <= 10; ++seed) {
        DungeonMap d;
        GenerationReport rep;
        if (!generateArea(seed, area, d, &rep)) {
            expect(false, "cavern generation failed for seed " + std::to_string(seed));
            continue;
        }
        expect(rep.attempts >= 1 && rep.attempts <= area.cavern.maxRetries + 1, "cavern attempt count out of range");

        const Room& r0 = d.rooms.front();
        const auto seen = floodFloor(d, r0.center());
        int reached = 0;
        for (uint8_t v : seen) reached += v;
        expect(reached == countFloorTiles(d), "cavern has floor outside the kept region");
        expect(countFloorTiles(d) >= cavernMinPlayableArea(area.cavern, d.width, d.height),
               "cavern smaller than the playable minimum");
        expect(static_cast<int>(d.rooms.size()) <= area.cavern.maxRooms, "too many cavern rooms");

        for (const Room& r : d.rooms) {
            for (int y = r.y; y < r.y2(); ++y) {
                for (int x = r.x; x < r.x2(); ++x) {
                    expect(d.isFloor(x, y), "cavern room covers a wall tile");
                }
            }
        }
    }
}

void test_cavern_region_tie_break() {
    // Two equal 2x2 regions: the one holding the lowest (y, x) cell is kept.
    DungeonMap d(12, 8);
    d.carveRect(1, 1, 2, 2);
    d.carveRect(7, 4, 2, 2);
    expect(keepLargestRegion(d) == 4, "tie: kept area");
    expect(d.isFloor(1, 1) && d.isFloor(2, 2), "tie: upper-left region should survive");
    expect(!d.isFloor(7, 4) && !d.isFloor(8, 5), "tie: lower-right region should be walled");
    expect(countFloorTiles(d) == 4, "tie: floor outside the kept region");

    // Row-major order means y decides first: the upper region wins even when
    // it lies further right.
    DungeonMap e(12, 8);
    e.carveRect(8, 1, 2, 2);
    e.carveRect(1, 4, 2, 2);
    expect(keepLargestRegion(e) == 4, "row-major tie: kept area");
    expect(e.isFloor(8, 1) && !e.isFloor(1, 4), "row-major tie: upper region should survive");

    // A strictly larger region found later still replaces the first.
    DungeonMap f(12, 8);
    f.carveRect(1, 1, 2, 2);
    f.carveRect(6, 4, 3, 2);
    expect(keepLargestRegion(f) == 6, "larger region: kept area");
    expect(!f.isFloor(1, 1) && f.isFloor(6, 4), "larger later region should win");

    DungeonMap g(8, 8);
    expect(keepLargestRegion(g) == 0, "no floor keeps nothing");
}

void test_cavern_retry_stream() {
    AreaTemplate area = templateWith(AreaTheme::Cave, LayoutAlgorithm::CellularAutomata);
    area.cavern.fillProbability = 0.45f;
    area.cavern.minPlayableArea = 400;
    area.cavern.maxRetries = 8;

    int retried = 0;
    for (uint32_t seed = 1; seed <= 400; ++seed) {
        DungeonMap d;
        GenerationReport rep;
        if (!generateArea(seed, area, d, &rep)) continue;
        if (rep.attempts <= 1) continue;
        ++retried;

        const std::string tag = "seed " + std::to_string(seed);
        expect(countFloorTiles(d) >= 400, "retried cavern below the playable minimum: " + tag);

        DungeonMap again;
        expect(generateArea(seed, area, again) && again.tiles == d.tiles, "retried cavern not reproducible: " + tag);

        DungeonMap next;
        if (generateArea(seed + 1, area, next)) {
            expect(next.tiles != d.tiles, "retried cavern repeats the next seed's map: " + tag);
        }
    }
    expect(retried > 0, "no seed needed a retry and then succeeded");
}

void test_density_conformance() {
    AreaTemplate area = templateWith(AreaTheme::Dungeon, LayoutAlgorithm::Bsp);
    area.monsterDensity = 0.5f;
    area.treasureDensity = 0.25f;
    area.trapDensity = 0.0f;

    double monsterSum = 0.0;
    double treasureSum = 0.0;
    int rooms = 0;
    for (uint32_t seed = 1; seed <= 200; ++seed) {
        DungeonMap d;
        if (!generateArea(seed, area, d)) continue;
        for (const Room& r : d.rooms) {
            if (r.isSpawn() || r.isBoss()) continue;
            monsterSum += static_cast<double>(r.monsters) * kTilesPerFeature / r.area();
            treasureSum += static_cast<double>(r.treasures) * kTilesPerFeature / r.area();
            expect(r.traps == 0, "trap density 0 should place no traps");
            rooms++;
        }
    }

    expect(rooms > 500, "density sample too small: " + std::to_string(rooms));
    if (rooms == 0) return;
    const double monsterMean = monsterSum / rooms;
    const double treasureMean = treasureSum / rooms;
    expect(std::fabs(monsterMean - 0.5) < 0.05, "monster density mean off: " + std::to_string(monsterMean));
    expect(std::fabs(treasureMean - 0.25) < 0.05, "treasure density mean off: " + std::to_string(treasureMean));
}

void test_jittered_count() {
    RandomSource rng(3u);
    for (int i = 0; i < 100; ++i) {
        expect(jitteredCount(0.0f, 40, rng) == 0, "density 0 should yield 0");
        expect(jitteredCount(1.0f, 32, rng) == 2, "whole expectation should be exact");
        const int n = jitteredCount(0.5f, 40, rng); // expected 1.25
        expect(n == 1 || n == 2, "jittered count should round the expectation up or down");
    }
}

void test_populator_room_roles() {
    DungeonMap d(30, 20);
    d.addRoom(1, 1, 5, 5);
    d.addRoom(10, 1, 6, 4);
    d.addRoom(20, 10, 5, 6);

    AreaTemplate area = templateForTheme(AreaTheme::Castle);
    area.monsterDensity = 1.0f;
    area.treasureDensity = 1.0f;
    area.trapDensity = 1.0f;

    RandomSource rng(17u);
    populateRooms(d, area, rng);

    expect(d.rooms[0].type == RoomType::Spawn, "first room should be spawn");
    expect(d.rooms[1].type == RoomType::Normal, "middle room should be normal");
    expect(d.rooms[2].type == RoomType::Boss, "last room should be boss");

    expect(d.rooms[0].monsters == 0 && d.rooms[0].treasures == 0 && d.rooms[0].traps == 0,
           "spawn room should start empty");
    expect(d.rooms[2].monsters >= kBossGuardsMin && d.rooms[2].monsters <= kBossGuardsMax,
           "boss guard count out of range");
    expect(d.rooms[2].treasures == 1, "boss room should hold one treasure");
    // 24 tiles at density 1.0: 1.5 expected.
    expect(d.rooms[1].monsters == 1 || d.rooms[1].monsters == 2, "normal room monster count");

    DungeonMap one(12, 12);
    one.addRoom(2, 2, 6, 6);
    populateRooms(one, area, rng);
    expect(one.rooms[0].type == RoomType::SpawnBoss, "single room should be spawn and boss");
    expect(one.rooms[0].isSpawn() && one.rooms[0].isBoss(), "SpawnBoss role helpers");
    expect(one.rooms[0].monsters >= kBossGuardsMin, "single room still gets boss guards");
}

void test_scenario_bsp_dungeon() {
    AreaTemplate area = templateForTheme(AreaTheme::Dungeon);
    area.algorithm = LayoutAlgorithm::Bsp;
    area.bsp.minLeafSize = 6;
    area.bsp.maxDepth = 4;
    area.width = 40;
    area.height = 40;

    DungeonMap d;
    GenerationReport rep;
    std::string err;
    const bool ok = generateArea(42u, area, d, &rep, &err);
    expect(ok, "BSP 40x40 seed 42 failed: " + err);
    if (!ok) return;

    expect(d.width == 40 && d.height == 40, "BSP map size");
    expect(d.seed == 42u, "map should record its seed");
    expect(d.rooms.size() >= 2u, "BSP map should have at least two rooms");
    expect(d.rooms.size() <= 16u, "depth 4 allows at most 16 leaves");
    expect(rep.bspLeaves == static_cast<int>(d.rooms.size()), "one room per BSP leaf");
    expect(d.corridors.size() + 1 == d.rooms.size(), "BSP joins subtrees with n-1 corridors");
    expect(rep.warnings.empty(), "BSP should not warn");
    expect(roomsConnected(d), "BSP rooms not connected");
    expect(!anyRoomsIntersect(d.rooms, area.bsp.padding), "BSP rooms violate padding");
    expect(floorWithinFootprints(d), "BSP floor outside rooms and corridors");

    for (const Room& r : d.rooms) {
        expect(r.w >= area.bsp.minRoomSize && r.h >= area.bsp.minRoomSize, "BSP room below min size");
    }
}

void test_scenario_cavern_empty_fill() {
    AreaTemplate area = templateForTheme(AreaTheme::Cave);
    area.algorithm = LayoutAlgorithm::CellularAutomata;
    area.cavern.fillProbability = 0.0f;

    DungeonMap out(9, 9);
    out.seed = 777u;
    out.addRoom(1, 1, 2, 2);

    GenerationReport rep;
    std::string err;
    const bool ok = generateArea(5u, area, out, &rep, &err);
    expect(!ok, "empty cavern should fail");
    expect(rep.failure == GenFailure::DisconnectedMap, "empty cavern failure kind");
    expect(rep.attempts == area.cavern.maxRetries + 1, "cavern should use every retry");
    expect(!err.empty(), "cavern failure should explain itself");
    expect(out.width == 9 && out.seed == 777u && out.rooms.size() == 1u, "failed call must not touch out");
}

void test_scenario_scatter_crowded() {
    AreaTemplate area = templateForTheme(AreaTheme::Forest);
    area.algorithm = LayoutAlgorithm::SimpleRandom;
    area.width = 10;
    area.height = 10;
    area.scatter.targetRooms = 50;
    area.scatter.padding = 2;

    DungeonMap d;
    GenerationReport rep;
    std::string err;
    const bool ok = generateArea(7u, area, d, &rep, &err);
    expect(ok, "crowded scatter should still succeed: " + err);
    if (!ok) return;

    expect(rep.hasWarning(GenWarningKind::PartialGeneration), "crowded scatter should warn");
    expect(rep.roomsRequested == 50, "scatter should record the request");
    expect(!d.rooms.empty(), "crowded scatter should place at least one room");
    expect(d.rooms.size() < 50u, "50 rooms cannot fit on 10x10");
    expect(!anyRoomsIntersect(d.rooms, 2), "crowded scatter rooms violate padding");
    expect(roomsConnected(d), "crowded scatter rooms not connected");
}

void test_invalid_parameters() {
    struct Case {
        const char* what;
        AreaTemplate area;
    };
    std::vector<Case> cases;

    AreaTemplate base = templateForTheme(AreaTheme::Dungeon);

    { AreaTemplate a = base; a.width = 4; cases.push_back({ "tiny width", a }); }
    { AreaTemplate a = base; a.height = 5000; cases.push_back({ "huge height", a }); }
    { AreaTemplate a = base; a.monsterDensity = -0.1f; cases.push_back({ "negative density", a }); }
    { AreaTemplate a = base; a.trapDensity = 1.5f; cases.push_back({ "density above 1", a }); }
    { AreaTemplate a = base; a.treasureDensity = std::nanf(""); cases.push_back({ "NaN density", a }); }
    { AreaTemplate a = base; a.recommendedLevel = 0; cases.push_back({ "level 0", a }); }
    { AreaTemplate a = base; a.bsp.minLeafSize = 3; cases.push_back({ "leaf smaller than room", a }); }
    { AreaTemplate a = base; a.bsp.maxDepth = -1; cases.push_back({ "negative depth", a }); }
    { AreaTemplate a = base; a.bsp.minLeafSize = 20; a.width = 16; cases.push_back({ "map smaller than leaf", a }); }
    {
        AreaTemplate a = base;
        a.algorithm = LayoutAlgorithm::CellularAutomata;
        a.cavern.birthThreshold = 9;
        cases.push_back({ "birth threshold 9", a });
    }
    {
        AreaTemplate a = base;
        a.algorithm = LayoutAlgorithm::CellularAutomata;
        a.cavern.fillProbability = 2.0f;
        cases.push_back({ "fill above 1", a });
    }
    {
        AreaTemplate a = base;
        a.algorithm = LayoutAlgorithm::SimpleRandom;
        a.scatter.targetRooms = 0;
        cases.push_back({ "zero target rooms", a });
    }
    {
        AreaTemplate a = base;
        a.algorithm = LayoutAlgorithm::SimpleRandom;
        a.scatter.minRoomSize = 5;
        a.scatter.maxRoomSize = 4;
        cases.push_back({ "max room below min", a });
    }
    {
        AreaTemplate a = base;
        a.algorithm = LayoutAlgorithm::SimpleRandom;
        a.width = 8;
        a.scatter.minRoomSize = 7;
        cases.push_back({ "room wider than map", a });
    }

    for (const Case& c : cases) {
        DungeonMap out;
        GenerationReport rep;
        std::string err;
        expect(!validateTemplate(c.area), std::string("validateTemplate accepted ") + c.what);
        expect(!generateArea(1u, c.area, out, &rep, &err), std::string("generateArea accepted ") + c.what);
        expect(rep.failure == GenFailure::InvalidParameter, std::string("wrong failure kind for ") + c.what);
        expect(!err.empty(), std::string("no message for ") + c.what);
        expect(out.tiles.empty(), std::string("out touched for ") + c.what);
    }

    // Unrelated algorithm parameters are not checked.
    AreaTemplate a = base;
    a.algorithm = LayoutAlgorithm::Bsp;
    a.cavern.birthThreshold = 99;
    expect(validateTemplate(a), "cavern params should not block a BSP template");
}

void test_bsp_generation_timeout() {
    AreaTemplate area = templateForTheme(AreaTheme::Dungeon);
    area.algorithm = LayoutAlgorithm::Bsp;
    area.bsp.maxDepth = 0;
    area.bsp.minRooms = 3;

    DungeonMap out;
    GenerationReport rep;
    std::string err;
    expect(!generateArea(1u, area, out, &rep, &err), "depth 0 cannot reach 3 rooms");
    expect(rep.failure == GenFailure::GenerationTimeout, "depth bound should report GenerationTimeout");
    expect(std::string(genFailureName(rep.failure)) == "GenerationTimeout", "failure name");
    expect(out.rooms.empty(), "failed call must not touch out");

    area.bsp.minRooms = 1;
    expect(generateArea(1u, area, out, &rep, &err), "depth 0 with one required room should succeed");
    expect(out.rooms.size() == 1u && out.rooms[0].type == RoomType::SpawnBoss, "lone BSP room is spawn and boss");
}

void test_encounters_and_quests() {
    AreaTemplate area = templateForTheme(AreaTheme::Ruins);
    DungeonMap d;
    if (!generateArea(21u, area, d)) {
        expect(false, "ruins generation failed");
        return;
    }

    const DungeonMap before = d;
    const auto e1 = deriveEncounters(d);
    const auto e2 = deriveEncounters(d);
    expect(sameLayout(before, d), "deriveEncounters must not modify the map");
    expect(e1.size() == e2.size(), "encounters not deterministic");
    for (size_t i = 0; i < e1.size() && i < e2.size(); ++i) {
        expect(e1[i].roomId == e2[i].roomId && e1[i].type == e2[i].type && e1[i].difficulty == e2[i].difficulty,
               "encounter mismatch at " + std::to_string(i));
    }

    size_t withMonsters = 0;
    for (const Room& r : d.rooms) if (r.monsters > 0) withMonsters++;
    expect(e1.size() == withMonsters, "one encounter per occupied room");

    const Room& boss = d.rooms.back();
    const Encounter be = encounterForRoom(d, boss);
    expect(be.type == EncounterType::BossRoom, "boss room encounter type");
    expect(std::string(encounterTypeName(be.type)) == "boss_room", "encounter type name");

    DungeonMap harder = d;
    harder.area.recommendedLevel = d.area.recommendedLevel * 3;
    const Encounter hb = encounterForRoom(harder, harder.rooms.back());
    expect(std::fabs(hb.difficulty - be.difficulty * 3.0f) < 1e-3f, "difficulty should scale with level");

    expect(describeRoom(d, boss) == describeRoom(d, boss), "room text not deterministic");
    expect(describeRoom(d, boss).find("lair") != std::string::npos, "boss room text should mention its lair");
    expect(describeArea(d).find(themeInfo(AreaTheme::Ruins).displayName) != std::string::npos,
           "area text should name the theme");

    const QuestHook q = deriveQuest(d);
    expect(!q.title.empty() && q.title.find('{') == std::string::npos, "quest template not filled");
    expect(q.difficulty >= 1 && q.difficulty <= 10, "quest difficulty out of range");
    expect(q.reward == q.difficulty * 100, "quest reward should be difficulty * 100");
    expect(q.location == themeInfo(AreaTheme::Ruins).displayName, "quest location");
}

void test_theme_catalog() {
    expect(allThemes().size() == 8u, "catalog should list 8 themes");
    for (AreaTheme t : allThemes()) {
        const ThemeInfo& info = themeInfo(t);
        expect(info.theme == t, "themeInfo order mismatch");

        AreaTheme parsed = AreaTheme::Dungeon;
        expect(parseAreaTheme(info.id, parsed) && parsed == t, std::string("theme id round trip: ") + info.id);
        expect(parseAreaTheme(info.displayName, parsed) && parsed == t,
               std::string("theme display name: ") + info.displayName);

        const AreaTemplate a = templateForTheme(t);
        expect(a.theme == t && a.algorithm == info.algorithm, "templateForTheme copies layout preference");
        expect(validateTemplate(a), std::string("catalog template invalid: ") + info.id);
    }

    AreaTheme t = AreaTheme::Dungeon;
    expect(parseAreaTheme("  Underground City ", t) && t == AreaTheme::UndergroundCity, "display name with spaces");
    expect(!parseAreaTheme("moon_base", t), "unknown theme accepted");
    expect(templateForTheme(AreaTheme::Cave).algorithm == LayoutAlgorithm::CellularAutomata, "caves use cellular");
    expect(templateForTheme(AreaTheme::Forest).algorithm == LayoutAlgorithm::SimpleRandom, "forests scatter rooms");

    LayoutAlgorithm la = LayoutAlgorithm::Bsp;
    expect(parseLayoutAlgorithm("cellular", la) && la == LayoutAlgorithm::CellularAutomata, "parse cellular");
    expect(parseLayoutAlgorithm(layoutAlgorithmId(LayoutAlgorithm::SimpleRandom), la) &&
           la == LayoutAlgorithm::SimpleRandom, "algorithm id round trip");
    expect(!parseLayoutAlgorithm("wfc", la), "unknown algorithm accepted");
}

void test_template_ini_load() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "delvegen_test_template.ini";

    {
        std::ofstream f(path);
        f << "\xEF\xBB\xBF# test template\n";
        f << "width = 60 ; wide\n";
        f << "theme = cave\n";
        f << "bogus = 1\n";
        f << "monster_density = 0.25\n";
        f << "bsp.max_depth = abc\n";
        f << "no equals here\n";
        f << "Cavern.Max_Rooms = 6\n";
        f << "name = Echoing Deep\n";
    }

    AreaTemplate area = templateForTheme(AreaTheme::Castle);
    std::string warns;
    expect(loadTemplateIni(path.string(), area, &warns), "template load failed");

    expect(area.theme == AreaTheme::Cave, "theme key applied");
    expect(area.algorithm == LayoutAlgorithm::CellularAutomata, "theme resets the algorithm");
    expect(area.width == 60, "width applied even before the theme line");
    expect(std::fabs(area.monsterDensity - 0.25f) < 1e-6f, "monster_density applied");
    expect(std::fabs(area.treasureDensity - themeInfo(AreaTheme::Cave).treasureDensity) < 1e-6f,
           "unlisted density comes from the theme");
    expect(area.cavern.maxRooms == 6, "keys are case-insensitive");
    expect(area.name == "Echoing Deep", "name applied");
    expect(area.bsp.maxDepth == BspParams{}.maxDepth, "bad value should leave the field alone");

    expect(warns.find("Line 4: Unknown key: bogus") != std::string::npos, "unknown key warning");
    expect(warns.find("Line 6:") != std::string::npos, "bad int warning");
    expect(warns.find("Line 7: Expected key=value") != std::string::npos, "missing '=' warning");

    AreaTemplate untouched = templateForTheme(AreaTheme::Temple);
    std::string missingWarn;
    expect(!loadTemplateIni((path.string() + ".missing"), untouched, &missingWarn), "missing file should fail");
    expect(!missingWarn.empty(), "missing file should explain itself");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_template_ini_default_roundtrip() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "delvegen_test_default.ini";

    expect(writeDefaultTemplateIni(path.string()), "writeDefaultTemplateIni failed");

    AreaTemplate area = templateForTheme(AreaTheme::Sewers);
    area.width = 99;
    std::string warns;
    expect(loadTemplateIni(path.string(), area, &warns), "default template load failed");
    expect(warns.empty(), "default template should load cleanly: " + warns);

    const AreaTemplate want = templateForTheme(AreaTheme::Dungeon);
    expect(area.theme == want.theme && area.algorithm == want.algorithm, "default theme/algorithm");
    expect(area.width == want.width && area.height == want.height, "default size");
    expect(area.name == want.name, "default name");
    expect(std::fabs(area.monsterDensity - want.monsterDensity) < 1e-6f, "default monster density");
    expect(area.bsp.minLeafSize == want.bsp.minLeafSize && area.scatter.padding == want.scatter.padding,
           "default layout params");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_json_and_ascii_export() {
    AreaTemplate area = templateForTheme(AreaTheme::Dungeon);
    area.width = 24;
    area.height = 16;
    area.name = "Vault \"B\"";

    DungeonMap d;
    std::string err;
    if (!generateArea(42u, area, d, nullptr, &err)) {
        expect(false, "export map generation failed: " + err);
        return;
    }

    const std::string json = dungeonMapToJson(d);
    for (const char* key : { "\"width\": 24", "\"height\": 16", "\"tiles\": [", "\"rooms\": [",
                             "\"corridors\": [", "\"room_a\": ", "\"path\": [[", "\"seed\": 42",
                             "\"template\": {", "\"theme\": \"dungeon\"", "\"algorithm\": \"bsp\"",
                             "\"monster_density\": ", "\"recommended_level\": ", "\"type\": \"spawn\"",
                             "\"type\": \"boss\"", "\"wall\"", "\"floor\"" }) {
        expect(json.find(key) != std::string::npos, std::string("JSON missing ") + key);
    }
    expect(json.find("Vault \\\"B\\\"") != std::string::npos, "JSON should escape the name");

    size_t tileTags = 0;
    for (size_t pos = json.find("\"wall\""); pos != std::string::npos; pos = json.find("\"wall\"", pos + 1)) tileTags++;
    for (size_t pos = json.find("\"floor\""); pos != std::string::npos; pos = json.find("\"floor\"", pos + 1)) tileTags++;
    expect(tileTags == static_cast<size_t>(24 * 16), "JSON should carry one tag per tile");

    const std::string ascii = renderAscii(d);
    size_t lines = 0;
    size_t lineLen = 0;
    bool uniform = true;
    for (char c : ascii) {
        if (c == '\n') {
            uniform = uniform && lineLen == 24u;
            lines++;
            lineLen = 0;
        } else {
            lineLen++;
        }
    }
    expect(lines == 16u && uniform, "ASCII should be one 24-char line per row");
    expect(ascii.find('S') != std::string::npos && ascii.find('B') != std::string::npos, "ASCII should mark spawn and boss");

    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "delvegen_test_map.json";
    expect(writeDungeonMapJson(path, d, &err), "writeDungeonMapJson failed: " + err);
    std::ifstream in(path);
    std::string first;
    std::getline(in, first);
    expect(first == "{", "JSON file should start with an object");
    in.close();
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

int main() {
    std::cout << "Running DelveGen tests...\n";

    test_rng_reproducible();
    test_rng_zero_seed_and_helpers();
    test_room_intersection_padding();
    test_tile_access_bounds();
    test_l_shaped_path();

    test_generation_deterministic();
    test_seed_sensitivity();
    test_layout_invariants();
    test_cavern_single_region();
    test_cavern_region_tie_break();
    test_cavern_retry_stream();
    test_density_conformance();
    test_jittered_count();
    test_populator_room_roles();

    test_scenario_bsp_dungeon();
    test_scenario_cavern_empty_fill();
    test_scenario_scatter_crowded();
    test_invalid_parameters();
    test_bsp_generation_timeout();

    test_encounters_and_quests();
    test_theme_catalog();
    test_template_ini_load();
    test_template_ini_default_roundtrip();
    test_json_and_ascii_export();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
