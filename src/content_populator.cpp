#include "content_populator.hpp"

#include <algorithm>
#include <cmath>

int jitteredCount(float density, int area, RandomSource& rng) {
    const double expected = static_cast<double>(density) * static_cast<double>(area) / kTilesPerFeature;
    if (!(expected > 0.0)) return 0;

    const double whole = std::floor(expected);
    const double frac = expected - whole;
    int n = static_cast<int>(whole);
    if (frac > 0.0 && rng.chance(frac)) n++;
    return std::max(0, n);
}

void populateRooms(DungeonMap& d, const AreaTemplate& area, RandomSource& rng) {
    if (d.rooms.empty()) return;

    const size_t last = d.rooms.size() - 1;
    for (size_t i = 0; i < d.rooms.size(); ++i) {
        Room& r = d.rooms[i];
        r.monsters = 0;
        r.treasures = 0;
        r.traps = 0;

        if (i == 0 && i == last) r.type = RoomType::SpawnBoss;
        else if (i == 0) r.type = RoomType::Spawn;
        else if (i == last) r.type = RoomType::Boss;
        else r.type = RoomType::Normal;
    }

    for (Room& r : d.rooms) {
        if (r.isBoss()) {
            // Guards and one hoard regardless of theme density.
            r.monsters = rng.range(kBossGuardsMin, kBossGuardsMax);
            r.treasures = 1;
            continue;
        }
        // Spawn rooms start empty.
        if (r.isSpawn()) continue;

        const int a = r.area();
        r.monsters = jitteredCount(area.monsterDensity, a, rng);
        r.treasures = jitteredCount(area.treasureDensity, a, rng);
        r.traps = jitteredCount(area.trapDensity, a, rng);
    }
}
