#include "layout.hpp"
#include "corridor_router.hpp"

#include <algorithm>
#include <sstream>

bool generateScatterLayout(DungeonMap& d, RandomSource& rng, const ScatterParams& p,
                           GenerationReport& report, std::string* err) {
    (void)err; // this layout degrades instead of failing

    d.fillWalls();
    report.roomsRequested = p.targetRooms;

    // Keep a one-tile wall border around the map.
    const int maxW = std::min(scatterMaxRoomSize(p, d.width, d.height), d.width - 2);
    const int maxH = std::min(scatterMaxRoomSize(p, d.width, d.height), d.height - 2);
    const int maxAttempts = p.targetRooms * p.attemptsPerRoom;

    int attempts = 0;
    while (static_cast<int>(d.rooms.size()) < p.targetRooms && attempts < maxAttempts) {
        attempts++;

        Room cand;
        cand.w = rng.range(p.minRoomSize, maxW);
        cand.h = rng.range(p.minRoomSize, maxH);
        cand.x = rng.range(1, d.width - cand.w - 1);
        cand.y = rng.range(1, d.height - cand.h - 1);

        bool blocked = false;
        for (const Room& r : d.rooms) {
            if (cand.intersects(r, p.padding)) {
                blocked = true;
                break;
            }
        }
        if (blocked) continue;

        const Room placed = d.addRoom(cand.x, cand.y, cand.w, cand.h);
        if (placed.id > 0) {
            const Room prev = d.rooms[static_cast<size_t>(placed.id - 1)];
            d.corridors.push_back(connectRooms(d, prev, placed, rng));
        }
    }

    if (static_cast<int>(d.rooms.size()) < p.targetRooms) {
        std::ostringstream ss;
        ss << "Placed " << d.rooms.size() << " of " << p.targetRooms << " rooms after "
           << attempts << " attempts";
        report.warnings.push_back({ GenWarningKind::PartialGeneration, ss.str() });
    }
    return true;
}
