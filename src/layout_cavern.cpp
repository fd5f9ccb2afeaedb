#include "layout.hpp"

#include <algorithm>
#include <deque>
#include <sstream>
#include <vector>

namespace {

void fillNoise(DungeonMap& d, RandomSource& rng, float floorChance) {
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            d.at(x, y) = rng.chance(floorChance) ? TileType::Floor : TileType::Wall;
        }
    }
}

// Out-of-bounds neighbours count as wall.
int floorCount8(const DungeonMap& d, int x, int y) {
    int c = 0;
    for (int oy = -1; oy <= 1; ++oy) {
        for (int ox = -1; ox <= 1; ++ox) {
            if (ox == 0 && oy == 0) continue;
            if (d.isFloor(x + ox, y + oy)) c++;
        }
    }
    return c;
}

void smooth(DungeonMap& d, int iterations, int birthThreshold) {
    std::vector<TileType> next(d.tiles.size(), TileType::Wall);
    auto idx = [&](int x, int y) { return static_cast<size_t>(y * d.width + x); };

    for (int it = 0; it < iterations; ++it) {
        for (int y = 0; y < d.height; ++y) {
            for (int x = 0; x < d.width; ++x) {
                next[idx(x, y)] = (floorCount8(d, x, y) >= birthThreshold) ? TileType::Floor : TileType::Wall;
            }
        }
        d.tiles.swap(next);
    }
}

} // namespace

int keepLargestRegion(DungeonMap& d) {
    std::vector<int> comp(d.tiles.size(), -1);
    std::vector<int> compSize;
    compSize.reserve(64);

    auto idx = [&](int x, int y) { return static_cast<size_t>(y * d.width + x); };
    const int dirs[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};

    int compIdx = 0;
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (d.at(x, y) != TileType::Floor) continue;
            const size_t ii = idx(x, y);
            if (comp[ii] != -1) continue;

            int count = 0;
            std::deque<Vec2i> q;
            q.push_back({x, y});
            comp[ii] = compIdx;
            while (!q.empty()) {
                const Vec2i p = q.front();
                q.pop_front();
                count++;
                for (auto& dv : dirs) {
                    const int nx = p.x + dv[0];
                    const int ny = p.y + dv[1];
                    if (!d.isFloor(nx, ny)) continue;
                    const size_t jj = idx(nx, ny);
                    if (comp[jj] != -1) continue;
                    comp[jj] = compIdx;
                    q.push_back({nx, ny});
                }
            }
            compSize.push_back(count);
            compIdx++;
        }
    }

    if (compSize.empty()) return 0;

    int bestComp = 0;
    for (int i = 1; i < static_cast<int>(compSize.size()); ++i) {
        if (compSize[static_cast<size_t>(i)] > compSize[static_cast<size_t>(bestComp)]) bestComp = i;
    }

    for (size_t i = 0; i < d.tiles.size(); ++i) {
        if (d.tiles[i] == TileType::Floor && comp[i] != bestComp) d.tiles[i] = TileType::Wall;
    }
    return compSize[static_cast<size_t>(bestComp)];
}

namespace {

// Chebyshev distance from each floor tile to the nearest wall or map edge
// (multi-source BFS). Walls are 0; floor on the map border is 1.
std::vector<int> clearanceMap(const DungeonMap& d) {
    std::vector<int> dist(d.tiles.size(), -1);
    auto idx = [&](int x, int y) { return static_cast<size_t>(y * d.width + x); };

    std::deque<Vec2i> q;
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (d.at(x, y) != TileType::Floor) {
                dist[idx(x, y)] = 0;
                q.push_back({x, y});
            }
        }
    }
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            const bool border = x == 0 || y == 0 || x == d.width - 1 || y == d.height - 1;
            if (border && dist[idx(x, y)] < 0) {
                dist[idx(x, y)] = 1;
                q.push_back({x, y});
            }
        }
    }

    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop_front();
        const int cd = dist[idx(p.x, p.y)];
        for (int oy = -1; oy <= 1; ++oy) {
            for (int ox = -1; ox <= 1; ++ox) {
                if (ox == 0 && oy == 0) continue;
                const int nx = p.x + ox;
                const int ny = p.y + oy;
                if (!d.inBounds(nx, ny)) continue;
                const size_t ii = idx(nx, ny);
                if (dist[ii] >= 0) continue;
                dist[ii] = cd + 1;
                q.push_back({nx, ny});
            }
        }
    }
    return dist;
}

struct Seed {
    int x = 0;
    int y = 0;
    int clearance = 0;
};

// Rooms in a cave are logical: rectangles grown from the most open spots of
// the kept region. They never carve anything new.
void growLogicalRooms(DungeonMap& d, const CavernParams& p) {
    const auto clear = clearanceMap(d);
    auto idx = [&](int x, int y) { return static_cast<size_t>(y * d.width + x); };

    std::vector<Seed> seeds;
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (d.at(x, y) != TileType::Floor) continue;
            const int c = clear[idx(x, y)];
            bool isMax = true;
            for (int oy = -1; oy <= 1 && isMax; ++oy) {
                for (int ox = -1; ox <= 1; ++ox) {
                    if (ox == 0 && oy == 0) continue;
                    if (!d.isFloor(x + ox, y + oy)) continue;
                    if (clear[idx(x + ox, y + oy)] > c) {
                        isMax = false;
                        break;
                    }
                }
            }
            if (isMax) seeds.push_back({x, y, c});
        }
    }

    std::stable_sort(seeds.begin(), seeds.end(), [](const Seed& a, const Seed& b) {
        if (a.clearance != b.clearance) return a.clearance > b.clearance;
        if (a.y != b.y) return a.y < b.y;
        return a.x < b.x;
    });

    std::vector<uint8_t> claimed(d.tiles.size(), 0);
    auto isFree = [&](int x, int y) {
        return d.isFloor(x, y) && claimed[idx(x, y)] == 0;
    };
    auto rowFree = [&](int y, int x0, int x1) {
        for (int x = x0; x <= x1; ++x) if (!isFree(x, y)) return false;
        return true;
    };
    auto colFree = [&](int x, int y0, int y1) {
        for (int y = y0; y <= y1; ++y) if (!isFree(x, y)) return false;
        return true;
    };

    for (const Seed& s : seeds) {
        if (static_cast<int>(d.rooms.size()) >= p.maxRooms) break;
        if (!isFree(s.x, s.y)) continue;

        const int maxSpan = 2 * s.clearance + 1;
        int x0 = s.x, x1 = s.x, y0 = s.y, y1 = s.y;

        bool grew = true;
        while (grew) {
            grew = false;
            if (x1 - x0 + 1 < maxSpan && colFree(x1 + 1, y0, y1)) { x1++; grew = true; }
            if (y1 - y0 + 1 < maxSpan && rowFree(y1 + 1, x0, x1)) { y1++; grew = true; }
            if (x1 - x0 + 1 < maxSpan && colFree(x0 - 1, y0, y1)) { x0--; grew = true; }
            if (y1 - y0 + 1 < maxSpan && rowFree(y0 - 1, x0, x1)) { y0--; grew = true; }
        }

        const int w = x1 - x0 + 1;
        const int h = y1 - y0 + 1;
        if (w < p.minRoomSize || h < p.minRoomSize) continue;

        d.addRoom(x0, y0, w, h);

        for (int y = y0 - p.roomPadding; y <= y1 + p.roomPadding; ++y) {
            for (int x = x0 - p.roomPadding; x <= x1 + p.roomPadding; ++x) {
                if (d.inBounds(x, y)) claimed[idx(x, y)] = 1;
            }
        }
    }

    if (!d.rooms.empty()) return;

    // Region too thin for any rectangle: its first tile stands in as the room.
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (d.at(x, y) == TileType::Floor) {
                d.addRoom(x, y, 1, 1);
                return;
            }
        }
    }
}

} // namespace

bool generateCavernLayout(DungeonMap& d, RandomSource& rng, const CavernParams& p,
                          GenerationReport& report, std::string* err) {
    const int minArea = cavernMinPlayableArea(p, d.width, d.height);
    const uint32_t baseSeed = rng.seed();

    int bestKept = 0;
    for (int attempt = 0; attempt <= p.maxRetries; ++attempt) {
        // Retries draw from a stream keyed on (seed, attempt), never from
        // another seed's first attempt.
        if (attempt > 0) rng.reseed(hashCombine(baseSeed, tag32("CAVERN"), static_cast<uint32_t>(attempt)));
        report.attempts = attempt + 1;

        d.fillWalls();
        fillNoise(d, rng, p.fillProbability);
        smooth(d, p.smoothingIterations, p.birthThreshold);

        const int kept = keepLargestRegion(d);
        bestKept = std::max(bestKept, kept);
        if (kept > 0 && kept >= minArea) {
            growLogicalRooms(d, p);
            return true;
        }
    }

    report.failure = GenFailure::DisconnectedMap;
    if (err) {
        std::ostringstream ss;
        ss << "Cavern never reached " << minArea << " connected floor tiles in "
           << (p.maxRetries + 1) << " attempt(s) (best " << bestKept << ")";
        *err = ss.str();
    }
    return false;
}
