#pragma once

#include "dungeon_map.hpp"
#include "rng.hpp"

#include <cstdint>

enum class CorridorLeg : uint8_t {
    Horizontal = 0,
    Vertical,
};

// Walks an L-shaped path from `from` to `to`: the first leg runs along
// `first`, the second along the other axis. Both endpoints are included.
std::vector<Vec2i> lShapedPath(Vec2i from, Vec2i to, CorridorLeg first);

// Joins the centers of rooms `a` and `b` with a single-bend corridor, carves
// it into `d` and returns it. The bend order is drawn from `rng`.
//
// No obstacle avoidance: a corridor crossing a third room just runs over its
// floor, which is harmless for connectivity.
Corridor connectRooms(DungeonMap& d, const Room& a, const Room& b, RandomSource& rng);
