#include "corridor_router.hpp"

#include <vector>

std::vector<Vec2i> lShapedPath(Vec2i from, Vec2i to, CorridorLeg first) {
    std::vector<Vec2i> path;
    path.reserve(static_cast<size_t>(manhattan(from, to) + 1));

    Vec2i p = from;
    path.push_back(p);

    auto walkX = [&]() {
        const int step = sign(to.x - p.x);
        while (p.x != to.x) {
            p.x += step;
            path.push_back(p);
        }
    };
    auto walkY = [&]() {
        const int step = sign(to.y - p.y);
        while (p.y != to.y) {
            p.y += step;
            path.push_back(p);
        }
    };

    if (first == CorridorLeg::Horizontal) {
        walkX();
        walkY();
    } else {
        walkY();
        walkX();
    }
    return path;
}

Corridor connectRooms(DungeonMap& d, const Room& a, const Room& b, RandomSource& rng) {
    static const std::vector<CorridorLeg> kLegs = { CorridorLeg::Horizontal, CorridorLeg::Vertical };

    Corridor c;
    c.roomA = a.id;
    c.roomB = b.id;
    c.path = lShapedPath(a.center(), b.center(), rng.choice(kLegs));
    d.carveCorridor(c);
    return c;
}
