#include "layout.hpp"
#include "corridor_router.hpp"

#include <limits>
#include <sstream>
#include <vector>

namespace {

struct Leaf {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    int depth = 0;
};

struct BspContext {
    DungeonMap& d;
    RandomSource& rng;
    const BspParams& p;
    int margin = 1;
    int leaves = 0;
};

// Returns the split offset (in tiles) or -1 if the leaf is too small.
int splitLeaf(const Leaf& n, bool splitH, RandomSource& rng, int minLeaf) {
    if (splitH) {
        if (n.h < minLeaf * 2) return -1;
        return rng.range(minLeaf, n.h - minLeaf);
    }
    if (n.w < minLeaf * 2) return -1;
    return rng.range(minLeaf, n.w - minLeaf);
}

int placeRoomInLeaf(BspContext& ctx, const Leaf& n) {
    const int m = ctx.margin;
    const int maxW = n.w - 2 * m;
    const int maxH = n.h - 2 * m;

    const int rw = ctx.rng.range(ctx.p.minRoomSize, maxW);
    const int rh = ctx.rng.range(ctx.p.minRoomSize, maxH);
    const int rx = ctx.rng.range(n.x + m, n.x + n.w - m - rw);
    const int ry = ctx.rng.range(n.y + m, n.y + n.h - m - rh);

    return ctx.d.addRoom(rx, ry, rw, rh).id;
}

// Closest pair of room centers across the two subtrees. The first pair found
// wins ties so the result only depends on room order.
void connectSubtrees(BspContext& ctx, const std::vector<int>& left, const std::vector<int>& right) {
    int bestA = -1;
    int bestB = -1;
    int bestDist = std::numeric_limits<int>::max();

    for (int a : left) {
        const Vec2i ca = ctx.d.rooms[static_cast<size_t>(a)].center();
        for (int b : right) {
            const int dd = dist2(ca, ctx.d.rooms[static_cast<size_t>(b)].center());
            if (dd < bestDist) {
                bestDist = dd;
                bestA = a;
                bestB = b;
            }
        }
    }
    if (bestA < 0 || bestB < 0) return;

    const Room ra = ctx.d.rooms[static_cast<size_t>(bestA)];
    const Room rb = ctx.d.rooms[static_cast<size_t>(bestB)];
    ctx.d.corridors.push_back(connectRooms(ctx.d, ra, rb, ctx.rng));
}

// Partitions `n`, places rooms in its leaves (left subtree first) and joins the
// two halves on the way back up. Returns the room ids inside `n`.
std::vector<int> partition(BspContext& ctx, const Leaf& n) {
    const int minLeaf = ctx.p.minLeafSize;
    const bool canH = n.h >= minLeaf * 2;
    const bool canV = n.w >= minLeaf * 2;

    if (n.depth >= ctx.p.maxDepth || (!canH && !canV)) {
        ctx.leaves++;
        return { placeRoomInLeaf(ctx, n) };
    }

    // Cut across the longer dimension so leaves stay roughly square.
    bool splitH;
    if (n.w > n.h) splitH = false;
    else if (n.h > n.w) splitH = true;
    else splitH = ctx.rng.chance(0.5);

    if (splitH && !canH) splitH = false;
    else if (!splitH && !canV) splitH = true;

    const int split = splitLeaf(n, splitH, ctx.rng, minLeaf);

    Leaf a = n;
    Leaf b = n;
    a.depth = n.depth + 1;
    b.depth = n.depth + 1;
    if (splitH) {
        a.h = split;
        b.y = n.y + split;
        b.h = n.h - split;
    } else {
        a.w = split;
        b.x = n.x + split;
        b.w = n.w - split;
    }

    std::vector<int> left = partition(ctx, a);
    std::vector<int> right = partition(ctx, b);
    connectSubtrees(ctx, left, right);

    left.insert(left.end(), right.begin(), right.end());
    return left;
}

} // namespace

bool generateBspLayout(DungeonMap& d, RandomSource& rng, const BspParams& p,
                       GenerationReport& report, std::string* err) {
    d.fillWalls();

    BspContext ctx{ d, rng, p, bspLeafMargin(p.padding), 0 };

    Leaf root;
    root.x = 0;
    root.y = 0;
    root.w = d.width;
    root.h = d.height;
    partition(ctx, root);

    report.bspLeaves = ctx.leaves;

    if (static_cast<int>(d.rooms.size()) < p.minRooms) {
        report.failure = GenFailure::GenerationTimeout;
        if (err) {
            std::ostringstream ss;
            ss << "BSP stopped at depth " << p.maxDepth << " with " << d.rooms.size()
               << " room(s); at least " << p.minRooms << " required";
            *err = ss.str();
        }
        return false;
    }
    return true;
}
