#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

// Compile-time tag hashing (FNV-1a) for readable domain separation.
// Derived (non-RNG) content such as room descriptions salts its hashes with
// these tags so adding a new consumer never shifts existing outputs.
//
// Example:
//   uint32_t s = hashCombine(map.seed, tag32("ROOMDESC"));
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

template <std::size_t N>
constexpr uint32_t tag32(const char (&str)[N]) {
    // N includes the null terminator for string literals.
    return fnv1a32(str, (N > 0) ? (N - 1) : 0);
}

// Seeded random source for layout generation.
//
// xorshift32 with integer-only reductions, so a given seed and call order
// yields the same stream on every platform and compiler. There is no shared
// instance: every generator receives the source it should draw from.
// Not cryptographically secure.
class RandomSource {
public:
    // xorshift32 has a fixed point at zero; seed 0 is remapped.
    static constexpr uint32_t kZeroSeedState = 0x12345678u;

    explicit RandomSource(uint32_t seed = 0u) { reseed(seed); }

    void reseed(uint32_t seed) {
        seed_ = seed;
        state_ = seed ? seed : kZeroSeedState;
    }

    uint32_t seed() const { return seed_; }
    uint32_t state() const { return state_; }

    uint32_t nextU32() {
        uint32_t x = state_;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state_ = x;
        return x;
    }

    // Uniform integer in [lo, hiInclusive]. Degenerate ranges return lo
    // without consuming a draw.
    int nextInt(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        const uint32_t span = static_cast<uint32_t>(static_cast<int64_t>(hiInclusive) - lo + 1);
        return static_cast<int>(static_cast<int64_t>(lo) + static_cast<int64_t>(nextU32() % span));
    }

    // Shorthand used throughout the layout code.
    int range(int lo, int hiInclusive) { return nextInt(lo, hiInclusive); }

    // [0,1). Divided in double precision so the top draw stays below 1.
    double nextFloat() {
        return static_cast<double>(nextU32()) / 4294967296.0;
    }

    bool chance(double p) {
        return nextFloat() < p;
    }

    template <typename T>
    const T& choice(const std::vector<T>& items) {
        return items[static_cast<std::size_t>(nextInt(0, static_cast<int>(items.size()) - 1))];
    }

    // Fisher-Yates, walking from the back.
    template <typename T>
    void shuffle(std::vector<T>& items) {
        for (int i = static_cast<int>(items.size()) - 1; i > 0; --i) {
            const int j = nextInt(0, i);
            std::swap(items[static_cast<std::size_t>(i)], items[static_cast<std::size_t>(j)]);
        }
    }

private:
    uint32_t seed_ = 0u;
    uint32_t state_ = kZeroSeedState;
};

// A tiny integer hash for stable variation.
inline uint32_t hash32(uint32_t x) {
    // Thomas Wang-ish mix
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

inline uint32_t hashCombine(uint32_t a, uint32_t b, uint32_t c) {
    return hashCombine(hashCombine(a, b), c);
}

// Convert a 32-bit integer hash into a stable value in [0, 1).
inline double rand01(uint32_t h) {
    return static_cast<double>(h) / 4294967296.0;
}
