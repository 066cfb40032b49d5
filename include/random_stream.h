#pragma once

#include <cstdint>
#include <optional>
#include <random>

// Explicit random stream handle. Every operation that samples noise takes a
// RandomEngine& so callers decide whether a run is reproducible.
using RandomEngine = std::mt19937_64;

// Seeded when a seed is given, otherwise seeded from std::random_device
inline RandomEngine makeEngine(std::optional<uint64_t> seed = std::nullopt) {
    if (seed) {
        return RandomEngine(*seed);
    }
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return RandomEngine(seq);
}

// Independent sub-stream for parallel work items. The result depends only on
// (base_seed, stream_index), never on which worker thread picks the item up.
inline RandomEngine deriveEngine(uint64_t base_seed, uint64_t stream_index) {
    std::seed_seq seq{static_cast<uint32_t>(base_seed), static_cast<uint32_t>(base_seed >> 32),
                      static_cast<uint32_t>(stream_index),
                      static_cast<uint32_t>(stream_index >> 32)};
    return RandomEngine(seq);
}

// N(0,1). Scale by sd at the call site so sd == 0 is legal.
inline double standardNormal(RandomEngine& engine) {
    std::normal_distribution<double> dist(0.0, 1.0);
    return dist(engine);
}

inline double uniform(RandomEngine& engine, double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(engine);
}
