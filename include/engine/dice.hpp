#pragma once

#include "core/types.hpp"
#include <array>
#include <cassert>

namespace castle_wars {

// ==============================================================================
// Dice Roller - the single source of randomness in a game
// Using xoshiro256++ PRNG - fast, high quality and reproducible across
// platforms, which keeps seeded games bit-for-bit identical
// ==============================================================================

class DiceRoller {
public:
    // Constructor with optional seed
    explicit DiceRoller(u64 seed = 0) {
        init_state(seed);
    }

    // Seed the generator
    void seed(u64 s) { init_state(s); }

    // Uniform integer in [lo, hi], both inclusive
    u32 roll_range(u32 lo, u32 hi) {
        assert(lo <= hi);
        u64 span = static_cast<u64>(hi) - lo + 1;
        return lo + static_cast<u32>(reduce(span));
    }

    // Uniform index in [0, count)
    size_t pick_index(size_t count) {
        assert(count > 0 && "cannot pick from an empty pool");
        return static_cast<size_t>(reduce(static_cast<u64>(count)));
    }

    // Generate raw 64-bit value (for custom use)
    u64 next() {
        const u64 result = rotl(state[0] + state[3], 23) + state[0];

        const u64 t = state[1] << 17;

        state[2] ^= state[0];
        state[3] ^= state[1];
        state[1] ^= state[2];
        state[0] ^= state[3];

        state[2] ^= t;
        state[3] = rotl(state[3], 45);

        return result;
    }

private:
    std::array<u64, 4> state;

    // Multiply-shift reduction of the upper 32 bits into [0, span), span <= 2^32
    u64 reduce(u64 span) {
        return ((next() >> 32) * span) >> 32;
    }

    void init_state(u64 seed) {
        if (seed == 0) {
            seed = 0x853c49e6748fea9bULL;
        }
        // Use splitmix64 to initialize state from seed
        u64 z = seed;
        for (int i = 0; i < 4; ++i) {
            z += 0x9e3779b97f4a7c15ULL;
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
            state[i] = z ^ (z >> 31);
        }
    }

    static u64 rotl(u64 x, int k) {
        return (x << k) | (x >> (64 - k));
    }
};

} // namespace castle_wars
