/**
 * SimRNG - Seeded PRNG for deterministic engagement outcomes.
 *
 * mulberry32: 32-bit state, period 2^32, cheap enough to roll every
 * detonation. Given the same seed a run replays bit-identically.
 *
 * Header-only.
 */

#ifndef SKYSHIELD_DEFENSE_SIM_RNG_HPP
#define SKYSHIELD_DEFENSE_SIM_RNG_HPP

#include <cstdint>

namespace skyshield::defense {

class SimRNG {
public:
    explicit SimRNG(uint32_t seed = 42)
        : state_(seed ? seed : 1u) {}

    /** Next double in [0, 1). */
    double random() {
        state_ += 0x6D2B79F5u;
        uint32_t t = state_;
        t = mul32(t ^ (t >> 15), t | 1u);
        t ^= t + mul32(t ^ (t >> 7), t | 61u);
        return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
    }

    /** Bernoulli trial: true with probability p. */
    bool bernoulli(double p) {
        return random() < p;
    }

    /** Uniform double in [a, b). */
    double uniform(double a, double b) {
        return a + random() * (b - a);
    }

    void reseed(uint32_t seed) {
        state_ = seed ? seed : 1u;
    }

private:
    uint32_t state_;

    // Low 32 bits of the full product
    static uint32_t mul32(uint32_t a, uint32_t b) {
        return static_cast<uint32_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
    }
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_SIM_RNG_HPP
