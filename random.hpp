#pragma once
#include <random>
#include <cstdint>

// One generator per process, created once at startup and handed to whoever needs it.
typedef std::mt19937 Rng;

// seed == 0 means "seed from std::random_device"
inline Rng make_rng(uint32_t seed) {
    if (seed == 0) {
        std::random_device rd;
        return Rng(rd());
    }
    return Rng(seed);
}
