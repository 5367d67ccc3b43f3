#pragma once

#include <cstdint>

namespace stvox {

// Seeded xorshift64* PRNG. Same seed, same sequence on every platform.
class Random {
public:
    explicit Random(uint64_t seed) { this->seed(seed); }

    void seed(uint64_t s) {
        state_ = s ^ 0x9E3779B97F4A7C15ULL;
        if (state_ == 0) state_ = 1; // xorshift can't have zero state
    }

    // Generate random integer in range [0, max)
    int randInt(int max) {
        if (max <= 0) return 0;
        return static_cast<int>(next() % static_cast<uint64_t>(max));
    }

    // Generate random integer in range [min, max)
    int randInt(int min, int max) {
        if (min >= max) return min;
        return min + randInt(max - min);
    }

    // Generate random float in range [0.0, 1.0)
    float randFloat() {
        return static_cast<float>(next() & 0xFFFFFF) / 16777216.0f;
    }

    // Generate random float in range [min, max)
    float randFloat(float min, float max) {
        return min + randFloat() * (max - min);
    }

    bool chance(float p) { return randFloat() < p; }

private:
    uint64_t next() {
        uint64_t x = state_;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        state_ = x;
        return x * 0x2545F4914F6CDD1DULL;
    }

    uint64_t state_ = 1;
};

}  // namespace stvox
