#pragma once

#include <cstdint>
#include <ctime>
#include <limits>

namespace cs {

// Fast xorshift64* PRNG - much faster than mt19937.
// Satisfies UniformRandomBitGenerator so <random> distributions can use it.
// One instance must not be shared between threads; use instance() for a
// thread-local default or construct one per worker.
class Random {
public:
    using result_type = uint64_t;

    Random() : state_(static_cast<uint64_t>(time(nullptr)) ^ reinterpret_cast<uintptr_t>(this)) {
        if (state_ == 0) state_ = 1;
    }

    explicit Random(uint64_t s) { seed(s); }

    // Get thread-local instance
    static Random& instance() {
        thread_local Random rng;
        return rng;
    }

    void seed(uint64_t s) {
        state_ = s;
        if (state_ == 0) state_ = 1; // xorshift can't have zero state
    }

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    result_type operator()() { return next(); }

    // Generate random integer in range [0, max)
    int randInt(int max) {
        if (max <= 0) return 0;
        return static_cast<int>(next() % static_cast<uint64_t>(max));
    }

    // Generate random double in range [0.0, 1.0)
    double randDouble() {
        return static_cast<double>(next() >> 11) * (1.0 / 9007199254740992.0);
    }

    // Generate random double in range [min, max)
    double randDouble(double min, double max) {
        return min + randDouble() * (max - min);
    }

private:
    // xorshift64* algorithm - very fast, good statistical properties
    uint64_t next() {
        uint64_t x = state_;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        state_ = x;
        return x * 0x2545F4914F6CDD1DULL;
    }

    uint64_t state_;
};

inline void randomSeed(uint64_t seed) {
    Random::instance().seed(seed);
}

} // namespace cs
