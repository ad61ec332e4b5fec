#pragma once

#include <cstdint>

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        const uint32_t e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }

    uint64_t Next64() {
        const uint64_t hi = Gen();
        const uint64_t lo = Gen();
        return hi << 32 | lo;
    }

    // Returns a random 64-bit value with a random number of significant bits, so that all decimal
    // lengths are hit equally often (roughly).
    uint64_t NextWithRandomLength() {
        const int shift = static_cast<int>(Gen() % 64);
        return Next64() >> shift;
    }
};
