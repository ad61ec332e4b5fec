// Copyright 2026 The itoa Authors
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>
#include <cstdint>

#if _MSC_VER
#include <intrin.h>
#endif

#ifndef ITOA_ASSERT
#define ITOA_ASSERT(X) assert(X)
#endif

#ifndef ITOA_HAS_INT128
#if defined(__SIZEOF_INT128__)
#define ITOA_HAS_INT128 1
#else
#define ITOA_HAS_INT128 0
#endif
#endif

namespace itoa {
namespace impl {

//==================================================================================================
// DivMod1e19
//
// Divides a 128-bit unsigned integer by 10^19, the largest power of ten which fits into 64 bits.
// The remainder therefore always fits into a uint64_t and can be printed using 64-bit arithmetic.
//
// There is no native 128/64-bit division on most targets, and a call to __udivti3 is slow. Since
// the divisor is a constant, the quotient can be computed by multiplying with a fixed-point
// approximation of 1/10^19 instead.
//
// References:
//
// [1]  Granlund, Montgomery, "Division by Invariant Integers using Multiplication",
//      Proceedings of the ACM SIGPLAN 1994 Conference on Programming Language Design and Implementation, PLDI 1994
//==================================================================================================

struct Uint128
{
    uint64_t hi = 0;
    uint64_t lo = 0;

    constexpr Uint128() = default;
    constexpr Uint128(uint64_t hi_, uint64_t lo_) : hi(hi_), lo(lo_) {}
};

inline bool operator==(Uint128 x, Uint128 y) { return x.hi == y.hi && x.lo == y.lo; }
inline bool operator!=(Uint128 x, Uint128 y) { return !(x == y); }

constexpr uint64_t Pow10_19 = 10000000000000000000ull; // 0x8AC7230489E80000
constexpr uint64_t Pow5_19  = 19073486328125ull;       // 10^19 / 2^19

// ceil(2^190 / 10^19)
constexpr Uint128 Reciprocal1e19 = {0x760F253EDB4AB0D2, 0x9598F4F1E8361973};
constexpr int Reciprocal1e19Shift = 62; // = 190 - 128

// Returns the 128-bit product x * y, computed from four 32x32-bit partial products.
inline Uint128 Mul128Generic(uint64_t x, uint64_t y)
{
    const uint32_t x_lo = static_cast<uint32_t>(x);
    const uint32_t x_hi = static_cast<uint32_t>(x >> 32);
    const uint32_t y_lo = static_cast<uint32_t>(y);
    const uint32_t y_hi = static_cast<uint32_t>(y >> 32);

    const uint64_t b00 = uint64_t{x_lo} * y_lo;
    const uint64_t b01 = uint64_t{x_lo} * y_hi;
    const uint64_t b10 = uint64_t{x_hi} * y_lo;
    const uint64_t b11 = uint64_t{x_hi} * y_hi;

    const uint32_t b00_hi = static_cast<uint32_t>(b00 >> 32);

    const uint64_t mid1 = b10 + b00_hi;
    const uint32_t mid1_lo = static_cast<uint32_t>(mid1);
    const uint32_t mid1_hi = static_cast<uint32_t>(mid1 >> 32);

    const uint64_t mid2 = b01 + mid1_lo;
    const uint32_t mid2_lo = static_cast<uint32_t>(mid2);
    const uint32_t mid2_hi = static_cast<uint32_t>(mid2 >> 32);

    const uint64_t p_hi = b11 + mid1_hi + mid2_hi;
    const uint64_t p_lo = (uint64_t{mid2_lo} << 32) | static_cast<uint32_t>(b00);

    return {p_hi, p_lo};
}

// Returns the 128-bit product x * y.
inline Uint128 Mul128(uint64_t x, uint64_t y)
{
#if ITOA_HAS_INT128
    __extension__ using uint128_t = unsigned __int128;

    const uint128_t p = uint128_t{x} * y;
    return {static_cast<uint64_t>(p >> 64), static_cast<uint64_t>(p)};
#elif defined(_MSC_VER) && defined(_M_X64)
    uint64_t h = 0;
    uint64_t l = _umul128(x, y, &h);
    return {h, l};
#else
    return Mul128Generic(x, y);
#endif
}

// Returns x + y (mod 2^128).
inline Uint128 Add128(Uint128 x, Uint128 y)
{
    const uint64_t lo = x.lo + y.lo;
    const uint64_t hi = x.hi + y.hi + (lo < x.lo ? 1u : 0u);
    return {hi, lo};
}

// Returns x - y (mod 2^128).
inline Uint128 Sub128(Uint128 x, Uint128 y)
{
    const uint64_t lo = x.lo - y.lo;
    const uint64_t hi = x.hi - y.hi - (x.lo < y.lo ? 1u : 0u);
    return {hi, lo};
}

// Returns an approximation of the upper 128 bits of the 256-bit product x * y.
// The carry out of the low x.lo * y.lo partial product is not computed, so the result is either
// exact or one too small.
inline Uint128 MulHigh128Approx(Uint128 x, Uint128 y)
{
    const Uint128 b01 = Mul128(x.lo, y.hi);
    const Uint128 b10 = Mul128(x.hi, y.lo);
    const Uint128 b11 = Mul128(x.hi, y.hi);

    // (b10 + b01.lo) >> 64
    const Uint128 mid = Add128(b10, Uint128(0, b01.lo));

    Uint128 h = Add128(b11, Uint128(0, b01.hi));
    h = Add128(h, Uint128(0, mid.hi));
    return h;
}

inline Uint128 ShiftRight128(Uint128 x, int n)
{
    ITOA_ASSERT(n > 0);
    ITOA_ASSERT(n < 64);

    return {x.hi >> n, (x.hi << (64 - n)) | (x.lo >> n)};
}

struct DivMod1e19Result
{
    Uint128 quot;
    uint64_t rem;
};

// Returns {n / 10^19, n % 10^19}.
inline DivMod1e19Result DivMod1e19(Uint128 n)
{
    // n < 2^83:
    // The dividend shifted right by 19 fits into 64 bits, and since 10^19 = 2^19 * 5^19,
    // floor(n / 10^19) = floor(floor(n / 2^19) / 5^19).
    if (n.hi < (uint64_t{1} << 19))
    {
        const uint64_t n_shifted = (n.hi << 45) | (n.lo >> 19);
        const uint64_t q = n_shifted / Pow5_19;
        const uint64_t r = n.lo - q * Pow10_19; // mod 2^64, exact since r < 10^19
        ITOA_ASSERT(r < Pow10_19);
        return {Uint128(0, q), r};
    }

    // q = floor(n * ceil(2^190 / 10^19) / 2^190) is exact for all n < 2^128 (see [1]). The
    // truncated high product may be one too small, which makes q at most one too small.
    Uint128 q = ShiftRight128(MulHigh128Approx(n, Reciprocal1e19), Reciprocal1e19Shift);

    // r = n - q * 10^19.
    // q < 2^128 / 10^19 < 2^65, so q.hi * 10^19 fits into the upper 64 bits.
    ITOA_ASSERT(q.hi <= 1);
    Uint128 qd = Mul128(q.lo, Pow10_19);
    qd.hi += q.hi * Pow10_19;
    Uint128 r = Sub128(n, qd);

    // Fix up.
    if (r.hi != 0 || r.lo >= Pow10_19)
    {
        r = Sub128(r, Uint128(0, Pow10_19));
        q = Add128(q, Uint128(0, 1));
    }

    ITOA_ASSERT(r.hi == 0);
    ITOA_ASSERT(r.lo < Pow10_19);
    return {q, r.lo};
}

} // namespace impl
} // namespace itoa
