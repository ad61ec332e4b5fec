#pragma once

#include "udiv128.h"

#include <cassert>
#include <cstdint>
#include <string>

struct ScanIntegerResult {
    bool ok = false;
    bool negative = false;
    itoa::impl::Uint128 magnitude;
};

inline bool IsDigit(char ch)
{
    return '0' <= ch && ch <= '9';
}

inline uint32_t DigitValue(char ch)
{
    assert(IsDigit(ch));
    return static_cast<uint32_t>(ch - '0');
}

// Parses an integer in canonical decimal form, i.e. -?(0|[1-9][0-9]*), with the exception of "-0",
// into sign and magnitude.
// Fails on anything else, including leading zeros and magnitudes >= 2^128.
inline ScanIntegerResult ScanInteger(char const* next, char const* last)
{
    using itoa::impl::Uint128;

    ScanIntegerResult res;

    if (next != last && *next == '-')
    {
        res.negative = true;
        ++next;
    }

    if (next == last || !IsDigit(*next))
        return res;

    if (*next == '0')
    {
        ++next;
        // No leading zeros, no "-0".
        res.ok = (next == last && !res.negative);
        return res;
    }

    Uint128 m;
    for (; next != last; ++next)
    {
        if (!IsDigit(*next))
            return res;

        // m = 10 * m + digit
        const Uint128 lo10 = itoa::impl::Mul128(m.lo, 10);
        const Uint128 hi10 = itoa::impl::Mul128(m.hi, 10);
        if (hi10.hi != 0)
            return res; // overflow

        Uint128 m10(hi10.lo + lo10.hi, lo10.lo);
        if (m10.hi < hi10.lo)
            return res; // overflow

        const Uint128 sum = itoa::impl::Add128(m10, Uint128(0, DigitValue(*next)));
        if (sum.hi < m10.hi)
            return res; // overflow

        m = sum;
    }

    res.ok = true;
    res.magnitude = m;
    return res;
}

inline ScanIntegerResult ScanInteger(std::string const& str)
{
    char const* next = str.data();
    char const* last = str.data() + str.size();

    return ScanInteger(next, last);
}
