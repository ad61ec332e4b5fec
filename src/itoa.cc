// Copyright 2026 The itoa Authors
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "itoa.h"

#include <cstring>

//==================================================================================================
// ToChars
//==================================================================================================

template <typename Int>
static inline char* ToCharsImpl(char* buffer, Int value)
{
    char tmp[itoa::MaxLength<Int>()];

    char* const last = tmp + itoa::MaxLength<Int>();
    char* const first = itoa::impl::WriteIntegerBackward(last, value);

    const auto len = last - first;
    std::memcpy(buffer, first, static_cast<size_t>(len));
    return buffer + len;
}

char* itoa::ToChars(char* buffer, signed char value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, unsigned char value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, short value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, unsigned short value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, int value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, unsigned int value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, long value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, unsigned long value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, long long value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, unsigned long long value)
{
    return ToCharsImpl(buffer, value);
}

#if ITOA_HAS_INT128

char* itoa::ToChars(char* buffer, int128_t value)
{
    return ToCharsImpl(buffer, value);
}

char* itoa::ToChars(char* buffer, uint128_t value)
{
    return ToCharsImpl(buffer, value);
}

#endif
