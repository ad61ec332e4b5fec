// Copyright 2026 The itoa Authors
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "udiv128.h"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <type_traits>

#ifndef ITOA_ASSERT
#define ITOA_ASSERT(X) assert(X)
#endif

#ifndef ITOA_INLINE
#if _MSC_VER
#define ITOA_INLINE __forceinline
#elif __GNUC__
#define ITOA_INLINE inline __attribute__((always_inline))
#else
#define ITOA_INLINE inline
#endif
#endif

namespace itoa {

#if ITOA_HAS_INT128
__extension__ using int128_t = __int128;
__extension__ using uint128_t = unsigned __int128;
#endif

// Maximum number of characters required to print an integer of the given type, including the
// minus sign.
constexpr int U8MaxLength   = 3;  // 255
constexpr int I8MaxLength   = 4;  // -128
constexpr int U16MaxLength  = 5;  // 65535
constexpr int I16MaxLength  = 6;  // -32768
constexpr int U32MaxLength  = 10; // 4294967295
constexpr int I32MaxLength  = 11; // -2147483648
constexpr int U64MaxLength  = 20; // 18446744073709551615
constexpr int I64MaxLength  = 20; // -9223372036854775808
constexpr int U128MaxLength = 39; // 340282366920938463463374607431768211455
constexpr int I128MaxLength = 40; // -170141183460469231731687303715884105728

constexpr int BufferLength = I128MaxLength;

namespace impl {

ITOA_INLINE char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    ITOA_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2*digits], 2*sizeof(char));
    return buf + 2;
}

ITOA_INLINE char* Utoa_4Digits(char* buf, uint32_t digits)
{
    ITOA_ASSERT(digits <= 9999);
    const uint32_t q = digits / 100;
    const uint32_t r = digits % 100;
    Utoa_2Digits(buf + 0, q);
    Utoa_2Digits(buf + 2, r);
    return buf + 4;
}

// char* first = WriteDigitsBackward(last, n);
//
// Prints the decimal digits of n into [first, last) and returns first.
// The output has no leading zeros, except for n = 0, which prints "0".
template <typename UnsignedInt>
ITOA_INLINE char* WriteDigitsBackward(char* last, UnsignedInt n)
{
    static_assert(std::is_same<UnsignedInt, uint32_t>::value || std::is_same<UnsignedInt, uint64_t>::value,
                  "internal error");

    char* curr = last;

    // Decode 4 digits at a time.
    while (n >= 10000)
    {
        const uint32_t r = static_cast<uint32_t>(n % 10000);
        n /= 10000;
        curr -= 4;
        Utoa_4Digits(curr, r);
    }

    // n <= 9999 here, so the rest can be done using 32-bit arithmetic.
    uint32_t m = static_cast<uint32_t>(n);

    if (m >= 100)
    {
        const uint32_t r = m % 100;
        m /= 100;
        curr -= 2;
        Utoa_2Digits(curr, r);
    }

    if (m < 10)
    {
        curr -= 1;
        curr[0] = static_cast<char>('0' + m);
    }
    else
    {
        curr -= 2;
        Utoa_2Digits(curr, m);
    }

    return curr;
}

// Prints the decimal digits of a 128-bit integer.
// The integer is split into (at most three) chunks of 19 digits, each of which fits into a
// uint64_t. PRE: [last - U128MaxLength, last) is writable.
inline char* WriteDigitsBackward(char* last, Uint128 n)
{
    DivMod1e19Result qr = DivMod1e19(n);
    char* first = WriteDigitsBackward(last, qr.rem);

    if (qr.quot != Uint128(0, 0))
    {
        // Pad the low chunk with leading zeros.
        char* const slot = last - 19;
        ITOA_ASSERT(first >= slot);
        std::memset(slot, '0', static_cast<size_t>(first - slot));
        first = slot;

        qr = DivMod1e19(qr.quot);
        first = WriteDigitsBackward(first, qr.rem);

        if (qr.quot != Uint128(0, 0))
        {
            char* const slot2 = last - 38;
            ITOA_ASSERT(first >= slot2);
            std::memset(slot2, '0', static_cast<size_t>(first - slot2));
            first = slot2;

            // 2^128 / 10^38 < 4.
            ITOA_ASSERT(qr.quot.hi == 0);
            ITOA_ASSERT(qr.quot.lo <= 3);
            first -= 1;
            first[0] = static_cast<char>('0' + qr.quot.lo);
        }
    }

    return first;
}

#if ITOA_HAS_INT128
inline char* WriteDigitsBackward(char* last, uint128_t n)
{
    return WriteDigitsBackward(last, Uint128(static_cast<uint64_t>(n >> 64), static_cast<uint64_t>(n)));
}
#endif

//--------------------------------------------------------------------------------------------------
// IntegerTraits
//
// The set of integer types which can be printed is closed. Only the specializations below are
// supported.
//--------------------------------------------------------------------------------------------------

template <typename Int>
struct IntegerTraits
{
    static constexpr bool Supported = false;
};

template <typename Int, typename UnsignedInt, int MaxLen>
struct UnsignedIntegerTraits
{
    using Unsigned = UnsignedInt;

    static constexpr bool Supported = true;
    static constexpr bool IsSigned = false;
    static constexpr int MaxLength = MaxLen;

    static bool IsNegative(Int /*value*/) { return false; }
    static Unsigned Magnitude(Int value) { return static_cast<Unsigned>(value); }
};

template <typename Int, typename UnsignedInt, int MaxLen>
struct SignedIntegerTraits
{
    using Unsigned = UnsignedInt;

    static constexpr bool Supported = true;
    static constexpr bool IsSigned = true;
    static constexpr int MaxLength = MaxLen;

    static bool IsNegative(Int value) { return value < 0; }

    // Computes |value| using two's complement arithmetic.
    // This is well-defined for the most negative value, too.
    static Unsigned Magnitude(Int value)
    {
        const Unsigned u = static_cast<Unsigned>(value);
        return value < 0 ? static_cast<Unsigned>(~u + 1) : u;
    }
};

template <typename Int>
constexpr int MaxLengthForSize()
{
    return sizeof(Int) == 1 ? I8MaxLength
         : sizeof(Int) == 2 ? I16MaxLength
         : sizeof(Int) == 4 ? I32MaxLength
         : sizeof(Int) == 8 ? I64MaxLength
         : I128MaxLength;
}

template <typename UnsignedInt>
constexpr int UnsignedMaxLengthForSize()
{
    return sizeof(UnsignedInt) == 1 ? U8MaxLength
         : sizeof(UnsignedInt) == 2 ? U16MaxLength
         : sizeof(UnsignedInt) == 4 ? U32MaxLength
         : sizeof(UnsignedInt) == 8 ? U64MaxLength
         : U128MaxLength;
}

// 8, 16 and 32-bit integers are printed using 32-bit arithmetic, 64-bit integers (long may be
// either) using 64-bit arithmetic.
template <typename Int>
using ConversionType = typename std::conditional<(sizeof(Int) <= 4), uint32_t, uint64_t>::type;

template <>
struct IntegerTraits<signed char>
    : SignedIntegerTraits<signed char, uint32_t, I8MaxLength> {};
template <>
struct IntegerTraits<unsigned char>
    : UnsignedIntegerTraits<unsigned char, uint32_t, U8MaxLength> {};
template <>
struct IntegerTraits<short>
    : SignedIntegerTraits<short, uint32_t, I16MaxLength> {};
template <>
struct IntegerTraits<unsigned short>
    : UnsignedIntegerTraits<unsigned short, uint32_t, U16MaxLength> {};
template <>
struct IntegerTraits<int>
    : SignedIntegerTraits<int, ConversionType<int>, MaxLengthForSize<int>()> {};
template <>
struct IntegerTraits<unsigned int>
    : UnsignedIntegerTraits<unsigned int, ConversionType<unsigned int>, UnsignedMaxLengthForSize<unsigned int>()> {};
template <>
struct IntegerTraits<long>
    : SignedIntegerTraits<long, ConversionType<long>, MaxLengthForSize<long>()> {};
template <>
struct IntegerTraits<unsigned long>
    : UnsignedIntegerTraits<unsigned long, ConversionType<unsigned long>, UnsignedMaxLengthForSize<unsigned long>()> {};
template <>
struct IntegerTraits<long long>
    : SignedIntegerTraits<long long, uint64_t, I64MaxLength> {};
template <>
struct IntegerTraits<unsigned long long>
    : UnsignedIntegerTraits<unsigned long long, uint64_t, U64MaxLength> {};
#if ITOA_HAS_INT128
template <>
struct IntegerTraits<int128_t>
    : SignedIntegerTraits<int128_t, uint128_t, I128MaxLength> {};
template <>
struct IntegerTraits<uint128_t>
    : UnsignedIntegerTraits<uint128_t, uint128_t, U128MaxLength> {};
#endif

static_assert(sizeof(int) <= 8 && sizeof(long) <= 8 && sizeof(long long) == 8, "unsupported platform");

// Prints value into [first, last) and returns first.
// PRE: [last - IntegerTraits<Int>::MaxLength, last) is writable.
template <typename Int>
inline char* WriteIntegerBackward(char* last, Int value)
{
    using Traits = IntegerTraits<Int>;

    char* first = WriteDigitsBackward(last, Traits::Magnitude(value));
    if (Traits::IsNegative(value))
    {
        first -= 1;
        first[0] = '-';
    }

    ITOA_ASSERT(last - first <= Traits::MaxLength);
    return first;
}

} // namespace impl

template <typename Int>
constexpr int MaxLength()
{
    static_assert(impl::IntegerTraits<Int>::Supported, "itoa: unsupported integer type");
    return impl::IntegerTraits<Int>::MaxLength;
}

//==================================================================================================
// TextView
//==================================================================================================

// A read-only view of the characters printed into a Buffer.
// The view is invalidated by the next call to Buffer::Format and must not outlive the buffer.
class TextView
{
    char const* data_;
    int size_;

public:
    TextView(char const* first, char const* last)
        : data_(first)
        , size_(static_cast<int>(last - first))
    {
        ITOA_ASSERT(size_ > 0);
    }

    char const* data() const { return data_; }
    int size() const { return size_; }

    char const* begin() const { return data_; }
    char const* end() const { return data_ + size_; }

    char operator[](int index) const
    {
        ITOA_ASSERT(index >= 0);
        ITOA_ASSERT(index < size_);
        return data_[index];
    }

    std::string str() const { return std::string(data_, static_cast<size_t>(size_)); }
};

inline bool operator==(TextView lhs, char const* rhs)
{
    const size_t len = std::strlen(rhs);
    return len == static_cast<size_t>(lhs.size()) && std::memcmp(lhs.data(), rhs, len) == 0;
}

inline bool operator==(TextView lhs, std::string const& rhs)
{
    return rhs.size() == static_cast<size_t>(lhs.size()) && std::memcmp(lhs.data(), rhs.data(), rhs.size()) == 0;
}

inline bool operator==(char const* lhs, TextView rhs) { return rhs == lhs; }
inline bool operator==(std::string const& lhs, TextView rhs) { return rhs == lhs; }
inline bool operator!=(TextView lhs, char const* rhs) { return !(lhs == rhs); }
inline bool operator!=(TextView lhs, std::string const& rhs) { return !(lhs == rhs); }
inline bool operator!=(char const* lhs, TextView rhs) { return !(rhs == lhs); }
inline bool operator!=(std::string const& lhs, TextView rhs) { return !(rhs == lhs); }

inline std::ostream& operator<<(std::ostream& os, TextView text)
{
    return os.write(text.data(), text.size());
}

//==================================================================================================
// Buffer
//==================================================================================================

// Buffer buffer;
// TextView text = buffer.Format(value);
//
// A fixed-size scratch buffer which is large enough to hold the decimal representation of any
// supported integer. Constructing a Buffer is free: the bytes are left uninitialized and each call
// to Format only exposes the bytes it has written.
//
// Format may be called repeatedly on the same buffer; each call overwrites the previous output and
// invalidates views returned earlier. A Buffer must not be used by more than one thread at a time.
//
// Copying a Buffer yields a fresh buffer. Views refer to the buffer they were obtained from.
class Buffer
{
    char bytes_[BufferLength];

public:
    Buffer() {}
    Buffer(Buffer const& /*other*/) {}
    Buffer& operator=(Buffer const& /*other*/) { return *this; }

    template <typename Int>
    TextView Format(Int value)
    {
        static_assert(impl::IntegerTraits<Int>::Supported, "itoa: unsupported integer type");
        static_assert(impl::IntegerTraits<Int>::MaxLength <= BufferLength, "internal error");

        char* const last = bytes_ + BufferLength;
        char* const first = impl::WriteIntegerBackward(last, value);
        return TextView(first, last);
    }

    static constexpr int capacity() { return BufferLength; }
};

//==================================================================================================
// ToChars
//==================================================================================================

// char* output_end = ToChars(buffer, value);
//
// Converts the given integer into its decimal representation and stores the result in the given
// buffer.
//
// The buffer must be large enough, i.e. >= MaxLength<Int>().
// The output is _not_ null-terminated.

char* ToChars(char* buffer, signed char value);
char* ToChars(char* buffer, unsigned char value);
char* ToChars(char* buffer, short value);
char* ToChars(char* buffer, unsigned short value);
char* ToChars(char* buffer, int value);
char* ToChars(char* buffer, unsigned int value);
char* ToChars(char* buffer, long value);
char* ToChars(char* buffer, unsigned long value);
char* ToChars(char* buffer, long long value);
char* ToChars(char* buffer, unsigned long long value);
#if ITOA_HAS_INT128
char* ToChars(char* buffer, int128_t value);
char* ToChars(char* buffer, uint128_t value);
#endif

} // namespace itoa
