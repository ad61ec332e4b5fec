#include "benchmark/benchmark.h"

#include "itoa.h"

#include "../test/jenkins_random.h"

#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#if defined(__has_include)
#if __has_include(<version>)
#include <version>
#endif
#endif

#if defined(__cpp_lib_to_chars)
#include <charconv>
#define BENCH_STD_CHARCONV()    1
#else
#define BENCH_STD_CHARCONV()    0
#endif

#define BENCH_ITOA()            1
#define BENCH_ITOA_TO_CHARS()   1
#define BENCH_STD_PRINTF()      1
#define BENCH_STD_TO_STRING()   0

//==================================================================================================
//
//==================================================================================================

struct I2S_Itoa
{
    static char const* Name() { return "itoa::Buffer"; }

    template <typename Int>
    char* operator()(char* buf, int /*buflen*/, Int value) const
    {
        itoa::Buffer buffer;
        const auto text = buffer.Format(value);
        std::memcpy(buf, text.data(), static_cast<size_t>(text.size()));
        return buf + text.size();
    }
};

struct I2S_ItoaToChars
{
    static char const* Name() { return "itoa::ToChars"; }

    template <typename Int>
    char* operator()(char* buf, int /*buflen*/, Int value) const { return itoa::ToChars(buf, value); }
};

struct I2S_Printf
{
    static char const* Name() { return "std::snprintf"; }

    char* operator()(char* buf, int buflen, int32_t value) const { return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%d", value); }
    char* operator()(char* buf, int buflen, uint32_t value) const { return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%u", value); }
    char* operator()(char* buf, int buflen, long long value) const { return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%lld", value); }
    char* operator()(char* buf, int buflen, unsigned long long value) const { return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%llu", value); }
};

struct I2S_ToString
{
    static char const* Name() { return "std::to_string"; }

    template <typename Int>
    char* operator()(char* buf, int /*buflen*/, Int value) const
    {
        const std::string str = std::to_string(value);
        std::memcpy(buf, str.data(), str.size());
        return buf + str.size();
    }
};

#if BENCH_STD_CHARCONV()
struct I2S_StdCharconv
{
    static char const* Name() { return "std::to_chars"; }

    template <typename Int>
    char* operator()(char* buf, int buflen, Int value) const { return std::to_chars(buf, buf + buflen, value).ptr; }
};
#endif

//==================================================================================================
//
//==================================================================================================

template <typename ...Args>
static inline char const* StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
#ifdef _MSC_VER
    return _strdup(buf); // leak...
#else
    return strdup(buf); // leak...
#endif
}

static JenkinsRandom rng;

static constexpr int BufSize = 64;
static constexpr int NumInts = 1 << 13;

template <typename I2S, typename Int>
static inline void BenchIt(benchmark::State& state, std::vector<Int> const& numbers)
{
    I2S i2s;

    int index = 0;

    uint64_t sum = 0;
    for (auto _ : state)
    {
        char buffer[BufSize];
        char* end = i2s(buffer, BufSize, numbers[index]);
        sum += static_cast<unsigned char>(end[-1]);
        index = (index + 1) & (NumInts - 1);
    }

    if (sum == UINT64_MAX)
        abort();
}

template <typename I2S, typename Int>
static inline void RegisterBenchmarkFor(char const* type_name, char const* name, std::vector<Int> const& numbers)
{
    auto* bench = benchmark::RegisterBenchmark(StrPrintf("%-8s %-16s %s", type_name, name, I2S::Name()), BenchIt<I2S, Int>, numbers);

    bench->ComputeStatistics("min", [](const std::vector<double>& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

template <typename Int>
static inline void RegisterBenchmarks(char const* type_name, char const* name, std::vector<Int> const& numbers)
{
#if BENCH_ITOA()
    RegisterBenchmarkFor<I2S_Itoa>(type_name, name, numbers);
#endif
#if BENCH_ITOA_TO_CHARS()
    RegisterBenchmarkFor<I2S_ItoaToChars>(type_name, name, numbers);
#endif
#if BENCH_STD_PRINTF()
    RegisterBenchmarkFor<I2S_Printf>(type_name, name, numbers);
#endif
#if BENCH_STD_TO_STRING()
    RegisterBenchmarkFor<I2S_ToString>(type_name, name, numbers);
#endif
#if BENCH_STD_CHARCONV()
    RegisterBenchmarkFor<I2S_StdCharconv>(type_name, name, numbers);
#endif
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

static constexpr uint64_t kPow10_u64[] = {
    1,
    10,
    100,
    1000,
    10000,
    100000,
    1000000,
    10000000,
    100000000,
    1000000000,
    10000000000,
    100000000000,
    1000000000000,
    10000000000000,
    100000000000000,
    1000000000000000,
    10000000000000000,
    100000000000000000,
    1000000000000000000,
    10000000000000000000u,
};

// Uniformly distributed in [10^(digits-1), 10^digits).
static inline uint64_t GenDigits(int digits)
{
    const uint64_t lo = kPow10_u64[digits - 1];
    const uint64_t hi = digits == 20 ? UINT64_MAX : kPow10_u64[digits] - 1;

    return lo + rng.Next64() % (hi - lo + 1);
}

template <typename Int>
static inline void Register_Digits(char const* type_name, int digits)
{
    std::vector<Int> numbers(NumInts);
    std::generate(numbers.begin(), numbers.end(), [&] { return static_cast<Int>(GenDigits(digits)); });

    RegisterBenchmarks(type_name, StrPrintf("%2d-digits", digits), numbers);
}

template <typename Int>
static inline void Register_RandomLength(char const* type_name)
{
    std::vector<Int> numbers(NumInts);
    std::generate(numbers.begin(), numbers.end(), [&] { return static_cast<Int>(rng.NextWithRandomLength()); });

    RegisterBenchmarks(type_name, "random-length", numbers);
}

template <typename Int>
static inline void Register_RandomBits(char const* type_name)
{
    std::vector<Int> numbers(NumInts);
    std::generate(numbers.begin(), numbers.end(), [&] { return static_cast<Int>(rng.Next64()); });

    RegisterBenchmarks(type_name, "random-bits", numbers);
}

#if ITOA_HAS_INT128
static inline void Register_RandomBits_u128()
{
    std::vector<itoa::uint128_t> numbers(NumInts);
    std::generate(numbers.begin(), numbers.end(), [&] {
        itoa::uint128_t v = (itoa::uint128_t{rng.Next64()} << 64) | rng.Next64();
        return v >> (rng() % 128);
    });

    // No std::snprintf for 128-bit integers.
    RegisterBenchmarkFor<I2S_Itoa>("u128", "random-length", numbers);
    RegisterBenchmarkFor<I2S_ItoaToChars>("u128", "random-length", numbers);
}
#endif

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    printf("Preparing benchmarks...\n");

    Register_RandomBits<uint32_t>("u32");
    Register_RandomBits<int32_t>("i32");
    Register_RandomLength<uint32_t>("u32");
    for (int d = 1; d <= 9; ++d)
    {
        Register_Digits<uint32_t>("u32", d);
    }

    Register_RandomBits<unsigned long long>("u64");
    Register_RandomBits<long long>("i64");
    Register_RandomLength<unsigned long long>("u64");
    for (int d = 1; d <= 20; ++d)
    {
        Register_Digits<unsigned long long>("u64", d);
    }

#if ITOA_HAS_INT128
    Register_RandomBits_u128();
#endif

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}
