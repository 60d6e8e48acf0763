/// @file Primes.cpp
/// @brief Tests for ORE::Math::Primes using Catch2.

#include <ORE/Math/Primes.hpp>
#include <ORE/Hashing/Hashing.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <vector>

namespace Primes = ORE::Math::Primes;
using ORE::UInt32;

TEST_CASE("IsPrime accepts known primes", "[Math][Primes]")
{
    constexpr std::array<UInt32, 20> primes = {
        2u, 3u, 5u, 7u, 11u, 13u, 97u, 101u, 1009u, 1021u, 1031u, 7919u, 104729u, 1299709u,
        15485863u, 2146435069u, 2147483647u, 4294967291u, 196613u, 786433u,
    };

    for (const UInt32 p: primes)
    {
        INFO("value=" << p);
        CHECK(Primes::IsPrime(p));
        CHECK(Primes::IsPrimeNoLookup(p));
    }
}

TEST_CASE("IsPrime rejects known composites", "[Math][Primes]")
{
    constexpr std::array<UInt32, 14> composites = {
        0u, 1u, 4u, 9u, 561u, 1001u, 1024u, 1025u, 1018081u, 1373653u, 25326001u, 3215031751u,
        2147483645u, 4294967295u,
    };

    for (const UInt32 n: composites)
    {
        INFO("value=" << n);
        CHECK_FALSE(Primes::IsPrime(n));
        CHECK_FALSE(Primes::IsPrimeNoLookup(n));
    }
}

TEST_CASE("IsPrime agrees with trial division", "[Math][Primes]")
{
    for (UInt32 n = 0; n < 20000; ++n)
    {
        if (Primes::IsPrime(n) != Primes::IsPrimeNoLookup(n))
            FAIL("mismatch at " << n);
    }

    for (UInt32 n = Primes::kMaxValue - 5000; n < Primes::kMaxValue; ++n)
    {
        if (Primes::IsPrime(n) != Primes::IsPrimeNoLookup(n))
            FAIL("mismatch at " << n);
    }
}

TEST_CASE("IsHashableSize rules", "[Math][Primes]")
{
    CHECK(Primes::IsHashableSize(7, 101));
    CHECK_FALSE(Primes::IsHashableSize(101, 101));
    CHECK_FALSE(Primes::IsHashableSize(7, 3));  // (7 - 1) % 3 == 0
    CHECK(Primes::IsHashableSize(11, 3));
    CHECK(Primes::IsHashableSize(17, 3));
    CHECK_FALSE(Primes::IsHashableSize(607, 101));// 606 == 6 * 101
}

TEST_CASE("NextHashableSize small inputs", "[Math][Primes]")
{
    CHECK(Primes::NextHashableSize(0, 101) == 7u);
    CHECK(Primes::NextHashableSize(6, 101) == 7u);
    CHECK(Primes::NextHashableSize(7, 101) == 7u);
    CHECK(Primes::NextHashableSize(14, 101) == 17u);
    CHECK(Primes::NextHashableSize(7, 3) == 11u);
    CHECK(Primes::NextHashableSize(14, 3) == 17u);
    CHECK(Primes::NextHashableSize(12, 101) == 13u);
    CHECK(Primes::NextHashableSize(139, 101) == 139u);
    CHECK(Primes::NextHashableSize(140, 101) == 149u);

    CHECK(Primes::NextHashableSizeNoLookup(8, 101) == 11u);
    CHECK(Primes::NextHashableSizeNoLookup(12, 101) == 13u);
    CHECK(Primes::NextHashableSizeNoLookup(14, 3) == 17u);
}

TEST_CASE("NextHashableSize yields the smallest hashable prime for every hash prime", "[Math][Primes]")
{
    std::vector<UInt32> hashPrimes(ORE::Hashing::kHashPrimes.begin(), ORE::Hashing::kHashPrimes.end());
    hashPrimes.push_back(Primes::kMaxValue);

    const std::array<UInt32, 12> values = {1u, 8u, 12u, 50u, 500u, 4000u, 65536u, 100000u, 1000003u, 7199370u, 7200000u, 50000000u};

    for (const UInt32 hashPrime: hashPrimes)
    {
        for (const UInt32 value: values)
        {
            const UInt32 next   = Primes::NextHashableSize(value, hashPrime);
            const UInt32 direct = Primes::NextHashableSizeNoLookup(value, hashPrime);

            INFO("hashPrime=" << hashPrime << " value=" << value << " next=" << next << " direct=" << direct);
            CHECK(next >= value);
            CHECK(Primes::IsPrime(next));
            CHECK(Primes::IsHashableSize(next, hashPrime));
            CHECK(next < Primes::kMaxSizePrime);

            CHECK(direct == next);
        }
    }
}

TEST_CASE("NextHashableSize saturates at the size ceiling", "[Math][Primes]")
{
    CHECK(Primes::NextHashableSize(Primes::kMaxSizePrime, 101) == Primes::kMaxSizePrime);
    CHECK(Primes::NextHashableSize(Primes::kMaxSizePrime + 1, 101) == Primes::kMaxSizePrime);
    CHECK(Primes::NextHashableSize(0xFFFFFFFFu, 101) == Primes::kMaxSizePrime);
    CHECK(Primes::NextHashableSizeNoLookup(0xFFFFFFFFu, 3) == Primes::kMaxSizePrime);
}

TEST_CASE("NearestTo picks the closest prime, ties toward larger", "[Math][Primes]")
{
    CHECK(Primes::NearestTo(7) == 7u);
    CHECK(Primes::NearestTo(25228) == 25229u);
    CHECK(Primes::NearestTo(3615) == 3617u);
    CHECK(Primes::NearestTo(3711) == 3709u);
    CHECK(Primes::NearestTo(5066) == 5059u);
    CHECK(Primes::NearestTo(5068) == 5077u);
    CHECK(Primes::NearestTo(5070) == 5077u);
    CHECK(Primes::NearestTo(100) == 101u);
    CHECK(Primes::NearestTo(0) == 2u);
    CHECK(Primes::NearestTo(1) == 2u);
    CHECK(Primes::NearestTo(4) == 5u);
    CHECK(Primes::NearestTo(0xFFFFFFFFu) == Primes::kMaxValue);
}

TEST_CASE("NearestTo results are prime and close", "[Math][Primes]")
{
    for (UInt32 value = 2; value < 50000; value += 37)
    {
        const UInt32 prime = Primes::NearestTo(value);
        INFO("value=" << value << " prime=" << prime);
        CHECK(Primes::IsPrime(prime));
        const UInt32 distance = prime > value ? prime - value : value - prime;
        CHECK(distance <= 72u);
    }
}

TEST_CASE("ConvenientPrimes is an ascending table of primes", "[Math][Primes]")
{
    const auto table = Primes::ConvenientPrimes();
    REQUIRE_FALSE(table.empty());
    CHECK(table.front() == Primes::kMinTableSize);
    CHECK(std::is_sorted(table.begin(), table.end()));
    CHECK(std::adjacent_find(table.begin(), table.end()) == table.end());

    for (const UInt32 p: table)
    {
        INFO("value=" << p);
        CHECK(Primes::IsPrime(p));
        CHECK(Primes::IsHashableSize(p, ORE::Hashing::kDefaultHashPrime));
    }
}

TEST_CASE("NextHashableSize matches the direct search below the table limit", "[Math][Primes]")
{
    for (const UInt32 hashPrime: {3u, 101u, 193u})
    {
        for (UInt32 value = 0; value < 5000; ++value)
        {
            if (Primes::NextHashableSize(value, hashPrime) != Primes::NextHashableSizeNoLookup(value, hashPrime))
                FAIL("mismatch at " << value << " for hashPrime " << hashPrime);
        }
    }
}
