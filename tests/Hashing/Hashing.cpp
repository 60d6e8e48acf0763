/// @file Hashing.cpp
/// @brief Tests for ORE::Hashing key hashing helpers.

#include <ORE/Hashing/Hashing.hpp>
#include <ORE/Math/Primes.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using namespace ORE;

TEST_CASE("FNV1a32 matches reference vectors", "[Hashing][FNV]")
{
    static_assert(Hashing::FNV1a32("") == 2166136261u);

    CHECK(Hashing::FNV1a32("") == 2166136261u);
    CHECK(Hashing::FNV1a32("a") == 0xE40C292Cu);
    CHECK(Hashing::FNV1a32("foobar") == 0xBF9CF968u);
}

TEST_CASE("Fold32 mixes both halves", "[Hashing]")
{
    static_assert(Hashing::Fold32(0x0000000100000002ull) == 3u);

    CHECK(Hashing::Fold32(0) == 0u);
    CHECK(Hashing::Fold32(0xFFFFFFFFull) == 0xFFFFFFFFu);
    CHECK(Hashing::Fold32(0xFFFFFFFF00000000ull) == 0xFFFFFFFFu);
    CHECK(Hashing::Fold32(0xFFFFFFFFFFFFFFFFull) == 0u);
}

TEST_CASE("KeyHash for strings uses FNV-1a", "[Hashing][KeyHash]")
{
    const std::string owned = "orchestra";
    CHECK(Hashing::KeyHash<std::string> {}(owned) == Hashing::FNV1a32("orchestra"));
    CHECK(Hashing::KeyHash<std::string_view> {}(owned) == Hashing::KeyHash<std::string> {}(owned));
}

TEST_CASE("KeyHash is deterministic for integral keys", "[Hashing][KeyHash]")
{
    Hashing::KeyHash<int> hash;
    for (int key = -50; key < 50; ++key)
        CHECK(hash(key) == hash(key));
}

TEST_CASE("Hash primes are prime and ascending", "[Hashing]")
{
    UInt32 previous = 0;
    for (const UInt32 prime: Hashing::kHashPrimes)
    {
        INFO("prime=" << prime);
        CHECK(Math::Primes::IsPrime(prime));
        CHECK(prime > previous);
        previous = prime;
    }
    CHECK(Hashing::kHashPrimes.front() == Hashing::kDefaultHashPrime);
}
