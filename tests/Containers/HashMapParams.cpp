/// @file HashMapParams.cpp
/// @brief Tests for ORE::Containers::HashMapParams sizing policy.

#include <ORE/Containers/HashMapParams.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <limits>
#include <vector>

using ORE::F32;
using ORE::UInt32;
using ORE::Containers::HashMapParams;
namespace Primes = ORE::Math::Primes;

TEST_CASE("HashMapParams defaults", "[Containers][HashMapParams]")
{
    const HashMapParams params;
    CHECK(params.initialSize == 7u);
    CHECK(params.loadFactor == HashMapParams::kDefaultLoadFactor);
    CHECK(params.hashPrime == ORE::Hashing::kDefaultHashPrime);
    CHECK_FALSE(params.IsFixedSize());
    CHECK(params.CalcLoadLimit() == 5u);
    CHECK(params.Check());
}

TEST_CASE("HashMapParams sizes the table for the requested capacity", "[Containers][HashMapParams]")
{
    const HashMapParams params(100);
    CHECK(params.initialSize == 139u);
    CHECK(params.CalcLoadLimit() == 100u);

    const std::array<UInt32, 7> capacities = {0u, 1u, 5u, 100u, 777u, 10000u, 1000000u};
    for (const UInt32 capacity: capacities)
    {
        for (const bool fixed: {false, true})
        {
            const HashMapParams sized(capacity, 0.5f, fixed);
            INFO("capacity=" << capacity << " fixed=" << fixed << " size=" << sized.initialSize);
            CHECK(sized.Check());
            CHECK(sized.IsFixedSize() == fixed);
            CHECK(sized.CalcLoadLimit() >= capacity);
            CHECK(Primes::IsHashableSize(sized.initialSize, sized.hashPrime));
        }
    }
}

TEST_CASE("HashMapParams normalizes its inputs", "[Containers][HashMapParams]")
{
    CHECK(HashMapParams(5, 5.0f).loadFactor == HashMapParams::kMaxLoadFactor);
    CHECK(HashMapParams(5, 0.0f).loadFactor == HashMapParams::kMinLoadFactor);
    CHECK(HashMapParams(5, std::numeric_limits<F32>::quiet_NaN()).loadFactor == HashMapParams::kDefaultLoadFactor);

    CHECK(HashMapParams(5, 0.72f, false, 100).hashPrime == 101u);
    CHECK(HashMapParams(5, 0.72f, false, 1).hashPrime == 3u);
    CHECK(HashMapParams(5, 0.72f, false, 4).hashPrime == 5u);
}

TEST_CASE("HashMapParams load limit and internal size", "[Containers][HashMapParams]")
{
    const HashMapParams params;
    CHECK(params.CalcLoadLimit(7) == 5u);
    CHECK(params.CalcLoadLimit(17) == 12u);
    CHECK(params.CalcInternalSize(5) == 7u);
    CHECK(params.CalcInternalSize(12) == 17u);

    const auto full = HashMapParams::FromFields(11, 1.0f, 101);
    CHECK(full.CalcLoadLimit() == 11u);
}

TEST_CASE("HashMapParams jump visits every bucket", "[Containers][HashMapParams]")
{
    const auto params = HashMapParams::FromFields(7, 0.72f, 101);
    const std::array<UInt32, 6> sizes = {7u, 11u, 17u, 101u + 2u, 1009u, 4049u};
    const std::array<UInt32, 6> hashes = {1u, 2u, 77u, 12345u, 0x7FFFFFFFu, 0x1234567u};

    for (const UInt32 size: sizes)
    {
        for (const UInt32 hash: hashes)
        {
            const UInt32 jump = params.CalcJump(hash, size);
            INFO("size=" << size << " hash=" << hash << " jump=" << jump);
            REQUIRE(jump >= 1u);
            REQUIRE(jump <= size - 1u);

            std::vector<bool> seen(size, false);
            UInt32 index = hash % size;
            for (UInt32 step = 0; step < size; ++step)
            {
                REQUIRE_FALSE(seen[index]);
                seen[index] = true;
                index       = (index + jump) % size;
            }
        }
    }
}

TEST_CASE("HashMapParams growth", "[Containers][HashMapParams]")
{
    const HashMapParams params;
    CHECK(params.CalcNextSize(7) == 17u);
    CHECK(HashMapParams::FromFields(7, 0.72f, 3).CalcNextSize(7) == 17u);

    SECTION("fixed size never grows")
    {
        const auto fixed = HashMapParams::FixedCapacity(10);
        CHECK(fixed.IsFixedSize());
        CHECK(fixed.CalcNextSize(fixed.initialSize) == fixed.initialSize);
    }

    SECTION("factor below the minimum does not grow")
    {
        const auto flat = params.WithGrowth([](UInt32) noexcept -> F32 { return 1.0f; });
        CHECK(flat.CalcNextSize(17) == 17u);
    }

    SECTION("growth is capped at a hashable prime")
    {
        CHECK(params.CalcNextSize(1000, 1500) == 1499u);
        CHECK(params.CalcNextSize(1000, 1499) == 1499u);
        CHECK(params.CalcNextSize(1500, 1500) == 1500u);
        CHECK(params.CalcNextSize(Primes::kMaxSizePrime) == Primes::kMaxSizePrime);
    }

    SECTION("a cap with no hashable prime above the current size does not grow")
    {
        // 1001, 1003, 1007 are composite.
        CHECK(params.CalcNextSize(1000, 1008) == 1000u);
        CHECK(params.CalcNextSize(7, 9) == 7u);
    }

    SECTION("capped results are always valid table sizes")
    {
        const std::array<UInt32, 5> caps = {20u, 100u, 1024u, 5000u, 65536u};
        for (const UInt32 cap: caps)
        {
            const UInt32 next = params.CalcNextSize(11, cap);
            INFO("cap=" << cap << " next=" << next);
            CHECK(next <= cap);
            CHECK(Primes::IsPrime(next));
            CHECK(Primes::IsHashableSize(next, params.hashPrime));
        }
    }

    SECTION("every step strictly grows to a hashable prime")
    {
        const auto slow = params.WithGrowth([](UInt32) noexcept -> F32 { return 1.05f; });
        UInt32 size = slow.initialSize;
        for (int i = 0; i < 40; ++i)
        {
            const UInt32 next = slow.CalcNextSize(size);
            INFO("size=" << size << " next=" << next);
            REQUIRE(next > size);
            CHECK(Primes::IsPrime(next));
            CHECK(Primes::IsHashableSize(next, slow.hashPrime));
            size = next;
        }
    }
}

TEST_CASE("HashMapParams Check rejects malformed fields", "[Containers][HashMapParams]")
{
    CHECK(HashMapParams::FromFields(7, 0.72f, 3).Check());
    CHECK(HashMapParams::FromFields(11, 0.5f, 101).Check());
    CHECK(HashMapParams::FromFields(7, 0.72f, 101).WithFixedSize().Check());

    CHECK_FALSE(HashMapParams::FromFields(0, 0.72f, 101).Check());
    CHECK_FALSE(HashMapParams::FromFields(5, 0.72f, 101).Check());
    CHECK_FALSE(HashMapParams::FromFields(8, 0.72f, 101).Check());
    CHECK_FALSE(HashMapParams::FromFields(7, 0.72f, 4).Check());
    CHECK_FALSE(HashMapParams::FromFields(7, 0.72f, 2).Check());
    CHECK_FALSE(HashMapParams::FromFields(7, 1.5f, 101).Check());
    CHECK_FALSE(HashMapParams::FromFields(7, 0.01f, 101).Check());
    CHECK_FALSE(HashMapParams::FromFields(7, std::numeric_limits<F32>::quiet_NaN(), 101).Check());
}

TEST_CASE("HashMapParams value semantics", "[Containers][HashMapParams]")
{
    const auto a = HashMapParams::FromFields(17, 0.5f, 193);
    const auto b = HashMapParams::FromFields(17, 0.5f, 193);
    CHECK(a == b);
    CHECK_FALSE(a == a.WithFixedSize());
    CHECK(a.WithFixedSize().WithGrowth(&HashMapParams::DefaultGrowth) == a);
}
