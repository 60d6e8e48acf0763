/// @file Primes.hpp
/// @brief Prime testing and prime table-size selection for closed-hashing containers.
///
/// Table sizes are always prime so that a double-hashing jump in `[1, size - 1]`
/// cycles through every bucket before repeating.
#pragma once

#include <ORE/Defines.hpp>
#include <ORE/Primitives.hpp>

#include <span>

namespace ORE::Math::Primes
{
    /// @brief Smallest prime accepted as a table size.
    inline constexpr UInt32 kMinTableSize = 7;

    /// @brief Largest prime representable as a signed 32-bit value.
    inline constexpr UInt32 kMaxValue = 2147483647u;

    /// @brief Largest table size handed out; the ceiling every search saturates at.
    inline constexpr UInt32 kMaxSizePrime = 2146435069u;

    /// @brief Values up to this bound are answered from a precomputed table.
    inline constexpr UInt32 kLookupLimit = 1024;

    /// @brief Maximum distance `NearestTo` searches on either side of its input.
    inline constexpr UInt32 kNearestToRadius = 1024;

    /// @brief Exact primality test for any 32-bit value.
    /// @details Table lookup below `kLookupLimit`, deterministic Miller-Rabin above it.
    [[nodiscard]] ORE_BASE_API bool IsPrime(UInt32 value) noexcept;

    /// @brief Trial-division primality test. Slow reference for `IsPrime`.
    [[nodiscard]] ORE_BASE_API bool IsPrimeNoLookup(UInt32 value) noexcept;

    /// @brief True when `prime` can size a table probed with `hashPrime` as the jump multiplier.
    /// @details Rejects the multiplier itself, divisors of it, and primes `p` with
    ///          `(p - 1) % hashPrime == 0` (multipliers below 3 skip that last rule).
    [[nodiscard]] ORE_BASE_API bool IsHashableSize(UInt32 prime, UInt32 hashPrime) noexcept;

    /// @brief Smallest hashable prime >= `minSize` (and >= `kMinTableSize`).
    /// @details `ConvenientPrimes()` bounds the search; the result equals `NextHashableSizeNoLookup`.
    /// @return The prime, or `kMaxSizePrime` when none exists below the ceiling.
    [[nodiscard]] ORE_BASE_API UInt32 NextHashableSize(UInt32 minSize, UInt32 hashPrime) noexcept;

    /// @brief Smallest hashable prime >= `minSize`, without consulting `ConvenientPrimes()`.
    [[nodiscard]] ORE_BASE_API UInt32 NextHashableSizeNoLookup(UInt32 minSize, UInt32 hashPrime) noexcept;

    /// @brief Closest prime to `value`; ties go to the larger prime.
    /// @return `kMaxValue` if no prime lies within `kNearestToRadius`, or `value` exceeds it.
    [[nodiscard]] ORE_BASE_API UInt32 NearestTo(UInt32 value) noexcept;

    /// @brief Ascending table of precomputed table sizes, each roughly 1.2x the previous.
    [[nodiscard]] ORE_BASE_API std::span<const UInt32> ConvenientPrimes() noexcept;
}// namespace ORE::Math::Primes
