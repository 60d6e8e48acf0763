// Hashing.hpp
// 32-bit key hashing capability and hash-prime constants in ORE::Hashing
#pragma once

#include <ORE/Primitives.hpp>

#include <array>
#include <functional>
#include <string>
#include <string_view>

namespace ORE::Hashing
{
    /// @brief Default multiplier for double-hashing jump computation.
    inline constexpr UInt32 kDefaultHashPrime = 101;

    /// @brief Primes that spread well as jump multipliers, roughly doubling.
    inline constexpr std::array<UInt32, 12> kHashPrimes = {
        101, 193, 389, 769, 1543, 3079, 6151, 12289, 24593, 49157, 98317, 196613,
    };

    /// @brief Folds a 64-bit hash into 32 bits, keeping entropy from both halves.
    [[nodiscard]] constexpr UInt32 Fold32(UInt64 value) noexcept
    {
        return static_cast<UInt32>(value ^ (value >> 32));
    }

    /// @brief FNV-1a 32-bit hash of a string_view.
    template<UInt32 Offset = 2166136261u, UInt32 Prime = 16777619u>
    [[nodiscard]] constexpr UInt32 FNV1a32(std::string_view sv) noexcept
    {
        UInt32 hash = Offset;
        for (const char c: sv)
            hash = (hash ^ static_cast<UInt8>(c)) * Prime;
        return hash;
    }

    /// @brief Default hash capability: `Key -> UInt32`.
    ///
    /// Falls back to `std::hash<Key>` folded to 32 bits.
    template<typename Key>
    struct KeyHash
    {
        [[nodiscard]] UInt32 operator()(const Key& key) const noexcept(noexcept(std::hash<Key> {}(key)))
        {
            return Fold32(static_cast<UInt64>(std::hash<Key> {}(key)));
        }
    };

    template<>
    struct KeyHash<std::string_view>
    {
        [[nodiscard]] constexpr UInt32 operator()(std::string_view key) const noexcept { return FNV1a32(key); }
    };

    template<>
    struct KeyHash<std::string>
    {
        [[nodiscard]] UInt32 operator()(const std::string& key) const noexcept { return FNV1a32(key); }
    };
}// namespace ORE::Hashing
