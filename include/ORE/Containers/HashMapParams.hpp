/// @file HashMapParams.hpp
/// @brief Sizing policy for `ORE::Containers::HashMap`: table size, load factor, jump multiplier and growth.
///
/// A policy is a plain value. Every member function is a deterministic function of its fields.
#pragma once

#include <ORE/Defines.hpp>
#include <ORE/Primitives.hpp>
#include <ORE/Hashing/Hashing.hpp>
#include <ORE/Math/Primes.hpp>

namespace ORE::Containers
{
    struct ORE_BASE_API HashMapParams
    {
        /// @brief Maps the current table size to a multiplicative growth factor.
        using GrowthFunction = F32 (*)(UInt32 prevSize) noexcept;

        static constexpr UInt32 kDefaultUserCapacity = 5;
        static constexpr F32    kDefaultLoadFactor   = 0.72f;
        static constexpr F32    kMinLoadFactor       = 0.1f * kDefaultLoadFactor;
        static constexpr F32    kMaxLoadFactor       = 1.0f;
        static constexpr F32    kMinGrowFactor       = 1.05f;
        static constexpr UInt32 kMinHashPrime        = 3;

        /// @brief Growth used by non-fixed policies unless replaced: doubles the table.
        static constexpr F32 DefaultGrowth(UInt32) noexcept { return 2.0f; }

        /// @brief Physical bucket count a table starts with.
        UInt32 initialSize {Math::Primes::kMinTableSize};
        /// @brief Target ratio of live entries to buckets, in `[kMinLoadFactor, kMaxLoadFactor]`.
        F32 loadFactor {kDefaultLoadFactor};
        /// @brief Prime multiplier for the secondary (jump) hash.
        UInt32 hashPrime {Hashing::kDefaultHashPrime};
        /// @brief Null means the table never grows.
        GrowthFunction growth {&DefaultGrowth};

        /// @brief Policy for `kDefaultUserCapacity` entries that doubles when full.
        HashMapParams() noexcept;

        /// @brief Builds a normalized policy sized for `userCapacity` live entries.
        ///
        /// The load factor is clamped into range, `hashPrime` snaps to the nearest prime
        /// (at least `kMinHashPrime`), and the initial size is the next hashable prime that
        /// holds `userCapacity` entries.
        explicit HashMapParams(UInt32 userCapacity,
                               F32    loadFactor = kDefaultLoadFactor,
                               bool   isFixed    = false,
                               UInt32 hashPrime  = Hashing::kDefaultHashPrime) noexcept;

        /// @brief Normalized policy whose table never grows past `userCapacity` entries.
        [[nodiscard]] static HashMapParams FixedCapacity(UInt32 userCapacity, F32 loadFactor = kDefaultLoadFactor) noexcept;

        /// @brief Raw field values, taken as-is (e.g. deserialized). Validate with `Check()`.
        [[nodiscard]] static constexpr HashMapParams FromFields(UInt32         initialSize,
                                                                F32            loadFactor,
                                                                UInt32         hashPrime,
                                                                GrowthFunction growth = &DefaultGrowth) noexcept
        {
            return HashMapParams(RawTag {}, initialSize, loadFactor, hashPrime, growth);
        }

        [[nodiscard]] constexpr HashMapParams WithGrowth(GrowthFunction function) const noexcept
        {
            HashMapParams copy = *this;
            copy.growth        = function;
            return copy;
        }

        [[nodiscard]] constexpr HashMapParams WithFixedSize() const noexcept { return WithGrowth(nullptr); }

        [[nodiscard]] constexpr bool IsFixedSize() const noexcept { return growth == nullptr; }

        /// @brief Validates field ranges and primality.
        [[nodiscard]] bool Check() const noexcept;

        /// @brief Live entries a table of `size` buckets may hold: `floor(size * loadFactor + 0.5)`.
        [[nodiscard]] constexpr UInt32 CalcLoadLimit(UInt32 size) const noexcept
        {
            return static_cast<UInt32>(static_cast<F64>(size) * static_cast<F64>(loadFactor) + 0.5);
        }

        [[nodiscard]] constexpr UInt32 CalcLoadLimit() const noexcept { return CalcLoadLimit(initialSize); }

        /// @brief Smallest hashable bucket count whose load limit is at least `loadLimit`.
        [[nodiscard]] UInt32 CalcInternalSize(UInt32 loadLimit) const noexcept;

        /// @brief Probe step for `hash31` in a table of `size` buckets, in `[1, size - 1]`.
        [[nodiscard]] constexpr UInt32 CalcJump(UInt32 hash31, UInt32 size) const noexcept
        {
            return 1u + ((hash31 * hashPrime) & 0x7FFFFFFFu) % (size - 1u);
        }

        /// @brief Bucket count to grow to from `prevSize`, capped at the largest hashable prime <= `maxSize`.
        /// @return `prevSize` when the policy is fixed-size, the growth factor is too small, or no
        ///         hashable prime lies in `(prevSize, maxSize]`.
        [[nodiscard]] UInt32 CalcNextSize(UInt32 prevSize, UInt32 maxSize = Math::Primes::kMaxSizePrime) const noexcept;

        [[nodiscard]] constexpr bool operator==(const HashMapParams&) const noexcept = default;

    private:
        struct RawTag
        {
        };

        constexpr HashMapParams(RawTag, UInt32 size, F32 factor, UInt32 prime, GrowthFunction function) noexcept
            : initialSize(size), loadFactor(factor), hashPrime(prime), growth(function)
        {
        }
    };

    namespace detail
    {
        /// @brief Writes a one-line warning about a rejected policy (see `ORE_HASHMAP_WARNINGS`).
        ORE_BASE_API void ReportInvalidParams(const HashMapParams& params) noexcept;
    }// namespace detail
}// namespace ORE::Containers
