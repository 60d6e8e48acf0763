#include <ORE/Containers/HashMapParams.hpp>

#include <ORE/Config.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace ORE::Containers
{
    namespace
    {
        [[nodiscard]] F32 ClampLoadFactor(F32 loadFactor) noexcept
        {
            if (std::isnan(loadFactor))
                return HashMapParams::kDefaultLoadFactor;
            return std::clamp(loadFactor, HashMapParams::kMinLoadFactor, HashMapParams::kMaxLoadFactor);
        }

        /// Largest hashable prime in `(floor, cap]`, or `floor` when there is none.
        [[nodiscard]] UInt32 LargestHashableAtMost(UInt32 cap, UInt32 floor, UInt32 hashPrime) noexcept
        {
            for (UInt32 candidate = cap; candidate > floor; --candidate)
            {
                if (Math::Primes::IsPrime(candidate) && Math::Primes::IsHashableSize(candidate, hashPrime))
                    return candidate;
            }
            return floor;
        }
    }// namespace

    HashMapParams::HashMapParams() noexcept
        : HashMapParams(kDefaultUserCapacity)
    {
    }

    HashMapParams::HashMapParams(UInt32 userCapacity, F32 factor, bool isFixed, UInt32 prime) noexcept
        : loadFactor(ClampLoadFactor(factor))
        , hashPrime(Math::Primes::NearestTo(std::max(prime, kMinHashPrime)))
        , growth(isFixed ? nullptr : &DefaultGrowth)
    {
        initialSize = CalcInternalSize(userCapacity);
    }

    HashMapParams HashMapParams::FixedCapacity(UInt32 userCapacity, F32 loadFactor) noexcept
    {
        return HashMapParams(userCapacity, loadFactor, true);
    }

    bool HashMapParams::Check() const noexcept
    {
        using namespace Math::Primes;

        if (initialSize < kMinTableSize || initialSize > kMaxSizePrime)
            return false;
        if (!(loadFactor >= kMinLoadFactor && loadFactor <= kMaxLoadFactor))
            return false;
        if (hashPrime < kMinHashPrime || !IsPrime(hashPrime))
            return false;
        return initialSize == kMinTableSize || IsPrime(initialSize);
    }

    UInt32 HashMapParams::CalcInternalSize(UInt32 loadLimit) const noexcept
    {
        const F64 buckets = std::ceil(static_cast<F64>(loadLimit) / static_cast<F64>(loadFactor));
        if (!(buckets < static_cast<F64>(Math::Primes::kMaxSizePrime)))
            return Math::Primes::kMaxSizePrime;
        return Math::Primes::NextHashableSize(static_cast<UInt32>(buckets), hashPrime);
    }

    UInt32 HashMapParams::CalcNextSize(UInt32 prevSize, UInt32 maxSize) const noexcept
    {
        if (IsFixedSize() || prevSize >= maxSize)
            return prevSize;

        const F32 factor = growth(prevSize);
        if (!(factor >= kMinGrowFactor))
            return prevSize;

        if (static_cast<F64>(maxSize) / factor < static_cast<F64>(prevSize))
            return LargestHashableAtMost(maxSize, prevSize, hashPrime);

        const auto grown = static_cast<UInt32>(static_cast<F64>(prevSize) * factor);
        const auto next  = Math::Primes::NextHashableSize(std::max(grown, prevSize + 1), hashPrime);
        if (next > maxSize)
            return LargestHashableAtMost(maxSize, prevSize, hashPrime);
        return next;
    }

    namespace detail
    {
        void ReportInvalidParams(const HashMapParams& params) noexcept
        {
#if ORE_HASHMAP_WARNINGS
            std::cerr << "[HashMap] Invalid HashMapParams (initialSize=" << params.initialSize
                      << ", loadFactor=" << params.loadFactor << ", hashPrime=" << params.hashPrime
                      << "); falling back to defaults." << std::endl;
#else
            (void) params;
#endif
        }
    }// namespace detail
}// namespace ORE::Containers
