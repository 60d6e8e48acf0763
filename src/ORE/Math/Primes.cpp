#include <ORE/Math/Primes.hpp>

#include <algorithm>
#include <array>
#include <initializer_list>
#include <iterator>

namespace ORE::Math::Primes
{
    namespace
    {
        constexpr UInt32 CountPrimesBelow(UInt32 limit) noexcept
        {
            UInt32 count = 0;
            for (UInt32 n = 2; n < limit; ++n)
            {
                bool prime = true;
                for (UInt32 d = 2; d * d <= n; ++d)
                {
                    if (n % d == 0)
                    {
                        prime = false;
                        break;
                    }
                }
                if (prime)
                    ++count;
            }
            return count;
        }

        constexpr UInt32 kSmallPrimeCount = CountPrimesBelow(kLookupLimit + 1);

        constexpr std::array<UInt16, kSmallPrimeCount> MakeSmallPrimes() noexcept
        {
            std::array<bool, kLookupLimit + 1> composite {};
            std::array<UInt16, kSmallPrimeCount> primes {};

            UInt32 next = 0;
            for (UInt32 n = 2; n <= kLookupLimit; ++n)
            {
                if (composite[n])
                    continue;
                primes[next++] = static_cast<UInt16>(n);
                for (UInt32 multiple = n * n; multiple <= kLookupLimit; multiple += n)
                    composite[multiple] = true;
            }
            return primes;
        }

        constexpr auto kSmallPrimes = MakeSmallPrimes();

        static_assert(kSmallPrimes.front() == 2);
        static_assert(kSmallPrimes.back() == 1021);

        // Sizes grow by ~1.2x; each entry satisfies the (p - 1) % 101 != 0 rule for the default hash prime.
        // Used to bound the forward search in NextHashableSize.
        constexpr UInt32 kConvenientPrimes[] = {
            7, 11, 17, 23, 29, 37, 47, 59, 71, 89, 107, 131, 163, 197, 239, 293, 353, 431, 521, 631, 761,
            919, 1103, 1327, 1597, 1931, 2333, 2801, 3371, 4049, 4861, 5839, 7013, 8419, 10103, 12143,
            14591, 17519, 21023, 25229, 30293, 36353, 43627, 52361, 62851, 75431, 90523, 108631, 130363,
            156437, 187751, 225307, 270371, 324449, 389357, 467237, 560689, 672827, 807403, 968897,
            1162687, 1395263, 1674319, 2009191, 2411033, 2893249, 3471899, 4166287, 4999559, 5999471,
            7199369,
        };

        [[nodiscard]] constexpr UInt32 MulMod(UInt32 a, UInt32 b, UInt32 mod) noexcept
        {
            return static_cast<UInt32>((static_cast<UInt64>(a) * b) % mod);
        }

        [[nodiscard]] constexpr UInt32 PowMod(UInt32 base, UInt32 exponent, UInt32 mod) noexcept
        {
            UInt32 result = 1;
            base %= mod;
            while (exponent)
            {
                if (exponent & 1u)
                    result = MulMod(result, base, mod);
                base = MulMod(base, base, mod);
                exponent >>= 1;
            }
            return result;
        }

        // Bases {2, 7, 61} are deterministic for every n < 4'759'123'141.
        [[nodiscard]] constexpr bool MillerRabin(UInt32 n) noexcept
        {
            UInt32 d      = n - 1;
            UInt32 shifts = 0;
            while ((d & 1u) == 0)
            {
                d >>= 1;
                ++shifts;
            }

            for (const UInt32 base: {2u, 7u, 61u})
            {
                if (base % n == 0)
                    continue;

                UInt32 x = PowMod(base, d, n);
                if (x == 1 || x == n - 1)
                    continue;

                bool witness = true;
                for (UInt32 r = 1; r < shifts; ++r)
                {
                    x = MulMod(x, x, n);
                    if (x == n - 1)
                    {
                        witness = false;
                        break;
                    }
                }
                if (witness)
                    return false;
            }
            return true;
        }
    }// namespace

    bool IsPrime(UInt32 value) noexcept
    {
        if (value <= kLookupLimit)
            return std::binary_search(kSmallPrimes.begin(), kSmallPrimes.end(), static_cast<UInt16>(value));

        if ((value & 1u) == 0)
            return false;

        for (const UInt16 p: kSmallPrimes)
        {
            if (static_cast<UInt32>(p) * p > value)
                return true;
            if (value % p == 0)
                return false;
        }

        return MillerRabin(value);
    }

    bool IsPrimeNoLookup(UInt32 value) noexcept
    {
        if (value < 2)
            return false;
        if (value < 4)
            return true;
        if (value % 2 == 0 || value % 3 == 0)
            return false;

        for (UInt64 d = 5; d * d <= value; d += 6)
        {
            if (value % d == 0 || value % (d + 2) == 0)
                return false;
        }
        return true;
    }

    bool IsHashableSize(UInt32 prime, UInt32 hashPrime) noexcept
    {
        if (prime < 2 || prime == hashPrime)
            return false;
        if (hashPrime != 0 && hashPrime % prime == 0)
            return false;
        if (hashPrime > 2 && (prime - 1) % hashPrime == 0)
            return false;
        return true;
    }

    UInt32 NextHashableSize(UInt32 minSize, UInt32 hashPrime) noexcept
    {
        if (minSize < kMinTableSize)
            minSize = kMinTableSize;

        // The first hashable convenient prime >= minSize bounds the scan.
        const UInt32* bound = std::lower_bound(std::begin(kConvenientPrimes), std::end(kConvenientPrimes), minSize);
        while (bound != std::end(kConvenientPrimes) && !IsHashableSize(*bound, hashPrime))
            ++bound;
        if (bound == std::end(kConvenientPrimes))
            return NextHashableSizeNoLookup(minSize, hashPrime);

        for (UInt32 candidate = minSize; candidate < *bound; ++candidate)
        {
            if (IsPrime(candidate) && IsHashableSize(candidate, hashPrime))
                return candidate;
        }
        return *bound;
    }

    UInt32 NextHashableSizeNoLookup(UInt32 minSize, UInt32 hashPrime) noexcept
    {
        if (minSize >= kMaxSizePrime)
            return kMaxSizePrime;

        if (minSize < kMinTableSize)
            minSize = kMinTableSize;

        for (UInt32 candidate = minSize | 1u; candidate < kMaxSizePrime; candidate += 2)
        {
            if (IsPrime(candidate) && IsHashableSize(candidate, hashPrime))
                return candidate;
        }

        return kMaxSizePrime;
    }

    UInt32 NearestTo(UInt32 value) noexcept
    {
        if (value <= 2)
            return 2;
        if (value >= kMaxValue)
            return kMaxValue;
        if (IsPrime(value))
            return value;

        for (UInt32 distance = 1; distance <= kNearestToRadius; ++distance)
        {
            const UInt32 above = value + distance;
            if (above <= kMaxValue && IsPrime(above))
                return above;

            if (distance < value - 1 && IsPrime(value - distance))
                return value - distance;
        }

        return kMaxValue;
    }

    std::span<const UInt32> ConvenientPrimes() noexcept
    {
        return std::span<const UInt32>(kConvenientPrimes);
    }
}// namespace ORE::Math::Primes
