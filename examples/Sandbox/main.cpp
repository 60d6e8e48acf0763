// main.cpp
#include <iostream>
#include <string>

#include <ORE/Containers/HashMap.hpp>

using namespace ORE;
using namespace ORE::Containers;

namespace
{
    template<typename MapT>
    void PrintDiagnostics(const char* label, const MapT& map)
    {
        const auto d = map.GetDiagnostics();
        std::cout << "[" << label << "] count=" << d.count << " buckets=" << d.bucketCount
                  << " limit=" << d.loadLimit << " tombstones=" << d.tombstones
                  << " collisions=" << d.collisions << " load=" << d.loadRatio << "\n";
    }
}// namespace

int main()
{
    std::cout << "=== HashMap Sandbox ===\n\n";

    HashMap<std::string, int> words;
    for (const char* word: {"alpha", "beta", "gamma", "delta", "epsilon", "zeta", "eta", "theta"})
    {
        if (auto slot = words.Insert(word, static_cast<int>(std::string(word).size())); !slot)
            std::cout << "insert " << word << " failed: " << ToString(slot.error().code) << "\n";
    }
    PrintDiagnostics("growable", words);

    if (auto dup = words.TryInsert("beta", 0); !dup)
        std::cout << "beta already mapped at slot " << dup.error().slot << "\n";

    {
        auto cursor = words.Iter();
        while (true)
        {
            auto next = cursor.MoveNext();
            if (!next)
            {
                std::cout << "cursor failed: " << ToString(next.error().code) << "\n";
                break;
            }
            if (!*next)
                break;
            auto value = cursor.CurrentValue();
            if (value && **value % 2 == 0)
            {
                if (auto removed = cursor.RemoveCurrent(); !removed)
                    std::cout << "remove failed: " << ToString(removed.error().code) << "\n";
            }
        }
    }
    PrintDiagnostics("odd lengths", words);

    for (const auto& entry: words)
        std::cout << "  " << entry.key << " -> " << entry.value << "\n";

    HashMap<int, int> fixed(HashMapParams::FixedCapacity(4));
    for (int key = 0; key < 8; ++key)
    {
        if (auto slot = fixed.Insert(key, key * key); !slot)
        {
            std::cout << "fixed table rejected key " << key << ": " << ToString(slot.error().code) << "\n";
            break;
        }
    }
    PrintDiagnostics("fixed", fixed);

    words.Rehash();
    PrintDiagnostics("rehashed", words);

    std::cout << "\n=== Done ===\n";
    return 0;
}
