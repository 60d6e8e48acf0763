/// @file Config.hpp
/// @brief Compile-time switches for the container module.
#pragma once

/// @brief When non-zero, recoverable configuration problems are reported on stderr.
#ifndef ORE_HASHMAP_WARNINGS
#define ORE_HASHMAP_WARNINGS 1
#endif

/// @brief When zero, probing skips collision bookkeeping and `Collisions()` stays at 0.
#ifndef ORE_HASHMAP_COUNT_COLLISIONS
#define ORE_HASHMAP_COUNT_COLLISIONS 1
#endif
