#pragma once

#if defined(_MSC_VER) && !defined(__clang__)
#define ORE_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define ORE_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define ORE_ALWAYS_INLINE inline
#endif

#ifndef ORE_BASE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(ORE_BASE_SHARED_BUILD)
#define ORE_BASE_API __declspec(dllexport)
#elif defined(ORE_BASE_SHARED)
#define ORE_BASE_API __declspec(dllimport)
#else
#define ORE_BASE_API
#endif
#else
#if defined(ORE_BASE_SHARED_BUILD) || defined(ORE_BASE_SHARED)
#define ORE_BASE_API __attribute__((visibility("default")))
#else
#define ORE_BASE_API
#endif
#endif
#endif
