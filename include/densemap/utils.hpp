/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#pragma once

#include <densemap/macros.hpp>
#include <densemap/types.hpp>

#include <cstdint>

namespace densemap::utils {

// alignment must be power of 2
constexpr inline uint64_t roundUpPow2(uint64_t offset, uint64_t alignment)
{
#ifdef DENSEMAP_MSVC
#pragma warning(push)
#pragma warning(disable : 4146)
#endif
    return (offset + alignment - 1) & -alignment;
#ifdef DENSEMAP_MSVC
#pragma warning(pop)
#endif
}

// splitmix64 finalizer
constexpr inline uint64_t int64Hash(uint64_t x)
{
    x ^= x >> 30u;
    x *= 0xbf58476d1ce4e5b9_u64;
    x ^= x >> 27u;
    x *= 0x94d049bb133111eb_u64;
    x ^= x >> 31u;
    return x;
}

constexpr inline uint64_t hashCombine(uint64_t seed, uint64_t v)
{
    return seed ^ (int64Hash(v) + 0x9e3779b97f4a7c15_u64 +
                   (seed << 6u) + (seed >> 2u));
}

}
