/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <densemap/macros.hpp>

namespace densemap {
namespace rand {

constexpr RandKey initKey(uint32_t seed, uint32_t seed_upper)
{
    return split_i(RandKey { seed, seed_upper }, 0);
}

// Threefry2x32 with 20 rounds, following JAX's splitting implementation:
// https://github.com/DEShawResearch/random123/blob/main/include/Random123/threefry.h
//
// Original copyright / license:
// Copyright 2019 The JAX Authors.
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
constexpr RandKey split_i(RandKey src, uint32_t idx, uint32_t idx_upper)
{
    constexpr uint32_t rotations[8] = {13, 15, 26, 6, 17, 29, 16, 24};

    // 0x1BD11BDA is the Threefry2x32 key schedule parity constant
    uint32_t ks[3] = {
        src.a,
        src.b,
        0x1BD11BDA ^ src.a ^ src.b,
    };

    uint32_t x[2] = {
        idx + ks[0],
        idx_upper + ks[1],
    };

    auto rotate_left = [](uint32_t v, uint32_t distance) {
        return (v << distance) | (v >> (32 - distance));
    };

    auto round = [&](uint32_t *v, uint32_t rotation) {
        v[0] += v[1];
        v[1] = rotate_left(v[1], rotation);
        v[1] ^= v[0];
    };

    // 5 groups of 4 rounds, key injection between groups
    for (uint32_t group = 0; group < 5; group++) {
        uint32_t rot_base = (group % 2) * 4;

DENSEMAP_UNROLL
        for (uint32_t i = 0; i < 4; i++) {
            round(x, rotations[rot_base + i]);
        }

        x[0] += ks[(group + 1) % 3];
        x[1] += ks[(group + 2) % 3] + group + 1;
    }

    return RandKey {
        x[0],
        x[1],
    };
}

constexpr uint32_t bits32(RandKey k)
{
    return k.a ^ k.b;
}

constexpr uint64_t bits64(RandKey k)
{
    return ((uint64_t)k.b << 32_u64) | (uint64_t)k.a;
}

constexpr int32_t sampleI32(RandKey k, int32_t a, int32_t b)
{
    uint32_t s = (uint32_t)(b - a);

    // Lemire, Fast Random Number Generation in an Interval.
    // Algorithm 5, unbiased.
    uint32_t x = bits32(k);

    uint64_t m = (uint64_t)x * (uint64_t)s;
    uint32_t l = (uint32_t)m;

    if (l < s) [[unlikely]] {
        // 2^32 % s == (2^32 - s) % s == -s % s
        uint32_t t = (0_u32 - s) % s;

        while (l < t) {
            k = split_i(k, 0);
            x = bits32(k);
            m = (uint64_t)x * (uint64_t)s;
            l = (uint32_t)m;
        }
    }

    return (int32_t)(m >> 32) + a;
}

}

RNG::RNG()
    : k_(RandKey { 0, 0 }),
      count_(0),
      count_upper_(0)
{}

RNG::RNG(RandKey k)
    : k_(k),
      count_(0),
      count_upper_(0)
{}

RNG::RNG(uint32_t seed)
    : RNG(rand::initKey(seed))
{}

int32_t RNG::sampleI32(int32_t a, int32_t b)
{
    RandKey sample_k = advance();
    return rand::sampleI32(sample_k, a, b);
}

uint64_t RNG::sampleU64()
{
    RandKey sample_k = advance();
    return rand::bits64(sample_k);
}

RandKey RNG::advance()
{
    RandKey sample_k = rand::split_i(k_, count_, count_upper_);

    // 64 bit counter, a stream never repeats in practice
    count_ += 1;
    if (count_ == 0) {
        count_upper_ += 1;
    }

    return sample_k;
}

}
