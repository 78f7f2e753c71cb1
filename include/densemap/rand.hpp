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

namespace densemap {

struct RandKey {
    uint32_t a;
    uint32_t b;
};

namespace rand {

constexpr inline RandKey initKey(uint32_t seed, uint32_t seed_upper = 0);
constexpr inline RandKey split_i(
  RandKey src, uint32_t idx, uint32_t idx_upper = 0);

constexpr inline uint32_t bits32(RandKey k);
constexpr inline uint64_t bits64(RandKey k);

constexpr inline int32_t sampleI32(RandKey k, int32_t a, int32_t b);

}

// Counter based generator: every sample is split_i(key, counter++), so two
// RNGs built from different splits of one key produce independent streams.
class RNG {
public:
    inline RNG();
    inline RNG(RandKey k);
    inline RNG(uint32_t seed);

    inline int32_t sampleI32(int32_t a, int32_t b);
    inline uint64_t sampleU64();

    RNG(const RNG &) = default;
    RNG(RNG &&) = default;
    RNG & operator=(const RNG &) = default;
    RNG & operator=(RNG &&) = default;

private:
    inline RandKey advance();

    RandKey k_;
    uint32_t count_;
    uint32_t count_upper_;
};

}

#include "rand.inl"
