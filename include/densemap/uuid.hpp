/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#pragma once

#include <densemap/rand.hpp>
#include <densemap/types.hpp>

#include <cstddef>
#include <string>

namespace densemap {

// Opaque 128 bit row identifier. No ordering, no relation to the row's
// position.
struct UUID {
    uint64_t lo;
    uint64_t hi;

    bool operator==(const UUID &) const = default;

    // 8-4-4-4-12 hex digits, hi word first
    std::string toString() const;
};

struct UUIDHash {
    inline size_t operator()(UUID id) const;
};

// Draws uniformly random UUIDs from SourceT, which must provide
// uint64_t sampleU64(). Holds no state beyond the source.
template <typename SourceT>
class BasicUUIDGenerator {
public:
    inline BasicUUIDGenerator(SourceT src);

    inline UUID sample();

    // Resamples until is_live(id) is false. With a 128 bit space this
    // loop runs once in practice.
    template <typename Fn>
    inline UUID generate(Fn &&is_live);

private:
    SourceT src_;
};

class UUIDGenerator : public BasicUUIDGenerator<RNG> {
public:
    // Seeded from the OS entropy source
    UUIDGenerator();
    explicit UUIDGenerator(uint32_t seed);
    explicit UUIDGenerator(RandKey key);
};

}

#include "uuid.inl"
