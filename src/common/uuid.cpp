/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <densemap/uuid.hpp>

#include <array>
#include <cinttypes>
#include <cstdio>
#include <random>

namespace densemap {

static RandKey entropyKey()
{
    std::random_device dev;

    return rand::initKey(dev(), dev());
}

std::string UUID::toString() const
{
    std::array<char, 37> buffer;

    snprintf(buffer.data(), buffer.size(),
             "%08" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%04" PRIx64
             "-%012" PRIx64,
             hi >> 32,
             (hi >> 16) & 0xFFFF,
             hi & 0xFFFF,
             lo >> 48,
             lo & 0xFFFF'FFFF'FFFF);

    return std::string(buffer.data());
}

UUIDGenerator::UUIDGenerator()
    : BasicUUIDGenerator<RNG>(RNG(entropyKey()))
{}

UUIDGenerator::UUIDGenerator(uint32_t seed)
    : BasicUUIDGenerator<RNG>(RNG(seed))
{}

UUIDGenerator::UUIDGenerator(RandKey key)
    : BasicUUIDGenerator<RNG>(RNG(key))
{}

}
