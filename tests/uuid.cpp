/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <gtest/gtest.h>

#include <densemap/uuid.hpp>

#include <unordered_set>
#include <vector>

using namespace densemap;

struct CountingSource {
    uint64_t next;

    uint64_t sampleU64()
    {
        return next++;
    }
};

TEST(UUID, SeededGeneratorsRepeat)
{
    UUIDGenerator a(5);
    UUIDGenerator b(5);

    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(a.sample(), b.sample());
    }
}

TEST(UUID, DifferentSeeds)
{
    UUIDGenerator a(5);
    UUIDGenerator b(10);

    for (int i = 0; i < 100; i++) {
        EXPECT_NE(a.sample(), b.sample());
    }
}

TEST(UUID, EntropySeededGeneratorsDiffer)
{
    UUIDGenerator a;
    UUIDGenerator b;

    // Collision is possible in theory only
    EXPECT_NE(a.sample(), b.sample());
}

TEST(UUID, NoDuplicatesInLongStream)
{
    UUIDGenerator gen(99);

    std::unordered_set<UUID, UUIDHash> seen;
    for (int i = 0; i < 100'000; i++) {
        EXPECT_TRUE(seen.insert(gen.sample()).second);
    }
}

TEST(UUID, GenerateResamplesLiveIDs)
{
    BasicUUIDGenerator<CountingSource> gen(CountingSource { 0 });

    std::unordered_set<UUID, UUIDHash> live {
        UUID { 0, 1 },
        UUID { 2, 3 },
    };

    int num_checks = 0;
    UUID id = gen.generate([&](UUID candidate) {
        num_checks++;
        return live.contains(candidate);
    });

    EXPECT_EQ(id, (UUID { 4, 5 }));
    EXPECT_EQ(num_checks, 3);
}

TEST(UUID, GenerateWithNothingLive)
{
    BasicUUIDGenerator<CountingSource> gen(CountingSource { 10 });

    UUID id = gen.generate([](UUID) { return false; });
    EXPECT_EQ(id, (UUID { 10, 11 }));
}

TEST(UUID, ToString)
{
    UUID id {
        0x0123'4567'89ab'cdef,
        0xfedc'ba98'7654'3210,
    };

    EXPECT_EQ(id.toString(), "fedcba98-7654-3210-0123-456789abcdef");
    EXPECT_EQ((UUID { 0, 0 }).toString(),
              "00000000-0000-0000-0000-000000000000");
}

TEST(UUID, HashUsesBothWords)
{
    UUIDHash hash;

    EXPECT_EQ(hash(UUID { 1, 2 }), hash(UUID { 1, 2 }));
    EXPECT_NE(hash(UUID { 1, 2 }), hash(UUID { 2, 1 }));
    EXPECT_NE(hash(UUID { 0, 1 }), hash(UUID { 0, 2 }));
    EXPECT_NE(hash(UUID { 1, 0 }), hash(UUID { 2, 0 }));
}
