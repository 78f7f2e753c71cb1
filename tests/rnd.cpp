/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <gtest/gtest.h>

#include <densemap/rand.hpp>

using namespace densemap;

struct RandomSplitTest : public testing::Test {
    RNG rngA;
    RNG rngB;

    void SetUp() override {
        RandKey init_key = rand::initKey(5);

        rngA = RNG(rand::split_i(init_key, 0));
        rngB = RNG(rand::split_i(init_key, 1));
    }
};

TEST_F(RandomSplitTest, U64)
{
    for (int32_t i = 0; i < 100; i++) {
        // Not guaranteed, but a collision is unlikely
        EXPECT_NE(rngA.sampleU64(), rngB.sampleU64());
    }
}

TEST_F(RandomSplitTest, Int)
{
    int32_t num_matches = 0;
    for (int32_t i = 0; i < 100; i++) {
        int32_t v_a = rngA.sampleI32(1, 100);
        int32_t v_b = rngB.sampleI32(1, 100);
        EXPECT_GE(v_a, 1);
        EXPECT_LT(v_a, 100);
        EXPECT_GE(v_b, 1);
        EXPECT_LT(v_b, 100);

        if (v_a == v_b) {
            num_matches++;
        }
    }
    EXPECT_LT(num_matches, 5);
}

static inline void checkLimits(RNG &rng, const int32_t low,
                               const int32_t high, const int32_t num_tries)
{
    bool low_found = false;
    bool high_found = false;
    for (int32_t i = 0; i < num_tries; i++) {
        int32_t v = rng.sampleI32(low, high);

        EXPECT_GE(v, low);
        EXPECT_LT(v, high);

        if (v == low) {
            low_found = true;
        }

        if (v == high) {
            high_found = true;
        }
    }

    EXPECT_TRUE(low_found);
    EXPECT_FALSE(high_found);
}

TEST_F(RandomSplitTest, IntPosLimits)
{
    checkLimits(rngA, 2, 20, 200);
}

TEST_F(RandomSplitTest, IntNegPosLimits)
{
    checkLimits(rngB, -20, 2, 200);
}

TEST_F(RandomSplitTest, IntSingleValue)
{
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(rngA.sampleI32(7, 8), 7);
    }
}

TEST(RandomInit, SameSeedSameStream)
{
    RNG a(42);
    RNG b(42);

    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(a.sampleU64(), b.sampleU64());
    }
}

TEST(RandomInit, DifferentSeeds)
{
    RNG a(5);
    RNG b(10);

    for (int i = 0; i < 100; i++) {
        EXPECT_NE(a.sampleU64(), b.sampleU64());
    }
}

TEST(RandomInit, SplitIsDeterministic)
{
    constexpr RandKey k = rand::initKey(3);
    constexpr RandKey s0 = rand::split_i(k, 0);
    constexpr RandKey s1 = rand::split_i(k, 1);

    static_assert(s0.a != s1.a || s0.b != s1.b);

    RandKey again = rand::split_i(k, 0);
    EXPECT_EQ(again.a, s0.a);
    EXPECT_EQ(again.b, s0.b);
}

TEST(RandomInit, KnownAnswers)
{
    // Threefry2x32-20 reference vector: zero key, zero counter
    RandKey zero = rand::split_i(RandKey { 0, 0 }, 0);
    EXPECT_EQ(zero.a, 0x6b200159u);
    EXPECT_EQ(zero.b, 0x99ba4efeu);

    RandKey k = rand::initKey(5);
    EXPECT_EQ(k.a, 0x5338d363u);
    EXPECT_EQ(k.b, 0x12d488dbu);

    RandKey s0 = rand::split_i(k, 0);
    EXPECT_EQ(s0.a, 0xfdd8d39au);
    EXPECT_EQ(s0.b, 0x12efbc9bu);

    RandKey s1 = rand::split_i(k, 1);
    EXPECT_EQ(s1.a, 0x7d8e95bbu);
    EXPECT_EQ(s1.b, 0xb7262f39u);

    RNG rng(42);
    EXPECT_EQ(rng.sampleU64(), 0x5ae63d099c1bc7e0_u64);
    EXPECT_EQ(rng.sampleU64(), 0x375ce8994a8d171c_u64);
}
