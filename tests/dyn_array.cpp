/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <gtest/gtest.h>

#include <densemap/dyn_array.hpp>
#include <densemap/macros.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace densemap;

TEST(DynArray, GrowsFromEmpty)
{
    DynArray<uint32_t> arr(0);
    EXPECT_EQ(arr.capacity(), 0);

    for (uint32_t i = 0; i < 1000; i++) {
        arr.push_back(i);
    }

    EXPECT_EQ(arr.size(), 1000);
    EXPECT_GE(arr.capacity(), 1000);
    for (uint32_t i = 0; i < 1000; i++) {
        EXPECT_EQ(arr[i], i);
    }
}

TEST(DynArray, CacheLineAligned)
{
    DynArray<uint8_t> arr(3);
    arr.push_back(1);

    EXPECT_EQ((uintptr_t)arr.data() % DENSEMAP_CACHE_LINE, 0u);
}

TEST(DynArray, RelocatesNonTrivialItems)
{
    DynArray<std::string> arr(1);

    for (int i = 0; i < 64; i++) {
        arr.push_back("a string long enough to live on the heap " +
                      std::to_string(i));
    }

    for (int i = 0; i < 64; i++) {
        EXPECT_EQ(arr[i], "a string long enough to live on the heap " +
                  std::to_string(i));
    }
}

TEST(DynArray, PushBackOwnElementWhileGrowing)
{
    DynArray<std::string> arr(1);
    arr.push_back("first element, longer than the small string buffer");

    // Expansion happens here, the argument aliases the old storage
    arr.push_back(arr[0]);

    ASSERT_EQ(arr.size(), 2);
    EXPECT_EQ(arr[0], arr[1]);
    EXPECT_EQ(arr[1], "first element, longer than the small string buffer");
}

TEST(DynArray, SwapRemoveMiddle)
{
    DynArray<std::unique_ptr<int>> arr(4);
    for (int i = 0; i < 4; i++) {
        arr.push_back(std::make_unique<int>(i));
    }

    std::unique_ptr<int> removed = arr.swap_remove(1);
    EXPECT_EQ(*removed, 1);

    ASSERT_EQ(arr.size(), 3);
    EXPECT_EQ(*arr[0], 0);
    EXPECT_EQ(*arr[1], 3);
    EXPECT_EQ(*arr[2], 2);
}

TEST(DynArray, SwapRemoveLast)
{
    DynArray<int> arr(4);
    arr.push_back(1);
    arr.push_back(2);

    EXPECT_EQ(arr.swap_remove(1), 2);
    ASSERT_EQ(arr.size(), 1);
    EXPECT_EQ(arr.back(), 1);

    EXPECT_EQ(arr.swap_remove(0), 1);
    EXPECT_EQ(arr.size(), 0);
}

TEST(DynArray, ClearKeepsCapacity)
{
    DynArray<std::string> arr(0);
    arr.reserve(16);
    EXPECT_EQ(arr.capacity(), 16);

    for (int i = 0; i < 10; i++) {
        arr.emplace_back(5, 'x');
    }

    arr.clear();
    EXPECT_EQ(arr.size(), 0);
    EXPECT_EQ(arr.capacity(), 16);
}

TEST(DynArray, MoveAssign)
{
    DynArray<int> a(2);
    a.push_back(1);
    a.push_back(2);

    DynArray<int> b(1);
    b.push_back(9);

    b = std::move(a);
    ASSERT_EQ(b.size(), 2);
    EXPECT_EQ(b[0], 1);
    EXPECT_EQ(b[1], 2);
    EXPECT_EQ(a.size(), 0);
    EXPECT_EQ(a.data(), nullptr);
}

TEST(DynArray, CloneCopiesItems)
{
    DynArray<std::string> a(2);
    a.push_back("the first string, heap allocated by its length");
    a.push_back("the second string, heap allocated by its length");

    DynArray<std::string> b = a.clone();
    ASSERT_EQ(b.size(), 2);
    EXPECT_EQ(b.capacity(), a.capacity());
    EXPECT_EQ(b[0], a[0]);
    EXPECT_EQ(b[1], a[1]);

    b[0] = "changed";
    EXPECT_EQ(a[0], "the first string, heap allocated by its length");
}

namespace {

struct ThrowsOnCopy {
    static inline int copiesLeft = 0;

    std::string s;

    ThrowsOnCopy(std::string v) : s(std::move(v)) {}

    ThrowsOnCopy(const ThrowsOnCopy &o)
        : s(o.s)
    {
        if (copiesLeft-- == 0) {
            throw std::runtime_error("copy failed");
        }
    }

    // Not noexcept, so relocation copies
    ThrowsOnCopy(ThrowsOnCopy &&o) : s(std::move(o.s)) {}
};

}

TEST(DynArray, FailedGrowthKeepsItems)
{
    DynArray<ThrowsOnCopy> arr(3);
    arr.emplace_back("zero");
    arr.emplace_back("one");
    arr.emplace_back("two");

    // Second relocation copy throws
    ThrowsOnCopy::copiesLeft = 1;
    EXPECT_THROW(arr.emplace_back("three"), std::runtime_error);

    ASSERT_EQ(arr.size(), 3);
    EXPECT_EQ(arr.capacity(), 3);
    EXPECT_EQ(arr[0].s, "zero");
    EXPECT_EQ(arr[1].s, "one");
    EXPECT_EQ(arr[2].s, "two");

    ThrowsOnCopy::copiesLeft = 1;
    EXPECT_THROW(arr.reserve(10), std::runtime_error);
    EXPECT_EQ(arr.capacity(), 3);
    EXPECT_EQ(arr[1].s, "one");

    ThrowsOnCopy::copiesLeft = 100;
    arr.emplace_back("three");
    ASSERT_EQ(arr.size(), 4);
    EXPECT_EQ(arr[3].s, "three");
}
