/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/lru.hpp"

#include <gtest/gtest.h>

using tessera::Lru;
using tessera::LruSet;

/**
 * @given lru of capacity 2 with two entries
 * @when first entry is used and third is put
 * @then second entry is evicted
 */
TEST(LruTest, EvictsLeastRecentlyUsed) {
  Lru<int, std::string> lru{2};
  lru.put(1, "a");
  lru.put(2, "b");
  ASSERT_TRUE(lru.get(1));
  lru.put(3, "c");
  EXPECT_EQ(lru.size(), 2);
  EXPECT_FALSE(lru.get(2));
  EXPECT_EQ(lru.get(1)->get(), "a");
  EXPECT_EQ(lru.get(3)->get(), "c");
}

/**
 * @given lru with an entry
 * @when the same key is put again
 * @then value is replaced without growing
 */
TEST(LruTest, PutReplaces) {
  Lru<int, int> lru{3};
  lru.put(1, 10);
  lru.put(1, 11);
  EXPECT_EQ(lru.size(), 1);
  EXPECT_EQ(lru.get(1)->get(), 11);
}

/**
 * @given lru with several entries
 * @when erase and erase_if are called
 * @then matching entries are removed and order of the rest is kept
 */
TEST(LruTest, Erase) {
  Lru<int, int> lru{4};
  for (int i = 0; i < 4; ++i) {
    lru.put(i, i * 10);
  }
  lru.erase(0);
  lru.erase(42);
  EXPECT_EQ(lru.size(), 3);
  lru.erase_if([](int, int v) { return v == 20; });
  EXPECT_EQ(lru.size(), 2);
  lru.put(4, 40);
  lru.put(5, 50);
  EXPECT_FALSE(lru.get(1));
  EXPECT_TRUE(lru.get(3));
  EXPECT_TRUE(lru.get(4));
  EXPECT_TRUE(lru.get(5));
}

/**
 * @when lru with zero capacity is created
 * @then it throws
 */
TEST(LruTest, ZeroCapacity) {
  EXPECT_THROW((Lru<int, int>{0}), std::length_error);
}

/**
 * @given set of capacity 2
 * @when keys are added
 * @then add reports first insertion only and oldest key is forgotten
 */
TEST(LruTest, Set) {
  LruSet<int> set{2};
  EXPECT_TRUE(set.add(1));
  EXPECT_FALSE(set.add(1));
  EXPECT_TRUE(set.add(2));
  EXPECT_TRUE(set.add(3));
  EXPECT_EQ(set.size(), 2);
  EXPECT_FALSE(set.has(1));
  EXPECT_TRUE(set.has(3));
}
