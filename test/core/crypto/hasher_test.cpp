/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <gtest/gtest.h>

#include "common/buffer.hpp"

using tessera::common::Buffer;
using tessera::common::Hash256;
using tessera::crypto::HasherImpl;

class HasherFixture : public ::testing::Test {
 protected:
  HasherImpl hasher;
};

/**
 * @given some bytes
 * @when sha2_256 is calculated
 * @then resulting hash matches the reference one
 */
TEST_F(HasherFixture, Sha2_256) {
  EXPECT_EQ(hasher.sha2_256(Buffer::fromString("abc")).toHex(),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(hasher.sha2_256(Buffer{}).toHex(),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

/**
 * @given two hashes
 * @when node hash of them is calculated
 * @then it equals hash of their concatenation and depends on the order
 */
TEST_F(HasherFixture, NodeHash) {
  auto left = hasher.sha2_256(Buffer::fromString("left"));
  auto right = hasher.sha2_256(Buffer::fromString("right"));
  Buffer concatenated;
  concatenated.put(left).put(right);
  EXPECT_EQ(hasher.sha2_256(left, right), hasher.sha2_256(concatenated));
  EXPECT_NE(hasher.sha2_256(left, right), hasher.sha2_256(right, left));
}
