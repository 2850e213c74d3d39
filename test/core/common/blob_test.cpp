/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <gtest/gtest.h>

#include "sharding/types.hpp"
#include "testutil/outcome.hpp"

using namespace tessera::common;
using tessera::sharding::ChunkHash;

/**
 * @given hex string
 * @when create blob object from this string using fromHex method
 * @then blob object is created and contains expected byte representation of the
 * hex string
 */
TEST(BlobTest, CreateFromValidHex) {
  std::array<byte_t, 2> expected{0, 255};
  EXPECT_OUTCOME_TRUE(blob, Blob<2>::fromHex("00ff"));
  EXPECT_EQ(blob, expected);
}

/**
 * @given non hex string, odd length hex or hex of a wrong length
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromInvalidHex) {
  EXPECT_EC(Blob<2>::fromHex("nothex"), UnhexError::NON_HEX_INPUT);
  EXPECT_EC(Blob<2>::fromHex("0a1"), UnhexError::NOT_ENOUGH_INPUT);
  EXPECT_EC(Blob<2>::fromHex("00ff00"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given byte span
 * @when create blob from it
 * @then blob is created only if the span has the blob size
 */
TEST(BlobTest, CreateFromSpan) {
  std::vector<uint8_t> bytes{1, 2, 3};
  EXPECT_OUTCOME_TRUE(blob, Blob<3>::fromSpan(bytes));
  EXPECT_EQ(blob.toHex(), "010203");
  EXPECT_EC(Blob<4>::fromSpan(bytes), BlobError::INCORRECT_LENGTH);
}

/**
 * @given strictly typed hash
 * @when it is formatted
 * @then short form shows its first and last bytes, long form all of them
 */
TEST(BlobTest, StrictTypedefFormatting) {
  EXPECT_OUTCOME_TRUE(
      hash,
      ChunkHash::fromHex(
          "0102030405060708091011121314151617181920212223242526272829303132"));
  EXPECT_EQ(fmt::format("{}", hash), "0x0102…3132");
  EXPECT_EQ(fmt::format("{:l}", hash),
            "0x0102030405060708091011121314151617181920212223242526272829303132");
  EXPECT_NE(std::hash<ChunkHash>{}(hash), std::hash<ChunkHash>{}(ChunkHash{}));
}
