/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/buffer.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace tessera::common;
using namespace std::string_literals;

/**
 * @given empty buffer
 * @when put different stuff in this buffer
 * @then result matches expectation
 */
TEST(Common, BufferPut) {
  Buffer b;
  ASSERT_EQ(b.size(), 0);
  ASSERT_EQ(b.toHex(), ""s);

  b.put("hello"s);
  ASSERT_EQ(b.size(), 5);

  std::vector<uint8_t> e{1, 2, 3, 4, 5};
  b.put(e);
  ASSERT_EQ(b.size(), 10);
  ASSERT_EQ(b.toHex(), "68656c6c6f0102030405");
}

/**
 * @given buffer containing bytes {1,2,3}
 * @when put is applied with another buffer {4,5,6} as parameter
 * @then content of current buffer changes to {1,2,3,4,5,6}
 */
TEST(Common, BufferPutChains) {
  Buffer current_buffer = {1, 2, 3};
  Buffer another_buffer = {4, 5, 6};
  auto &buffer = current_buffer.put(another_buffer);
  ASSERT_EQ(&buffer, &current_buffer);
  ASSERT_EQ(buffer, (Buffer{1, 2, 3, 4, 5, 6}));
}

/**
 * @when create buffer using different constructors
 * @then expected buffer is created
 */
TEST(Common, BufferInit) {
  Buffer b{1, 2, 3, 4, 5};
  ASSERT_EQ(b.toHex(), "0102030405"s);

  Buffer c{"0102030405"_unhex};
  ASSERT_EQ(c, b);

  EXPECT_OUTCOME_TRUE(d, Buffer::fromHex("0102030405"));
  ASSERT_EQ(d, b);
  EXPECT_EC(Buffer::fromHex("01x"), UnhexError::NOT_ENOUGH_INPUT);

  ASSERT_EQ(Buffer::fromString("abc").asString(), "abc");
  ASSERT_EQ("abc"_buf, Buffer::fromString("abc"));
}

/**
 * @given buffer of 6 bytes
 * @when take views and sub-buffers of it
 * @then they cover the requested ranges
 */
TEST(Common, BufferSubbuffer) {
  Buffer b{0, 1, 2, 3, 4, 5};
  ASSERT_EQ(b.subbuffer(2, 3), (Buffer{2, 3, 4}));
  ASSERT_EQ(b.subbuffer(4), (Buffer{4, 5}));
  ASSERT_EQ(b.view(1, 2).size(), 2);
  ASSERT_EQ(b.view(1, 2)[0], 1);
}
