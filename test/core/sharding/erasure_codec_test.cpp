/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/erasure/erasure_codec.hpp"

#include <bit>

#include "core/sharding/sharding_test_harness.hpp"
#include "testutil/outcome.hpp"

class ErasureCodecTest : public ShardingTestHarness {
 protected:
  static std::vector<ChunkPart> select(const std::vector<ChunkPart> &parts,
                                       std::initializer_list<PartIndex> indices) {
    std::vector<ChunkPart> selected;
    for (auto index : indices) {
      selected.push_back(parts.at(index));
    }
    return selected;
  }

  outcome::result<Buffer> decode(std::span<const ChunkPart> parts,
                                 uint32_t data,
                                 uint32_t total,
                                 size_t original_length) const {
    return codec_->decode(parts,
                          data,
                          total,
                          original_length,
                          ErasureCodec::shardSizeFor(original_length, data)
                              * data);
  }
};

/**
 * @given 10000 bytes encoded into 4 data and 2 parity parts
 * @when decoding from parts 0, 2, 4 and 5
 * @then the original payload is restored
 */
TEST_F(ErasureCodecTest, ReconstructsFromMixedParts) {
  auto payload = randomBytes(10000, 7);
  EXPECT_OUTCOME_TRUE(parts, codec_->encode(payload, 4, 6));
  ASSERT_EQ(parts.size(), 6);
  for (const auto &part : parts) {
    EXPECT_EQ(part.bytes.size(), 2504);
    EXPECT_TRUE(part.merkle_proof.empty());
  }

  auto subset = select(parts, {0, 2, 4, 5});
  EXPECT_OUTCOME_TRUE(decoded, decode(subset, 4, 6, payload.size()));
  EXPECT_EQ(decoded, payload);
}

/**
 * @given payload encoded into 3 data and 3 parity parts
 * @when decoding from every subset of exactly 3 parts
 * @then every subset restores the payload
 */
TEST_F(ErasureCodecTest, AnyMinimalSubsetReconstructs) {
  auto payload = randomBytes(1000, 11);
  EXPECT_OUTCOME_TRUE(parts, codec_->encode(payload, 3, 6));

  size_t subsets = 0;
  for (unsigned mask = 0; mask < (1u << 6); ++mask) {
    if (std::popcount(mask) != 3) {
      continue;
    }
    std::vector<ChunkPart> subset;
    for (PartIndex i = 0; i < 6; ++i) {
      if ((mask & (1u << i)) != 0) {
        subset.push_back(parts[i]);
      }
    }
    EXPECT_OUTCOME_TRUE(decoded, decode(subset, 3, 6, payload.size()));
    EXPECT_EQ(decoded, payload) << "subset mask " << mask;
    ++subsets;
  }
  EXPECT_EQ(subsets, 20);
}

/**
 * @given payloads of sizes around the shard alignment
 * @when decoding each of them from parity parts mostly
 * @then every payload is restored with its exact length
 */
TEST_F(ErasureCodecTest, PayloadSizes) {
  for (size_t size : {0, 1, 7, 8, 9, 39, 40, 41, 1000, 65537}) {
    auto payload = randomBytes(size, size);
    EXPECT_OUTCOME_TRUE(parts, codec_->encode(payload, 5, 8));
    auto subset = select(parts, {1, 3, 5, 6, 7});
    EXPECT_OUTCOME_TRUE(decoded, decode(subset, 5, 8, size));
    EXPECT_EQ(decoded, payload) << "payload of " << size << " bytes";
  }
}

/**
 * @given no parity shards
 * @when the payload is encoded and all parts are decoded
 * @then parts are the plain padded payload
 */
TEST_F(ErasureCodecTest, WithoutParity) {
  auto payload = Buffer::fromString("abcdefghijkl");
  EXPECT_OUTCOME_TRUE(parts, codec_->encode(payload, 2, 2));
  ASSERT_EQ(parts.size(), 2);
  auto first = Buffer::fromString("abcdef");
  first.resize(ErasureCodec::kShardAlignment, 0);
  EXPECT_EQ(parts[0].bytes, first);
  EXPECT_OUTCOME_TRUE(decoded, decode(parts, 2, 2, payload.size()));
  EXPECT_EQ(decoded, payload);
}

/**
 * @given three distinct parts of a 4 of 6 encoding, one of them repeated
 * @when decoding
 * @then decoding fails as duplicates do not count
 */
TEST_F(ErasureCodecTest, NotEnoughDistinctParts) {
  auto payload = randomBytes(500, 3);
  EXPECT_OUTCOME_TRUE(parts, codec_->encode(payload, 4, 6));
  auto subset = select(parts, {0, 0, 3, 5, 5});
  EXPECT_EC(decode(subset, 4, 6, payload.size()),
            ErasureCodingError::INSUFFICIENT_PARTS);
}

/**
 * @given data parts whose padding bytes were altered
 * @when decoding
 * @then the corruption is detected
 */
TEST_F(ErasureCodecTest, CorruptedPadding) {
  auto payload = randomBytes(1001, 5);
  EXPECT_OUTCOME_TRUE(parts, codec_->encode(payload, 4, 6));
  parts[3].bytes.back() ^= 0xff;
  auto subset = select(parts, {0, 1, 2, 3});
  EXPECT_EC(decode(subset, 4, 6, payload.size()),
            ErasureCodingError::CORRUPT_PARTS);
}

/**
 * @given malformed sets of parts
 * @when decoding
 * @then the respective error is returned
 */
TEST_F(ErasureCodecTest, MalformedParts) {
  auto payload = randomBytes(1000, 9);
  EXPECT_OUTCOME_TRUE(parts, codec_->encode(payload, 4, 6));

  auto out_of_range = select(parts, {0, 1, 2, 3});
  out_of_range[1].index = 6;
  EXPECT_EC(decode(out_of_range, 4, 6, payload.size()),
            ErasureCodingError::INVALID_INDEX);

  auto truncated = select(parts, {0, 1, 2, 4});
  truncated[3].bytes.resize(truncated[3].bytes.size() - 8);
  EXPECT_EC(decode(truncated, 4, 6, payload.size()),
            ErasureCodingError::INCONSISTENT_PART_SIZE);

  auto subset = select(parts, {0, 1, 2, 4});
  EXPECT_EC(codec_->decode(subset, 4, 6, 2000, 1000),
            ErasureCodingError::CORRUPT_PARTS);
}

/**
 * @given shard counts the coder can not handle
 * @when encoding
 * @then the shard counts are rejected
 */
TEST_F(ErasureCodecTest, InvalidShardCounts) {
  auto payload = randomBytes(100, 1);
  EXPECT_EC(codec_->encode(payload, 0, 2),
            ErasureCodingError::INVALID_SHARD_COUNT);
  EXPECT_EC(codec_->encode(payload, 4, 3),
            ErasureCodingError::INVALID_SHARD_COUNT);
  EXPECT_EC(codec_->encode(payload, 40000, 70000),
            ErasureCodingError::TOO_MANY_SHARDS);
}

/**
 * @given default chunk configuration
 * @when deriving layouts for several payload lengths
 * @then data shards carry the payload, parity is half of data rounded up
 * and the shard size is aligned
 */
TEST_F(ErasureCodecTest, Layout) {
  EXPECT_OUTCOME_TRUE(large, ErasureCodec::layoutFor(100000, 4, config_));
  EXPECT_EQ(large,
            (ShardLayout{.data_shard_count = 7,
                         .total_shard_count = 11,
                         .shard_size = 14288,
                         .encoded_length = 100016}));

  EXPECT_OUTCOME_TRUE(small, ErasureCodec::layoutFor(100, 4, config_));
  EXPECT_EQ(small.data_shard_count, 4);
  EXPECT_EQ(small.total_shard_count, 6);
  EXPECT_EQ(small.shard_size, 32);

  EXPECT_OUTCOME_TRUE(empty, ErasureCodec::layoutFor(0, 0, config_));
  EXPECT_EQ(empty.data_shard_count, 1);
  EXPECT_EQ(empty.total_shard_count, 2);
  EXPECT_EQ(empty.shard_size, ErasureCodec::kShardAlignment);

  config_.max_total_shards = 10;
  EXPECT_EC(ErasureCodec::layoutFor(100000, 4, config_),
            ErasureCodingError::PAYLOAD_TOO_LARGE);
}

/**
 * @given a 3 MiB payload and default chunk configuration
 * @when it is encoded with the derived layout and decoded with a third of
 * the data parts replaced by parity
 * @then the layout uses more shards than GF(2^8) addresses and the payload is
 * restored
 */
TEST_F(ErasureCodecTest, MultiMegabytePayload) {
  auto payload = randomBytes(3 * 1024 * 1024, 17);
  EXPECT_OUTCOME_TRUE(layout,
                      ErasureCodec::layoutFor(payload.size(), 1, config_));
  EXPECT_EQ(layout.data_shard_count, 192);
  EXPECT_EQ(layout.total_shard_count, 288);
  EXPECT_EQ(layout.shard_size, config_.shard_byte_size);

  EXPECT_OUTCOME_TRUE(
      parts,
      codec_->encode(
          payload, layout.data_shard_count, layout.total_shard_count));
  ASSERT_EQ(parts.size(), layout.total_shard_count);

  std::vector<ChunkPart> subset;
  for (PartIndex i = 64; i < layout.total_shard_count; ++i) {
    subset.push_back(parts[i]);
  }
  ASSERT_EQ(subset.size(), layout.data_shard_count + 32);
  EXPECT_OUTCOME_TRUE(decoded,
                      codec_->decode(subset,
                                     layout.data_shard_count,
                                     layout.total_shard_count,
                                     payload.size(),
                                     layout.encoded_length));
  EXPECT_EQ(decoded, payload);
}
