/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/partial_chunk.hpp"

#include <algorithm>

#include "core/sharding/sharding_test_harness.hpp"
#include "sharding/chunk_error.hpp"
#include "testutil/outcome.hpp"

class PartialChunkTest : public ShardingTestHarness {
 protected:
  void SetUp() override {
    chunk_ = makeChunk(makeBody(4, 700, {receipt(1, 1), receipt(0, 2)}),
                       4,
                       7,
                       0,
                       2);
  }

  PartialChunk makePartial() const {
    return PartialChunk{chunk_.hash, config_, hasher_};
  }

  ChunkPart corrupted(PartIndex index) const {
    auto part = chunk_.parts.at(index);
    part.bytes[3] ^= 0x80;
    return part;
  }

  TestChunk chunk_;
  ValidatorId sender_ = validator(1);
};

/**
 * @given a chunk with a known header
 * @when the minimal number of parts arrives in different orders
 * @then every order completes to the same body
 */
TEST_F(PartialChunkTest, OrderIndependence) {
  std::vector<std::vector<PartIndex>> orders{
      {0, 1, 2, 3}, {6, 5, 4, 3}, {2, 6, 0, 4}, {5, 1, 3, 6}};
  for (const auto &order : orders) {
    auto partial = makePartial();
    EXPECT_OUTCOME_TRUE(state, partial.setHeader(chunk_.header, 2));
    EXPECT_EQ(state, ChunkState::AwaitingParts);
    for (auto index : order) {
      EXPECT_EQ(partial.insertPart(chunk_.parts[index], sender_),
                InsertResult::Accepted);
    }
    EXPECT_EQ(partial.state(), ChunkState::Decodable);

    EXPECT_OUTCOME_TRUE(completed, partial.tryComplete(*codec_));
    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(completed->header, chunk_.header);
    EXPECT_EQ(completed->body, chunk_.body);
    EXPECT_EQ(completed->receipt_proofs, chunk_.receipt_proofs);
    EXPECT_EQ(partial.state(), ChunkState::Complete);
    // every part is restored to be served
    EXPECT_EQ(partial.parts().size(), 7);
  }
}

/**
 * @given a chunk awaiting parts
 * @when the same part is inserted twice
 * @then the second insertion is a duplicate and changes nothing
 */
TEST_F(PartialChunkTest, DuplicatePart) {
  auto partial = makePartial();
  EXPECT_OUTCOME_TRUE_1(partial.setHeader(chunk_.header, 2));
  EXPECT_EQ(partial.insertPart(chunk_.parts[1], sender_),
            InsertResult::Accepted);
  auto bytes = partial.byteSize();
  EXPECT_EQ(partial.insertPart(chunk_.parts[1], validator(2)),
            InsertResult::Duplicate);
  EXPECT_EQ(partial.parts().size(), 1);
  EXPECT_EQ(partial.byteSize(), bytes);
}

/**
 * @given a chunk awaiting parts
 * @when one part less than the data shard count is held
 * @then the chunk is not decodable and completing it yields nothing
 */
TEST_F(PartialChunkTest, BelowThreshold) {
  auto partial = makePartial();
  EXPECT_OUTCOME_TRUE_1(partial.setHeader(chunk_.header, 2));
  for (PartIndex index : {0, 4, 6}) {
    partial.insertPart(chunk_.parts[index], sender_);
  }
  EXPECT_EQ(partial.state(), ChunkState::AwaitingParts);
  EXPECT_OUTCOME_TRUE(completed, partial.tryComplete(*codec_));
  EXPECT_FALSE(completed.has_value());
}

/**
 * @given a chunk awaiting parts
 * @when a part is out of range or fails its proof
 * @then it is rejected and not held
 */
TEST_F(PartialChunkTest, RejectsBadParts) {
  auto partial = makePartial();
  EXPECT_OUTCOME_TRUE_1(partial.setHeader(chunk_.header, 2));

  auto outside = chunk_.parts[0];
  outside.index = 7;
  EXPECT_EQ(partial.insertPart(outside, sender_), InsertResult::InvalidIndex);
  EXPECT_EQ(partial.insertPart(corrupted(2), sender_),
            InsertResult::ProofMismatch);
  EXPECT_TRUE(partial.parts().empty());
  EXPECT_EQ(partial.proofFailures(), 1);

  // the genuine part is still accepted after a forged one
  EXPECT_EQ(partial.insertPart(chunk_.parts[2], sender_),
            InsertResult::Accepted);
}

/**
 * @given proof failures limited to 3 distinct senders
 * @when one sender fails repeatedly and then two more fail
 * @then the chunk is invalid only after the third distinct sender
 */
TEST_F(PartialChunkTest, ProofFailuresFromDistinctSenders) {
  config_.max_proof_failures = 3;
  auto partial = makePartial();
  EXPECT_OUTCOME_TRUE_1(partial.setHeader(chunk_.header, 2));

  for (int i = 0; i < 5; ++i) {
    partial.insertPart(corrupted(0), validator(1));
  }
  partial.insertPart(corrupted(1), validator(2));
  EXPECT_EQ(partial.state(), ChunkState::AwaitingParts);

  partial.insertPart(corrupted(1), validator(3));
  EXPECT_EQ(partial.state(), ChunkState::Invalid);
  EXPECT_EQ(partial.invalidReason(), InvalidReason::ProofFailures);
  EXPECT_EC(partial.tryComplete(*codec_), ChunkError::CHUNK_INVALID);
  EXPECT_EQ(partial.insertPart(chunk_.parts[0], sender_),
            InsertResult::Duplicate);
}

/**
 * @given fragments arriving before the header
 * @when the header is set
 * @then buffered fragments are verified, forged ones dropped and the chunk
 * becomes decodable
 */
TEST_F(PartialChunkTest, BuffersUntilHeader) {
  auto partial = makePartial();
  for (PartIndex index : {0, 1, 2, 5}) {
    EXPECT_EQ(partial.insertPart(chunk_.parts[index], sender_),
              InsertResult::Buffered);
  }
  EXPECT_EQ(partial.insertPart(chunk_.parts[0], sender_),
            InsertResult::Duplicate);
  EXPECT_EQ(partial.insertPart(corrupted(3), validator(4)),
            InsertResult::Buffered);
  EXPECT_EQ(partial.insertReceiptProof(chunk_.receipt_proofs[1], sender_),
            InsertResult::Buffered);
  EXPECT_EQ(partial.state(), ChunkState::AwaitingHeader);
  EXPECT_EQ(partial.bufferedCount(), 6);
  EXPECT_TRUE(partial.parts().empty());

  EXPECT_OUTCOME_TRUE(state, partial.setHeader(chunk_.header, 2));
  EXPECT_EQ(state, ChunkState::Decodable);
  EXPECT_EQ(partial.bufferedCount(), 0);
  EXPECT_EQ(partial.parts().size(), 4);
  EXPECT_FALSE(partial.parts().contains(3));
  EXPECT_EQ(partial.receiptProofs().size(), 1);
  EXPECT_EQ(partial.proofFailures(), 1);
}

/**
 * @given buffering limited to two fragments
 * @when more fragments arrive before the header
 * @then only the first two are kept and the rest are reported dropped
 */
TEST_F(PartialChunkTest, BufferLimit) {
  config_.max_buffered_fragments = 2;
  auto partial = makePartial();
  for (PartIndex index : {0, 1}) {
    EXPECT_EQ(partial.insertPart(chunk_.parts[index], sender_),
              InsertResult::Buffered);
  }
  EXPECT_EQ(partial.insertPart(chunk_.parts[2], sender_),
            InsertResult::Dropped);
  EXPECT_EQ(partial.insertReceiptProof(chunk_.receipt_proofs[0], sender_),
            InsertResult::Dropped);
  EXPECT_EQ(partial.insertPart(chunk_.parts[1], sender_),
            InsertResult::Duplicate);
  EXPECT_EQ(partial.bufferedCount(), 2);
  EXPECT_OUTCOME_TRUE_1(partial.setHeader(chunk_.header, 2));
  EXPECT_EQ(partial.parts().size(), 2);
}

/**
 * @given a header of another chunk
 * @when setting it
 * @then it is rejected and the chunk keeps waiting for its header
 */
TEST_F(PartialChunkTest, ForeignHeader) {
  auto other = makeChunk(makeBody(1, 10), 1, 2);
  auto partial = makePartial();
  EXPECT_EC(partial.setHeader(other.header, 2), ChunkError::HEADER_MISMATCH);
  EXPECT_EQ(partial.state(), ChunkState::AwaitingHeader);
  EXPECT_FALSE(partial.header().has_value());
}

/**
 * @given a chunk whose header commits to parts that are not a codeword
 * @when its parts are completed
 * @then the chunk is rejected as corrupt
 */
TEST_F(PartialChunkTest, RejectsWrongCodeword) {
  // parts root over parts of which one is not produced by the coder
  auto parts = chunk_.parts;
  parts[6].bytes[0] ^= 0x11;
  auto header = chunk_.header;
  header.parts_root = attachPartProofs(*hasher_, parts);
  auto hash = chunkHash(*hasher_, header);

  PartialChunk partial{hash, config_, hasher_};
  EXPECT_OUTCOME_TRUE_1(partial.setHeader(header, 2));
  for (PartIndex index : {3, 4, 5, 6}) {
    EXPECT_EQ(partial.insertPart(parts[index], sender_),
              InsertResult::Accepted);
  }
  EXPECT_EC(partial.tryComplete(*codec_), ErasureCodingError::CORRUPT_PARTS);
  EXPECT_EQ(partial.state(), ChunkState::Invalid);
  EXPECT_EQ(partial.invalidReason(), InvalidReason::CorruptParts);
}

/**
 * @given a chunk whose receipts root disagrees with its body
 * @when its parts are completed
 * @then the chunk is rejected with payload mismatch
 */
TEST_F(PartialChunkTest, RejectsWrongReceiptsRoot) {
  auto header = chunk_.header;
  header.receipts_root[0] ^= 0xff;
  auto hash = chunkHash(*hasher_, header);

  PartialChunk partial{hash, config_, hasher_};
  EXPECT_OUTCOME_TRUE_1(partial.setHeader(header, 2));
  for (PartIndex index : {0, 1, 2, 3}) {
    partial.insertPart(chunk_.parts[index], sender_);
  }
  EXPECT_EC(partial.tryComplete(*codec_), ChunkError::PAYLOAD_MISMATCH);
  EXPECT_EQ(partial.invalidReason(), InvalidReason::PayloadMismatch);
}
