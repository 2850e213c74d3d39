/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/encoding/chunk_encoding.hpp"

#include <boost/assert.hpp>

#include "sharding/chunk_error.hpp"
#include "sharding/erasure/erasure_codec.hpp"
#include "sharding/merkle/merkle.hpp"

namespace tessera::sharding {

  MerkleHash partLeaf(const crypto::Hasher &hasher, const ChunkPart &part) {
    return hasher.sha2_256(part.bytes);
  }

  MerkleHash receiptLeaf(const crypto::Hasher &hasher,
                         const ReceiptProof &proof) {
    return hasher.sha2_256(
        ::scale::encode(proof.from_shard, proof.to_shard, proof.receipts)
            .value());
  }

  MerkleHash attachPartProofs(const crypto::Hasher &hasher,
                              std::vector<ChunkPart> &parts) {
    std::vector<MerkleHash> leaves;
    leaves.reserve(parts.size());
    for (size_t i = 0; i < parts.size(); ++i) {
      BOOST_ASSERT(parts[i].index == i);
      leaves.emplace_back(partLeaf(hasher, parts[i]));
    }
    auto paths = merkle::computePaths(hasher, leaves);
    for (size_t i = 0; i < parts.size(); ++i) {
      parts[i].merkle_proof = std::move(paths[i]);
    }
    return merkle::computeRoot(hasher, leaves);
  }

  ReceiptProofs makeReceiptProofs(const crypto::Hasher &hasher,
                                  ShardId from_shard,
                                  const std::vector<Receipt> &receipts,
                                  ShardId num_shards) {
    ReceiptProofs result;
    result.proofs.resize(num_shards);
    for (ShardId to_shard = 0; to_shard < num_shards; ++to_shard) {
      result.proofs[to_shard].from_shard = from_shard;
      result.proofs[to_shard].to_shard = to_shard;
    }
    for (const auto &receipt : receipts) {
      if (receipt.receiver_shard < num_shards) {
        result.proofs[receipt.receiver_shard].receipts.push_back(receipt);
      }
    }

    std::vector<MerkleHash> leaves;
    leaves.reserve(result.proofs.size());
    for (const auto &proof : result.proofs) {
      leaves.emplace_back(receiptLeaf(hasher, proof));
    }
    auto paths = merkle::computePaths(hasher, leaves);
    for (size_t i = 0; i < result.proofs.size(); ++i) {
      result.proofs[i].merkle_proof = std::move(paths[i]);
    }
    result.root = merkle::computeRoot(hasher, leaves);
    return result;
  }

  outcome::result<void> checkHeaderLayout(const ChunkHeader &header) {
    if (header.data_shard_count == 0
        or header.total_shard_count < header.data_shard_count
        or header.total_shard_count > ErasureCodec::kMaxShards) {
      return ChunkError::HEADER_MISMATCH;
    }
    auto expected_length =
        uint64_t{header.data_shard_count}
        * ErasureCodec::shardSizeFor(header.original_length,
                                     header.data_shard_count);
    if (header.encoded_length != expected_length) {
      return ChunkError::HEADER_MISMATCH;
    }
    return outcome::success();
  }

  outcome::result<void> verifyPart(const crypto::Hasher &hasher,
                                   const ChunkHeader &header,
                                   const ChunkPart &part) {
    if (part.index >= header.total_shard_count) {
      return ChunkError::INVALID_INDEX;
    }
    if (part.bytes.size() != header.shardSize()) {
      return ChunkError::PROOF_MISMATCH;
    }
    if (not merkle::verifyPath(hasher,
                               header.parts_root,
                               partLeaf(hasher, part),
                               part.index,
                               part.merkle_proof)) {
      return ChunkError::PROOF_MISMATCH;
    }
    return outcome::success();
  }

  outcome::result<void> verifyReceiptProof(const crypto::Hasher &hasher,
                                           const ChunkHeader &header,
                                           const ReceiptProof &proof,
                                           ShardId num_shards) {
    if (proof.to_shard >= num_shards) {
      return ChunkError::INVALID_INDEX;
    }
    if (proof.from_shard != header.shard_id) {
      return ChunkError::PROOF_MISMATCH;
    }
    if (not merkle::verifyPath(hasher,
                               header.receipts_root,
                               receiptLeaf(hasher, proof),
                               proof.to_shard,
                               proof.merkle_proof)) {
      return ChunkError::PROOF_MISMATCH;
    }
    return outcome::success();
  }

}  // namespace tessera::sharding
