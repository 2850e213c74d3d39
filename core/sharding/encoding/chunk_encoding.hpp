/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"
#include "sharding/chunk_header.hpp"

namespace tessera::sharding {

  /// Leaf of the parts tree: hash of the raw part bytes
  MerkleHash partLeaf(const crypto::Hasher &hasher, const ChunkPart &part);

  /// Leaf of the receipts tree: hash of `(from_shard, to_shard, receipts)`
  MerkleHash receiptLeaf(const crypto::Hasher &hasher,
                         const ReceiptProof &proof);

  /**
   * Attaches merkle proofs to `parts` ordered by index
   * @return parts root
   */
  MerkleHash attachPartProofs(const crypto::Hasher &hasher,
                              std::vector<ChunkPart> &parts);

  struct ReceiptProofs {
    MerkleHash root;
    /// One proof per target shard, index is the target shard
    std::vector<ReceiptProof> proofs;
  };

  /**
   * Groups `receipts` of `from_shard` by receiver shard and proves every
   * group against the receipts root. Receivers outside `[0, num_shards)`
   * are not addressable and are dropped.
   */
  ReceiptProofs makeReceiptProofs(const crypto::Hasher &hasher,
                                  ShardId from_shard,
                                  const std::vector<Receipt> &receipts,
                                  ShardId num_shards);

  /**
   * Checks that the declared shard counts and lengths describe a layout the
   * codec produces
   * @return ChunkError::HEADER_MISMATCH otherwise
   */
  outcome::result<void> checkHeaderLayout(const ChunkHeader &header);

  /**
   * @return ChunkError::INVALID_INDEX if the part is outside the declared
   * layout, ChunkError::PROOF_MISMATCH if its size or proof disagree with
   * the header
   */
  outcome::result<void> verifyPart(const crypto::Hasher &hasher,
                                   const ChunkHeader &header,
                                   const ChunkPart &part);

  /**
   * @return ChunkError::INVALID_INDEX if the target shard is outside
   * `[0, num_shards)`, ChunkError::PROOF_MISMATCH if the proof does not
   * belong to the chunk
   */
  outcome::result<void> verifyReceiptProof(const crypto::Hasher &hasher,
                                           const ChunkHeader &header,
                                           const ReceiptProof &proof,
                                           ShardId num_shards);

}  // namespace tessera::sharding
