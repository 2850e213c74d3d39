/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "crypto/ed25519_provider.hpp"
#include "log/logger.hpp"
#include "sharding/chunk_header.hpp"
#include "sharding/chunks_config.hpp"
#include "sharding/erasure/erasure_codec.hpp"
#include "sharding/validator_assignment.hpp"

namespace tessera::sharding {

  struct ProductionRequest {
    ShardId shard_id = 0;
    BlockHeight height = 0;
    BlockHash prev_block_hash;
    StateRoot prev_state_root;
    std::vector<common::Buffer> transactions;
    std::vector<Receipt> outgoing_receipts;
  };

  struct ProducedChunk {
    ChunkHash hash;
    ChunkHeader header;
    ChunkBody body;
    /// All parts ordered by index, with proofs
    std::vector<ChunkPart> parts;
    /// One proof per shard of the epoch, ordered by target shard
    std::vector<ReceiptProof> receipt_proofs;
    ShardId num_shards = 0;
    /// Part indices each validator must receive
    std::map<ValidatorId, std::vector<PartIndex>> distribution;
  };

  /**
   * Builds and signs chunks of the local validator
   */
  class ChunkProducer {
   public:
    ChunkProducer(const ChunksConfig &config,
                  std::shared_ptr<crypto::Hasher> hasher,
                  std::shared_ptr<ErasureCodec> codec,
                  std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
                  std::shared_ptr<ValidatorAssignment> assignment,
                  crypto::Ed25519Keypair keypair);

    /**
     * Serializes the body, erasure-codes it, commits parts and receipts
     * into the header and signs it
     * @return ChunkError::UNKNOWN_PRODUCER if the local validator is not the
     * producer of the shard at this height
     */
    outcome::result<ProducedChunk> produce(
        const ProductionRequest &request) const;

    const ValidatorId &localValidator() const {
      return keypair_.public_key;
    }

   private:
    log::Logger logger_;
    const ChunksConfig &config_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<ErasureCodec> codec_;
    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    std::shared_ptr<ValidatorAssignment> assignment_;
    crypto::Ed25519Keypair keypair_;
  };

}  // namespace tessera::sharding
