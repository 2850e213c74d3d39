/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/chunk_producer.hpp"

#include "sharding/chunk_error.hpp"
#include "sharding/encoding/chunk_encoding.hpp"

namespace tessera::sharding {

  ChunkProducer::ChunkProducer(
      const ChunksConfig &config,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<ErasureCodec> codec,
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      std::shared_ptr<ValidatorAssignment> assignment,
      crypto::Ed25519Keypair keypair)
      : logger_{log::createLogger("ChunkProducer", "chunk_producer")},
        config_{config},
        hasher_{std::move(hasher)},
        codec_{std::move(codec)},
        ed25519_provider_{std::move(ed25519_provider)},
        assignment_{std::move(assignment)},
        keypair_{std::move(keypair)} {
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(codec_);
    BOOST_ASSERT(ed25519_provider_);
    BOOST_ASSERT(assignment_);
  }

  outcome::result<ProducedChunk> ChunkProducer::produce(
      const ProductionRequest &request) const {
    OUTCOME_TRY(epoch, assignment_->epochOf(request.prev_block_hash));
    if (assignment_->chunkProducer(epoch, request.shard_id, request.height)
        != keypair_.public_key) {
      SL_WARN(logger_,
              "Not a producer of shard {} at #{}",
              request.shard_id,
              request.height);
      return ChunkError::UNKNOWN_PRODUCER;
    }
    auto num_shards = assignment_->numShards(epoch);

    ProducedChunk chunk;
    chunk.num_shards = num_shards;
    chunk.body.prev_state_root = request.prev_state_root;
    chunk.body.transactions = request.transactions;
    chunk.body.outgoing_receipts = request.outgoing_receipts;

    common::Buffer payload{::scale::encode(chunk.body).value()};
    OUTCOME_TRY(
        layout,
        ErasureCodec::layoutFor(
            payload.size(),
            assignment_->dataShardCount(epoch, request.shard_id),
            config_));
    OUTCOME_TRY(parts,
                codec_->encode(payload,
                               layout.data_shard_count,
                               layout.total_shard_count));
    chunk.parts = std::move(parts);

    auto &header = chunk.header;
    header.shard_id = request.shard_id;
    header.height = request.height;
    header.prev_block_hash = request.prev_block_hash;
    header.parts_root = attachPartProofs(*hasher_, chunk.parts);
    auto receipts = makeReceiptProofs(
        *hasher_, request.shard_id, request.outgoing_receipts, num_shards);
    header.receipts_root = receipts.root;
    chunk.receipt_proofs = std::move(receipts.proofs);
    header.encoded_length = layout.encoded_length;
    header.original_length = payload.size();
    header.data_shard_count = layout.data_shard_count;
    header.total_shard_count = layout.total_shard_count;

    chunk.hash = chunkHash(*hasher_, header);
    OUTCOME_TRY(signature, ed25519_provider_->sign(keypair_, chunk.hash));
    header.signature = signature;

    for (const auto &part : chunk.parts) {
      chunk
          .distribution[assignment_->ownerOf(
              epoch, request.shard_id, part.index)]
          .push_back(part.index);
    }

    SL_DEBUG(logger_, "Produced chunk {}: {}", chunk.hash, header);
    return chunk;
  }

}  // namespace tessera::sharding
