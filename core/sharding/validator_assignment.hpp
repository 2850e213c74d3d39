/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "sharding/types.hpp"

namespace tessera::sharding {

  /**
   * Read-only view of epoch validator assignments. Implementations are pure
   * lookups and may be queried from any thread.
   */
  class ValidatorAssignment {
   public:
    virtual ~ValidatorAssignment() = default;

    /// Epoch that a chunk built on top of `prev_block_hash` belongs to
    virtual outcome::result<EpochId> epochOf(
        const BlockHash &prev_block_hash) const = 0;

    /// Number of shards in the epoch
    virtual ShardId numShards(const EpochId &epoch) const = 0;

    /// Minimal number of data shards of chunks of `shard`
    virtual uint32_t dataShardCount(const EpochId &epoch,
                                    ShardId shard) const = 0;

    /// Validator responsible for holding and forwarding the part
    virtual ValidatorId ownerOf(const EpochId &epoch,
                                ShardId shard,
                                PartIndex part_index) const = 0;

    /// Validator expected to produce and sign the chunk
    virtual ValidatorId chunkProducer(const EpochId &epoch,
                                      ShardId shard,
                                      BlockHeight height) const = 0;
  };

}  // namespace tessera::sharding
