/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "sharding/validator_assignment.hpp"

#include <vector>

namespace tessera::sharding {

  /**
   * Single-epoch assignment over a fixed validator list. Parts and chunk
   * production rotate over the list round-robin, offset by shard id.
   */
  class StaticValidatorAssignment : public ValidatorAssignment {
   public:
    StaticValidatorAssignment(EpochId epoch,
                              std::vector<ValidatorId> validators,
                              ShardId num_shards);

    outcome::result<EpochId> epochOf(
        const BlockHash &prev_block_hash) const override;

    ShardId numShards(const EpochId &epoch) const override;

    /// Byzantine recovery threshold `(n - 1) / 3 + 1` of the validator set
    uint32_t dataShardCount(const EpochId &epoch,
                            ShardId shard) const override;

    ValidatorId ownerOf(const EpochId &epoch,
                        ShardId shard,
                        PartIndex part_index) const override;

    ValidatorId chunkProducer(const EpochId &epoch,
                              ShardId shard,
                              BlockHeight height) const override;

    const std::vector<ValidatorId> &validators() const {
      return validators_;
    }

   private:
    EpochId epoch_;
    std::vector<ValidatorId> validators_;
    ShardId num_shards_;
  };

}  // namespace tessera::sharding
