/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/impl/static_validator_assignment.hpp"

#include <boost/assert.hpp>

namespace tessera::sharding {

  StaticValidatorAssignment::StaticValidatorAssignment(
      EpochId epoch, std::vector<ValidatorId> validators, ShardId num_shards)
      : epoch_{epoch},
        validators_{std::move(validators)},
        num_shards_{num_shards} {
    BOOST_ASSERT(not validators_.empty());
    BOOST_ASSERT(num_shards_ > 0);
  }

  outcome::result<EpochId> StaticValidatorAssignment::epochOf(
      const BlockHash &) const {
    return epoch_;
  }

  ShardId StaticValidatorAssignment::numShards(const EpochId &) const {
    return num_shards_;
  }

  uint32_t StaticValidatorAssignment::dataShardCount(const EpochId &,
                                                     ShardId) const {
    return static_cast<uint32_t>((validators_.size() - 1) / 3 + 1);
  }

  ValidatorId StaticValidatorAssignment::ownerOf(const EpochId &,
                                                 ShardId shard,
                                                 PartIndex part_index) const {
    return validators_[(shard + part_index) % validators_.size()];
  }

  ValidatorId StaticValidatorAssignment::chunkProducer(
      const EpochId &, ShardId shard, BlockHeight height) const {
    return validators_[(shard + height) % validators_.size()];
  }

}  // namespace tessera::sharding
