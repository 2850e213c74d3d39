/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace tessera::sharding {

  enum class ErasureCodingError {
    /// data or total shard count is zero, or total is not above data
    INVALID_SHARD_COUNT = 1,
    /// more shards than the GF(2^16) coder is able to address
    TOO_MANY_SHARDS,
    /// less distinct parts than data shards
    INSUFFICIENT_PARTS,
    /// reconstruction disagrees with the declared lengths
    CORRUPT_PARTS,
    /// parts of different sizes, or sizes not matching encoded length
    INCONSISTENT_PART_SIZE,
    /// part index outside of [0, total shard count)
    INVALID_INDEX,
    /// the coder failed internally
    CODEC_FAILURE,
    /// payload needs more shards than allowed by configuration
    PAYLOAD_TOO_LARGE,
  };

}  // namespace tessera::sharding

OUTCOME_HPP_DECLARE_ERROR(tessera::sharding, ErasureCodingError)
