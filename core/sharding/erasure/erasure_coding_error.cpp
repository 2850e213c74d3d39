/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/erasure/erasure_coding_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::sharding, ErasureCodingError, e) {
  using E = tessera::sharding::ErasureCodingError;
  switch (e) {
    case E::INVALID_SHARD_COUNT:
      return "Invalid number of data or parity shards";
    case E::TOO_MANY_SHARDS:
      return "Number of shards exceeds the coder limit";
    case E::INSUFFICIENT_PARTS:
      return "Not enough distinct parts to reconstruct the payload";
    case E::CORRUPT_PARTS:
      return "Reconstructed payload disagrees with the declared lengths";
    case E::INCONSISTENT_PART_SIZE:
      return "Parts have inconsistent sizes";
    case E::INVALID_INDEX:
      return "Part index is out of the declared range";
    case E::CODEC_FAILURE:
      return "Internal erasure coder failure";
    case E::PAYLOAD_TOO_LARGE:
      return "Payload requires more shards than allowed";
  }
  return "Unknown erasure coding error";
}
