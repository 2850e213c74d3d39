/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace tessera::sharding {

  enum class ChunkError {
    INVALID_INDEX = 1,
    PROOF_MISMATCH,
    SIGNATURE_INVALID,
    HEADER_MISMATCH,
    CHUNK_INVALID,
    CHUNK_FINISHED,
    UNKNOWN_CHUNK,
    REQUEST_TIMEOUT,
    UNREACHABLE,
    PAYLOAD_MISMATCH,
    UNKNOWN_PRODUCER,
  };

}  // namespace tessera::sharding

OUTCOME_HPP_DECLARE_ERROR(tessera::sharding, ChunkError)
