/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/chunk_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::sharding, ChunkError, e) {
  using E = tessera::sharding::ChunkError;
  switch (e) {
    case E::INVALID_INDEX:
      return "Fragment index is out of the declared bounds";
    case E::PROOF_MISMATCH:
      return "Merkle proof does not match the header root";
    case E::SIGNATURE_INVALID:
      return "Chunk header signature is invalid";
    case E::HEADER_MISMATCH:
      return "Chunk header does not match the expected layout or epoch";
    case E::CHUNK_INVALID:
      return "Chunk is invalid";
    case E::CHUNK_FINISHED:
      return "Chunk was already completed or rejected";
    case E::UNKNOWN_CHUNK:
      return "Chunk is not known";
    case E::REQUEST_TIMEOUT:
      return "Request timed out";
    case E::UNREACHABLE:
      return "Not enough reachable parts to reconstruct the chunk";
    case E::PAYLOAD_MISMATCH:
      return "Decoded payload does not match the header";
    case E::UNKNOWN_PRODUCER:
      return "This node is not the producer of the chunk";
  }
  return "Unknown chunk error";
}
