/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "outcome/outcome.hpp"
#include "sharding/chunk_header.hpp"

namespace tessera::storage {

  /**
   * Persistent store of assembled chunks keyed by chunk hash
   */
  class ChunkStore {
   public:
    virtual ~ChunkStore() = default;

    /// Stores the chunk, overwriting a chunk stored under the same hash
    virtual outcome::result<void> put(
        const sharding::ChunkHash &hash,
        const sharding::FinalizedChunk &chunk) = 0;

    /// @return stored chunk or nullopt if absent
    virtual outcome::result<std::optional<sharding::FinalizedChunk>> get(
        const sharding::ChunkHash &hash) const = 0;

    /// @return true if a chunk is stored under the hash
    virtual outcome::result<bool> contains(
        const sharding::ChunkHash &hash) const = 0;
  };

}  // namespace tessera::storage
