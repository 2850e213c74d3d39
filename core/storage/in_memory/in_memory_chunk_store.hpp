/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_map>

#include "common/buffer.hpp"
#include "log/logger.hpp"
#include "storage/chunk_store.hpp"
#include "utils/safe_object.hpp"

namespace tessera::storage {

  /**
   * Chunk store keeping SCALE encoded chunks in memory.
   * Mostly needed for tests and the simulation.
   */
  class InMemoryChunkStore : public ChunkStore {
   public:
    InMemoryChunkStore();
    ~InMemoryChunkStore() override = default;

    outcome::result<void> put(const sharding::ChunkHash &hash,
                              const sharding::FinalizedChunk &chunk) override;

    outcome::result<std::optional<sharding::FinalizedChunk>> get(
        const sharding::ChunkHash &hash) const override;

    outcome::result<bool> contains(
        const sharding::ChunkHash &hash) const override;

    size_t size() const;

   private:
    log::Logger logger_;
    SafeObject<std::unordered_map<sharding::ChunkHash, common::Buffer>>
        storage_;
  };

}  // namespace tessera::storage
