/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_chunk_store.hpp"

#include "storage/database_error.hpp"

namespace tessera::storage {

  InMemoryChunkStore::InMemoryChunkStore()
      : logger_{log::createLogger("InMemoryChunkStore", "storage")} {}

  outcome::result<void> InMemoryChunkStore::put(
      const sharding::ChunkHash &hash, const sharding::FinalizedChunk &chunk) {
    OUTCOME_TRY(encoded, ::scale::encode(chunk));
    storage_.exclusiveAccess([&](auto &storage) {
      storage[hash] = common::Buffer{std::move(encoded)};
    });
    SL_TRACE(logger_, "Chunk {} stored", hash);
    return outcome::success();
  }

  outcome::result<std::optional<sharding::FinalizedChunk>>
  InMemoryChunkStore::get(const sharding::ChunkHash &hash) const {
    auto encoded = storage_.sharedAccess(
        [&](const auto &storage) -> std::optional<common::Buffer> {
          auto it = storage.find(hash);
          if (it == storage.end()) {
            return std::nullopt;
          }
          return it->second;
        });
    if (not encoded.has_value()) {
      return std::nullopt;
    }
    auto chunk = ::scale::decode<sharding::FinalizedChunk>(*encoded);
    if (chunk.has_error()) {
      SL_ERROR(logger_,
               "Chunk {} can not be decoded: {}",
               hash,
               chunk.error().message());
      return DatabaseError::CORRUPTION;
    }
    return std::move(chunk.value());
  }

  outcome::result<bool> InMemoryChunkStore::contains(
      const sharding::ChunkHash &hash) const {
    return storage_.sharedAccess(
        [&](const auto &storage) { return storage.contains(hash); });
  }

  size_t InMemoryChunkStore::size() const {
    return storage_.sharedAccess(
        [](const auto &storage) { return storage.size(); });
  }

}  // namespace tessera::storage
