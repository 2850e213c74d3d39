/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <mutex>
#include <unordered_map>

#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "sharding/erasure/erasure_codec.hpp"
#include "sharding/partial_chunk.hpp"
#include "utils/lru.hpp"
#include "utils/safe_object.hpp"

namespace tessera::sharding {

  /**
   * Bounded store of chunks under assembly and recently completed chunks,
   * keyed by chunk hash.
   *
   * Membership and recency are guarded by one mutex, every chunk has its own
   * mutex serializing all operations on it. Least recently touched entries
   * are evicted once the entry count or the byte budget is exceeded; pinned
   * entries are never evicted. Hashes of evicted complete or invalid chunks
   * are remembered and never admitted again.
   */
  class ChunkCache {
   public:
    struct Entry {
      Entry(const ChunkHash &hash,
            const ChunksConfig &config,
            std::shared_ptr<crypto::Hasher> hasher)
          : chunk{hash, config, std::move(hasher)} {}

      SafeObject<PartialChunk, std::mutex> chunk;

      /// mirrors `PartialChunk::state()`, readable without the chunk lock
      std::atomic<ChunkState> state = ChunkState::AwaitingHeader;

      // guarded by the cache mutex
      size_t bytes = 0;
      size_t pins = 0;
      bool evicted = false;
      std::list<ChunkHash>::iterator recency;
    };
    using Handle = std::shared_ptr<Entry>;

    /// Called for every evicted chunk hash, outside of cache locks
    using EvictionListener = std::function<void(const ChunkHash &)>;

    ChunkCache(const ChunksConfig &config,
               std::shared_ptr<crypto::Hasher> hasher,
               std::shared_ptr<ErasureCodec> codec,
               metrics::RegistryPtr metrics_registry);

    void setEvictionListener(EvictionListener listener);

    /**
     * @return entry of the chunk, created if absent;
     * ChunkError::CHUNK_FINISHED for a remembered finished chunk
     */
    outcome::result<Handle> getOrCreate(const ChunkHash &hash);

    /// @return state after the header is applied
    outcome::result<ChunkState> setHeader(const ChunkHash &hash,
                                          const ChunkHeader &header,
                                          ShardId num_shards);

    /**
     * @return insertion result;
     * ChunkError::CHUNK_INVALID if the chunk was rejected,
     * ChunkError::CHUNK_FINISHED if it was finished and evicted
     */
    outcome::result<InsertResult> insertPart(const ChunkHash &hash,
                                             ChunkPart part,
                                             const ValidatorId &sender);

    outcome::result<InsertResult> insertReceiptProof(
        const ChunkHash &hash, ReceiptProof proof, const ValidatorId &sender);

    /**
     * Decodes the chunk once it is decodable
     * @return completed chunk exactly once per chunk, nullopt while
     * incomplete; a decoding error rejects the chunk
     */
    outcome::result<std::optional<CompletedChunk>> tryComplete(
        const ChunkHash &hash);

    /// Stores a locally produced chunk as complete
    outcome::result<void> insertProduced(
        const ChunkHash &hash,
        const ChunkHeader &header,
        ShardId num_shards,
        std::vector<ChunkPart> parts,
        std::vector<ReceiptProof> receipt_proofs);

    /// Evicts least recently touched unpinned entries until within budget
    void evictIfOverBudget();

    outcome::result<void> pin(const ChunkHash &hash);
    void unpin(const ChunkHash &hash);

    void markInvalid(const ChunkHash &hash, InvalidReason reason);

    /// `Unknown` for absent or forgotten chunks, last state of remembered ones
    ChunkState state(const ChunkHash &hash) const;

    std::optional<InvalidReason> invalidReason(const ChunkHash &hash) const;

    std::optional<ChunkHeader> header(const ChunkHash &hash) const;

    /// Held parts among `indices`, all held parts if `indices` is empty
    std::vector<ChunkPart> partsFor(const ChunkHash &hash,
                                    const std::vector<PartIndex> &indices) const;

    /// Held receipt proofs to `to_shards`, all if `to_shards` is empty
    std::vector<ReceiptProof> receiptProofsFor(
        const ChunkHash &hash, const std::vector<ShardId> &to_shards) const;

    /// Indices of held parts
    std::vector<PartIndex> heldParts(const ChunkHash &hash) const;

    size_t size() const;
    size_t bytes() const;
    bool contains(const ChunkHash &hash) const;
    bool isPinned(const ChunkHash &hash) const;

   private:
    Handle find(const ChunkHash &hash) const;
    std::optional<ChunkState> finishedState(const ChunkHash &hash) const;
    outcome::result<Handle> existing(const ChunkHash &hash) const;

    /// Runs `f` on the chunk under its lock and accounts its new size
    template <typename F>
    auto modify(const Handle &entry, F &&f);

    /// Requires `mutex_` held
    void updateSizeMetrics();

    log::Logger logger_;
    const ChunksConfig &config_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<ErasureCodec> codec_;

    mutable std::mutex mutex_;
    std::unordered_map<ChunkHash, Handle> entries_;
    /// most recently touched first
    std::list<ChunkHash> recency_;
    size_t bytes_ = 0;
    /// finished hashes and their final state
    mutable Lru<ChunkHash, ChunkState> finished_;

    std::mutex listener_mutex_;
    EvictionListener on_evicted_;

    metrics::RegistryPtr metrics_registry_;
    metrics::Gauge *metric_entries_;
    metrics::Gauge *metric_bytes_;
    metrics::Counter *metric_evictions_;
    std::unordered_map<InvalidReason, metrics::Counter *> metric_invalid_;
  };

}  // namespace tessera::sharding
