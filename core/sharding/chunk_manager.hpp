/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <unordered_map>

#include "clock/clock.hpp"
#include "clock/timer.hpp"
#include "crypto/ed25519_provider.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "network/chunk_transport.hpp"
#include "sharding/chunk_cache.hpp"
#include "sharding/chunk_producer.hpp"
#include "sharding/request_tracker.hpp"
#include "sharding/validator_assignment.hpp"
#include "storage/chunk_store.hpp"
#include "utils/lru.hpp"
#include "utils/pool_handler.hpp"

namespace tessera::sharding {

  /**
   * Drives production, distribution and assembly of chunks.
   *
   * Events are handled on the main pool handler, which exclusively owns the
   * request bookkeeping. Signature checks, fragment verification, erasure
   * coding and persistence run on the worker pool handler. The chunk cache
   * is the only state shared between both.
   */
  class ChunkManager : public std::enable_shared_from_this<ChunkManager> {
   public:
    /// Invoked exactly once per chunk hash, when the chunk is complete
    using OnChunkComplete =
        std::function<void(const ChunkHeader &header,
                           const ChunkBody &body,
                           const std::vector<ReceiptProof> &receipt_proofs)>;

    using ProduceCallback = std::function<void(outcome::result<ChunkHash>)>;

    ChunkManager(const ChunksConfig &config,
                 std::shared_ptr<PoolHandler> main_pool_handler,
                 std::shared_ptr<PoolHandler> worker_pool_handler,
                 std::shared_ptr<clock::SteadyClock> clock,
                 std::shared_ptr<crypto::Hasher> hasher,
                 std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
                 std::shared_ptr<ErasureCodec> codec,
                 std::shared_ptr<ValidatorAssignment> assignment,
                 std::shared_ptr<ChunkCache> cache,
                 std::shared_ptr<ChunkProducer> producer,
                 std::shared_ptr<network::ChunkTransport> transport,
                 std::shared_ptr<storage::ChunkStore> store,
                 metrics::RegistryPtr metrics_registry,
                 OnChunkComplete on_chunk_complete);

    void start();
    void stop();

    /// Calls `onTick()` every `tick_interval` on the main pool handler
    void startTicking();

    /**
     * Produces the chunk of the local validator, stores it as complete and
     * sends every owner its parts
     */
    void produceChunk(ProductionRequest request, ProduceCallback callback);

    /// Single entry point of inbound chunk protocol messages
    void onMessage(const ValidatorId &from, network::ChunkMessage message);

    /// Retries expired requests, gives up unreachable chunks and releases
    /// production pins
    void onTick();

    const ValidatorId &localValidator() const {
      return producer_->localValidator();
    }

    ChunkState chunkState(const ChunkHash &hash) const {
      return cache_->state(hash);
    }

    /// Chunks under active assembly, main pool handler only
    size_t activeCount() const {
      return active_.size();
    }

    /// Outstanding requests, main pool handler only
    size_t pendingRequests() const {
      return tracker_.pendingCount();
    }

   private:
    /// Chunk with an accepted header being assembled, pinned in the cache
    struct ActiveChunk {
      ChunkHeader header;
      EpochId epoch;
      ShardId num_shards = 0;
      clock::SteadyClock::TimePoint started_at;
    };

    struct InsertOutcome {
      RequestId id;
      outcome::result<InsertResult> result;
    };

    using Completion = outcome::result<std::optional<CompletedChunk>>;

    // main pool handler
    void onProduced(outcome::result<ProducedChunk> produced,
                    ProduceCallback callback);
    void onHeaderAccepted(const ChunkHash &hash,
                          const ChunkHeader &header,
                          const EpochId &epoch,
                          ShardId num_shards,
                          ChunkState state,
                          Completion completion);
    void onInserted(const ValidatorId &from,
                    const ChunkHash &hash,
                    std::vector<InsertOutcome> outcomes,
                    Completion completion);
    void onBadResponse(const ValidatorId &from,
                       const ChunkHash &hash,
                       const RequestId &id);
    void onEvicted(const ChunkHash &hash);
    void handleProgress(const ChunkHash &hash, Completion completion);
    void onComplete(const ChunkHash &hash, CompletedChunk chunk);
    void fireCompletion(const ChunkHash &hash, const CompletedChunk &chunk);
    void failChunk(const ChunkHash &hash,
                   const std::error_code &error,
                   InvalidReason reason);
    void requestMissing(const ChunkHash &hash);
    void sendRequest(const ChunkHash &hash,
                     const RequestId &id,
                     const ValidatorId &target);
    ValidatorId partSource(const ActiveChunk &chunk, PartIndex index) const;
    void distribute(const ProducedChunk &chunk);
    void scheduleTick();
    void eraseActive(const ChunkHash &hash);

    // worker pool handler
    void validateHeader(const ValidatorId &from, ChunkHeader header);
    void insertParts(const ValidatorId &from, network::PartMessage message);
    void insertReceiptProofs(const ValidatorId &from,
                             network::ReceiptProofMessage message);
    void servePartRequest(const ValidatorId &from,
                          network::PartRequest request);
    void serveReceiptRequest(const ValidatorId &from,
                             network::ReceiptRequest request);
    outcome::result<std::pair<EpochId, ShardId>> checkHeader(
        const ChunkHash &hash, const ChunkHeader &header) const;
    Completion completeIfDecodable(const ChunkHash &hash);
    /// Stored chunks were completed before and never assembled again
    bool isStored(const ChunkHash &hash) const;
    outcome::result<std::vector<ChunkPart>> partsFromStore(
        const ChunkHash &hash, const std::vector<PartIndex> &indices) const;

    log::Logger logger_;
    const ChunksConfig &config_;
    std::shared_ptr<PoolHandler> main_pool_handler_;
    std::shared_ptr<PoolHandler> worker_pool_handler_;
    std::shared_ptr<clock::SteadyClock> clock_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    std::shared_ptr<ErasureCodec> codec_;
    std::shared_ptr<ValidatorAssignment> assignment_;
    std::shared_ptr<ChunkCache> cache_;
    std::shared_ptr<ChunkProducer> producer_;
    std::shared_ptr<network::ChunkTransport> transport_;
    std::shared_ptr<storage::ChunkStore> store_;
    OnChunkComplete on_chunk_complete_;

    // main pool handler
    RequestTracker tracker_;
    std::unordered_map<ChunkHash, ActiveChunk> active_;
    std::unordered_map<ChunkHash, clock::SteadyClock::TimePoint>
        production_pins_;
    LruSet<ChunkHash> completed_;
    std::unique_ptr<clock::Timer> timer_;

    // Metrics
    metrics::RegistryPtr metrics_registry_;
    metrics::Counter *metric_completed_;
    metrics::Counter *metric_requests_issued_;
    metrics::Counter *metric_requests_retried_;
    metrics::Counter *metric_requests_missing_;
    metrics::Gauge *metric_assembling_;
    metrics::Histogram *metric_assembly_time_;
  };

}  // namespace tessera::sharding
