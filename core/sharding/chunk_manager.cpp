/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/chunk_manager.hpp"

#include <algorithm>
#include <map>

#include "clock/impl/basic_waitable_timer.hpp"
#include "common/visitor.hpp"
#include "sharding/chunk_error.hpp"
#include "sharding/encoding/chunk_encoding.hpp"

namespace {
  constexpr auto completedMetricName = "tessera_chunks_completed_total";
  constexpr auto requestsMetricName = "tessera_chunk_fragment_requests_total";
  constexpr auto assemblingMetricName = "tessera_chunks_assembling";
  constexpr auto assemblyTimeMetricName = "tessera_chunk_assembly_seconds";
}  // namespace

namespace tessera::sharding {

  ChunkManager::ChunkManager(
      const ChunksConfig &config,
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
      OnChunkComplete on_chunk_complete)
      : logger_{log::createLogger("ChunkManager", "chunk_manager")},
        config_{config},
        main_pool_handler_{std::move(main_pool_handler)},
        worker_pool_handler_{std::move(worker_pool_handler)},
        clock_{std::move(clock)},
        hasher_{std::move(hasher)},
        ed25519_provider_{std::move(ed25519_provider)},
        codec_{std::move(codec)},
        assignment_{std::move(assignment)},
        cache_{std::move(cache)},
        producer_{std::move(producer)},
        transport_{std::move(transport)},
        store_{std::move(store)},
        on_chunk_complete_{std::move(on_chunk_complete)},
        tracker_{config},
        completed_{std::max<size_t>(config.finished_memory, 1)},
        metrics_registry_{std::move(metrics_registry)} {
    BOOST_ASSERT(main_pool_handler_);
    BOOST_ASSERT(worker_pool_handler_);
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(ed25519_provider_);
    BOOST_ASSERT(codec_);
    BOOST_ASSERT(assignment_);
    BOOST_ASSERT(cache_);
    BOOST_ASSERT(producer_);
    BOOST_ASSERT(transport_);
    BOOST_ASSERT(store_);
    BOOST_ASSERT(metrics_registry_);

    metrics_registry_->registerCounterFamily(
        completedMetricName, "Number of chunks completed by this node");
    metric_completed_ =
        metrics_registry_->registerCounterMetric(completedMetricName);

    metrics_registry_->registerCounterFamily(
        requestsMetricName, "Number of fragment requests, by outcome");
    metric_requests_issued_ = metrics_registry_->registerCounterMetric(
        requestsMetricName, {{"outcome", "issued"}});
    metric_requests_retried_ = metrics_registry_->registerCounterMetric(
        requestsMetricName, {{"outcome", "retried"}});
    metric_requests_missing_ = metrics_registry_->registerCounterMetric(
        requestsMetricName, {{"outcome", "missing"}});

    metrics_registry_->registerGaugeFamily(
        assemblingMetricName, "Number of chunks under assembly");
    metric_assembling_ =
        metrics_registry_->registerGaugeMetric(assemblingMetricName);

    metrics_registry_->registerHistogramFamily(
        assemblyTimeMetricName,
        "Time from accepting a chunk header to completing the chunk");
    metric_assembly_time_ = metrics_registry_->registerHistogramMetric(
        assemblyTimeMetricName, metrics::exponentialBuckets(0.01, 2, 12));
  }

  void ChunkManager::start() {
    cache_->setEvictionListener(
        [weak{weak_from_this()}](const ChunkHash &hash) {
          if (auto self = weak.lock()) {
            self->onEvicted(hash);
          }
        });
    main_pool_handler_->start();
    worker_pool_handler_->start();
    SL_DEBUG(logger_, "Started as validator {}", localValidator());
  }

  void ChunkManager::stop() {
    if (timer_) {
      timer_->cancel();
    }
    main_pool_handler_->stop();
    worker_pool_handler_->stop();
  }

  void ChunkManager::startTicking() {
    REINVOKE(*main_pool_handler_, startTicking);
    if (timer_) {
      return;
    }
    timer_ = std::make_unique<clock::BasicWaitableTimer>(
        main_pool_handler_->io_context());
    scheduleTick();
  }

  void ChunkManager::scheduleTick() {
    timer_->expiresAfter(config_.tick_interval);
    timer_->asyncWait(
        [weak{weak_from_this()}](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          if (auto self = weak.lock()) {
            self->onTick();
            self->scheduleTick();
          }
        });
  }

  void ChunkManager::produceChunk(ProductionRequest request,
                                  ProduceCallback callback) {
    REINVOKE(*worker_pool_handler_,
             produceChunk,
             std::move(request),
             std::move(callback));

    auto produced = producer_->produce(request);
    if (produced.has_value()) {
      const auto &chunk = produced.value();
      if (auto res = cache_->insertProduced(chunk.hash,
                                            chunk.header,
                                            chunk.num_shards,
                                            chunk.parts,
                                            chunk.receipt_proofs);
          res.has_error()) {
        SL_WARN(logger_,
                "Produced chunk {} of shard {} not cached: {}",
                chunk.hash,
                chunk.header.shard_id,
                res.error().message());
      }
      if (auto res = store_->put(
              chunk.hash,
              FinalizedChunk{chunk.header, chunk.body, chunk.receipt_proofs});
          res.has_error()) {
        SL_ERROR(logger_,
                 "Produced chunk {} of shard {} not stored: {}",
                 chunk.hash,
                 chunk.header.shard_id,
                 res.error().message());
      }
    }
    onProduced(std::move(produced), std::move(callback));
  }

  void ChunkManager::onProduced(outcome::result<ProducedChunk> produced,
                                ProduceCallback callback) {
    REINVOKE(*main_pool_handler_,
             onProduced,
             std::move(produced),
             std::move(callback));

    if (produced.has_error()) {
      SL_ERROR(logger_,
               "Chunk production failed: {}",
               produced.error().message());
      if (callback) {
        callback(produced.as_failure());
      }
      return;
    }
    const auto &chunk = produced.value();

    if (not production_pins_.contains(chunk.hash)) {
      if (auto res = cache_->pin(chunk.hash); res.has_value()) {
        production_pins_.emplace(
            chunk.hash, clock_->now() + config_.production_pin_duration);
      } else {
        SL_DEBUG(logger_,
                 "Produced chunk {} is not pinned: {}",
                 chunk.hash,
                 res.error().message());
      }
    }

    fireCompletion(
        chunk.hash,
        CompletedChunk{chunk.header, chunk.body, chunk.receipt_proofs});
    distribute(chunk);

    if (callback) {
      callback(chunk.hash);
    }
  }

  void ChunkManager::distribute(const ProducedChunk &chunk) {
    const auto &local = localValidator();
    for (const auto &[validator, indices] : chunk.distribution) {
      if (validator == local) {
        continue;
      }
      network::PartMessage parts{.chunk_hash = chunk.hash};
      for (auto index : indices) {
        parts.parts.push_back(chunk.parts.at(index));
      }
      transport_->send(validator, network::HeaderMessage{chunk.header});
      transport_->send(validator, std::move(parts));
      transport_->send(
          validator,
          network::ReceiptProofMessage{.chunk_hash = chunk.hash,
                                       .proofs = chunk.receipt_proofs});
    }
    SL_DEBUG(logger_,
             "Chunk {} of shard {} sent to {} validators",
             chunk.hash,
             chunk.header.shard_id,
             chunk.distribution.size());
  }

  void ChunkManager::onMessage(const ValidatorId &from,
                               network::ChunkMessage message) {
    REINVOKE(*main_pool_handler_, onMessage, from, std::move(message));

    visit_in_place(
        message,
        [&](network::HeaderMessage &msg) {
          SL_TRACE(logger_, "Header {} from {}", msg.header, from);
          validateHeader(from, std::move(msg.header));
        },
        [&](network::PartMessage &msg) {
          SL_TRACE(logger_,
                   "{} parts of chunk {} from {}",
                   msg.parts.size(),
                   msg.chunk_hash,
                   from);
          insertParts(from, std::move(msg));
        },
        [&](network::ReceiptProofMessage &msg) {
          SL_TRACE(logger_,
                   "{} receipt proofs of chunk {} from {}",
                   msg.proofs.size(),
                   msg.chunk_hash,
                   from);
          insertReceiptProofs(from, std::move(msg));
        },
        [&](network::PartRequest &msg) {
          servePartRequest(from, std::move(msg));
        },
        [&](network::ReceiptRequest &msg) {
          serveReceiptRequest(from, std::move(msg));
        });
  }

  outcome::result<std::pair<EpochId, ShardId>> ChunkManager::checkHeader(
      const ChunkHash &hash, const ChunkHeader &header) const {
    auto epoch_res = assignment_->epochOf(header.prev_block_hash);
    if (epoch_res.has_error()) {
      return ChunkError::HEADER_MISMATCH;
    }
    const auto &epoch = epoch_res.value();
    auto num_shards = assignment_->numShards(epoch);
    if (header.shard_id >= num_shards
        or header.total_shard_count > config_.max_total_shards) {
      return ChunkError::HEADER_MISMATCH;
    }
    OUTCOME_TRY(checkHeaderLayout(header));
    if (header.data_shard_count
        < assignment_->dataShardCount(epoch, header.shard_id)) {
      return ChunkError::HEADER_MISMATCH;
    }

    auto producer =
        assignment_->chunkProducer(epoch, header.shard_id, header.height);
    auto valid = ed25519_provider_->verify(header.signature, hash, producer);
    if (valid.has_error() or not valid.value()) {
      return ChunkError::SIGNATURE_INVALID;
    }
    return std::make_pair(epoch, num_shards);
  }

  void ChunkManager::validateHeader(const ValidatorId &from,
                                    ChunkHeader header) {
    REINVOKE(*worker_pool_handler_, validateHeader, from, std::move(header));

    auto hash = chunkHash(*hasher_, header);
    auto checked = checkHeader(hash, header);
    if (checked.has_error()) {
      SL_WARN(logger_,
              "Header of chunk {} of shard {} from {} rejected: {}",
              hash,
              header.shard_id,
              from,
              checked.error().message());
      return;
    }
    auto [epoch, num_shards] = checked.value();

    if (isStored(hash)) {
      SL_TRACE(logger_, "Chunk {} is already stored", hash);
      return;
    }

    auto state = cache_->setHeader(hash, header, num_shards);
    if (state.has_error()) {
      if (state.error() != ChunkError::CHUNK_FINISHED) {
        SL_WARN(logger_,
                "Header of chunk {} of shard {} not applied: {}",
                hash,
                header.shard_id,
                state.error().message());
      }
      return;
    }
    auto completion = completeIfDecodable(hash);
    onHeaderAccepted(
        hash, header, epoch, num_shards, state.value(), std::move(completion));
  }

  void ChunkManager::onHeaderAccepted(const ChunkHash &hash,
                                      const ChunkHeader &header,
                                      const EpochId &epoch,
                                      ShardId num_shards,
                                      ChunkState state,
                                      Completion completion) {
    REINVOKE(*main_pool_handler_,
             onHeaderAccepted,
             hash,
             header,
             epoch,
             num_shards,
             state,
             std::move(completion));

    if ((state == ChunkState::AwaitingParts or state == ChunkState::Decodable)
        and not active_.contains(hash) and not completed_.has(hash)) {
      if (auto res = cache_->pin(hash); res.has_error()) {
        SL_DEBUG(logger_, "Chunk {} evicted before pinning", hash);
        return;
      }
      active_.emplace(hash,
                      ActiveChunk{
                          .header = header,
                          .epoch = epoch,
                          .num_shards = num_shards,
                          .started_at = clock_->now(),
                      });
      metric_assembling_->set(active_.size());
      SL_DEBUG(logger_, "Assembling chunk {}: {}", hash, header);
    }
    handleProgress(hash, std::move(completion));
  }

  bool ChunkManager::isStored(const ChunkHash &hash) const {
    auto stored = store_->contains(hash);
    if (stored.has_error()) {
      SL_WARN(logger_,
              "Can't look up chunk {} in the store: {}",
              hash,
              stored.error().message());
      return false;
    }
    return stored.value();
  }

  ChunkManager::Completion ChunkManager::completeIfDecodable(
      const ChunkHash &hash) {
    if (cache_->state(hash) != ChunkState::Decodable) {
      return std::nullopt;
    }
    auto completion = cache_->tryComplete(hash);
    if (completion.has_value() and completion.value().has_value()) {
      const auto &chunk = completion.value().value();
      if (auto res = store_->put(hash, chunk); res.has_error()) {
        SL_ERROR(logger_,
                 "Chunk {} of shard {} not stored: {}",
                 hash,
                 chunk.header.shard_id,
                 res.error().message());
      }
    }
    return completion;
  }

  void ChunkManager::insertParts(const ValidatorId &from,
                                 network::PartMessage message) {
    REINVOKE(*worker_pool_handler_, insertParts, from, std::move(message));

    const auto &hash = message.chunk_hash;
    std::vector<InsertOutcome> outcomes;
    outcomes.reserve(message.parts.size());
    for (auto &part : message.parts) {
      PartRequestId id{part.index};
      outcomes.push_back(InsertOutcome{
          .id = id,
          .result = cache_->insertPart(hash, std::move(part), from),
      });
    }
    auto completion = completeIfDecodable(hash);
    onInserted(from, hash, std::move(outcomes), std::move(completion));
  }

  void ChunkManager::insertReceiptProofs(
      const ValidatorId &from, network::ReceiptProofMessage message) {
    REINVOKE(
        *worker_pool_handler_, insertReceiptProofs, from, std::move(message));

    const auto &hash = message.chunk_hash;
    std::vector<InsertOutcome> outcomes;
    outcomes.reserve(message.proofs.size());
    for (auto &proof : message.proofs) {
      ReceiptRequestId id{proof.to_shard};
      outcomes.push_back(InsertOutcome{
          .id = id,
          .result = cache_->insertReceiptProof(hash, std::move(proof), from),
      });
    }
    auto completion = completeIfDecodable(hash);
    onInserted(from, hash, std::move(outcomes), std::move(completion));
  }

  void ChunkManager::onInserted(const ValidatorId &from,
                                const ChunkHash &hash,
                                std::vector<InsertOutcome> outcomes,
                                Completion completion) {
    REINVOKE(*main_pool_handler_,
             onInserted,
             from,
             hash,
             std::move(outcomes),
             std::move(completion));

    for (const auto &outcome : outcomes) {
      if (outcome.result.has_error()) {
        SL_TRACE(logger_,
                 "Chunk {}: {} from {} dropped: {}",
                 hash,
                 outcome.id,
                 from,
                 outcome.result.error().message());
        continue;
      }
      switch (outcome.result.value()) {
        case InsertResult::Accepted:
        case InsertResult::Duplicate:
          tracker_.deliver(hash, outcome.id);
          break;
        case InsertResult::InvalidIndex:
        case InsertResult::ProofMismatch:
          onBadResponse(from, hash, outcome.id);
          break;
        case InsertResult::Buffered:
          break;
        case InsertResult::Dropped:
          SL_DEBUG(logger_,
                   "Chunk {}: {} from {} dropped, too many fragments precede "
                   "the header",
                   hash,
                   outcome.id,
                   from);
          break;
      }
    }
    handleProgress(hash, std::move(completion));
  }

  void ChunkManager::onBadResponse(const ValidatorId &from,
                                   const ChunkHash &hash,
                                   const RequestId &id) {
    auto header = cache_->header(hash);
    auto shard = header.has_value() ? header->shard_id : ShardId{0};
    SL_WARN(logger_,
            "Chunk {} of shard {}: {} from {} failed verification",
            hash,
            shard,
            id,
            from);

    auto pending = tracker_.pending(hash, id);
    if (not pending.has_value() or pending->target != from) {
      return;
    }
    // sent again by `onTick` once the backoff of the failed attempt passes
    if (auto retry = tracker_.fail(hash, id, clock_->now())) {
      SL_DEBUG(logger_,
               "Chunk {}: {} from {} postponed for {} ms",
               hash,
               id,
               from,
               tracker_.backoff(retry->retry_count).count());
    }
  }

  void ChunkManager::handleProgress(const ChunkHash &hash,
                                    Completion completion) {
    if (completion.has_error()) {
      failChunk(hash, completion.error(), InvalidReason::CorruptParts);
      return;
    }
    if (completion.value().has_value()) {
      onComplete(hash, std::move(completion.value().value()));
      return;
    }
    auto state = cache_->state(hash);
    if (state == ChunkState::Invalid) {
      failChunk(hash, ChunkError::CHUNK_INVALID, InvalidReason::ProofFailures);
      return;
    }
    if (state == ChunkState::AwaitingParts) {
      requestMissing(hash);
    }
  }

  void ChunkManager::onComplete(const ChunkHash &hash, CompletedChunk chunk) {
    tracker_.cancel(hash);
    if (auto it = active_.find(hash); it != active_.end()) {
      std::chrono::duration<double> elapsed =
          clock_->now() - it->second.started_at;
      metric_assembly_time_->observe(elapsed.count());
      eraseActive(hash);
      cache_->unpin(hash);
    }
    fireCompletion(hash, chunk);
  }

  void ChunkManager::fireCompletion(const ChunkHash &hash,
                                    const CompletedChunk &chunk) {
    if (not completed_.add(hash)) {
      return;
    }
    metric_completed_->inc();
    SL_INFO(logger_,
            "Chunk {} of shard {} #{} is complete",
            hash,
            chunk.header.shard_id,
            chunk.header.height);
    if (on_chunk_complete_) {
      on_chunk_complete_(chunk.header, chunk.body, chunk.receipt_proofs);
    }
  }

  void ChunkManager::failChunk(const ChunkHash &hash,
                               const std::error_code &error,
                               InvalidReason reason) {
    cache_->markInvalid(hash, reason);
    tracker_.cancel(hash);
    auto it = active_.find(hash);
    std::optional<ShardId> shard;
    if (it != active_.end()) {
      shard = it->second.header.shard_id;
    } else if (auto header = cache_->header(hash)) {
      shard = header->shard_id;
    }
    SL_WARN(logger_,
            "Chunk {} of shard {} failed: {}",
            hash,
            shard.has_value() ? fmt::to_string(*shard) : "unknown",
            error.message());
    if (it == active_.end()) {
      return;
    }
    eraseActive(hash);
    cache_->unpin(hash);
  }

  void ChunkManager::eraseActive(const ChunkHash &hash) {
    active_.erase(hash);
    metric_assembling_->set(active_.size());
  }

  ValidatorId ChunkManager::partSource(const ActiveChunk &chunk,
                                       PartIndex index) const {
    auto owner =
        assignment_->ownerOf(chunk.epoch, chunk.header.shard_id, index);
    if (owner != localValidator()) {
      return owner;
    }
    return assignment_->chunkProducer(
        chunk.epoch, chunk.header.shard_id, chunk.header.height);
  }

  void ChunkManager::requestMissing(const ChunkHash &hash) {
    auto it = active_.find(hash);
    if (it == active_.end()) {
      return;
    }
    const auto &chunk = it->second;
    const auto &header = chunk.header;

    auto held = cache_->heldParts(hash);
    if (tracker_.isUnreachable(
            hash, header.data_shard_count, header.total_shard_count, held)) {
      failChunk(hash, ChunkError::UNREACHABLE, InvalidReason::Unreachable);
      return;
    }

    auto now = clock_->now();
    std::map<ValidatorId, network::PartRequest> part_requests;
    for (auto index : tracker_.selectParts(
             hash, header.data_shard_count, header.total_shard_count, held)) {
      auto target = partSource(chunk, index);
      auto &request = part_requests[target];
      request.chunk_hash = hash;
      request.indices.push_back(index);
      tracker_.issue(hash, PartRequestId{index}, target, now);
      metric_requests_issued_->inc();
    }
    for (auto &[target, request] : part_requests) {
      SL_TRACE(logger_,
               "Chunk {}: requesting {} parts from {}",
               hash,
               request.indices.size(),
               target);
      transport_->send(target, std::move(request));
    }

    std::vector<ShardId> held_receipts;
    for (const auto &proof : cache_->receiptProofsFor(hash, {})) {
      held_receipts.push_back(proof.to_shard);
    }
    auto to_shards = tracker_.selectReceipts(
        hash, config_.tracked_shards, chunk.num_shards, held_receipts);
    if (to_shards.empty()) {
      return;
    }
    auto producer = assignment_->chunkProducer(
        chunk.epoch, header.shard_id, header.height);
    for (auto shard : to_shards) {
      tracker_.issue(hash, ReceiptRequestId{shard}, producer, now);
      metric_requests_issued_->inc();
    }
    transport_->send(producer,
                     network::ReceiptRequest{.chunk_hash = hash,
                                             .to_shards = std::move(to_shards)});
  }

  void ChunkManager::sendRequest(const ChunkHash &hash,
                                 const RequestId &id,
                                 const ValidatorId &target) {
    visit_in_place(
        id,
        [&](const PartRequestId &part) {
          transport_->send(target,
                           network::PartRequest{.chunk_hash = hash,
                                                .indices = {part.index}});
        },
        [&](const ReceiptRequestId &receipt) {
          transport_->send(
              target,
              network::ReceiptRequest{.chunk_hash = hash,
                                      .to_shards = {receipt.to_shard}});
        });
  }

  void ChunkManager::onTick() {
    REINVOKE(*main_pool_handler_, onTick);

    auto now = clock_->now();
    auto expired = tracker_.expired(now);
    for (const auto &retry : expired.retries) {
      SL_DEBUG(logger_,
               "Chunk {}: {} sent again to {}, retry {}",
               retry.hash,
               retry.id,
               retry.request.target,
               retry.request.retry_count);
      sendRequest(retry.hash, retry.id, retry.request.target);
    }
    metric_requests_retried_->inc(expired.retries.size());
    for (const auto &missing : expired.missing) {
      SL_DEBUG(logger_,
               "Chunk {}: {} is out of retries",
               missing.hash,
               missing.id);
    }
    metric_requests_missing_->inc(expired.missing.size());

    std::vector<ChunkHash> active;
    active.reserve(active_.size());
    for (const auto &[hash, _] : active_) {
      active.push_back(hash);
    }
    for (const auto &hash : active) {
      switch (cache_->state(hash)) {
        case ChunkState::Invalid:
          failChunk(
              hash, ChunkError::CHUNK_INVALID, InvalidReason::ProofFailures);
          break;
        case ChunkState::AwaitingParts:
          requestMissing(hash);
          break;
        default:
          break;
      }
    }

    for (auto it = production_pins_.begin(); it != production_pins_.end();) {
      if (now < it->second) {
        ++it;
        continue;
      }
      SL_TRACE(logger_, "Production pin of chunk {} released", it->first);
      cache_->unpin(it->first);
      it = production_pins_.erase(it);
    }
  }

  void ChunkManager::onEvicted(const ChunkHash &hash) {
    REINVOKE(*main_pool_handler_, onEvicted, hash);
    tracker_.cancel(hash);
    eraseActive(hash);
    production_pins_.erase(hash);
  }

  outcome::result<std::vector<ChunkPart>> ChunkManager::partsFromStore(
      const ChunkHash &hash, const std::vector<PartIndex> &indices) const {
    OUTCOME_TRY(stored, store_->get(hash));
    if (not stored.has_value()) {
      return std::vector<ChunkPart>{};
    }
    const auto &header = stored->header;
    common::Buffer payload{::scale::encode(stored->body).value()};
    OUTCOME_TRY(parts,
                codec_->encode(payload,
                               header.data_shard_count,
                               header.total_shard_count));
    if (attachPartProofs(*hasher_, parts) != header.parts_root) {
      SL_ERROR(logger_,
               "Stored chunk {} of shard {} does not match its parts root",
               hash,
               header.shard_id);
      return ChunkError::PAYLOAD_MISMATCH;
    }
    if (indices.empty()) {
      return parts;
    }
    std::vector<ChunkPart> selected;
    for (auto index : indices) {
      if (index < parts.size()) {
        selected.push_back(std::move(parts[index]));
      }
    }
    return selected;
  }

  void ChunkManager::servePartRequest(const ValidatorId &from,
                                      network::PartRequest request) {
    REINVOKE(*worker_pool_handler_, servePartRequest, from, std::move(request));

    const auto &hash = request.chunk_hash;
    auto parts = cache_->partsFor(hash, request.indices);
    if (parts.empty() and not cache_->contains(hash)) {
      auto stored = partsFromStore(hash, request.indices);
      if (stored.has_error()) {
        SL_WARN(logger_,
                "Can't serve parts of chunk {} to {}: {}",
                hash,
                from,
                stored.error().message());
        return;
      }
      parts = std::move(stored.value());
    }
    if (parts.empty()) {
      SL_TRACE(logger_, "No parts of chunk {} for {}", hash, from);
      return;
    }
    transport_->send(
        from,
        network::PartMessage{.chunk_hash = hash, .parts = std::move(parts)});
  }

  void ChunkManager::serveReceiptRequest(const ValidatorId &from,
                                         network::ReceiptRequest request) {
    REINVOKE(
        *worker_pool_handler_, serveReceiptRequest, from, std::move(request));

    const auto &hash = request.chunk_hash;
    auto proofs = cache_->receiptProofsFor(hash, request.to_shards);
    if (proofs.empty() and not cache_->contains(hash)) {
      auto stored = store_->get(hash);
      if (stored.has_error()) {
        SL_WARN(logger_,
                "Can't serve receipts of chunk {} to {}: {}",
                hash,
                from,
                stored.error().message());
        return;
      }
      if (stored.value().has_value()) {
        for (auto &proof : stored.value()->receipt_proofs) {
          if (request.to_shards.empty()
              or std::find(request.to_shards.begin(),
                           request.to_shards.end(),
                           proof.to_shard)
                     != request.to_shards.end()) {
            proofs.push_back(std::move(proof));
          }
        }
      }
    }
    if (proofs.empty()) {
      return;
    }
    transport_->send(from,
                     network::ReceiptProofMessage{.chunk_hash = hash,
                                                  .proofs = std::move(proofs)});
  }

}  // namespace tessera::sharding
