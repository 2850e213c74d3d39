/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/chunk_cache.hpp"

#include <algorithm>

#include "sharding/chunk_error.hpp"

namespace {
  constexpr auto entriesMetricName = "tessera_chunk_cache_entries";
  constexpr auto bytesMetricName = "tessera_chunk_cache_bytes";
  constexpr auto evictionsMetricName = "tessera_chunk_cache_evictions_total";
  constexpr auto invalidMetricName = "tessera_chunks_invalid_total";

  const char *reasonLabel(tessera::sharding::InvalidReason reason) {
    using tessera::sharding::InvalidReason;
    switch (reason) {
      case InvalidReason::ProofFailures:
        return "proof_failures";
      case InvalidReason::CorruptParts:
        return "corrupt_parts";
      case InvalidReason::Unreachable:
        return "unreachable";
      case InvalidReason::HeaderMismatch:
        return "header_mismatch";
      case InvalidReason::PayloadMismatch:
        return "payload_mismatch";
    }
    return "unknown";
  }
}  // namespace

namespace tessera::sharding {

  ChunkCache::ChunkCache(const ChunksConfig &config,
                         std::shared_ptr<crypto::Hasher> hasher,
                         std::shared_ptr<ErasureCodec> codec,
                         metrics::RegistryPtr metrics_registry)
      : logger_{log::createLogger("ChunkCache", "chunk_cache")},
        config_{config},
        hasher_{std::move(hasher)},
        codec_{std::move(codec)},
        finished_{std::max<size_t>(config.finished_memory, 1)},
        metrics_registry_{std::move(metrics_registry)} {
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(codec_);
    BOOST_ASSERT(metrics_registry_);

    metrics_registry_->registerGaugeFamily(
        entriesMetricName, "Number of chunks held in the chunk cache");
    metric_entries_ = metrics_registry_->registerGaugeMetric(entriesMetricName);

    metrics_registry_->registerGaugeFamily(
        bytesMetricName, "Bytes of chunk data held in the chunk cache");
    metric_bytes_ = metrics_registry_->registerGaugeMetric(bytesMetricName);

    metrics_registry_->registerCounterFamily(
        evictionsMetricName, "Number of chunks evicted from the chunk cache");
    metric_evictions_ =
        metrics_registry_->registerCounterMetric(evictionsMetricName);

    metrics_registry_->registerCounterFamily(
        invalidMetricName, "Number of chunks rejected as invalid, by reason");
    for (auto reason : {InvalidReason::ProofFailures,
                        InvalidReason::CorruptParts,
                        InvalidReason::Unreachable,
                        InvalidReason::HeaderMismatch,
                        InvalidReason::PayloadMismatch}) {
      metric_invalid_.emplace(
          reason,
          metrics_registry_->registerCounterMetric(
              invalidMetricName, {{"reason", reasonLabel(reason)}}));
    }
  }

  void ChunkCache::setEvictionListener(EvictionListener listener) {
    std::lock_guard lock{listener_mutex_};
    on_evicted_ = std::move(listener);
  }

  template <typename F>
  auto ChunkCache::modify(const Handle &entry, F &&f) {
    return entry->chunk.exclusiveAccess([&](PartialChunk &chunk) {
      auto was_invalid = chunk.state() == ChunkState::Invalid;
      auto res = std::forward<F>(f)(chunk);
      auto size = chunk.byteSize();
      entry->state = chunk.state();
      if (not was_invalid and chunk.state() == ChunkState::Invalid) {
        if (auto reason = chunk.invalidReason()) {
          metric_invalid_.at(*reason)->inc();
        }
      }

      std::lock_guard lock{mutex_};
      if (not entry->evicted) {
        bytes_ = bytes_ - entry->bytes + size;
      }
      entry->bytes = size;
      updateSizeMetrics();
      return res;
    });
  }

  void ChunkCache::updateSizeMetrics() {
    metric_entries_->set(entries_.size());
    metric_bytes_->set(bytes_);
  }

  ChunkCache::Handle ChunkCache::find(const ChunkHash &hash) const {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(hash);
    return it != entries_.end() ? it->second : nullptr;
  }

  std::optional<ChunkState> ChunkCache::finishedState(
      const ChunkHash &hash) const {
    std::lock_guard lock{mutex_};
    if (auto state = finished_.get(hash)) {
      return state->get();
    }
    return std::nullopt;
  }

  outcome::result<ChunkCache::Handle> ChunkCache::existing(
      const ChunkHash &hash) const {
    if (auto entry = find(hash)) {
      return entry;
    }
    if (finishedState(hash).has_value()) {
      return ChunkError::CHUNK_FINISHED;
    }
    return ChunkError::UNKNOWN_CHUNK;
  }

  outcome::result<ChunkCache::Handle> ChunkCache::getOrCreate(
      const ChunkHash &hash) {
    std::lock_guard lock{mutex_};
    if (auto it = entries_.find(hash); it != entries_.end()) {
      auto &entry = it->second;
      recency_.splice(recency_.begin(), recency_, entry->recency);
      return entry;
    }
    if (finished_.get(hash).has_value()) {
      SL_TRACE(logger_, "Chunk {} is already finished", hash);
      return ChunkError::CHUNK_FINISHED;
    }
    auto entry = std::make_shared<Entry>(hash, config_, hasher_);
    recency_.push_front(hash);
    entry->recency = recency_.begin();
    entries_.emplace(hash, entry);
    updateSizeMetrics();
    return entry;
  }

  outcome::result<ChunkState> ChunkCache::setHeader(const ChunkHash &hash,
                                                    const ChunkHeader &header,
                                                    ShardId num_shards) {
    OUTCOME_TRY(entry, getOrCreate(hash));
    auto res = modify(entry, [&](PartialChunk &chunk) {
      return chunk.setHeader(header, num_shards);
    });
    evictIfOverBudget();
    return res;
  }

  outcome::result<InsertResult> ChunkCache::insertPart(
      const ChunkHash &hash, ChunkPart part, const ValidatorId &sender) {
    OUTCOME_TRY(entry, getOrCreate(hash));
    auto res = modify(
        entry, [&](PartialChunk &chunk) -> outcome::result<InsertResult> {
          if (chunk.state() == ChunkState::Invalid) {
            return ChunkError::CHUNK_INVALID;
          }
          return chunk.insertPart(std::move(part), sender);
        });
    evictIfOverBudget();
    return res;
  }

  outcome::result<InsertResult> ChunkCache::insertReceiptProof(
      const ChunkHash &hash, ReceiptProof proof, const ValidatorId &sender) {
    OUTCOME_TRY(entry, getOrCreate(hash));
    auto res = modify(
        entry, [&](PartialChunk &chunk) -> outcome::result<InsertResult> {
          if (chunk.state() == ChunkState::Invalid) {
            return ChunkError::CHUNK_INVALID;
          }
          return chunk.insertReceiptProof(std::move(proof), sender);
        });
    evictIfOverBudget();
    return res;
  }

  outcome::result<std::optional<CompletedChunk>> ChunkCache::tryComplete(
      const ChunkHash &hash) {
    OUTCOME_TRY(entry, existing(hash));
    auto res = modify(
        entry, [&](PartialChunk &chunk) { return chunk.tryComplete(*codec_); });
    if (res.has_error()) {
      SL_WARN(logger_,
              "Chunk {} can not be completed: {}",
              hash,
              res.error().message());
    }
    evictIfOverBudget();
    return res;
  }

  outcome::result<void> ChunkCache::insertProduced(
      const ChunkHash &hash,
      const ChunkHeader &header,
      ShardId num_shards,
      std::vector<ChunkPart> parts,
      std::vector<ReceiptProof> receipt_proofs) {
    OUTCOME_TRY(entry, getOrCreate(hash));
    modify(entry, [&](PartialChunk &chunk) {
      chunk.setProduced(
          header, num_shards, std::move(parts), std::move(receipt_proofs));
      return true;
    });
    evictIfOverBudget();
    return outcome::success();
  }

  void ChunkCache::evictIfOverBudget() {
    std::vector<ChunkHash> evicted;
    {
      std::lock_guard lock{mutex_};
      auto it = recency_.end();
      while ((entries_.size() > config_.cache_max_entries
              or bytes_ > config_.cache_max_bytes)
             and it != recency_.begin()) {
        --it;
        auto entry_it = entries_.find(*it);
        BOOST_ASSERT(entry_it != entries_.end());
        auto &entry = entry_it->second;
        if (entry->pins != 0) {
          continue;
        }
        auto state = entry->state.load();
        if (state == ChunkState::Complete or state == ChunkState::Invalid) {
          finished_.put(*it, state);
        }
        bytes_ -= entry->bytes;
        entry->evicted = true;
        evicted.push_back(*it);
        entries_.erase(entry_it);
        it = recency_.erase(it);
      }
      updateSizeMetrics();
    }
    if (evicted.empty()) {
      return;
    }
    metric_evictions_->inc(evicted.size());

    EvictionListener listener;
    {
      std::lock_guard lock{listener_mutex_};
      listener = on_evicted_;
    }
    for (const auto &hash : evicted) {
      SL_DEBUG(logger_, "Chunk {} evicted", hash);
      if (listener) {
        listener(hash);
      }
    }
  }

  outcome::result<void> ChunkCache::pin(const ChunkHash &hash) {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(hash);
    if (it == entries_.end()) {
      return ChunkError::UNKNOWN_CHUNK;
    }
    ++it->second->pins;
    return outcome::success();
  }

  void ChunkCache::unpin(const ChunkHash &hash) {
    {
      std::lock_guard lock{mutex_};
      auto it = entries_.find(hash);
      if (it == entries_.end() or it->second->pins == 0) {
        return;
      }
      --it->second->pins;
    }
    evictIfOverBudget();
  }

  void ChunkCache::markInvalid(const ChunkHash &hash, InvalidReason reason) {
    auto entry = find(hash);
    if (not entry) {
      return;
    }
    modify(entry, [&](PartialChunk &chunk) {
      chunk.markInvalid(reason);
      return true;
    });
  }

  ChunkState ChunkCache::state(const ChunkHash &hash) const {
    if (auto entry = find(hash)) {
      return entry->state.load();
    }
    return finishedState(hash).value_or(ChunkState::Unknown);
  }

  std::optional<InvalidReason> ChunkCache::invalidReason(
      const ChunkHash &hash) const {
    if (auto entry = find(hash)) {
      return entry->chunk.exclusiveAccess(
          [](const PartialChunk &chunk) { return chunk.invalidReason(); });
    }
    return std::nullopt;
  }

  std::optional<ChunkHeader> ChunkCache::header(const ChunkHash &hash) const {
    if (auto entry = find(hash)) {
      return entry->chunk.exclusiveAccess(
          [](const PartialChunk &chunk) { return chunk.header(); });
    }
    return std::nullopt;
  }

  std::vector<ChunkPart> ChunkCache::partsFor(
      const ChunkHash &hash, const std::vector<PartIndex> &indices) const {
    auto entry = find(hash);
    if (not entry) {
      return {};
    }
    return entry->chunk.exclusiveAccess([&](const PartialChunk &chunk) {
      std::vector<ChunkPart> parts;
      const auto &held = chunk.parts();
      if (indices.empty()) {
        for (const auto &[_, part] : held) {
          parts.push_back(part);
        }
        return parts;
      }
      for (auto index : indices) {
        if (auto it = held.find(index); it != held.end()) {
          parts.push_back(it->second);
        }
      }
      return parts;
    });
  }

  std::vector<ReceiptProof> ChunkCache::receiptProofsFor(
      const ChunkHash &hash, const std::vector<ShardId> &to_shards) const {
    auto entry = find(hash);
    if (not entry) {
      return {};
    }
    return entry->chunk.exclusiveAccess([&](const PartialChunk &chunk) {
      std::vector<ReceiptProof> proofs;
      const auto &held = chunk.receiptProofs();
      if (to_shards.empty()) {
        for (const auto &[_, proof] : held) {
          proofs.push_back(proof);
        }
        return proofs;
      }
      for (auto shard : to_shards) {
        if (auto it = held.find(shard); it != held.end()) {
          proofs.push_back(it->second);
        }
      }
      return proofs;
    });
  }

  std::vector<PartIndex> ChunkCache::heldParts(const ChunkHash &hash) const {
    auto entry = find(hash);
    if (not entry) {
      return {};
    }
    return entry->chunk.exclusiveAccess([](const PartialChunk &chunk) {
      std::vector<PartIndex> indices;
      for (const auto &[index, _] : chunk.parts()) {
        indices.push_back(index);
      }
      return indices;
    });
  }

  size_t ChunkCache::size() const {
    std::lock_guard lock{mutex_};
    return entries_.size();
  }

  size_t ChunkCache::bytes() const {
    std::lock_guard lock{mutex_};
    return bytes_;
  }

  bool ChunkCache::contains(const ChunkHash &hash) const {
    return find(hash) != nullptr;
  }

  bool ChunkCache::isPinned(const ChunkHash &hash) const {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(hash);
    return it != entries_.end() and it->second->pins != 0;
  }

}  // namespace tessera::sharding
