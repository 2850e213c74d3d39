/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/request_tracker.hpp"

#include <algorithm>

namespace tessera::sharding {

  RequestTracker::RequestTracker(const ChunksConfig &config)
      : logger_{log::createLogger("RequestTracker", "chunk_requester")},
        config_{config} {}

  RequestTracker::Duration RequestTracker::backoff(uint32_t attempt) const {
    auto timeout = config_.request_base_backoff;
    for (uint32_t i = 0; i < attempt and timeout < config_.request_max_backoff;
         ++i) {
      timeout *= 2;
    }
    return std::min(timeout, config_.request_max_backoff);
  }

  bool RequestTracker::outOfRetries(const PendingRequest &request) const {
    return request.retry_count >= config_.request_max_retries;
  }

  void RequestTracker::markMissing(const ChunkHash &hash, const RequestId &id) {
    SL_DEBUG(logger_, "Chunk {}: {} is permanently missing", hash, id);
    missing_[hash].insert(id);
  }

  void RequestTracker::issue(const ChunkHash &hash,
                             const RequestId &id,
                             const ValidatorId &target,
                             TimePoint now) {
    auto &request = pending_[hash][id];
    request.target = target;
    request.issued_at = now;
    request.retry_count = 0;
    request.postponed = false;
    SL_TRACE(logger_, "Chunk {}: {} requested from {}", hash, id, target);
  }

  RequestTracker::Expired RequestTracker::expired(TimePoint now) {
    Expired expired;
    for (auto chunk_it = pending_.begin(); chunk_it != pending_.end();) {
      auto &[hash, requests] = *chunk_it;
      for (auto it = requests.begin(); it != requests.end();) {
        auto &[id, request] = *it;
        if (now < request.issued_at + backoff(request.retry_count)) {
          ++it;
          continue;
        }
        if (request.postponed) {
          request.postponed = false;
          request.issued_at = now;
          expired.retries.push_back({hash, id, request});
          ++it;
          continue;
        }
        if (outOfRetries(request)) {
          markMissing(hash, id);
          expired.missing.push_back({hash, id});
          it = requests.erase(it);
          continue;
        }
        ++request.retry_count;
        request.issued_at = now;
        expired.retries.push_back({hash, id, request});
        ++it;
      }
      if (requests.empty()) {
        chunk_it = pending_.erase(chunk_it);
      } else {
        ++chunk_it;
      }
    }
    return expired;
  }

  std::optional<PendingRequest> RequestTracker::fail(const ChunkHash &hash,
                                                     const RequestId &id,
                                                     TimePoint now) {
    auto chunk_it = pending_.find(hash);
    if (chunk_it == pending_.end()) {
      return std::nullopt;
    }
    auto &requests = chunk_it->second;
    auto it = requests.find(id);
    if (it == requests.end()) {
      return std::nullopt;
    }
    auto &request = it->second;
    SL_DEBUG(logger_,
             "Chunk {}: invalid response for {} from {}",
             hash,
             id,
             request.target);
    if (outOfRetries(request)) {
      markMissing(hash, id);
      requests.erase(it);
      if (requests.empty()) {
        pending_.erase(chunk_it);
      }
      return std::nullopt;
    }
    ++request.retry_count;
    request.issued_at = now;
    request.postponed = true;
    return request;
  }

  bool RequestTracker::deliver(const ChunkHash &hash, const RequestId &id) {
    auto chunk_it = pending_.find(hash);
    if (chunk_it == pending_.end()) {
      return false;
    }
    auto removed = chunk_it->second.erase(id) != 0;
    if (chunk_it->second.empty()) {
      pending_.erase(chunk_it);
    }
    return removed;
  }

  void RequestTracker::cancel(const ChunkHash &hash) {
    pending_.erase(hash);
    missing_.erase(hash);
  }

  std::optional<PendingRequest> RequestTracker::pending(
      const ChunkHash &hash, const RequestId &id) const {
    auto chunk_it = pending_.find(hash);
    if (chunk_it == pending_.end()) {
      return std::nullopt;
    }
    auto it = chunk_it->second.find(id);
    if (it == chunk_it->second.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  size_t RequestTracker::pendingCount(const ChunkHash &hash) const {
    auto it = pending_.find(hash);
    return it == pending_.end() ? 0 : it->second.size();
  }

  size_t RequestTracker::pendingCount() const {
    size_t count = 0;
    for (const auto &[_, requests] : pending_) {
      count += requests.size();
    }
    return count;
  }

  bool RequestTracker::isMissing(const ChunkHash &hash,
                                 const RequestId &id) const {
    auto it = missing_.find(hash);
    return it != missing_.end() and it->second.contains(id);
  }

  std::vector<PartIndex> RequestTracker::selectParts(
      const ChunkHash &hash,
      uint32_t data_shard_count,
      uint32_t total_shard_count,
      const std::vector<PartIndex> &held) const {
    std::set<PartIndex> held_set{held.begin(), held.end()};
    size_t outstanding = 0;
    if (auto it = pending_.find(hash); it != pending_.end()) {
      for (const auto &[id, _] : it->second) {
        if (auto part = std::get_if<PartRequestId>(&id);
            part != nullptr and not held_set.contains(part->index)) {
          ++outstanding;
        }
      }
    }
    if (held_set.size() + outstanding >= data_shard_count) {
      return {};
    }
    auto wanted = data_shard_count - held_set.size() - outstanding;

    std::vector<PartIndex> selected;
    for (PartIndex index = 0;
         index < total_shard_count and selected.size() < wanted;
         ++index) {
      RequestId id = PartRequestId{index};
      if (held_set.contains(index) or pending(hash, id).has_value()
          or isMissing(hash, id)) {
        continue;
      }
      selected.push_back(index);
    }
    return selected;
  }

  std::vector<ShardId> RequestTracker::selectReceipts(
      const ChunkHash &hash,
      const std::set<ShardId> &tracked_shards,
      ShardId num_shards,
      const std::vector<ShardId> &held) const {
    std::vector<ShardId> selected;
    for (auto shard : tracked_shards) {
      if (shard >= num_shards) {
        break;
      }
      RequestId id = ReceiptRequestId{shard};
      if (std::find(held.begin(), held.end(), shard) != held.end()
          or pending(hash, id).has_value() or isMissing(hash, id)) {
        continue;
      }
      selected.push_back(shard);
    }
    return selected;
  }

  bool RequestTracker::isUnreachable(const ChunkHash &hash,
                                     uint32_t data_shard_count,
                                     uint32_t total_shard_count,
                                     const std::vector<PartIndex> &held) const {
    auto it = missing_.find(hash);
    if (it == missing_.end()) {
      return false;
    }
    size_t lost = 0;
    for (const auto &id : it->second) {
      if (auto part = std::get_if<PartRequestId>(&id);
          part != nullptr
          and std::find(held.begin(), held.end(), part->index) == held.end()) {
        ++lost;
      }
    }
    return total_shard_count - lost < data_shard_count;
  }

}  // namespace tessera::sharding
