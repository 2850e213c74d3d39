/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "sharding/chunks_config.hpp"
#include "sharding/types.hpp"

namespace tessera::sharding {

  struct PartRequestId {
    PartIndex index = 0;

    auto operator<=>(const PartRequestId &) const = default;
  };

  struct ReceiptRequestId {
    ShardId to_shard = 0;

    auto operator<=>(const ReceiptRequestId &) const = default;
  };

  /// Identifies a requested fragment within a chunk
  using RequestId = std::variant<PartRequestId, ReceiptRequestId>;

  struct PendingRequest {
    ValidatorId target;
    clock::SteadyClock::TimePoint issued_at;
    /// failed attempts so far
    uint32_t retry_count = 0;
    /// answered invalidly, sent again once its backoff passes
    bool postponed = false;
  };

  /**
   * Bookkeeping of outstanding fragment requests with capped exponential
   * backoff. Driven by explicit `now` time points, not synchronized.
   */
  class RequestTracker {
   public:
    using TimePoint = clock::SteadyClock::TimePoint;
    using Duration = std::chrono::milliseconds;

    /// Request to be sent again
    struct Retry {
      ChunkHash hash;
      RequestId id;
      PendingRequest request;
    };

    /// Request out of retries
    struct Missing {
      ChunkHash hash;
      RequestId id;
    };

    struct Expired {
      std::vector<Retry> retries;
      std::vector<Missing> missing;
    };

    explicit RequestTracker(const ChunksConfig &config);

    /// Response timeout after `attempt` failed attempts
    Duration backoff(uint32_t attempt) const;

    /// Records a request, superseding an existing one for the same id
    void issue(const ChunkHash &hash,
               const RequestId &id,
               const ValidatorId &target,
               TimePoint now);

    /**
     * Collects requests whose timeout passed. Each is either rescheduled as
     * issued at `now` with one more failed attempt, or removed and reported
     * as permanently missing once out of retries. Postponed requests are
     * rescheduled without counting another attempt
     */
    Expired expired(TimePoint now);

    /**
     * Counts an invalid response as a failed attempt and postpones the
     * request until the backoff of the attempt passes
     * @return postponed request, nullopt if the request is not pending or is
     * now permanently missing
     */
    std::optional<PendingRequest> fail(const ChunkHash &hash,
                                       const RequestId &id,
                                       TimePoint now);

    /// @return true if the request was pending
    bool deliver(const ChunkHash &hash, const RequestId &id);

    /// Forgets every request and missing mark of the chunk
    void cancel(const ChunkHash &hash);

    std::optional<PendingRequest> pending(const ChunkHash &hash,
                                          const RequestId &id) const;
    size_t pendingCount(const ChunkHash &hash) const;
    size_t pendingCount() const;

    bool isMissing(const ChunkHash &hash, const RequestId &id) const;

    /**
     * Chooses parts to request so that held and requested parts reach
     * `data_shard_count`, lowest indices first, skipping held, pending and
     * permanently missing indices
     */
    std::vector<PartIndex> selectParts(const ChunkHash &hash,
                                       uint32_t data_shard_count,
                                       uint32_t total_shard_count,
                                       const std::vector<PartIndex> &held) const;

    /// Tracked shards whose receipt proofs are neither held nor requested
    std::vector<ShardId> selectReceipts(
        const ChunkHash &hash,
        const std::set<ShardId> &tracked_shards,
        ShardId num_shards,
        const std::vector<ShardId> &held) const;

    /// @return true if parts not permanently missing can not reach
    /// `data_shard_count`
    bool isUnreachable(const ChunkHash &hash,
                       uint32_t data_shard_count,
                       uint32_t total_shard_count,
                       const std::vector<PartIndex> &held) const;

   private:
    using Requests = std::map<RequestId, PendingRequest>;

    bool outOfRetries(const PendingRequest &request) const;
    void markMissing(const ChunkHash &hash, const RequestId &id);

    log::Logger logger_;
    const ChunksConfig &config_;
    std::unordered_map<ChunkHash, Requests> pending_;
    std::unordered_map<ChunkHash, std::set<RequestId>> missing_;
  };

}  // namespace tessera::sharding

template <>
struct fmt::formatter<tessera::sharding::RequestId> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.end();
  }

  template <typename FormatContext>
  auto format(const tessera::sharding::RequestId &id,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (auto part = std::get_if<tessera::sharding::PartRequestId>(&id)) {
      return fmt::format_to(ctx.out(), "part #{}", part->index);
    }
    return fmt::format_to(
        ctx.out(),
        "receipts to shard {}",
        std::get<tessera::sharding::ReceiptRequestId>(id).to_shard);
  }
};
