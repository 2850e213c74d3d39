/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <set>

#include "sharding/types.hpp"

namespace tessera::sharding {

  /**
   * Policy constants of chunk production, assembly and retrieval
   */
  struct ChunksConfig {
    /// Target size of a single data part
    size_t shard_byte_size = 16 * 1024;
    /// Parity shards are `ceil(data * numerator / denominator)`
    uint32_t parity_numerator = 1;
    uint32_t parity_denominator = 2;
    /// Bounded by `ErasureCodec::kMaxShards`
    uint32_t max_total_shards = 1024;

    size_t cache_max_entries = 1024;
    size_t cache_max_bytes = 256 * 1024 * 1024;
    /// Number of completed or rejected chunk hashes remembered after eviction
    size_t finished_memory = 4096;
    /// Fragments kept per chunk while its header is unknown
    size_t max_buffered_fragments = 64;

    std::chrono::milliseconds request_base_backoff{200};
    std::chrono::milliseconds request_max_backoff{5000};
    uint32_t request_max_retries = 5;

    /// Distinct peers sending bad fragments before the chunk is rejected,
    /// 0 disables
    uint32_t max_proof_failures = 8;

    std::chrono::milliseconds production_pin_duration{10000};
    std::chrono::milliseconds tick_interval{100};

    /// Shards whose incoming receipts this node collects
    std::set<ShardId> tracked_shards;
  };

}  // namespace tessera::sharding
