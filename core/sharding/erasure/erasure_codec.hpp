/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

#include "common/buffer.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "sharding/chunks_config.hpp"
#include "sharding/erasure/erasure_coding_error.hpp"
#include "sharding/types.hpp"

namespace tessera::sharding {

  /// Split of a payload into erasure-coded shards
  struct ShardLayout {
    uint32_t data_shard_count = 0;
    uint32_t total_shard_count = 0;
    size_t shard_size = 0;
    uint64_t encoded_length = 0;

    bool operator==(const ShardLayout &other) const = default;
  };

  /**
   * Systematic Reed-Solomon coder over GF(2^16) (Vandermonde matrix of
   * Jerasure). The first `data_shard_count` parts are the zero-padded payload
   * itself, the rest are parity. Any `data_shard_count` distinct parts
   * reconstruct the payload.
   */
  class ErasureCodec {
   public:
    /// Word size of the coder, bits
    static constexpr int kWordSize = 16;
    /// Jerasure addresses at most 2^w shards
    static constexpr uint32_t kMaxShards = 1u << kWordSize;
    /// Jerasure works on regions aligned to `sizeof(long)` and to whole words
    static constexpr size_t kShardAlignment = 8;
    static_assert(kShardAlignment % (kWordSize / 8) == 0);

    ErasureCodec();
    ~ErasureCodec();

    ErasureCodec(const ErasureCodec &) = delete;
    ErasureCodec &operator=(const ErasureCodec &) = delete;

    /**
     * Size of one shard when `length` bytes are spread over
     * `data_shard_count` shards
     */
    static size_t shardSizeFor(size_t length, uint32_t data_shard_count);

    /**
     * Derives the layout of a payload of `original_length` bytes: at least
     * `min_data_shards` data shards (and one), enough shards of
     * `shard_byte_size` to carry the payload, and the configured parity
     */
    static outcome::result<ShardLayout> layoutFor(size_t original_length,
                                                  uint32_t min_data_shards,
                                                  const ChunksConfig &config);

    /**
     * Encodes the payload into `total_shard_count` parts of equal size.
     * Merkle proofs of returned parts are empty.
     */
    outcome::result<std::vector<ChunkPart>> encode(
        common::BufferView payload,
        uint32_t data_shard_count,
        uint32_t total_shard_count) const;

    /**
     * Reconstructs the payload from at least `data_shard_count` distinct
     * parts. Duplicated indices are ignored.
     * @return first `original_length` bytes of the reconstructed payload
     */
    outcome::result<common::Buffer> decode(std::span<const ChunkPart> parts,
                                           uint32_t data_shard_count,
                                           uint32_t total_shard_count,
                                           uint64_t original_length,
                                           uint64_t encoded_length) const;

   private:
    struct CodingMatrix;

    static outcome::result<void> checkShardCounts(uint32_t data_shard_count,
                                                  uint32_t total_shard_count);

    outcome::result<std::shared_ptr<const CodingMatrix>> matrixFor(
        uint32_t data_shard_count, uint32_t parity_shard_count) const;

    log::Logger logger_;
    mutable std::mutex matrices_mutex_;
    mutable std::map<std::pair<uint32_t, uint32_t>,
                     std::shared_ptr<const CodingMatrix>>
        matrices_;
  };

}  // namespace tessera::sharding
