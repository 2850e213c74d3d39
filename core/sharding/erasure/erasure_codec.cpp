/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/erasure/erasure_codec.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>

#include <boost/assert.hpp>

extern "C" {
#include <jerasure.h>
#include <reed_sol.h>
}

namespace tessera::sharding {

  struct ErasureCodec::CodingMatrix {
    explicit CodingMatrix(int *matrix) : matrix{matrix} {}

    CodingMatrix(const CodingMatrix &) = delete;
    CodingMatrix &operator=(const CodingMatrix &) = delete;

    ~CodingMatrix() {
      // allocated by jerasure with malloc
      free(matrix);  // NOLINT(cppcoreguidelines-no-malloc)
    }

    int *matrix;
  };

  namespace {
    size_t divCeil(size_t a, size_t b) {
      return (a + b - 1) / b;
    }

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    char *asChars(uint8_t *ptr) {
      return reinterpret_cast<char *>(ptr);
    }
  }  // namespace

  ErasureCodec::ErasureCodec()
      : logger_{log::createLogger("ErasureCodec", "erasure")} {}

  ErasureCodec::~ErasureCodec() = default;

  size_t ErasureCodec::shardSizeFor(size_t length, uint32_t data_shard_count) {
    BOOST_ASSERT(data_shard_count > 0);
    auto size = divCeil(length, data_shard_count);
    size = divCeil(size, kShardAlignment) * kShardAlignment;
    return std::max(size, kShardAlignment);
  }

  outcome::result<ShardLayout> ErasureCodec::layoutFor(
      size_t original_length,
      uint32_t min_data_shards,
      const ChunksConfig &config) {
    if (config.shard_byte_size == 0 or config.parity_denominator == 0) {
      return ErasureCodingError::INVALID_SHARD_COUNT;
    }
    size_t data = std::max<size_t>(
        {1, min_data_shards, divCeil(original_length, config.shard_byte_size)});
    size_t parity = divCeil(data * config.parity_numerator,
                            config.parity_denominator);
    size_t total = data + parity;
    if (total > std::min(config.max_total_shards, kMaxShards)) {
      return ErasureCodingError::PAYLOAD_TOO_LARGE;
    }

    ShardLayout layout;
    layout.data_shard_count = static_cast<uint32_t>(data);
    layout.total_shard_count = static_cast<uint32_t>(total);
    layout.shard_size = shardSizeFor(original_length, layout.data_shard_count);
    layout.encoded_length = layout.shard_size * layout.data_shard_count;
    return layout;
  }

  outcome::result<void> ErasureCodec::checkShardCounts(
      uint32_t data_shard_count, uint32_t total_shard_count) {
    if (data_shard_count == 0 or total_shard_count < data_shard_count) {
      return ErasureCodingError::INVALID_SHARD_COUNT;
    }
    if (total_shard_count > kMaxShards) {
      return ErasureCodingError::TOO_MANY_SHARDS;
    }
    return outcome::success();
  }

  outcome::result<std::shared_ptr<const ErasureCodec::CodingMatrix>>
  ErasureCodec::matrixFor(uint32_t data_shard_count,
                          uint32_t parity_shard_count) const {
    // galois tables are initialized lazily and not thread safe
    std::lock_guard lock{matrices_mutex_};
    auto key = std::make_pair(data_shard_count, parity_shard_count);
    if (auto it = matrices_.find(key); it != matrices_.end()) {
      return it->second;
    }
    auto *raw = reed_sol_vandermonde_coding_matrix(
        static_cast<int>(data_shard_count),
        static_cast<int>(parity_shard_count),
        kWordSize);
    if (raw == nullptr) {
      SL_ERROR(logger_,
               "Can't create coding matrix for {}+{} shards",
               data_shard_count,
               parity_shard_count);
      return ErasureCodingError::CODEC_FAILURE;
    }
    auto matrix = std::make_shared<const CodingMatrix>(raw);
    matrices_.emplace(key, matrix);
    return matrix;
  }

  outcome::result<std::vector<ChunkPart>> ErasureCodec::encode(
      common::BufferView payload,
      uint32_t data_shard_count,
      uint32_t total_shard_count) const {
    OUTCOME_TRY(checkShardCounts(data_shard_count, total_shard_count));

    const auto shard_size = shardSizeFor(payload.size(), data_shard_count);
    const auto parity_shard_count = total_shard_count - data_shard_count;

    std::vector<ChunkPart> parts(total_shard_count);
    for (uint32_t i = 0; i < total_shard_count; ++i) {
      parts[i].index = i;
      parts[i].bytes.resize(shard_size, 0);
      if (i < data_shard_count) {
        auto offset = std::min<size_t>(i * shard_size, payload.size());
        auto len = std::min(shard_size, payload.size() - offset);
        std::copy_n(payload.begin() + offset, len, parts[i].bytes.begin());
      }
    }

    if (parity_shard_count != 0) {
      OUTCOME_TRY(matrix, matrixFor(data_shard_count, parity_shard_count));
      std::vector<char *> data_ptrs(data_shard_count);
      std::vector<char *> coding_ptrs(parity_shard_count);
      for (uint32_t i = 0; i < data_shard_count; ++i) {
        data_ptrs[i] = asChars(parts[i].bytes.data());
      }
      for (uint32_t i = 0; i < parity_shard_count; ++i) {
        coding_ptrs[i] = asChars(parts[data_shard_count + i].bytes.data());
      }
      jerasure_matrix_encode(static_cast<int>(data_shard_count),
                             static_cast<int>(parity_shard_count),
                             kWordSize,
                             matrix->matrix,
                             data_ptrs.data(),
                             coding_ptrs.data(),
                             static_cast<int>(shard_size));
    }

    SL_TRACE(logger_,
             "Encoded {} bytes into {}+{} shards of {} bytes",
             payload.size(),
             data_shard_count,
             parity_shard_count,
             shard_size);
    return parts;
  }

  outcome::result<common::Buffer> ErasureCodec::decode(
      std::span<const ChunkPart> parts,
      uint32_t data_shard_count,
      uint32_t total_shard_count,
      uint64_t original_length,
      uint64_t encoded_length) const {
    OUTCOME_TRY(checkShardCounts(data_shard_count, total_shard_count));
    if (original_length > encoded_length) {
      return ErasureCodingError::CORRUPT_PARTS;
    }

    // first occurrence of every index
    std::vector<const ChunkPart *> by_index(total_shard_count, nullptr);
    size_t distinct = 0;
    for (const auto &part : parts) {
      if (part.index >= total_shard_count) {
        return ErasureCodingError::INVALID_INDEX;
      }
      if (by_index[part.index] == nullptr) {
        by_index[part.index] = &part;
        ++distinct;
      }
    }
    if (distinct < data_shard_count) {
      return ErasureCodingError::INSUFFICIENT_PARTS;
    }

    const auto shard_size =
        (*std::find_if(by_index.begin(),
                       by_index.end(),
                       [](const ChunkPart *p) { return p != nullptr; }))
            ->bytes.size();
    for (const auto *part : by_index) {
      if (part != nullptr and part->bytes.size() != shard_size) {
        return ErasureCodingError::INCONSISTENT_PART_SIZE;
      }
    }
    if (shard_size == 0 or shard_size % kShardAlignment != 0
        or shard_size * data_shard_count != encoded_length) {
      return ErasureCodingError::INCONSISTENT_PART_SIZE;
    }

    const auto parity_shard_count = total_shard_count - data_shard_count;
    const bool systematic = std::all_of(
        by_index.begin(),
        by_index.begin() + data_shard_count,
        [](const ChunkPart *p) { return p != nullptr; });

    common::Buffer payload;
    payload.reserve(encoded_length);

    if (systematic) {
      for (uint32_t i = 0; i < data_shard_count; ++i) {
        payload.put(by_index[i]->bytes);
      }
    } else {
      OUTCOME_TRY(matrix, matrixFor(data_shard_count, parity_shard_count));

      std::vector<common::Buffer> shards(total_shard_count);
      std::vector<int> erasures;
      for (uint32_t i = 0; i < total_shard_count; ++i) {
        if (by_index[i] != nullptr) {
          shards[i] = by_index[i]->bytes;
        } else {
          shards[i].resize(shard_size, 0);
          erasures.push_back(static_cast<int>(i));
        }
      }
      erasures.push_back(-1);

      std::vector<char *> data_ptrs(data_shard_count);
      std::vector<char *> coding_ptrs(parity_shard_count);
      for (uint32_t i = 0; i < data_shard_count; ++i) {
        data_ptrs[i] = asChars(shards[i].data());
      }
      for (uint32_t i = 0; i < parity_shard_count; ++i) {
        coding_ptrs[i] = asChars(shards[data_shard_count + i].data());
      }

      auto res = jerasure_matrix_decode(static_cast<int>(data_shard_count),
                                        static_cast<int>(parity_shard_count),
                                        kWordSize,
                                        matrix->matrix,
                                        0,
                                        erasures.data(),
                                        data_ptrs.data(),
                                        coding_ptrs.data(),
                                        static_cast<int>(shard_size));
      if (res != 0) {
        SL_ERROR(logger_,
                 "Reconstruction of {}+{} shards failed; error code: {}",
                 data_shard_count,
                 parity_shard_count,
                 res);
        return ErasureCodingError::CODEC_FAILURE;
      }

      for (uint32_t i = 0; i < data_shard_count; ++i) {
        payload.put(shards[i]);
      }
    }

    BOOST_ASSERT(payload.size() == encoded_length);
    auto padding = payload.view(original_length);
    if (not std::all_of(padding.begin(), padding.end(), [](uint8_t byte) {
          return byte == 0;
        })) {
      return ErasureCodingError::CORRUPT_PARTS;
    }
    payload.resize(original_length);
    return payload;
  }

}  // namespace tessera::sharding
