/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"
#include "sharding/types.hpp"

namespace tessera::sharding {

  /**
   * Header of a chunk, immutable once signed by the chunk producer.
   * Identity of a chunk is the hash of all fields but the signature.
   */
  struct ChunkHeader {
    ShardId shard_id = 0;
    BlockHeight height = 0;
    BlockHash prev_block_hash;
    MerkleHash parts_root;
    MerkleHash receipts_root;
    /// Length of the zero-padded payload spread over the data shards
    uint64_t encoded_length = 0;
    /// Length of the serialized body before padding
    uint64_t original_length = 0;
    uint32_t data_shard_count = 0;
    uint32_t total_shard_count = 0;
    Signature signature;

    bool operator==(const ChunkHeader &other) const = default;

    /// Bytes covered by the chunk hash and the signature
    common::Buffer signable() const {
      return common::Buffer{
          ::scale::encode(shard_id,
                          height,
                          prev_block_hash,
                          parts_root,
                          receipts_root,
                          encoded_length,
                          original_length,
                          data_shard_count,
                          total_shard_count)
              .value(),
      };
    }

    size_t shardSize() const {
      return data_shard_count == 0 ? 0 : encoded_length / data_shard_count;
    }
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ChunkHeader &header) {
    return s << header.shard_id << header.height << header.prev_block_hash
             << header.parts_root << header.receipts_root
             << header.encoded_length << header.original_length
             << header.data_shard_count << header.total_shard_count
             << header.signature;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ChunkHeader &header) {
    return s >> header.shard_id >> header.height >> header.prev_block_hash
        >> header.parts_root >> header.receipts_root >> header.encoded_length
        >> header.original_length >> header.data_shard_count
        >> header.total_shard_count >> header.signature;
  }

  inline ChunkHash chunkHash(const crypto::Hasher &hasher,
                             const ChunkHeader &header) {
    return ChunkHash{hasher.sha2_256(header.signable())};
  }

  /// Persisted form of an assembled and verified chunk
  struct FinalizedChunk {
    ChunkHeader header;
    ChunkBody body;
    std::vector<ReceiptProof> receipt_proofs;

    bool operator==(const FinalizedChunk &other) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const FinalizedChunk &chunk) {
    return s << chunk.header << chunk.body << chunk.receipt_proofs;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, FinalizedChunk &chunk) {
    return s >> chunk.header >> chunk.body >> chunk.receipt_proofs;
  }

}  // namespace tessera::sharding

template <>
struct fmt::formatter<tessera::sharding::ChunkHeader> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tessera::sharding::ChunkHeader &header,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "shard {} #{} ({}/{} parts, {} bytes)",
                          header.shard_id,
                          header.height,
                          header.data_shard_count,
                          header.total_shard_count,
                          header.original_length);
  }
};
