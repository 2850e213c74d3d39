/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "sharding/chunk_header.hpp"

namespace tessera::network {

  using sharding::ChunkHash;
  using sharding::ChunkHeader;
  using sharding::ChunkPart;
  using sharding::PartIndex;
  using sharding::ReceiptProof;
  using sharding::ShardId;

  /// Announces a signed chunk header
  struct HeaderMessage {
    ChunkHeader header;

    bool operator==(const HeaderMessage &other) const = default;
  };

  /// Delivers parts of a chunk, solicited or not
  struct PartMessage {
    ChunkHash chunk_hash;
    std::vector<ChunkPart> parts;

    bool operator==(const PartMessage &other) const = default;
  };

  /// Delivers receipt proofs of a chunk
  struct ReceiptProofMessage {
    ChunkHash chunk_hash;
    std::vector<ReceiptProof> proofs;

    bool operator==(const ReceiptProofMessage &other) const = default;
  };

  /// Asks for parts of a chunk, answered with a `PartMessage`
  struct PartRequest {
    ChunkHash chunk_hash;
    std::vector<PartIndex> indices;

    bool operator==(const PartRequest &other) const = default;
  };

  /// Asks for receipt proofs of a chunk, answered with a
  /// `ReceiptProofMessage`
  struct ReceiptRequest {
    ChunkHash chunk_hash;
    std::vector<ShardId> to_shards;

    bool operator==(const ReceiptRequest &other) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const HeaderMessage &msg) {
    return s << msg.header;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, HeaderMessage &msg) {
    return s >> msg.header;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const PartMessage &msg) {
    return s << msg.chunk_hash << msg.parts;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, PartMessage &msg) {
    return s >> msg.chunk_hash >> msg.parts;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ReceiptProofMessage &msg) {
    return s << msg.chunk_hash << msg.proofs;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ReceiptProofMessage &msg) {
    return s >> msg.chunk_hash >> msg.proofs;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const PartRequest &msg) {
    return s << msg.chunk_hash << msg.indices;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, PartRequest &msg) {
    return s >> msg.chunk_hash >> msg.indices;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ReceiptRequest &msg) {
    return s << msg.chunk_hash << msg.to_shards;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ReceiptRequest &msg) {
    return s >> msg.chunk_hash >> msg.to_shards;
  }

  /// Note: order of types in variant matters
  using ChunkMessage = std::variant<HeaderMessage,        // 0
                                    PartMessage,          // 1
                                    ReceiptProofMessage,  // 2
                                    PartRequest,          // 3
                                    ReceiptRequest>;      // 4

}  // namespace tessera::network
