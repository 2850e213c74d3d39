/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/ed25519_types.hpp"

TESSERA_BLOB_STRICT_TYPEDEF(tessera::sharding, ChunkHash, 32);
TESSERA_BLOB_STRICT_TYPEDEF(tessera::sharding, EpochId, 32);

namespace tessera::sharding {

  using ShardId = uint64_t;
  using BlockHeight = uint64_t;
  using PartIndex = uint32_t;

  using BlockHash = common::Hash256;
  using StateRoot = common::Hash256;
  using MerkleHash = common::Hash256;
  using MerklePath = std::vector<MerkleHash>;

  using ValidatorId = crypto::Ed25519PublicKey;
  using Signature = crypto::Ed25519Signature;

  /// One erasure-coded shard of a chunk payload
  struct ChunkPart {
    PartIndex index = 0;
    common::Buffer bytes;
    /// Path from the part leaf to the header's parts root
    MerklePath merkle_proof;

    bool operator==(const ChunkPart &other) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ChunkPart &part) {
    return s << part.index << part.bytes << part.merkle_proof;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ChunkPart &part) {
    return s >> part.index >> part.bytes >> part.merkle_proof;
  }

  /// Cross-shard message emitted by a chunk
  struct Receipt {
    common::Hash256 receipt_id;
    ShardId receiver_shard = 0;
    common::Buffer payload;

    bool operator==(const Receipt &other) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Receipt &receipt) {
    return s << receipt.receipt_id << receipt.receiver_shard
             << receipt.payload;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Receipt &receipt) {
    return s >> receipt.receipt_id >> receipt.receiver_shard
        >> receipt.payload;
  }

  /**
   * Outgoing receipts of `from_shard` addressed to `to_shard`, proven against
   * the receipts root of the producing chunk. Leaves of that tree are ordered
   * by target shard.
   */
  struct ReceiptProof {
    ShardId from_shard = 0;
    ShardId to_shard = 0;
    std::vector<Receipt> receipts;
    MerklePath merkle_proof;

    bool operator==(const ReceiptProof &other) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ReceiptProof &proof) {
    return s << proof.from_shard << proof.to_shard << proof.receipts
             << proof.merkle_proof;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ReceiptProof &proof) {
    return s >> proof.from_shard >> proof.to_shard >> proof.receipts
        >> proof.merkle_proof;
  }

  /// Payload carried by the erasure-coded parts of a chunk
  struct ChunkBody {
    StateRoot prev_state_root;
    std::vector<common::Buffer> transactions;
    std::vector<Receipt> outgoing_receipts;

    bool operator==(const ChunkBody &other) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ChunkBody &body) {
    return s << body.prev_state_root << body.transactions
             << body.outgoing_receipts;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ChunkBody &body) {
    return s >> body.prev_state_root >> body.transactions
        >> body.outgoing_receipts;
  }

}  // namespace tessera::sharding
