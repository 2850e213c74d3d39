/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <unordered_set>
#include <variant>
#include <vector>

#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"
#include "sharding/chunk_header.hpp"
#include "sharding/chunks_config.hpp"
#include "sharding/erasure/erasure_codec.hpp"

namespace tessera::sharding {

  enum class ChunkState : uint8_t {
    /// no fragment of the chunk was ever seen
    Unknown,
    /// some fragments are buffered, the header is not known
    AwaitingHeader,
    /// header is known, less than data shard count parts are held
    AwaitingParts,
    /// enough parts to reconstruct, not attempted yet
    Decodable,
    /// reconstructed and verified against the header
    Complete,
    /// rejected, never retried automatically
    Invalid,
  };

  enum class InvalidReason : uint8_t {
    /// too many distinct peers delivered fragments failing their proofs
    ProofFailures,
    /// verified parts failed to reconstruct the committed payload
    CorruptParts,
    /// not enough parts can be retrieved
    Unreachable,
    /// header is not the one of the chunk or breaks the epoch layout
    HeaderMismatch,
    /// reconstructed body disagrees with the receipts root
    PayloadMismatch,
  };

  enum class InsertResult : uint8_t {
    Accepted,
    Duplicate,
    InvalidIndex,
    ProofMismatch,
    /// kept unverified until the header arrives
    Buffered,
    /// discarded unverified, the buffer is full
    Dropped,
  };

  /// Result of a completed chunk assembly
  using CompletedChunk = FinalizedChunk;

  /**
   * Assembly state of a single chunk. Not synchronized: the owner serializes
   * all operations on one instance.
   */
  class PartialChunk {
   public:
    PartialChunk(ChunkHash hash,
                 const ChunksConfig &config,
                 std::shared_ptr<crypto::Hasher> hasher);

    const ChunkHash &hash() const {
      return hash_;
    }

    ChunkState state() const {
      return state_;
    }

    bool isFinished() const {
      return state_ == ChunkState::Complete or state_ == ChunkState::Invalid;
    }

    std::optional<InvalidReason> invalidReason() const {
      return invalid_reason_;
    }

    const std::optional<ChunkHeader> &header() const {
      return header_;
    }

    ShardId numShards() const {
      return num_shards_;
    }

    /**
     * Sets the header, verifying every buffered fragment against it
     * @param num_shards number of shards of the chunk's epoch, bounds
     * receipt proofs
     * @return state after the header is applied; ChunkError::HEADER_MISMATCH
     * if the header is not the one of this chunk
     */
    outcome::result<ChunkState> setHeader(const ChunkHeader &header,
                                          ShardId num_shards);

    InsertResult insertPart(ChunkPart part, const ValidatorId &sender);

    InsertResult insertReceiptProof(ReceiptProof proof,
                                    const ValidatorId &sender);

    /**
     * Reconstructs and verifies the chunk once `Decodable`
     * @return completed chunk on the transition to `Complete`, nullopt if the
     * chunk is not decodable; an error marks the chunk `Invalid`
     */
    outcome::result<std::optional<CompletedChunk>> tryComplete(
        const ErasureCodec &codec);

    /// Stores a locally produced chunk as `Complete`
    void setProduced(const ChunkHeader &header,
                     ShardId num_shards,
                     std::vector<ChunkPart> parts,
                     std::vector<ReceiptProof> receipt_proofs);

    void markInvalid(InvalidReason reason);

    const std::map<PartIndex, ChunkPart> &parts() const {
      return parts_;
    }

    const std::map<ShardId, ReceiptProof> &receiptProofs() const {
      return receipt_proofs_;
    }

    size_t bufferedCount() const {
      return buffered_.size();
    }

    size_t proofFailures() const {
      return bad_senders_.size();
    }

    /// Bytes of held and buffered fragments
    size_t byteSize() const;

   private:
    using Fragment = std::variant<ChunkPart, ReceiptProof>;

    InsertResult storePart(ChunkPart &&part, const ValidatorId &sender);
    InsertResult storeReceiptProof(ReceiptProof &&proof,
                                   const ValidatorId &sender);
    InsertResult buffer(Fragment &&fragment, const ValidatorId &sender);
    InsertResult onProofFailure(const ValidatorId &sender);
    void updateThreshold();
    outcome::result<CompletedChunk> reconstruct(const ErasureCodec &codec);

    ChunkHash hash_;
    const ChunksConfig &config_;
    std::shared_ptr<crypto::Hasher> hasher_;

    ChunkState state_ = ChunkState::AwaitingHeader;
    std::optional<InvalidReason> invalid_reason_;
    std::optional<ChunkHeader> header_;
    ShardId num_shards_ = 0;

    std::map<PartIndex, ChunkPart> parts_;
    std::map<ShardId, ReceiptProof> receipt_proofs_;
    std::vector<std::pair<Fragment, ValidatorId>> buffered_;
    std::unordered_set<ValidatorId> bad_senders_;
  };

}  // namespace tessera::sharding
