/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/partial_chunk.hpp"

#include "common/visitor.hpp"
#include "sharding/chunk_error.hpp"
#include "sharding/encoding/chunk_encoding.hpp"

namespace tessera::sharding {

  namespace {
    size_t sizeOf(const ChunkPart &part) {
      return part.bytes.size() + part.merkle_proof.size() * MerkleHash::size();
    }

    size_t sizeOf(const ReceiptProof &proof) {
      size_t size = proof.merkle_proof.size() * MerkleHash::size();
      for (const auto &receipt : proof.receipts) {
        size += receipt.payload.size() + common::Hash256::size();
      }
      return size;
    }
  }  // namespace

  PartialChunk::PartialChunk(ChunkHash hash,
                             const ChunksConfig &config,
                             std::shared_ptr<crypto::Hasher> hasher)
      : hash_{hash}, config_{config}, hasher_{std::move(hasher)} {
    BOOST_ASSERT(hasher_);
  }

  outcome::result<ChunkState> PartialChunk::setHeader(const ChunkHeader &header,
                                                      ShardId num_shards) {
    if (chunkHash(*hasher_, header) != hash_) {
      return ChunkError::HEADER_MISMATCH;
    }
    if (header_.has_value() or state_ == ChunkState::Invalid) {
      return state_;
    }
    OUTCOME_TRY(checkHeaderLayout(header));

    header_ = header;
    num_shards_ = num_shards;
    state_ = ChunkState::AwaitingParts;

    auto buffered = std::move(buffered_);
    buffered_.clear();
    for (auto &[fragment, sender] : buffered) {
      if (state_ == ChunkState::Invalid) {
        break;
      }
      visit_in_place(
          fragment,
          [&, &sender = sender](ChunkPart &part) {
            storePart(std::move(part), sender);
          },
          [&, &sender = sender](ReceiptProof &proof) {
            storeReceiptProof(std::move(proof), sender);
          });
    }
    return state_;
  }

  InsertResult PartialChunk::insertPart(ChunkPart part,
                                        const ValidatorId &sender) {
    if (state_ == ChunkState::Invalid) {
      return InsertResult::Duplicate;
    }
    if (not header_.has_value()) {
      return buffer(std::move(part), sender);
    }
    return storePart(std::move(part), sender);
  }

  InsertResult PartialChunk::insertReceiptProof(ReceiptProof proof,
                                                const ValidatorId &sender) {
    if (state_ == ChunkState::Invalid) {
      return InsertResult::Duplicate;
    }
    if (not header_.has_value()) {
      return buffer(std::move(proof), sender);
    }
    return storeReceiptProof(std::move(proof), sender);
  }

  InsertResult PartialChunk::buffer(Fragment &&fragment,
                                    const ValidatorId &sender) {
    for (const auto &[held, _] : buffered_) {
      if (held == fragment) {
        return InsertResult::Duplicate;
      }
    }
    // dropped fragments are requested again once the header is known
    if (buffered_.size() >= config_.max_buffered_fragments) {
      return InsertResult::Dropped;
    }
    buffered_.emplace_back(std::move(fragment), sender);
    return InsertResult::Buffered;
  }

  InsertResult PartialChunk::storePart(ChunkPart &&part,
                                       const ValidatorId &sender) {
    BOOST_ASSERT(header_.has_value());
    if (part.index >= header_->total_shard_count) {
      return InsertResult::InvalidIndex;
    }
    if (auto it = parts_.find(part.index);
        it != parts_.end() and it->second.bytes == part.bytes) {
      return InsertResult::Duplicate;
    }
    if (auto res = verifyPart(*hasher_, *header_, part); res.has_error()) {
      if (res.error() == ChunkError::INVALID_INDEX) {
        return InsertResult::InvalidIndex;
      }
      return onProofFailure(sender);
    }
    if (parts_.contains(part.index)) {
      return InsertResult::Duplicate;
    }
    parts_.emplace(part.index, std::move(part));
    updateThreshold();
    return InsertResult::Accepted;
  }

  InsertResult PartialChunk::storeReceiptProof(ReceiptProof &&proof,
                                               const ValidatorId &sender) {
    BOOST_ASSERT(header_.has_value());
    if (proof.to_shard >= num_shards_) {
      return InsertResult::InvalidIndex;
    }
    if (auto it = receipt_proofs_.find(proof.to_shard);
        it != receipt_proofs_.end() and it->second == proof) {
      return InsertResult::Duplicate;
    }
    if (auto res = verifyReceiptProof(*hasher_, *header_, proof, num_shards_);
        res.has_error()) {
      if (res.error() == ChunkError::INVALID_INDEX) {
        return InsertResult::InvalidIndex;
      }
      return onProofFailure(sender);
    }
    if (receipt_proofs_.contains(proof.to_shard)) {
      return InsertResult::Duplicate;
    }
    receipt_proofs_.emplace(proof.to_shard, std::move(proof));
    return InsertResult::Accepted;
  }

  InsertResult PartialChunk::onProofFailure(const ValidatorId &sender) {
    bad_senders_.insert(sender);
    if (config_.max_proof_failures != 0
        and bad_senders_.size() >= config_.max_proof_failures) {
      markInvalid(InvalidReason::ProofFailures);
    }
    return InsertResult::ProofMismatch;
  }

  void PartialChunk::updateThreshold() {
    if (state_ == ChunkState::AwaitingParts
        and parts_.size() >= header_->data_shard_count) {
      state_ = ChunkState::Decodable;
    }
  }

  outcome::result<std::optional<CompletedChunk>> PartialChunk::tryComplete(
      const ErasureCodec &codec) {
    if (state_ == ChunkState::Invalid) {
      return ChunkError::CHUNK_INVALID;
    }
    if (state_ != ChunkState::Decodable) {
      return std::nullopt;
    }
    auto res = reconstruct(codec);
    if (res.has_error()) {
      markInvalid(res.error() == ChunkError::PAYLOAD_MISMATCH
                      ? InvalidReason::PayloadMismatch
                      : InvalidReason::CorruptParts);
      return res.as_failure();
    }
    state_ = ChunkState::Complete;
    return std::make_optional(std::move(res.value()));
  }

  outcome::result<CompletedChunk> PartialChunk::reconstruct(
      const ErasureCodec &codec) {
    const auto &header = *header_;

    std::vector<ChunkPart> held;
    held.reserve(parts_.size());
    for (const auto &[_, part] : parts_) {
      held.push_back(part);
    }
    OUTCOME_TRY(payload,
                codec.decode(held,
                             header.data_shard_count,
                             header.total_shard_count,
                             header.original_length,
                             header.encoded_length));

    // verified parts may still be a wrong codeword
    OUTCOME_TRY(parts,
                codec.encode(
                    payload, header.data_shard_count, header.total_shard_count));
    if (attachPartProofs(*hasher_, parts) != header.parts_root) {
      return ErasureCodingError::CORRUPT_PARTS;
    }

    auto body_res = ::scale::decode<ChunkBody>(payload);
    if (body_res.has_error()) {
      return ChunkError::PAYLOAD_MISMATCH;
    }
    auto &body = body_res.value();
    auto receipts = makeReceiptProofs(
        *hasher_, header.shard_id, body.outgoing_receipts, num_shards_);
    if (receipts.root != header.receipts_root) {
      return ChunkError::PAYLOAD_MISMATCH;
    }

    parts_.clear();
    for (auto &part : parts) {
      parts_.emplace(part.index, std::move(part));
    }
    receipt_proofs_.clear();
    for (const auto &proof : receipts.proofs) {
      receipt_proofs_.emplace(proof.to_shard, proof);
    }
    return CompletedChunk{
        .header = header,
        .body = std::move(body),
        .receipt_proofs = std::move(receipts.proofs),
    };
  }

  void PartialChunk::setProduced(const ChunkHeader &header,
                                 ShardId num_shards,
                                 std::vector<ChunkPart> parts,
                                 std::vector<ReceiptProof> receipt_proofs) {
    header_ = header;
    num_shards_ = num_shards;
    buffered_.clear();
    parts_.clear();
    for (auto &part : parts) {
      parts_.emplace(part.index, std::move(part));
    }
    receipt_proofs_.clear();
    for (auto &proof : receipt_proofs) {
      receipt_proofs_.emplace(proof.to_shard, std::move(proof));
    }
    invalid_reason_.reset();
    state_ = ChunkState::Complete;
  }

  void PartialChunk::markInvalid(InvalidReason reason) {
    if (isFinished()) {
      return;
    }
    state_ = ChunkState::Invalid;
    invalid_reason_ = reason;
    parts_.clear();
    receipt_proofs_.clear();
    buffered_.clear();
  }

  size_t PartialChunk::byteSize() const {
    size_t size = 0;
    for (const auto &[_, part] : parts_) {
      size += sizeOf(part);
    }
    for (const auto &[_, proof] : receipt_proofs_) {
      size += sizeOf(proof);
    }
    for (const auto &[fragment, _] : buffered_) {
      size += visit_in_place(fragment, [](const auto &f) { return sizeOf(f); });
    }
    return size;
  }

}  // namespace tessera::sharding
