/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/chunk_manager.hpp"

#include "core/sharding/sharding_test_harness.hpp"
#include "metrics/impl/prometheus/registry_impl.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "mock/core/crypto/ed25519_provider_mock.hpp"
#include "mock/core/network/chunk_transport_mock.hpp"
#include "mock/core/sharding/validator_assignment_mock.hpp"
#include "mock/core/storage/chunk_store_mock.hpp"
#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_chunk_store.hpp"
#include "testutil/outcome.hpp"
#include "utils/thread_pool.hpp"

using tessera::TestThreadPool;
using tessera::ThreadPool;
using tessera::clock::SteadyClockMock;
using tessera::crypto::Ed25519Keypair;
using tessera::crypto::Ed25519ProviderMock;
using tessera::metrics::PrometheusRegistry;
using tessera::network::ChunkMessage;
using tessera::network::ChunkTransportMock;
using tessera::network::HeaderMessage;
using tessera::network::PartMessage;
using tessera::network::PartRequest;
using tessera::network::ReceiptProofMessage;
using tessera::network::ReceiptRequest;
using tessera::storage::ChunkStore;
using tessera::storage::ChunkStoreMock;
using tessera::storage::DatabaseError;
using tessera::storage::InMemoryChunkStore;
using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::ReturnPointee;

using namespace std::chrono_literals;

class ChunkManagerTest : public ShardingTestHarness {
 protected:
  struct Completion {
    ChunkHeader header;
    ChunkBody body;
    std::vector<ReceiptProof> receipt_proofs;
  };

  void SetUp() override {
    io_ = std::make_shared<boost::asio::io_context>();
    main_pool_ = std::make_unique<ThreadPool>(TestThreadPool{io_});
    worker_pool_ = std::make_unique<ThreadPool>(TestThreadPool{io_});

    epoch_[0] = 0xe0;
    local_.public_key = validator(1);

    ON_CALL(*clock_, now()).WillByDefault(ReturnPointee(&now_));

    ON_CALL(*assignment_, epochOf(_)).WillByDefault(Return(epoch_));
    ON_CALL(*assignment_, numShards(epoch_)).WillByDefault(Return(1));
    ON_CALL(*assignment_, dataShardCount(epoch_, 0)).WillByDefault(Return(2));
    ON_CALL(*assignment_, ownerOf(epoch_, 0, _))
        .WillByDefault([](const EpochId &, ShardId, PartIndex index) {
          return validator(static_cast<uint8_t>(index % 4));
        });
    // validator 1 produces even heights, validator 0 odd ones
    ON_CALL(*assignment_, chunkProducer(epoch_, 0, _))
        .WillByDefault([](const EpochId &, ShardId, BlockHeight height) {
          return validator(height % 2 == 0 ? 1 : 0);
        });

    ON_CALL(*ed25519_provider_, verify(_, _, _)).WillByDefault(Return(true));
    ON_CALL(*ed25519_provider_, sign(_, _))
        .WillByDefault(Return(Signature{}));

    ON_CALL(*transport_, send(_, _))
        .WillByDefault([this](const ValidatorId &peer, ChunkMessage message) {
          sent_.emplace_back(peer, std::move(message));
        });

    if (not manager_store_) {
      manager_store_ = store_;
    }

    cache_ = std::make_shared<ChunkCache>(
        config_, hasher_, codec_, metrics_registry_);
    auto producer = std::make_shared<ChunkProducer>(
        config_, hasher_, codec_, ed25519_provider_, assignment_, local_);
    manager_ = std::make_shared<ChunkManager>(
        config_,
        main_pool_->handler(),
        worker_pool_->handler(),
        clock_,
        hasher_,
        ed25519_provider_,
        codec_,
        assignment_,
        cache_,
        producer,
        transport_,
        manager_store_,
        metrics_registry_,
        [this](const ChunkHeader &header,
               const ChunkBody &body,
               const std::vector<ReceiptProof> &receipt_proofs) {
          completions_.push_back({header, body, receipt_proofs});
        });
    manager_->start();

    remote_ = makeChunk(makeBody(3, 500), 2, 3);
  }

  void TearDown() override {
    manager_->stop();
    manager_.reset();
    worker_pool_.reset();
    main_pool_.reset();
  }

  /// Runs everything posted so far
  void runAll() {
    io_->restart();
    io_->run();
  }

  void deliver(const ValidatorId &from, ChunkMessage message) {
    manager_->onMessage(from, std::move(message));
    runAll();
  }

  void deliverParts(const ValidatorId &from,
                    const TestChunk &chunk,
                    std::initializer_list<PartIndex> indices) {
    PartMessage message{.chunk_hash = chunk.hash};
    for (auto index : indices) {
      message.parts.push_back(chunk.parts.at(index));
    }
    deliver(from, std::move(message));
  }

  double counterValue(const std::string &name,
                      const std::map<std::string, std::string> &labels = {}) {
    return PrometheusRegistry::internalMetric(
               metrics_registry_->registerCounterMetric(name, labels))
        ->Value();
  }

  double gaugeValue(const std::string &name) {
    return PrometheusRegistry::internalMetric(
               metrics_registry_->registerGaugeMetric(name))
        ->Value();
  }

  template <typename T>
  std::vector<std::pair<ValidatorId, T>> sentOf() const {
    std::vector<std::pair<ValidatorId, T>> result;
    for (const auto &[peer, message] : sent_) {
      if (auto msg = std::get_if<T>(&message)) {
        result.emplace_back(peer, *msg);
      }
    }
    return result;
  }

  std::shared_ptr<boost::asio::io_context> io_;
  std::unique_ptr<ThreadPool> main_pool_;
  std::unique_ptr<ThreadPool> worker_pool_;

  SteadyClockMock::TimePoint now_{};
  std::shared_ptr<NiceMock<SteadyClockMock>> clock_ =
      std::make_shared<NiceMock<SteadyClockMock>>();
  std::shared_ptr<NiceMock<ValidatorAssignmentMock>> assignment_ =
      std::make_shared<NiceMock<ValidatorAssignmentMock>>();
  std::shared_ptr<NiceMock<Ed25519ProviderMock>> ed25519_provider_ =
      std::make_shared<NiceMock<Ed25519ProviderMock>>();
  std::shared_ptr<NiceMock<ChunkTransportMock>> transport_ =
      std::make_shared<NiceMock<ChunkTransportMock>>();
  std::shared_ptr<InMemoryChunkStore> store_ =
      std::make_shared<InMemoryChunkStore>();
  std::shared_ptr<ChunkStore> manager_store_;
  std::shared_ptr<PrometheusRegistry> metrics_registry_ =
      std::make_shared<PrometheusRegistry>();
  std::shared_ptr<ChunkCache> cache_;
  std::shared_ptr<ChunkManager> manager_;

  EpochId epoch_;
  Ed25519Keypair local_;
  TestChunk remote_;
  std::vector<std::pair<ValidatorId, ChunkMessage>> sent_;
  std::vector<Completion> completions_;
};

/**
 * @given a header whose signature does not belong to the chunk producer
 * @when the header arrives
 * @then it is dropped without requesting anything
 */
TEST_F(ChunkManagerTest, RejectsForgedHeader) {
  EXPECT_CALL(*ed25519_provider_,
              verify(remote_.header.signature, _, validator(0)))
      .WillOnce(Return(false));

  deliver(validator(0), HeaderMessage{remote_.header});

  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::Unknown);
  EXPECT_EQ(manager_->activeCount(), 0);
  EXPECT_TRUE(sent_.empty());
}

/**
 * @given a header with less data shards than the epoch requires
 * @when the header arrives
 * @then it is dropped
 */
TEST_F(ChunkManagerTest, RejectsHeaderBreakingEpochLayout) {
  ON_CALL(*assignment_, dataShardCount(epoch_, 0)).WillByDefault(Return(3));

  deliver(validator(0), HeaderMessage{remote_.header});

  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::Unknown);
  EXPECT_TRUE(sent_.empty());
}

/**
 * @given a valid header of a remote chunk
 * @when it arrives
 * @then missing parts are requested from their owners, or from the producer
 * for parts the local validator owns
 */
TEST_F(ChunkManagerTest, RequestsMissingParts) {
  deliver(validator(3), HeaderMessage{remote_.header});

  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::AwaitingParts);
  EXPECT_EQ(manager_->activeCount(), 1);
  EXPECT_TRUE(cache_->isPinned(remote_.hash));

  auto requests = sentOf<PartRequest>();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].first, validator(0));
  EXPECT_EQ(requests[0].second.chunk_hash, remote_.hash);
  EXPECT_EQ(requests[0].second.indices, (std::vector<PartIndex>{0, 1}));
  EXPECT_EQ(manager_->pendingRequests(), 2);
}

/**
 * @given receipts of shard 0 tracked
 * @when a header arrives
 * @then receipts are requested from the producer
 */
TEST_F(ChunkManagerTest, RequestsTrackedReceipts) {
  config_.tracked_shards = {0};

  deliver(validator(3), HeaderMessage{remote_.header});

  auto requests = sentOf<ReceiptRequest>();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].first, validator(0));
  EXPECT_EQ(requests[0].second.to_shards, (std::vector<ShardId>{0}));

  deliver(validator(0),
          ReceiptProofMessage{.chunk_hash = remote_.hash,
                              .proofs = remote_.receipt_proofs});
  EXPECT_EQ(manager_->pendingRequests(), 2);
}

/**
 * @given an assembling chunk
 * @when its parts arrive several times from several validators
 * @then the chunk is stored and reported complete exactly once
 */
TEST_F(ChunkManagerTest, CompletesOnce) {
  deliver(validator(0), HeaderMessage{remote_.header});
  deliverParts(validator(0), remote_, {0, 1});
  deliverParts(validator(2), remote_, {0, 1, 2});
  deliverParts(validator(3), remote_, {2});
  deliver(validator(0), HeaderMessage{remote_.header});

  ASSERT_EQ(completions_.size(), 1);
  EXPECT_EQ(completions_[0].header, remote_.header);
  EXPECT_EQ(completions_[0].body, remote_.body);
  EXPECT_EQ(completions_[0].receipt_proofs, remote_.receipt_proofs);

  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::Complete);
  EXPECT_EQ(manager_->activeCount(), 0);
  EXPECT_EQ(manager_->pendingRequests(), 0);
  EXPECT_FALSE(cache_->isPinned(remote_.hash));

  EXPECT_OUTCOME_TRUE(stored, store_->get(remote_.hash));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->body, remote_.body);

  EXPECT_EQ(counterValue("tessera_chunks_completed_total"), 1);
  EXPECT_EQ(gaugeValue("tessera_chunks_assembling"), 0);
}

/**
 * @given parts arriving before their header
 * @when the header arrives
 * @then the chunk completes from the buffered parts without any request
 */
TEST_F(ChunkManagerTest, CompletesFromBufferedParts) {
  deliverParts(validator(2), remote_, {2});
  deliverParts(validator(0), remote_, {0});
  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::AwaitingHeader);

  deliver(validator(0), HeaderMessage{remote_.header});

  EXPECT_EQ(completions_.size(), 1);
  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::Complete);
  EXPECT_TRUE(sentOf<PartRequest>().empty());
}

/**
 * @given parts 0 and 1 requested from validator 0
 * @when validator 0 answers with a forged part 0 and a valid part 1
 * @then part 0 is requested from it again only after the doubled backoff
 */
TEST_F(ChunkManagerTest, BacksOffAfterForgedResponse) {
  deliver(validator(3), HeaderMessage{remote_.header});
  sent_.clear();

  auto forged = remote_.parts[0];
  forged.bytes[0] ^= 0x01;
  deliver(validator(0),
          PartMessage{.chunk_hash = remote_.hash,
                      .parts = {forged, remote_.parts[1]}});
  EXPECT_TRUE(sent_.empty());
  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::AwaitingParts);
  EXPECT_EQ(manager_->pendingRequests(), 1);

  now_ += config_.request_base_backoff * 2 - 1ms;
  manager_->onTick();
  runAll();
  EXPECT_TRUE(sent_.empty());

  now_ += 1ms;
  manager_->onTick();
  runAll();
  auto requests = sentOf<PartRequest>();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].first, validator(0));
  EXPECT_EQ(requests[0].second.indices, std::vector<PartIndex>{0});
}

/**
 * @given outstanding part requests
 * @when their timeout passes
 * @then they are sent again on the next tick
 */
TEST_F(ChunkManagerTest, RetriesOnTimeout) {
  deliver(validator(3), HeaderMessage{remote_.header});
  sent_.clear();

  now_ += config_.request_base_backoff - 1ms;
  manager_->onTick();
  runAll();
  EXPECT_TRUE(sent_.empty());

  now_ += 1ms;
  manager_->onTick();
  runAll();
  auto requests = sentOf<PartRequest>();
  ASSERT_EQ(requests.size(), 2);
  EXPECT_EQ(requests[0].first, validator(0));
  EXPECT_EQ(requests[1].first, validator(0));
  EXPECT_EQ(counterValue("tessera_chunk_fragment_requests_total",
                         {{"outcome", "retried"}}),
            sent_.size());
}

/**
 * @given requests without retries
 * @when they time out and too few parts remain obtainable
 * @then the chunk is given up as unreachable
 */
TEST_F(ChunkManagerTest, GivesUpUnreachableChunk) {
  config_.request_max_retries = 0;
  deliver(validator(3), HeaderMessage{remote_.header});

  now_ += config_.request_base_backoff;
  manager_->onTick();
  runAll();

  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::Invalid);
  EXPECT_EQ(cache_->invalidReason(remote_.hash), InvalidReason::Unreachable);
  EXPECT_EQ(manager_->activeCount(), 0);
  EXPECT_EQ(manager_->pendingRequests(), 0);
  EXPECT_TRUE(completions_.empty());

  const auto requests = "tessera_chunk_fragment_requests_total";
  EXPECT_GT(counterValue(requests, {{"outcome", "issued"}}), 0);
  EXPECT_EQ(counterValue(requests, {{"outcome", "missing"}}),
            counterValue(requests, {{"outcome", "issued"}}));
  EXPECT_EQ(counterValue("tessera_chunks_invalid_total",
                         {{"reason", "unreachable"}}),
            1);
  EXPECT_EQ(gaugeValue("tessera_chunks_assembling"), 0);
}

/**
 * @given a forged part buffered before the header and a single bad sender
 * enough to reject a chunk
 * @when the header arrives
 * @then the chunk is rejected without being assembled
 */
TEST_F(ChunkManagerTest, RejectsOnBufferedForgedPart) {
  config_.max_proof_failures = 1;
  auto forged = remote_.parts[0];
  forged.bytes[0] ^= 0x01;
  deliver(validator(2),
          PartMessage{.chunk_hash = remote_.hash, .parts = {forged}});
  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::AwaitingHeader);

  deliver(validator(3), HeaderMessage{remote_.header});

  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::Invalid);
  EXPECT_EQ(cache_->invalidReason(remote_.hash),
            InvalidReason::ProofFailures);
  EXPECT_EQ(manager_->activeCount(), 0);
  EXPECT_EQ(manager_->pendingRequests(), 0);
  EXPECT_TRUE(sent_.empty());
  EXPECT_TRUE(completions_.empty());
  EXPECT_EQ(counterValue("tessera_chunks_invalid_total",
                         {{"reason", "proof_failures"}}),
            1);
}

/**
 * @given a complete chunk evicted from the cache
 * @when a part of it is requested
 * @then the part is rebuilt from the store with its proof
 */
TEST_F(ChunkManagerTest, ServesEvictedChunkFromStore) {
  config_.cache_max_entries = 1;
  deliver(validator(0), HeaderMessage{remote_.header});
  deliverParts(validator(0), remote_, {0, 1});
  ASSERT_EQ(completions_.size(), 1);

  auto other = makeChunk(makeBody(1, 10), 1, 2);
  deliverParts(validator(2), other, {0});
  ASSERT_FALSE(cache_->contains(remote_.hash));
  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::Complete);
  sent_.clear();

  deliver(validator(3),
          PartRequest{.chunk_hash = remote_.hash, .indices = {2}});

  auto responses = sentOf<PartMessage>();
  ASSERT_EQ(responses.size(), 1);
  EXPECT_EQ(responses[0].first, validator(3));
  ASSERT_EQ(responses[0].second.parts.size(), 1);
  EXPECT_EQ(responses[0].second.parts[0], remote_.parts[2]);
  EXPECT_OUTCOME_TRUE_1(
      verifyPart(*hasher_, remote_.header, responses[0].second.parts[0]));
}

/**
 * @given the local validator producing at an even height
 * @when producing a chunk
 * @then the chunk is stored, reported complete and every remote owner
 * receives the header, its parts and the receipt proofs
 */
TEST_F(ChunkManagerTest, ProducesAndDistributes) {
  ProductionRequest request{
      .shard_id = 0,
      .height = 2,
      .transactions = {randomBytes(300, 3)},
      .outgoing_receipts = {receipt(0, 1)},
  };
  std::optional<outcome::result<ChunkHash>> produced;
  manager_->produceChunk(request, [&](outcome::result<ChunkHash> res) {
    produced = std::move(res);
  });
  runAll();

  ASSERT_TRUE(produced.has_value());
  EXPECT_OUTCOME_TRUE(hash, produced.value());
  EXPECT_EQ(manager_->chunkState(hash), ChunkState::Complete);
  EXPECT_TRUE(cache_->isPinned(hash));
  ASSERT_EQ(completions_.size(), 1);
  EXPECT_EQ(completions_[0].body.transactions, request.transactions);
  EXPECT_EQ(store_->size(), 1);

  // parts 0 and 2 are owned by validators 0 and 2, part 1 locally
  auto headers = sentOf<HeaderMessage>();
  auto parts = sentOf<PartMessage>();
  auto receipts = sentOf<ReceiptProofMessage>();
  ASSERT_EQ(headers.size(), 2);
  ASSERT_EQ(parts.size(), 2);
  ASSERT_EQ(receipts.size(), 2);
  for (const auto &[peer, message] : parts) {
    EXPECT_NE(peer, local_.public_key);
    ASSERT_EQ(message.parts.size(), 1);
    EXPECT_EQ(validator(static_cast<uint8_t>(message.parts[0].index)), peer);
  }

  // production pin is released after its duration
  now_ += config_.production_pin_duration;
  manager_->onTick();
  runAll();
  EXPECT_FALSE(cache_->isPinned(hash));
}

/**
 * @given a height produced by another validator
 * @when asked to produce
 * @then the callback receives the error
 */
TEST_F(ChunkManagerTest, ProductionFailure) {
  std::optional<outcome::result<ChunkHash>> produced;
  manager_->produceChunk(ProductionRequest{.shard_id = 0, .height = 3},
                         [&](outcome::result<ChunkHash> res) {
                           produced = std::move(res);
                         });
  runAll();

  ASSERT_TRUE(produced.has_value());
  EXPECT_EC(produced.value(), ChunkError::UNKNOWN_PRODUCER);
  EXPECT_TRUE(sent_.empty());
  EXPECT_TRUE(completions_.empty());
}

/**
 * @given a complete chunk
 * @when receipts to all shards are requested
 * @then every proof is sent back
 */
TEST_F(ChunkManagerTest, ServesReceiptRequest) {
  deliver(validator(0), HeaderMessage{remote_.header});
  deliverParts(validator(0), remote_, {0, 1});
  sent_.clear();

  deliver(validator(2), ReceiptRequest{.chunk_hash = remote_.hash});

  auto responses = sentOf<ReceiptProofMessage>();
  ASSERT_EQ(responses.size(), 1);
  EXPECT_EQ(responses[0].first, validator(2));
  EXPECT_EQ(responses[0].second.proofs, remote_.receipt_proofs);
}

class ChunkManagerStoreFailureTest : public ChunkManagerTest {
 protected:
  void SetUp() override {
    outcome::result<void> put_failure = DatabaseError::CORRUPTION;
    outcome::result<std::optional<FinalizedChunk>> get_failure =
        DatabaseError::CORRUPTION;
    outcome::result<bool> contains_failure = DatabaseError::CORRUPTION;
    ON_CALL(*store_mock_, put(_, _)).WillByDefault(Return(put_failure));
    ON_CALL(*store_mock_, get(_)).WillByDefault(Return(get_failure));
    ON_CALL(*store_mock_, contains(_))
        .WillByDefault(Return(contains_failure));
    manager_store_ = store_mock_;
    ChunkManagerTest::SetUp();
  }

  std::shared_ptr<NiceMock<ChunkStoreMock>> store_mock_ =
      std::make_shared<NiceMock<ChunkStoreMock>>();
};

/**
 * @given a store refusing to persist chunks
 * @when a remote chunk becomes decodable
 * @then it is still reported complete once and parts are served from the
 * cache
 */
TEST_F(ChunkManagerStoreFailureTest, CompletesDespiteStoreFailure) {
  EXPECT_CALL(*store_mock_, put(remote_.hash, _)).Times(1);

  deliver(validator(0), HeaderMessage{remote_.header});
  deliverParts(validator(0), remote_, {0, 1});

  ASSERT_EQ(completions_.size(), 1);
  EXPECT_EQ(manager_->chunkState(remote_.hash), ChunkState::Complete);
  sent_.clear();

  deliver(validator(3),
          PartRequest{.chunk_hash = remote_.hash, .indices = {0}});
  auto responses = sentOf<PartMessage>();
  ASSERT_EQ(responses.size(), 1);
  EXPECT_EQ(responses[0].second.parts, std::vector{remote_.parts[0]});
}

/**
 * @given a store failing to read
 * @when parts of a chunk unknown to the cache are requested
 * @then nothing is sent back
 */
TEST_F(ChunkManagerStoreFailureTest, UnreadableStore) {
  EXPECT_CALL(*store_mock_, get(remote_.hash)).Times(1);

  deliver(validator(3),
          PartRequest{.chunk_hash = remote_.hash, .indices = {0}});

  EXPECT_TRUE(sent_.empty());
}

class ChunkManagerShortMemoryTest : public ChunkManagerTest {
 protected:
  void SetUp() override {
    config_.cache_max_entries = 1;
    config_.finished_memory = 1;
    ChunkManagerTest::SetUp();
  }

  void complete(const TestChunk &chunk) {
    deliver(validator(0), HeaderMessage{chunk.header});
    deliverParts(validator(0), chunk, {0, 1});
  }
};

/**
 * @given a complete chunk forgotten by the cache and the manager after two
 * newer chunks completed
 * @when its header and parts are delivered again
 * @then it is not assembled again and completion is not reported twice
 */
TEST_F(ChunkManagerShortMemoryTest, ReplayedChunkCompletesOnce) {
  complete(remote_);
  complete(makeChunk(makeBody(1, 40), 2, 3, 0, 1, 3));
  complete(makeChunk(makeBody(2, 40), 2, 3, 0, 1, 5));
  ASSERT_EQ(completions_.size(), 3);
  ASSERT_FALSE(cache_->contains(remote_.hash));
  sent_.clear();

  complete(remote_);

  EXPECT_EQ(completions_.size(), 3);
  EXPECT_EQ(manager_->activeCount(), 0);
  EXPECT_TRUE(sentOf<PartRequest>().empty());
  EXPECT_EQ(store_->size(), 3);
}
