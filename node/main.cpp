/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <map>
#include <random>
#include <set>
#include <thread>
#include <unordered_map>

#include <fmt/format.h>
#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>
#include <soralog/util.hpp>

#include "application/chunks_configuration.hpp"
#include "clock/impl/clock_impl.hpp"
#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "metrics/impl/prometheus/registry_impl.hpp"
#include "sharding/chunk_manager.hpp"
#include "sharding/impl/static_validator_assignment.hpp"
#include "storage/in_memory/in_memory_chunk_store.hpp"
#include "utils/safe_object.hpp"
#include "utils/thread_pool.hpp"

using namespace tessera;  // NOLINT(google-build-using-namespace)

namespace {
  using sharding::ChunkManager;
  using sharding::ChunkState;
  using sharding::ValidatorId;

  /// Registry of simulated validators, shared by their transports
  class LoopbackNetwork {
   public:
    LoopbackNetwork(double drop_rate, uint64_t seed)
        : logger_{log::createLogger("LoopbackNetwork", "simulation")},
          drop_rate_{drop_rate},
          random_{seed} {}

    void attach(const ValidatorId &id, std::weak_ptr<ChunkManager> manager) {
      managers_.exclusiveAccess(
          [&](auto &managers) { managers[id] = std::move(manager); });
    }

    void deliver(const ValidatorId &from,
                 const ValidatorId &to,
                 network::ChunkMessage message) {
      if (std::holds_alternative<network::PartMessage>(message) and lost()) {
        SL_TRACE(logger_, "Parts from {} to {} lost", from, to);
        dropped_.fetch_add(1);
        return;
      }
      auto manager = managers_.sharedAccess(
          [&](const auto &managers) -> std::shared_ptr<ChunkManager> {
            auto it = managers.find(to);
            return it == managers.end() ? nullptr : it->second.lock();
          });
      if (manager) {
        manager->onMessage(from, std::move(message));
      }
    }

    size_t dropped() const {
      return dropped_.load();
    }

   private:
    bool lost() {
      return random_.exclusiveAccess([&](auto &random) {
        return std::bernoulli_distribution{drop_rate_}(random);
      });
    }

    log::Logger logger_;
    double drop_rate_;
    SafeObject<std::mt19937_64, std::mutex> random_;
    SafeObject<std::unordered_map<ValidatorId, std::weak_ptr<ChunkManager>>>
        managers_;
    std::atomic_size_t dropped_ = 0;
  };

  class LoopbackTransport : public network::ChunkTransport {
   public:
    LoopbackTransport(ValidatorId local,
                      std::shared_ptr<LoopbackNetwork> network)
        : local_{local}, network_{std::move(network)} {}

    void send(const ValidatorId &peer, network::ChunkMessage message) override {
      network_->deliver(local_, peer, std::move(message));
    }

   private:
    ValidatorId local_;
    std::shared_ptr<LoopbackNetwork> network_;
  };

  struct Validator {
    ValidatorId id;
    std::unique_ptr<ThreadPool> main_pool;
    std::shared_ptr<metrics::PrometheusRegistry> metrics_registry;
    std::shared_ptr<sharding::ChunkCache> cache;
    std::shared_ptr<storage::InMemoryChunkStore> store;
    std::shared_ptr<ChunkManager> manager;
  };

  const char *stateName(ChunkState state) {
    switch (state) {
      case ChunkState::Unknown:
        return "unknown";
      case ChunkState::AwaitingHeader:
        return "awaiting header";
      case ChunkState::AwaitingParts:
        return "awaiting parts";
      case ChunkState::Decodable:
        return "decodable";
      case ChunkState::Complete:
        return "complete";
      case ChunkState::Invalid:
        return "invalid";
    }
    return "?";
  }

  outcome::result<common::Buffer> loadPayload(
      const application::SimulationOptions &options) {
    if (options.payload_file.has_value()) {
      std::ifstream file{options.payload_file.value(), std::ios::binary};
      if (not file.is_open()) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
      }
      common::Buffer payload;
      payload.assign(std::istreambuf_iterator<char>{file},
                     std::istreambuf_iterator<char>{});
      return payload;
    }
    std::mt19937_64 random{options.seed};
    std::uniform_int_distribution<uint16_t> byte{0, 255};
    common::Buffer payload(options.payload_size, 0);
    for (auto &b : payload) {
      b = static_cast<uint8_t>(byte(random));
    }
    return payload;
  }

  int run_simulation(const application::ChunksConfiguration &configuration) {
    auto logger = log::createLogger("Simulation", "simulation");
    const auto &config = configuration.chunks();
    const auto &options = configuration.simulation();

    auto payload_res = loadPayload(options);
    if (payload_res.has_error()) {
      SL_ERROR(
          logger, "Can't load payload: {}", payload_res.error().message());
      return EXIT_FAILURE;
    }

    auto hasher = std::make_shared<crypto::HasherImpl>();
    auto ed25519_provider = std::make_shared<crypto::Ed25519ProviderImpl>();
    auto clock = std::make_shared<clock::SteadyClockImpl>();
    auto codec = std::make_shared<sharding::ErasureCodec>();

    std::vector<crypto::Ed25519Keypair> keypairs;
    std::vector<ValidatorId> ids;
    for (size_t i = 0; i < options.validators; ++i) {
      auto seed = crypto::Ed25519Seed::fromSpan(
                      hasher->sha2_256(common::Buffer::fromString(
                          fmt::format("tessera-validator-{}", i))))
                      .value();
      auto keypair = ed25519_provider->generateKeypair(seed);
      if (keypair.has_error()) {
        SL_ERROR(logger,
                 "Can't generate key #{}: {}",
                 i,
                 keypair.error().message());
        return EXIT_FAILURE;
      }
      ids.push_back(keypair.value().public_key);
      keypairs.push_back(std::move(keypair.value()));
    }

    auto epoch = sharding::EpochId{
        hasher->sha2_256(common::Buffer::fromString("tessera-epoch"))};
    auto assignment = std::make_shared<sharding::StaticValidatorAssignment>(
        epoch, ids, options.num_shards);

    auto network =
        std::make_shared<LoopbackNetwork>(options.drop_rate, options.seed);
    auto worker_pool = std::make_unique<ThreadPool>(
        "worker", options.worker_threads, std::nullopt);

    SafeObject<std::map<ValidatorId, sharding::ChunkBody>> completed;

    std::vector<Validator> validators;
    validators.reserve(options.validators);
    for (size_t i = 0; i < options.validators; ++i) {
      Validator validator;
      validator.id = ids[i];
      validator.main_pool = std::make_unique<ThreadPool>(
          fmt::format("main.{}", i), 1, std::nullopt);
      validator.metrics_registry =
          std::make_shared<metrics::PrometheusRegistry>();
      validator.cache = std::make_shared<sharding::ChunkCache>(
          config, hasher, codec, validator.metrics_registry);
      validator.store = std::make_shared<storage::InMemoryChunkStore>();
      auto producer = std::make_shared<sharding::ChunkProducer>(
          config, hasher, codec, ed25519_provider, assignment, keypairs[i]);
      validator.manager = std::make_shared<ChunkManager>(
          config,
          validator.main_pool->handler(),
          worker_pool->handler(),
          clock,
          hasher,
          ed25519_provider,
          codec,
          assignment,
          validator.cache,
          producer,
          std::make_shared<LoopbackTransport>(ids[i], network),
          validator.store,
          validator.metrics_registry,
          [&completed, id{ids[i]}](const sharding::ChunkHeader &,
                                   const sharding::ChunkBody &body,
                                   const auto &) {
            completed.exclusiveAccess(
                [&](auto &bodies) { bodies.emplace(id, body); });
          });
      network->attach(validator.id, validator.manager);
      validator.manager->start();
      validator.manager->startTicking();
      validators.push_back(std::move(validator));
    }

    sharding::ProductionRequest request;
    request.shard_id = options.shard_id;
    request.height = 1;
    request.prev_block_hash =
        hasher->sha2_256(common::Buffer::fromString("tessera-genesis"));
    request.prev_state_root =
        hasher->sha2_256(common::Buffer::fromString("tessera-state"));
    request.transactions.push_back(std::move(payload_res.value()));
    for (sharding::ShardId shard = 0; shard < options.num_shards; ++shard) {
      if (shard == options.shard_id) {
        continue;
      }
      request.outgoing_receipts.push_back(sharding::Receipt{
          .receipt_id = hasher->sha2_256(common::Buffer::fromString(
              fmt::format("tessera-receipt-{}", shard))),
          .receiver_shard = shard,
          .payload = common::Buffer::fromString(
              fmt::format("transfer to shard {}", shard)),
      });
    }

    auto producer_id = assignment->chunkProducer(
        epoch, request.shard_id, request.height);
    auto producer_it =
        std::find_if(validators.begin(), validators.end(), [&](auto &v) {
          return v.id == producer_id;
        });
    if (producer_it == validators.end()) {
      SL_ERROR(logger, "Producer {} is not simulated", producer_id);
      return EXIT_FAILURE;
    }

    std::promise<outcome::result<sharding::ChunkHash>> produced_promise;
    auto produced_future = produced_promise.get_future();
    producer_it->manager->produceChunk(
        request, [&](outcome::result<sharding::ChunkHash> res) {
          produced_promise.set_value(std::move(res));
        });
    auto produced = produced_future.get();
    if (produced.has_error()) {
      SL_ERROR(
          logger, "Chunk production failed: {}", produced.error().message());
      return EXIT_FAILURE;
    }
    const auto &hash = produced.value();

    auto header = producer_it->cache->header(hash);
    if (not header.has_value()) {
      SL_ERROR(logger, "Produced chunk {} is not cached", hash);
      return EXIT_FAILURE;
    }
    std::set<ValidatorId> owners{producer_id};
    for (sharding::PartIndex index = 0; index < header->total_shard_count;
         ++index) {
      owners.insert(assignment->ownerOf(epoch, header->shard_id, index));
    }
    SL_INFO(logger,
            "Chunk {} produced by {}: {}, {} owners",
            hash,
            producer_id,
            *header,
            owners.size());

    auto deadline = clock->now() + options.timeout;
    auto finished = [&] {
      return std::all_of(owners.begin(), owners.end(), [&](const auto &id) {
        auto it = std::find_if(validators.begin(),
                               validators.end(),
                               [&](auto &v) { return v.id == id; });
        auto state = it->cache->state(hash);
        return state == ChunkState::Complete or state == ChunkState::Invalid;
      });
    };
    while (not finished() and clock->now() < deadline) {
      std::this_thread::sleep_for(config.tick_interval);
    }

    for (auto &validator : validators) {
      validator.main_pool.reset();
    }
    worker_pool.reset();
    for (auto &validator : validators) {
      validator.manager->stop();
    }

    auto expected_body = completed.sharedAccess(
        [&](const auto &completed) -> std::optional<sharding::ChunkBody> {
          auto it = completed.find(producer_id);
          if (it == completed.end()) {
            return std::nullopt;
          }
          return it->second;
        });

    size_t failures = 0;
    fmt::print("{:<4} {:<18} {:<9} {:<16} {:>6} {:>8}\n",
               "#",
               "validator",
               "role",
               "state",
               "parts",
               "payload");
    for (size_t i = 0; i < validators.size(); ++i) {
      const auto &validator = validators[i];
      auto state = validator.cache->state(hash);
      auto body = completed.sharedAccess(
          [&](const auto &completed) -> std::optional<sharding::ChunkBody> {
            auto it = completed.find(validator.id);
            if (it == completed.end()) {
              return std::nullopt;
            }
            return it->second;
          });
      auto is_owner = owners.contains(validator.id);
      bool ok = not is_owner
             or (state == ChunkState::Complete and body.has_value()
                 and body == expected_body);
      if (not ok) {
        ++failures;
      }
      fmt::print("{:<4} {:<18} {:<9} {:<16} {:>6} {:>8}\n",
                 i,
                 validator.id.toHex().substr(0, 16),
                 validator.id == producer_id ? "producer"
                 : is_owner                  ? "owner"
                                             : "idle",
                 stateName(state),
                 validator.cache->heldParts(hash).size(),
                 not body.has_value() ? "-"
                 : body == expected_body ? "ok"
                                         : "MISMATCH");
    }
    fmt::print("{} part messages dropped, {} of {} owners failed\n",
               network->dropped(),
               failures,
               owners.size());
    for (const auto &validator : validators) {
      SL_DEBUG(logger,
               "Metrics of validator {}:\n{}",
               validator.id,
               validator.metrics_registry->exposition());
    }

    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }
}  // namespace

int main(int argc, const char **argv) {
  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  soralog::util::setThreadName("tessera");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto tessera_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(tessera_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  log::setLoggingSystem(logging_system);

  application::ChunksConfiguration configuration;
  auto initialized = configuration.initializeFromArgs(argc, argv);
  if (initialized.has_error()) {
    std::cerr << "Invalid configuration: " << initialized.error().message()
              << '\n';
    return EXIT_FAILURE;
  }
  if (not initialized.value()) {
    return EXIT_SUCCESS;
  }

  log::tuneLoggingSystem(configuration.log());

  auto exit_code = run_simulation(configuration);

  auto logger = log::createLogger("Main", log::defaultGroupName);
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}
