/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/chunks_configuration.hpp"

#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>

#include "application/config_error.hpp"
#include "sharding/erasure/erasure_codec.hpp"

namespace {
  const tessera::sharding::ChunksConfig def_chunks{};
  const tessera::application::SimulationOptions def_simulation{};

  template <typename T>
  void find_argument(const boost::program_options::variables_map &vm,
                     const char *name,
                     T &target) {
    if (auto it = vm.find(name); it != vm.end()) {
      target = it->second.as<T>();
    }
  }

  void find_duration(const boost::program_options::variables_map &vm,
                     const char *name,
                     std::chrono::milliseconds &target) {
    if (auto it = vm.find(name); it != vm.end()) {
      target = std::chrono::milliseconds{it->second.as<uint64_t>()};
    }
  }
}  // namespace

namespace tessera::application {

  ChunksConfiguration::ChunksConfiguration()
      : logger_{log::createLogger("Configuration", "application")} {}

  outcome::result<bool> ChunksConfiguration::initializeFromArgs(
      int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from (INI).")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax is `<target>=<level>`, e.g. -llibp2p=off.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off.\n"
          "By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath to a YAML logging configuration")
        ;

    po::options_description chunks_desc("Chunk options");
    chunks_desc.add_options()
        ("shard-byte-size", po::value<size_t>()->default_value(def_chunks.shard_byte_size), "target size of one data part, bytes")
        ("parity-numerator", po::value<uint32_t>()->default_value(def_chunks.parity_numerator), "parity shards per data shard, numerator")
        ("parity-denominator", po::value<uint32_t>()->default_value(def_chunks.parity_denominator), "parity shards per data shard, denominator")
        ("max-total-shards", po::value<uint32_t>()->default_value(def_chunks.max_total_shards), "maximal number of parts of a chunk")
        ("cache-max-entries", po::value<size_t>()->default_value(def_chunks.cache_max_entries), "maximal number of cached chunks")
        ("cache-max-bytes", po::value<size_t>()->default_value(def_chunks.cache_max_bytes), "maximal size of cached fragments, bytes")
        ("finished-memory", po::value<size_t>()->default_value(def_chunks.finished_memory), "number of finished chunk hashes remembered after eviction")
        ("max-buffered-fragments", po::value<size_t>()->default_value(def_chunks.max_buffered_fragments), "fragments kept per chunk until its header is known")
        ("request-base-backoff", po::value<uint64_t>()->default_value(def_chunks.request_base_backoff.count()), "first request timeout, ms")
        ("request-max-backoff", po::value<uint64_t>()->default_value(def_chunks.request_max_backoff.count()), "maximal request timeout, ms")
        ("request-max-retries", po::value<uint32_t>()->default_value(def_chunks.request_max_retries), "retries before a fragment is considered missing")
        ("max-proof-failures", po::value<uint32_t>()->default_value(def_chunks.max_proof_failures), "distinct peers with bad fragments before a chunk is rejected, 0 disables")
        ("production-pin-duration", po::value<uint64_t>()->default_value(def_chunks.production_pin_duration.count()), "time a produced chunk is kept in cache, ms")
        ("tick-interval", po::value<uint64_t>()->default_value(def_chunks.tick_interval.count()), "request timer resolution, ms")
        ("tracked-shard", po::value<std::vector<sharding::ShardId>>()->composing(), "shard whose incoming receipts are collected, may be repeated")
        ;

    po::options_description simulation_desc("Simulation options");
    simulation_desc.add_options()
        ("validators", po::value<size_t>()->default_value(def_simulation.validators), "number of simulated validators")
        ("shards", po::value<sharding::ShardId>()->default_value(def_simulation.num_shards), "number of shards")
        ("shard", po::value<sharding::ShardId>()->default_value(def_simulation.shard_id), "shard of the produced chunk")
        ("payload-file", po::value<std::string>(), "file used as the transaction of the produced chunk")
        ("payload-size", po::value<size_t>()->default_value(def_simulation.payload_size), "size of the random transaction if no payload file is given, bytes")
        ("drop-rate", po::value<double>()->default_value(def_simulation.drop_rate), "share of part messages lost in transit")
        ("seed", po::value<uint64_t>()->default_value(def_simulation.seed), "seed of payload and loss randomness")
        ("timeout", po::value<uint64_t>()->default_value(def_simulation.timeout.count()), "time given to the validators to assemble the chunk, ms")
        ("worker-threads", po::value<size_t>()->default_value(def_simulation.worker_threads), "threads of the worker pool")
        ;
    // clang-format on

    desc.add(chunks_desc).add(simulation_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      SL_ERROR(logger_, "Error: {}", e.what());
      std::cerr << "Try run with option '--help' for more information"
                << std::endl;
      return ConfigError::INVALID_ARGUMENTS;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    if (auto it = vm.find("config-file"); it != vm.end()) {
      auto path = it->second.as<std::string>();
      std::ifstream file{path};
      if (not file.is_open()) {
        SL_ERROR(logger_, "Config file {} can not be opened", path);
        return ConfigError::CONFIG_FILE_UNREADABLE;
      }
      try {
        po::store(po::parse_config_file(file, desc), vm);
        po::notify(vm);
      } catch (const std::exception &e) {
        SL_ERROR(logger_, "Config file {} is invalid: {}", path, e.what());
        return ConfigError::INVALID_ARGUMENTS;
      }
    }

    find_argument(vm, "log", logger_tuning_config_);

    find_argument(vm, "shard-byte-size", chunks_.shard_byte_size);
    find_argument(vm, "parity-numerator", chunks_.parity_numerator);
    find_argument(vm, "parity-denominator", chunks_.parity_denominator);
    find_argument(vm, "max-total-shards", chunks_.max_total_shards);
    find_argument(vm, "cache-max-entries", chunks_.cache_max_entries);
    find_argument(vm, "cache-max-bytes", chunks_.cache_max_bytes);
    find_argument(vm, "finished-memory", chunks_.finished_memory);
    find_argument(
        vm, "max-buffered-fragments", chunks_.max_buffered_fragments);
    find_duration(vm, "request-base-backoff", chunks_.request_base_backoff);
    find_duration(vm, "request-max-backoff", chunks_.request_max_backoff);
    find_argument(vm, "request-max-retries", chunks_.request_max_retries);
    find_argument(vm, "max-proof-failures", chunks_.max_proof_failures);
    find_duration(
        vm, "production-pin-duration", chunks_.production_pin_duration);
    find_duration(vm, "tick-interval", chunks_.tick_interval);
    if (auto it = vm.find("tracked-shard"); it != vm.end()) {
      for (auto shard : it->second.as<std::vector<sharding::ShardId>>()) {
        chunks_.tracked_shards.insert(shard);
      }
    }

    find_argument(vm, "validators", simulation_.validators);
    find_argument(vm, "shards", simulation_.num_shards);
    find_argument(vm, "shard", simulation_.shard_id);
    if (auto it = vm.find("payload-file"); it != vm.end()) {
      simulation_.payload_file = it->second.as<std::string>();
    }
    find_argument(vm, "payload-size", simulation_.payload_size);
    find_argument(vm, "drop-rate", simulation_.drop_rate);
    find_argument(vm, "seed", simulation_.seed);
    find_duration(vm, "timeout", simulation_.timeout);
    find_argument(vm, "worker-threads", simulation_.worker_threads);

    OUTCOME_TRY(validate(chunks_));
    OUTCOME_TRY(validate(simulation_));
    return true;
  }

  outcome::result<void> ChunksConfiguration::validate(
      const sharding::ChunksConfig &config) {
    if (config.shard_byte_size == 0) {
      return ConfigError::ZERO_SHARD_SIZE;
    }
    if (config.parity_denominator == 0) {
      return ConfigError::ZERO_PARITY_DENOMINATOR;
    }
    if (config.max_total_shards == 0
        or config.max_total_shards > sharding::ErasureCodec::kMaxShards) {
      return ConfigError::TOO_MANY_SHARDS;
    }
    if (config.cache_max_entries == 0 or config.cache_max_bytes == 0
        or config.finished_memory == 0) {
      return ConfigError::EMPTY_BUDGET;
    }
    if (config.request_base_backoff.count() <= 0
        or config.request_max_backoff.count() <= 0) {
      return ConfigError::ZERO_BACKOFF;
    }
    if (config.request_base_backoff > config.request_max_backoff) {
      return ConfigError::BACKOFF_ORDER;
    }
    if (config.tick_interval.count() <= 0) {
      return ConfigError::ZERO_TICK_INTERVAL;
    }
    return outcome::success();
  }

  outcome::result<void> ChunksConfiguration::validate(
      const SimulationOptions &options) {
    if (options.validators == 0 or options.worker_threads == 0) {
      return ConfigError::NOT_ENOUGH_VALIDATORS;
    }
    if (not(options.drop_rate >= 0.0 and options.drop_rate < 1.0)) {
      return ConfigError::INVALID_DROP_RATE;
    }
    if (options.num_shards == 0 or options.shard_id >= options.num_shards) {
      return ConfigError::INVALID_SHARD;
    }
    return outcome::success();
  }

}  // namespace tessera::application
