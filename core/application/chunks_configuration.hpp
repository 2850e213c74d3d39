/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "sharding/chunks_config.hpp"

namespace tessera::application {

  /**
   * Parameters of the in-process network simulation
   */
  struct SimulationOptions {
    size_t validators = 4;
    sharding::ShardId num_shards = 1;
    /// Shard the simulated chunk belongs to
    sharding::ShardId shard_id = 0;
    /// Payload is read from the file if set, random otherwise
    std::optional<std::string> payload_file;
    size_t payload_size = 100 * 1024;
    /// Share of part messages lost by the transport
    double drop_rate = 0.1;
    uint64_t seed = 42;
    std::chrono::milliseconds timeout{10000};
    size_t worker_threads = 2;
  };

  /**
   * Reads chunk policy and simulation parameters from the command line and
   * an optional INI config file. Command line values take precedence.
   */
  class ChunksConfiguration {
   public:
    ChunksConfiguration();

    /**
     * @return false if only help was requested, ConfigError on invalid input
     */
    outcome::result<bool> initializeFromArgs(int argc, const char **argv);

    const sharding::ChunksConfig &chunks() const {
      return chunks_;
    }

    const SimulationOptions &simulation() const {
      return simulation_;
    }

    /// `--log group=level` overrides of the logging system
    const std::vector<std::string> &log() const {
      return logger_tuning_config_;
    }

    /// Checks the policy constants for values the engine can not work with
    static outcome::result<void> validate(const sharding::ChunksConfig &config);

    static outcome::result<void> validate(const SimulationOptions &options);

   private:
    log::Logger logger_;
    sharding::ChunksConfig chunks_;
    SimulationOptions simulation_;
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace tessera::application
