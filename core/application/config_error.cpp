/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/config_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::application, ConfigError, e) {
  using E = tessera::application::ConfigError;
  switch (e) {
    case E::INVALID_ARGUMENTS:
      return "Invalid command line arguments";
    case E::CONFIG_FILE_UNREADABLE:
      return "Config file can not be read";
    case E::ZERO_SHARD_SIZE:
      return "Shard byte size must be positive";
    case E::ZERO_PARITY_DENOMINATOR:
      return "Parity denominator must be positive";
    case E::TOO_MANY_SHARDS:
      return "Total shard count limit must be in [1, 65536]";
    case E::EMPTY_BUDGET:
      return "Cache budgets must be positive";
    case E::ZERO_BACKOFF:
      return "Request backoff must be positive";
    case E::BACKOFF_ORDER:
      return "Base request backoff exceeds the maximal one";
    case E::ZERO_TICK_INTERVAL:
      return "Tick interval must be positive";
    case E::NOT_ENOUGH_VALIDATORS:
      return "At least one validator is required";
    case E::INVALID_DROP_RATE:
      return "Drop rate must be in [0, 1)";
    case E::INVALID_SHARD:
      return "Shard id must be less than the number of shards";
  }
  return "Unknown configuration error";
}
