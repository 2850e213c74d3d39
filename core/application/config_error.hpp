/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace tessera::application {

  enum class ConfigError {
    INVALID_ARGUMENTS = 1,
    CONFIG_FILE_UNREADABLE,
    ZERO_SHARD_SIZE,
    ZERO_PARITY_DENOMINATOR,
    TOO_MANY_SHARDS,
    EMPTY_BUDGET,
    ZERO_BACKOFF,
    BACKOFF_ORDER,
    ZERO_TICK_INTERVAL,
    NOT_ENOUGH_VALIDATORS,
    INVALID_DROP_RATE,
    INVALID_SHARD,
  };

}  // namespace tessera::application

OUTCOME_HPP_DECLARE_ERROR(tessera::application, ConfigError);
