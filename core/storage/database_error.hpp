/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace tessera::storage {

  /**
   * @brief chunk store error
   */
  enum class DatabaseError : int {
    OK = 0,
    CORRUPTION = 1,
    INVALID_ARGUMENT = 2,

    UNKNOWN = 1000
  };
}  // namespace tessera::storage

OUTCOME_HPP_DECLARE_ERROR(tessera::storage, DatabaseError);
