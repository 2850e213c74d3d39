/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/database_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::storage, DatabaseError, e) {
  using E = tessera::storage::DatabaseError;
  switch (e) {
    case E::OK:
      return "success";
    case E::CORRUPTION:
      return "data corruption in chunk store";
    case E::INVALID_ARGUMENT:
      return "chunk does not match its hash";
    case E::UNKNOWN:
      break;
  }

  return "unknown error";
}
