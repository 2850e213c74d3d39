/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/blob.hpp"

namespace tessera::crypto {
  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha256(common::BufferView input);

  /**
   * Take a SHA-256 hash of the concatenation `left || right`
   */
  common::Hash256 sha256(const common::Hash256 &left,
                         const common::Hash256 &right);
}  // namespace tessera::crypto
