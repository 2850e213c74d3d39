/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace tessera::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash256 sha2_256(common::BufferView data) const override;

    Hash256 sha2_256(const Hash256 &left, const Hash256 &right) const override;
  };

}  // namespace tessera::crypto
