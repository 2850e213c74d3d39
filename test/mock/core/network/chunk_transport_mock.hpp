/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/chunk_transport.hpp"

#include <gmock/gmock.h>

namespace tessera::network {
  class ChunkTransportMock : public ChunkTransport {
   public:
    MOCK_METHOD(void,
                send,
                (const sharding::ValidatorId &, ChunkMessage),
                (override));
  };
}  // namespace tessera::network
