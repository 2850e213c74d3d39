/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/types/chunk_messages.hpp"

namespace tessera::network {

  /**
   * Outbound side of the chunk protocol. Inbound messages are delivered to
   * `sharding::ChunkManager::onMessage`.
   */
  class ChunkTransport {
   public:
    virtual ~ChunkTransport() = default;

    /// Sends the message to the validator, delivery is not guaranteed
    virtual void send(const sharding::ValidatorId &peer,
                      ChunkMessage message) = 0;
  };

}  // namespace tessera::network
