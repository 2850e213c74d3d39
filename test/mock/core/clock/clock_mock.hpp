/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

#include <gmock/gmock.h>

namespace tessera::clock {

  class SteadyClockMock : public SteadyClock {
   public:
    MOCK_METHOD(TimePoint, now, (), (const, override));

    MOCK_METHOD(uint64_t, nowMsec, (), (const, override));
  };

}  // namespace tessera::clock
