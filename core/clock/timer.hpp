/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include <boost/system/error_code.hpp>

#include "clock/clock.hpp"

namespace tessera::clock {
  /**
   * Interface for asynchronous timer
   */
  struct Timer {
    virtual ~Timer() = default;

    /**
     * Set an expire time for this timer
     * @param duration before timer will be expired
     */
    virtual void expiresAfter(SteadyClock::Duration duration) = 0;

    /**
     * Cancel timer
     */
    virtual void cancel() = 0;

    /**
     * Wait for the timer expiration
     * @param h - handler, which is called, when the timer is expired, or error
     * happens
     */
    virtual void asyncWait(
        const std::function<void(const boost::system::error_code &)> &h) = 0;
  };
}  // namespace tessera::clock
