/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "clock/timer.hpp"

namespace tessera::clock {
  /**
   * Implementation of timer over boost::asio::steady_timer
   */
  class BasicWaitableTimer : public Timer {
   public:
    explicit BasicWaitableTimer(
        std::shared_ptr<boost::asio::io_context> io_context);

    ~BasicWaitableTimer() override = default;

    void expiresAfter(SteadyClock::Duration duration) override;

    void cancel() override;

    void asyncWait(const std::function<void(const boost::system::error_code &)>
                       &h) override;

   private:
    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::steady_timer timer_;
  };
}  // namespace tessera::clock
