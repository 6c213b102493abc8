/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "coro/coro.hpp"

namespace slashtags::coro {

  /**
   * One-shot notification for coroutines running on a single executor.
   * Every waiter suspended before `set()` is resumed by it, waiters arriving
   * after `set()` do not suspend at all.
   * Owner keeps the event in a shared_ptr, waiters hold their own copy of it.
   */
  class AsyncEvent {
   public:
    using Clock = boost::asio::steady_timer::clock_type;

    bool isSet() const {
      return set_;
    }

    void set() {
      if (set_) {
        return;
      }
      set_ = true;
      auto waiters = std::move(waiters_);
      for (auto &timer : waiters) {
        timer->cancel();
      }
    }

    Coro<void> wait() {
      co_await waitUntil(Clock::time_point::max());
    }

    /// @return true if the event was set before timeout expired
    Coro<bool> waitFor(Clock::duration timeout) {
      co_return co_await waitUntil(Clock::now() + timeout);
    }

   private:
    Coro<bool> waitUntil(Clock::time_point deadline) {
      if (set_) {
        co_return true;
      }
      auto timer = std::make_shared<boost::asio::steady_timer>(
          co_await boost::asio::this_coro::executor, deadline);
      waiters_.push_back(timer);
      boost::system::error_code ec;
      co_await timer->async_wait(
          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      std::erase(waiters_, timer);
      co_return set_;
    }

    bool set_ = false;
    std::vector<std::shared_ptr<boost::asio::steady_timer>> waiters_;
  };

}  // namespace slashtags::coro
