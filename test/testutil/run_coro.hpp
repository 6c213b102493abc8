/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <stdexcept>

#include <boost/asio/io_context.hpp>

#include "coro/spawn.hpp"

namespace testutil {

  /**
   * Runs \param io until \param coro completes.
   * Other queued work keeps running as long as the coroutine is pending.
   */
  template <typename T>
  T runCoro(boost::asio::io_context &io, slashtags::Coro<T> coro) {
    std::optional<T> result;
    slashtags::coroSpawn(io.get_executor(),
                         [&]() -> slashtags::Coro<void> {
                           result.emplace(co_await std::move(coro));
                         });
    io.restart();
    while (not result) {
      if (io.run_one() == 0) {
        throw std::logic_error("io_context ran out of work");
      }
    }
    return std::move(*result);
  }

  inline void runCoro(boost::asio::io_context &io,
                      slashtags::Coro<void> coro) {
    bool done = false;
    slashtags::coroSpawn(io.get_executor(), [&]() -> slashtags::Coro<void> {
      co_await std::move(coro);
      done = true;
    });
    io.restart();
    while (not done) {
      if (io.run_one() == 0) {
        throw std::logic_error("io_context ran out of work");
      }
    }
  }

  /**
   * Runs the handlers which are ready, without waiting for timers
   */
  inline void runReady(boost::asio::io_context &io) {
    io.restart();
    io.poll();
  }

}  // namespace testutil
