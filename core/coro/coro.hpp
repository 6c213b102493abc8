/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "outcome/outcome.hpp"

#define _CO_TRY_VOID(tmp, expr) \
  auto &&tmp = (expr);          \
  if (tmp.has_error()) {        \
    co_return tmp.as_failure(); \
  }

#define _CO_TRY_OUT(tmp, var, expr) \
  auto &&tmp = (expr);              \
  if (tmp.has_error()) {            \
    co_return tmp.as_failure();     \
  }                                 \
  auto var = std::move(tmp.value());

#define _CO_TRY_1(expr) _CO_TRY_VOID(OUTCOME_UNIQUE, expr)
#define _CO_TRY_2(var, expr) _CO_TRY_OUT(OUTCOME_UNIQUE, var, expr)

/**
 * Macro to get outcome result or return error from coroutine.
 * Awaited expressions must be wrapped: `CO_TRY(x, co_await f())`.
 */
#define CO_TRY(...) BOOST_PP_OVERLOAD(_CO_TRY_, __VA_ARGS__)(__VA_ARGS__)

namespace slashtags {
  /**
   * Return type for coroutine.
   */
  template <typename T>
  using Coro = boost::asio::awaitable<T>;

  /**
   * Return type for coroutine returning outcome.
   */
  template <typename T>
  using CoroOutcome = Coro<outcome::result<T>>;
}  // namespace slashtags
