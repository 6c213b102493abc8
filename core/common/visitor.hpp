/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace slashtags {

  template <typename... Lambdas>
  struct lambda_visitor : Lambdas... {
    using Lambdas::operator()...;
  };

  template <typename... Lambdas>
  lambda_visitor(Lambdas...) -> lambda_visitor<Lambdas...>;

  /**
   * @brief Convenient in-place compile-time visitor creation, from a set of
   * lambdas
   *
   * @code
   * make_visitor([](int a){ return 1; },
   *              [](std::string b) { return 2; });
   * @nocode
   */
  template <class... Fs>
  constexpr auto make_visitor(Fs &&...fs) {
    return lambda_visitor<std::decay_t<Fs>...>{std::forward<Fs>(fs)...};
  }

  /**
   * @brief Inplace visitor for std::variant.
   * @code
   *   std::variant<int, std::string> value = "1234";
   *   ...
   *   visit_in_place(value,
   *                  [](int v) { std::cout << "(int)" << v; },
   *                  [](std::string v) { std::cout << "(string)" << v;}
   *                  );
   * @nocode
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&...visitors) {
    return std::visit(make_visitor(std::forward<TVisitors>(visitors)...),
                      std::forward<TVariant>(variant));
  }

}  // namespace slashtags
