/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>
#include <typeinfo>

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/facilities/overload.hpp>

namespace outcome {
  template <typename T>
  using result = boost::outcome_v2::std_result<T>;

  using boost::outcome_v2::failure;
  using boost::outcome_v2::success;
}  // namespace outcome

namespace __slashtags_outcome {

  template <typename T>
  class Category : public std::error_category {
   public:
    const char *name() const noexcept final {
      return typeid(T).name();
    }

    std::string message(int c) const final {
      return toString(static_cast<T>(c));
    }

    /// specialised by OUTCOME_CPP_DEFINE_CATEGORY for each enum
    static std::string toString(T t);

    static const Category<T> &get() {
      static const Category<T> c;
      return c;
    }
  };

}  // namespace __slashtags_outcome

/// MUST BE EXECUTED AT FILE LEVEL (no namespace) IN HPP
#define OUTCOME_HPP_DECLARE_ERROR(Namespace, Enum)                     \
  template <>                                                           \
  struct std::is_error_code_enum<Namespace::Enum> : std::true_type {}; \
  namespace Namespace {                                                 \
    std::error_code make_error_code(Enum e);                            \
  }

/// MUST BE EXECUTED AT FILE LEVEL (no namespace) IN CPP
#define OUTCOME_CPP_DEFINE_CATEGORY(Namespace, Enum, Name)                   \
  template <>                                                                \
  std::string __slashtags_outcome::Category<Namespace::Enum>::toString(      \
      Namespace::Enum);                                                      \
  namespace Namespace {                                                      \
    std::error_code make_error_code(Enum e) {                                \
      return {static_cast<int>(e),                                           \
              __slashtags_outcome::Category<Namespace::Enum>::get()};        \
    }                                                                        \
  }                                                                          \
  template <>                                                                \
  std::string __slashtags_outcome::Category<Namespace::Enum>::toString(      \
      Namespace::Enum Name)

#define OUTCOME_UNIQUE BOOST_PP_CAT(_outcome_unique_, __COUNTER__)

#define _OUTCOME_TRY_VOID(tmp, expr) \
  auto &&tmp = (expr);               \
  if (tmp.has_error()) {             \
    return tmp.as_failure();         \
  }

#define _OUTCOME_TRY_OUT(tmp, var, expr) \
  auto &&tmp = (expr);                   \
  if (tmp.has_error()) {                 \
    return tmp.as_failure();             \
  }                                      \
  auto var = std::move(tmp.value());

#define _OUTCOME_TRY_1(expr) _OUTCOME_TRY_VOID(OUTCOME_UNIQUE, expr)
#define _OUTCOME_TRY_2(var, expr) _OUTCOME_TRY_OUT(OUTCOME_UNIQUE, var, expr)

/**
 * OUTCOME_TRY(expr) returns the error of `expr` from the enclosing function,
 * OUTCOME_TRY(var, expr) additionally declares `var` holding its value.
 */
#define OUTCOME_TRY(...) \
  BOOST_PP_OVERLOAD(_OUTCOME_TRY_, __VA_ARGS__)(__VA_ARGS__)
