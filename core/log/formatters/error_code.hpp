/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include <fmt/core.h>
#include <fmt/format.h>
#include <boost/system/error_code.hpp>

template <>
struct fmt::formatter<std::error_code> {
  // Parses format specifications. Must be empty
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();

    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }

    return it;
  }

  // Formats the std::error_code by its message
  template <typename FormatContext>
  auto format(const std::error_code &ec, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    const auto &message = ec.message();
    return std::copy(std::begin(message), std::end(message), ctx.out());
  }
};

template <>
struct fmt::formatter<boost::system::error_code>
    : fmt::formatter<std::error_code> {
  template <typename FormatContext>
  auto format(const boost::system::error_code &ec, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    const auto &message = ec.message();
    return std::copy(std::begin(message), std::end(message), ctx.out());
  }
};
