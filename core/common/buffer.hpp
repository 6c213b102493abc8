/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

inline auto operator""_bytes(const char *s, std::size_t size) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(s), size);
}

namespace slashtags::common {

  /// Arbitrary (including empty) byte buffer
  using Buffer = std::vector<uint8_t>;

  /// Non-owning view of bytes
  using BufferView = std::span<const uint8_t>;

  inline BufferView str2byte(std::string_view str) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
  }

  inline std::string_view byte2str(BufferView bytes) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
  }

  inline Buffer concat(BufferView a, BufferView b) {
    Buffer out;
    out.reserve(a.size() + b.size());
    out.insert(out.end(), a.begin(), a.end());
    out.insert(out.end(), b.begin(), b.end());
    return out;
  }

}  // namespace slashtags::common
