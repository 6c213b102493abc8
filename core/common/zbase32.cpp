/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/zbase32.hpp"

#include <array>

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::common, ZBase32Error, e) {
  using slashtags::common::ZBase32Error;
  switch (e) {
    case ZBase32Error::INVALID_CHARACTER:
      return "Input contains a character outside of the z-base-32 alphabet";
    case ZBase32Error::NON_ZERO_PADDING:
      return "Trailing bits of z-base-32 input are not zero";
  }
  return "unknown ZBase32Error code";
}

namespace slashtags::common {

  namespace {
    constexpr std::string_view kAlphabet = "ybndrfg8ejkmcpqxot1uwisza345h769";

    constexpr std::array<int8_t, 128> makeReverseAlphabet() {
      std::array<int8_t, 128> table{};
      table.fill(-1);
      for (size_t i = 0; i < kAlphabet.size(); ++i) {
        table[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
      }
      return table;
    }

    constexpr auto kReverseAlphabet = makeReverseAlphabet();
  }  // namespace

  std::string zbase32Encode(BufferView bytes) {
    std::string result;
    result.reserve((bytes.size() * 8 + 4) / 5);

    uint32_t acc = 0;
    size_t bits = 0;
    for (auto byte : bytes) {
      acc = (acc << 8u) | byte;
      bits += 8;
      while (bits >= 5) {
        bits -= 5;
        result.push_back(kAlphabet[(acc >> bits) & 0x1Fu]);
      }
    }
    if (bits > 0) {
      result.push_back(kAlphabet[(acc << (5 - bits)) & 0x1Fu]);
    }
    return result;
  }

  outcome::result<Buffer> zbase32Decode(std::string_view text) {
    Buffer result;
    result.reserve(text.size() * 5 / 8);

    uint32_t acc = 0;
    size_t bits = 0;
    for (auto c : text) {
      auto index = static_cast<uint8_t>(c);
      if (index >= kReverseAlphabet.size() or kReverseAlphabet[index] < 0) {
        return ZBase32Error::INVALID_CHARACTER;
      }
      acc = (acc << 5u) | static_cast<uint32_t>(kReverseAlphabet[index]);
      bits += 5;
      if (bits >= 8) {
        bits -= 8;
        result.push_back(static_cast<uint8_t>((acc >> bits) & 0xFFu));
      }
    }
    if ((acc & ((1u << bits) - 1)) != 0) {
      return ZBase32Error::NON_ZERO_PADDING;
    }
    return result;
  }

}  // namespace slashtags::common
