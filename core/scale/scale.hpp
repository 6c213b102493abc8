/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "scale/scale_decoder_stream.hpp"
#include "scale/scale_encoder_stream.hpp"

namespace slashtags::scale {
  /**
   * @brief convenience function for encoding primitives data to stream
   * @tparam Args primitive types to be encoded
   * @param args data to encode
   * @return encoded data
   */
  template <typename... Args>
  outcome::result<std::vector<uint8_t>> encode(Args &&...args) {
    ScaleEncoderStream s{};
    try {
      (s << ... << std::forward<Args>(args));
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
    return s.takeData();
  }

  /**
   * @brief convenience function for decoding primitives data from stream
   * @tparam T primitive type that is decoded from provided span
   * @param span of bytes with encoded data, must be consumed entirely
   * @return decoded T
   */
  template <class T>
  outcome::result<T> decode(std::span<const uint8_t> span) {
    T t{};
    ScaleDecoderStream s(span);
    try {
      s >> t;
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
    if (s.currentIndex() != span.size()) {
      return outcome::failure(DecodeError::REDUNDANT_DATA);
    }
    return outcome::success(std::move(t));
  }
}  // namespace slashtags::scale
