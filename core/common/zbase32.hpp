/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace slashtags::common {

  /**
   * @brief error codes for z-base-32 decoding
   */
  enum class ZBase32Error { INVALID_CHARACTER = 1, NON_ZERO_PADDING };

  /**
   * Encodes bytes with the human-oriented z-base-32 alphabet, most
   * significant bits first, without padding.
   * 32 bytes of a public key turn into 52 characters.
   */
  std::string zbase32Encode(BufferView bytes);

  /**
   * Decodes z-base-32 text produced by zbase32Encode
   * @return bytes or ZBase32Error if text contains a foreign character
   */
  outcome::result<Buffer> zbase32Decode(std::string_view text);

}  // namespace slashtags::common

OUTCOME_HPP_DECLARE_ERROR(slashtags::common, ZBase32Error);
