/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <span>
#include "common/blob.hpp"

namespace slashtags::crypto {
  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha256(common::BufferView input);

  /**
   * HMAC with SHA-256
   * @param key authentication key
   * @param input message
   */
  common::Hash256 hmacSha256(common::BufferView key, common::BufferView input);
}  // namespace slashtags::crypto
