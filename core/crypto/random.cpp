/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/random.hpp"

#include <openssl/rand.h>

#include "crypto/crypto_error.hpp"

namespace slashtags::crypto {

  outcome::result<void> fillRandomly(std::span<uint8_t> out) {
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
      return CryptoError::RANDOM_FAILED;
    }
    return outcome::success();
  }

}  // namespace slashtags::crypto
