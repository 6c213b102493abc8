/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace slashtags::crypto {

  enum class CryptoError {
    KEY_GENERATION_FAILED = 1,
    SIGN_FAILED,
    VERIFICATION_FAILED,
    RANDOM_FAILED,
    HASHING_FAILED,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
  };

}  // namespace slashtags::crypto

OUTCOME_HPP_DECLARE_ERROR(slashtags::crypto, CryptoError);
