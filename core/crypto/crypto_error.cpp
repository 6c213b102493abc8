/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/crypto_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::crypto, CryptoError, e) {
  using E = slashtags::crypto::CryptoError;
  switch (e) {
    case E::KEY_GENERATION_FAILED:
      return "Internal error during ed25519 key pair generation";
    case E::SIGN_FAILED:
      return "Internal error during ed25519 signing";
    case E::VERIFICATION_FAILED:
      return "Internal error during ed25519 signature verification";
    case E::RANDOM_FAILED:
      return "Random generator failed to produce bytes";
    case E::HASHING_FAILED:
      return "Internal error during hashing";
    case E::ENCRYPTION_FAILED:
      return "Internal error during encryption";
    case E::DECRYPTION_FAILED:
      return "Ciphertext could not be authenticated or decrypted";
  }
  return "Unknown crypto error";
}
