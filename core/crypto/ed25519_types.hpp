/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace slashtags::crypto::constants::ed25519 {
  /**
   * Important constants to deal with ed25519
   */
  enum {  // NOLINT(performance-enum-size)
    PUBKEY_SIZE = 32,
    SEED_SIZE = 32,
    // seed followed by public key
    PRIVKEY_SIZE = SEED_SIZE + PUBKEY_SIZE,
    SIGNATURE_SIZE = 64,
  };
}  // namespace slashtags::crypto::constants::ed25519

SLASHTAGS_BLOB_STRICT_TYPEDEF(slashtags::crypto,
                              Ed25519PublicKey,
                              constants::ed25519::PUBKEY_SIZE);
SLASHTAGS_BLOB_STRICT_TYPEDEF(slashtags::crypto,
                              Ed25519PrivateKey,
                              constants::ed25519::PRIVKEY_SIZE);
SLASHTAGS_BLOB_STRICT_TYPEDEF(slashtags::crypto,
                              Ed25519Seed,
                              constants::ed25519::SEED_SIZE);
SLASHTAGS_BLOB_STRICT_TYPEDEF(slashtags::crypto,
                              Ed25519Signature,
                              constants::ed25519::SIGNATURE_SIZE);

namespace slashtags::crypto {

  struct Ed25519Keypair {
    Ed25519PrivateKey secret_key;
    Ed25519PublicKey public_key;

    bool operator==(const Ed25519Keypair &other) const = default;

    /// first half of the secret key
    Ed25519Seed seed() const;
  };

}  // namespace slashtags::crypto
