/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519_types.hpp"

namespace slashtags::crypto {

  Ed25519Seed Ed25519Keypair::seed() const {
    Ed25519Seed seed;
    std::copy_n(secret_key.begin(), seed.size(), seed.begin());
    return seed;
  }

}  // namespace slashtags::crypto
