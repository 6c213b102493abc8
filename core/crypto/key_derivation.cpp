/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/key_derivation.hpp"

#include "crypto/random.hpp"
#include "crypto/sha/sha256.hpp"

namespace slashtags::crypto {

  namespace {
    constexpr std::string_view kDiscoveryNamespace = "hypercore";
  }

  outcome::result<Ed25519Keypair> deriveKeyPair(
      const Ed25519Provider &provider,
      common::BufferView primary_key,
      std::string_view name) {
    auto hash = sha256(common::concat(primary_key, common::str2byte(name)));
    return provider.generateKeypair(Ed25519Seed{hash});
  }

  outcome::result<Ed25519Keypair> createKeyPair(
      const Ed25519Provider &provider) {
    OUTCOME_TRY(primary_key, randomBytes<kPrimaryKeySize>());
    return deriveKeyPair(provider, primary_key.view());
  }

  common::Hash256 discoveryKey(const Ed25519PublicKey &public_key) {
    return hmacSha256(public_key.view(), common::str2byte(kDiscoveryNamespace));
  }

}  // namespace slashtags::crypto
