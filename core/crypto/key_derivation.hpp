/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "crypto/ed25519_provider.hpp"

namespace slashtags::crypto {

  /// Size of a primary key all the named key pairs are derived from
  constexpr size_t kPrimaryKeySize = 32;

  using PrimaryKey = common::Blob<kPrimaryKeySize>;

  /**
   * Deterministic key pair derivation, seed is SHA-256(primary_key || name).
   * Different names under the same primary key give unlinkable key pairs.
   */
  outcome::result<Ed25519Keypair> deriveKeyPair(
      const Ed25519Provider &provider,
      common::BufferView primary_key,
      std::string_view name = {});

  /**
   * Key pair derived from a fresh random primary key with the empty name
   */
  outcome::result<Ed25519Keypair> createKeyPair(
      const Ed25519Provider &provider);

  /**
   * Topic a core is announced under, keyed hash of its public key so the
   * key itself is not revealed to the discovery network
   */
  common::Hash256 discoveryKey(const Ed25519PublicKey &public_key);

}  // namespace slashtags::crypto
