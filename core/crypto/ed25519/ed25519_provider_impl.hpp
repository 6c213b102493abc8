/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/ed25519_provider.hpp"

#include "log/logger.hpp"

namespace slashtags::crypto {

  /**
   * Ed25519 over OpenSSL EVP raw keys
   */
  class Ed25519ProviderImpl : public Ed25519Provider {
   public:
    Ed25519ProviderImpl();

    outcome::result<Ed25519Keypair> generateKeypair() const override;

    outcome::result<Ed25519Keypair> generateKeypair(
        const Ed25519Seed &seed) const override;

    outcome::result<Ed25519Signature> sign(
        const Ed25519Keypair &keypair,
        common::BufferView message) const override;

    outcome::result<bool> verify(
        const Ed25519Signature &signature,
        common::BufferView message,
        const Ed25519PublicKey &public_key) const override;

   private:
    log::Logger logger_;
  };

}  // namespace slashtags::crypto
