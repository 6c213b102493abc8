/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "crypto/ed25519_types.hpp"
#include "outcome/outcome.hpp"

namespace slashtags::crypto {

  class Ed25519Provider {
   public:
    virtual ~Ed25519Provider() = default;

    /**
     * Generates random keypair for signing the message
     * @return ed25519 key pair if succeeded or error if failed
     */
    virtual outcome::result<Ed25519Keypair> generateKeypair() const = 0;

    /**
     * @brief generates key pair by seed
     * @param seed seed value
     * @return ed25519 key pair
     */
    virtual outcome::result<Ed25519Keypair> generateKeypair(
        const Ed25519Seed &seed) const = 0;

    /**
     * Sign message \param message using \param keypair
     * @param keypair pair of public and private ed25519 keys
     * @param message bytes to be signed
     * @return signature
     */
    virtual outcome::result<Ed25519Signature> sign(
        const Ed25519Keypair &keypair, common::BufferView message) const = 0;

    /**
     * Verifies that \param message was signed by the owner of \param
     * public_key producing \param signature
     */
    virtual outcome::result<bool> verify(
        const Ed25519Signature &signature,
        common::BufferView message,
        const Ed25519PublicKey &public_key) const = 0;
  };

}  // namespace slashtags::crypto
