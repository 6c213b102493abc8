/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "crypto/ed25519_provider.hpp"

namespace slashtags::key {

  /**
   * Key pair of a slashtag along with its public identifiers
   */
  struct KeyReport {
    crypto::Ed25519Keypair key_pair;
    std::string id;
    std::string url;
  };

  class Key {
   public:
    explicit Key(std::shared_ptr<crypto::Ed25519Provider> ed_crypto_provider);

    /**
     * Derives the key pair from \param primary_key and \param name, from a
     * random primary key if none is given
     */
    outcome::result<KeyReport> generate(
        const std::optional<common::Buffer> &primary_key,
        std::string_view name) const;

    /**
     * Prints the URL to stderr and the secret key to stdout
     */
    outcome::result<void> run(const std::optional<common::Buffer> &primary_key,
                              std::string_view name) const;

   private:
    std::shared_ptr<crypto::Ed25519Provider> ed_crypto_provider_;
  };

}  // namespace slashtags::key
