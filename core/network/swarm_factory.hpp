/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "crypto/ed25519_types.hpp"
#include "network/swarm.hpp"

namespace slashtags::network {

  /**
   * Creates discovery and transport sessions
   */
  class SwarmFactory {
   public:
    virtual ~SwarmFactory() = default;

    /**
     * @param key_pair identity of the session, an ephemeral key pair is
     * generated if missing
     */
    virtual outcome::result<std::shared_ptr<Swarm>> createSession(
        const std::optional<crypto::Ed25519Keypair> &key_pair,
        const SwarmOptions &options) = 0;
  };

}  // namespace slashtags::network
