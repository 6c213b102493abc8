/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <variant>

#include "identity/slash_url.hpp"
#include "network/types.hpp"

namespace slashtags::identity {

  /**
   * Peer to connect to: raw public key, `slash:` URL or z-base-32 id string,
   * or a parsed URL
   */
  using Target = std::variant<network::PublicKey, std::string, SlashURL>;

  outcome::result<network::PublicKey> resolveTarget(const Target &target);

}  // namespace slashtags::identity
