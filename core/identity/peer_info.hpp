/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "network/types.hpp"

namespace slashtags::identity {

  class Slashtag;

  /**
   * Peer of a new connection, addressable as a remote slashtag
   */
  struct PeerInfo {
    network::PublicKey public_key;
    /// true if the local side initiated the connection
    bool client = false;
    /// remote identity of the peer, has no key pair
    std::shared_ptr<Slashtag> slashtag;
  };

}  // namespace slashtags::identity
