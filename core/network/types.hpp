/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/blob.hpp"
#include "crypto/ed25519_types.hpp"

namespace slashtags::network {

  using PublicKey = crypto::Ed25519PublicKey;

  /// Discovery topic, peers joining the same topic find each other
  using Topic = common::Hash256;

  using ProtocolName = std::string;

  struct SwarmOptions {
    /// discovery network bootstrap nodes, `host:port`
    std::vector<std::string> bootstrap;
    /// relay servers for peers behind NAT
    std::vector<std::string> relays;
    /// how long connect() waits for the remote peer to become reachable
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
  };

  struct JoinOptions {
    /// announce ourselves on the topic and accept connections
    bool server = true;
    /// connect to the servers of the topic
    bool client = true;
  };

  /**
   * Peer information attached by the swarm to every new connection
   */
  struct PeerInfo {
    PublicKey public_key;
    /// true if we are the side which initiated the connection
    bool client = false;
  };

}  // namespace slashtags::network
