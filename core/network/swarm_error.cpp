/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/swarm.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::network, SwarmError, e) {
  using E = slashtags::network::SwarmError;
  switch (e) {
    case E::CONNECT_TIMEOUT:
      return "Remote peer was not reached in time";
    case E::CONNECT_ERROR:
      return "Connection to the remote peer failed";
    case E::DESTROYED:
      return "Swarm is destroyed";
  }
  return "Unknown SwarmError";
}
