/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "identity/peer_info.hpp"
#include "network/connection.hpp"

namespace slashtags::protocol {

  /**
   * Named behaviour of a slashtag, instantiated once per local slashtag and
   * applied to every connection opened after its registration
   */
  class Protocol {
   public:
    virtual ~Protocol() = default;

    virtual const network::ProtocolName &name() const = 0;

    /**
     * Sets up the per-connection state of the protocol
     */
    virtual void createChannel(
        const std::shared_ptr<network::Connection> &connection,
        const identity::PeerInfo &peer_info) = 0;
  };

}  // namespace slashtags::protocol
