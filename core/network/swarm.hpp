/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include "coro/coro.hpp"
#include "network/connection.hpp"
#include "network/types.hpp"

namespace slashtags::network {

  enum class SwarmError {
    CONNECT_TIMEOUT = 1,
    CONNECT_ERROR,
    DESTROYED,
  };

  /**
   * Discovery and transport session of a single key pair.
   * Every established connection, inbound or outbound, is reported exactly
   * once to the connection handler.
   */
  class Swarm {
   public:
    using ConnectionHandler =
        std::function<void(std::shared_ptr<Connection>, const PeerInfo &)>;

    virtual ~Swarm() = default;

    virtual const PublicKey &publicKey() const = 0;

    virtual void setConnectionHandler(ConnectionHandler handler) = 0;

    /**
     * Starts accepting inbound connections, repeated calls are no-op
     */
    virtual CoroOutcome<void> listen() = 0;

    /**
     * Stops accepting inbound connections and announcing joined topics as
     * a server. Live connections stay open, repeated calls are no-op.
     */
    virtual CoroOutcome<void> unlisten() = 0;

    /**
     * Connects to the peer owning \param remote_key and waits for the
     * connection to open. Returns the live connection if there is one.
     */
    virtual CoroOutcome<std::shared_ptr<Connection>> connect(
        const PublicKey &remote_key) = 0;

    /**
     * @return live connection to \param remote_key or nullptr
     */
    virtual std::shared_ptr<Connection> connection(
        const PublicKey &remote_key) const = 0;

    /**
     * Joins the discovery \param topic
     */
    virtual void join(const Topic &topic, JoinOptions options) = 0;

    virtual void leave(const Topic &topic) = 0;

    /**
     * Resolves once connections to the peers discovered so far are
     * established
     */
    virtual Coro<void> flush() = 0;

    /**
     * Leaves all topics and closes every live connection
     */
    virtual Coro<void> destroy() = 0;

    virtual bool destroyed() const = 0;
  };

}  // namespace slashtags::network

OUTCOME_HPP_DECLARE_ERROR(slashtags::network, SwarmError);
