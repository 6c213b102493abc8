/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_map>

#include <boost/asio/io_context.hpp>

#include "coro/async_event.hpp"
#include "log/logger.hpp"
#include "network/impl/memory_connection.hpp"
#include "network/swarm.hpp"

namespace slashtags::network {

  class MemoryNetwork;

  class MemorySwarm : public Swarm,
                      public std::enable_shared_from_this<MemorySwarm> {
   public:
    MemorySwarm(std::weak_ptr<MemoryNetwork> network,
                boost::asio::io_context &io_context,
                crypto::Ed25519Keypair key_pair,
                SwarmOptions options);

    const PublicKey &publicKey() const override {
      return key_pair_.public_key;
    }

    void setConnectionHandler(ConnectionHandler handler) override;

    CoroOutcome<void> listen() override;

    CoroOutcome<void> unlisten() override;

    CoroOutcome<std::shared_ptr<Connection>> connect(
        const PublicKey &remote_key) override;

    std::shared_ptr<Connection> connection(
        const PublicKey &remote_key) const override;

    void join(const Topic &topic, JoinOptions options) override;

    void leave(const Topic &topic) override;

    Coro<void> flush() override;

    Coro<void> destroy() override;

    bool destroyed() const override {
      return destroyed_;
    }

    bool listening() const {
      return listening_ and not destroyed_;
    }

   private:
    friend class MemoryNetwork;

    void addConnection(std::shared_ptr<MemoryConnection> connection,
                       bool client);

    /// peer found on a joined topic, connects in background
    void discovered(const PublicKey &remote_key);

    std::weak_ptr<MemoryNetwork> network_;
    boost::asio::io_context &io_context_;
    crypto::Ed25519Keypair key_pair_;
    SwarmOptions options_;
    ConnectionHandler handler_;
    bool listening_ = false;
    bool destroyed_ = false;
    std::unordered_map<PublicKey, std::shared_ptr<MemoryConnection>>
        connections_;
    std::unordered_map<Topic, JoinOptions> topics_;
    size_t pending_ = 0;
    std::shared_ptr<coro::AsyncEvent> flushed_;
    log::Logger log_;
  };

}  // namespace slashtags::network
