/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_map>
#include <unordered_set>

#include <boost/asio/io_context.hpp>

#include "coro/async_event.hpp"
#include "crypto/ed25519_provider.hpp"
#include "log/logger.hpp"
#include "network/swarm_factory.hpp"

namespace slashtags::network {

  class MemorySwarm;

  /**
   * In-process discovery network. Swarms created by the same network find
   * each other by topic and connect directly, frames travel through the
   * io_context.
   */
  class MemoryNetwork : public SwarmFactory,
                        public std::enable_shared_from_this<MemoryNetwork> {
   public:
    MemoryNetwork(boost::asio::io_context &io_context,
                  std::shared_ptr<crypto::Ed25519Provider> ed25519_provider);

    outcome::result<std::shared_ptr<Swarm>> createSession(
        const std::optional<crypto::Ed25519Keypair> &key_pair,
        const SwarmOptions &options) override;

    /// number of swarms which are not destroyed
    size_t sessions() const;

    /// number of peers announced as servers on \param topic
    size_t servers(const Topic &topic) const;

   private:
    friend class MemorySwarm;

    struct TopicPeers {
      std::unordered_set<PublicKey> servers;
      std::unordered_set<PublicKey> clients;
    };

    std::shared_ptr<MemorySwarm> find(const PublicKey &key) const;

    /**
     * Links \param initiator with the listening swarm of \param remote_key
     * @return initiator side of the connection or nullptr if the remote
     * swarm is not reachable
     */
    std::shared_ptr<Connection> dial(MemorySwarm &initiator,
                                     const PublicKey &remote_key);

    void announce(const std::shared_ptr<MemorySwarm> &swarm,
                  const Topic &topic,
                  JoinOptions options);

    void unannounce(const PublicKey &key, const Topic &topic);

    /// \param key stays a client of \param topic, if it was one
    void unannounceServer(const PublicKey &key, const Topic &topic);

    void remove(const PublicKey &key);

    /// event set on the next change of reachability of any swarm
    std::shared_ptr<coro::AsyncEvent> changed() const {
      return changed_;
    }

    void notifyChanged();

    boost::asio::io_context &io_context_;
    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    std::unordered_map<PublicKey, std::weak_ptr<MemorySwarm>> swarms_;
    std::unordered_map<Topic, TopicPeers> topics_;
    std::shared_ptr<coro::AsyncEvent> changed_;
    log::Logger log_;
  };

}  // namespace slashtags::network
