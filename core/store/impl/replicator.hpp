/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "coro/async_event.hpp"
#include "log/logger.hpp"
#include "network/mux.hpp"
#include "store/impl/memory_core.hpp"
#include "store/impl/replication_messages.hpp"

namespace slashtags::store {

  /**
   * Cores of a root corestore and their replication over connections.
   * Every connection carries a single `slashtags/corestore` channel which
   * serves all the cores.
   */
  class Replicator : public std::enable_shared_from_this<Replicator> {
   public:
    static constexpr std::string_view kProtocol = "slashtags/corestore";

    Replicator(std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
               CorestoreOptions options);

    /**
     * @return core of \param key, created on the first call; every acquire
     * must be paired with a release
     */
    std::shared_ptr<MemoryCore> acquire(
        const PublicKey &key,
        const std::optional<crypto::Ed25519Keypair> &key_pair);

    /// closes the core once nobody has it acquired
    void release(const DiscoveryKey &discovery_key);

    void replicate(const std::shared_ptr<network::Connection> &connection);

    /// some replication channel is alive
    bool hasPeers() const;

    /**
     * Requests the missing blocks of \param core from every peer and waits
     * for all of them to answer, at most \param timeout
     */
    Coro<void> requestUpdate(std::shared_ptr<MemoryCore> core,
                             coro::AsyncEvent::Clock::duration timeout);

   private:
    struct Session {
      std::shared_ptr<network::Channel> channel;
      network::PublicKey remote;
      // live block forwarding of the cores the peer has requested
      std::unordered_map<DiscoveryKey, boost::signals2::scoped_connection>
          subscriptions;
    };

    struct UpdateWait {
      std::unordered_set<const Session *> remaining;
      std::shared_ptr<coro::AsyncEvent> done =
          std::make_shared<coro::AsyncEvent>();
    };

    struct Entry {
      std::shared_ptr<MemoryCore> core;
      size_t refs = 0;
    };

    void onMessage(const std::shared_ptr<Session> &session,
                   common::BufferView data);
    void onRequest(const std::shared_ptr<Session> &session,
                   const RequestMessage &request);
    void onData(const std::shared_ptr<Session> &session,
                const DataMessage &data);
    void onSessionClosed(const std::shared_ptr<Session> &session);

    /// \param session has answered a request for \param discovery_key
    void answered(const Session *session, const DiscoveryKey &discovery_key);

    void subscribe(const std::shared_ptr<Session> &session,
                   const std::shared_ptr<MemoryCore> &core);

    outcome::result<void> send(Session &session,
                               const ReplicationMessage &message);

    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    CorestoreOptions options_;

    std::unordered_map<DiscoveryKey, Entry> cores_;
    std::vector<std::shared_ptr<Session>> sessions_;
    std::unordered_map<DiscoveryKey, std::vector<std::shared_ptr<UpdateWait>>>
        waits_;
    log::Logger log_;
  };

}  // namespace slashtags::store
