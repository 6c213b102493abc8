/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/impl/memory_network.hpp"

#include <algorithm>

#include "network/impl/memory_swarm.hpp"

namespace slashtags::network {

  MemoryNetwork::MemoryNetwork(
      boost::asio::io_context &io_context,
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider)
      : io_context_{io_context},
        ed25519_provider_{std::move(ed25519_provider)},
        changed_{std::make_shared<coro::AsyncEvent>()},
        log_{log::createLogger("MemoryNetwork", "network")} {}

  outcome::result<std::shared_ptr<Swarm>> MemoryNetwork::createSession(
      const std::optional<crypto::Ed25519Keypair> &key_pair,
      const SwarmOptions &options) {
    crypto::Ed25519Keypair session_key_pair;
    if (key_pair.has_value()) {
      session_key_pair = key_pair.value();
    } else {
      OUTCOME_TRY(ephemeral, ed25519_provider_->generateKeypair());
      session_key_pair = ephemeral;
    }

    auto swarm = std::make_shared<MemorySwarm>(
        weak_from_this(), io_context_, session_key_pair, options);
    swarms_[swarm->publicKey()] = swarm;
    SL_DEBUG(log_, "Session {} created", swarm->publicKey());
    return swarm;
  }

  size_t MemoryNetwork::sessions() const {
    return std::count_if(swarms_.begin(), swarms_.end(), [](auto &entry) {
      auto swarm = entry.second.lock();
      return swarm and not swarm->destroyed();
    });
  }

  size_t MemoryNetwork::servers(const Topic &topic) const {
    if (auto it = topics_.find(topic); it != topics_.end()) {
      return it->second.servers.size();
    }
    return 0;
  }

  std::shared_ptr<MemorySwarm> MemoryNetwork::find(
      const PublicKey &key) const {
    if (auto it = swarms_.find(key); it != swarms_.end()) {
      auto swarm = it->second.lock();
      if (swarm and not swarm->destroyed()) {
        return swarm;
      }
    }
    return nullptr;
  }

  std::shared_ptr<Connection> MemoryNetwork::dial(
      MemorySwarm &initiator, const PublicKey &remote_key) {
    auto responder = find(remote_key);
    if (not responder or responder.get() == &initiator
        or not responder->listening()) {
      return nullptr;
    }

    auto [initiator_end, responder_end] = MemoryConnection::makePair(
        io_context_, initiator.publicKey(), remote_key);
    SL_TRACE(log_, "Link {} -> {}", initiator.publicKey(), remote_key);
    initiator.addConnection(initiator_end, true);
    responder->addConnection(responder_end, false);
    return initiator_end;
  }

  void MemoryNetwork::announce(const std::shared_ptr<MemorySwarm> &swarm,
                               const Topic &topic,
                               JoinOptions options) {
    auto &peers = topics_[topic];
    const auto &key = swarm->publicKey();

    if (options.server) {
      peers.servers.insert(key);
      for (auto &client_key : peers.clients) {
        if (client_key == key) {
          continue;
        }
        if (auto client = find(client_key)) {
          client->discovered(key);
        }
      }
    }

    if (options.client) {
      peers.clients.insert(key);
      for (auto &server_key : peers.servers) {
        if (server_key != key) {
          swarm->discovered(server_key);
        }
      }
    }

    notifyChanged();
  }

  void MemoryNetwork::unannounce(const PublicKey &key, const Topic &topic) {
    auto it = topics_.find(topic);
    if (it == topics_.end()) {
      return;
    }
    it->second.servers.erase(key);
    it->second.clients.erase(key);
    if (it->second.servers.empty() and it->second.clients.empty()) {
      topics_.erase(it);
    }
  }

  void MemoryNetwork::unannounceServer(const PublicKey &key,
                                       const Topic &topic) {
    auto it = topics_.find(topic);
    if (it == topics_.end()) {
      return;
    }
    it->second.servers.erase(key);
    if (it->second.servers.empty() and it->second.clients.empty()) {
      topics_.erase(it);
    }
  }

  void MemoryNetwork::remove(const PublicKey &key) {
    swarms_.erase(key);
    for (auto it = topics_.begin(); it != topics_.end();) {
      it->second.servers.erase(key);
      it->second.clients.erase(key);
      if (it->second.servers.empty() and it->second.clients.empty()) {
        it = topics_.erase(it);
      } else {
        ++it;
      }
    }
    notifyChanged();
  }

  void MemoryNetwork::notifyChanged() {
    auto event = std::exchange(changed_, std::make_shared<coro::AsyncEvent>());
    event->set();
  }

}  // namespace slashtags::network
