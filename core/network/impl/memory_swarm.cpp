/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/impl/memory_swarm.hpp"

#include "coro/spawn.hpp"
#include "network/impl/memory_network.hpp"

namespace slashtags::network {

  MemorySwarm::MemorySwarm(std::weak_ptr<MemoryNetwork> network,
                           boost::asio::io_context &io_context,
                           crypto::Ed25519Keypair key_pair,
                           SwarmOptions options)
      : network_{std::move(network)},
        io_context_{io_context},
        key_pair_{std::move(key_pair)},
        options_{std::move(options)},
        flushed_{std::make_shared<coro::AsyncEvent>()},
        log_{log::createLogger("MemorySwarm", "swarm")} {
    flushed_->set();
  }

  void MemorySwarm::setConnectionHandler(ConnectionHandler handler) {
    handler_ = std::move(handler);
  }

  CoroOutcome<void> MemorySwarm::listen() {
    if (destroyed_) {
      co_return SwarmError::DESTROYED;
    }
    if (not listening_) {
      listening_ = true;
      SL_DEBUG(log_, "{} is listening", publicKey());
      if (auto network = network_.lock()) {
        // server topics dropped by unlisten are announced again
        for (auto &[topic, options] : topics_) {
          if (options.server) {
            network->announce(shared_from_this(),
                              topic,
                              JoinOptions{.server = true, .client = false});
          }
        }
        network->notifyChanged();
      }
    }
    co_return outcome::success();
  }

  CoroOutcome<void> MemorySwarm::unlisten() {
    if (destroyed_) {
      co_return SwarmError::DESTROYED;
    }
    if (not listening_) {
      co_return outcome::success();
    }
    listening_ = false;
    if (auto network = network_.lock()) {
      for (auto &[topic, options] : topics_) {
        if (options.server) {
          network->unannounceServer(publicKey(), topic);
        }
      }
    }
    SL_DEBUG(log_, "{} stopped listening", publicKey());
    co_return outcome::success();
  }

  CoroOutcome<std::shared_ptr<Connection>> MemorySwarm::connect(
      const PublicKey &remote_key) {
    if (destroyed_) {
      co_return SwarmError::DESTROYED;
    }
    auto self = shared_from_this();
    auto deadline = coro::AsyncEvent::Clock::now() + options_.connect_timeout;

    while (true) {
      if (destroyed_) {
        co_return SwarmError::CONNECT_ERROR;
      }
      if (auto existing = connection(remote_key)) {
        co_return existing;
      }
      auto network = network_.lock();
      if (not network) {
        co_return SwarmError::CONNECT_ERROR;
      }
      if (auto connection = network->dial(*this, remote_key)) {
        co_return connection;
      }

      auto now = coro::AsyncEvent::Clock::now();
      if (now >= deadline) {
        SL_DEBUG(log_, "Connect to {} timed out", remote_key);
        co_return SwarmError::CONNECT_TIMEOUT;
      }
      // wait until some swarm starts listening or joins a topic
      auto changed = network->changed();
      network.reset();
      co_await changed->waitFor(deadline - now);
    }
  }

  std::shared_ptr<Connection> MemorySwarm::connection(
      const PublicKey &remote_key) const {
    if (auto it = connections_.find(remote_key); it != connections_.end()) {
      if (not it->second->isClosed()) {
        return it->second;
      }
    }
    return nullptr;
  }

  void MemorySwarm::join(const Topic &topic, JoinOptions options) {
    if (destroyed_) {
      return;
    }
    topics_[topic] = options;
    if (options.server) {
      listening_ = true;
    }
    SL_DEBUG(log_,
             "{} joined topic {} (server: {}, client: {})",
             publicKey(),
             topic,
             options.server,
             options.client);
    if (auto network = network_.lock()) {
      network->announce(shared_from_this(), topic, options);
    }
  }

  void MemorySwarm::leave(const Topic &topic) {
    if (topics_.erase(topic) == 0) {
      return;
    }
    if (auto network = network_.lock()) {
      network->unannounce(publicKey(), topic);
    }
  }

  Coro<void> MemorySwarm::flush() {
    auto flushed = flushed_;
    co_await flushed->wait();
  }

  Coro<void> MemorySwarm::destroy() {
    if (destroyed_) {
      co_return;
    }
    auto self = shared_from_this();
    destroyed_ = true;
    topics_.clear();
    if (auto network = network_.lock()) {
      network->remove(publicKey());
    }

    auto connections = std::move(connections_);
    connections_.clear();
    for (auto &[key, connection] : connections) {
      connection->close();
    }
    flushed_->set();
    SL_DEBUG(log_,
             "{} destroyed, {} connections closed",
             publicKey(),
             connections.size());
    co_return;
  }

  void MemorySwarm::addConnection(std::shared_ptr<MemoryConnection> connection,
                                  bool client) {
    const auto &remote_key = connection->remotePublicKey();
    connections_[remote_key] = connection;
    connection->onClose([weak{weak_from_this()},
                         remote_key,
                         raw{connection.get()}] {
      auto self = weak.lock();
      if (not self) {
        return;
      }
      auto it = self->connections_.find(remote_key);
      if (it != self->connections_.end() and it->second.get() == raw) {
        self->connections_.erase(it);
      }
    });

    SL_DEBUG(log_,
             "Connection {} {} {}",
             publicKey(),
             client ? "->" : "<-",
             remote_key);
    if (handler_) {
      handler_(connection, PeerInfo{remote_key, client});
    }
  }

  void MemorySwarm::discovered(const PublicKey &remote_key) {
    if (destroyed_ or connection(remote_key)) {
      return;
    }
    if (pending_++ == 0) {
      flushed_ = std::make_shared<coro::AsyncEvent>();
    }
    coroSpawn(io_context_.get_executor(),
              [self{shared_from_this()}, remote_key]() -> Coro<void> {
                auto res = co_await self->connect(remote_key);
                if (res.has_error()) {
                  SL_DEBUG(self->log_,
                           "Connect to discovered peer {} failed: {}",
                           remote_key,
                           res.error());
                }
                if (--self->pending_ == 0) {
                  self->flushed_->set();
                }
              });
  }

}  // namespace slashtags::network
