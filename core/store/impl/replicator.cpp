/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "store/impl/replicator.hpp"

#include <algorithm>

#include "common/visitor.hpp"
#include "crypto/key_derivation.hpp"
#include "scale/scale.hpp"

namespace slashtags::store {

  Replicator::Replicator(
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      CorestoreOptions options)
      : ed25519_provider_{std::move(ed25519_provider)},
        options_{options},
        log_{log::createLogger("Replicator", "store")} {}

  std::shared_ptr<MemoryCore> Replicator::acquire(
      const PublicKey &key,
      const std::optional<crypto::Ed25519Keypair> &key_pair) {
    auto discovery_key = crypto::discoveryKey(key);
    auto it = cores_.find(discovery_key);
    if (it == cores_.end()) {
      auto core = std::make_shared<MemoryCore>(ed25519_provider_,
                                               key,
                                               key_pair,
                                               weak_from_this(),
                                               options_.update_timeout);
      it = cores_.emplace(discovery_key, Entry{std::move(core)}).first;
      SL_DEBUG(log_,
               "Core {} opened, writable: {}",
               discovery_key,
               key_pair.has_value());
    } else if (key_pair and not it->second.core->writable()) {
      it->second.core->setKeyPair(*key_pair);
    }
    ++it->second.refs;
    return it->second.core;
  }

  void Replicator::release(const DiscoveryKey &discovery_key) {
    auto it = cores_.find(discovery_key);
    if (it == cores_.end() or --it->second.refs != 0) {
      return;
    }
    auto core = std::move(it->second.core);
    cores_.erase(it);
    core->close();

    if (auto waits = waits_.find(discovery_key); waits != waits_.end()) {
      for (auto &wait : waits->second) {
        wait->done->set();
      }
    }
    for (auto &session : sessions_) {
      session->subscriptions.erase(discovery_key);
    }
  }

  void Replicator::replicate(
      const std::shared_ptr<network::Connection> &connection) {
    auto mux = network::Mux::from(connection);
    auto channel_res = mux->createChannel(std::string{kProtocol});
    if (channel_res.has_error()) {
      if (channel_res.error() != network::MuxError::CHANNEL_EXISTS) {
        SL_WARN(log_,
                "Can not replicate with {}: {}",
                connection->remotePublicKey(),
                channel_res.error());
      }
      return;
    }
    auto session = std::make_shared<Session>();
    session->channel = std::move(channel_res.value());
    session->remote = connection->remotePublicKey();

    session->channel->onMessage(
        [weak_self{weak_from_this()},
         weak_session{std::weak_ptr{session}}](common::BufferView data) {
          auto self = weak_self.lock();
          auto session = weak_session.lock();
          if (self and session) {
            self->onMessage(session, data);
          }
        });
    session->channel->onClose([weak_self{weak_from_this()},
                               weak_session{std::weak_ptr{session}}] {
      auto self = weak_self.lock();
      auto session = weak_session.lock();
      if (self and session) {
        self->onSessionClosed(session);
      }
    });
    sessions_.push_back(session);

    if (auto res = session->channel->open(); res.has_error()) {
      SL_WARN(log_,
              "Can not open replication channel with {}: {}",
              session->remote,
              res.error());
      onSessionClosed(session);
      return;
    }
    SL_DEBUG(log_, "Replicating with {}", session->remote);
  }

  bool Replicator::hasPeers() const {
    return std::any_of(
        sessions_.begin(), sessions_.end(), [](const auto &session) {
          return not session->channel->isClosed();
        });
  }

  Coro<void> Replicator::requestUpdate(
      std::shared_ptr<MemoryCore> core,
      coro::AsyncEvent::Clock::duration timeout) {
    auto self = shared_from_this();
    const auto discovery_key = core->discoveryKey();
    auto wait = std::make_shared<UpdateWait>();

    ReplicationMessage request{RequestMessage{discovery_key, core->length()}};
    for (auto &session : sessions_) {
      if (auto res = send(*session, request); res.has_value()) {
        wait->remaining.insert(session.get());
      }
    }
    if (wait->remaining.empty()) {
      co_return;
    }
    waits_[discovery_key].push_back(wait);

    auto answered = co_await wait->done->waitFor(timeout);
    if (not answered) {
      SL_DEBUG(log_,
               "Update of {}: {} peers did not answer in time",
               discovery_key,
               wait->remaining.size());
    }

    if (auto it = waits_.find(discovery_key); it != waits_.end()) {
      std::erase(it->second, wait);
      if (it->second.empty()) {
        waits_.erase(it);
      }
    }
  }

  void Replicator::onMessage(const std::shared_ptr<Session> &session,
                             common::BufferView data) {
    auto message_res = scale::decode<ReplicationMessage>(data);
    if (message_res.has_error()) {
      SL_WARN(log_,
              "Malformed replication message from {}: {}",
              session->remote,
              message_res.error());
      if (auto connection = session->channel->connection()) {
        connection->destroy(message_res.error());
      }
      return;
    }
    visit_in_place(
        message_res.value(),
        [&](const RequestMessage &request) { onRequest(session, request); },
        [&](const DataMessage &data) { onData(session, data); },
        [&](const MissingMessage &missing) {
          SL_TRACE(log_,
                   "{} has no core {}",
                   session->remote,
                   missing.discovery_key);
          answered(session.get(), missing.discovery_key);
        });
  }

  void Replicator::onRequest(const std::shared_ptr<Session> &session,
                             const RequestMessage &request) {
    auto it = cores_.find(request.discovery_key);
    if (it == cores_.end()) {
      auto res = send(*session,
                      ReplicationMessage{
                          MissingMessage{request.discovery_key},
                      });
      if (res.has_error()) {
        SL_TRACE(log_, "Can not answer {}: {}", session->remote, res.error());
      }
      return;
    }
    const auto &core = it->second.core;
    subscribe(session, core);

    DataMessage data{
        request.discovery_key,
        request.from,
        core->blocks(request.from),
    };
    SL_TRACE(log_,
             "Sending {} blocks of {} to {}",
             data.blocks.size(),
             request.discovery_key,
             session->remote);
    if (auto res = send(*session, ReplicationMessage{std::move(data)});
        res.has_error()) {
      SL_DEBUG(log_,
               "Can not answer {} to {}: {}",
               request.discovery_key,
               session->remote,
               res.error());
    }
  }

  void Replicator::onData(const std::shared_ptr<Session> &session,
                          const DataMessage &data) {
    if (auto it = cores_.find(data.discovery_key); it != cores_.end()) {
      auto res = it->second.core->appendVerified(data.start, data.blocks);
      if (res.has_error()) {
        SL_WARN(log_,
                "Rejected blocks of {} from {}: {}",
                data.discovery_key,
                session->remote,
                res.error());
        if (auto connection = session->channel->connection()) {
          connection->destroy(res.error());
        }
        return;
      }
      if (res.value() != 0) {
        SL_DEBUG(log_,
                 "Received {} blocks of {} from {}",
                 res.value(),
                 data.discovery_key,
                 session->remote);
      }
    }
    answered(session.get(), data.discovery_key);
  }

  void Replicator::onSessionClosed(const std::shared_ptr<Session> &session) {
    if (std::erase(sessions_, session) == 0) {
      return;
    }
    session->subscriptions.clear();
    for (auto &[discovery_key, waits] : waits_) {
      for (auto &wait : waits) {
        if (wait->remaining.erase(session.get()) != 0
            and wait->remaining.empty()) {
          wait->done->set();
        }
      }
    }
    SL_DEBUG(log_, "Replication with {} finished", session->remote);
  }

  void Replicator::answered(const Session *session,
                            const DiscoveryKey &discovery_key) {
    auto it = waits_.find(discovery_key);
    if (it == waits_.end()) {
      return;
    }
    for (auto &wait : it->second) {
      if (wait->remaining.erase(session) != 0 and wait->remaining.empty()) {
        wait->done->set();
      }
    }
  }

  void Replicator::subscribe(const std::shared_ptr<Session> &session,
                             const std::shared_ptr<MemoryCore> &core) {
    const auto &discovery_key = core->discoveryKey();
    if (session->subscriptions.contains(discovery_key)) {
      return;
    }
    session->subscriptions.emplace(
        discovery_key,
        core->onAppend([weak_self{weak_from_this()},
                        weak_session{std::weak_ptr{session}},
                        discovery_key](uint64_t seq,
                                       const SignedBlock &block) {
          auto self = weak_self.lock();
          auto session = weak_session.lock();
          if (not self or not session) {
            return;
          }
          auto res = self->send(*session,
                                ReplicationMessage{
                                    DataMessage{discovery_key, seq, {block}},
                                });
          if (res.has_error()) {
            SL_TRACE(self->log_,
                     "Block {} of {} not forwarded to {}: {}",
                     seq,
                     discovery_key,
                     session->remote,
                     res.error());
          }
        }));
  }

  outcome::result<void> Replicator::send(Session &session,
                                         const ReplicationMessage &message) {
    OUTCOME_TRY(encoded, scale::encode(message));
    return session.channel->send(encoded);
  }

}  // namespace slashtags::store
