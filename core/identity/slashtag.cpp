/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/slashtag.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "coro/spawn.hpp"
#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/key_derivation.hpp"
#include "store/impl/memory_corestore.hpp"
#include "store/slash_drive.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::identity, SlashtagError, e) {
  using E = slashtags::identity::SlashtagError;
  switch (e) {
    case E::INVALID_IDENTITY:
      return "Neither key pair, key nor URL yields a public key";
    case E::REMOTE_IDENTITY:
      return "Operation requires the key pair, slashtag is remote";
    case E::SELF_CONNECT:
      return "Slashtag can not connect to itself";
    case E::ALREADY_CLOSED:
      return "Slashtag is closed";
    case E::MISSING_SWARM_FACTORY:
      return "Swarm factory is not set";
    case E::INVALID_PROFILE:
      return "Stored profile is not a JSON document";
  }
  return "Unknown SlashtagError";
}

namespace slashtags::identity {

  namespace {
    outcome::result<network::PublicKey> resolveKey(
        const SlashtagOptions &options) {
      if (options.key_pair) {
        return options.key_pair->public_key;
      }
      if (options.key) {
        return *options.key;
      }
      if (options.url) {
        auto url = SlashURL::parse(*options.url);
        if (url.has_value()) {
          return url.value().key();
        }
      }
      return SlashtagError::INVALID_IDENTITY;
    }
  }  // namespace

  outcome::result<std::shared_ptr<Slashtag>> Slashtag::create(
      boost::asio::io_context &io_context,
      std::shared_ptr<network::SwarmFactory> swarm_factory,
      SlashtagOptions options) {
    if (not swarm_factory) {
      return SlashtagError::MISSING_SWARM_FACTORY;
    }
    OUTCOME_TRY(key, resolveKey(options));

    auto ed25519_provider = options.ed25519_provider;
    if (not ed25519_provider) {
      ed25519_provider = std::make_shared<crypto::Ed25519ProviderImpl>();
    }
    auto root_store = options.store;
    bool owns_store = false;
    if (not root_store) {
      OUTCOME_TRY(store,
                  store::MemoryCorestore::create(ed25519_provider,
                                                 options.store_options));
      root_store = std::move(store);
      owns_store = true;
    }

    std::shared_ptr<Slashtag> slashtag{new Slashtag(io_context,
                                                    std::move(swarm_factory),
                                                    std::move(ed25519_provider),
                                                    std::move(root_store),
                                                    owns_store,
                                                    options.key_pair,
                                                    SlashURL{key},
                                                    options.swarm_options)};
    if (not slashtag->remote()) {
      for (const auto &descriptor : options.protocols) {
        OUTCOME_TRY(slashtag->protocol(descriptor));
      }
    }
    return slashtag;
  }

  Slashtag::Slashtag(boost::asio::io_context &io_context,
                     std::shared_ptr<network::SwarmFactory> swarm_factory,
                     std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
                     std::shared_ptr<store::Corestore> root_store,
                     bool owns_store,
                     std::optional<crypto::Ed25519Keypair> key_pair,
                     SlashURL url,
                     network::SwarmOptions swarm_options)
      : io_context_{io_context},
        swarm_factory_{std::move(swarm_factory)},
        ed25519_provider_{std::move(ed25519_provider)},
        root_store_{std::move(root_store)},
        owns_store_{owns_store},
        store_{root_store_->namespaced(url.key().view())},
        key_pair_{std::move(key_pair)},
        key_{url.key()},
        url_{std::move(url)},
        remote_{not key_pair_.has_value()},
        swarm_options_{std::move(swarm_options)},
        ready_event_{std::make_shared<coro::AsyncEvent>()},
        closed_event_{std::make_shared<coro::AsyncEvent>()},
        log_{log::createLogger("Slashtag", "slashtag")} {}

  outcome::result<crypto::Ed25519Keypair> Slashtag::createKeyPair() {
    crypto::Ed25519ProviderImpl provider;
    return crypto::createKeyPair(provider);
  }

  outcome::result<crypto::Ed25519Keypair> Slashtag::createKeyPair(
      common::BufferView primary_key, std::string_view name) {
    crypto::Ed25519ProviderImpl provider;
    return crypto::deriveKeyPair(provider, primary_key, name);
  }

  std::shared_ptr<network::Connection> Slashtag::connection(
      const network::PublicKey &remote_key) const {
    if (auto it = sockets_.find(remote_key); it != sockets_.end()) {
      if (not it->second->isClosed()) {
        return it->second;
      }
    }
    return nullptr;
  }

  CoroOutcome<void> Slashtag::ready() {
    auto self = shared_from_this();
    switch (state_) {
      case State::CLOSED:
        co_return SlashtagError::ALREADY_CLOSED;
      case State::READY:
        co_return ready_result_;
      case State::INITIALIZING: {
        auto ready_event = ready_event_;
        co_await ready_event->wait();
        if (state_ == State::CLOSED) {
          co_return SlashtagError::ALREADY_CLOSED;
        }
        co_return ready_result_;
      }
      case State::UNINITIALIZED:
        break;
    }

    state_ = State::INITIALIZING;
    ready_result_ = co_await initialize();
    if (ready_result_.has_error()) {
      SL_WARN(log_, "Slashtag {} failed to start: {}", id(), ready_result_.error());
    }
    bool closed_meanwhile = state_ == State::CLOSED;
    if (not closed_meanwhile) {
      state_ = State::READY;
    }
    ready_event_->set();
    if (closed_meanwhile) {
      co_return SlashtagError::ALREADY_CLOSED;
    }
    co_return ready_result_;
  }

  CoroOutcome<void> Slashtag::initialize() {
    CO_TRY(swarm, swarm_factory_->createSession(key_pair_, swarm_options_));
    swarm_ = std::move(swarm);
    swarm_->setConnectionHandler(
        [weak{weak_from_this()}](std::shared_ptr<network::Connection> connection,
                                 const network::PeerInfo &info) {
          if (auto self = weak.lock()) {
            self->handleConnection(connection, info);
          }
        });
    SL_DEBUG(log_,
             "Session of {} started as {}",
             id(),
             swarm_->publicKey());

    CO_TRY(public_drive,
           co_await openDrive(store::DriveOptions{
               .key = key_,
               .key_pair = key_pair_,
           }));
    public_drive_ = std::move(public_drive);
    SL_INFO(log_, "Slashtag {} is ready, remote: {}", url_.toString(), remote_);
    co_return outcome::success();
  }

  CoroOutcome<void> Slashtag::listen() {
    if (remote_) {
      co_return SlashtagError::REMOTE_IDENTITY;
    }
    CO_TRY(co_await ready());
    auto swarm = swarm_;
    CO_TRY(co_await swarm->listen());
    SL_DEBUG(log_, "Slashtag {} is listening", id());
    co_return outcome::success();
  }

  CoroOutcome<void> Slashtag::unlisten() {
    if (remote_) {
      co_return SlashtagError::REMOTE_IDENTITY;
    }
    if (closed()) {
      co_return SlashtagError::ALREADY_CLOSED;
    }
    if (not swarm_) {
      co_return outcome::success();
    }
    auto self = shared_from_this();
    auto swarm = swarm_;
    CO_TRY(co_await swarm->unlisten());
    SL_DEBUG(log_, "Slashtag {} stopped listening", id());
    co_return outcome::success();
  }

  CoroOutcome<std::shared_ptr<network::Connection>> Slashtag::connect(
      const Target &target) {
    if (remote_) {
      co_return SlashtagError::REMOTE_IDENTITY;
    }
    if (closed()) {
      co_return SlashtagError::ALREADY_CLOSED;
    }
    CO_TRY(remote_key, resolveTarget(target));
    if (remote_key == key_) {
      co_return SlashtagError::SELF_CONNECT;
    }
    CO_TRY(co_await ready());

    if (auto existing = connection(remote_key)) {
      co_return existing;
    }
    auto swarm = swarm_;
    CO_TRY(connection, co_await swarm->connect(remote_key));
    if (closed()) {
      co_return SlashtagError::ALREADY_CLOSED;
    }
    co_return connection;
  }

  outcome::result<std::shared_ptr<protocol::Protocol>> Slashtag::protocol(
      const protocol::ProtocolDescriptor &descriptor) {
    if (remote_) {
      return SlashtagError::REMOTE_IDENTITY;
    }
    if (closed()) {
      return SlashtagError::ALREADY_CLOSED;
    }
    if (auto it = protocols_.find(descriptor.name); it != protocols_.end()) {
      return it->second;
    }
    auto instance = descriptor.factory(shared_from_this());
    protocols_.emplace(descriptor.name, instance);
    SL_DEBUG(log_, "Protocol {} registered for {}", descriptor.name, id());
    return instance;
  }

  CoroOutcome<std::shared_ptr<store::Drive>> Slashtag::drive(
      store::DriveOptions options) {
    auto self = shared_from_this();
    CO_TRY(co_await ready());
    co_return co_await openDrive(std::move(options));
  }

  CoroOutcome<std::shared_ptr<store::Drive>> Slashtag::openDrive(
      store::DriveOptions options) {
    auto self = shared_from_this();
    CO_TRY(key,
           store_->resolveKey(store::CoreOptions{
               .key_pair = options.key_pair,
               .name = options.name,
               .key = options.key,
           }));
    if (auto it = drives_.find(key); it != drives_.end()) {
      co_return it->second;
    }

    auto drive = std::make_shared<store::SlashDrive>(store_, std::move(options));
    CO_TRY(co_await drive->ready());
    if (auto it = drives_.find(drive->key()); it != drives_.end()) {
      co_await drive->close();
      co_return it->second;
    }
    drives_.emplace(drive->key(), drive);
    setupDiscovery(drive);

    CO_TRY(co_await drive->update());
    co_return drive;
  }

  void Slashtag::setupDiscovery(const std::shared_ptr<store::Drive> &drive) {
    swarm_->join(drive->discoveryKey(),
                 network::JoinOptions{.server = true, .client = true});
    SL_DEBUG(log_,
             "Drive {} announced on {}",
             drive->key(),
             drive->discoveryKey());

    coroSpawn(io_context_.get_executor(),
              [swarm{swarm_}, done{drive->findingPeers()}]() -> Coro<void> {
                co_await swarm->flush();
                done();
              });
  }

  void Slashtag::handleConnection(
      const std::shared_ptr<network::Connection> &connection,
      const network::PeerInfo &info) {
    if (closed()) {
      connection->close();
      return;
    }
    store_->replicate(connection);

    PeerInfo peer_info{info.public_key, info.client, nullptr};
    auto remote_res = createRemote(info.public_key);
    if (remote_res.has_value()) {
      peer_info.slashtag = std::move(remote_res.value());
    } else {
      SL_WARN(log_,
              "Remote slashtag of {} is not available: {}",
              info.public_key,
              remote_res.error());
    }

    sockets_[info.public_key] = connection;
    connection->onError([weak{weak_from_this()},
                         remote_key{info.public_key}](const std::error_code &e) {
      if (auto self = weak.lock()) {
        SL_DEBUG(self->log_, "Connection to {} failed: {}", remote_key, e);
      }
    });
    connection->onClose([weak{weak_from_this()},
                         remote_key{info.public_key},
                         raw{connection.get()},
                         remote{peer_info.slashtag}] {
      if (auto self = weak.lock()) {
        auto it = self->sockets_.find(remote_key);
        if (it != self->sockets_.end() and it->second.get() == raw) {
          self->sockets_.erase(it);
        }
        SL_DEBUG(self->log_, "Connection to {} closed", remote_key);
        if (remote) {
          coroSpawn(self->io_context_.get_executor(),
                    [remote]() -> Coro<void> { co_await remote->close(); });
        }
      }
    });

    for (auto &[name, protocol] : protocols_) {
      protocol->createChannel(connection, peer_info);
    }
    SL_DEBUG(log_,
             "Slashtag {} {} {}",
             id(),
             info.client ? "connected to" : "accepted",
             info.public_key);
    on_connection_(connection, peer_info);
  }

  outcome::result<std::shared_ptr<Slashtag>> Slashtag::createRemote(
      const network::PublicKey &key) {
    return create(io_context_,
                  swarm_factory_,
                  SlashtagOptions{
                      .key = key,
                      .store = root_store_,
                      .swarm_options = swarm_options_,
                      .ed25519_provider = ed25519_provider_,
                  });
  }

  CoroOutcome<void> Slashtag::setProfile(const rapidjson::Value &profile) {
    if (remote_) {
      co_return SlashtagError::REMOTE_IDENTITY;
    }
    CO_TRY(co_await ready());

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};
    profile.Accept(writer);
    std::string_view json{buffer.GetString(), buffer.GetSize()};
    CO_TRY(public_drive_->put(kProfilePath, common::str2byte(json)));
    SL_DEBUG(log_, "Profile of {} updated", id());
    co_return outcome::success();
  }

  CoroOutcome<std::optional<rapidjson::Document>> Slashtag::getProfile() {
    CO_TRY(co_await ready());
    auto drive = public_drive_;
    if (not drive->writable()) {
      CO_TRY(co_await drive->update());
    }
    CO_TRY(content, drive->get(kProfilePath));
    if (not content) {
      co_return std::nullopt;
    }

    rapidjson::Document profile;
    auto json = common::byte2str(*content);
    profile.Parse(json.data(), json.size());
    if (profile.HasParseError()) {
      SL_WARN(log_, "Profile of {} is not valid JSON", id());
      co_return SlashtagError::INVALID_PROFILE;
    }
    co_return std::optional<rapidjson::Document>{std::move(profile)};
  }

  outcome::result<crypto::Ed25519Signature> Slashtag::sign(
      common::BufferView message) const {
    if (not key_pair_) {
      return SlashtagError::REMOTE_IDENTITY;
    }
    return ed25519_provider_->sign(*key_pair_, message);
  }

  outcome::result<bool> Slashtag::verify(
      common::BufferView message,
      const crypto::Ed25519Signature &signature) const {
    return ed25519_provider_->verify(signature, message, key_);
  }

  Coro<void> Slashtag::close() {
    auto self = shared_from_this();
    if (closed()) {
      auto closed_event = closed_event_;
      co_await closed_event->wait();
      co_return;
    }
    auto previous = state_;
    state_ = State::CLOSED;
    on_close_();
    on_close_.disconnect_all_slots();
    on_connection_.disconnect_all_slots();

    if (previous == State::INITIALIZING) {
      auto ready_event = ready_event_;
      co_await ready_event->wait();
    }
    if (not swarm_) {
      SL_DEBUG(log_, "Slashtag {} closed before start", id());
      closed_event_->set();
      co_return;
    }

    auto swarm = swarm_;
    co_await swarm->destroy();
    sockets_.clear();

    auto drives = std::move(drives_);
    drives_.clear();
    for (auto &[key, drive] : drives) {
      co_await drive->close();
    }
    co_await store_->close();
    if (owns_store_) {
      co_await root_store_->close();
    }
    closed_event_->set();
    SL_INFO(log_, "Slashtag {} closed", id());
  }

}  // namespace slashtags::identity
