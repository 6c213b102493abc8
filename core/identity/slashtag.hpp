/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <rapidjson/document.h>
#include <boost/asio/io_context.hpp>
#include <boost/signals2.hpp>

#include "coro/async_event.hpp"
#include "crypto/ed25519_provider.hpp"
#include "identity/peer_info.hpp"
#include "identity/slash_url.hpp"
#include "identity/target.hpp"
#include "log/logger.hpp"
#include "network/swarm_factory.hpp"
#include "protocol/protocol_descriptor.hpp"
#include "store/corestore.hpp"
#include "store/drive.hpp"

namespace slashtags::identity {

  enum class SlashtagError {
    INVALID_IDENTITY = 1,
    REMOTE_IDENTITY,
    SELF_CONNECT,
    ALREADY_CLOSED,
    MISSING_SWARM_FACTORY,
    INVALID_PROFILE,
  };

  struct SlashtagOptions {
    /// local identity, able to sign, listen and connect
    std::optional<crypto::Ed25519Keypair> key_pair;
    /// remote identity known by its public key
    std::optional<network::PublicKey> key;
    /// remote identity known by its URL
    std::optional<std::string> url;
    /// root store shared with other slashtags, a RAM store if missing
    std::shared_ptr<store::Corestore> store;
    /// registered right after construction (local identities only)
    std::vector<protocol::ProtocolDescriptor> protocols;
    network::SwarmOptions swarm_options;
    store::CorestoreOptions store_options;
    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider;
  };

  /**
   * Peer identity. Local slashtags own a key pair, remote ones are known by
   * the public key only and may just read drives.
   * Session, connections and the public drive are set up lazily by ready().
   */
  class Slashtag : public std::enable_shared_from_this<Slashtag> {
   public:
    enum class State { UNINITIALIZED, INITIALIZING, READY, CLOSED };

    using ConnectionHandler =
        void(const std::shared_ptr<network::Connection> &, const PeerInfo &);
    using CloseHandler = void();

    static constexpr std::string_view kProfilePath = "profile.json";

    static outcome::result<std::shared_ptr<Slashtag>> create(
        boost::asio::io_context &io_context,
        std::shared_ptr<network::SwarmFactory> swarm_factory,
        SlashtagOptions options);

    /// key pair derived from a random primary key
    static outcome::result<crypto::Ed25519Keypair> createKeyPair();

    static outcome::result<crypto::Ed25519Keypair> createKeyPair(
        common::BufferView primary_key, std::string_view name = {});

    Slashtag(const Slashtag &) = delete;
    Slashtag &operator=(const Slashtag &) = delete;

    const network::PublicKey &key() const {
      return key_;
    }

    /// z-base-32 encoded key
    std::string id() const {
      return url_.id();
    }

    const SlashURL &url() const {
      return url_;
    }

    bool remote() const {
      return remote_;
    }

    const std::optional<crypto::Ed25519Keypair> &keyPair() const {
      return key_pair_;
    }

    State state() const {
      return state_;
    }

    bool closed() const {
      return state_ == State::CLOSED;
    }

    /// drive of the identity itself, set by ready()
    std::shared_ptr<store::Drive> publicDrive() const {
      return public_drive_;
    }

    /**
     * @return live connection to \param remote_key or nullptr
     */
    std::shared_ptr<network::Connection> connection(
        const network::PublicKey &remote_key) const;

    /**
     * Creates the session and opens the public drive. Runs once, concurrent
     * and later calls get the result of the first run.
     */
    CoroOutcome<void> ready();

    /**
     * Accepts inbound connections
     */
    CoroOutcome<void> listen();

    /**
     * Stops accepting inbound connections, live connections stay open.
     * No-op for a slashtag which never started its session.
     */
    CoroOutcome<void> unlisten();

    /**
     * @return the live connection to \param target, opening it if needed
     */
    CoroOutcome<std::shared_ptr<network::Connection>> connect(
        const Target &target);

    /**
     * @return protocol instance of the descriptor name, created by its
     * factory on the first call
     */
    outcome::result<std::shared_ptr<protocol::Protocol>> protocol(
        const protocol::ProtocolDescriptor &descriptor);

    /**
     * Opens the drive and announces it for discovery. Drives are cached by
     * key, a second call with the same key returns the same drive.
     */
    CoroOutcome<std::shared_ptr<store::Drive>> drive(
        store::DriveOptions options);

    CoroOutcome<void> setProfile(const rapidjson::Value &profile);

    /**
     * @return profile stored in the public drive, nullopt if none
     */
    CoroOutcome<std::optional<rapidjson::Document>> getProfile();

    outcome::result<crypto::Ed25519Signature> sign(
        common::BufferView message) const;

    /// \param signature of \param message was made by this identity
    outcome::result<bool> verify(
        common::BufferView message,
        const crypto::Ed25519Signature &signature) const;

    /**
     * Notifies close observers, then destroys the session and closes
     * drives and store. Repeated calls resolve once the first one is done.
     */
    Coro<void> close();

    boost::signals2::connection onConnection(
        const std::function<ConnectionHandler> &handler) {
      return on_connection_.connect(handler);
    }

    boost::signals2::connection onClose(
        const std::function<CloseHandler> &handler) {
      return on_close_.connect(handler);
    }

   private:
    Slashtag(boost::asio::io_context &io_context,
             std::shared_ptr<network::SwarmFactory> swarm_factory,
             std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
             std::shared_ptr<store::Corestore> root_store,
             bool owns_store,
             std::optional<crypto::Ed25519Keypair> key_pair,
             SlashURL url,
             network::SwarmOptions swarm_options);

    CoroOutcome<void> initialize();
    CoroOutcome<std::shared_ptr<store::Drive>> openDrive(
        store::DriveOptions options);
    void setupDiscovery(const std::shared_ptr<store::Drive> &drive);
    void handleConnection(const std::shared_ptr<network::Connection> &connection,
                          const network::PeerInfo &info);
    outcome::result<std::shared_ptr<Slashtag>> createRemote(
        const network::PublicKey &key);

    boost::asio::io_context &io_context_;
    std::shared_ptr<network::SwarmFactory> swarm_factory_;
    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    std::shared_ptr<store::Corestore> root_store_;
    bool owns_store_;
    std::shared_ptr<store::Corestore> store_;

    std::optional<crypto::Ed25519Keypair> key_pair_;
    network::PublicKey key_;
    SlashURL url_;
    bool remote_;
    network::SwarmOptions swarm_options_;

    State state_ = State::UNINITIALIZED;
    std::shared_ptr<coro::AsyncEvent> ready_event_;
    outcome::result<void> ready_result_ = outcome::success();
    // set once close() has torn everything down
    std::shared_ptr<coro::AsyncEvent> closed_event_;

    std::shared_ptr<network::Swarm> swarm_;
    std::shared_ptr<store::Drive> public_drive_;

    std::unordered_map<network::PublicKey, std::shared_ptr<network::Connection>>
        sockets_;
    std::unordered_map<store::PublicKey, std::shared_ptr<store::Drive>> drives_;
    std::unordered_map<network::ProtocolName,
                       std::shared_ptr<protocol::Protocol>>
        protocols_;

    boost::signals2::signal<ConnectionHandler> on_connection_;
    boost::signals2::signal<CloseHandler> on_close_;
    log::Logger log_;
  };

}  // namespace slashtags::identity

OUTCOME_HPP_DECLARE_ERROR(slashtags::identity, SlashtagError);
