/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "protocol/protocol.hpp"

#include <unordered_map>

#include "coro/coro.hpp"
#include "identity/target.hpp"
#include "log/logger.hpp"
#include "network/mux.hpp"

namespace slashtags::protocol {

  /**
   * Protocol talking over one mux channel per connection, named after the
   * protocol. Derived protocols react to the channel events.
   */
  class SlashProtocol : public Protocol,
                        public std::enable_shared_from_this<SlashProtocol> {
   public:
    SlashProtocol(const std::shared_ptr<identity::Slashtag> &slashtag,
                  network::ProtocolName name);

    const network::ProtocolName &name() const override {
      return name_;
    }

    void createChannel(const std::shared_ptr<network::Connection> &connection,
                       const identity::PeerInfo &peer_info) override;

    /**
     * @return channel to \param remote_key or nullptr
     */
    std::shared_ptr<network::Channel> channel(
        const network::PublicKey &remote_key) const;

    /**
     * Connects the owning slashtag to \param target
     * @return channel of this protocol over the connection
     */
    CoroOutcome<std::shared_ptr<network::Channel>> connect(
        identity::Target target);

    outcome::result<void> send(const network::PublicKey &remote_key,
                               common::BufferView message);

   protected:
    /// both sides have opened the channel
    virtual void onOpen(const std::shared_ptr<network::Channel> &channel,
                        const identity::PeerInfo &peer_info) {}

    virtual void onMessage(const std::shared_ptr<network::Channel> &channel,
                           common::BufferView message,
                           const identity::PeerInfo &peer_info) {}

    virtual void onClose(const identity::PeerInfo &peer_info) {}

    std::shared_ptr<identity::Slashtag> slashtag() const {
      return slashtag_.lock();
    }

    log::Logger log_;

   private:
    struct Entry {
      std::shared_ptr<network::Channel> channel;
      identity::PeerInfo peer_info;
    };

    std::weak_ptr<identity::Slashtag> slashtag_;
    network::ProtocolName name_;
    std::unordered_map<network::PublicKey, Entry> channels_;
  };

}  // namespace slashtags::protocol
