/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "protocol/slash_protocol.hpp"

#include "identity/slashtag.hpp"

namespace slashtags::protocol {

  SlashProtocol::SlashProtocol(
      const std::shared_ptr<identity::Slashtag> &slashtag,
      network::ProtocolName name)
      : log_{log::createLogger("SlashProtocol", "protocol")},
        slashtag_{slashtag},
        name_{std::move(name)} {}

  void SlashProtocol::createChannel(
      const std::shared_ptr<network::Connection> &connection,
      const identity::PeerInfo &peer_info) {
    auto mux = network::Mux::from(connection);
    auto channel_res = mux->createChannel(name_);
    if (channel_res.has_error()) {
      SL_WARN(log_,
              "Can not create channel {} to {}: {}",
              name_,
              peer_info.public_key,
              channel_res.error());
      return;
    }
    auto &channel = channel_res.value();
    std::weak_ptr weak_channel{channel};

    channel->onOpen([weak{weak_from_this()}, weak_channel, peer_info] {
      auto self = weak.lock();
      auto channel = weak_channel.lock();
      if (self and channel) {
        SL_DEBUG(
            self->log_, "Channel {} to {} open", self->name_, peer_info.public_key);
        self->onOpen(channel, peer_info);
      }
    });
    channel->onMessage([weak{weak_from_this()}, weak_channel, peer_info](
                           common::BufferView message) {
      auto self = weak.lock();
      auto channel = weak_channel.lock();
      if (self and channel) {
        self->onMessage(channel, message, peer_info);
      }
    });
    channel->onClose(
        [weak{weak_from_this()}, raw{channel.get()}, peer_info] {
          auto self = weak.lock();
          if (not self) {
            return;
          }
          auto it = self->channels_.find(peer_info.public_key);
          if (it != self->channels_.end() and it->second.channel.get() == raw) {
            self->channels_.erase(it);
          }
          SL_DEBUG(self->log_,
                   "Channel {} to {} closed",
                   self->name_,
                   peer_info.public_key);
          self->onClose(peer_info);
        });

    channels_[peer_info.public_key] = Entry{channel, peer_info};
    if (auto res = channel->open(); res.has_error()) {
      SL_WARN(log_,
              "Can not open channel {} to {}: {}",
              name_,
              peer_info.public_key,
              res.error());
      channels_.erase(peer_info.public_key);
    }
  }

  std::shared_ptr<network::Channel> SlashProtocol::channel(
      const network::PublicKey &remote_key) const {
    if (auto it = channels_.find(remote_key); it != channels_.end()) {
      if (not it->second.channel->isClosed()) {
        return it->second.channel;
      }
    }
    return nullptr;
  }

  CoroOutcome<std::shared_ptr<network::Channel>> SlashProtocol::connect(
      identity::Target target) {
    auto self = shared_from_this();
    auto slashtag = slashtag_.lock();
    if (not slashtag) {
      co_return identity::SlashtagError::ALREADY_CLOSED;
    }
    CO_TRY(connection, co_await slashtag->connect(target));
    if (auto channel = this->channel(connection->remotePublicKey())) {
      co_return channel;
    }
    co_return network::MuxError::CHANNEL_NOT_OPENED;
  }

  outcome::result<void> SlashProtocol::send(
      const network::PublicKey &remote_key, common::BufferView message) {
    auto channel = this->channel(remote_key);
    if (not channel) {
      return network::MuxError::CHANNEL_NOT_OPENED;
    }
    return channel->send(message);
  }

}  // namespace slashtags::protocol
