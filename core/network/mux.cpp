/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/mux.hpp"

#include "scale/scale.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::network, MuxError, e) {
  using E = slashtags::network::MuxError;
  switch (e) {
    case E::CHANNEL_NOT_OPENED:
      return "Channel is not opened yet";
    case E::CHANNEL_CLOSED:
      return "Channel is closed";
    case E::CHANNEL_EXISTS:
      return "Channel for this protocol already exists on the connection";
    case E::CONNECTION_CLOSED:
      return "Connection of the channel is closed";
    case E::PENDING_LIMIT_EXCEEDED:
      return "Too many frames sent to channels which are not opened";
  }
  return "Unknown MuxError";
}

namespace slashtags::network {

  Channel::Channel(std::weak_ptr<Mux> mux, ProtocolName protocol)
      : mux_{std::move(mux)}, protocol_{std::move(protocol)} {}

  std::shared_ptr<Connection> Channel::connection() const {
    if (auto mux = mux_.lock()) {
      return mux->connection();
    }
    return nullptr;
  }

  outcome::result<void> Channel::open() {
    if (closed_) {
      return MuxError::CHANNEL_CLOSED;
    }
    if (opened_) {
      return outcome::success();
    }
    auto mux = mux_.lock();
    if (not mux) {
      return MuxError::CONNECTION_CLOSED;
    }
    OUTCOME_TRY(mux->sendFrame({MuxFrame::Type::OPEN, protocol_, {}}));
    opened_ = true;
    mux->replayPending(shared_from_this());
    if (isOpen()) {
      on_open_();
    }
    return outcome::success();
  }

  outcome::result<void> Channel::send(common::BufferView message) {
    if (closed_) {
      return MuxError::CHANNEL_CLOSED;
    }
    if (not opened_) {
      return MuxError::CHANNEL_NOT_OPENED;
    }
    auto mux = mux_.lock();
    if (not mux) {
      return MuxError::CONNECTION_CLOSED;
    }
    return mux->sendFrame({MuxFrame::Type::MESSAGE,
                           protocol_,
                           common::Buffer{message.begin(), message.end()}});
  }

  void Channel::close() {
    if (closed_) {
      return;
    }
    if (auto mux = mux_.lock()) {
      if (opened_) {
        auto res = mux->sendFrame({MuxFrame::Type::CLOSE, protocol_, {}});
        if (res.has_error()) {
          SL_TRACE(mux->log_,
                   "Close of channel '{}' is not delivered: {}",
                   protocol_,
                   res.error());
        }
      }
      mux->release(protocol_);
    }
    closeLocally();
  }

  void Channel::handleFrame(const MuxFrame &frame) {
    switch (frame.type) {
      case MuxFrame::Type::OPEN:
        if (not remote_opened_) {
          remote_opened_ = true;
          if (isOpen()) {
            on_open_();
          }
        }
        break;
      case MuxFrame::Type::MESSAGE:
        on_message_(frame.payload);
        break;
      case MuxFrame::Type::CLOSE:
        if (auto mux = mux_.lock()) {
          mux->release(protocol_);
        }
        closeLocally();
        break;
    }
  }

  void Channel::closeLocally() {
    if (closed_) {
      return;
    }
    closed_ = true;
    on_close_();
    on_open_.disconnect_all_slots();
    on_message_.disconnect_all_slots();
    on_close_.disconnect_all_slots();
  }

  Mux::Mux(const std::shared_ptr<Connection> &connection)
      : connection_{connection},
        closed_{connection->isClosed()},
        log_{log::createLogger("Mux", "mux")} {}

  std::shared_ptr<Mux> Mux::from(
      const std::shared_ptr<Connection> &connection) {
    if (connection->mux_) {
      return connection->mux_;
    }
    auto mux = std::make_shared<Mux>(connection);
    mux->subscribe(connection);
    connection->mux_ = mux;
    return mux;
  }

  void Mux::subscribe(const std::shared_ptr<Connection> &connection) {
    connection->onData([weak{weak_from_this()}](common::BufferView data) {
      if (auto self = weak.lock()) {
        self->onFrame(data);
      }
    });
    connection->onClose([weak{weak_from_this()}] {
      if (auto self = weak.lock()) {
        self->onConnectionClosed();
      }
    });
  }

  outcome::result<std::shared_ptr<Channel>> Mux::createChannel(
      const ProtocolName &protocol) {
    if (closed_) {
      return MuxError::CONNECTION_CLOSED;
    }
    if (channels_.contains(protocol)) {
      return MuxError::CHANNEL_EXISTS;
    }
    auto channel = std::make_shared<Channel>(weak_from_this(), protocol);
    channels_.emplace(protocol, channel);
    return channel;
  }

  std::shared_ptr<Channel> Mux::channel(const ProtocolName &protocol) const {
    if (auto it = channels_.find(protocol); it != channels_.end()) {
      return it->second;
    }
    return nullptr;
  }

  bool Mux::remoteOpened(const ProtocolName &protocol) const {
    if (auto channel = this->channel(protocol)) {
      return channel->remote_opened_;
    }
    return pending_.contains(protocol);
  }

  void Mux::onFrame(common::BufferView data) {
    if (closed_) {
      return;
    }
    auto frame_res = scale::decode<MuxFrame>(data);
    if (frame_res.has_error()) {
      SL_WARN(log_, "Malformed mux frame: {}", frame_res.error());
      if (auto connection = connection_.lock()) {
        connection->destroy(frame_res.error());
      }
      return;
    }
    auto &frame = frame_res.value();

    auto it = channels_.find(frame.protocol);
    if (it == channels_.end() or not it->second->opened_) {
      if (frame.type == MuxFrame::Type::CLOSE) {
        dropPending(frame.protocol);
        if (it != channels_.end()) {
          auto channel = it->second;
          channels_.erase(it);
          channel->closeLocally();
        }
        return;
      }
      keepPending(std::move(frame));
      return;
    }
    auto channel = it->second;
    channel->handleFrame(frame);
  }

  void Mux::replayPending(const std::shared_ptr<Channel> &channel) {
    auto it = pending_.find(channel->protocol());
    if (it == pending_.end()) {
      return;
    }
    auto frames = std::move(it->second);
    pending_.erase(it);
    for (auto &frame : frames) {
      pending_bytes_ -= frame.payload.size();
    }
    for (auto &frame : frames) {
      if (channel->isClosed()) {
        break;
      }
      channel->handleFrame(frame);
    }
  }

  void Mux::onConnectionClosed() {
    closed_ = true;
    pending_.clear();
    pending_bytes_ = 0;
    auto channels = std::move(channels_);
    channels_.clear();
    for (auto &[protocol, channel] : channels) {
      SL_TRACE(log_, "Channel '{}' closed with the connection", protocol);
      channel->closeLocally();
    }
  }

  outcome::result<void> Mux::sendFrame(MuxFrame frame) {
    auto connection = connection_.lock();
    if (closed_ or not connection or connection->isClosed()) {
      return MuxError::CONNECTION_CLOSED;
    }
    OUTCOME_TRY(bytes, scale::encode(frame));
    return connection->write(std::move(bytes));
  }

  void Mux::release(const ProtocolName &protocol) {
    channels_.erase(protocol);
  }

  void Mux::keepPending(MuxFrame frame) {
    auto it = pending_.find(frame.protocol);
    bool exceeded = pending_bytes_ + frame.payload.size() > kMaxPendingBytes;
    if (it == pending_.end()) {
      exceeded = exceeded or pending_.size() >= kMaxPendingProtocols;
    } else {
      exceeded = exceeded or it->second.size() >= kMaxPendingFrames;
    }
    if (exceeded) {
      SL_WARN(log_,
              "Remote side keeps sending to not opened channel '{}', "
              "dropping connection",
              frame.protocol);
      if (auto connection = connection_.lock()) {
        connection->destroy(MuxError::PENDING_LIMIT_EXCEEDED);
      }
      return;
    }
    SL_TRACE(log_,
             "Keep frame of protocol '{}' until the channel is opened",
             frame.protocol);
    pending_bytes_ += frame.payload.size();
    auto protocol = frame.protocol;
    pending_[protocol].emplace_back(std::move(frame));
  }

  void Mux::dropPending(const ProtocolName &protocol) {
    auto it = pending_.find(protocol);
    if (it == pending_.end()) {
      return;
    }
    for (auto &frame : it->second) {
      pending_bytes_ -= frame.payload.size();
    }
    pending_.erase(it);
  }

}  // namespace slashtags::network
