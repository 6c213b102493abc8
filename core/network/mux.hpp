/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <memory>
#include <unordered_map>

#include "log/logger.hpp"
#include "network/connection.hpp"

namespace slashtags::network {

  enum class MuxError {
    CHANNEL_NOT_OPENED = 1,
    CHANNEL_CLOSED,
    CHANNEL_EXISTS,
    CONNECTION_CLOSED,
    PENDING_LIMIT_EXCEEDED,
  };

  /**
   * Wire frame of the protocol multiplexer
   */
  struct MuxFrame {
    enum class Type : uint8_t { OPEN = 0, MESSAGE = 1, CLOSE = 2 };

    Type type = Type::MESSAGE;
    ProtocolName protocol;
    common::Buffer payload;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const MuxFrame &v) {
    return s << v.type << v.protocol << v.payload;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, MuxFrame &v) {
    return s >> v.type >> v.protocol >> v.payload;
  }

  class Mux;

  /**
   * Named channel of a single protocol over a connection.
   * Messages sent before the remote side opens its channel are kept by the
   * remote multiplexer and delivered once it opens.
   */
  class Channel : public std::enable_shared_from_this<Channel> {
   public:
    using OpenHandler = void();
    using MessageHandler = void(common::BufferView);
    using CloseHandler = void();

    Channel(std::weak_ptr<Mux> mux, ProtocolName protocol);

    const ProtocolName &protocol() const {
      return protocol_;
    }

    /// both sides have opened the channel
    bool isOpen() const {
      return opened_ and remote_opened_ and not closed_;
    }

    bool isClosed() const {
      return closed_;
    }

    std::shared_ptr<Connection> connection() const;

    /**
     * Announces the channel to the remote side and delivers the frames the
     * remote side has sent before. Handlers must be set before the call.
     */
    outcome::result<void> open();

    outcome::result<void> send(common::BufferView message);

    void close();

    boost::signals2::connection onOpen(const std::function<OpenHandler> &f) {
      return on_open_.connect(f);
    }

    boost::signals2::connection onMessage(
        const std::function<MessageHandler> &f) {
      return on_message_.connect(f);
    }

    boost::signals2::connection onClose(const std::function<CloseHandler> &f) {
      return on_close_.connect(f);
    }

   private:
    friend class Mux;

    void handleFrame(const MuxFrame &frame);
    void closeLocally();

    std::weak_ptr<Mux> mux_;
    ProtocolName protocol_;
    bool opened_ = false;
    bool remote_opened_ = false;
    bool closed_ = false;

    boost::signals2::signal<OpenHandler> on_open_;
    boost::signals2::signal<MessageHandler> on_message_;
    boost::signals2::signal<CloseHandler> on_close_;
  };

  /**
   * Protocol multiplexer of a single connection, one instance per
   * connection. Channels are keyed by protocol name.
   */
  class Mux : public std::enable_shared_from_this<Mux> {
   public:
    /// frames kept for a protocol not opened locally
    static constexpr size_t kMaxPendingFrames = 128;
    /// protocols with kept frames
    static constexpr size_t kMaxPendingProtocols = 32;
    /// bytes of payload kept over all protocols
    static constexpr size_t kMaxPendingBytes = 1 << 20;

    explicit Mux(const std::shared_ptr<Connection> &connection);

    /**
     * @return multiplexer of the connection, created on the first call
     */
    static std::shared_ptr<Mux> from(
        const std::shared_ptr<Connection> &connection);

    /**
     * Creates an unopened channel for \param protocol
     * @return CHANNEL_EXISTS if a channel for the protocol is still alive
     */
    outcome::result<std::shared_ptr<Channel>> createChannel(
        const ProtocolName &protocol);

    std::shared_ptr<Channel> channel(const ProtocolName &protocol) const;

    /// remote side has opened a channel for \param protocol
    bool remoteOpened(const ProtocolName &protocol) const;

    std::shared_ptr<Connection> connection() const {
      return connection_.lock();
    }

   private:
    friend class Channel;

    void subscribe(const std::shared_ptr<Connection> &connection);
    void onFrame(common::BufferView data);
    void onConnectionClosed();

    outcome::result<void> sendFrame(MuxFrame frame);
    void replayPending(const std::shared_ptr<Channel> &channel);
    void release(const ProtocolName &protocol);
    void keepPending(MuxFrame frame);
    void dropPending(const ProtocolName &protocol);

    std::weak_ptr<Connection> connection_;
    std::unordered_map<ProtocolName, std::shared_ptr<Channel>> channels_;
    // frames of channels opened by the remote side and not created locally
    std::unordered_map<ProtocolName, std::deque<MuxFrame>> pending_;
    size_t pending_bytes_ = 0;
    bool closed_ = false;
    log::Logger log_;
  };

}  // namespace slashtags::network

OUTCOME_HPP_DECLARE_ERROR(slashtags::network, MuxError);
