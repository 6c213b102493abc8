/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <system_error>

#include <boost/signals2.hpp>

#include "common/buffer.hpp"
#include "network/types.hpp"
#include "outcome/outcome.hpp"

namespace slashtags::network {

  class Mux;

  enum class ConnectionError {
    CLOSED = 1,
    RESET,
  };

  /**
   * Encrypted message-framed duplex connection to a remote public key.
   * Every frame written by one side arrives as a single `onData` event on
   * the other side, in the order of writing.
   * `onClose` fires exactly once, after the last `onData`.
   */
  class Connection {
   public:
    using DataHandler = void(common::BufferView);
    using CloseHandler = void();
    using ErrorHandler = void(const std::error_code &);

    Connection() = default;
    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;
    virtual ~Connection() = default;

    virtual const PublicKey &remotePublicKey() const = 0;

    virtual const PublicKey &publicKey() const = 0;

    virtual bool isInitiator() const = 0;

    bool isClosed() const {
      return closed_;
    }

    /**
     * Sends a single frame to the remote side
     */
    virtual outcome::result<void> write(common::Buffer frame) = 0;

    /**
     * Graceful close, remote side observes close after all written frames
     */
    void close() {
      destroy({});
    }

    /**
     * Closes the connection, non-zero \param error is reported to the local
     * error observers before close
     */
    virtual void destroy(std::error_code error) = 0;

    boost::signals2::connection onData(
        const std::function<DataHandler> &handler) {
      return on_data_.connect(handler);
    }

    boost::signals2::connection onClose(
        const std::function<CloseHandler> &handler) {
      return on_close_.connect(handler);
    }

    boost::signals2::connection onError(
        const std::function<ErrorHandler> &handler) {
      return on_error_.connect(handler);
    }

   protected:
    void emitData(common::BufferView data);

    /**
     * Marks connection closed and notifies observers, does nothing if the
     * connection is already closed
     * @return true if this call closed the connection
     */
    bool closeOnce(const std::error_code &error);

   private:
    friend class Mux;

    bool closed_ = false;
    boost::signals2::signal<DataHandler> on_data_;
    boost::signals2::signal<CloseHandler> on_close_;
    boost::signals2::signal<ErrorHandler> on_error_;

    // protocol multiplexer of this connection, see Mux::from
    std::shared_ptr<Mux> mux_;
  };

}  // namespace slashtags::network

OUTCOME_HPP_DECLARE_ERROR(slashtags::network, ConnectionError);
