/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>

#include "network/connection.hpp"

namespace slashtags::network {

  /**
   * One end of an in-process connection. Frames and close are delivered to
   * the other end through the io_context, preserving the order of calls.
   */
  class MemoryConnection : public Connection,
                           public std::enable_shared_from_this<MemoryConnection> {
   public:
    MemoryConnection(boost::asio::io_context &io_context,
                     const PublicKey &local_key,
                     const PublicKey &remote_key,
                     bool initiator);

    /**
     * @return linked pair of connection ends, the first one belongs to the
     * initiator
     */
    static std::pair<std::shared_ptr<MemoryConnection>,
                     std::shared_ptr<MemoryConnection>>
    makePair(boost::asio::io_context &io_context,
             const PublicKey &initiator_key,
             const PublicKey &responder_key);

    const PublicKey &remotePublicKey() const override {
      return remote_key_;
    }

    const PublicKey &publicKey() const override {
      return local_key_;
    }

    bool isInitiator() const override {
      return initiator_;
    }

    outcome::result<void> write(common::Buffer frame) override;

    void destroy(std::error_code error) override;

   private:
    boost::asio::io_context &io_context_;
    PublicKey local_key_;
    PublicKey remote_key_;
    bool initiator_;
    std::weak_ptr<MemoryConnection> peer_;
  };

}  // namespace slashtags::network
