/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/impl/memory_connection.hpp"

#include <boost/asio/post.hpp>

namespace slashtags::network {

  MemoryConnection::MemoryConnection(boost::asio::io_context &io_context,
                                     const PublicKey &local_key,
                                     const PublicKey &remote_key,
                                     bool initiator)
      : io_context_{io_context},
        local_key_{local_key},
        remote_key_{remote_key},
        initiator_{initiator} {}

  std::pair<std::shared_ptr<MemoryConnection>,
            std::shared_ptr<MemoryConnection>>
  MemoryConnection::makePair(boost::asio::io_context &io_context,
                             const PublicKey &initiator_key,
                             const PublicKey &responder_key) {
    auto initiator = std::make_shared<MemoryConnection>(
        io_context, initiator_key, responder_key, true);
    auto responder = std::make_shared<MemoryConnection>(
        io_context, responder_key, initiator_key, false);
    initiator->peer_ = responder;
    responder->peer_ = initiator;
    return {std::move(initiator), std::move(responder)};
  }

  outcome::result<void> MemoryConnection::write(common::Buffer frame) {
    if (isClosed()) {
      return ConnectionError::CLOSED;
    }
    boost::asio::post(io_context_,
                      [peer{peer_}, frame{std::move(frame)}] {
                        if (auto connection = peer.lock()) {
                          connection->emitData(frame);
                        }
                      });
    return outcome::success();
  }

  void MemoryConnection::destroy(std::error_code error) {
    // keep alive while observers run, they may drop the last owner
    auto self = shared_from_this();
    if (not closeOnce(error)) {
      return;
    }
    boost::asio::post(io_context_, [peer{peer_}, reset{bool(error)}] {
      if (auto connection = peer.lock()) {
        connection->closeOnce(reset ? make_error_code(ConnectionError::RESET)
                                    : std::error_code{});
      }
    });
  }

}  // namespace slashtags::network
