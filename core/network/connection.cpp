/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/connection.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::network, ConnectionError, e) {
  using E = slashtags::network::ConnectionError;
  switch (e) {
    case E::CLOSED:
      return "Connection is closed";
    case E::RESET:
      return "Connection was reset by the remote peer";
  }
  return "Unknown ConnectionError";
}

namespace slashtags::network {

  void Connection::emitData(common::BufferView data) {
    if (closed_) {
      return;
    }
    on_data_(data);
  }

  bool Connection::closeOnce(const std::error_code &error) {
    if (closed_) {
      return false;
    }
    closed_ = true;
    if (error) {
      on_error_(error);
    }
    on_close_();
    on_data_.disconnect_all_slots();
    on_error_.disconnect_all_slots();
    on_close_.disconnect_all_slots();
    return true;
  }

}  // namespace slashtags::network
