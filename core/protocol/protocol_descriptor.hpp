/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include "protocol/protocol.hpp"

namespace slashtags::protocol {

  /**
   * Registration entry of a protocol: unique name and the factory building
   * the protocol instance bound to a local slashtag
   */
  struct ProtocolDescriptor {
    using Factory = std::function<std::shared_ptr<Protocol>(
        const std::shared_ptr<identity::Slashtag> &)>;

    network::ProtocolName name;
    Factory factory;
  };

  /**
   * Descriptor of protocol \tparam P constructed as
   * `P(slashtag, name, args...)`
   */
  template <typename P, typename... Args>
  ProtocolDescriptor makeProtocolDescriptor(network::ProtocolName name,
                                            Args... args) {
    return ProtocolDescriptor{
        name,
        [name, args...](const std::shared_ptr<identity::Slashtag> &slashtag)
            -> std::shared_ptr<Protocol> {
          return std::make_shared<P>(slashtag, name, args...);
        },
    };
  }

}  // namespace slashtags::protocol
