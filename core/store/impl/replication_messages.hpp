/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>
#include <vector>

#include "store/types.hpp"

namespace slashtags::store {

  /// asks for blocks of a core starting at `from`
  struct RequestMessage {
    DiscoveryKey discovery_key;
    uint64_t from = 0;
  };

  /// consecutive blocks of a core, first of them has sequence `start`
  struct DataMessage {
    DiscoveryKey discovery_key;
    uint64_t start = 0;
    std::vector<SignedBlock> blocks;
  };

  /// responder has no such core
  struct MissingMessage {
    DiscoveryKey discovery_key;
  };

  using ReplicationMessage =
      std::variant<RequestMessage, DataMessage, MissingMessage>;

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const RequestMessage &v) {
    return s << v.discovery_key << v.from;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, RequestMessage &v) {
    return s >> v.discovery_key >> v.from;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const DataMessage &v) {
    return s << v.discovery_key << v.start << v.blocks;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, DataMessage &v) {
    return s >> v.discovery_key >> v.start >> v.blocks;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const MissingMessage &v) {
    return s << v.discovery_key;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, MissingMessage &v) {
    return s >> v.discovery_key;
  }

}  // namespace slashtags::store
