/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/blob.hpp"
#include "crypto/ed25519_types.hpp"

namespace slashtags::store {

  using PublicKey = crypto::Ed25519PublicKey;
  using DiscoveryKey = common::Hash256;

  /**
   * Selects a core of a corestore. Key pair wins over name, name wins over
   * bare key.
   */
  struct CoreOptions {
    std::optional<crypto::Ed25519Keypair> key_pair;
    /// key pair is derived from the store primary key, namespace and name
    std::optional<std::string> name;
    /// read-only replica of a core written by somebody else
    std::optional<PublicKey> key;
  };

  struct CorestoreOptions {
    /// bound of the wait for remote peers answering an update request
    std::chrono::milliseconds update_timeout{std::chrono::seconds(5)};
  };

  /**
   * Block of a core along with the signature of its writer over
   * (discovery key, sequence number, payload)
   */
  struct SignedBlock {
    common::Buffer payload;
    crypto::Ed25519Signature signature;

    bool operator==(const SignedBlock &other) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const SignedBlock &v) {
    return s << v.payload << v.signature;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, SignedBlock &v) {
    return s >> v.payload >> v.signature;
  }

}  // namespace slashtags::store
