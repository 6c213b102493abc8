/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "crypto/secret_box.hpp"
#include "store/core.hpp"

namespace slashtags::store {

  struct DriveOptions {
    /// name of the core within the store namespace
    std::optional<std::string> name;
    /// key of a drive written by somebody else
    std::optional<PublicKey> key;
    std::optional<crypto::Ed25519Keypair> key_pair;
    bool encrypted = false;
    /// derived from the key pair of a writable drive if not given
    std::optional<crypto::SecretBoxKey> encryption_key;
  };

  /**
   * Key-value store on top of a single core, discoverable by the
   * discovery key of its core
   */
  class Drive {
   public:
    virtual ~Drive() = default;

    /**
     * Opens the core and indexes its blocks, repeated calls are no-op.
     * Key related accessors are valid after ready() succeeded.
     */
    virtual CoroOutcome<void> ready() = 0;

    virtual const PublicKey &key() const = 0;

    virtual const DiscoveryKey &discoveryKey() const = 0;

    virtual bool encrypted() const = 0;

    virtual bool writable() const = 0;

    /// key the content of an encrypted drive is sealed with
    virtual const std::optional<crypto::SecretBoxKey> &encryptionKey()
        const = 0;

    /**
     * @return content stored at \param path or nullopt if there is none
     */
    virtual outcome::result<std::optional<common::Buffer>> get(
        std::string_view path) const = 0;

    virtual outcome::result<void> put(std::string_view path,
                                      common::BufferView content) = 0;

    virtual outcome::result<void> del(std::string_view path) = 0;

    /**
     * @return paths starting with \param prefix, ordered
     */
    virtual outcome::result<std::vector<std::string>> list(
        std::string_view prefix) const = 0;

    /**
     * Pulls entries written by the drive owner from connected peers
     * @return true if anything new arrived
     */
    virtual CoroOutcome<bool> update() = 0;

    virtual Core::FindingPeersDone findingPeers() = 0;

    virtual Coro<void> close() = 0;

    virtual bool closed() const = 0;
  };

}  // namespace slashtags::store
