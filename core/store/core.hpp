/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>

#include <boost/signals2.hpp>

#include "coro/coro.hpp"
#include "store/types.hpp"

namespace slashtags::store {

  /**
   * Signed append-only log. Only the owner of the key pair appends, other
   * peers hold verified replicas.
   */
  class Core {
   public:
    using AppendHandler = void(uint64_t seq, const SignedBlock &block);
    /// one-shot callback ending a "finding peers" period
    using FindingPeersDone = std::function<void()>;

    virtual ~Core() = default;

    virtual const PublicKey &key() const = 0;

    virtual const DiscoveryKey &discoveryKey() const = 0;

    virtual bool writable() const = 0;

    /// key pair of a writable core
    virtual const std::optional<crypto::Ed25519Keypair> &keyPair() const = 0;

    virtual uint64_t length() const = 0;

    /**
     * Appends \param payload signed by the key pair of the core
     * @return sequence number of the block
     */
    virtual outcome::result<uint64_t> append(common::BufferView payload) = 0;

    virtual std::optional<common::Buffer> get(uint64_t seq) const = 0;

    /**
     * Pulls blocks available at connected peers. While "finding peers" is in
     * progress and no peer is connected, waits for the search to end first.
     * @return true if the length changed
     */
    virtual CoroOutcome<bool> update() = 0;

    /**
     * Marks the start of a peer search, update() waits for the returned
     * callback to be called
     */
    virtual FindingPeersDone findingPeers() = 0;

    virtual bool closed() const = 0;

    virtual boost::signals2::connection onAppend(
        const std::function<AppendHandler> &handler) = 0;
  };

}  // namespace slashtags::store
