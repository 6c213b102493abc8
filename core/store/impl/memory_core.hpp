/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "store/core.hpp"

#include <memory>
#include <vector>

#include "coro/async_event.hpp"
#include "crypto/ed25519_provider.hpp"
#include "log/logger.hpp"

namespace slashtags::store {

  class Replicator;

  class MemoryCore : public Core,
                     public std::enable_shared_from_this<MemoryCore> {
   public:
    MemoryCore(std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
               PublicKey key,
               std::optional<crypto::Ed25519Keypair> key_pair,
               std::weak_ptr<Replicator> replicator,
               std::chrono::milliseconds update_timeout);

    const PublicKey &key() const override {
      return key_;
    }

    const DiscoveryKey &discoveryKey() const override {
      return discovery_key_;
    }

    bool writable() const override {
      return key_pair_.has_value();
    }

    const std::optional<crypto::Ed25519Keypair> &keyPair() const override {
      return key_pair_;
    }

    uint64_t length() const override {
      return blocks_.size();
    }

    outcome::result<uint64_t> append(common::BufferView payload) override;

    std::optional<common::Buffer> get(uint64_t seq) const override;

    CoroOutcome<bool> update() override;

    FindingPeersDone findingPeers() override;

    bool closed() const override {
      return closed_;
    }

    boost::signals2::connection onAppend(
        const std::function<AppendHandler> &handler) override {
      return on_append_.connect(handler);
    }

    /// replica becomes writable once the key pair of its key is known
    void setKeyPair(const crypto::Ed25519Keypair &key_pair);

    /**
     * Verifies and appends the blocks received from a peer. Blocks already
     * present are skipped, blocks after a gap are ignored.
     * @return number of appended blocks
     */
    outcome::result<size_t> appendVerified(
        uint64_t start, const std::vector<SignedBlock> &blocks);

    /// blocks starting at \param from
    std::vector<SignedBlock> blocks(uint64_t from) const;

    void close();

    /// bytes covered by the signature of a block
    static outcome::result<common::Buffer> signable(
        const DiscoveryKey &discovery_key,
        uint64_t seq,
        common::BufferView payload);

   private:
    void push(SignedBlock block);

    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    PublicKey key_;
    DiscoveryKey discovery_key_;
    std::optional<crypto::Ed25519Keypair> key_pair_;
    std::weak_ptr<Replicator> replicator_;
    std::chrono::milliseconds update_timeout_;

    std::vector<SignedBlock> blocks_;
    bool closed_ = false;

    size_t finding_peers_ = 0;
    std::shared_ptr<coro::AsyncEvent> peers_found_;

    boost::signals2::signal<AppendHandler> on_append_;
    log::Logger log_;
  };

}  // namespace slashtags::store
