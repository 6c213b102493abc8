/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "store/corestore.hpp"

#include "crypto/ed25519_provider.hpp"
#include "crypto/key_derivation.hpp"
#include "log/logger.hpp"

namespace slashtags::store {

  class Replicator;

  /**
   * RAM corestore, cores live while some namespace keeps them open
   */
  class MemoryCorestore : public Corestore,
                          public std::enable_shared_from_this<MemoryCorestore> {
   public:
    /// root store with a random primary key
    static outcome::result<std::shared_ptr<MemoryCorestore>> create(
        std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
        CorestoreOptions options = {});

    MemoryCorestore(std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
                    const crypto::PrimaryKey &primary_key,
                    CorestoreOptions options = {});

    std::shared_ptr<Corestore> namespaced(common::BufferView ns) override;

    outcome::result<PublicKey> resolveKey(
        const CoreOptions &options) const override;

    outcome::result<std::shared_ptr<Core>> get(
        const CoreOptions &options) override;

    void release(const std::shared_ptr<Core> &core) override;

    /// references taken through this namespace and not released yet
    size_t opened() const {
      return opened_.size();
    }

    void replicate(
        const std::shared_ptr<network::Connection> &connection) override;

    Coro<void> close() override;

    bool closed() const override {
      return closed_;
    }

   private:
    outcome::result<std::optional<crypto::Ed25519Keypair>> resolveKeyPair(
        const CoreOptions &options) const;
    static outcome::result<PublicKey> keyOf(
        const CoreOptions &options,
        const std::optional<crypto::Ed25519Keypair> &key_pair);

    MemoryCorestore(std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
                    const crypto::PrimaryKey &primary_key,
                    std::shared_ptr<Replicator> replicator,
                    common::Buffer ns);

    std::shared_ptr<crypto::Ed25519Provider> ed25519_provider_;
    crypto::PrimaryKey primary_key_;
    std::shared_ptr<Replicator> replicator_;
    // empty for the root store
    common::Buffer ns_;

    // one entry per get() not released yet, the rest is released on close
    std::vector<DiscoveryKey> opened_;
    bool closed_ = false;
    log::Logger log_;
  };

}  // namespace slashtags::store
