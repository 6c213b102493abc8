/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "store/impl/memory_corestore.hpp"

#include <algorithm>

#include "crypto/random.hpp"
#include "crypto/sha/sha256.hpp"
#include "store/impl/replicator.hpp"
#include "store/store_error.hpp"

namespace slashtags::store {

  outcome::result<std::shared_ptr<MemoryCorestore>> MemoryCorestore::create(
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      CorestoreOptions options) {
    OUTCOME_TRY(primary_key, crypto::randomBytes<crypto::kPrimaryKeySize>());
    return std::make_shared<MemoryCorestore>(
        std::move(ed25519_provider), primary_key, options);
  }

  MemoryCorestore::MemoryCorestore(
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      const crypto::PrimaryKey &primary_key,
      CorestoreOptions options)
      : MemoryCorestore(
          ed25519_provider,
          primary_key,
          std::make_shared<Replicator>(ed25519_provider, options),
          {}) {}

  MemoryCorestore::MemoryCorestore(
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      const crypto::PrimaryKey &primary_key,
      std::shared_ptr<Replicator> replicator,
      common::Buffer ns)
      : ed25519_provider_{std::move(ed25519_provider)},
        primary_key_{primary_key},
        replicator_{std::move(replicator)},
        ns_{std::move(ns)},
        log_{log::createLogger("Corestore", "store")} {}

  std::shared_ptr<Corestore> MemoryCorestore::namespaced(
      common::BufferView ns) {
    auto hash = crypto::sha256(common::concat(ns_, ns));
    return std::shared_ptr<MemoryCorestore>(new MemoryCorestore(
        ed25519_provider_,
        primary_key_,
        replicator_,
        common::Buffer{hash.begin(), hash.end()}));
  }

  outcome::result<std::optional<crypto::Ed25519Keypair>>
  MemoryCorestore::resolveKeyPair(const CoreOptions &options) const {
    if (options.key_pair or not options.name) {
      return options.key_pair;
    }
    OUTCOME_TRY(derived,
                crypto::deriveKeyPair(*ed25519_provider_,
                                      common::concat(primary_key_.view(), ns_),
                                      *options.name));
    return std::optional<crypto::Ed25519Keypair>{derived};
  }

  outcome::result<PublicKey> MemoryCorestore::keyOf(
      const CoreOptions &options,
      const std::optional<crypto::Ed25519Keypair> &key_pair) {
    if (key_pair) {
      return key_pair->public_key;
    }
    if (options.key) {
      return *options.key;
    }
    return StoreError::MISSING_KEY;
  }

  outcome::result<PublicKey> MemoryCorestore::resolveKey(
      const CoreOptions &options) const {
    OUTCOME_TRY(key_pair, resolveKeyPair(options));
    return keyOf(options, key_pair);
  }

  outcome::result<std::shared_ptr<Core>> MemoryCorestore::get(
      const CoreOptions &options) {
    if (closed_) {
      return StoreError::CLOSED;
    }
    OUTCOME_TRY(key_pair, resolveKeyPair(options));
    OUTCOME_TRY(key, keyOf(options, key_pair));

    auto core = replicator_->acquire(key, key_pair);
    opened_.push_back(core->discoveryKey());
    return core;
  }

  void MemoryCorestore::release(const std::shared_ptr<Core> &core) {
    if (closed_) {
      return;
    }
    auto it = std::find(opened_.begin(), opened_.end(), core->discoveryKey());
    if (it == opened_.end()) {
      SL_WARN(log_, "Core {} was not opened here", core->discoveryKey());
      return;
    }
    opened_.erase(it);
    replicator_->release(core->discoveryKey());
  }

  void MemoryCorestore::replicate(
      const std::shared_ptr<network::Connection> &connection) {
    if (closed_) {
      return;
    }
    replicator_->replicate(connection);
  }

  Coro<void> MemoryCorestore::close() {
    if (closed_) {
      co_return;
    }
    closed_ = true;
    auto opened = std::move(opened_);
    opened_.clear();
    for (const auto &discovery_key : opened) {
      replicator_->release(discovery_key);
    }
    SL_DEBUG(log_, "Corestore closed, {} cores released", opened.size());
    co_return;
  }

}  // namespace slashtags::store
