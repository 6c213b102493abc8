/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "store/impl/memory_core.hpp"

#include "crypto/key_derivation.hpp"
#include "scale/scale.hpp"
#include "store/impl/replicator.hpp"
#include "store/store_error.hpp"

namespace slashtags::store {

  MemoryCore::MemoryCore(
      std::shared_ptr<crypto::Ed25519Provider> ed25519_provider,
      PublicKey key,
      std::optional<crypto::Ed25519Keypair> key_pair,
      std::weak_ptr<Replicator> replicator,
      std::chrono::milliseconds update_timeout)
      : ed25519_provider_{std::move(ed25519_provider)},
        key_{key},
        discovery_key_{crypto::discoveryKey(key)},
        key_pair_{std::move(key_pair)},
        replicator_{std::move(replicator)},
        update_timeout_{update_timeout},
        peers_found_{std::make_shared<coro::AsyncEvent>()},
        log_{log::createLogger("Core", "store")} {
    peers_found_->set();
  }

  outcome::result<common::Buffer> MemoryCore::signable(
      const DiscoveryKey &discovery_key,
      uint64_t seq,
      common::BufferView payload) {
    return scale::encode(discovery_key, seq, payload);
  }

  outcome::result<uint64_t> MemoryCore::append(common::BufferView payload) {
    if (closed_) {
      return StoreError::CLOSED;
    }
    if (not key_pair_) {
      return StoreError::READ_ONLY;
    }
    auto seq = blocks_.size();
    OUTCOME_TRY(message, signable(discovery_key_, seq, payload));
    OUTCOME_TRY(signature, ed25519_provider_->sign(*key_pair_, message));
    push(SignedBlock{{payload.begin(), payload.end()}, signature});
    return seq;
  }

  std::optional<common::Buffer> MemoryCore::get(uint64_t seq) const {
    if (seq >= blocks_.size()) {
      return std::nullopt;
    }
    return blocks_[seq].payload;
  }

  CoroOutcome<bool> MemoryCore::update() {
    if (closed_) {
      co_return StoreError::CLOSED;
    }
    if (writable()) {
      co_return false;
    }
    auto self = shared_from_this();
    auto replicator = replicator_.lock();
    if (not replicator) {
      co_return false;
    }
    const auto before = blocks_.size();
    const auto deadline = coro::AsyncEvent::Clock::now() + update_timeout_;

    if (finding_peers_ != 0 and not replicator->hasPeers()) {
      SL_TRACE(log_, "Update of {} waits for peers", discovery_key_);
      auto found = peers_found_;
      co_await found->waitFor(update_timeout_);
    }
    if (closed_) {
      co_return StoreError::CLOSED;
    }

    auto now = coro::AsyncEvent::Clock::now();
    if (now < deadline) {
      co_await replicator->requestUpdate(self, deadline - now);
    }
    SL_TRACE(log_,
             "Update of {}: length {} -> {}",
             discovery_key_,
             before,
             blocks_.size());
    co_return blocks_.size() != before;
  }

  Core::FindingPeersDone MemoryCore::findingPeers() {
    if (finding_peers_++ == 0) {
      peers_found_ = std::make_shared<coro::AsyncEvent>();
    }
    return [weak{weak_from_this()}, called{std::make_shared<bool>(false)}] {
      if (*called) {
        return;
      }
      *called = true;
      auto self = weak.lock();
      if (self and --self->finding_peers_ == 0) {
        self->peers_found_->set();
      }
    };
  }

  void MemoryCore::setKeyPair(const crypto::Ed25519Keypair &key_pair) {
    if (key_pair.public_key == key_) {
      key_pair_ = key_pair;
    }
  }

  outcome::result<size_t> MemoryCore::appendVerified(
      uint64_t start, const std::vector<SignedBlock> &blocks) {
    if (closed_) {
      return StoreError::CLOSED;
    }
    size_t appended = 0;
    for (size_t i = 0; i < blocks.size(); ++i) {
      auto seq = start + i;
      if (seq < blocks_.size()) {
        continue;
      }
      if (seq > blocks_.size()) {
        break;
      }
      const auto &block = blocks[i];
      OUTCOME_TRY(message, signable(discovery_key_, seq, block.payload));
      OUTCOME_TRY(valid,
                  ed25519_provider_->verify(block.signature, message, key_));
      if (not valid) {
        return StoreError::INVALID_SIGNATURE;
      }
      push(block);
      ++appended;
    }
    return appended;
  }

  std::vector<SignedBlock> MemoryCore::blocks(uint64_t from) const {
    if (from >= blocks_.size()) {
      return {};
    }
    return {blocks_.begin() + static_cast<std::ptrdiff_t>(from),
            blocks_.end()};
  }

  void MemoryCore::close() {
    if (closed_) {
      return;
    }
    closed_ = true;
    on_append_.disconnect_all_slots();
    peers_found_->set();
    SL_DEBUG(log_, "Core {} closed", discovery_key_);
  }

  void MemoryCore::push(SignedBlock block) {
    blocks_.emplace_back(std::move(block));
    auto seq = blocks_.size() - 1;
    on_append_(seq, blocks_.back());
  }

}  // namespace slashtags::store
