/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "store/slash_drive.hpp"

#include "crypto/sha/sha256.hpp"
#include "scale/scale.hpp"
#include "store/store_error.hpp"

namespace slashtags::store {

  SlashDrive::SlashDrive(std::shared_ptr<Corestore> store,
                         DriveOptions options)
      : store_{std::move(store)},
        options_{std::move(options)},
        log_{log::createLogger("SlashDrive", "drive")} {}

  crypto::SecretBoxKey SlashDrive::deriveEncryptionKey(
      const crypto::Ed25519Keypair &key_pair) {
    auto seed = key_pair.seed();
    return crypto::hmacSha256(seed.view(),
                              common::str2byte("slashtags/encryption"));
  }

  CoroOutcome<void> SlashDrive::ready() {
    if (closed_) {
      co_return DriveError::CLOSED;
    }
    if (core_) {
      co_return outcome::success();
    }
    co_return open();
  }

  outcome::result<void> SlashDrive::open() {
    OUTCOME_TRY(core,
                store_->get(CoreOptions{
                    .key_pair = options_.key_pair,
                    .name = options_.name,
                    .key = options_.key,
                }));

    if (options_.encrypted) {
      if (options_.encryption_key) {
        encryption_key_ = options_.encryption_key;
      } else if (core->keyPair()) {
        encryption_key_ = deriveEncryptionKey(*core->keyPair());
      } else {
        return DriveError::MISSING_ENCRYPTION_KEY;
      }
    }

    core_ = std::move(core);
    key_ = core_->key();
    discovery_key_ = core_->discoveryKey();
    for (uint64_t seq = 0; seq < core_->length(); ++seq) {
      index(seq);
    }
    append_subscription_ = core_->onAppend(
        [weak{weak_from_this()}](uint64_t seq, const SignedBlock &) {
          if (auto self = weak.lock()) {
            self->index(seq);
          }
        });
    SL_DEBUG(log_,
             "Drive {} ready, {} paths, writable: {}, encrypted: {}",
             key_,
             index_.size(),
             core_->writable(),
             options_.encrypted);
    return outcome::success();
  }

  const PublicKey &SlashDrive::key() const {
    return key_;
  }

  const DiscoveryKey &SlashDrive::discoveryKey() const {
    return discovery_key_;
  }

  bool SlashDrive::writable() const {
    return core_ and core_->writable();
  }

  outcome::result<std::optional<common::Buffer>> SlashDrive::get(
      std::string_view path) const {
    if (closed_) {
      return DriveError::CLOSED;
    }
    if (not core_) {
      return DriveError::NOT_READY;
    }
    auto it = index_.find(path);
    if (it == index_.end()) {
      return std::nullopt;
    }
    OUTCOME_TRY(entry, readEntry(it->second));
    return std::move(entry.value);
  }

  outcome::result<void> SlashDrive::put(std::string_view path,
                                        common::BufferView content) {
    return append(DriveEntry{
        std::string{path},
        common::Buffer{content.begin(), content.end()},
    });
  }

  outcome::result<void> SlashDrive::del(std::string_view path) {
    if (core_ and not index_.contains(path)) {
      return outcome::success();
    }
    return append(DriveEntry{std::string{path}, std::nullopt});
  }

  outcome::result<std::vector<std::string>> SlashDrive::list(
      std::string_view prefix) const {
    if (closed_) {
      return DriveError::CLOSED;
    }
    if (not core_) {
      return DriveError::NOT_READY;
    }
    std::vector<std::string> paths;
    for (auto it = index_.lower_bound(prefix);
         it != index_.end() and it->first.starts_with(prefix);
         ++it) {
      paths.push_back(it->first);
    }
    return paths;
  }

  CoroOutcome<bool> SlashDrive::update() {
    if (closed_) {
      co_return DriveError::CLOSED;
    }
    if (not core_) {
      co_return DriveError::NOT_READY;
    }
    auto core = core_;
    co_return co_await core->update();
  }

  Core::FindingPeersDone SlashDrive::findingPeers() {
    if (not core_ or closed_) {
      return [] {};
    }
    return core_->findingPeers();
  }

  Coro<void> SlashDrive::close() {
    if (closed_) {
      co_return;
    }
    closed_ = true;
    append_subscription_.disconnect();
    if (core_) {
      store_->release(core_);
    }
    SL_DEBUG(log_, "Drive {} closed", key_);
    co_return;
  }

  outcome::result<void> SlashDrive::append(DriveEntry entry) {
    if (closed_) {
      return DriveError::CLOSED;
    }
    if (not core_) {
      return DriveError::NOT_READY;
    }
    if (not core_->writable()) {
      return DriveError::READ_ONLY;
    }
    OUTCOME_TRY(block, scale::encode(entry));
    if (encryption_key_) {
      OUTCOME_TRY(sealed,
                  crypto::SecretBox{*encryption_key_}.seal(core_->length(),
                                                           block));
      block = std::move(sealed);
    }
    OUTCOME_TRY(seq, core_->append(block));
    SL_TRACE(log_,
             "Drive {}: {} {} at {}",
             key_,
             entry.value ? "put" : "del",
             entry.path,
             seq);
    return outcome::success();
  }

  outcome::result<DriveEntry> SlashDrive::readEntry(uint64_t seq) const {
    auto block = core_->get(seq);
    if (not block) {
      return DriveError::INVALID_ENTRY;
    }
    if (encryption_key_) {
      OUTCOME_TRY(opened,
                  crypto::SecretBox{*encryption_key_}.open(seq, *block));
      return scale::decode<DriveEntry>(opened);
    }
    return scale::decode<DriveEntry>(*block);
  }

  void SlashDrive::index(uint64_t seq) {
    auto entry = readEntry(seq);
    if (entry.has_error()) {
      SL_WARN(log_,
              "Drive {}: block {} is not a readable entry: {}",
              key_,
              seq,
              entry.error());
      return;
    }
    if (entry.value().value) {
      index_.insert_or_assign(std::move(entry.value().path), seq);
    } else {
      index_.erase(entry.value().path);
    }
  }

}  // namespace slashtags::store
