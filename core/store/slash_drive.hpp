/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "store/drive.hpp"

#include <map>
#include <memory>

#include "log/logger.hpp"
#include "store/corestore.hpp"

namespace slashtags::store {

  /// Single block of a drive core, absent value deletes the path
  struct DriveEntry {
    std::string path;
    std::optional<common::Buffer> value;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const DriveEntry &v) {
    return s << v.path << v.value;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, DriveEntry &v) {
    return s >> v.path >> v.value;
  }

  /**
   * Drive keeping an index of the latest entry of every path. Entries of
   * an encrypted drive are sealed with the block sequence number as nonce.
   */
  class SlashDrive : public Drive,
                     public std::enable_shared_from_this<SlashDrive> {
   public:
    SlashDrive(std::shared_ptr<Corestore> store, DriveOptions options);

    CoroOutcome<void> ready() override;

    const PublicKey &key() const override;

    const DiscoveryKey &discoveryKey() const override;

    bool encrypted() const override {
      return options_.encrypted;
    }

    bool writable() const override;

    const std::optional<crypto::SecretBoxKey> &encryptionKey() const override {
      return encryption_key_;
    }

    outcome::result<std::optional<common::Buffer>> get(
        std::string_view path) const override;

    outcome::result<void> put(std::string_view path,
                              common::BufferView content) override;

    outcome::result<void> del(std::string_view path) override;

    outcome::result<std::vector<std::string>> list(
        std::string_view prefix) const override;

    CoroOutcome<bool> update() override;

    Core::FindingPeersDone findingPeers() override;

    Coro<void> close() override;

    bool closed() const override {
      return closed_;
    }

    /// encryption key of a drive written with \param key_pair
    static crypto::SecretBoxKey deriveEncryptionKey(
        const crypto::Ed25519Keypair &key_pair);

   private:
    outcome::result<void> open();
    outcome::result<void> append(DriveEntry entry);
    outcome::result<DriveEntry> readEntry(uint64_t seq) const;
    void index(uint64_t seq);

    std::shared_ptr<Corestore> store_;
    DriveOptions options_;

    std::shared_ptr<Core> core_;
    PublicKey key_;
    DiscoveryKey discovery_key_;
    std::optional<crypto::SecretBoxKey> encryption_key_;
    // path -> sequence number of its latest entry
    std::map<std::string, uint64_t, std::less<>> index_;
    boost::signals2::scoped_connection append_subscription_;
    bool closed_ = false;

    log::Logger log_;
  };

}  // namespace slashtags::store
