/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "outcome/outcome.hpp"

namespace slashtags::crypto {

  using SecretBoxKey = common::Blob<32>;

  /**
   * ChaCha20-Poly1305 authenticated encryption with a counter nonce.
   * Every (key, nonce) pair must seal a single plaintext.
   */
  class SecretBox {
   public:
    static constexpr size_t kTagSize = 16;

    explicit SecretBox(const SecretBoxKey &key) : key_{key} {}

    /// @return ciphertext followed by authentication tag
    outcome::result<common::Buffer> seal(uint64_t nonce,
                                         common::BufferView plaintext) const;

    outcome::result<common::Buffer> open(uint64_t nonce,
                                         common::BufferView sealed) const;

   private:
    SecretBoxKey key_;
  };

}  // namespace slashtags::crypto
