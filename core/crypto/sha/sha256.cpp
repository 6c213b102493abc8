/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace slashtags::crypto {
  common::Hash256 sha256(std::string_view input) {
    return sha256(common::str2byte(input));
  }

  common::Hash256 sha256(std::span<const uint8_t> input) {
    common::Hash256 out;
    unsigned int len = out.size();
    EVP_Digest(
        input.data(), input.size(), out.data(), &len, EVP_sha256(), nullptr);
    return out;
  }

  common::Hash256 hmacSha256(common::BufferView key, common::BufferView input) {
    common::Hash256 out;
    unsigned int len = out.size();
    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         input.data(),
         input.size(),
         out.data(),
         &len);
    return out;
  }
}  // namespace slashtags::crypto
