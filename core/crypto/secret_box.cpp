/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secret_box.hpp"

#include <openssl/evp.h>

#include "crypto/crypto_error.hpp"

namespace slashtags::crypto {

  namespace {
    using CipherCtxPtr =
        std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

    constexpr size_t kNonceSize = 12;

    std::array<uint8_t, kNonceSize> makeNonce(uint64_t counter) {
      std::array<uint8_t, kNonceSize> nonce{};
      for (size_t i = 0; i < sizeof(counter); ++i) {
        nonce[i] = static_cast<uint8_t>(counter >> (8 * i));
      }
      return nonce;
    }
  }  // namespace

  outcome::result<common::Buffer> SecretBox::seal(
      uint64_t nonce, common::BufferView plaintext) const {
    CipherCtxPtr ctx{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
    auto iv = makeNonce(nonce);
    if (ctx == nullptr
        or EVP_EncryptInit_ex(ctx.get(),
                              EVP_chacha20_poly1305(),
                              nullptr,
                              key_.data(),
                              iv.data())
               != 1) {
      return CryptoError::ENCRYPTION_FAILED;
    }

    common::Buffer out(plaintext.size() + kTagSize);
    int len = 0;
    if (not plaintext.empty()
        and EVP_EncryptUpdate(ctx.get(),
                              out.data(),
                              &len,
                              plaintext.data(),
                              static_cast<int>(plaintext.size()))
                != 1) {
      return CryptoError::ENCRYPTION_FAILED;
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1
        or EVP_CIPHER_CTX_ctrl(ctx.get(),
                               EVP_CTRL_AEAD_GET_TAG,
                               kTagSize,
                               out.data() + plaintext.size())
               != 1) {
      return CryptoError::ENCRYPTION_FAILED;
    }
    return out;
  }

  outcome::result<common::Buffer> SecretBox::open(
      uint64_t nonce, common::BufferView sealed) const {
    if (sealed.size() < kTagSize) {
      return CryptoError::DECRYPTION_FAILED;
    }
    auto ciphertext = sealed.first(sealed.size() - kTagSize);
    common::Blob<kTagSize> tag;
    std::copy(sealed.begin() + ciphertext.size(), sealed.end(), tag.begin());

    CipherCtxPtr ctx{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
    auto iv = makeNonce(nonce);
    if (ctx == nullptr
        or EVP_DecryptInit_ex(ctx.get(),
                              EVP_chacha20_poly1305(),
                              nullptr,
                              key_.data(),
                              iv.data())
               != 1) {
      return CryptoError::DECRYPTION_FAILED;
    }

    common::Buffer out(ciphertext.size());
    int len = 0;
    if (not ciphertext.empty()
        and EVP_DecryptUpdate(ctx.get(),
                              out.data(),
                              &len,
                              ciphertext.data(),
                              static_cast<int>(ciphertext.size()))
                != 1) {
      return CryptoError::DECRYPTION_FAILED;
    }
    int final_len = 0;
    if (EVP_CIPHER_CTX_ctrl(
            ctx.get(), EVP_CTRL_AEAD_SET_TAG, kTagSize, tag.data())
            != 1
        or EVP_DecryptFinal_ex(ctx.get(), out.data() + len, &final_len)
               != 1) {
      return CryptoError::DECRYPTION_FAILED;
    }
    return out;
  }

}  // namespace slashtags::crypto
