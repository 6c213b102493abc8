/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519/ed25519_provider_impl.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include "crypto/crypto_error.hpp"
#include "crypto/random.hpp"

namespace slashtags::crypto {

  namespace {
    using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    PkeyPtr privateKeyFromSeed(const Ed25519Seed &seed) {
      return {EVP_PKEY_new_raw_private_key(
                  EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
              EVP_PKEY_free};
    }

    std::string lastOpensslError() {
      std::array<char, 256> buf{};
      ERR_error_string_n(ERR_get_error(), buf.data(), buf.size());
      return buf.data();
    }
  }  // namespace

  Ed25519ProviderImpl::Ed25519ProviderImpl()
      : logger_{log::createLogger("Ed25519Provider", "crypto")} {}

  outcome::result<Ed25519Keypair> Ed25519ProviderImpl::generateKeypair()
      const {
    OUTCOME_TRY(seed, randomBytes<Ed25519Seed::size()>());
    return generateKeypair(Ed25519Seed{seed});
  }

  outcome::result<Ed25519Keypair> Ed25519ProviderImpl::generateKeypair(
      const Ed25519Seed &seed) const {
    auto pkey = privateKeyFromSeed(seed);
    if (pkey == nullptr) {
      SL_ERROR(logger_, "Can't create ed25519 key: {}", lastOpensslError());
      return CryptoError::KEY_GENERATION_FAILED;
    }

    Ed25519Keypair kp;
    size_t len = kp.public_key.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), kp.public_key.data(), &len)
            != 1
        or len != kp.public_key.size()) {
      SL_ERROR(
          logger_, "Can't get ed25519 public key: {}", lastOpensslError());
      return CryptoError::KEY_GENERATION_FAILED;
    }
    std::copy(seed.begin(), seed.end(), kp.secret_key.begin());
    std::copy(kp.public_key.begin(),
              kp.public_key.end(),
              kp.secret_key.begin() + seed.size());
    return kp;
  }

  outcome::result<Ed25519Signature> Ed25519ProviderImpl::sign(
      const Ed25519Keypair &keypair, common::BufferView message) const {
    auto pkey = privateKeyFromSeed(keypair.seed());
    MdCtxPtr ctx{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (pkey == nullptr or ctx == nullptr) {
      return CryptoError::SIGN_FAILED;
    }

    Ed25519Signature sig;
    size_t sig_len = sig.size();
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get())
            != 1
        or EVP_DigestSign(ctx.get(),
                          sig.data(),
                          &sig_len,
                          message.data(),
                          message.size())
               != 1) {
      SL_ERROR(logger_, "Error during ed25519 sign: {}", lastOpensslError());
      return CryptoError::SIGN_FAILED;
    }
    return sig;
  }

  outcome::result<bool> Ed25519ProviderImpl::verify(
      const Ed25519Signature &signature,
      common::BufferView message,
      const Ed25519PublicKey &public_key) const {
    PkeyPtr pkey{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519,
                                             nullptr,
                                             public_key.data(),
                                             public_key.size()),
                 EVP_PKEY_free};
    if (pkey == nullptr) {
      // not a point of the curve, so nothing can be signed by it
      SL_DEBUG(logger_, "Invalid ed25519 public key {}", public_key);
      return false;
    }
    MdCtxPtr ctx{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (ctx == nullptr
        or EVP_DigestVerifyInit(
               ctx.get(), nullptr, nullptr, nullptr, pkey.get())
               != 1) {
      SL_ERROR(logger_,
               "Error verifying a signature: {}",
               lastOpensslError());
      return CryptoError::VERIFICATION_FAILED;
    }
    auto res = EVP_DigestVerify(ctx.get(),
                                signature.data(),
                                signature.size(),
                                message.data(),
                                message.size());
    if (res == 1) {
      return true;
    }
    ERR_clear_error();
    return false;
  }

}  // namespace slashtags::crypto
