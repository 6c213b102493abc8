/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519/ed25519_provider_impl.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using slashtags::common::Buffer;
using namespace slashtags::crypto;

class Ed25519ProviderTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ed25519_provider = std::make_shared<Ed25519ProviderImpl>();
  }

  std::string_view hex_seed =
      "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
  std::string_view hex_public_key =
      "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
  Buffer message = Buffer{1, 2, 3, 4, 5};

  std::shared_ptr<Ed25519Provider> ed25519_provider;
};

/**
 * @given seed from RFC 8032 test vector 1
 * @when generate key pair from it and sign the empty message
 * @then public key and signature match the test vector
 */
TEST_F(Ed25519ProviderTest, Rfc8032Vector) {
  EXPECT_OUTCOME_TRUE(seed, Ed25519Seed::fromHex(hex_seed));
  EXPECT_OUTCOME_TRUE(kp, ed25519_provider->generateKeypair(seed));
  EXPECT_EQ(kp.public_key.toHex(), hex_public_key);
  EXPECT_EQ(kp.seed(), seed);

  EXPECT_OUTCOME_TRUE(signature, ed25519_provider->sign(kp, Buffer{}));
  EXPECT_EQ(signature.toHex(),
            "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901"
            "555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a"
            "100b");
}

/**
 * @given randomly generated key pair
 * @when sign a message and verify the signature
 * @then verification succeeds
 */
TEST_F(Ed25519ProviderTest, SignVerifySuccess) {
  EXPECT_OUTCOME_TRUE(kp, ed25519_provider->generateKeypair());
  EXPECT_OUTCOME_TRUE(signature, ed25519_provider->sign(kp, message));
  EXPECT_OUTCOME_TRUE(res,
                      ed25519_provider->verify(signature, message, kp.public_key));
  ASSERT_TRUE(res);
}

/**
 * @given two different key pairs
 * @when sign a message with the first and verify with the second public key
 * @then verification fails
 */
TEST_F(Ed25519ProviderTest, VerifyWrongKeyFail) {
  EXPECT_OUTCOME_TRUE(kp1, ed25519_provider->generateKeypair());
  EXPECT_OUTCOME_TRUE(kp2, ed25519_provider->generateKeypair());
  EXPECT_OUTCOME_TRUE(signature, ed25519_provider->sign(kp1, message));
  EXPECT_OUTCOME_TRUE(
      res, ed25519_provider->verify(signature, message, kp2.public_key));
  ASSERT_FALSE(res);
}

/**
 * @given signature of a message
 * @when verify it against a tampered message
 * @then verification fails
 */
TEST_F(Ed25519ProviderTest, VerifyTamperedMessageFail) {
  EXPECT_OUTCOME_TRUE(kp, ed25519_provider->generateKeypair());
  EXPECT_OUTCOME_TRUE(signature, ed25519_provider->sign(kp, message));
  auto tampered = message;
  tampered.back() ^= 1;
  EXPECT_OUTCOME_TRUE(
      res, ed25519_provider->verify(signature, tampered, kp.public_key));
  ASSERT_FALSE(res);
}
