/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/key_derivation.hpp"

#include <gtest/gtest.h>

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/sha/sha256.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace slashtags;
using namespace slashtags::crypto;

class KeyDerivationTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  Ed25519ProviderImpl provider;
  PrimaryKey primary = sha256("primary");
};

/**
 * @given primary key and name
 * @when derive the key pair twice
 * @then both derivations give the same key pair seeded by SHA-256(primary ||
 * name)
 */
TEST_F(KeyDerivationTest, Deterministic) {
  EXPECT_OUTCOME_TRUE(kp1, deriveKeyPair(provider, primary.view(), "contacts"));
  EXPECT_OUTCOME_TRUE(kp2, deriveKeyPair(provider, primary.view(), "contacts"));
  EXPECT_EQ(kp1, kp2);

  auto seed =
      sha256(common::concat(primary.view(), common::str2byte("contacts")));
  EXPECT_TRUE(std::equal(seed.begin(), seed.end(), kp1.seed().begin()));
}

/**
 * @given one primary key
 * @when derive key pairs for different names
 * @then public keys differ
 */
TEST_F(KeyDerivationTest, NamesAreUnlinkable) {
  EXPECT_OUTCOME_TRUE(root, deriveKeyPair(provider, primary.view()));
  EXPECT_OUTCOME_TRUE(named, deriveKeyPair(provider, primary.view(), "a"));
  EXPECT_NE(root.public_key, named.public_key);
}

/**
 * @given nothing
 * @when create two key pairs from random primary keys
 * @then they differ
 */
TEST_F(KeyDerivationTest, RandomKeyPairs) {
  EXPECT_OUTCOME_TRUE(kp1, createKeyPair(provider));
  EXPECT_OUTCOME_TRUE(kp2, createKeyPair(provider));
  EXPECT_NE(kp1.public_key, kp2.public_key);
}

/**
 * @given public key
 * @when compute its discovery key
 * @then it is stable and does not equal the key itself
 */
TEST_F(KeyDerivationTest, DiscoveryKey) {
  EXPECT_OUTCOME_TRUE(kp, deriveKeyPair(provider, primary.view()));
  auto dk = discoveryKey(kp.public_key);
  EXPECT_EQ(dk, discoveryKey(kp.public_key));
  EXPECT_FALSE(std::equal(dk.begin(), dk.end(), kp.public_key.begin()));
}
