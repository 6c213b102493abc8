/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <gtest/gtest.h>

using slashtags::common::str2byte;
using slashtags::crypto::hmacSha256;
using slashtags::crypto::sha256;

/**
 * @given well known inputs
 * @when hash them with SHA-256
 * @then digests match the published ones
 */
TEST(Sha256Test, KnownDigests) {
  EXPECT_EQ(
      sha256("").toHex(),
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(
      sha256("abc").toHex(),
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(sha256(str2byte("abc")), sha256("abc"));
}

/**
 * @given key and data of RFC 4231 test case 2
 * @when compute HMAC-SHA-256
 * @then it matches the published value
 */
TEST(Sha256Test, Hmac) {
  EXPECT_EQ(
      hmacSha256(str2byte("Jefe"), str2byte("what do ya want for nothing?"))
          .toHex(),
      "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}
