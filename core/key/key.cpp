/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/key.hpp"

#include <iostream>

#include <boost/assert.hpp>

#include "common/hexutil.hpp"
#include "crypto/key_derivation.hpp"
#include "crypto/random.hpp"
#include "identity/slash_url.hpp"

namespace slashtags::key {

  Key::Key(std::shared_ptr<crypto::Ed25519Provider> ed_crypto_provider)
      : ed_crypto_provider_{std::move(ed_crypto_provider)} {
    BOOST_ASSERT(ed_crypto_provider_ != nullptr);
  }

  outcome::result<KeyReport> Key::generate(
      const std::optional<common::Buffer> &primary_key,
      std::string_view name) const {
    common::Buffer primary;
    if (primary_key) {
      primary = *primary_key;
    } else {
      OUTCOME_TRY(random, crypto::randomBytes<crypto::kPrimaryKeySize>());
      primary.assign(random.begin(), random.end());
    }
    OUTCOME_TRY(key_pair,
                crypto::deriveKeyPair(*ed_crypto_provider_, primary, name));

    identity::SlashURL url{key_pair.public_key};
    return KeyReport{
        .key_pair = key_pair,
        .id = url.id(),
        .url = url.toString(),
    };
  }

  outcome::result<void> Key::run(
      const std::optional<common::Buffer> &primary_key,
      std::string_view name) const {
    OUTCOME_TRY(report, generate(primary_key, name));
    std::cerr << report.url << std::endl;
    std::cout << common::hex_lower(report.key_pair.secret_key.view()) << std::endl;
    return outcome::success();
  }

}  // namespace slashtags::key
