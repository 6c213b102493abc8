/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/target.hpp"

#include "common/visitor.hpp"
#include "common/zbase32.hpp"

namespace slashtags::identity {

  outcome::result<network::PublicKey> resolveTarget(const Target &target) {
    return visit_in_place(
        target,
        [](const network::PublicKey &key) -> outcome::result<network::PublicKey> {
          return key;
        },
        [](const SlashURL &url) -> outcome::result<network::PublicKey> {
          return url.key();
        },
        [](const std::string &str) -> outcome::result<network::PublicKey> {
          if (str.starts_with("slash")) {
            OUTCOME_TRY(url, SlashURL::parse(str));
            return url.key();
          }
          auto bytes = common::zbase32Decode(str);
          if (bytes.has_error()) {
            return SlashUrlError::INVALID_KEY;
          }
          auto key = network::PublicKey::fromSpan(bytes.value());
          if (key.has_error()) {
            return SlashUrlError::INVALID_KEY;
          }
          return key.value();
        });
  }

}  // namespace slashtags::identity
