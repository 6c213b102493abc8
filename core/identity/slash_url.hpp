/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "crypto/ed25519_types.hpp"
#include "outcome/outcome.hpp"

namespace slashtags::identity {

  enum class SlashUrlError {
    INVALID_PROTOCOL = 1,
    INVALID_KEY,
  };

  /**
   * Canonical, shareable address of a slashtag:
   * `slash:<z-base-32 public key>[/path][?query][#fragment]`.
   * Fragment keeps parameters which are not meant for the server side,
   * e.g. `#encryptionKey=<z-base-32>` of a private drive.
   */
  class SlashURL {
   public:
    static constexpr std::string_view kProtocol = "slash:";

    explicit SlashURL(crypto::Ed25519PublicKey key,
                      std::string path = {},
                      std::string query = {},
                      std::string fragment = {});

    /**
     * Parses both `slash:<key>` and legacy `slash://<key>` forms
     */
    static outcome::result<SlashURL> parse(std::string_view url);

    static std::string format(const crypto::Ed25519PublicKey &key,
                              std::string_view path = {},
                              std::string_view query = {},
                              std::string_view fragment = {});

    const crypto::Ed25519PublicKey &key() const {
      return key_;
    }

    /// z-base-32 encoded key
    std::string id() const;

    const std::string &path() const {
      return path_;
    }

    const std::string &query() const {
      return query_;
    }

    const std::string &fragment() const {
      return fragment_;
    }

    /**
     * @return value of `name=value` entry of the fragment
     */
    std::optional<std::string> privateParam(std::string_view name) const;

    std::string toString() const;

    bool operator==(const SlashURL &other) const = default;

   private:
    crypto::Ed25519PublicKey key_;
    std::string path_;
    std::string query_;
    std::string fragment_;
  };

}  // namespace slashtags::identity

OUTCOME_HPP_DECLARE_ERROR(slashtags::identity, SlashUrlError);
