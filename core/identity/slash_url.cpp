/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/slash_url.hpp"

#include <boost/algorithm/string/split.hpp>

#include "common/zbase32.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::identity, SlashUrlError, e) {
  using E = slashtags::identity::SlashUrlError;
  switch (e) {
    case E::INVALID_PROTOCOL:
      return "URL protocol must be 'slash:'";
    case E::INVALID_KEY:
      return "URL does not contain a valid z-base-32 encoded public key";
  }
  return "Unknown SlashUrlError";
}

namespace slashtags::identity {

  SlashURL::SlashURL(crypto::Ed25519PublicKey key,
                     std::string path,
                     std::string query,
                     std::string fragment)
      : key_{key},
        path_{std::move(path)},
        query_{std::move(query)},
        fragment_{std::move(fragment)} {}

  outcome::result<SlashURL> SlashURL::parse(std::string_view url) {
    if (not url.starts_with(kProtocol)) {
      return SlashUrlError::INVALID_PROTOCOL;
    }
    url.remove_prefix(kProtocol.size());
    if (url.starts_with("//")) {
      url.remove_prefix(2);
    }

    auto take_until = [&url](std::string_view stops) {
      auto pos = std::min(url.find_first_of(stops), url.size());
      auto part = url.substr(0, pos);
      url.remove_prefix(pos);
      return part;
    };

    auto id = take_until("/?#");
    std::string path{take_until("?#")};
    std::string query;
    if (url.starts_with('?')) {
      url.remove_prefix(1);
      query = take_until("#");
    }
    std::string fragment;
    if (url.starts_with('#')) {
      fragment = url.substr(1);
    }

    auto bytes_res = common::zbase32Decode(id);
    if (bytes_res.has_error()) {
      return SlashUrlError::INVALID_KEY;
    }
    auto key_res = crypto::Ed25519PublicKey::fromSpan(bytes_res.value());
    if (key_res.has_error()) {
      return SlashUrlError::INVALID_KEY;
    }

    return SlashURL{key_res.value(),
                    std::move(path),
                    std::move(query),
                    std::move(fragment)};
  }

  std::string SlashURL::format(const crypto::Ed25519PublicKey &key,
                               std::string_view path,
                               std::string_view query,
                               std::string_view fragment) {
    std::string out{kProtocol};
    out += common::zbase32Encode(key.view());
    if (not path.empty()) {
      if (not path.starts_with('/')) {
        out += '/';
      }
      out += path;
    }
    if (not query.empty()) {
      out += '?';
      out += query;
    }
    if (not fragment.empty()) {
      out += '#';
      out += fragment;
    }
    return out;
  }

  std::string SlashURL::id() const {
    return common::zbase32Encode(key_.view());
  }

  std::optional<std::string> SlashURL::privateParam(
      std::string_view name) const {
    std::vector<std::string> params;
    boost::algorithm::split(
        params, fragment_, [](char c) { return c == '&'; });
    for (auto &param : params) {
      auto eq = param.find('=');
      if (eq != std::string::npos and std::string_view{param}.substr(0, eq)
                                          == name) {
        return param.substr(eq + 1);
      }
    }
    return std::nullopt;
  }

  std::string SlashURL::toString() const {
    return format(key_, path_, query_, fragment_);
  }

}  // namespace slashtags::identity
