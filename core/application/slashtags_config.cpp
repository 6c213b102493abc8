/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/slashtags_config.hpp"

#include <array>
#include <cstdio>
#include <memory>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

OUTCOME_CPP_DEFINE_CATEGORY(slashtags::application, ConfigError, e) {
  using E = slashtags::application::ConfigError;
  switch (e) {
    case E::FILE_NOT_FOUND:
      return "Configuration file can not be opened";
    case E::PARSE_FAILED:
      return "Configuration is not a valid JSON document";
    case E::INVALID_VALUE:
      return "Configuration field has a wrong type";
  }
  return "Unknown ConfigError";
}

namespace slashtags::application {

  SlashtagsConfig::SlashtagsConfig()
      : logger_{log::createLogger("SlashtagsConfig", "config")} {
    handlers_ = {
        SegmentHandlers{
            "general",
            [this](const rapidjson::Value &val) {
              return parse_general_segment(val);
            },
        },
        SegmentHandlers{
            "network",
            [this](const rapidjson::Value &val) {
              return parse_network_segment(val);
            },
        },
    };
  }

  outcome::result<void> SlashtagsConfig::loadFromFile(
      const std::filesystem::path &path) {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;
    FilePtr file{std::fopen(path.c_str(), "r"), &std::fclose};
    if (not file) {
      SL_ERROR(logger_, "Configuration file path is invalid: {}", path.string());
      return ConfigError::FILE_NOT_FOUND;
    }

    std::array<char, 1024> buffer{};
    rapidjson::FileReadStream input_stream(
        file.get(), buffer.data(), buffer.size());

    rapidjson::Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               path.string(),
               rapidjson::GetParseError_En(document.GetParseError()));
      return ConfigError::PARSE_FAILED;
    }
    return apply(document);
  }

  outcome::result<void> SlashtagsConfig::loadFromString(std::string_view json) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration parse failed with error {}",
               rapidjson::GetParseError_En(document.GetParseError()));
      return ConfigError::PARSE_FAILED;
    }
    return apply(document);
  }

  outcome::result<void> SlashtagsConfig::apply(
      const rapidjson::Document &document) {
    if (not document.IsObject()) {
      return ConfigError::INVALID_VALUE;
    }
    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it) {
        if (not it->value.IsObject()) {
          SL_ERROR(logger_, "Segment {} is not an object", handler.segment_name);
          return ConfigError::INVALID_VALUE;
        }
        OUTCOME_TRY(handler.handler(it->value));
      }
    }
    return outcome::success();
  }

  outcome::result<void> SlashtagsConfig::parse_general_segment(
      const rapidjson::Value &val) {
    return load_ms(val, "log", logger_tuning_config_);
  }

  outcome::result<void> SlashtagsConfig::parse_network_segment(
      const rapidjson::Value &val) {
    OUTCOME_TRY(load_ms(val, "bootstrap", swarm_options_.bootstrap));
    OUTCOME_TRY(load_ms(val, "relays", swarm_options_.relays));
    OUTCOME_TRY(
        load_millis(val, "connect-timeout-ms", swarm_options_.connect_timeout));
    OUTCOME_TRY(load_millis(
        val, "update-timeout-ms", corestore_options_.update_timeout));
    return outcome::success();
  }

  outcome::result<void> SlashtagsConfig::load_ms(
      const rapidjson::Value &val,
      const char *name,
      std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return outcome::success();
    }
    if (not m->value.IsArray()) {
      return ConfigError::INVALID_VALUE;
    }
    std::vector<std::string> values;
    for (auto &v : m->value.GetArray()) {
      if (not v.IsString()) {
        return ConfigError::INVALID_VALUE;
      }
      values.emplace_back(v.GetString(), v.GetStringLength());
    }
    target = std::move(values);
    return outcome::success();
  }

  outcome::result<void> SlashtagsConfig::load_millis(
      const rapidjson::Value &val,
      const char *name,
      std::chrono::milliseconds &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return outcome::success();
    }
    if (not m->value.IsUint64()) {
      return ConfigError::INVALID_VALUE;
    }
    target = std::chrono::milliseconds(m->value.GetUint64());
    return outcome::success();
  }

}  // namespace slashtags::application
