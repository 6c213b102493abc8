/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "log/logger.hpp"
#include "network/types.hpp"
#include "outcome/outcome.hpp"
#include "store/types.hpp"

namespace slashtags::application {

  enum class ConfigError {
    FILE_NOT_FOUND = 1,
    PARSE_FAILED,
    INVALID_VALUE,
  };

  /**
   * JSON configuration:
   * @code
   * {
   *   "general": { "log": ["debug", "swarm=trace"] },
   *   "network": {
   *     "bootstrap": ["host:port"],
   *     "relays": ["..."],
   *     "connect-timeout-ms": 10000,
   *     "update-timeout-ms": 5000
   *   }
   * }
   * @nocode
   * Missing segments and fields keep their defaults.
   */
  class SlashtagsConfig {
   public:
    SlashtagsConfig();

    outcome::result<void> loadFromFile(const std::filesystem::path &path);

    outcome::result<void> loadFromString(std::string_view json);

    /// logging system tuning entries, see log::tuneLoggingSystem
    const std::vector<std::string> &log() const {
      return logger_tuning_config_;
    }

    const network::SwarmOptions &swarmOptions() const {
      return swarm_options_;
    }

    const store::CorestoreOptions &corestoreOptions() const {
      return corestore_options_;
    }

   private:
    using SegmentHandler =
        std::function<outcome::result<void>(const rapidjson::Value &)>;

    struct SegmentHandlers {
      const char *segment_name;
      SegmentHandler handler;
    };

    outcome::result<void> apply(const rapidjson::Document &document);

    outcome::result<void> parse_general_segment(const rapidjson::Value &val);
    outcome::result<void> parse_network_segment(const rapidjson::Value &val);

    static outcome::result<void> load_ms(const rapidjson::Value &val,
                                         const char *name,
                                         std::vector<std::string> &target);
    static outcome::result<void> load_millis(
        const rapidjson::Value &val,
        const char *name,
        std::chrono::milliseconds &target);

    std::vector<SegmentHandlers> handlers_;

    std::vector<std::string> logger_tuning_config_;
    network::SwarmOptions swarm_options_;
    store::CorestoreOptions corestore_options_;
    log::Logger logger_;
  };

}  // namespace slashtags::application

OUTCOME_HPP_DECLARE_ERROR(slashtags::application, ConfigError);
