/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace tally::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        database_{
            .directory = "db",
            .cache_size = 1 << 29,
        },
        tracking_{
            .timezone{},
            .channel = "tracked-channel",
            .report_cooldown = std::chrono::seconds{3600},
            .tick_interval = std::chrono::seconds{30},
            .present{},
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const Configuration::DatabaseConfig &Configuration::database() const {
    return database_;
  }

  const Configuration::TrackingConfig &Configuration::tracking() const {
    return tracking_;
  }

  const Configuration::Members &Configuration::members() const {
    return members_;
  }

}  // namespace tally::app
