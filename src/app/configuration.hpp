/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <utils/ctor_limiters.hpp>

namespace tally::app {
  class Configuration : Singleton<Configuration> {
   public:
    struct DatabaseConfig {
      std::filesystem::path directory = "db";
      size_t cache_size = 1 << 29;  // 512MiB
    };

    struct TrackingConfig {
      std::string timezone;
      std::string channel = "tracked-channel";
      std::chrono::seconds report_cooldown{3600};
      std::chrono::seconds tick_interval{30};
      /// Users present at startup, given on the command line
      std::optional<std::vector<std::string>> present;
    };

    /// user id -> display name
    using Members = std::map<std::string, std::string>;

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;

    [[nodiscard]] virtual const DatabaseConfig &database() const;

    [[nodiscard]] virtual const TrackingConfig &tracking() const;

    [[nodiscard]] virtual const Members &members() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path base_path_;

    DatabaseConfig database_;
    TrackingConfig tracking_;
    Members members_;
  };

}  // namespace tally::app
