/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "report/cooldown.hpp"
#include "tracking/local_calendar.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tally::app, Configurator::Error, e) {
  using E = tally::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown log::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    assert(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  /// Splits "a, b,c" into trimmed non-empty items
  std::vector<std::string> split_list(const std::string &value) {
    std::vector<std::string> items;
    boost::split(items, value, boost::is_any_of(","));
    for (auto &item : items) {
      boost::trim(item);
    }
    std::erase_if(items, [](const auto &item) { return item.empty(); });
    return items;
  }

  // Ticks must be denser than the midnight window, or one may skip it
  constexpr std::chrono::seconds kMinTickInterval{1};
  constexpr std::chrono::seconds kMaxTickInterval{30};

}  // namespace

namespace tally::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "noname";
    config_->base_path_ = std::filesystem::current_path();

    config_->database_.directory = "db";
    config_->database_.cache_size = 512 << 20;  // 512MiB

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of instance.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lstorage=off.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description tracking_options("Tracking options");
    tracking_options.add_options()
        ("timezone", po::value<std::string>(), "IANA timezone of local days, e.g. America/New_York. Required.")
        ("channel", po::value<std::string>(), "Name of the tracked channel shown in reports.")
        ("report-cooldown", po::value<std::string>(), "Global cooldown of report-now: 3600, 60m, 1h, etc.")
        ("tick-interval", po::value<std::string>(), "Period of midnight checks, 1s to 60s.")
        ("present", po::value<std::string>(), "Comma-separated ids of users present at startup. Without it the tracker waits for a snapshot line.")
        ;

    po::options_description storage_options("Storage options");
    storage_options.add_options()
        ("db_path", po::value<std::string>()->default_value(config_->database_.directory), "Path to DB directory. Can be relative on base path.")
        ("db_cache_size", po::value<std::string>(), "Limit the memory the database cache can use: 4096, 512Mb, 1G, etc.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(tracking_options)
        .add(storage_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;
    namespace fs = std::filesystem;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Tally version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      std::cout << "Presence feed (stdin), one per line:\n"
                   "  snapshot [<user_id>...] | join <user_id> | "
                   "leave <user_id>\n"
                   "  today | report-now | status | quit\n";
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Tally version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;
    namespace fs = std::filesystem;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: tally
        children:
          - name: tracking
            children:
              - name: session_engine
              - name: totals
          - name: storage
          - name: application
          - name: scheduler
          - name: presence
          - name: report
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initTrackingConfig());
    OUTCOME_TRY(initDatabaseConfig());
    OUTCOME_TRY(initMembersConfig());

    return config_;
  }

  outcome::result<void> Configurator::checkFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto name = section["name"];
          if (name.IsDefined()) {
            if (name.IsScalar()) {
              auto value = name.as<std::string>();
              config_->name_ = value;
            } else {
              file_errors_ << "E: Value 'general.name' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto base_path = section["base-path"];
          if (base_path.IsDefined()) {
            if (base_path.IsScalar()) {
              auto value = base_path.as<std::string>();
              config_->base_path_ = value;
            } else {
              file_errors_ << "E: Value 'general.base-path' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });

    // Check values
    if (not config_->base_path_.is_absolute()) {
      SL_ERROR(logger_,
               "The 'base_path' must be defined as absolute: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    current_path(config_->base_path_);

    return outcome::success();
  }

  outcome::result<void> Configurator::initTrackingConfig() {
    auto &tracking = config_->tracking_;

    std::optional<std::string> cooldown_text;
    std::optional<std::string> tick_text;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["tracking"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto timezone = section["timezone"];
          if (timezone.IsDefined()) {
            if (timezone.IsScalar()) {
              tracking.timezone = timezone.as<std::string>();
            } else {
              file_errors_ << "E: Value 'tracking.timezone' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto channel = section["channel"];
          if (channel.IsDefined()) {
            if (channel.IsScalar()) {
              tracking.channel = channel.as<std::string>();
            } else {
              file_errors_ << "E: Value 'tracking.channel' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto cooldown = section["report-cooldown"];
          if (cooldown.IsDefined()) {
            if (cooldown.IsScalar()) {
              cooldown_text = cooldown.as<std::string>();
            } else {
              file_errors_
                  << "E: Value 'tracking.report-cooldown' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto tick = section["tick-interval"];
          if (tick.IsDefined()) {
            if (tick.IsScalar()) {
              tick_text = tick.as<std::string>();
            } else {
              file_errors_
                  << "E: Value 'tracking.tick-interval' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto present = section["present"];
          if (present.IsDefined()) {
            if (present.IsSequence()) {
              std::vector<std::string> users;
              for (const auto &user : present) {
                users.emplace_back(user.as<std::string>());
              }
              tracking.present = std::move(users);
            } else {
              file_errors_ << "E: Value 'tracking.present' must be sequence\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'tracking' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "timezone", [&](const std::string &value) {
          tracking.timezone = value;
        });
    find_argument<std::string>(
        cli_values_map_, "channel", [&](const std::string &value) {
          tracking.channel = value;
        });
    find_argument<std::string>(
        cli_values_map_, "report-cooldown", [&](const std::string &value) {
          cooldown_text = value;
        });
    find_argument<std::string>(
        cli_values_map_, "tick-interval", [&](const std::string &value) {
          tick_text = value;
        });
    find_argument<std::string>(
        cli_values_map_, "present", [&](const std::string &value) {
          tracking.present = split_list(value);
        });

    // Check values
    boost::trim(tracking.timezone);
    if (tracking.timezone.empty()) {
      SL_ERROR(logger_, "The 'timezone' must be provided");
      return Error::InvalidValue;
    }
    if (auto calendar = tracking::LocalCalendar::create(tracking.timezone);
        calendar.has_error()) {
      SL_ERROR(logger_,
               "The 'timezone' is not a known IANA timezone: {}",
               tracking.timezone);
      return Error::InvalidValue;
    }

    if (cooldown_text.has_value()) {
      auto value = util::parseTimeDuration(*cooldown_text);
      if (not value.has_value() or *value == 0
          or *value > static_cast<uint64_t>(
                 report::kMaxReportCooldown.count())) {
        SL_ERROR(logger_,
                 "The 'report-cooldown' must be a positive duration "
                 "(3600, 60m, 1h, etc.) of at most {}s: {}",
                 report::kMaxReportCooldown.count(),
                 *cooldown_text);
        return Error::InvalidValue;
      }
      tracking.report_cooldown =
          std::chrono::seconds(static_cast<int64_t>(*value));
    }

    if (tick_text.has_value()) {
      auto value = util::parseTimeDuration(*tick_text);
      if (not value.has_value()
          or *value < static_cast<uint64_t>(kMinTickInterval.count())
          or *value > static_cast<uint64_t>(kMaxTickInterval.count())) {
        SL_ERROR(logger_,
                 "The 'tick-interval' must be between {}s and {}s: {}",
                 kMinTickInterval.count(),
                 kMaxTickInterval.count(),
                 *tick_text);
        return Error::InvalidValue;
      }
      tracking.tick_interval =
          std::chrono::seconds(static_cast<int64_t>(*value));
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initDatabaseConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["database"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto path = section["path"];
          if (path.IsDefined()) {
            if (path.IsScalar()) {
              auto value = path.as<std::string>();
              config_->database_.directory = value;
            } else {
              file_errors_ << "E: Value 'database.path' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto cache_size = section["cache_size"];
          if (cache_size.IsDefined()) {
            if (cache_size.IsScalar()) {
              auto value =
                  util::parseByteQuantity(cache_size.as<std::string>());
              if (value.has_value()) {
                config_->database_.cache_size = value.value();
              } else {
                file_errors_ << "E: Bad 'cache_size' value; "
                                "Expected: 4096, 512Mb, 1G, etc.\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'database.cache_size' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'database' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    bool fail;

    fail = false;
    find_argument<std::string>(
        cli_values_map_, "db_path", [&](const std::string &value) {
          config_->database_.directory = value;
        });
    find_argument<std::string>(
        cli_values_map_, "db_cache_size", [&](const std::string &value) {
          auto size = util::parseByteQuantity(value);
          if (size.has_value()) {
            config_->database_.cache_size = size.value();
          } else {
            std::cerr << "Option --db_cache_size has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    auto make_absolute = [&](const std::filesystem::path &path) {
      return weakly_canonical(config_->base_path_.is_absolute()
                                  ? path
                                  : (config_->base_path_ / path));
    };

    config_->database_.directory = make_absolute(config_->database_.directory);

    return outcome::success();
  }

  outcome::result<void> Configurator::initMembersConfig() {
    if (not config_file_.has_value()) {
      return outcome::success();
    }
    auto section = (*config_file_)["members"];
    if (not section.IsDefined()) {
      return outcome::success();
    }
    if (not section.IsMap()) {
      file_errors_ << "E: Section 'members' defined, but is not map\n";
      file_has_error_ = true;
    } else {
      for (const auto &member : section) {
        if (not member.second.IsScalar()) {
          file_errors_ << "E: Display name of member '"
                       << member.first.as<std::string>()
                       << "' must be scalar\n";
          file_has_error_ = true;
          continue;
        }
        config_->members_.insert_or_assign(member.first.as<std::string>(),
                                           member.second.as<std::string>());
      }
    }
    OUTCOME_TRY(checkFileErrors());
    SL_DEBUG(logger_, "{} member names configured", config_->members_.size());
    return outcome::success();
  }

}  // namespace tally::app
