/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tracking/types.hpp"

namespace tally::app {

  namespace feed {
    /// Users present in the channel right now
    struct Snapshot {
      std::vector<tracking::UserId> users;
      bool operator==(const Snapshot &) const = default;
    };
    struct Join {
      tracking::UserId user_id;
      bool operator==(const Join &) const = default;
    };
    struct Leave {
      tracking::UserId user_id;
      bool operator==(const Leave &) const = default;
    };
    struct Today {
      bool operator==(const Today &) const = default;
    };
    struct ReportNow {
      bool operator==(const ReportNow &) const = default;
    };
    struct Status {
      bool operator==(const Status &) const = default;
    };
    struct Quit {
      bool operator==(const Quit &) const = default;
    };
  }  // namespace feed

  using FeedCommand = std::variant<feed::Snapshot,
                                   feed::Join,
                                   feed::Leave,
                                   feed::Today,
                                   feed::ReportNow,
                                   feed::Status,
                                   feed::Quit>;

  /**
   * Parses one line of the presence feed:
   * `snapshot [<user_id>...]`, `join <user_id>`, `leave <user_id>`,
   * `today`, `report-now`, `status`, `quit`.
   * Words are separated by whitespace; blank lines and lines starting with
   * `#` yield nothing.
   * @return nullopt for blank, comment and malformed lines
   */
  std::optional<FeedCommand> parseFeedLine(std::string_view line);

}  // namespace tally::app
