/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string_view>

#include <qtils/outcome.hpp>

#include "tracking/types.hpp"

namespace tally::report {

  /// Longest cooldown accepted; longer ones are cut to it
  constexpr std::chrono::seconds kMaxReportCooldown = std::chrono::days{7};

  /**
   * Time left until a global cooldown started at `last_run` expires:
   * max(0, cooldown - elapsed). Zero when there was no run or the cooldown
   * is not positive. A stored timestamp without offset is read as UTC.
   * @return TrackingError::INVALID_TIMESTAMP for a malformed `last_run`
   */
  outcome::result<std::chrono::seconds> remainingCooldown(
      std::optional<std::string_view> last_run,
      std::chrono::seconds cooldown,
      tracking::Instant now);

}  // namespace tally::report
