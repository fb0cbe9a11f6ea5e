/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "report/cooldown.hpp"

#include <algorithm>

#include "tracking/iso_instant.hpp"

namespace tally::report {
  using std::chrono::seconds;

  outcome::result<seconds> remainingCooldown(
      std::optional<std::string_view> last_run,
      seconds cooldown,
      tracking::Instant now) {
    if (cooldown <= seconds::zero()) {
      return seconds::zero();
    }
    if (not last_run.has_value() or last_run->empty()) {
      return seconds::zero();
    }
    OUTCOME_TRY(last_run_at,
                tracking::parseIsoInstant(*last_run, tracking::NaiveAs::Utc));
    // whole seconds, truncated toward zero
    const auto elapsed =
        std::chrono::duration_cast<seconds>(now - last_run_at);
    return std::max(seconds::zero(),
                    std::min(cooldown, kMaxReportCooldown) - elapsed);
  }

}  // namespace tally::report
