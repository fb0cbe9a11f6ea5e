/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

namespace tally::app {

  /// Local day whose midnight report was delivered last
  constexpr std::string_view kLastAutoReportDay = "last_auto_report_day";

  /// UTC instant of the last delivered manual report; starts the cooldown
  constexpr std::string_view kLastManualReportAt = "last_manual_report_at_utc";

}  // namespace tally::app
