/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

namespace tally::report {

  /// "HH:MM:SS"; negative input renders as 00:00:00, hours are not wrapped
  std::string formatSeconds(int64_t total_seconds);

}  // namespace tally::report
