/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "report/format.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace tally::report {

  std::string formatSeconds(int64_t total_seconds) {
    const auto safe = std::max<int64_t>(0, total_seconds);
    return fmt::format(
        "{:02}:{:02}:{:02}", safe / 3600, (safe % 3600) / 60, safe % 60);
  }

}  // namespace tally::report
