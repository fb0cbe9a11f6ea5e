/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace tally::tracking {

  /// Absolute (UTC) instant with millisecond precision
  using Instant = std::chrono::sys_time<std::chrono::milliseconds>;

  /// Opaque identifier of a tracked user
  using UserId = std::string;

  /// Local calendar date formatted as YYYY-MM-DD
  using DayKey = std::string;

  /// Accumulated seconds per user
  using Totals = std::map<UserId, uint64_t>;

  /**
   * Presence time accrued by a user but not yet credited to any day.
   */
  struct OpenSession {
    UserId user_id;
    Instant started_at;

    bool operator==(const OpenSession &) const = default;
  };

  /**
   * Seconds of closed presence attributed to a local day.
   */
  struct DailyTotal {
    DayKey day_key;
    UserId user_id;
    uint64_t seconds = 0;

    bool operator==(const DailyTotal &) const = default;
  };

  /**
   * Part of an interval that falls into one local day.
   */
  struct DayChunk {
    DayKey day_key;
    uint64_t seconds = 0;

    bool operator==(const DayChunk &) const = default;
  };

}  // namespace tally::tracking
