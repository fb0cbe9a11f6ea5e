/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tracking/interval_splitter.hpp"

#include <algorithm>

#include "tracking/local_calendar.hpp"
#include "tracking/tracking_error.hpp"

namespace tally::tracking {
  using namespace std::chrono;

  namespace {
    bool isMappable(Instant instant) {
      static const auto kMin = sys_days{year{1970} / January / 1};
      static const auto kMax = sys_days{year{10000} / January / 1};
      return instant >= kMin and instant < kMax;
    }
  }  // namespace

  outcome::result<std::vector<DayChunk>> splitInterval(
      Instant start, Instant end, const time_zone &zone) {
    if (not isMappable(start) or not isMappable(end)) {
      return TrackingError::INVALID_INTERVAL;
    }

    std::vector<DayChunk> chunks;
    if (end <= start) {
      return chunks;
    }

    const LocalCalendar calendar{zone};
    seconds credited{0};
    auto cursor = start;
    while (cursor < end) {
      const auto day = calendar.localDay(cursor);
      const auto boundary = calendar.midnightForLocalDay(
          year_month_day{local_days{day} + days{1}});
      if (boundary <= cursor) {
        // tz rules must never map the next midnight behind the cursor
        return TrackingError::INVALID_INTERVAL;
      }
      const auto chunk_end = std::min(boundary, end);

      // cumulative flooring keeps the total equal to floor(end - start)
      const auto elapsed = floor<seconds>(chunk_end - start);
      const auto chunk_seconds = elapsed - credited;
      if (chunk_seconds > seconds::zero()) {
        chunks.push_back(DayChunk{
            .day_key = LocalCalendar::formatDayKey(day),
            .seconds = static_cast<uint64_t>(chunk_seconds.count()),
        });
        credited = elapsed;
      }
      cursor = chunk_end;
    }
    return chunks;
  }

}  // namespace tally::tracking
