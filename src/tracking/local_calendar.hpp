/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <qtils/outcome.hpp>

#include "injector/dont_inject.hpp"
#include "tracking/types.hpp"

namespace tally::tracking {

  /**
   * Calendar of the configured IANA timezone. Local days are the aggregation
   * buckets of the tracker; everything else is kept in absolute time.
   */
  class LocalCalendar {
   public:
    DONT_INJECT(LocalCalendar);

    explicit LocalCalendar(const std::chrono::time_zone &zone);

    /**
     * Looks the zone up in the tz database.
     * @return TrackingError::UNKNOWN_TIMEZONE if there is no such zone
     */
    static outcome::result<LocalCalendar> create(std::string_view zone_name);

    const std::chrono::time_zone &zone() const {
      return *zone_;
    }

    std::string_view name() const {
      return zone_->name();
    }

    /// Local calendar date of the instant
    std::chrono::year_month_day localDay(Instant now) const;

    DayKey localDayKey(Instant now) const;

    DayKey previousLocalDayKey(Instant now) const;

    /**
     * Instant of 00:00 local time of the given day. A repeated midnight
     * resolves to its later occurrence, a skipped one to the transition.
     */
    Instant midnightForLocalDay(std::chrono::year_month_day day) const;

    outcome::result<Instant> midnightForLocalDay(DayKey day_key) const;

    /// First local midnight strictly after the instant
    Instant nextMidnightAfter(Instant now) const;

    /// Local wall time with offset, e.g. "2026-01-01 23:50:00 -05:00 (EST)"
    std::string formatLocal(Instant now) const;

    static DayKey formatDayKey(std::chrono::year_month_day day);

    /**
     * @return TrackingError::INVALID_DAY_KEY unless `day_key` is a valid
     * YYYY-MM-DD date
     */
    static outcome::result<std::chrono::year_month_day> parseDayKey(
        std::string_view day_key);

   private:
    const std::chrono::time_zone *zone_;
  };

}  // namespace tally::tracking
