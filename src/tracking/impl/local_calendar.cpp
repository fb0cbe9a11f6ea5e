/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tracking/local_calendar.hpp"

#include <charconv>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>

#include "tracking/tracking_error.hpp"

namespace tally::tracking {
  using namespace std::chrono;

  LocalCalendar::LocalCalendar(const time_zone &zone) : zone_(&zone) {}

  outcome::result<LocalCalendar> LocalCalendar::create(
      std::string_view zone_name) {
    try {
      return LocalCalendar(*locate_zone(zone_name));
    } catch (const std::runtime_error &) {
      return TrackingError::UNKNOWN_TIMEZONE;
    }
  }

  year_month_day LocalCalendar::localDay(Instant now) const {
    return year_month_day{floor<days>(zone_->to_local(now))};
  }

  DayKey LocalCalendar::localDayKey(Instant now) const {
    return formatDayKey(localDay(now));
  }

  DayKey LocalCalendar::previousLocalDayKey(Instant now) const {
    return formatDayKey(year_month_day{local_days{localDay(now)} - days{1}});
  }

  Instant LocalCalendar::midnightForLocalDay(year_month_day day) const {
    return time_point_cast<milliseconds>(
        zone_->to_sys(local_days{day}, choose::latest));
  }

  outcome::result<Instant> LocalCalendar::midnightForLocalDay(
      DayKey day_key) const {
    OUTCOME_TRY(day, parseDayKey(day_key));
    return midnightForLocalDay(day);
  }

  Instant LocalCalendar::nextMidnightAfter(Instant now) const {
    return midnightForLocalDay(
        year_month_day{local_days{localDay(now)} + days{1}});
  }

  std::string LocalCalendar::formatLocal(Instant now) const {
    const auto info = zone_->get_info(floor<seconds>(now));
    const auto local = floor<seconds>(zone_->to_local(now));
    const auto day = floor<days>(local);
    const hh_mm_ss time{local - day};
    const year_month_day date{day};

    const auto offset_minutes = duration_cast<minutes>(info.offset).count();
    const auto abs_offset = offset_minutes < 0 ? -offset_minutes
                                               : offset_minutes;
    return fmt::format("{} {:02}:{:02}:{:02} {}{:02}:{:02} ({})",
                       formatDayKey(date),
                       time.hours().count(),
                       time.minutes().count(),
                       time.seconds().count(),
                       offset_minutes < 0 ? '-' : '+',
                       abs_offset / 60,
                       abs_offset % 60,
                       info.abbrev);
  }

  DayKey LocalCalendar::formatDayKey(year_month_day day) {
    return fmt::format("{:04}-{:02}-{:02}",
                       static_cast<int>(day.year()),
                       static_cast<unsigned>(day.month()),
                       static_cast<unsigned>(day.day()));
  }

  outcome::result<year_month_day> LocalCalendar::parseDayKey(
      std::string_view day_key) {
    if (day_key.size() != 10 or day_key[4] != '-' or day_key[7] != '-') {
      return TrackingError::INVALID_DAY_KEY;
    }
    auto number = [&](size_t pos, size_t len) -> std::optional<unsigned> {
      unsigned value = 0;
      const auto *first = day_key.data() + pos;
      const auto *last = first + len;
      auto [ptr, ec] = std::from_chars(first, last, value);
      if (ec != std::errc{} or ptr != last) {
        return std::nullopt;
      }
      return value;
    };
    auto y = number(0, 4);
    auto m = number(5, 2);
    auto d = number(8, 2);
    if (not y or not m or not d) {
      return TrackingError::INVALID_DAY_KEY;
    }
    year_month_day ymd{year{static_cast<int>(*y)}, month{*m}, day{*d}};
    if (not ymd.ok()) {
      return TrackingError::INVALID_DAY_KEY;
    }
    return ymd;
  }

}  // namespace tally::tracking
