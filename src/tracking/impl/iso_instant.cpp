/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tracking/iso_instant.hpp"

#include <charconv>
#include <optional>

#include <fmt/format.h>

#include "tracking/local_calendar.hpp"
#include "tracking/tracking_error.hpp"

namespace tally::tracking {
  using namespace std::chrono;

  namespace {
    /// Reads exactly `len` decimal digits at `pos`
    std::optional<unsigned> digits(std::string_view text,
                                   size_t pos,
                                   size_t len) {
      if (pos + len > text.size()) {
        return std::nullopt;
      }
      unsigned value = 0;
      const auto *first = text.data() + pos;
      const auto *last = first + len;
      auto [ptr, ec] = std::from_chars(first, last, value);
      if (ec != std::errc{} or ptr != last) {
        return std::nullopt;
      }
      return value;
    }
  }  // namespace

  outcome::result<Instant> parseIsoInstant(std::string_view text,
                                           NaiveAs naive) {
    // YYYY-MM-DDTHH:MM:SS
    constexpr size_t kBaseSize = 19;
    if (text.size() < kBaseSize
        or (text[10] != 'T' and text[10] != 't' and text[10] != ' ')
        or text[13] != ':' or text[16] != ':') {
      return TrackingError::INVALID_TIMESTAMP;
    }
    auto date = LocalCalendar::parseDayKey(text.substr(0, 10));
    if (date.has_error()) {
      return TrackingError::INVALID_TIMESTAMP;
    }
    auto hh = digits(text, 11, 2);
    auto mm = digits(text, 14, 2);
    auto ss = digits(text, 17, 2);
    if (not hh or not mm or not ss or *hh > 23 or *mm > 59 or *ss > 59) {
      return TrackingError::INVALID_TIMESTAMP;
    }

    auto result = time_point_cast<milliseconds>(sys_days{date.value()})
                + hours{*hh} + minutes{*mm} + seconds{*ss};

    size_t pos = kBaseSize;
    if (pos < text.size() and text[pos] == '.') {
      ++pos;
      const auto start = pos;
      unsigned millis = 0;
      while (pos < text.size() and text[pos] >= '0' and text[pos] <= '9') {
        if (pos - start < 3) {
          millis = millis * 10 + (text[pos] - '0');
        }
        ++pos;
      }
      if (pos == start) {
        return TrackingError::INVALID_TIMESTAMP;
      }
      for (auto n = pos - start; n < 3; ++n) {
        millis *= 10;
      }
      result += milliseconds{millis};
    }

    if (pos == text.size()) {
      if (naive == NaiveAs::Utc) {
        return result;
      }
      return TrackingError::INVALID_TIMESTAMP;
    }

    if (text.substr(pos) == "Z" or text.substr(pos) == "z") {
      return result;
    }

    // +HH:MM or -HH:MM
    if (text.size() - pos != 6 or (text[pos] != '+' and text[pos] != '-')
        or text[pos + 3] != ':') {
      return TrackingError::INVALID_TIMESTAMP;
    }
    auto off_h = digits(text, pos + 1, 2);
    auto off_m = digits(text, pos + 4, 2);
    if (not off_h or not off_m or *off_h > 23 or *off_m > 59) {
      return TrackingError::INVALID_TIMESTAMP;
    }
    const minutes offset = hours{*off_h} + minutes{*off_m};
    // local = utc + offset
    return text[pos] == '+' ? result - offset : result + offset;
  }

  std::string formatIsoInstant(Instant instant) {
    const auto day = floor<days>(instant);
    const hh_mm_ss time{instant - day};
    auto text = fmt::format("{}T{:02}:{:02}:{:02}",
                            LocalCalendar::formatDayKey(year_month_day{day}),
                            time.hours().count(),
                            time.minutes().count(),
                            time.seconds().count());
    if (const auto millis = time.subseconds().count(); millis != 0) {
      text += fmt::format(".{:03}", millis);
    }
    return text + "+00:00";
  }

}  // namespace tally::tracking
