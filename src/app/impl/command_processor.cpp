/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/command_processor.hpp"

#include <fmt/format.h>

#include "app/configuration.hpp"
#include "app/impl/presence_tracker.hpp"
#include "app/meta_keys.hpp"
#include "clock/clock.hpp"
#include "report/cooldown.hpp"
#include "report/format.hpp"
#include "report/reporter.hpp"
#include "tracking/iso_instant.hpp"
#include "tracking/local_calendar.hpp"
#include "tracking/presence_store.hpp"
#include "tracking/tracking_error.hpp"

namespace tally::app {

  CommandProcessor::CommandProcessor(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<clock::SystemClock> clock,
      qtils::SharedRef<tracking::LocalCalendar> calendar,
      qtils::SharedRef<tracking::PresenceStore> store,
      qtils::SharedRef<PresenceTracker> tracker,
      qtils::SharedRef<report::Reporter> reporter)
      : logger_{logsys->getLogger("Commands", "presence")},
        channel_{config->tracking().channel},
        report_cooldown_{config->tracking().report_cooldown},
        clock_{std::move(clock)},
        calendar_{std::move(calendar)},
        store_{std::move(store)},
        tracker_{std::move(tracker)},
        reporter_{std::move(reporter)} {}

  outcome::result<std::chrono::seconds> CommandProcessor::cooldownRemaining(
      tracking::Instant now) const {
    OUTCOME_TRY(marker, store_->getMeta(kLastManualReportAt));
    std::optional<std::string_view> last_run;
    if (marker.has_value()) {
      last_run = *marker;
    }
    auto remaining = report::remainingCooldown(last_run, report_cooldown_, now);
    if (remaining.has_error()) {
      if (remaining.error() != tracking::TrackingError::INVALID_TIMESTAMP) {
        return remaining.error();
      }
      SL_WARN(logger_,
              "Ignoring malformed cooldown marker '{}'",
              marker.value_or(""));
      return std::chrono::seconds{0};
    }
    return remaining.value();
  }

  std::string CommandProcessor::status() const {
    auto now = clock_->nowInstant();

    std::string cooldown;
    if (auto remaining = cooldownRemaining(now); remaining.has_value()) {
      cooldown = report::formatSeconds(remaining.value().count());
    } else {
      SL_ERROR(logger_,
               "Can't read cooldown marker: {}",
               remaining.error().message());
      cooldown = "unknown";
    }

    return fmt::format(
        "Tracker status: {}\n"
        "Tracked channel: #{}\n"
        "Timezone: `{}`\n"
        "Current local time: `{}`\n"
        "Next scheduled midnight check: `{}`\n"
        "report-now cooldown remaining: `{}`",
        tracker_->isReady() ? "online" : "waiting for snapshot",
        channel_,
        calendar_->name(),
        calendar_->formatLocal(now),
        calendar_->formatLocal(calendar_->nextMidnightAfter(now)),
        cooldown);
  }

  std::string CommandProcessor::today() const {
    auto now = clock_->nowInstant();
    auto day_key = calendar_->localDayKey(now);
    auto rows = reporter_->buildRowsForDay(day_key, true, now);
    if (rows.has_error()) {
      SL_ERROR(logger_,
               "Can't read totals of {}: {}",
               day_key,
               rows.error().message());
      return fmt::format("Failed to read totals: `{}`",
                         rows.error().message());
    }
    return report::Reporter::buildTodayContent(day_key, rows.value());
  }

  std::string CommandProcessor::reportNow() {
    auto now = clock_->nowInstant();

    auto remaining = cooldownRemaining(now);
    if (remaining.has_error()) {
      SL_ERROR(logger_,
               "report-now failed: {}",
               remaining.error().message());
      return fmt::format("Failed to send report: `{}`",
                         remaining.error().message());
    }
    if (remaining.value().count() > 0) {
      return fmt::format("Global cooldown active. Try again in `{}`.",
                         report::formatSeconds(remaining.value().count()));
    }

    auto day_key = calendar_->localDayKey(now);
    if (auto res = reporter_->postReport(day_key, true, now);
        res.has_error()) {
      SL_ERROR(logger_, "report-now failed: {}", res.error().message());
      return fmt::format("Failed to send report: `{}`", res.error().message());
    }

    if (auto res =
            store_->setMeta(kLastManualReportAt, tracking::formatIsoInstant(now));
        res.has_error()) {
      SL_ERROR(logger_,
               "Can't record manual report time: {}",
               res.error().message());
    }
    SL_INFO(logger_, "Manual report for {} posted", day_key);
    return fmt::format("Posted day-so-far report for `{}`.", day_key);
  }

}  // namespace tally::app
