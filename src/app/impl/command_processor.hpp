/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "tracking/types.hpp"

namespace tally::clock {
  class SystemClock;
}  // namespace tally::clock

namespace tally::tracking {
  class LocalCalendar;
  class PresenceStore;
}  // namespace tally::tracking

namespace tally::report {
  class Reporter;
}  // namespace tally::report

namespace tally::app {
  class Configuration;
  class PresenceTracker;

  /**
   * Answers the `status`, `today` and `report-now` commands. Every answer is
   * a printable text; failures are reported in it rather than raised.
   * Must run on the event loop.
   */
  class CommandProcessor {
   public:
    CommandProcessor(qtils::SharedRef<log::LoggingSystem> logsys,
                     qtils::SharedRef<Configuration> config,
                     qtils::SharedRef<clock::SystemClock> clock,
                     qtils::SharedRef<tracking::LocalCalendar> calendar,
                     qtils::SharedRef<tracking::PresenceStore> store,
                     qtils::SharedRef<PresenceTracker> tracker,
                     qtils::SharedRef<report::Reporter> reporter);

    std::string status() const;

    /// Today's totals including time of sessions still open
    std::string today() const;

    /**
     * Posts the day-so-far report unless the global cooldown is active.
     * The cooldown restarts only when the report was delivered.
     */
    std::string reportNow();

   private:
    /// A malformed cooldown marker counts as no marker
    outcome::result<std::chrono::seconds> cooldownRemaining(
        tracking::Instant now) const;

    log::Logger logger_;
    std::string channel_;
    std::chrono::seconds report_cooldown_;
    qtils::SharedRef<clock::SystemClock> clock_;
    qtils::SharedRef<tracking::LocalCalendar> calendar_;
    qtils::SharedRef<tracking::PresenceStore> store_;
    qtils::SharedRef<PresenceTracker> tracker_;
    qtils::SharedRef<report::Reporter> reporter_;
  };

}  // namespace tally::app
