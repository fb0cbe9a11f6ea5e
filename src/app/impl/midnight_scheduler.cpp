/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/midnight_scheduler.hpp"

#include <algorithm>

#include "app/configuration.hpp"
#include "app/impl/event_loop.hpp"
#include "app/impl/presence_tracker.hpp"
#include "app/meta_keys.hpp"
#include "app/state_manager.hpp"
#include "clock/clock.hpp"
#include "report/reporter.hpp"
#include "tracking/local_calendar.hpp"
#include "tracking/presence_store.hpp"
#include "tracking/session_engine.hpp"

namespace tally::app {

  MidnightScheduler::MidnightScheduler(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<StateManager> state_manager,
      qtils::SharedRef<EventLoop> event_loop,
      qtils::SharedRef<clock::SystemClock> clock,
      qtils::SharedRef<tracking::LocalCalendar> calendar,
      qtils::SharedRef<tracking::SessionEngine> session_engine,
      qtils::SharedRef<tracking::PresenceStore> store,
      qtils::SharedRef<PresenceTracker> tracker,
      qtils::SharedRef<report::Reporter> reporter)
      : logger_{logsys->getLogger("MidnightScheduler", "scheduler")},
        tick_interval_{config->tracking().tick_interval},
        event_loop_{std::move(event_loop)},
        clock_{std::move(clock)},
        calendar_{std::move(calendar)},
        session_engine_{std::move(session_engine)},
        store_{std::move(store)},
        tracker_{std::move(tracker)},
        reporter_{std::move(reporter)} {
    state_manager->takeControl(*this);
  }

  void MidnightScheduler::start() {
    timer_.emplace(event_loop_->ioContext());
    next_tick_ = std::chrono::steady_clock::now();
    SL_INFO(logger_,
            "Midnight check every {}s in {}",
            tick_interval_.count(),
            calendar_->name());
    scheduleTick();
  }

  void MidnightScheduler::stop() {
    // The event loop is already stopped here, so no handler runs concurrently
    timer_.reset();
  }

  void MidnightScheduler::scheduleTick() {
    // Deadlines follow each other by the interval, so handler latency does
    // not stretch the period. After a stall the next tick fires at once.
    next_tick_ = std::max(next_tick_ + tick_interval_,
                          std::chrono::steady_clock::now());
    timer_->expires_at(next_tick_);
    timer_->async_wait(
        [weak_self{weak_from_this()}](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          auto self = weak_self.lock();
          if (not self or not self->timer_.has_value()) {
            return;
          }
          if (auto res = self->checkMidnight(); res.has_error()) {
            SL_ERROR(self->logger_,
                     "Midnight check failed: {}",
                     res.error().message());
          }
          self->scheduleTick();
        });
  }

  outcome::result<bool> MidnightScheduler::checkMidnight() {
    if (not tracker_->isReady()) {
      return false;
    }

    auto now = clock_->nowInstant();
    auto midnight = calendar_->midnightForLocalDay(calendar_->localDay(now));
    if (now < midnight or now >= midnight + kWindow) {
      return false;
    }

    auto finished_day = calendar_->previousLocalDayKey(now);
    OUTCOME_TRY(marker, store_->getMeta(kLastAutoReportDay));
    if (marker == finished_day) {
      return false;
    }

    OUTCOME_TRY(rolled, session_engine_->rolloverOpenSessions(midnight));
    SL_DEBUG(logger_, "Rolled {} open sessions over to the new day", rolled);

    SL_INFO(logger_, "Posting midnight report for {}", finished_day);
    if (auto res = reporter_->postReport(finished_day, false, midnight);
        res.has_error()) {
      SL_ERROR(logger_,
               "Failed to post midnight report for {}: {}",
               finished_day,
               res.error().message());
      return false;
    }

    OUTCOME_TRY(store_->setMeta(kLastAutoReportDay, finished_day));
    return true;
  }

}  // namespace tally::app
